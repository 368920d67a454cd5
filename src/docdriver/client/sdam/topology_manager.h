/**
 *    Copyright (C) 2019-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#pragma once

#include <boost/optional.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "docdriver/base/error_extra_info.h"
#include "docdriver/base/status_with.h"
#include "docdriver/client/sdam/sdam_configuration.h"
#include "docdriver/client/sdam/sdam_datatypes.h"
#include "docdriver/client/sdam/server_selector.h"
#include "docdriver/client/sdam/topology_change_stream.h"
#include "docdriver/client/sdam/topology_description.h"
#include "docdriver/client/sdam/topology_listener.h"
#include "docdriver/client/sdam/topology_state_machine.h"
#include "docdriver/client/server_is_master_monitor.h"
#include "docdriver/executor/connection_pool.h"
#include "docdriver/executor/network_interface.h"
#include "docdriver/util/clock_source.h"

namespace docdriver::sdam {

/**
 * Attached to a ServerSelectionTimeout error. Holds the TopologyDescription that was current when
 * server selection gave up.
 */
class ServerSelectionTimeoutInfo final : public ErrorExtraInfo {
public:
    static constexpr auto code = ErrorCodes::ServerSelectionTimeout;

    explicit ServerSelectionTimeoutInfo(TopologyDescriptionPtr topologyDescription)
        : _topologyDescription(std::move(topologyDescription)) {}

    const TopologyDescriptionPtr& getTopologyDescription() const {
        return _topologyDescription;
    }

    std::string toString() const override;

private:
    TopologyDescriptionPtr _topologyDescription;
};

/**
 * How a connection was last used, reported when it is returned to the topology.
 */
enum class CheckinOutcome { kHealthy, kNetworkError };

/**
 * This class serves as the public interface to server discovery and monitoring. It owns the
 * current TopologyDescription and, once initialized, one ServerIsMasterMonitor and one
 * ConnectionPool per known server.
 *
 * Monitor events reach the manager through its TopologyEventsPublisher and are processed one at a
 * time on the publisher's delivery thread. Readers get immutable snapshots of the topology.
 */
class TopologyManager {
    TopologyManager() = delete;
    TopologyManager(const TopologyManager&) = delete;
    TopologyManager& operator=(const TopologyManager&) = delete;

public:
    using ConnectionHandle = executor::ConnectionPool::ConnectionHandle;

    TopologyManager(SdamConfiguration config,
                    ClockSource* clockSource,
                    executor::NetworkInterfacePtr net = nullptr,
                    executor::ConnectionPool::Options poolOptions = {},
                    TopologyEventsPublisherPtr eventsPublisher = nullptr);

    ~TopologyManager();

    /**
     * Publishes the topology opening event and starts a monitor and a pool for every server in
     * the initial description. A load balanced topology gets its single server described as a
     * LoadBalancer and is never monitored. Requires a NetworkInterface.
     */
    void init();

    /**
     * This function atomically:
     *   1. Discards the outcome if the server is not part of the topology, or if the reply carries
     * a topologyVersion that is not newer than the one already stored for the server.
     *   2. Clones the current TopologyDescription
     *   3. Executes the state machine logic given the cloned TopologyDescription and the new
     * ServerDescription built from the outcome.
     *   4. Installs the cloned (and possibly modified) TopologyDescription as the current one.
     *
     * A failed outcome also clears the server's connection pool. Multiple threads may call this
     * function concurrently; the outcomes are processed serially. Returns false if the outcome
     * was discarded.
     */
    bool onServerDescription(const IsMasterOutcome& isMasterOutcome);

    /**
     * Folds a round trip time sample into the stored description of 'hostAndPort'.
     */
    void onServerRTTUpdated(ServerAddress hostAndPort, IsMasterRTT rtt);

    /**
     * Get the current TopologyDescription. This is safe to call from multiple threads.
     */
    const TopologyDescriptionPtr getTopologyDescription() const;

    /**
     * Returns a server matching 'criteria'. If none is suitable, requests immediate checks from
     * every monitor and waits for the topology to change, up to 'maxWait' (the configured
     * serverSelectionTimeout by default).
     *
     * Known errors are:
     *  ServerSelectionTimeout, with a ServerSelectionTimeoutInfo holding the last description.
     *  IncompatibleServerVersion, if a server's wire version range is not supported.
     *  ShutdownInProgress, if the manager is closed.
     */
    StatusWith<ServerDescriptionPtr> selectServer(
        const SelectionCriteria& criteria, boost::optional<Milliseconds> maxWait = boost::none);

    /**
     * Checks out a connection from the pool of 'server'. A network error while connecting marks
     * the server failed.
     */
    StatusWith<ConnectionHandle> checkoutConnection(
        const ServerAddress& server, boost::optional<Milliseconds> timeout = boost::none);

    /**
     * Returns a connection. A network error observed on a connection of the pool's current
     * generation marks the server failed; errors on connections from before a clear are ignored.
     */
    void checkinConnection(ConnectionHandle handle, CheckinOutcome outcome);

    /**
     * Notifies the manager that 'host' has failed because of 'status' and should be considered
     * down: its description becomes Unknown, its pool is cleared and its monitor checks it
     * immediately.
     */
    void failedHost(const ServerAddress& host, const Status& status);

    /**
     * Asks every monitor for an immediate check.
     */
    void requestImmediateCheck();

    /**
     * Returns a change stream of the topology descriptions installed from now on. The stream is
     * exhausted once the manager closes, and unsubscribes when its last reference is dropped.
     */
    TopologyChangeStreamPtr watch();

    TopologyEventsPublisherPtr getEventsPublisher() const {
        return _eventsPublisher;
    }

    /**
     * Stops the monitors, publishes the topology closed event, closes the publisher and the
     * pools, and fails pending server selections. Idempotent.
     */
    void close();

    bool isClosed() const;

private:
    class MonitorEventsListener;

    struct ServerHandles {
        ServerIsMasterMonitorPtr monitor;
        executor::ConnectionPoolPtr pool;
    };

    bool _onServerDescription(const std::unique_lock<std::mutex>& lk,
                              const IsMasterOutcome& isMasterOutcome,
                              bool keepLastRtt);

    void _onHeartbeatSucceeded(IsMasterRTT duration,
                               const ServerAddress& hostAndPort,
                               const IsMasterReply& reply,
                               bool awaited);

    void _updateRtt(const std::unique_lock<std::mutex>& lk,
                    const ServerAddress& hostAndPort,
                    IsMasterRTT rtt);

    void _installTopologyDescription(const std::unique_lock<std::mutex>& lk,
                                     TopologyDescriptionPtr newTopologyDescription);

    void _publishTopologyDescriptionChanged(
        const TopologyDescriptionPtr& oldTopologyDescription,
        const TopologyDescriptionPtr& newTopologyDescription) const;

    /**
     * Starts handles for servers that joined the topology and queues the handles of servers that
     * left for the retirement thread.
     */
    void _reconcileServers(const std::unique_lock<std::mutex>& lk);

    void _startServer(const std::unique_lock<std::mutex>& lk, const ServerAddress& address);

    void _clearPool(const std::unique_lock<std::mutex>& lk,
                    const ServerAddress& address,
                    const Status& cause);

    void _requestImmediateCheck(const std::unique_lock<std::mutex>& lk);

    /**
     * Body of the retirement thread. Joins the monitors and shuts down the pools of servers that
     * left the topology, off the event delivery thread. Returns once the manager is closed and
     * the queue is drained.
     */
    void _retireServers();

    static constexpr int kLogLevel = 1;

    mutable std::mutex _mutex;
    std::condition_variable _topologyChanged;

    const SdamConfiguration _config;
    ClockSource* const _clockSource;
    const executor::NetworkInterfacePtr _net;
    const executor::ConnectionPool::Options _poolOptions;

    TopologyDescriptionPtr _topologyDescription;
    uint64_t _descriptionVersion = 0;

    std::unique_ptr<TopologyStateMachine> _topologyStateMachine;
    std::unique_ptr<ServerSelector> _serverSelector;

    std::map<ServerAddress, ServerHandles> _servers;

    // monitors already told to shut down, waiting to be joined
    std::deque<ServerHandles> _retiredServers;
    std::condition_variable _serversRetired;
    std::thread _retirementThread;

    const TopologyEventsPublisherPtr _eventsPublisher;
    std::shared_ptr<MonitorEventsListener> _monitorEventsListener;

    bool _isInitialized = false;
    bool _isClosed = false;
};
using TopologyManagerPtr = std::shared_ptr<TopologyManager>;

std::string toString(CheckinOutcome outcome);

}  // namespace docdriver::sdam
