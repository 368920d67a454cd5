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
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "docdriver/client/sdam/sdam_configuration.h"
#include "docdriver/client/sdam/sdam_datatypes.h"
#include "docdriver/client/sdam/topology_listener.h"
#include "docdriver/executor/network_interface.h"

namespace docdriver {

/**
 * Monitors a single server with the isMaster health check and publishes the outcome of every
 * check to a TopologyEventsPublisher.
 *
 * The monitor owns a dedicated connection to its server, separate from the connection pool. It
 * polls every heartbeat interval, or streams (sends awaitable requests back to back) once the
 * server reports a topologyVersion and the configuration allows it. While streaming, a second
 * thread with its own connection measures the round trip time.
 */
class ServerIsMasterMonitor {
public:
    ServerIsMasterMonitor(const sdam::ServerAddress& host,
                          const sdam::SdamConfiguration& sdamConfiguration,
                          sdam::TopologyEventsPublisherPtr eventListener,
                          executor::NetworkInterfacePtr net);

    ~ServerIsMasterMonitor();

    ServerIsMasterMonitor(const ServerIsMasterMonitor&) = delete;
    ServerIsMasterMonitor& operator=(const ServerIsMasterMonitor&) = delete;

    /**
     * Starts the monitoring and pinger threads. The first check runs immediately; the pinger
     * idles until the monitor streams.
     */
    void init();

    /**
     * Wakes the monitor for a check now, or as soon as minHeartbeatFrequency has passed since the
     * previous check. Puts the monitor in expedited mode, checking every minHeartbeatFrequency,
     * until disableExpeditedChecking() is called.
     */
    void requestImmediateCheck();

    void disableExpeditedChecking();

    /**
     * Signals the monitoring threads to stop and interrupts an outstanding check. Does not wait.
     */
    void shutdown();

    /**
     * Waits for the monitoring threads to exit. shutdown() must have been called.
     */
    void join();

    bool isShutdown() const;

    const sdam::ServerAddress& getHost() const {
        return _host;
    }

    /**
     * Returns true while awaitable requests are being sent to the server.
     */
    bool isStreaming() const;

private:
    void _run();
    void _runPinger();

    void _doIsMaster();

    void _onIsMasterSuccess(sdam::IsMasterRTT latency, const IsMasterReply& reply, bool awaited);
    void _onIsMasterFailure(sdam::IsMasterRTT latency, const Status& status, bool awaited);

    Milliseconds _currentRefreshPeriod(const std::unique_lock<std::mutex>& lk) const;

    /**
     * Waits until the next check is due, an immediate check was requested or the monitor is shut
     * down.
     */
    void _waitForNextCheck(std::unique_lock<std::mutex>& lk);

    static constexpr int kLogLevel = 2;

    mutable std::mutex _mutex;
    std::condition_variable _wakeup;

    const sdam::ServerAddress _host;
    const sdam::SdamConfiguration _sdamConfiguration;
    const sdam::TopologyEventsPublisherPtr _eventListener;
    const executor::NetworkInterfacePtr _net;

    // Each is replaced only by the thread that uses it; shutdown() cancels them under the lock.
    std::unique_ptr<executor::NetworkConnection> _connection;
    std::unique_ptr<executor::NetworkConnection> _pingConnection;

    boost::optional<TopologyVersion> _topologyVersion;
    boost::optional<std::chrono::steady_clock::time_point> _lastIsMasterAt;
    bool _isStreaming = false;
    bool _isExpedited = false;
    bool _immediateCheckRequested = false;
    bool _isShutdown = false;

    std::thread _monitorThread;
    std::thread _pingerThread;
};
using ServerIsMasterMonitorPtr = std::shared_ptr<ServerIsMasterMonitor>;

}  // namespace docdriver
