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

#define DOCDRIVER_LOG_DEFAULT_COMPONENT ::docdriver::logger::LogComponent::kTopology

#include "docdriver/client/sdam/topology_manager.h"

#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <sstream>
#include <utility>

#include "docdriver/client/sdam/server_description.h"
#include "docdriver/client/wire_version.h"
#include "docdriver/util/assert_util.h"
#include "docdriver/util/log.h"

namespace docdriver::sdam {
namespace {

const std::string kLogPrefix = "[TopologyManager] ";

bool topologyHasKnownPrimary(TopologyType type) {
    return type == TopologyType::kSingle || type == TopologyType::kReplicaSetWithPrimary ||
        type == TopologyType::kSharded;
}

}  // namespace

std::string ServerSelectionTimeoutInfo::toString() const {
    return "topology: " + (_topologyDescription ? _topologyDescription->toString() : "<none>");
}

class TopologyManager::MonitorEventsListener : public TopologyListener {
public:
    explicit MonitorEventsListener(TopologyManager* manager) : _manager(manager) {}

    void onServerHeartbeatSucceededEvent(IsMasterRTT duration,
                                         const ServerAddress hostAndPort,
                                         const IsMasterReply reply,
                                         bool awaited) override {
        _manager->_onHeartbeatSucceeded(duration, hostAndPort, reply, awaited);
    }

    void onServerHeartbeatFailureEvent(IsMasterRTT duration,
                                       Status errorStatus,
                                       const ServerAddress hostAndPort,
                                       bool awaited) override {
        _manager->onServerDescription(IsMasterOutcome(hostAndPort, errorStatus.toString()));
    }

    void onServerPingFailedEvent(const ServerAddress hostAndPort, const Status& status) override {
        _manager->failedHost(hostAndPort, status);
    }

    void onServerPingSucceededEvent(IsMasterRTT duration,
                                    const ServerAddress hostAndPort) override {
        _manager->onServerRTTUpdated(hostAndPort, duration);
    }

private:
    TopologyManager* const _manager;
};

TopologyManager::TopologyManager(SdamConfiguration config,
                                 ClockSource* clockSource,
                                 executor::NetworkInterfacePtr net,
                                 executor::ConnectionPool::Options poolOptions,
                                 TopologyEventsPublisherPtr eventsPublisher)
    : _config(std::move(config)),
      _clockSource(clockSource),
      _net(std::move(net)),
      _poolOptions(std::move(poolOptions)),
      _topologyDescription(std::make_shared<TopologyDescription>(_config)),
      _topologyStateMachine(std::make_unique<TopologyStateMachine>(_config)),
      _serverSelector(std::make_unique<SdamServerSelector>(
          ServerSelectionConfiguration::fromSdamConfiguration(_config))),
      _eventsPublisher(eventsPublisher ? std::move(eventsPublisher)
                                       : std::make_shared<TopologyEventsPublisher>()),
      _monitorEventsListener(std::make_shared<MonitorEventsListener>(this)) {
    _poolOptions.validate();
    _eventsPublisher->registerListener(_monitorEventsListener);
}

TopologyManager::~TopologyManager() {
    close();
}

void TopologyManager::init() {
    uassert(ErrorCodes::BadValue,
            "a NetworkInterface is required to monitor the topology",
            static_cast<bool>(_net));

    std::unique_lock<std::mutex> lock(_mutex);
    uassert(ErrorCodes::ShutdownInProgress, "topology is closed", !_isClosed);
    if (_isInitialized)
        return;
    _isInitialized = true;

    LOG_INFO() << kLogPrefix << "starting topology " << _topologyDescription->getId()
               << " with configuration " << _config.toString();
    _eventsPublisher->onTopologyOpeningEvent(_topologyDescription->getId());
    _retirementThread = std::thread([this] { _retireServers(); });

    if (_config.isLoadBalanced()) {
        const auto& seeds = *_config.getSeedList();
        auto newTopologyDescription = std::make_shared<TopologyDescription>(*_topologyDescription);
        newTopologyDescription->installServerDescription(
            ServerDescriptionBuilder()
                .withAddress(seeds.front())
                .withType(ServerType::kLoadBalancer)
                .withMinWireVersion(WireVersion::MIN_SUPPORTED_WIRE_VERSION)
                .withMaxWireVersion(WireVersion::LATEST_WIRE_VERSION)
                .withLastUpdateTime(_clockSource->now())
                .instance());
        _installTopologyDescription(lock, newTopologyDescription);
    } else {
        _reconcileServers(lock);
    }
}

bool TopologyManager::onServerDescription(const IsMasterOutcome& isMasterOutcome) {
    std::unique_lock<std::mutex> lock(_mutex);
    return _onServerDescription(lock, isMasterOutcome, false);
}

bool TopologyManager::_onServerDescription(const std::unique_lock<std::mutex>& lk,
                                           const IsMasterOutcome& isMasterOutcome,
                                           bool keepLastRtt) {
    if (_isClosed)
        return false;

    const auto& address = isMasterOutcome.getServer();
    const auto lastServerDescription = _topologyDescription->findServerByAddress(address);
    if (!lastServerDescription) {
        LOG(kLogLevel + 1) << kLogPrefix << "ignoring isMaster outcome for " << address
                           << ", which is not part of the topology";
        return false;
    }

    if (isMasterOutcome.isSuccess() &&
        TopologyVersion::isStale(isMasterOutcome.getResponse()->topologyVersion,
                                 (*lastServerDescription)->getTopologyVersion())) {
        LOG(kLogLevel + 1) << kLogPrefix << ErrorCodes::StaleUpdate << ": ignoring isMaster reply "
                           << "from " << address << " with topologyVersion "
                           << isMasterOutcome.getResponse()->topologyVersion->toString()
                           << ", which is not newer than the stored one";
        return false;
    }

    const boost::optional<IsMasterRTT> lastRTT = (*lastServerDescription)->getRtt();
    ServerDescriptionBuilder builder(_clockSource, isMasterOutcome, lastRTT);
    auto newServerDescription = builder.instance();

    // an awaited reply was held by the server, so its duration is not a round trip time.
    if (keepLastRtt && lastRTT && newServerDescription->getRtt()) {
        newServerDescription = builder.withRtt(*lastRTT).instance();
    }

    auto newTopologyDescription = std::make_shared<TopologyDescription>(*_topologyDescription);
    _topologyStateMachine->onServerDescription(*newTopologyDescription, newServerDescription);
    _installTopologyDescription(lk, std::move(newTopologyDescription));

    if (!isMasterOutcome.isSuccess()) {
        _clearPool(lk,
                   address,
                   Status(ErrorCodes::PoolCleared,
                          "isMaster to " + address.toString() +
                              " failed: " + isMasterOutcome.getErrorMsg()));
    }
    return true;
}

void TopologyManager::_onHeartbeatSucceeded(IsMasterRTT duration,
                                            const ServerAddress& hostAndPort,
                                            const IsMasterReply& reply,
                                            bool awaited) {
    std::unique_lock<std::mutex> lock(_mutex);
    const IsMasterOutcome outcome(hostAndPort, reply, duration);
    const bool applied = _onServerDescription(lock, outcome, awaited);

    // a polled reply that did not change the server still measures the round trip.
    if (!applied && !awaited && !_isClosed)
        _updateRtt(lock, hostAndPort, duration);
}

const TopologyDescriptionPtr TopologyManager::getTopologyDescription() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _topologyDescription;
}

void TopologyManager::onServerRTTUpdated(ServerAddress hostAndPort, IsMasterRTT rtt) {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_isClosed)
        return;
    _updateRtt(lock, hostAndPort, rtt);
}

void TopologyManager::_updateRtt(const std::unique_lock<std::mutex>& lk,
                                 const ServerAddress& hostAndPort,
                                 IsMasterRTT rtt) {
    auto oldServerDescription = _topologyDescription->findServerByAddress(hostAndPort);
    if (oldServerDescription) {
        auto newServerDescription = (*oldServerDescription)->cloneWithRTT(rtt);

        auto newTopologyDescription = std::make_shared<TopologyDescription>(*_topologyDescription);
        newTopologyDescription->installServerDescription(newServerDescription);

        _installTopologyDescription(lk, std::move(newTopologyDescription));
        return;
    }

    // otherwise, the server was removed from the topology. Nothing to do.
}

void TopologyManager::_installTopologyDescription(const std::unique_lock<std::mutex>& lk,
                                                  TopologyDescriptionPtr newTopologyDescription) {
    auto oldTopologyDescription = std::exchange(_topologyDescription, newTopologyDescription);
    ++_descriptionVersion;

    // an equivalent description still carries fresh round trip times, but is not published.
    if (!oldTopologyDescription->isEquivalent(*_topologyDescription))
        _publishTopologyDescriptionChanged(oldTopologyDescription, _topologyDescription);
    _reconcileServers(lk);

    if (topologyHasKnownPrimary(_topologyDescription->getType())) {
        for (auto& entry : _servers) {
            if (entry.second.monitor)
                entry.second.monitor->disableExpeditedChecking();
        }
    }

    _topologyChanged.notify_all();
}

void TopologyManager::_publishTopologyDescriptionChanged(
    const TopologyDescriptionPtr& oldTopologyDescription,
    const TopologyDescriptionPtr& newTopologyDescription) const {
    const auto& topologyId = newTopologyDescription->getId();
    for (const auto& newServerDescription : newTopologyDescription->getServers()) {
        const auto& address = newServerDescription->getAddress();
        auto oldServerDescription = oldTopologyDescription->findServerByAddress(address);
        if (oldServerDescription && !(*oldServerDescription)->isEquivalent(*newServerDescription)) {
            _eventsPublisher->onServerDescriptionChangedEvent(
                address, topologyId, *oldServerDescription, newServerDescription);
        }
    }

    _eventsPublisher->onTopologyDescriptionChangedEvent(
        topologyId, oldTopologyDescription, newTopologyDescription);
}

void TopologyManager::_reconcileServers(const std::unique_lock<std::mutex>& lk) {
    if (!_isInitialized || _isClosed)
        return;

    for (auto it = _servers.begin(); it != _servers.end();) {
        if (_topologyDescription->containsServerAddress(it->first)) {
            ++it;
            continue;
        }

        LOG(kLogLevel) << kLogPrefix << it->first << " was removed from the topology";
        _eventsPublisher->onServerClosedEvent(_topologyDescription->getId(), it->first);
        if (it->second.monitor)
            it->second.monitor->shutdown();
        _retiredServers.push_back(std::move(it->second));
        _serversRetired.notify_one();
        it = _servers.erase(it);
    }

    for (const auto& serverDescription : _topologyDescription->getServers()) {
        const auto& address = serverDescription->getAddress();
        if (_servers.find(address) == _servers.end())
            _startServer(lk, address);
    }
}

void TopologyManager::_startServer(const std::unique_lock<std::mutex>& lk,
                                   const ServerAddress& address) {
    LOG(kLogLevel) << kLogPrefix << "starting to track " << address;
    _eventsPublisher->onServerOpeningEvent(_topologyDescription->getId(), address);

    ServerHandles handles;
    handles.pool =
        std::make_shared<executor::ConnectionPool>(address, _net, _clockSource, _poolOptions);
    handles.pool->startup();

    // a load balancer is never monitored.
    if (!_config.isLoadBalanced()) {
        handles.monitor =
            std::make_shared<ServerIsMasterMonitor>(address, _config, _eventsPublisher, _net);
        handles.monitor->init();
    }

    _servers.emplace(address, std::move(handles));
}

void TopologyManager::_clearPool(const std::unique_lock<std::mutex>& lk,
                                 const ServerAddress& address,
                                 const Status& cause) {
    auto it = _servers.find(address);
    if (it == _servers.end())
        return;
    it->second.pool->clear(cause);
}

StatusWith<ServerDescriptionPtr> TopologyManager::selectServer(
    const SelectionCriteria& criteria, boost::optional<Milliseconds> maxWait) {
    const auto timeout = maxWait.value_or(_config.getServerSelectionTimeout());
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(_mutex);
    while (true) {
        if (_isClosed)
            return Status(ErrorCodes::ShutdownInProgress, "topology is closed");

        const auto topologyDescription = _topologyDescription;
        const auto version = _descriptionVersion;

        lock.unlock();
        boost::optional<ServerDescriptionPtr> selectedServer;
        try {
            selectedServer = _serverSelector->selectServer(topologyDescription, criteria);
        } catch (const DBException& ex) {
            return ex.toStatus();
        }
        if (selectedServer) {
            LOG(kLogLevel + 1) << kLogPrefix << "selected " << (*selectedServer)->getAddress()
                               << " for " << criteria.toString();
            return *selectedServer;
        }
        lock.lock();

        if (std::chrono::steady_clock::now() >= deadline) {
            std::ostringstream message;
            message << "Could not find a server matching " << criteria.toString() << " within "
                    << timeout.count() << "ms";
            LOG(kLogLevel) << kLogPrefix << message.str();
            return Status(std::make_shared<const ServerSelectionTimeoutInfo>(topologyDescription),
                          message.str());
        }

        _requestImmediateCheck(lock);
        _topologyChanged.wait_until(
            lock, deadline, [&] { return _isClosed || _descriptionVersion != version; });
    }
}

StatusWith<TopologyManager::ConnectionHandle> TopologyManager::checkoutConnection(
    const ServerAddress& server, boost::optional<Milliseconds> timeout) {
    executor::ConnectionPoolPtr pool;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_isClosed)
            return Status(ErrorCodes::ShutdownInProgress, "topology is closed");

        auto it = _servers.find(server);
        if (it == _servers.end()) {
            return Status(ErrorCodes::HostNotFound,
                          server.toString() + " is not part of the topology");
        }
        pool = it->second.pool;
    }

    auto swHandle = timeout ? pool->checkout(*timeout) : pool->checkout();
    if (!swHandle.isOK() && ErrorCodes::isNetworkError(swHandle.getStatus().code())) {
        failedHost(server, swHandle.getStatus());
    }
    return swHandle;
}

void TopologyManager::checkinConnection(ConnectionHandle handle, CheckinOutcome outcome) {
    invariant(handle);
    if (outcome == CheckinOutcome::kHealthy) {
        handle.reset();
        return;
    }

    const auto address = handle->getHostAndPort();
    const auto generation = handle->getGeneration();
    const Status status(ErrorCodes::SocketException,
                        "network error on connection " + std::to_string(handle->getId()) +
                            " to " + address.toString());
    handle->indicateFailed(status);
    handle.reset();

    bool isCurrentGeneration = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _servers.find(address);
        isCurrentGeneration =
            it != _servers.end() && it->second.pool->getGeneration() == generation;
    }

    if (!isCurrentGeneration) {
        LOG(kLogLevel) << kLogPrefix << "ignoring network error from a connection to " << address
                       << " created before the pool was cleared";
        return;
    }
    failedHost(address, status);
}

void TopologyManager::failedHost(const ServerAddress& host, const Status& status) {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_isClosed)
        return;

    LOG(kLogLevel) << kLogPrefix << "marking " << host << " as failed: " << status;
    _onServerDescription(lock, IsMasterOutcome(host, status.toString()), false);

    auto it = _servers.find(host);
    if (it != _servers.end() && it->second.monitor)
        it->second.monitor->requestImmediateCheck();
}

void TopologyManager::requestImmediateCheck() {
    std::unique_lock<std::mutex> lock(_mutex);
    _requestImmediateCheck(lock);
}

void TopologyManager::_requestImmediateCheck(const std::unique_lock<std::mutex>& lk) {
    for (auto& entry : _servers) {
        if (entry.second.monitor)
            entry.second.monitor->requestImmediateCheck();
    }
}

TopologyChangeStreamPtr TopologyManager::watch() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_isClosed) {
        auto changeStream = std::make_shared<TopologyChangeStream>();
        changeStream->close();
        return changeStream;
    }
    return TopologyChangeStream::subscribe(_eventsPublisher);
}

void TopologyManager::close() {
    std::vector<ServerHandles> servers;
    UUID topologyId;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (std::exchange(_isClosed, true))
            return;

        topologyId = _topologyDescription->getId();
        LOG_INFO() << kLogPrefix << "closing topology " << topologyId;
        for (auto& entry : _servers) {
            if (entry.second.monitor)
                entry.second.monitor->shutdown();
            servers.push_back(std::move(entry.second));
        }
        _servers.clear();
        _serversRetired.notify_one();
    }

    // drains the servers that left the topology before the close.
    if (_retirementThread.joinable())
        _retirementThread.join();

    for (auto& server : servers) {
        if (server.monitor)
            server.monitor->join();
    }

    _eventsPublisher->onTopologyClosedEvent(topologyId);
    _eventsPublisher->close();

    for (auto& server : servers) {
        server.pool->shutdown();
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _topologyChanged.notify_all();
}

bool TopologyManager::isClosed() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _isClosed;
}

void TopologyManager::_retireServers() {
    std::unique_lock<std::mutex> lock(_mutex);
    while (true) {
        _serversRetired.wait(lock, [&] { return _isClosed || !_retiredServers.empty(); });
        if (_retiredServers.empty())
            return;

        auto server = std::move(_retiredServers.front());
        _retiredServers.pop_front();
        lock.unlock();

        // a monitor stuck in connect only stops once the connect times out.
        if (server.monitor)
            server.monitor->join();
        server.pool->shutdown();
        LOG(kLogLevel) << kLogPrefix << "stopped monitoring " << server.pool->getHostAndPort();

        lock.lock();
    }
}

std::string toString(CheckinOutcome outcome) {
    switch (outcome) {
        case CheckinOutcome::kHealthy:
            return "Healthy";
        case CheckinOutcome::kNetworkError:
            return "NetworkError";
    }
    DOCDRIVER_UNREACHABLE;
}

}  // namespace docdriver::sdam
