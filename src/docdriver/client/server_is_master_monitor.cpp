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

#define DOCDRIVER_LOG_DEFAULT_COMPONENT ::docdriver::logger::LogComponent::kNetwork

#include "docdriver/client/server_is_master_monitor.h"

#include <utility>

#include "docdriver/util/assert_util.h"
#include "docdriver/util/log.h"

namespace docdriver {
namespace {

using Clock = std::chrono::steady_clock;

sdam::IsMasterRTT elapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<sdam::IsMasterRTT>(Clock::now() - start);
}

}  // namespace

ServerIsMasterMonitor::ServerIsMasterMonitor(const sdam::ServerAddress& host,
                                             const sdam::SdamConfiguration& sdamConfiguration,
                                             sdam::TopologyEventsPublisherPtr eventListener,
                                             executor::NetworkInterfacePtr net)
    : _host(host),
      _sdamConfiguration(sdamConfiguration),
      _eventListener(std::move(eventListener)),
      _net(std::move(net)) {
    invariant(_eventListener);
    invariant(_net);
    LOG(kLogLevel + 1) << "Created ServerIsMasterMonitor for host " << host;
}

ServerIsMasterMonitor::~ServerIsMasterMonitor() {
    shutdown();
    join();
}

void ServerIsMasterMonitor::init() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_isShutdown || _monitorThread.joinable())
        return;
    _monitorThread = std::thread([this] { _run(); });
    _pingerThread = std::thread([this] { _runPinger(); });
}

void ServerIsMasterMonitor::requestImmediateCheck() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_isShutdown)
        return;

    // remain in expedited mode until the replica set recovers
    if (!_isExpedited) {
        // save some log lines.
        LOG(kLogLevel) << "[ServerIsMasterMonitor] Monitoring " << _host
                       << " in expedited mode until we detect a primary.";
        _isExpedited = true;
    }

    if (_isStreaming) {
        LOG(kLogLevel + 1) << "[ServerIsMasterMonitor] immediate isMaster check requested, but "
                              "there is already an outstanding awaitable request.";
        return;
    }

    _immediateCheckRequested = true;
    _wakeup.notify_all();
}

void ServerIsMasterMonitor::disableExpeditedChecking() {
    std::lock_guard<std::mutex> lock(_mutex);
    _isExpedited = false;
}

void ServerIsMasterMonitor::shutdown() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (std::exchange(_isShutdown, true))
        return;

    LOG(kLogLevel) << "Closing ServerIsMasterMonitor for host " << _host;
    if (_connection)
        _connection->cancel();
    if (_pingConnection)
        _pingConnection->cancel();
    _wakeup.notify_all();
}

void ServerIsMasterMonitor::join() {
    if (_monitorThread.joinable())
        _monitorThread.join();
    if (_pingerThread.joinable())
        _pingerThread.join();
}

bool ServerIsMasterMonitor::isShutdown() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _isShutdown;
}

bool ServerIsMasterMonitor::isStreaming() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _isStreaming;
}

void ServerIsMasterMonitor::_run() {
    LOG(kLogLevel) << "[ServerIsMasterMonitor] starting to monitor " << _host << " with mode "
                   << sdam::toString(_sdamConfiguration.getMonitoringMode());
    while (true) {
        _doIsMaster();

        std::unique_lock<std::mutex> lk(_mutex);
        if (_isShutdown)
            break;

        // a streaming server answers when its state changes, so the next request goes out now.
        if (_isStreaming) {
            _immediateCheckRequested = false;
            continue;
        }

        _waitForNextCheck(lk);
        if (_isShutdown)
            break;
    }

    std::lock_guard<std::mutex> lk(_mutex);
    _connection.reset();
    LOG(kLogLevel) << "Done closing ServerIsMasterMonitor for host " << _host;
}

void ServerIsMasterMonitor::_doIsMaster() {
    IsMasterRequest request;
    bool awaited = false;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        if (_isShutdown)
            return;

        awaited = _isStreaming && _connection && _topologyVersion;
        if (awaited) {
            request.topologyVersion = _topologyVersion;
            request.maxAwaitTime = _sdamConfiguration.getHeartBeatFrequency();
        }
    }

    _eventListener->onServerHeartbeatStartedEvent(_host, awaited);
    const auto start = Clock::now();

    if (!_connection) {
        auto swConnection = _net->connect(_host, _sdamConfiguration.getConnectionTimeout());

        std::unique_lock<std::mutex> lk(_mutex);
        _lastIsMasterAt = Clock::now();
        if (_isShutdown)
            return;
        if (!swConnection.isOK()) {
            lk.unlock();
            _onIsMasterFailure(elapsedSince(start), swConnection.getStatus(), false);
            return;
        }
        _connection = std::move(swConnection.getValue());
    }

    auto timeout = _sdamConfiguration.getConnectionTimeout();
    if (awaited)
        timeout += *request.maxAwaitTime;
    auto swReply = _connection->runIsMaster(request, timeout);
    const auto latency = elapsedSince(start);

    std::unique_lock<std::mutex> lk(_mutex);
    _lastIsMasterAt = Clock::now();
    if (_isShutdown || ErrorCodes::isCancelationError(swReply.getStatus().code())) {
        LOG(kLogLevel) << "[ServerIsMasterMonitor] not processing response: "
                       << swReply.getStatus();
        return;
    }

    if (!swReply.isOK()) {
        // the next check reconnects
        _connection.reset();
        _topologyVersion = boost::none;
        _isStreaming = false;
        lk.unlock();
        _onIsMasterFailure(latency, swReply.getStatus(), awaited);
        return;
    }

    const auto& reply = swReply.getValue();
    _topologyVersion = reply.topologyVersion;
    const bool canStream = _sdamConfiguration.getMonitoringMode() !=
            sdam::ServerMonitoringMode::kPoll &&
        reply.topologyVersion;
    if (canStream != _isStreaming) {
        LOG(kLogLevel) << "[ServerIsMasterMonitor] " << _host << " now uses the "
                       << (canStream ? "streaming" : "polling") << " protocol";
        _isStreaming = canStream;
        _wakeup.notify_all();
    }
    lk.unlock();

    _onIsMasterSuccess(latency, reply, awaited);
}

void ServerIsMasterMonitor::_runPinger() {
    std::unique_lock<std::mutex> lk(_mutex);
    while (true) {
        _wakeup.wait(lk, [this] { return _isShutdown || _isStreaming; });
        if (_isShutdown)
            break;

        Status status = Status::OK();
        const auto start = Clock::now();
        if (!_pingConnection) {
            lk.unlock();
            auto swConnection = _net->connect(_host, _sdamConfiguration.getConnectionTimeout());
            lk.lock();
            if (_isShutdown)
                break;
            if (swConnection.isOK()) {
                _pingConnection = std::move(swConnection.getValue());
            } else {
                status = swConnection.getStatus();
            }
        }

        sdam::IsMasterRTT rtt{0};
        if (status.isOK()) {
            auto* connection = _pingConnection.get();
            lk.unlock();
            const auto pingStart = Clock::now();
            auto swReply = connection->runIsMaster(IsMasterRequest(),
                                                   _sdamConfiguration.getConnectionTimeout());
            rtt = elapsedSince(pingStart);
            lk.lock();
            if (!swReply.isOK())
                status = swReply.getStatus();
        }
        if (_isShutdown)
            break;

        if (status.isOK()) {
            lk.unlock();
            _eventListener->onServerPingSucceededEvent(rtt, _host);
            lk.lock();
        } else {
            _pingConnection.reset();
            LOG(kLogLevel) << "[ServerIsMasterMonitor] ping of " << _host << " failed after "
                           << elapsedSince(start).count() << "ms: " << status;
            lk.unlock();
            _eventListener->onServerPingFailedEvent(_host, status);
            lk.lock();
        }

        _wakeup.wait_for(
            lk, _sdamConfiguration.getHeartBeatFrequency(), [this] { return _isShutdown; });
    }
    _pingConnection.reset();
}

void ServerIsMasterMonitor::_waitForNextCheck(std::unique_lock<std::mutex>& lk) {
    while (!_isShutdown && _lastIsMasterAt) {
        const auto period = _immediateCheckRequested
            ? _sdamConfiguration.getMinHeartbeatFrequency()
            : _currentRefreshPeriod(lk);
        const auto elapsed = elapsedSince(*_lastIsMasterAt);
        if (elapsed >= period)
            break;
        _wakeup.wait_for(lk, period - elapsed);
    }
    _immediateCheckRequested = false;
}

Milliseconds ServerIsMasterMonitor::_currentRefreshPeriod(
    const std::unique_lock<std::mutex>&) const {
    return (_isExpedited) ? _sdamConfiguration.getMinHeartbeatFrequency()
                          : _sdamConfiguration.getHeartBeatFrequency();
}

void ServerIsMasterMonitor::_onIsMasterSuccess(sdam::IsMasterRTT latency,
                                               const IsMasterReply& reply,
                                               bool awaited) {
    LOG(kLogLevel + 1) << "received successful isMaster for server " << _host << " ("
                       << latency.count() << "ms)"
                       << "; " << reply;
    _eventListener->onServerHeartbeatSucceededEvent(latency, _host, reply, awaited);
}

void ServerIsMasterMonitor::_onIsMasterFailure(sdam::IsMasterRTT latency,
                                               const Status& status,
                                               bool awaited) {
    LOG(kLogLevel) << "received failed isMaster for server " << _host << ": " << status << " ("
                   << latency.count() << "ms)";
    _eventListener->onServerHeartbeatFailureEvent(latency, status, _host, awaited);
}

}  // namespace docdriver
