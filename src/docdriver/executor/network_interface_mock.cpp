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

#include "docdriver/executor/network_interface_mock.h"

#include <algorithm>
#include <chrono>
#include <thread>

#include "docdriver/util/log.h"

namespace docdriver {
namespace executor {

class NetworkInterfaceMock::MockConnection : public NetworkConnection {
public:
    MockConnection(std::shared_ptr<State> state, HostAndPort host, int64_t healthEpoch)
        : _state(std::move(state)), _host(std::move(host)), _healthEpoch(healthEpoch) {}

    const HostAndPort& getHostAndPort() const override {
        return _host;
    }

    StatusWith<IsMasterReply> runIsMaster(const IsMasterRequest& request,
                                          Milliseconds timeout) override {
        std::unique_lock<std::mutex> lk(_state->mutex);
        if (_canceled)
            return Status(ErrorCodes::CallbackCanceled, "health check canceled");

        auto& hostState = _state->hosts[_host];
        ++hostState.isMasterCount;
        if (request.isAwaitable())
            ++hostState.awaitableIsMasterCount;
        _state->changed.notify_all();

        if (request.isAwaitable() && hostState.reply && hostState.replyStatus.isOK() &&
            hostState.reply->topologyVersion == request.topologyVersion) {
            const auto scriptVersion = hostState.scriptVersion;
            const auto maxWait = std::min(*request.maxAwaitTime, timeout);
            _state->changed.wait_for(lk, maxWait, [&] {
                return _canceled || _state->hosts[_host].scriptVersion != scriptVersion;
            });
            if (_canceled)
                return Status(ErrorCodes::CallbackCanceled, "health check canceled");
        }

        const auto& current = _state->hosts[_host];
        if (!current.replyStatus.isOK()) {
            _failed = true;
            return current.replyStatus;
        }
        if (_healthEpoch != current.healthEpoch) {
            _failed = true;
            return Status(ErrorCodes::SocketException,
                          "connection to " + _host.toString() + " was reset");
        }
        if (!current.reply) {
            _failed = true;
            return Status(ErrorCodes::HostUnreachable,
                          "no server is listening at " + _host.toString());
        }
        return *current.reply;
    }

    bool isHealthy() const override {
        std::lock_guard<std::mutex> lk(_state->mutex);
        auto it = _state->hosts.find(_host);
        return !_failed && !_canceled && it != _state->hosts.end() &&
            it->second.healthEpoch == _healthEpoch;
    }

    void cancel() override {
        std::lock_guard<std::mutex> lk(_state->mutex);
        _canceled = true;
        _state->changed.notify_all();
    }

private:
    const std::shared_ptr<State> _state;
    const HostAndPort _host;
    const int64_t _healthEpoch;

    // guarded by _state->mutex
    bool _failed = false;
    bool _canceled = false;
};

NetworkInterfaceMock::NetworkInterfaceMock() : _state(std::make_shared<State>()) {}

NetworkInterfaceMock::~NetworkInterfaceMock() {
    std::lock_guard<std::mutex> lk(_state->mutex);
    for (auto& hostAndState : _state->hosts) {
        ++hostAndState.second.scriptVersion;
    }
    _state->changed.notify_all();
}

StatusWith<std::unique_ptr<NetworkConnection>> NetworkInterfaceMock::connect(
    const HostAndPort& host, Milliseconds timeout) {
    Milliseconds delay;
    {
        std::lock_guard<std::mutex> lk(_state->mutex);
        auto& hostState = _state->hosts[host];
        ++hostState.connectCount;
        delay = hostState.connectDelay;
    }

    if (delay > Milliseconds(0)) {
        std::this_thread::sleep_for(std::min(delay, timeout));
        if (delay > timeout) {
            return Status(ErrorCodes::NetworkTimeout,
                          "timed out connecting to " + host.toString() + " after " +
                              std::to_string(timeout.count()) + "ms");
        }
    }

    std::lock_guard<std::mutex> lk(_state->mutex);
    const auto& hostState = _state->hosts[host];
    if (!hostState.connectStatus.isOK())
        return hostState.connectStatus;
    if (!hostState.replyStatus.isOK() && ErrorCodes::isNetworkError(hostState.replyStatus.code()))
        return hostState.replyStatus;
    if (!hostState.reply && hostState.replyStatus.isOK()) {
        return Status(ErrorCodes::HostUnreachable,
                      "no server is listening at " + host.toString());
    }

    LOG(3) << "mock connection opened to " << host;
    std::unique_ptr<NetworkConnection> connection =
        std::make_unique<MockConnection>(_state, host, hostState.healthEpoch);
    return std::move(connection);
}

void NetworkInterfaceMock::setIsMasterReply(const HostAndPort& host, IsMasterReply reply) {
    std::lock_guard<std::mutex> lk(_state->mutex);
    auto& hostState = _state->hosts[host];
    hostState.reply = std::move(reply);
    hostState.replyStatus = Status::OK();
    ++hostState.scriptVersion;
    _state->changed.notify_all();
}

void NetworkInterfaceMock::setIsMasterError(const HostAndPort& host, Status status) {
    invariant(!status.isOK());
    std::lock_guard<std::mutex> lk(_state->mutex);
    auto& hostState = _state->hosts[host];
    hostState.replyStatus = std::move(status);
    ++hostState.scriptVersion;
    _state->changed.notify_all();
}

void NetworkInterfaceMock::setConnectStatus(const HostAndPort& host, Status status) {
    std::lock_guard<std::mutex> lk(_state->mutex);
    _state->hosts[host].connectStatus = std::move(status);
}

void NetworkInterfaceMock::setConnectDelay(const HostAndPort& host, Milliseconds delay) {
    std::lock_guard<std::mutex> lk(_state->mutex);
    _state->hosts[host].connectDelay = delay;
}

void NetworkInterfaceMock::breakConnections(const HostAndPort& host) {
    std::lock_guard<std::mutex> lk(_state->mutex);
    auto& hostState = _state->hosts[host];
    ++hostState.healthEpoch;
    ++hostState.scriptVersion;
    _state->changed.notify_all();
}

int NetworkInterfaceMock::getConnectCount(const HostAndPort& host) const {
    std::lock_guard<std::mutex> lk(_state->mutex);
    auto it = _state->hosts.find(host);
    return it == _state->hosts.end() ? 0 : it->second.connectCount;
}

int NetworkInterfaceMock::getIsMasterCount(const HostAndPort& host) const {
    std::lock_guard<std::mutex> lk(_state->mutex);
    auto it = _state->hosts.find(host);
    return it == _state->hosts.end() ? 0 : it->second.isMasterCount;
}

int NetworkInterfaceMock::getAwaitableIsMasterCount(const HostAndPort& host) const {
    std::lock_guard<std::mutex> lk(_state->mutex);
    auto it = _state->hosts.find(host);
    return it == _state->hosts.end() ? 0 : it->second.awaitableIsMasterCount;
}

bool NetworkInterfaceMock::waitForIsMasterCount(const HostAndPort& host,
                                                int count,
                                                Milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(_state->mutex);
    return _state->changed.wait_for(lk, timeout, [&] {
        auto it = _state->hosts.find(host);
        return it != _state->hosts.end() && it->second.isMasterCount >= count;
    });
}

}  // namespace executor
}  // namespace docdriver
