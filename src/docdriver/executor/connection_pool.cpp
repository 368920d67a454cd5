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

#define DOCDRIVER_LOG_DEFAULT_COMPONENT ::docdriver::logger::LogComponent::kConnectionPool

#include "docdriver/executor/connection_pool.h"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

#include "docdriver/util/assert_util.h"
#include "docdriver/util/log.h"

namespace docdriver {
namespace executor {

const Milliseconds ConnectionPool::kDefaultWaitQueueTimeout = Seconds(30);
const Milliseconds ConnectionPool::kDefaultConnectTimeout = Seconds(10);
const Milliseconds ConnectionPool::kDefaultMaintenanceInterval = Milliseconds(100);

std::string toString(ConnectionPool::CloseReason reason) {
    switch (reason) {
        case ConnectionPool::CloseReason::kStale:
            return "stale";
        case ConnectionPool::CloseReason::kIdle:
            return "idle";
        case ConnectionPool::CloseReason::kError:
            return "error";
        case ConnectionPool::CloseReason::kPoolClosed:
            return "poolClosed";
    }
    DOCDRIVER_UNREACHABLE;
}

std::string toString(ConnectionPool::CheckoutFailedReason reason) {
    switch (reason) {
        case ConnectionPool::CheckoutFailedReason::kTimeout:
            return "timeout";
        case ConnectionPool::CheckoutFailedReason::kConnectionError:
            return "connectionError";
        case ConnectionPool::CheckoutFailedReason::kPoolClosed:
            return "poolClosed";
    }
    DOCDRIVER_UNREACHABLE;
}

void ConnectionPool::Options::validate() const {
    uassert(ErrorCodes::BadValue, "maxPoolSize must be greater than 0", maxPoolSize > 0);
    uassert(ErrorCodes::BadValue,
            "minPoolSize must not be greater than maxPoolSize",
            minPoolSize <= maxPoolSize);
    uassert(ErrorCodes::BadValue,
            "maxIdleTimeMS must be greater than 0",
            !maxIdleTime || *maxIdleTime > Milliseconds(0));
    uassert(ErrorCodes::BadValue,
            "waitQueueTimeoutMS must not be negative",
            waitQueueTimeout >= Milliseconds(0));
    uassert(ErrorCodes::BadValue,
            "connectTimeoutMS must be greater than 0",
            connectTimeout > Milliseconds(0));
    uassert(ErrorCodes::BadValue,
            "the maintenance interval must be greater than 0",
            maintenanceInterval > Milliseconds(0));
}

std::string ConnectionPool::Options::toString() const {
    std::ostringstream os;
    os << "{maxPoolSize: " << maxPoolSize << ", minPoolSize: " << minPoolSize;
    if (maxIdleTime)
        os << ", maxIdleTimeMS: " << maxIdleTime->count();
    os << ", waitQueueTimeoutMS: " << waitQueueTimeout.count()
       << ", connectTimeoutMS: " << connectTimeout.count() << "}";
    return os.str();
}

ConnectionPool::PooledConnection::PooledConnection(std::unique_ptr<NetworkConnection> connection,
                                                   uint64_t id,
                                                   uint64_t generation,
                                                   Date_t now)
    : _connection(std::move(connection)), _id(id), _generation(generation), _lastUsed(now) {
    invariant(_connection);
}

void ConnectionPool::PooledConnection::indicateFailed(const Status& status) {
    invariant(!status.isOK());
    _failure = status;
}

ConnectionPool::ConnectionPool(HostAndPort hostAndPort,
                               NetworkInterfacePtr net,
                               ClockSource* clockSource,
                               Options options)
    : _hostAndPort(std::move(hostAndPort)),
      _net(std::move(net)),
      _clockSource(clockSource),
      _options(std::move(options)) {
    _options.validate();
    invariant(_net);
    invariant(_clockSource);
    LOG(kLogLevel) << "Connection pool created for " << _hostAndPort << " using options "
                   << _options.toString();
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

void ConnectionPool::startup() {
    std::lock_guard<std::mutex> lk(_mutex);
    if (_isShutdown || _maintenanceThread.joinable())
        return;
    _maintenanceThread = std::thread([this] { _maintenanceLoop(); });
    LOG(kLogLevel) << "Connection pool ready for " << _hostAndPort;
}

StatusWith<ConnectionPool::ConnectionHandle> ConnectionPool::checkout() {
    return checkout(_options.waitQueueTimeout);
}

StatusWith<ConnectionPool::ConnectionHandle> ConnectionPool::checkout(Milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    LOG(kLogLevel + 1) << "Checkout started for " << _hostAndPort;

    std::unique_lock<std::mutex> lk(_mutex);
    const auto generation = _generation;
    while (true) {
        if (_isShutdown) {
            return _checkoutFailed(
                lk,
                CheckoutFailedReason::kPoolClosed,
                Status(ErrorCodes::ShutdownInProgress,
                       "connection pool for " + _hostAndPort.toString() + " is closed"));
        }
        if (_generation != generation) {
            return _checkoutFailed(lk,
                                   CheckoutFailedReason::kConnectionError,
                                   Status(ErrorCodes::PoolCleared,
                                          "connection pool for " + _hostAndPort.toString() +
                                              " was cleared during checkout: " +
                                              _clearCause.reason()));
        }

        while (!_available.empty()) {
            auto connection = std::move(_available.back());
            _available.pop_back();
            if (auto reason = _perishedReason(lk, *connection)) {
                _closeConnection(lk, std::move(connection), *reason);
                continue;
            }
            return _handOut(lk, std::move(connection));
        }

        if (_totalInLock(lk) < _options.maxPoolSize) {
            const auto remaining = std::chrono::duration_cast<Milliseconds>(
                deadline - std::chrono::steady_clock::now());
            auto swConnection = _spawnConnection(
                lk, std::max(Milliseconds(1), std::min(_options.connectTimeout, remaining)));
            if (!swConnection.isOK()) {
                _connectionAvailable.notify_one();
                return _checkoutFailed(
                    lk, CheckoutFailedReason::kConnectionError, swConnection.getStatus());
            }

            auto& connection = swConnection.getValue();
            if (_isShutdown) {
                _closeConnection(lk, std::move(connection), CloseReason::kPoolClosed);
                continue;
            }
            if (connection->getGeneration() != _generation) {
                // the pool was cleared while we were connecting; the next pass fails the checkout
                _closeConnection(lk, std::move(connection), CloseReason::kStale);
                continue;
            }
            return _handOut(lk, std::move(connection));
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return _checkoutFailed(
                lk,
                CheckoutFailedReason::kTimeout,
                Status(ErrorCodes::PoolTimeout,
                       "timed out after " + std::to_string(timeout.count()) +
                           "ms waiting for a connection to " + _hostAndPort.toString() +
                           " from a pool of maxPoolSize " +
                           std::to_string(_options.maxPoolSize)));
        }
        _connectionAvailable.wait_until(lk, deadline);
    }
}

void ConnectionPool::clear(const Status& cause) {
    std::unique_lock<std::mutex> lk(_mutex);
    if (_isShutdown)
        return;

    ++_generation;
    _clearCause = cause;
    LOG_INFO() << "Connection pool for " << _hostAndPort << " cleared, generation is now "
               << _generation << ": " << cause;
    _closeAvailable(lk, CloseReason::kStale);
    _connectionAvailable.notify_all();
}

void ConnectionPool::shutdown() {
    {
        std::unique_lock<std::mutex> lk(_mutex);
        if (std::exchange(_isShutdown, true))
            return;

        LOG(kLogLevel) << "Closing connection pool for " << _hostAndPort;
        _closeAvailable(lk, CloseReason::kPoolClosed);
    }
    _connectionAvailable.notify_all();
    _maintenanceWakeup.notify_all();

    if (_maintenanceThread.joinable()) {
        invariant(_maintenanceThread.get_id() != std::this_thread::get_id());
        _maintenanceThread.join();
    }
    LOG(kLogLevel) << "Connection pool for " << _hostAndPort << " closed";
}

bool ConnectionPool::isShutdown() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _isShutdown;
}

uint64_t ConnectionPool::getGeneration() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _generation;
}

ConnectionPool::Stats ConnectionPool::getStats() const {
    std::unique_lock<std::mutex> lk(_mutex);
    Stats stats;
    stats.available = _available.size();
    stats.inUse = _inUse;
    stats.pending = _pending;
    stats.total = _totalInLock(lk);
    stats.created = _created;
    stats.generation = _generation;
    return stats;
}

void ConnectionPool::_checkin(PooledConnection* rawConnection) {
    OwnedConnection connection(rawConnection);
    {
        std::unique_lock<std::mutex> lk(_mutex);
        invariant(_inUse > 0);
        --_inUse;
        LOG(kLogLevel + 1) << "Connection " << connection->getId() << " checked in to "
                           << _hostAndPort;

        if (_isShutdown) {
            _closeConnection(lk, std::move(connection), CloseReason::kPoolClosed);
        } else if (connection->getGeneration() != _generation) {
            _closeConnection(lk, std::move(connection), CloseReason::kStale);
        } else if (connection->isFailed() || !connection->getConnection()->isHealthy()) {
            _closeConnection(lk, std::move(connection), CloseReason::kError);
        } else {
            connection->indicateUsed(_clockSource->now());
            _available.push_back(std::move(connection));
        }
    }
    _connectionAvailable.notify_one();
}

void ConnectionPool::_maintenanceLoop() {
    std::unique_lock<std::mutex> lk(_mutex);
    while (!_isShutdown) {
        _maintenanceWakeup.wait_for(lk, _options.maintenanceInterval, [this] {
            return _isShutdown;
        });
        if (_isShutdown)
            break;

        // Prune perished idle connections, keeping the most recently used order.
        std::vector<OwnedConnection> keep;
        for (auto& connection : _available) {
            if (auto reason = _perishedReason(lk, *connection)) {
                _closeConnection(lk, std::move(connection), *reason);
            } else {
                keep.push_back(std::move(connection));
            }
        }
        _available = std::move(keep);

        while (!_isShutdown && _totalInLock(lk) < _options.minPoolSize) {
            auto swConnection = _spawnConnection(lk, _options.connectTimeout);
            if (!swConnection.isOK()) {
                LOG(kLogLevel) << "Background connect to " << _hostAndPort
                               << " failed: " << swConnection.getStatus();
                break;
            }

            auto& connection = swConnection.getValue();
            if (_isShutdown) {
                _closeConnection(lk, std::move(connection), CloseReason::kPoolClosed);
                break;
            }
            if (connection->getGeneration() != _generation) {
                _closeConnection(lk, std::move(connection), CloseReason::kStale);
                continue;
            }
            // new connections go to the least recently used end
            _available.insert(_available.begin(), std::move(connection));
            _connectionAvailable.notify_one();
        }
    }
}

// Connects outside of the pool lock. The connection counts as pending until it is established, so
// maxPoolSize also bounds concurrent connects.
StatusWith<ConnectionPool::OwnedConnection> ConnectionPool::_spawnConnection(
    std::unique_lock<std::mutex>& lk, Milliseconds timeout) {
    const auto generation = _generation;
    const auto id = _nextConnectionId++;
    ++_pending;

    lk.unlock();
    auto swConnection = _net->connect(_hostAndPort, timeout);
    lk.lock();

    invariant(_pending > 0);
    --_pending;
    if (!swConnection.isOK()) {
        LOG(kLogLevel) << "Failed to open connection " << id << " to " << _hostAndPort << ": "
                       << swConnection.getStatus();
        return swConnection.getStatus();
    }

    ++_created;
    LOG(kLogLevel) << "Connection " << id << " created to " << _hostAndPort << " (generation "
                   << generation << ")";
    auto connection = std::make_unique<PooledConnection>(
        std::move(swConnection.getValue()), id, generation, _clockSource->now());
    LOG(kLogLevel + 1) << "Connection " << id << " to " << _hostAndPort << " ready";
    return std::move(connection);
}

boost::optional<ConnectionPool::CloseReason> ConnectionPool::_perishedReason(
    const std::unique_lock<std::mutex>&, const PooledConnection& connection) {
    if (connection.getGeneration() != _generation)
        return CloseReason::kStale;
    if (_options.maxIdleTime &&
        _clockSource->now() - connection.getLastUsed() >= *_options.maxIdleTime)
        return CloseReason::kIdle;
    if (connection.isFailed() || !connection.getConnection()->isHealthy())
        return CloseReason::kError;
    return boost::none;
}

void ConnectionPool::_closeConnection(const std::unique_lock<std::mutex>&,
                                      OwnedConnection connection,
                                      CloseReason reason) {
    LOG(kLogLevel) << "Connection " << connection->getId() << " to " << _hostAndPort
                   << " closed, reason: " << toString(reason);
    connection.reset();
}

void ConnectionPool::_closeAvailable(const std::unique_lock<std::mutex>& lk,
                                     CloseReason reason) {
    auto available = std::move(_available);
    _available.clear();
    for (auto& connection : available) {
        _closeConnection(lk, std::move(connection), reason);
    }
}

ConnectionPool::ConnectionHandle ConnectionPool::_handOut(const std::unique_lock<std::mutex>&,
                                                          OwnedConnection connection) {
    ++_inUse;
    connection->indicateUsed(_clockSource->now());
    LOG(kLogLevel + 1) << "Connection " << connection->getId() << " to " << _hostAndPort
                       << " checked out";
    return ConnectionHandle(connection.release(), ConnectionHandleDeleter(shared_from_this()));
}

StatusWith<ConnectionPool::ConnectionHandle> ConnectionPool::_checkoutFailed(
    const std::unique_lock<std::mutex>&, CheckoutFailedReason reason, Status status) {
    LOG(kLogLevel) << "Checkout failed for " << _hostAndPort << ", reason: " << toString(reason)
                   << ": " << status;
    return status;
}

size_t ConnectionPool::_totalInLock(const std::unique_lock<std::mutex>&) const {
    return _available.size() + _inUse + _pending;
}

}  // namespace executor
}  // namespace docdriver
