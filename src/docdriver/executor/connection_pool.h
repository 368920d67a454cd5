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
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "docdriver/base/status_with.h"
#include "docdriver/executor/network_interface.h"
#include "docdriver/util/clock_source.h"
#include "docdriver/util/duration.h"
#include "docdriver/util/net/host_and_port.h"

namespace docdriver {
namespace executor {

/**
 * The connection pool for one server.
 *
 * Connections are created lazily by checkout() up to maxPoolSize, and in the background up to
 * minPoolSize. Every connection is stamped with the pool generation current when it was
 * created; clear() bumps the generation, which destroys the idle connections immediately and
 * the checked out ones when they come back.
 *
 * Pools must be owned by a shared_ptr: every checked out handle keeps its pool alive.
 */
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
    class ConnectionHandleDeleter;

public:
    class PooledConnection;

    using ConnectionHandle = std::unique_ptr<PooledConnection, ConnectionHandleDeleter>;

    static const Milliseconds kDefaultWaitQueueTimeout;
    static const Milliseconds kDefaultConnectTimeout;
    static const Milliseconds kDefaultMaintenanceInterval;

    enum class CloseReason { kStale, kIdle, kError, kPoolClosed };
    enum class CheckoutFailedReason { kTimeout, kConnectionError, kPoolClosed };

    struct Options {
        Options() {}

        /**
         * The maximum number of connections to the server. This includes pending connections
         * being established and connections checked out of the pool as well as the idle ones.
         */
        size_t maxPoolSize = 100;

        /**
         * The number of connections the background task keeps open.
         */
        size_t minPoolSize = 0;

        /**
         * Idle connections unused for longer than this are closed. Unset means never.
         */
        boost::optional<Milliseconds> maxIdleTime;

        /**
         * How long checkout() waits for a connection when the pool is at maxPoolSize.
         */
        Milliseconds waitQueueTimeout = kDefaultWaitQueueTimeout;

        Milliseconds connectTimeout = kDefaultConnectTimeout;

        /**
         * Period of the background task that prunes perished connections.
         */
        Milliseconds maintenanceInterval = kDefaultMaintenanceInterval;

        /**
         * Throws DBException(BadValue) if the options are contradictory.
         */
        void validate() const;

        std::string toString() const;
    };

    struct Stats {
        size_t available = 0;
        size_t inUse = 0;
        size_t pending = 0;
        size_t total = 0;
        size_t created = 0;
        uint64_t generation = 0;
    };

    ConnectionPool(HostAndPort hostAndPort,
                   NetworkInterfacePtr net,
                   ClockSource* clockSource,
                   Options options = Options{});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * Starts the background maintenance task.
     */
    void startup();

    /**
     * Returns an idle connection, or a new one if the pool is below maxPoolSize. Otherwise waits
     * up to 'timeout' for one to be returned and fails with PoolTimeout.
     *
     * Fails with ShutdownInProgress once the pool is shut down, with PoolCleared if the pool is
     * cleared before a connection was handed out, and with the connect error if a new connection
     * could not be established.
     */
    StatusWith<ConnectionHandle> checkout(Milliseconds timeout);
    StatusWith<ConnectionHandle> checkout();

    /**
     * Invalidates every connection created so far. Idle connections are closed now; checked out
     * ones are closed when they are returned. Checkouts waiting for a connection fail with
     * PoolCleared. Does not wait for in flight operations.
     */
    void clear(const Status& cause);

    /**
     * Closes the idle connections and stops the background task. Waiting and later checkouts
     * fail with ShutdownInProgress; checked out connections are closed when they are returned.
     */
    void shutdown();

    bool isShutdown() const;

    uint64_t getGeneration() const;

    Stats getStats() const;

    const HostAndPort& getHostAndPort() const {
        return _hostAndPort;
    }

    const Options& getOptions() const {
        return _options;
    }

private:
    using OwnedConnection = std::unique_ptr<PooledConnection>;

    void _checkin(PooledConnection* connection);

    void _maintenanceLoop();

    /**
     * Opens a new connection without holding the lock. The caller must have counted it as
     * pending.
     */
    StatusWith<OwnedConnection> _spawnConnection(std::unique_lock<std::mutex>& lk,
                                                 Milliseconds timeout);

    boost::optional<CloseReason> _perishedReason(const std::unique_lock<std::mutex>& lk,
                                                 const PooledConnection& connection);

    void _closeConnection(const std::unique_lock<std::mutex>& lk,
                          OwnedConnection connection,
                          CloseReason reason);

    void _closeAvailable(const std::unique_lock<std::mutex>& lk, CloseReason reason);

    ConnectionHandle _handOut(const std::unique_lock<std::mutex>& lk, OwnedConnection connection);

    StatusWith<ConnectionHandle> _checkoutFailed(const std::unique_lock<std::mutex>& lk,
                                                 CheckoutFailedReason reason,
                                                 Status status);

    size_t _totalInLock(const std::unique_lock<std::mutex>& lk) const;

    static constexpr int kLogLevel = 2;

    const HostAndPort _hostAndPort;
    const NetworkInterfacePtr _net;
    ClockSource* const _clockSource;

    // Options are set at startup and never changed at run time, so these are accessed outside
    // the lock
    const Options _options;

    mutable std::mutex _mutex;
    std::condition_variable _connectionAvailable;
    std::condition_variable _maintenanceWakeup;

    // most recently used at the back
    std::vector<OwnedConnection> _available;
    size_t _inUse = 0;
    size_t _pending = 0;
    size_t _created = 0;
    uint64_t _nextConnectionId = 1;
    uint64_t _generation = 0;
    // why the pool was last cleared
    Status _clearCause = Status::OK();
    bool _isShutdown = false;

    std::thread _maintenanceThread;
};

using ConnectionPoolPtr = std::shared_ptr<ConnectionPool>;

std::string toString(ConnectionPool::CloseReason reason);
std::string toString(ConnectionPool::CheckoutFailedReason reason);

/**
 * A connection owned by the pool. While checked out it belongs to the holder of its handle.
 */
class ConnectionPool::PooledConnection {
public:
    PooledConnection(std::unique_ptr<NetworkConnection> connection,
                     uint64_t id,
                     uint64_t generation,
                     Date_t now);

    NetworkConnection* getConnection() const {
        return _connection.get();
    }

    NetworkConnection* operator->() const {
        return _connection.get();
    }

    const HostAndPort& getHostAndPort() const {
        return _connection->getHostAndPort();
    }

    uint64_t getId() const {
        return _id;
    }

    uint64_t getGeneration() const {
        return _generation;
    }

    Date_t getLastUsed() const {
        return _lastUsed;
    }

    void indicateUsed(Date_t now) {
        _lastUsed = now;
    }

    /**
     * Marks the connection as unusable. It is closed instead of being returned to the pool.
     */
    void indicateFailed(const Status& status);

    bool isFailed() const {
        return !_failure.isOK();
    }

    const Status& getFailure() const {
        return _failure;
    }

private:
    const std::unique_ptr<NetworkConnection> _connection;
    const uint64_t _id;
    const uint64_t _generation;
    Date_t _lastUsed;
    Status _failure = Status::OK();
};

class ConnectionPool::ConnectionHandleDeleter {
public:
    ConnectionHandleDeleter() = default;
    explicit ConnectionHandleDeleter(std::shared_ptr<ConnectionPool> pool)
        : _pool(std::move(pool)) {}

    void operator()(PooledConnection* connection) {
        if (_pool && connection)
            _pool->_checkin(connection);
    }

private:
    std::shared_ptr<ConnectionPool> _pool;
};

}  // namespace executor
}  // namespace docdriver
