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

#include "docdriver/executor/connection_pool.h"

#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <vector>

#include "docdriver/executor/network_interface_mock.h"
#include "docdriver/util/clock_source_mock.h"

namespace docdriver {
namespace executor {
namespace {

class ConnectionPoolTestFixture : public ::testing::Test {
protected:
    void SetUp() override {
        net = std::make_shared<NetworkInterfaceMock>();
        net->setIsMasterReply(kHost, IsMasterReply());
    }

    ConnectionPoolPtr makePool(ConnectionPool::Options options = ConnectionPool::Options{}) {
        return std::make_shared<ConnectionPool>(kHost, net, &clockSource, options);
    }

    static ConnectionPool::Options singleConnectionOptions() {
        ConnectionPool::Options options;
        options.maxPoolSize = 1;
        return options;
    }

    const HostAndPort kHost{"localhost", 27017};
    std::shared_ptr<NetworkInterfaceMock> net;
    ClockSourceMock clockSource;
};

TEST_F(ConnectionPoolTestFixture, ShouldReuseIdleConnection) {
    auto pool = makePool();

    uint64_t firstId;
    {
        auto handle = uassertStatusOK(pool->checkout());
        firstId = handle->getId();
        ASSERT_EQ(1u, pool->getStats().inUse);
    }
    ASSERT_EQ(1u, pool->getStats().available);

    auto handle = uassertStatusOK(pool->checkout());
    ASSERT_EQ(firstId, handle->getId());
    ASSERT_EQ(1, net->getConnectCount(kHost));
    ASSERT_EQ(1u, pool->getStats().created);
}

TEST_F(ConnectionPoolTestFixture, ShouldCreateDistinctConnectionsWhileCheckedOut) {
    auto pool = makePool();

    auto first = uassertStatusOK(pool->checkout());
    auto second = uassertStatusOK(pool->checkout());
    ASSERT_NE(first->getId(), second->getId());
    ASSERT_NE(first.get(), second.get());

    const auto stats = pool->getStats();
    ASSERT_EQ(2u, stats.inUse);
    ASSERT_EQ(0u, stats.available);
    ASSERT_EQ(2u, stats.total);
}

TEST_F(ConnectionPoolTestFixture, ShouldNeverHandOutSameConnectionConcurrently) {
    auto pool = makePool(singleConnectionOptions());

    constexpr int kThreads = 8;
    constexpr int kIterations = 50;
    std::atomic<int> holders{0};
    std::atomic<int> maxHolders{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < kIterations; ++j) {
                auto swHandle = pool->checkout(Seconds(30));
                if (!swHandle.isOK()) {
                    ++failures;
                    continue;
                }
                const auto current = ++holders;
                int observed = maxHolders.load();
                while (current > observed && !maxHolders.compare_exchange_weak(observed, current)) {
                }
                std::this_thread::yield();
                --holders;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    ASSERT_EQ(0, failures.load());
    ASSERT_EQ(1, maxHolders.load());
    ASSERT_EQ(1u, pool->getStats().created);
}

TEST_F(ConnectionPoolTestFixture, ShouldDestroyPreClearConnectionOnCheckin) {
    auto pool = makePool();
    ASSERT_EQ(0u, pool->getGeneration());

    auto handle = uassertStatusOK(pool->checkout());
    const auto staleId = handle->getId();
    ASSERT_EQ(0u, handle->getGeneration());

    pool->clear(Status(ErrorCodes::HostUnreachable, "monitor check failed"));
    ASSERT_EQ(1u, pool->getGeneration());

    handle.reset();
    auto stats = pool->getStats();
    ASSERT_EQ(0u, stats.available);
    ASSERT_EQ(0u, stats.total);

    auto fresh = uassertStatusOK(pool->checkout());
    ASSERT_NE(staleId, fresh->getId());
    ASSERT_EQ(1u, fresh->getGeneration());
}

TEST_F(ConnectionPoolTestFixture, ShouldCloseIdleConnectionsOnClear) {
    auto pool = makePool();
    uassertStatusOK(pool->checkout());
    ASSERT_EQ(1u, pool->getStats().available);

    pool->clear(Status(ErrorCodes::SocketException, "connection reset"));
    ASSERT_EQ(0u, pool->getStats().available);
}

TEST_F(ConnectionPoolTestFixture, ShouldTimeoutWhenPoolIsExhausted) {
    auto pool = makePool(singleConnectionOptions());
    auto held = uassertStatusOK(pool->checkout());

    auto swHandle = pool->checkout(Milliseconds(50));
    ASSERT_FALSE(swHandle.isOK());
    ASSERT_EQ(ErrorCodes::PoolTimeout, swHandle.getStatus().code());
    ASSERT_EQ(1u, pool->getStats().inUse);
}

TEST_F(ConnectionPoolTestFixture, ShouldWakeWaiterWhenConnectionIsReturned) {
    auto pool = makePool(singleConnectionOptions());
    auto held = uassertStatusOK(pool->checkout());
    const auto heldId = held->getId();

    uint64_t waiterId = 0;
    std::thread waiter([&] {
        auto handle = uassertStatusOK(pool->checkout(Seconds(30)));
        waiterId = handle->getId();
    });

    std::this_thread::sleep_for(Milliseconds(50));
    held.reset();
    waiter.join();

    ASSERT_EQ(heldId, waiterId);
}

TEST_F(ConnectionPoolTestFixture, ShouldSurfaceConnectErrors) {
    net->setConnectStatus(kHost, Status(ErrorCodes::HostUnreachable, "connection refused"));
    auto pool = makePool();

    auto swHandle = pool->checkout(Seconds(1));
    ASSERT_FALSE(swHandle.isOK());
    ASSERT_TRUE(ErrorCodes::isNetworkError(swHandle.getStatus().code()));

    const auto stats = pool->getStats();
    ASSERT_EQ(0u, stats.pending);
    ASSERT_EQ(0u, stats.total);
}

TEST_F(ConnectionPoolTestFixture, ShouldTimeoutSlowConnects) {
    net->setConnectDelay(kHost, Milliseconds(200));
    ConnectionPool::Options options;
    options.connectTimeout = Milliseconds(20);
    auto pool = makePool(options);

    auto swHandle = pool->checkout(Seconds(1));
    ASSERT_EQ(ErrorCodes::NetworkTimeout, swHandle.getStatus().code());
}

TEST_F(ConnectionPoolTestFixture, ShouldFailCheckoutAfterShutdown) {
    auto pool = makePool();
    auto held = uassertStatusOK(pool->checkout());
    uassertStatusOK(pool->checkout());
    ASSERT_EQ(1u, pool->getStats().available);

    pool->shutdown();
    ASSERT_TRUE(pool->isShutdown());
    ASSERT_EQ(0u, pool->getStats().available);

    auto swHandle = pool->checkout(Seconds(1));
    ASSERT_EQ(ErrorCodes::ShutdownInProgress, swHandle.getStatus().code());

    held.reset();
    ASSERT_EQ(0u, pool->getStats().total);
}

TEST_F(ConnectionPoolTestFixture, ShouldFailWaitersOnShutdown) {
    auto pool = makePool(singleConnectionOptions());
    auto held = uassertStatusOK(pool->checkout());

    Status waiterStatus = Status::OK();
    std::thread waiter([&] { waiterStatus = pool->checkout(Seconds(30)).getStatus(); });

    std::this_thread::sleep_for(Milliseconds(50));
    pool->shutdown();
    waiter.join();

    ASSERT_EQ(ErrorCodes::ShutdownInProgress, waiterStatus.code());
}

TEST_F(ConnectionPoolTestFixture, ShouldFailWaitersOnClear) {
    auto pool = makePool(singleConnectionOptions());
    auto held = uassertStatusOK(pool->checkout());

    Status waiterStatus = Status::OK();
    std::thread waiter([&] { waiterStatus = pool->checkout(Seconds(30)).getStatus(); });

    std::this_thread::sleep_for(Milliseconds(50));
    pool->clear(Status(ErrorCodes::HostUnreachable, "monitor check failed"));
    waiter.join();

    ASSERT_EQ(ErrorCodes::PoolCleared, waiterStatus.code());
    ASSERT_NE(std::string::npos, waiterStatus.reason().find("monitor check failed"));

    // the pool stays usable
    held.reset();
    auto fresh = uassertStatusOK(pool->checkout(Seconds(5)));
    ASSERT_EQ(1u, fresh->getGeneration());
}

TEST_F(ConnectionPoolTestFixture, ShouldCloseUnhealthyConnectionOnCheckin) {
    auto pool = makePool();
    {
        auto handle = uassertStatusOK(pool->checkout());
        net->breakConnections(kHost);
        ASSERT_FALSE(handle->getConnection()->isHealthy());
    }
    ASSERT_EQ(0u, pool->getStats().available);
    ASSERT_EQ(0u, pool->getGeneration());
}

TEST_F(ConnectionPoolTestFixture, ShouldCloseConnectionMarkedFailed) {
    auto pool = makePool();
    {
        auto handle = uassertStatusOK(pool->checkout());
        handle->indicateFailed(Status(ErrorCodes::SocketException, "broken pipe"));
        ASSERT_TRUE(handle->isFailed());
    }
    ASSERT_EQ(0u, pool->getStats().total);
}

TEST_F(ConnectionPoolTestFixture, ShouldNotReuseConnectionsIdleLongerThanMaxIdleTime) {
    ConnectionPool::Options options;
    options.maxIdleTime = Seconds(1);
    auto pool = makePool(options);

    uint64_t firstId;
    {
        auto handle = uassertStatusOK(pool->checkout());
        firstId = handle->getId();
    }

    clockSource.advance(Milliseconds(500));
    {
        auto handle = uassertStatusOK(pool->checkout());
        ASSERT_EQ(firstId, handle->getId());
    }

    clockSource.advance(Seconds(2));
    auto handle = uassertStatusOK(pool->checkout());
    ASSERT_NE(firstId, handle->getId());
    ASSERT_EQ(2, net->getConnectCount(kHost));
}

TEST_F(ConnectionPoolTestFixture, ShouldMaintainMinPoolSizeInBackground) {
    ConnectionPool::Options options;
    options.minPoolSize = 2;
    options.maintenanceInterval = Milliseconds(10);
    auto pool = makePool(options);
    pool->startup();

    const auto deadline = std::chrono::steady_clock::now() + Seconds(5);
    while (pool->getStats().available < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(Milliseconds(10));
    }
    ASSERT_EQ(2u, pool->getStats().available);
    ASSERT_EQ(2u, pool->getStats().created);

    pool->shutdown();
}

TEST_F(ConnectionPoolTestFixture, ShouldPruneIdleConnectionsInBackground) {
    ConnectionPool::Options options;
    options.maxIdleTime = Seconds(1);
    options.maintenanceInterval = Milliseconds(10);
    auto pool = makePool(options);
    pool->startup();

    uassertStatusOK(pool->checkout());
    ASSERT_EQ(1u, pool->getStats().available);

    clockSource.advance(Seconds(5));
    const auto deadline = std::chrono::steady_clock::now() + Seconds(5);
    while (pool->getStats().available > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(Milliseconds(10));
    }
    ASSERT_EQ(0u, pool->getStats().available);

    pool->shutdown();
}

TEST_F(ConnectionPoolTestFixture, ShouldRejectInvalidOptions) {
    ConnectionPool::Options options;
    options.maxPoolSize = 2;
    options.minPoolSize = 3;
    ASSERT_THROW(makePool(options), DBException);

    ConnectionPool::Options zeroMax;
    zeroMax.maxPoolSize = 0;
    ASSERT_THROW(zeroMax.validate(), DBException);
}

}  // namespace
}  // namespace executor
}  // namespace docdriver
