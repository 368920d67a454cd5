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

#include "docdriver/client/sdam/topology_listener.h"

#include <chrono>
#include <functional>
#include <future>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "docdriver/client/sdam/topology_change_stream.h"
#include "docdriver/client/sdam/topology_description.h"

namespace docdriver::sdam {
namespace {

// Records the order of delivered events as short strings.
class OrderRecorder : public TopologyListener {
public:
    void onServerOpeningEvent(UUID topologyId, const ServerAddress hostAndPort) override {
        _record("open " + hostAndPort.toString());
    }

    void onServerClosedEvent(UUID topologyId, const ServerAddress hostAndPort) override {
        _record("close " + hostAndPort.toString());
    }

    void onServerHeartbeatFailureEvent(IsMasterRTT duration,
                                       Status errorStatus,
                                       const ServerAddress hostAndPort,
                                       bool awaited) override {
        _record("failure " + hostAndPort.toString() + " " + errorStatus.codeString());
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lk(_mutex);
        return _events;
    }

private:
    void _record(std::string event) {
        std::lock_guard<std::mutex> lk(_mutex);
        _events.push_back(std::move(event));
    }

    mutable std::mutex _mutex;
    std::vector<std::string> _events;
};

// Closes the publisher from inside a callback.
class ClosingListener : public TopologyListener {
public:
    explicit ClosingListener(TopologyEventsPublisher* publisher) : _publisher(publisher) {}

    void onTopologyClosedEvent(UUID topologyId) override {
        _publisher->close();
    }

private:
    TopologyEventsPublisher* _publisher;
};

// Holds a publisher and drops it from inside the first server opening callback, once the test
// gave up its own reference.
class ReleasingListener : public TopologyListener {
public:
    ReleasingListener(std::shared_ptr<TopologyEventsPublisher> publisher,
                      std::shared_future<void> testReleased)
        : _publisher(std::move(publisher)), _testReleased(std::move(testReleased)) {}

    void onServerOpeningEvent(UUID topologyId, const ServerAddress hostAndPort) override {
        if (!_publisher)
            return;
        _testReleased.wait();
        _publisher.reset();
    }

private:
    std::shared_ptr<TopologyEventsPublisher> _publisher;
    std::shared_future<void> _testReleased;
};

bool waitUntil(const std::function<bool()>& condition) {
    const auto deadline = std::chrono::steady_clock::now() + Seconds(10);
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(Milliseconds(5));
    }
    return true;
}

}  // namespace

class TopologyListenerTestFixture : public ::testing::Test {
protected:
    const UUID kTopologyId = TopologyDescription().getId();
    const ServerAddress kServerA = ServerAddress("a:1");
    const ServerAddress kServerB = ServerAddress("b:1");
};

TEST_F(TopologyListenerTestFixture, ShouldDeliverEventsInPublicationOrder) {
    TopologyEventsPublisher publisher;
    auto recorder = std::make_shared<OrderRecorder>();
    publisher.registerListener(recorder);

    publisher.onServerOpeningEvent(kTopologyId, kServerA);
    publisher.onServerOpeningEvent(kTopologyId, kServerB);
    publisher.onServerHeartbeatFailureEvent(
        IsMasterRTT(1), Status(ErrorCodes::HostUnreachable, "down"), kServerB, false);
    publisher.onServerClosedEvent(kTopologyId, kServerA);
    publisher.close();

    const std::vector<std::string> expected{
        "open a:1", "open b:1", "failure b:1 HostUnreachable", "close a:1"};
    ASSERT_EQ(expected, recorder->events());
}

TEST_F(TopologyListenerTestFixture, ShouldNotReplayEventsToLateListeners) {
    TopologyEventsPublisher publisher;
    auto early = std::make_shared<OrderRecorder>();
    auto late = std::make_shared<OrderRecorder>();

    publisher.registerListener(early);
    publisher.onServerOpeningEvent(kTopologyId, kServerA);
    publisher.registerListener(late);
    publisher.onServerOpeningEvent(kTopologyId, kServerB);
    publisher.close();

    ASSERT_EQ((std::vector<std::string>{"open a:1", "open b:1"}), early->events());
    ASSERT_EQ((std::vector<std::string>{"open b:1"}), late->events());
}

TEST_F(TopologyListenerTestFixture, ShouldDiscardEventsPublishedAfterClose) {
    TopologyEventsPublisher publisher;
    auto recorder = std::make_shared<OrderRecorder>();
    publisher.registerListener(recorder);
    publisher.onServerOpeningEvent(kTopologyId, kServerA);
    publisher.close();
    ASSERT_TRUE(publisher.isClosed());

    publisher.onServerOpeningEvent(kTopologyId, kServerB);
    publisher.close();
    ASSERT_EQ((std::vector<std::string>{"open a:1"}), recorder->events());
}

TEST_F(TopologyListenerTestFixture, ShouldStopDeliveringToRemovedListeners) {
    TopologyEventsPublisher publisher;
    auto kept = std::make_shared<OrderRecorder>();
    auto removed = std::make_shared<OrderRecorder>();
    publisher.registerListener(kept);
    publisher.registerListener(removed);
    publisher.removeListener(removed);

    publisher.onServerOpeningEvent(kTopologyId, kServerA);
    publisher.close();

    ASSERT_EQ((std::vector<std::string>{"open a:1"}), kept->events());
    ASSERT_TRUE(removed->events().empty());
}

TEST_F(TopologyListenerTestFixture, ShouldAllowClosingFromACallback) {
    auto publisher = std::make_shared<TopologyEventsPublisher>();
    auto recorder = std::make_shared<OrderRecorder>();
    publisher->registerListener(std::make_shared<ClosingListener>(publisher.get()));
    publisher->registerListener(recorder);

    publisher->onTopologyClosedEvent(kTopologyId);
    publisher->onServerOpeningEvent(kTopologyId, kServerA);

    const auto deadline = std::chrono::steady_clock::now() + Seconds(10);
    while (!publisher->isClosed() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(Milliseconds(5));
    }
    ASSERT_TRUE(publisher->isClosed());
    publisher->close();
}

TEST_F(TopologyListenerTestFixture, ShouldKeepDeliveringWhenDestroyedFromACallback) {
    std::promise<void> testReleased;
    auto publisher = std::make_shared<TopologyEventsPublisher>();
    auto recorder = std::make_shared<OrderRecorder>();
    publisher->registerListener(
        std::make_shared<ReleasingListener>(publisher, testReleased.get_future().share()));
    publisher->registerListener(recorder);

    publisher->onServerOpeningEvent(kTopologyId, kServerA);
    publisher->onServerOpeningEvent(kTopologyId, kServerB);

    // the listener now holds the last reference and destroys the publisher on its thread.
    publisher.reset();
    testReleased.set_value();

    ASSERT_TRUE(waitUntil([&] { return recorder->events().size() == 2; }));
    ASSERT_EQ((std::vector<std::string>{"open a:1", "open b:1"}), recorder->events());
}

TEST_F(TopologyListenerTestFixture, ChangeStreamShouldBufferChanges) {
    TopologyChangeStream changeStream;
    const auto first = std::make_shared<TopologyDescription>();
    const auto second = std::make_shared<TopologyDescription>(*first);

    changeStream.onTopologyDescriptionChangedEvent(first->getId(), nullptr, first);
    changeStream.onTopologyDescriptionChangedEvent(first->getId(), first, second);

    auto change = changeStream.next(Milliseconds(0));
    ASSERT_TRUE(change);
    ASSERT_EQ(nullptr, change->previousDescription);
    ASSERT_EQ(first, change->newDescription);

    change = changeStream.next(Milliseconds(0));
    ASSERT_TRUE(change);
    ASSERT_EQ(first, change->previousDescription);
    ASSERT_EQ(second, change->newDescription);

    ASSERT_FALSE(changeStream.next(Milliseconds(10)));
    ASSERT_FALSE(changeStream.isExhausted());
}

TEST_F(TopologyListenerTestFixture, ChangeStreamShouldDrainBeforeExhaustion) {
    TopologyChangeStream changeStream;
    const auto description = std::make_shared<TopologyDescription>();
    changeStream.onTopologyDescriptionChangedEvent(description->getId(), nullptr, description);
    changeStream.onTopologyClosedEvent(description->getId());

    ASSERT_FALSE(changeStream.isExhausted());
    ASSERT_TRUE(changeStream.next(Milliseconds(0)));
    ASSERT_TRUE(changeStream.isExhausted());

    // an exhausted stream returns at once and ignores later changes
    const auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(changeStream.next(Seconds(10)));
    ASSERT_LT(std::chrono::steady_clock::now() - start, Seconds(5));

    changeStream.onTopologyDescriptionChangedEvent(description->getId(), nullptr, description);
    ASSERT_FALSE(changeStream.next(Milliseconds(0)));
}

TEST_F(TopologyListenerTestFixture, ChangeStreamShouldWakeUpWaitingReaders) {
    auto changeStream = std::make_shared<TopologyChangeStream>();
    const auto description = std::make_shared<TopologyDescription>();

    std::thread producer([&] {
        std::this_thread::sleep_for(Milliseconds(50));
        changeStream->onTopologyDescriptionChangedEvent(
            description->getId(), nullptr, description);
    });

    auto change = changeStream->next(Seconds(10));
    producer.join();
    ASSERT_TRUE(change);
    ASSERT_EQ(description, change->newDescription);
}

TEST_F(TopologyListenerTestFixture, ChangeStreamShouldUnsubscribeWhenDropped) {
    auto publisher = std::make_shared<TopologyEventsPublisher>();

    // dropped before its registration was delivered
    TopologyChangeStream::subscribe(publisher);
    ASSERT_EQ(0u, publisher->getListenerCount());

    auto changeStream = TopologyChangeStream::subscribe(publisher);
    ASSERT_EQ(1u, publisher->getListenerCount());

    const auto description = std::make_shared<TopologyDescription>();
    publisher->onTopologyDescriptionChangedEvent(description->getId(), nullptr, description);
    ASSERT_TRUE(changeStream->next(Seconds(10)));

    changeStream.reset();
    ASSERT_TRUE(waitUntil([&] { return publisher->getListenerCount() == 0; }));
    publisher->close();
}

}  // namespace docdriver::sdam
