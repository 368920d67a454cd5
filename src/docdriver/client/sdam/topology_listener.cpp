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

#include <algorithm>

#include "docdriver/util/assert_util.h"

namespace docdriver::sdam {
TopologyEventsPublisher::TopologyEventsPublisher() : _state(std::make_shared<DeliveryState>()) {
    _deliveryThread = std::thread([state = _state] { _deliveryLoop(state); });
}

TopologyEventsPublisher::~TopologyEventsPublisher() {
    close();
    // the last reference was dropped by a listener callback. The thread owns the delivery state
    // and exits once the queue is drained.
    if (_deliveryThread.joinable())
        _deliveryThread.detach();
}

void TopologyEventsPublisher::registerListener(TopologyListenerPtr listener) {
    // the listener joins in queue order, so it never sees events that were already queued.
    auto event = std::make_unique<Event>(EventType::LISTENER_ADDED);
    event->listener = std::move(listener);
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::removeListener(TopologyListenerPtr listener) {
    std::lock_guard<std::mutex> lk(_state->mutex);
    auto& listeners = _state->listeners;
    listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());
    auto& queue = _state->eventQueue;
    queue.erase(std::remove_if(queue.begin(),
                               queue.end(),
                               [&](const EventPtr& event) {
                                   return event->type == EventType::LISTENER_ADDED &&
                                       event->listener == listener;
                               }),
                queue.end());
}

void TopologyEventsPublisher::close() {
    {
        std::lock_guard<std::mutex> lk(_state->mutex);
        _state->isClosed = true;
    }
    _state->eventAvailable.notify_all();

    if (_deliveryThread.joinable()) {
        // closed from inside a listener callback; the loop exits once the queue is drained and a
        // later close() from another thread joins it.
        if (_deliveryThread.get_id() == std::this_thread::get_id())
            return;
        _deliveryThread.join();
    }

    std::lock_guard<std::mutex> lk(_state->mutex);
    _state->listeners.clear();
}

size_t TopologyEventsPublisher::getListenerCount() const {
    std::lock_guard<std::mutex> lk(_state->mutex);
    const auto& queue = _state->eventQueue;
    const auto pending = std::count_if(queue.begin(), queue.end(), [](const EventPtr& event) {
        return event->type == EventType::LISTENER_ADDED;
    });
    return _state->listeners.size() + static_cast<size_t>(pending);
}

bool TopologyEventsPublisher::isClosed() const {
    std::lock_guard<std::mutex> lk(_state->mutex);
    return _state->isClosed;
}

void TopologyEventsPublisher::onTopologyDescriptionChangedEvent(
    UUID topologyId,
    TopologyDescriptionPtr previousDescription,
    TopologyDescriptionPtr newDescription) {
    auto event = std::make_unique<Event>(EventType::TOPOLOGY_DESCRIPTION_CHANGED);
    event->topologyId = topologyId;
    event->previousDescription = std::move(previousDescription);
    event->newDescription = std::move(newDescription);
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::onServerDescriptionChangedEvent(
    const ServerAddress hostAndPort,
    UUID topologyId,
    ServerDescriptionPtr previousDescription,
    ServerDescriptionPtr newDescription) {
    auto event = std::make_unique<Event>(EventType::SERVER_DESCRIPTION_CHANGED);
    event->hostAndPort = hostAndPort;
    event->topologyId = topologyId;
    event->previousServerDescription = std::move(previousDescription);
    event->newServerDescription = std::move(newDescription);
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::onServerHeartbeatStartedEvent(const ServerAddress hostAndPort,
                                                            bool awaited) {
    auto event = std::make_unique<Event>(EventType::HEARTBEAT_START);
    event->hostAndPort = hostAndPort;
    event->awaited = awaited;
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::onServerHeartbeatSucceededEvent(IsMasterRTT duration,
                                                              const ServerAddress hostAndPort,
                                                              const IsMasterReply reply,
                                                              bool awaited) {
    auto event = std::make_unique<Event>(EventType::HEARTBEAT_SUCCESS);
    event->hostAndPort = hostAndPort;
    event->awaited = awaited;
    event->reply = reply;
    event->duration = duration;
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::onServerHeartbeatFailureEvent(IsMasterRTT duration,
                                                            Status errorStatus,
                                                            const ServerAddress hostAndPort,
                                                            bool awaited) {
    auto event = std::make_unique<Event>(EventType::HEARTBEAT_FAILURE);
    event->hostAndPort = hostAndPort;
    event->awaited = awaited;
    event->duration = duration;
    event->status = errorStatus;
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::onServerPingFailedEvent(const ServerAddress hostAndPort,
                                                      const Status& status) {
    auto event = std::make_unique<Event>(EventType::PING_FAILURE);
    event->hostAndPort = hostAndPort;
    event->status = status;
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::onServerPingSucceededEvent(IsMasterRTT duration,
                                                         const ServerAddress hostAndPort) {
    auto event = std::make_unique<Event>(EventType::PING_SUCCESS);
    event->duration = duration;
    event->hostAndPort = hostAndPort;
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::onServerOpeningEvent(UUID topologyId,
                                                   const ServerAddress hostAndPort) {
    auto event = std::make_unique<Event>(EventType::SERVER_OPENING);
    event->topologyId = topologyId;
    event->hostAndPort = hostAndPort;
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::onServerClosedEvent(UUID topologyId,
                                                  const ServerAddress hostAndPort) {
    auto event = std::make_unique<Event>(EventType::SERVER_CLOSED);
    event->topologyId = topologyId;
    event->hostAndPort = hostAndPort;
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::onTopologyOpeningEvent(UUID topologyId) {
    auto event = std::make_unique<Event>(EventType::TOPOLOGY_OPENING);
    event->topologyId = topologyId;
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::onTopologyClosedEvent(UUID topologyId) {
    auto event = std::make_unique<Event>(EventType::TOPOLOGY_CLOSED);
    event->topologyId = topologyId;
    _enqueue(std::move(event));
}

void TopologyEventsPublisher::_enqueue(EventPtr event) {
    {
        std::lock_guard<std::mutex> lk(_state->mutex);
        if (_state->isClosed)
            return;
        _state->eventQueue.push_back(std::move(event));
    }
    _state->eventAvailable.notify_one();
}

void TopologyEventsPublisher::_deliveryLoop(DeliveryStatePtr state) {
    while (true) {
        EventPtr event;
        std::vector<TopologyListenerPtr> listeners;
        {
            std::unique_lock<std::mutex> lk(state->mutex);
            state->eventAvailable.wait(
                lk, [&] { return state->isClosed || !state->eventQueue.empty(); });
            if (state->eventQueue.empty())
                return;

            event = std::move(state->eventQueue.front());
            state->eventQueue.pop_front();
            if (event->type == EventType::LISTENER_ADDED) {
                state->listeners.push_back(std::move(event->listener));
                continue;
            }
            listeners = state->listeners;
        }

        for (const auto& listener : listeners) {
            _sendEvent(listener, *event);
        }
    }
}

void TopologyEventsPublisher::_sendEvent(const TopologyListenerPtr& listener, const Event& event) {
    switch (event.type) {
        case EventType::HEARTBEAT_START:
            listener->onServerHeartbeatStartedEvent(event.hostAndPort, event.awaited);
            break;
        case EventType::HEARTBEAT_SUCCESS:
            listener->onServerHeartbeatSucceededEvent(
                event.duration, event.hostAndPort, *event.reply, event.awaited);
            break;
        case EventType::HEARTBEAT_FAILURE:
            listener->onServerHeartbeatFailureEvent(
                event.duration, event.status, event.hostAndPort, event.awaited);
            break;
        case EventType::TOPOLOGY_DESCRIPTION_CHANGED:
            listener->onTopologyDescriptionChangedEvent(
                event.topologyId, event.previousDescription, event.newDescription);
            break;
        case EventType::SERVER_DESCRIPTION_CHANGED:
            listener->onServerDescriptionChangedEvent(event.hostAndPort,
                                                      event.topologyId,
                                                      event.previousServerDescription,
                                                      event.newServerDescription);
            break;
        case EventType::PING_SUCCESS:
            listener->onServerPingSucceededEvent(event.duration, event.hostAndPort);
            break;
        case EventType::PING_FAILURE:
            listener->onServerPingFailedEvent(event.hostAndPort, event.status);
            break;
        case EventType::SERVER_OPENING:
            listener->onServerOpeningEvent(event.topologyId, event.hostAndPort);
            break;
        case EventType::SERVER_CLOSED:
            listener->onServerClosedEvent(event.topologyId, event.hostAndPort);
            break;
        case EventType::TOPOLOGY_OPENING:
            listener->onTopologyOpeningEvent(event.topologyId);
            break;
        case EventType::TOPOLOGY_CLOSED:
            listener->onTopologyClosedEvent(event.topologyId);
            break;
        case EventType::LISTENER_ADDED:
        default:
            DOCDRIVER_UNREACHABLE;
    }
}
}  // namespace docdriver::sdam
