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
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "docdriver/base/status.h"
#include "docdriver/client/is_master_reply.h"
#include "docdriver/client/sdam/sdam_datatypes.h"

namespace docdriver::sdam {
/**
 * Receives topology and monitoring events. Every callback defaults to a no-op so listeners only
 * override what they need.
 */
class TopologyListener {
public:
    virtual ~TopologyListener() {}

    /**
     * Published when topology description changes.
     */
    virtual void onTopologyDescriptionChangedEvent(
        /**
         * Returns a unique identifier for the topology.
         */
        UUID topologyId,

        /**
         * Returns the old topology description.
         */
        TopologyDescriptionPtr previousDescription,

        /**
         * Returns the new topology description.
         */
        TopologyDescriptionPtr newDescription){};

    /**
     * Published when the stored description of a server that stays in the topology changes.
     * Changes of round trip time alone are not published.
     */
    virtual void onServerDescriptionChangedEvent(const ServerAddress hostAndPort,
                                                 UUID topologyId,
                                                 ServerDescriptionPtr previousDescription,
                                                 ServerDescriptionPtr newDescription){};

    /**
     * Published when a monitor sends an isMaster. 'awaited' is true when the request asks the
     * server to hold the reply until its topology changes.
     */
    virtual void onServerHeartbeatStartedEvent(const ServerAddress hostAndPort, bool awaited){};

    virtual void onServerHeartbeatSucceededEvent(
        /**
         * Returns the execution time of the event. For awaited requests this includes the time
         * the server held the reply, so it is not a round trip time.
         */
        IsMasterRTT duration,

        /**
         * Returns the address of the monitored server.
         */
        const ServerAddress hostAndPort,

        const IsMasterReply reply,

        /**
         * True when the request asked the server to hold the reply until its topology changed.
         */
        bool awaited){};

    virtual void onServerHeartbeatFailureEvent(IsMasterRTT duration,
                                               Status errorStatus,
                                               const ServerAddress hostAndPort,
                                               bool awaited){};

    virtual void onServerPingFailedEvent(const ServerAddress hostAndPort, const Status& status){};

    virtual void onServerPingSucceededEvent(IsMasterRTT duration,
                                            const ServerAddress hostAndPort){};

    virtual void onServerOpeningEvent(UUID topologyId, const ServerAddress hostAndPort){};

    virtual void onServerClosedEvent(UUID topologyId, const ServerAddress hostAndPort){};

    virtual void onTopologyOpeningEvent(UUID topologyId){};

    virtual void onTopologyClosedEvent(UUID topologyId){};
};
using TopologyListenerPtr = std::shared_ptr<TopologyListener>;

/**
 * This class publishes TopologyListener events to a group of registered listeners.
 *
 * To publish an event to all registered listeners call the corresponding event function on the
 * TopologyEventsPublisher instance. Events are queued and delivered on the publisher's own
 * thread, one at a time, in the order they were published. Publishing never blocks on a
 * listener.
 */
class TopologyEventsPublisher : public TopologyListener {
public:
    TopologyEventsPublisher();
    virtual ~TopologyEventsPublisher();

    TopologyEventsPublisher(const TopologyEventsPublisher&) = delete;
    TopologyEventsPublisher& operator=(const TopologyEventsPublisher&) = delete;

    /**
     * The listener receives every event published after this call returns.
     */
    void registerListener(TopologyListenerPtr listener);
    void removeListener(TopologyListenerPtr listener);

    /**
     * Counts the registered listeners, including the ones whose registration is still queued.
     */
    size_t getListenerCount() const;

    /**
     * Stops accepting events, delivers the ones already queued and stops the delivery thread.
     * Events published afterwards are discarded. May be called from a listener callback.
     */
    void close();

    bool isClosed() const;

    void onTopologyDescriptionChangedEvent(UUID topologyId,
                                           TopologyDescriptionPtr previousDescription,
                                           TopologyDescriptionPtr newDescription) override;
    void onServerDescriptionChangedEvent(const ServerAddress hostAndPort,
                                         UUID topologyId,
                                         ServerDescriptionPtr previousDescription,
                                         ServerDescriptionPtr newDescription) override;
    void onServerHeartbeatStartedEvent(const ServerAddress hostAndPort, bool awaited) override;
    void onServerHeartbeatSucceededEvent(IsMasterRTT duration,
                                         const ServerAddress hostAndPort,
                                         const IsMasterReply reply,
                                         bool awaited) override;
    void onServerHeartbeatFailureEvent(IsMasterRTT duration,
                                       Status errorStatus,
                                       const ServerAddress hostAndPort,
                                       bool awaited) override;
    void onServerPingFailedEvent(const ServerAddress hostAndPort, const Status& status) override;
    void onServerPingSucceededEvent(IsMasterRTT duration,
                                    const ServerAddress hostAndPort) override;
    void onServerOpeningEvent(UUID topologyId, const ServerAddress hostAndPort) override;
    void onServerClosedEvent(UUID topologyId, const ServerAddress hostAndPort) override;
    void onTopologyOpeningEvent(UUID topologyId) override;
    void onTopologyClosedEvent(UUID topologyId) override;

private:
    enum class EventType {
        HEARTBEAT_START,
        HEARTBEAT_SUCCESS,
        HEARTBEAT_FAILURE,
        PING_SUCCESS,
        PING_FAILURE,
        TOPOLOGY_DESCRIPTION_CHANGED,
        SERVER_DESCRIPTION_CHANGED,
        SERVER_OPENING,
        SERVER_CLOSED,
        TOPOLOGY_OPENING,
        TOPOLOGY_CLOSED,
        LISTENER_ADDED
    };
    struct Event {
        explicit Event(EventType eventType) : type(eventType) {}

        EventType type;
        ServerAddress hostAndPort;
        IsMasterRTT duration{0};
        bool awaited = false;
        boost::optional<IsMasterReply> reply;
        TopologyDescriptionPtr previousDescription;
        TopologyDescriptionPtr newDescription;
        ServerDescriptionPtr previousServerDescription;
        ServerDescriptionPtr newServerDescription;
        UUID topologyId{};
        Status status = Status::OK();
        TopologyListenerPtr listener;
    };
    using EventPtr = std::unique_ptr<Event>;

    /**
     * Everything the delivery thread touches. The thread holds its own reference, so the loop
     * stays valid when the publisher is destroyed from inside a listener callback.
     */
    struct DeliveryState {
        // guards the queue, the listeners and isClosed
        std::mutex mutex;
        std::condition_variable eventAvailable;
        std::deque<EventPtr> eventQueue;
        std::vector<TopologyListenerPtr> listeners;
        bool isClosed = false;
    };
    using DeliveryStatePtr = std::shared_ptr<DeliveryState>;

    void _enqueue(EventPtr event);
    static void _sendEvent(const TopologyListenerPtr& listener, const Event& event);
    static void _deliveryLoop(DeliveryStatePtr state);

    const DeliveryStatePtr _state;
    std::thread _deliveryThread;
};
using TopologyEventsPublisherPtr = std::shared_ptr<TopologyEventsPublisher>;
}  // namespace docdriver::sdam
