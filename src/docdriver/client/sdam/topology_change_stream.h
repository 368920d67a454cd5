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
#include <deque>
#include <memory>
#include <mutex>

#include "docdriver/client/sdam/sdam_datatypes.h"
#include "docdriver/client/sdam/topology_listener.h"

namespace docdriver::sdam {
struct TopologyDescriptionChangedEvent {
    UUID topologyId;
    TopologyDescriptionPtr previousDescription;
    TopologyDescriptionPtr newDescription;
};

/**
 * A lazy, unbounded, non-restartable sequence of topology description changes.
 *
 * The stream buffers every change published after it subscribed. Once the topology is closed
 * and the buffer is drained, next() returns boost::none immediately and forever.
 */
class TopologyChangeStream : public TopologyListener {
public:
    TopologyChangeStream() = default;
    ~TopologyChangeStream();

    /**
     * Returns a stream of the changes 'publisher' delivers from now on. The publisher only holds
     * the stream weakly: dropping the last reference to the stream unsubscribes it.
     */
    static std::shared_ptr<TopologyChangeStream> subscribe(
        const TopologyEventsPublisherPtr& publisher);

    /**
     * Returns the next change, waiting up to 'timeout' for one to arrive. Returns boost::none on
     * timeout or when the stream is exhausted.
     */
    boost::optional<TopologyDescriptionChangedEvent> next(Milliseconds timeout);

    /**
     * Returns true once the topology has closed and every buffered change was consumed.
     */
    bool isExhausted() const;

    void onTopologyDescriptionChangedEvent(UUID topologyId,
                                           TopologyDescriptionPtr previousDescription,
                                           TopologyDescriptionPtr newDescription) override;

    void onTopologyClosedEvent(UUID topologyId) override;

    /**
     * Ends the stream without a topology closed event, e.g. when the stream was created after
     * the topology closed.
     */
    void close();

private:
    class Subscription;

    mutable std::mutex _mutex;
    std::condition_variable _changed;
    std::deque<TopologyDescriptionChangedEvent> _buffer;
    bool _isClosed = false;

    // set by subscribe()
    std::weak_ptr<TopologyEventsPublisher> _publisher;
    TopologyListenerPtr _subscription;
};
using TopologyChangeStreamPtr = std::shared_ptr<TopologyChangeStream>;
}  // namespace docdriver::sdam
