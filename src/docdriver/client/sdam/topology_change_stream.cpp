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

#include "docdriver/client/sdam/topology_change_stream.h"

#include <chrono>

namespace docdriver::sdam {
/**
 * The listener registered with the publisher on behalf of a stream.
 */
class TopologyChangeStream::Subscription : public TopologyListener {
public:
    explicit Subscription(std::weak_ptr<TopologyChangeStream> stream)
        : _stream(std::move(stream)) {}

    void onTopologyDescriptionChangedEvent(UUID topologyId,
                                           TopologyDescriptionPtr previousDescription,
                                           TopologyDescriptionPtr newDescription) override {
        if (auto stream = _stream.lock()) {
            stream->onTopologyDescriptionChangedEvent(
                topologyId, std::move(previousDescription), std::move(newDescription));
        }
    }

    void onTopologyClosedEvent(UUID topologyId) override {
        if (auto stream = _stream.lock())
            stream->onTopologyClosedEvent(topologyId);
    }

private:
    const std::weak_ptr<TopologyChangeStream> _stream;
};

TopologyChangeStream::~TopologyChangeStream() {
    if (!_subscription)
        return;
    if (auto publisher = _publisher.lock())
        publisher->removeListener(_subscription);
}

std::shared_ptr<TopologyChangeStream> TopologyChangeStream::subscribe(
    const TopologyEventsPublisherPtr& publisher) {
    auto stream = std::make_shared<TopologyChangeStream>();
    stream->_publisher = publisher;
    stream->_subscription = std::make_shared<Subscription>(stream);
    publisher->registerListener(stream->_subscription);
    return stream;
}

boost::optional<TopologyDescriptionChangedEvent> TopologyChangeStream::next(Milliseconds timeout) {
    std::unique_lock<std::mutex> lk(_mutex);
    _changed.wait_for(lk, timeout, [this] { return _isClosed || !_buffer.empty(); });
    if (_buffer.empty())
        return boost::none;

    auto event = std::move(_buffer.front());
    _buffer.pop_front();
    return event;
}

bool TopologyChangeStream::isExhausted() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _isClosed && _buffer.empty();
}

void TopologyChangeStream::onTopologyDescriptionChangedEvent(
    UUID topologyId,
    TopologyDescriptionPtr previousDescription,
    TopologyDescriptionPtr newDescription) {
    {
        std::lock_guard<std::mutex> lk(_mutex);
        if (_isClosed)
            return;
        _buffer.push_back(TopologyDescriptionChangedEvent{
            topologyId, std::move(previousDescription), std::move(newDescription)});
    }
    _changed.notify_all();
}

void TopologyChangeStream::onTopologyClosedEvent(UUID) {
    close();
}

void TopologyChangeStream::close() {
    {
        std::lock_guard<std::mutex> lk(_mutex);
        _isClosed = true;
    }
    _changed.notify_all();
}
}  // namespace docdriver::sdam
