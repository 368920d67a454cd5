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
#include <map>
#include <memory>
#include <mutex>

#include "docdriver/executor/network_interface.h"

namespace docdriver {
namespace executor {

/**
 * Mock network implementation for use in unit tests.
 *
 * Replies are scripted per host and are sticky: every health check against a host returns the
 * last reply (or error) set for it until the script changes. An awaitable request whose
 * topologyVersion matches the scripted reply blocks until the script for that host changes, the
 * connection is canceled, or the request's maxAwaitTime elapses, which is how a server streams
 * topology changes.
 *
 * Hosts with nothing scripted refuse connections with HostUnreachable.
 */
class NetworkInterfaceMock : public NetworkInterface {
public:
    NetworkInterfaceMock();
    ~NetworkInterfaceMock() override;

    StatusWith<std::unique_ptr<NetworkConnection>> connect(const HostAndPort& host,
                                                           Milliseconds timeout) override;

    /**
     * Every later health check against 'host' returns 'reply'. Wakes awaiting requests.
     */
    void setIsMasterReply(const HostAndPort& host, IsMasterReply reply);

    /**
     * Every later health check against 'host' fails with 'status', and the connection it ran on
     * reports itself unhealthy. Wakes awaiting requests.
     */
    void setIsMasterError(const HostAndPort& host, Status status);

    /**
     * Every later connect to 'host' fails with 'status'. Pass Status::OK() to accept connections
     * again.
     */
    void setConnectStatus(const HostAndPort& host, Status status);

    /**
     * Makes connects to 'host' take 'delay' of wall clock time. A delay longer than the connect
     * timeout fails with NetworkTimeout.
     */
    void setConnectDelay(const HostAndPort& host, Milliseconds delay);

    /**
     * Marks every connection currently open to 'host' unhealthy.
     */
    void breakConnections(const HostAndPort& host);

    int getConnectCount(const HostAndPort& host) const;
    int getIsMasterCount(const HostAndPort& host) const;
    int getAwaitableIsMasterCount(const HostAndPort& host) const;

    /**
     * Blocks until at least 'count' health checks were sent to 'host', or 'timeout' elapsed.
     * Returns true if the count was reached.
     */
    bool waitForIsMasterCount(const HostAndPort& host, int count, Milliseconds timeout) const;

private:
    class MockConnection;

    struct HostState {
        Status connectStatus = Status::OK();
        Milliseconds connectDelay{0};
        boost::optional<IsMasterReply> reply;
        Status replyStatus = Status::OK();
        // bumped whenever the script changes
        int64_t scriptVersion = 0;
        // connections opened under an older epoch are unhealthy
        int64_t healthEpoch = 0;
        int connectCount = 0;
        int isMasterCount = 0;
        int awaitableIsMasterCount = 0;
    };

    // Shared with the connections, which may outlive the mock.
    struct State {
        mutable std::mutex mutex;
        mutable std::condition_variable changed;
        std::map<HostAndPort, HostState> hosts;
    };

    std::shared_ptr<State> _state;
};

}  // namespace executor
}  // namespace docdriver
