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

#include <memory>

#include "docdriver/base/status_with.h"
#include "docdriver/client/is_master_reply.h"
#include "docdriver/util/duration.h"
#include "docdriver/util/net/host_and_port.h"

namespace docdriver {
namespace executor {

/**
 * A single physical channel to one server.
 *
 * Implementations are not required to be thread safe, except for cancel(), which may be called
 * from any thread while another thread is blocked in runIsMaster().
 */
class NetworkConnection {
public:
    virtual ~NetworkConnection() = default;

    /**
     * The HostAndPort for the connection. This should be the same as the HostAndPort passed to
     * NetworkInterface::connect.
     */
    virtual const HostAndPort& getHostAndPort() const = 0;

    /**
     * Sends the health check command and waits for its reply. An awaitable request may be held
     * by the server for up to its maxAwaitTime; 'timeout' bounds the whole exchange.
     *
     * Network failures are reported with a network error code (see ErrorCodes::isNetworkError).
     * A canceled call returns CallbackCanceled.
     */
    virtual StatusWith<IsMasterReply> runIsMaster(const IsMasterRequest& request,
                                                  Milliseconds timeout) = 0;

    /**
     * Returns false once the connection observed an I/O error or was closed by the peer.
     */
    virtual bool isHealthy() const = 0;

    /**
     * Interrupts an in progress runIsMaster() and makes every later call fail with
     * CallbackCanceled.
     */
    virtual void cancel() = 0;
};

/**
 * Opens connections. This is the only transport primitive the monitors and pools depend on.
 */
class NetworkInterface {
public:
    virtual ~NetworkInterface() = default;

    /**
     * Opens a connection to 'host', failing with a network error if it cannot be established
     * within 'timeout'.
     */
    virtual StatusWith<std::unique_ptr<NetworkConnection>> connect(const HostAndPort& host,
                                                                   Milliseconds timeout) = 0;
};

using NetworkInterfacePtr = std::shared_ptr<NetworkInterface>;

}  // namespace executor
}  // namespace docdriver
