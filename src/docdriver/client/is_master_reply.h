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
#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "docdriver/bson/oid.h"
#include "docdriver/util/duration.h"
#include "docdriver/util/time_support.h"

namespace docdriver {

/**
 * The (processId, counter) pair a server attaches to each health check reply. The counter
 * increases whenever the server's view of the topology changes; the processId changes when the
 * server restarts.
 */
struct TopologyVersion {
    OID processId;
    int64_t counter = 0;

    /**
     * Returns true if 'incoming' describes the same or an older server state than 'stored':
     * both exist, the processIds match and the incoming counter is not greater.
     */
    static bool isStale(const boost::optional<TopologyVersion>& incoming,
                        const boost::optional<TopologyVersion>& stored);

    bool operator==(const TopologyVersion& other) const {
        return processId == other.processId && counter == other.counter;
    }
    bool operator!=(const TopologyVersion& other) const {
        return !(*this == other);
    }

    std::string toString() const;
};

std::ostream& operator<<(std::ostream& os, const TopologyVersion& topologyVersion);

/**
 * The "isMaster" health check request. When 'topologyVersion' and 'maxAwaitTime' are both set the
 * server holds the reply until its topology version changes or the await time elapses.
 */
struct IsMasterRequest {
    boost::optional<TopologyVersion> topologyVersion;
    boost::optional<Milliseconds> maxAwaitTime;

    bool isAwaitable() const {
        return topologyVersion && maxAwaitTime;
    }
};

/**
 * The typed result of the "isMaster" health check command.
 */
struct IsMasterReply {
    static constexpr auto kIsDbGrid = "isdbgrid";

    bool ok = true;
    bool isMaster = false;
    bool secondary = false;
    bool arbiterOnly = false;
    bool hidden = false;
    bool isReplicaSet = false;

    boost::optional<std::string> msg;
    boost::optional<std::string> setName;
    boost::optional<int> setVersion;
    boost::optional<OID> electionId;
    boost::optional<std::string> primary;
    boost::optional<std::string> me;

    std::vector<std::string> hosts;
    std::vector<std::string> passives;
    std::vector<std::string> arbiters;
    std::map<std::string, std::string> tags;

    int minWireVersion = 0;
    int maxWireVersion = 0;

    boost::optional<int> logicalSessionTimeoutMinutes;
    boost::optional<Date_t> lastWriteDate;
    boost::optional<TopologyVersion> topologyVersion;

    // Only load balancers report a service id.
    boost::optional<OID> serviceId;

    std::string toString() const;
};

std::ostream& operator<<(std::ostream& os, const IsMasterReply& reply);

}  // namespace docdriver
