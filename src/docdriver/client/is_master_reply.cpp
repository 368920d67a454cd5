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

#include "docdriver/client/is_master_reply.h"

#include <boost/algorithm/string/join.hpp>
#include <ostream>
#include <sstream>

namespace docdriver {

bool TopologyVersion::isStale(const boost::optional<TopologyVersion>& incoming,
                              const boost::optional<TopologyVersion>& stored) {
    if (!incoming || !stored)
        return false;
    if (incoming->processId != stored->processId)
        return false;
    return incoming->counter <= stored->counter;
}

std::string TopologyVersion::toString() const {
    std::ostringstream ss;
    ss << "{ processId: " << processId << ", counter: " << counter << " }";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const TopologyVersion& topologyVersion) {
    return os << topologyVersion.toString();
}

std::string IsMasterReply::toString() const {
    std::ostringstream ss;
    ss << "{ ok: " << ok << ", ismaster: " << isMaster << ", secondary: " << secondary;
    if (arbiterOnly)
        ss << ", arbiterOnly: true";
    if (hidden)
        ss << ", hidden: true";
    if (isReplicaSet)
        ss << ", isreplicaset: true";
    if (msg)
        ss << ", msg: \"" << *msg << "\"";
    if (setName)
        ss << ", setName: \"" << *setName << "\"";
    if (setVersion)
        ss << ", setVersion: " << *setVersion;
    if (electionId)
        ss << ", electionId: " << *electionId;
    if (primary)
        ss << ", primary: \"" << *primary << "\"";
    if (me)
        ss << ", me: \"" << *me << "\"";
    if (!hosts.empty())
        ss << ", hosts: [" << boost::algorithm::join(hosts, ", ") << "]";
    if (!passives.empty())
        ss << ", passives: [" << boost::algorithm::join(passives, ", ") << "]";
    if (!arbiters.empty())
        ss << ", arbiters: [" << boost::algorithm::join(arbiters, ", ") << "]";
    if (!tags.empty()) {
        ss << ", tags: {";
        bool first = true;
        for (const auto& tag : tags) {
            ss << (first ? " " : ", ") << tag.first << ": \"" << tag.second << "\"";
            first = false;
        }
        ss << " }";
    }
    ss << ", minWireVersion: " << minWireVersion << ", maxWireVersion: " << maxWireVersion;
    if (logicalSessionTimeoutMinutes)
        ss << ", logicalSessionTimeoutMinutes: " << *logicalSessionTimeoutMinutes;
    if (lastWriteDate)
        ss << ", lastWriteDate: " << *lastWriteDate;
    if (topologyVersion)
        ss << ", topologyVersion: " << *topologyVersion;
    if (serviceId)
        ss << ", serviceId: " << *serviceId;
    ss << " }";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const IsMasterReply& reply) {
    return os << reply.toString();
}

}  // namespace docdriver
