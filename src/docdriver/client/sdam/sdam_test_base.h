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

#include <algorithm>
#include <functional>
#include <gtest/gtest.h>
#include <iterator>
#include <set>
#include <string>
#include <vector>

#include "docdriver/client/is_master_reply.h"
#include "docdriver/client/sdam/sdam_datatypes.h"
#include "docdriver/client/wire_version.h"

namespace docdriver::sdam {

class SdamTestFixture : public ::testing::Test {
protected:
    template <typename T, typename U>
    std::vector<U> map(const std::vector<T>& source, std::function<U(const T&)> f) {
        std::vector<U> result;
        std::transform(source.begin(), source.end(), std::back_inserter(result), f);
        return result;
    }

    template <typename T, typename U>
    std::set<U> mapSet(const std::vector<T>& source, std::function<U(const T&)> f) {
        auto v = map<T, U>(source, f);
        return std::set<U>(v.begin(), v.end());
    }

    static IsMasterReply makeReply() {
        IsMasterReply reply;
        reply.minWireVersion = WireVersion::MIN_SUPPORTED_WIRE_VERSION;
        reply.maxWireVersion = WireVersion::LATEST_WIRE_VERSION;
        return reply;
    }

    static IsMasterReply makeStandaloneReply() {
        auto reply = makeReply();
        reply.isMaster = true;
        return reply;
    }

    static IsMasterReply makeMongosReply() {
        auto reply = makeReply();
        reply.isMaster = true;
        reply.msg = std::string(IsMasterReply::kIsDbGrid);
        return reply;
    }

    static IsMasterReply makeMemberReply(const std::string& setName,
                                         const std::vector<std::string>& hosts) {
        auto reply = makeReply();
        reply.setName = setName;
        reply.hosts = hosts;
        return reply;
    }

    static IsMasterReply makePrimaryReply(const std::string& setName,
                                          const std::vector<std::string>& hosts,
                                          boost::optional<OID> electionId = boost::none,
                                          boost::optional<int> setVersion = boost::none) {
        auto reply = makeMemberReply(setName, hosts);
        reply.isMaster = true;
        reply.electionId = electionId;
        reply.setVersion = setVersion;
        return reply;
    }

    static IsMasterReply makeSecondaryReply(const std::string& setName,
                                            const std::vector<std::string>& hosts) {
        auto reply = makeMemberReply(setName, hosts);
        reply.secondary = true;
        return reply;
    }

    static TopologyVersion makeTopologyVersion(const OID& processId, int64_t counter) {
        TopologyVersion topologyVersion;
        topologyVersion.processId = processId;
        topologyVersion.counter = counter;
        return topologyVersion;
    }
};

}  // namespace docdriver::sdam
