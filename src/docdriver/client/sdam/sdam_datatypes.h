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
#include <boost/uuid/uuid.hpp>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "docdriver/base/status_with.h"
#include "docdriver/client/is_master_reply.h"
#include "docdriver/util/duration.h"
#include "docdriver/util/net/host_and_port.h"

namespace docdriver::sdam {

using ::docdriver::operator<<;

enum class TopologyType {
    kSingle = 0,
    kReplicaSetNoPrimary,
    kReplicaSetWithPrimary,
    kSharded,
    kUnknown,
    kLoadBalanced
};
const std::vector<TopologyType> allTopologyTypes();
std::string toString(TopologyType topologyType);
StatusWith<TopologyType> parseTopologyType(const std::string& strTopologyType);
std::ostream& operator<<(std::ostream& os, TopologyType topologyType);

enum class ServerType {
    kStandalone = 0,
    kMongos,
    kRSPrimary,
    kRSSecondary,
    kRSArbiter,
    kRSOther,
    kRSGhost,
    kUnknown,
    kLoadBalancer
};
const std::vector<ServerType> allServerTypes();
std::string toString(ServerType serverType);
StatusWith<ServerType> parseServerType(const std::string& strServerType);
std::ostream& operator<<(std::ostream& os, ServerType serverType);

using ServerAddress = HostAndPort;
using IsMasterRTT = Milliseconds;

// Identifies one TopologyDescription lineage for the lifetime of a topology.
using UUID = boost::uuids::uuid;

// The result of an attempt to call the "ismaster" command on a server.
class IsMasterOutcome {
    IsMasterOutcome() = delete;

public:
    // success constructor
    IsMasterOutcome(ServerAddress server, IsMasterReply response, IsMasterRTT rtt)
        : _server(std::move(server)),
          _success(true),
          _response(std::move(response)),
          _rtt(rtt) {}

    // failure constructor
    IsMasterOutcome(ServerAddress server, std::string errorMsg)
        : _server(std::move(server)), _success(false), _errorMsg(std::move(errorMsg)) {}

    const ServerAddress& getServer() const;
    bool isSuccess() const;
    const boost::optional<IsMasterReply>& getResponse() const;
    const boost::optional<IsMasterRTT>& getRtt() const;
    const std::string& getErrorMsg() const;

private:
    ServerAddress _server;
    // indicating the success or failure of the attempt
    bool _success;
    // an error message in case of failure
    std::string _errorMsg;
    // the command response (or boost::none if it failed)
    boost::optional<IsMasterReply> _response;
    // the round trip time to execute the command (or boost::none if it failed)
    boost::optional<IsMasterRTT> _rtt;
};

class ServerDescription;
using ServerDescriptionPtr = std::shared_ptr<ServerDescription>;

class TopologyDescription;
using TopologyDescriptionPtr = std::shared_ptr<TopologyDescription>;

};  // namespace docdriver::sdam
