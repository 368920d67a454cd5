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
#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <utility>

#include "docdriver/bson/oid.h"
#include "docdriver/client/is_master_reply.h"
#include "docdriver/client/sdam/sdam_datatypes.h"
#include "docdriver/util/clock_source.h"
#include "docdriver/util/time_support.h"

namespace docdriver::sdam {
class ServerDescription {
public:
    /**
     * Construct an Unknown ServerDescription with default values except the server address.
     */
    ServerDescription(ServerAddress address) : _address(std::move(address)) {}  // NOLINT

    /**
     * Returns true if all fields that take part in topology decisions are equal. The round trip
     * time and the last update time are not compared.
     */
    bool isEquivalent(const ServerDescription& other) const;

    bool operator==(const ServerDescription& other) const;
    bool operator!=(const ServerDescription& other) const;

    // server identity
    const ServerAddress& getAddress() const;
    ServerType getType() const;
    const boost::optional<ServerAddress>& getMe() const;
    const boost::optional<std::string>& getSetName() const;
    const std::map<std::string, std::string>& getTags() const;

    // network attributes
    const boost::optional<std::string>& getError() const;
    const boost::optional<IsMasterRTT>& getRtt() const;
    const boost::optional<int>& getLogicalSessionTimeoutMinutes() const;

    // server capabilities
    int getMinWireVersion() const;
    int getMaxWireVersion() const;
    bool isDataBearingServer() const;

    // server 'time'
    const Date_t getLastUpdateTime() const;
    const boost::optional<Date_t>& getLastWriteDate() const;
    const boost::optional<TopologyVersion>& getTopologyVersion() const;

    // topology membership
    const boost::optional<ServerAddress>& getPrimary() const;
    const std::set<ServerAddress>& getHosts() const;
    const std::set<ServerAddress>& getPassives() const;
    const std::set<ServerAddress>& getArbiters() const;
    const boost::optional<int>& getSetVersion() const;
    const boost::optional<OID>& getElectionId() const;

    /**
     * Returns a copy of this description whose round trip time has the given sample folded into
     * its moving average.
     */
    ServerDescriptionPtr cloneWithRTT(IsMasterRTT rtt) const;

    std::string toString() const;

    // new_rtt = alpha * x + (1 - alpha) * old_rtt
    static constexpr double kRttAlpha = 0.2;

private:
    ServerDescription() : ServerDescription(ServerAddress()) {}

    // address: the hostname or IP, and the port number, that the client connects to. Note that this
    // is not the server's ismaster.me field, in the case that the server reports an address
    // different from the address the client uses.
    ServerAddress _address;

    // error: information about the last error related to this server. Default null.
    boost::optional<std::string> _error;

    // roundTripTime: the duration of the ismaster call. Default null.
    boost::optional<IsMasterRTT> _rtt;

    // lastWriteDate: the "lastWriteDate" from the server's most recent ismaster response.
    boost::optional<Date_t> _lastWriteDate;

    // topologyVersion: the server's (processId, counter) at the time of the reply. Default null.
    boost::optional<TopologyVersion> _topologyVersion;

    // (=) type: a ServerType enum value. Default Unknown.
    ServerType _type = ServerType::kUnknown;

    // (=) minWireVersion, maxWireVersion: the wire protocol version range supported by the server.
    // Both default to 0. Use min and maxWireVersion only to determine compatibility.
    int _minWireVersion = 0;
    int _maxWireVersion = 0;

    // (=) me: The hostname or IP, and the port number, that this server was configured with in the
    // replica set. Default null.
    boost::optional<ServerAddress> _me;

    // (=) hosts, passives, arbiters: Sets of addresses. This server's opinion of the replica set's
    // members, if any. These hostnames are normalized to lower-case. Default empty. The client
    // monitors all three types of servers in a replica set.
    std::set<ServerAddress> _hosts;
    std::set<ServerAddress> _passives;
    std::set<ServerAddress> _arbiters;

    // (=) tags: map from string to string. Default empty.
    std::map<std::string, std::string> _tags;

    // (=) setName: string or null. Default null.
    boost::optional<std::string> _setName;

    // (=) setVersion: integer or null. Default null.
    boost::optional<int> _setVersion;

    // (=) electionId: an ObjectId, if this is a replica set member that believes it is primary.
    // Default null.
    boost::optional<OID> _electionId;

    // (=) primary: an address. This server's opinion of who the primary is. Default null.
    boost::optional<ServerAddress> _primary;

    // lastUpdateTime: when this server was last checked. Default "infinity ago".
    boost::optional<Date_t> _lastUpdateTime = Date_t::min();

    // (=) logicalSessionTimeoutMinutes: integer or null. Default null.
    boost::optional<int> _logicalSessionTimeoutMinutes;

    friend class ServerDescriptionBuilder;
};

std::ostream& operator<<(std::ostream& os, const ServerDescription& description);
std::ostream& operator<<(std::ostream& os, const ServerDescriptionPtr& description);

class ServerDescriptionBuilder {
public:
    ServerDescriptionBuilder() = default;

    /**
     * Build a new ServerDescription from an isMaster outcome. 'lastRtt' is the round trip time
     * of the previous description for the same address, if any.
     */
    ServerDescriptionBuilder(ClockSource* clockSource,
                             const IsMasterOutcome& isMasterOutcome,
                             boost::optional<IsMasterRTT> lastRtt = boost::none);

    /**
     * Return a ServerDescription instance with the currently configured values.
     */
    ServerDescriptionPtr instance() const;

    ServerDescriptionBuilder& withError(const std::string& error);
    ServerDescriptionBuilder& withAddress(const ServerAddress& address);
    ServerDescriptionBuilder& withRtt(const IsMasterRTT& rtt,
                                      boost::optional<IsMasterRTT> lastRtt = boost::none);
    ServerDescriptionBuilder& withLastWriteDate(const Date_t& lastWriteDate);
    ServerDescriptionBuilder& withTopologyVersion(const TopologyVersion& topologyVersion);
    ServerDescriptionBuilder& withType(const ServerType type);
    ServerDescriptionBuilder& withMinWireVersion(int minVersion);
    ServerDescriptionBuilder& withMaxWireVersion(int maxVersion);
    ServerDescriptionBuilder& withMe(const ServerAddress& me);
    ServerDescriptionBuilder& withHost(const ServerAddress& host);
    ServerDescriptionBuilder& withPassive(const ServerAddress& passive);
    ServerDescriptionBuilder& withArbiter(const ServerAddress& arbiter);
    ServerDescriptionBuilder& withTag(const std::string key, const std::string value);
    ServerDescriptionBuilder& withSetName(const std::string setName);
    ServerDescriptionBuilder& withSetVersion(const int setVersion);
    ServerDescriptionBuilder& withElectionId(const OID& electionId);
    ServerDescriptionBuilder& withPrimary(const ServerAddress& primary);
    ServerDescriptionBuilder& withLastUpdateTime(const Date_t& lastUpdateTime);
    ServerDescriptionBuilder& withLogicalSessionTimeoutMinutes(
        const int logicalSessionTimeoutMinutes);

private:
    /**
     * Classify the server's type based on the ismaster response.
     */
    void parseTypeFromIsMaster(const IsMasterReply& isMaster);

    void calculateRtt(const IsMasterRTT currentRtt, const boost::optional<IsMasterRTT> lastRtt);
    void saveHosts(const IsMasterReply& isMaster);

    ServerDescription _instance;
};
}  // namespace docdriver::sdam
