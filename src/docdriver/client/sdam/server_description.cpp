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

#define DOCDRIVER_LOG_DEFAULT_COMPONENT ::docdriver::logger::LogComponent::kTopology

#include "docdriver/client/sdam/server_description.h"

#include <algorithm>
#include <ostream>
#include <sstream>
#include <tuple>

#include "docdriver/util/log.h"

namespace docdriver::sdam {
namespace {
const std::set<ServerType> kDataServerTypes{ServerType::kMongos,
                                            ServerType::kRSPrimary,
                                            ServerType::kRSSecondary,
                                            ServerType::kStandalone,
                                            ServerType::kLoadBalancer};

template <typename T>
void appendOptional(std::ostringstream& ss, const char* name, const boost::optional<T>& value) {
    ss << ", " << name << ": ";
    if (value) {
        ss << *value;
    } else {
        ss << "null";
    }
}

void appendAddressSet(std::ostringstream& ss,
                      const char* name,
                      const std::set<ServerAddress>& addresses) {
    if (addresses.empty())
        return;
    ss << ", " << name << ": [";
    bool first = true;
    for (const auto& address : addresses) {
        ss << (first ? " " : ", ") << address;
        first = false;
    }
    ss << " ]";
}
}  // namespace

const ServerAddress& ServerDescription::getAddress() const {
    return _address;
}

const boost::optional<std::string>& ServerDescription::getError() const {
    return _error;
}

const boost::optional<IsMasterRTT>& ServerDescription::getRtt() const {
    return _rtt;
}

const boost::optional<Date_t>& ServerDescription::getLastWriteDate() const {
    return _lastWriteDate;
}

const boost::optional<TopologyVersion>& ServerDescription::getTopologyVersion() const {
    return _topologyVersion;
}

ServerType ServerDescription::getType() const {
    return _type;
}

const boost::optional<ServerAddress>& ServerDescription::getMe() const {
    return _me;
}

const std::set<ServerAddress>& ServerDescription::getHosts() const {
    return _hosts;
}

const std::set<ServerAddress>& ServerDescription::getPassives() const {
    return _passives;
}

const std::set<ServerAddress>& ServerDescription::getArbiters() const {
    return _arbiters;
}

const std::map<std::string, std::string>& ServerDescription::getTags() const {
    return _tags;
}

const boost::optional<std::string>& ServerDescription::getSetName() const {
    return _setName;
}

const boost::optional<int>& ServerDescription::getSetVersion() const {
    return _setVersion;
}

const boost::optional<OID>& ServerDescription::getElectionId() const {
    return _electionId;
}

const boost::optional<ServerAddress>& ServerDescription::getPrimary() const {
    return _primary;
}

const Date_t ServerDescription::getLastUpdateTime() const {
    return *_lastUpdateTime;
}

const boost::optional<int>& ServerDescription::getLogicalSessionTimeoutMinutes() const {
    return _logicalSessionTimeoutMinutes;
}

int ServerDescription::getMinWireVersion() const {
    return _minWireVersion;
}

int ServerDescription::getMaxWireVersion() const {
    return _maxWireVersion;
}

bool ServerDescription::isEquivalent(const ServerDescription& other) const {
    auto otherValues = std::tie(other._type,
                                other._minWireVersion,
                                other._maxWireVersion,
                                other._me,
                                other._hosts,
                                other._passives,
                                other._arbiters,
                                other._tags,
                                other._setName,
                                other._setVersion,
                                other._electionId,
                                other._primary,
                                other._logicalSessionTimeoutMinutes,
                                other._topologyVersion,
                                other._error);
    auto thisValues = std::tie(_type,
                               _minWireVersion,
                               _maxWireVersion,
                               _me,
                               _hosts,
                               _passives,
                               _arbiters,
                               _tags,
                               _setName,
                               _setVersion,
                               _electionId,
                               _primary,
                               _logicalSessionTimeoutMinutes,
                               _topologyVersion,
                               _error);
    return thisValues == otherValues;
}

bool ServerDescription::operator==(const ServerDescription& other) const {
    return _address == other._address && isEquivalent(other);
}

bool ServerDescription::operator!=(const ServerDescription& other) const {
    return !(*this == other);
}

bool ServerDescription::isDataBearingServer() const {
    return kDataServerTypes.find(_type) != kDataServerTypes.end();
}

ServerDescriptionPtr ServerDescription::cloneWithRTT(IsMasterRTT rtt) const {
    auto newServerDescription = std::make_shared<ServerDescription>(*this);
    if (_rtt) {
        newServerDescription->_rtt = IsMasterRTT(static_cast<IsMasterRTT::rep>(
            kRttAlpha * rtt.count() + (1 - kRttAlpha) * _rtt->count()));
    } else {
        newServerDescription->_rtt = rtt;
    }
    return newServerDescription;
}

// output server description as a string. This is primarily used for debugging.
std::string ServerDescription::toString() const {
    std::ostringstream ss;
    ss << "{ address: " << _address << ", type: " << _type;
    appendOptional(ss, "roundTripTime", _rtt);
    ss << ", minWireVersion: " << _minWireVersion << ", maxWireVersion: " << _maxWireVersion;
    appendOptional(ss, "me", _me);
    appendOptional(ss, "setName", _setName);
    appendOptional(ss, "setVersion", _setVersion);
    appendOptional(ss, "electionId", _electionId);
    appendOptional(ss, "primary", _primary);
    appendOptional(ss, "topologyVersion", _topologyVersion);
    appendOptional(ss, "lastWriteDate", _lastWriteDate);
    appendOptional(ss, "lastUpdateTime", _lastUpdateTime);
    appendOptional(ss, "logicalSessionTimeoutMinutes", _logicalSessionTimeoutMinutes);
    appendAddressSet(ss, "hosts", _hosts);
    appendAddressSet(ss, "passives", _passives);
    appendAddressSet(ss, "arbiters", _arbiters);
    if (!_tags.empty()) {
        ss << ", tags: {";
        bool first = true;
        for (const auto& tag : _tags) {
            ss << (first ? " " : ", ") << tag.first << ": \"" << tag.second << "\"";
            first = false;
        }
        ss << " }";
    }
    if (_error) {
        ss << ", error: \"" << *_error << "\"";
    }
    ss << " }";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const ServerDescription& description) {
    return os << description.toString();
}

std::ostream& operator<<(std::ostream& os, const ServerDescriptionPtr& description) {
    if (!description)
        return os << "null";
    return os << *description;
}

////////////////////////////
// ServerDescriptionBuilder
////////////////////////////
ServerDescriptionBuilder::ServerDescriptionBuilder(ClockSource* clockSource,
                                                   const IsMasterOutcome& isMasterOutcome,
                                                   boost::optional<IsMasterRTT> lastRtt) {
    withAddress(isMasterOutcome.getServer());
    withLastUpdateTime(clockSource->now());

    if (isMasterOutcome.isSuccess()) {
        const auto& response = *isMasterOutcome.getResponse();
        parseTypeFromIsMaster(response);

        calculateRtt(*isMasterOutcome.getRtt(), lastRtt);

        withMinWireVersion(response.minWireVersion);
        withMaxWireVersion(response.maxWireVersion);

        if (response.lastWriteDate) {
            withLastWriteDate(*response.lastWriteDate);
        }

        if (response.topologyVersion) {
            withTopologyVersion(*response.topologyVersion);
        }

        saveHosts(response);

        for (const auto& tag : response.tags) {
            withTag(tag.first, tag.second);
        }

        if (response.electionId) {
            withElectionId(*response.electionId);
        }

        if (response.logicalSessionTimeoutMinutes) {
            withLogicalSessionTimeoutMinutes(*response.logicalSessionTimeoutMinutes);
        }

        if (response.setVersion) {
            withSetVersion(*response.setVersion);
        }

        if (response.setName) {
            withSetName(*response.setName);
        }
    } else {
        withError(isMasterOutcome.getErrorMsg());
    }
}

void ServerDescriptionBuilder::saveHosts(const IsMasterReply& isMaster) {
    auto parseAddress = [this](const std::string& text) -> boost::optional<ServerAddress> {
        auto swAddress = HostAndPort::parse(text);
        if (!swAddress.isOK()) {
            LOG_WARNING() << "ignoring unparseable address '" << text << "' reported by "
                          << _instance._address << ": " << swAddress.getStatus();
            return boost::none;
        }
        return swAddress.getValue();
    };

    const std::pair<const std::vector<std::string>*, std::set<ServerAddress>*> hostLists[] = {
        {&isMaster.hosts, &_instance._hosts},
        {&isMaster.passives, &_instance._passives},
        {&isMaster.arbiters, &_instance._arbiters}};
    for (const auto& hostList : hostLists) {
        for (const auto& text : *hostList.first) {
            if (auto address = parseAddress(text)) {
                hostList.second->emplace(std::move(*address));
            }
        }
    }

    if (isMaster.me) {
        if (auto me = parseAddress(*isMaster.me)) {
            withMe(*me);
        }
    }

    if (isMaster.primary) {
        if (auto primary = parseAddress(*isMaster.primary)) {
            withPrimary(*primary);
        }
    }
}

void ServerDescriptionBuilder::calculateRtt(const IsMasterRTT currentRtt,
                                            const boost::optional<IsMasterRTT> lastRtt) {
    if (_instance.getType() != ServerType::kUnknown) {
        withRtt(currentRtt, lastRtt);
    }
}

void ServerDescriptionBuilder::parseTypeFromIsMaster(const IsMasterReply& isMaster) {
    ServerType t;
    bool hasSetName = isMaster.setName != boost::none;

    if (!isMaster.ok) {
        t = ServerType::kUnknown;
    } else if (isMaster.serviceId) {
        t = ServerType::kLoadBalancer;
    } else if (isMaster.msg && *isMaster.msg == IsMasterReply::kIsDbGrid) {
        t = ServerType::kMongos;
    } else if (hasSetName && isMaster.isMaster) {
        t = ServerType::kRSPrimary;
    } else if (hasSetName && isMaster.secondary) {
        t = ServerType::kRSSecondary;
    } else if (hasSetName && isMaster.arbiterOnly) {
        t = ServerType::kRSArbiter;
    } else if (hasSetName) {
        t = ServerType::kRSOther;
    } else if (isMaster.isReplicaSet) {
        t = ServerType::kRSGhost;
    } else {
        t = ServerType::kStandalone;
    }
    withType(t);
}

ServerDescriptionPtr ServerDescriptionBuilder::instance() const {
    return std::make_shared<ServerDescription>(_instance);
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withAddress(const ServerAddress& address) {
    _instance._address = address;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withError(const std::string& error) {
    _instance._error = error;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withRtt(const IsMasterRTT& rtt,
                                                            boost::optional<IsMasterRTT> lastRtt) {
    if (lastRtt) {
        _instance._rtt = IsMasterRTT(static_cast<IsMasterRTT::rep>(
            ServerDescription::kRttAlpha * rtt.count() +
            (1 - ServerDescription::kRttAlpha) * lastRtt->count()));
    } else {
        _instance._rtt = rtt;
    }
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withLastWriteDate(const Date_t& lastWriteDate) {
    _instance._lastWriteDate = lastWriteDate;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withTopologyVersion(
    const TopologyVersion& topologyVersion) {
    _instance._topologyVersion = topologyVersion;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withType(const ServerType type) {
    _instance._type = type;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withMinWireVersion(int minVersion) {
    _instance._minWireVersion = minVersion;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withMaxWireVersion(int maxVersion) {
    _instance._maxWireVersion = maxVersion;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withMe(const ServerAddress& me) {
    _instance._me = me;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withHost(const ServerAddress& host) {
    _instance._hosts.emplace(host);
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withPassive(const ServerAddress& passive) {
    _instance._passives.emplace(passive);
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withArbiter(const ServerAddress& arbiter) {
    _instance._arbiters.emplace(arbiter);
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withTag(const std::string key,
                                                            const std::string value) {
    _instance._tags[key] = value;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withSetName(const std::string setName) {
    _instance._setName = std::move(setName);
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withSetVersion(const int setVersion) {
    _instance._setVersion = setVersion;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withElectionId(const OID& electionId) {
    _instance._electionId = electionId;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withPrimary(const ServerAddress& primary) {
    _instance._primary = primary;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withLastUpdateTime(
    const Date_t& lastUpdateTime) {
    _instance._lastUpdateTime = lastUpdateTime;
    return *this;
}

ServerDescriptionBuilder& ServerDescriptionBuilder::withLogicalSessionTimeoutMinutes(
    const int logicalSessionTimeoutMinutes) {
    _instance._logicalSessionTimeoutMinutes = logicalSessionTimeoutMinutes;
    return *this;
}
}  // namespace docdriver::sdam
