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

#include "docdriver/client/sdam/sdam_configuration.h"

#include <sstream>

#include "docdriver/util/assert_util.h"

namespace docdriver::sdam {
constexpr Milliseconds SdamConfiguration::kDefaultHeartbeatFrequencyMs;
constexpr Milliseconds SdamConfiguration::kMinHeartbeatFrequencyMS;
constexpr Milliseconds SdamConfiguration::kDefaultConnectTimeoutMS;
constexpr Milliseconds SdamConfiguration::kDefaultLocalThresholdMS;
constexpr Milliseconds SdamConfiguration::kDefaultServerSelectionTimeoutMs;

std::string toString(ServerMonitoringMode mode) {
    switch (mode) {
        case ServerMonitoringMode::kAuto:
            return "auto";
        case ServerMonitoringMode::kStream:
            return "stream";
        case ServerMonitoringMode::kPoll:
            return "poll";
    }
    DOCDRIVER_UNREACHABLE;
}

StatusWith<ServerMonitoringMode> parseServerMonitoringMode(const std::string& mode) {
    for (auto candidate : {ServerMonitoringMode::kAuto,
                           ServerMonitoringMode::kStream,
                           ServerMonitoringMode::kPoll}) {
        if (toString(candidate) == mode)
            return candidate;
    }
    return Status(ErrorCodes::FailedToParse, "unknown server monitoring mode: " + mode);
}

SdamConfiguration::SdamConfiguration(boost::optional<std::vector<ServerAddress>> seedList,
                                     TopologyType initialType,
                                     Milliseconds heartBeatFrequencyMs,
                                     Milliseconds connectTimeoutMs,
                                     Milliseconds localThreshholdMs,
                                     Milliseconds serverSelectionTimeoutMs,
                                     boost::optional<std::string> setName,
                                     ServerMonitoringMode monitoringMode,
                                     Milliseconds minHeartbeatFrequencyMs)
    : _seedList(std::move(seedList)),
      _initialType(initialType),
      _heartBeatFrequencyMs(heartBeatFrequencyMs),
      _connectTimeoutMs(connectTimeoutMs),
      _localThreshholdMs(localThreshholdMs),
      _serverSelectionTimeoutMs(serverSelectionTimeoutMs),
      _setName(std::move(setName)),
      _monitoringMode(monitoringMode),
      _minHeartbeatFrequencyMs(minHeartbeatFrequencyMs) {
    uassert(ErrorCodes::InvalidTopologyType,
            "initial topology type must be Single, Unknown, ReplicaSetNoPrimary or LoadBalanced",
            _initialType == TopologyType::kSingle || _initialType == TopologyType::kUnknown ||
                _initialType == TopologyType::kReplicaSetNoPrimary ||
                _initialType == TopologyType::kLoadBalanced);

    if (_seedList) {
        uassert(ErrorCodes::InvalidSeedList, "seed list size must be >= 1", _seedList->size() >= 1);
    }

    if (_initialType == TopologyType::kSingle || _initialType == TopologyType::kLoadBalanced) {
        uassert(ErrorCodes::InvalidSeedList,
                "A " + sdam::toString(_initialType) +
                    " TopologyType must have exactly one entry in the seed list.",
                _seedList && _seedList->size() == 1);
    }

    if (_initialType == TopologyType::kReplicaSetNoPrimary) {
        uassert(ErrorCodes::InvalidTopologyType,
                "A ReplicaSetNoPrimary TopologyType requires a setName.",
                _setName != boost::none);
    }

    if (_setName) {
        uassert(ErrorCodes::InvalidTopologyType,
                "Only ReplicaSetNoPrimary or Single allowed when a setName is provided.",
                _initialType == TopologyType::kReplicaSetNoPrimary ||
                    _initialType == TopologyType::kSingle);
    }

    uassert(ErrorCodes::InvalidHeartBeatFrequency,
            "minimum heartbeat frequency must be positive",
            _minHeartbeatFrequencyMs > Milliseconds(0));

    uassert(ErrorCodes::InvalidHeartBeatFrequency,
            "topology heartbeat must be >= " + std::to_string(_minHeartbeatFrequencyMs.count()) +
                "ms",
            _heartBeatFrequencyMs >= _minHeartbeatFrequencyMs);

    uassert(ErrorCodes::BadValue,
            "connect timeout must be positive",
            _connectTimeoutMs > Milliseconds(0));

    uassert(ErrorCodes::BadValue,
            "local threshold must not be negative",
            _localThreshholdMs >= Milliseconds(0));

    uassert(ErrorCodes::BadValue,
            "server selection timeout must not be negative",
            _serverSelectionTimeoutMs >= Milliseconds(0));
}

const boost::optional<std::vector<ServerAddress>>& SdamConfiguration::getSeedList() const {
    return _seedList;
}

TopologyType SdamConfiguration::getInitialType() const {
    return _initialType;
}

Milliseconds SdamConfiguration::getHeartBeatFrequency() const {
    return _heartBeatFrequencyMs;
}

Milliseconds SdamConfiguration::getMinHeartbeatFrequency() const {
    return _minHeartbeatFrequencyMs;
}

const boost::optional<std::string>& SdamConfiguration::getSetName() const {
    return _setName;
}

Milliseconds SdamConfiguration::getConnectionTimeout() const {
    return _connectTimeoutMs;
}

Milliseconds SdamConfiguration::getLocalThreshold() const {
    return _localThreshholdMs;
}

Milliseconds SdamConfiguration::getServerSelectionTimeout() const {
    return _serverSelectionTimeoutMs;
}

ServerMonitoringMode SdamConfiguration::getMonitoringMode() const {
    return _monitoringMode;
}

std::string SdamConfiguration::toString() const {
    std::ostringstream ss;
    ss << "{ seedList: [";
    if (_seedList) {
        bool first = true;
        for (const auto& address : *_seedList) {
            ss << (first ? " " : ", ") << address;
            first = false;
        }
        ss << " ";
    }
    ss << "], initialType: " << _initialType << ", heartbeatFrequencyMS: " << _heartBeatFrequencyMs
       << ", minHeartbeatFrequencyMS: " << _minHeartbeatFrequencyMs
       << ", connectTimeoutMS: " << _connectTimeoutMs
       << ", localThresholdMS: " << _localThreshholdMs
       << ", serverSelectionTimeoutMS: " << _serverSelectionTimeoutMs;
    if (_setName) {
        ss << ", setName: " << *_setName;
    }
    ss << ", serverMonitoringMode: " << sdam::toString(_monitoringMode) << " }";
    return ss.str();
}
}  // namespace docdriver::sdam
