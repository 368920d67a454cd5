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

#include "docdriver/client/sdam/topology_description.h"

#include <algorithm>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <iterator>
#include <ostream>
#include <sstream>
#include <tuple>

#include "docdriver/client/wire_version.h"
#include "docdriver/util/assert_util.h"

namespace docdriver::sdam {
////////////////////////
// TopologyDescription
////////////////////////
TopologyDescription::TopologyDescription(const SdamConfiguration& config)
    : _id(boost::uuids::random_generator()()),
      _type(config.getInitialType()),
      _setName(config.getSetName()) {
    if (auto seeds = config.getSeedList()) {
        _servers.clear();
        for (const auto& address : *seeds) {
            if (!containsServerAddress(address)) {
                _servers.push_back(std::make_shared<ServerDescription>(address));
            }
        }
    }
}

const UUID& TopologyDescription::getId() const {
    return _id;
}

TopologyType TopologyDescription::getType() const {
    return _type;
}

const boost::optional<std::string>& TopologyDescription::getSetName() const {
    return _setName;
}

const boost::optional<int>& TopologyDescription::getMaxSetVersion() const {
    return _maxSetVersion;
}

const boost::optional<OID>& TopologyDescription::getMaxElectionId() const {
    return _maxElectionId;
}

const std::vector<ServerDescriptionPtr>& TopologyDescription::getServers() const {
    return _servers;
}

bool TopologyDescription::isWireVersionCompatible() const {
    return _compatible;
}

const boost::optional<std::string>& TopologyDescription::getWireVersionCompatibleError() const {
    return _compatibleError;
}

const boost::optional<int>& TopologyDescription::getLogicalSessionTimeoutMinutes() const {
    return _logicalSessionTimeoutMinutes;
}

void TopologyDescription::setType(TopologyType type) {
    _type = type;
}

bool TopologyDescription::containsServerAddress(const ServerAddress& address) const {
    return bool(findServerByAddress(address));
}

std::vector<ServerDescriptionPtr> TopologyDescription::findServers(
    std::function<bool(const ServerDescriptionPtr&)> predicate) const {
    std::vector<ServerDescriptionPtr> result;
    std::copy_if(_servers.begin(), _servers.end(), std::back_inserter(result), predicate);
    return result;
}

boost::optional<ServerDescriptionPtr> TopologyDescription::findServerByAddress(
    const ServerAddress& address) const {
    for (const auto& serverDescription : _servers) {
        if (serverDescription->getAddress() == address)
            return serverDescription;
    }
    return boost::none;
}

boost::optional<ServerDescriptionPtr> TopologyDescription::getPrimary() const {
    for (const auto& serverDescription : _servers) {
        if (serverDescription->getType() == ServerType::kRSPrimary)
            return serverDescription;
    }
    return boost::none;
}

boost::optional<ServerDescriptionPtr> TopologyDescription::installServerDescription(
    const ServerDescriptionPtr& newServerDescription) {
    boost::optional<ServerDescriptionPtr> previousDescription;
    if (getType() == TopologyType::kSingle) {
        // For Single, there is always one ServerDescription in TopologyDescription.servers;
        // the ServerDescription in TopologyDescription.servers MUST be replaced with the new
        // ServerDescription.
        invariant(_servers.size() == 1);
        previousDescription = _servers[0];
        _servers[0] = newServerDescription;
    } else {
        auto it = std::find_if(_servers.begin(),
                               _servers.end(),
                               [&](const ServerDescriptionPtr& description) {
                                   return description->getAddress() ==
                                       newServerDescription->getAddress();
                               });
        if (it != _servers.end()) {
            previousDescription = *it;
            *it = newServerDescription;
        } else {
            _servers.push_back(newServerDescription);
        }
    }

    checkWireCompatibilityVersions();
    calculateLogicalSessionTimeout();
    return previousDescription;
}

void TopologyDescription::removeServerDescription(const ServerAddress& serverAddress) {
    auto it = std::find_if(_servers.begin(),
                           _servers.end(),
                           [serverAddress](const ServerDescriptionPtr& description) {
                               return serverAddress == description->getAddress();
                           });
    if (it != _servers.end()) {
        _servers.erase(it);
    }
    checkWireCompatibilityVersions();
    calculateLogicalSessionTimeout();
}

void TopologyDescription::checkWireCompatibilityVersions() {
    std::ostringstream errorOss;

    _compatible = true;
    for (const auto& serverDescription : _servers) {
        if (serverDescription->getType() == ServerType::kUnknown) {
            continue;
        }

        if (serverDescription->getMinWireVersion() > LATEST_WIRE_VERSION) {
            _compatible = false;
            errorOss << "Server at " << serverDescription->getAddress()
                     << " requires wire version " << serverDescription->getMinWireVersion()
                     << " but this version of the driver only supports up to "
                     << LATEST_WIRE_VERSION << ".";
            break;
        } else if (serverDescription->getMaxWireVersion() < MIN_SUPPORTED_WIRE_VERSION) {
            _compatible = false;
            errorOss << "Server at " << serverDescription->getAddress()
                     << " reports wire version " << serverDescription->getMaxWireVersion()
                     << " but this version of the driver requires at least "
                     << MIN_SUPPORTED_WIRE_VERSION << " (server "
                     << minimumRequiredServerVersionString(MIN_SUPPORTED_WIRE_VERSION) << ").";
            break;
        }
    }

    _compatibleError = (_compatible) ? boost::none : boost::make_optional(errorOss.str());
}

void TopologyDescription::calculateLogicalSessionTimeout() {
    boost::optional<int> result;
    bool hasDataBearingServer = false;
    for (const auto& server : _servers) {
        if (!server->isDataBearingServer())
            continue;
        hasDataBearingServer = true;

        const auto& timeout = server->getLogicalSessionTimeoutMinutes();
        if (!timeout) {
            _logicalSessionTimeoutMinutes = boost::none;
            return;
        }
        result = result ? std::min(*result, *timeout) : *timeout;
    }
    _logicalSessionTimeoutMinutes = hasDataBearingServer ? result : boost::none;
}

bool TopologyDescription::isEquivalent(const TopologyDescription& other) const {
    if (std::tie(_type, _setName, _maxSetVersion, _maxElectionId, _compatible) !=
        std::tie(other._type,
                 other._setName,
                 other._maxSetVersion,
                 other._maxElectionId,
                 other._compatible)) {
        return false;
    }

    if (_servers.size() != other._servers.size())
        return false;
    for (const auto& server : _servers) {
        auto otherServer = other.findServerByAddress(server->getAddress());
        if (!otherServer || !server->isEquivalent(**otherServer))
            return false;
    }
    return true;
}

std::string TopologyDescription::toString() const {
    std::ostringstream ss;
    ss << "{ id: " << _id << ", topologyType: " << _type;
    if (_setName) {
        ss << ", setName: " << *_setName;
    }
    if (_maxSetVersion) {
        ss << ", maxSetVersion: " << *_maxSetVersion;
    }
    if (_maxElectionId) {
        ss << ", maxElectionId: " << *_maxElectionId;
    }
    if (_logicalSessionTimeoutMinutes) {
        ss << ", logicalSessionTimeoutMinutes: " << *_logicalSessionTimeoutMinutes;
    }
    if (!_compatible) {
        ss << ", compatibilityError: \"" << *_compatibleError << "\"";
    }
    ss << ", servers: [";
    bool first = true;
    for (const auto& server : _servers) {
        ss << (first ? " " : ", ") << *server;
        first = false;
    }
    ss << (_servers.empty() ? "] }" : " ] }");
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const TopologyDescription& description) {
    return os << description.toString();
}
}  // namespace docdriver::sdam
