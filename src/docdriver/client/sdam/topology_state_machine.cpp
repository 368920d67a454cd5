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

#include "docdriver/client/sdam/topology_state_machine.h"

#include <boost/optional/optional_io.hpp>
#include <functional>
#include <ostream>

#include "docdriver/util/assert_util.h"
#include "docdriver/util/log.h"

namespace docdriver::sdam {
namespace {
const auto kLogPrefix = "(TopologyStateMachine) ";
}  // namespace

TopologyStateMachine::TopologyStateMachine(const SdamConfiguration& config) : _config(config) {
    initTransitionTable();
}

// This is used to make the syntax in initTransitionTable less verbose.
// Since we have enum class for TopologyType and ServerType there are no implicit int conversions.
template <typename T>
inline int idx(T enumType) {
    return static_cast<int>(enumType);
}

/**
 * This function encodes the transition table from topology type and reported server type to
 * the action taken.
 */
void TopologyStateMachine::initTransitionTable() {
    using namespace std::placeholders;

    // init the table to No-ops
    const TransitionAction NO_OP([](TopologyDescription&, const ServerDescriptionPtr&) {});
    _stt.resize(allTopologyTypes().size() + 1);
    for (auto& row : _stt) {
        row.resize(allServerTypes().size() + 1, NO_OP);
    }

    // From TopologyType: Unknown
    _stt[idx(TopologyType::kUnknown)][idx(ServerType::kStandalone)] =
        std::bind(&TopologyStateMachine::updateUnknownWithStandalone, this, _1, _2);
    _stt[idx(TopologyType::kUnknown)][idx(ServerType::kMongos)] =
        setTopologyType(TopologyType::kSharded);
    _stt[idx(TopologyType::kUnknown)][idx(ServerType::kRSPrimary)] =
        setTopologyTypeAndUpdateRSFromPrimary(TopologyType::kReplicaSetWithPrimary);
    _stt[idx(TopologyType::kUnknown)][idx(ServerType::kLoadBalancer)] =
        std::bind(&TopologyStateMachine::removeAndStopMonitoring, this, _1, _2);

    {
        const auto serverTypes = std::vector<ServerType>{
            ServerType::kRSSecondary, ServerType::kRSArbiter, ServerType::kRSOther};
        for (auto newServerType : serverTypes) {
            _stt[idx(TopologyType::kUnknown)][idx(newServerType)] =
                setTopologyTypeAndUpdateRSWithoutPrimary(TopologyType::kReplicaSetNoPrimary);
        }
    }

    // From TopologyType: Sharded
    {
        const auto serverTypes = std::vector<ServerType>{ServerType::kStandalone,
                                                         ServerType::kRSPrimary,
                                                         ServerType::kRSSecondary,
                                                         ServerType::kRSArbiter,
                                                         ServerType::kRSOther,
                                                         ServerType::kRSGhost,
                                                         ServerType::kLoadBalancer};
        for (auto newServerType : serverTypes) {
            _stt[idx(TopologyType::kSharded)][idx(newServerType)] =
                std::bind(&TopologyStateMachine::removeAndStopMonitoring, this, _1, _2);
        }
    }

    // From TopologyType: ReplicaSetNoPrimary
    {
        const auto serverTypes = std::vector<ServerType>{
            ServerType::kStandalone, ServerType::kMongos, ServerType::kLoadBalancer};
        for (auto serverType : serverTypes) {
            _stt[idx(TopologyType::kReplicaSetNoPrimary)][idx(serverType)] =
                std::bind(&TopologyStateMachine::removeAndStopMonitoring, this, _1, _2);
        }
    }

    _stt[idx(TopologyType::kReplicaSetNoPrimary)][idx(ServerType::kRSPrimary)] =
        setTopologyTypeAndUpdateRSFromPrimary(TopologyType::kReplicaSetWithPrimary);

    {
        const auto serverTypes = std::vector<ServerType>{
            ServerType::kRSSecondary, ServerType::kRSArbiter, ServerType::kRSOther};
        for (auto serverType : serverTypes) {
            _stt[idx(TopologyType::kReplicaSetNoPrimary)][idx(serverType)] =
                std::bind(&TopologyStateMachine::updateRSWithoutPrimary, this, _1, _2);
        }
    }

    // From TopologyType: ReplicaSetWithPrimary
    {
        const auto serverTypes =
            std::vector<ServerType>{ServerType::kUnknown, ServerType::kRSGhost};
        for (auto serverType : serverTypes) {
            _stt[idx(TopologyType::kReplicaSetWithPrimary)][idx(serverType)] =
                std::bind(&TopologyStateMachine::checkIfHasPrimary, this, _1, _2);
        }
    }

    {
        const auto serverTypes = std::vector<ServerType>{
            ServerType::kStandalone, ServerType::kMongos, ServerType::kLoadBalancer};
        for (auto serverType : serverTypes) {
            _stt[idx(TopologyType::kReplicaSetWithPrimary)][idx(serverType)] =
                std::bind(&TopologyStateMachine::removeAndCheckIfHasPrimary, this, _1, _2);
        }
    }

    _stt[idx(TopologyType::kReplicaSetWithPrimary)][idx(ServerType::kRSPrimary)] =
        std::bind(&TopologyStateMachine::updateRSFromPrimary, this, _1, _2);

    {
        const auto serverTypes = std::vector<ServerType>{
            ServerType::kRSSecondary, ServerType::kRSArbiter, ServerType::kRSOther};
        for (auto serverType : serverTypes) {
            _stt[idx(TopologyType::kReplicaSetWithPrimary)][idx(serverType)] =
                std::bind(&TopologyStateMachine::updateRSWithPrimaryFromMember, this, _1, _2);
        }
    }
}

void TopologyStateMachine::onServerDescription(TopologyDescription& topologyDescription,
                                               const ServerDescriptionPtr& serverDescription) {
    std::lock_guard<std::mutex> lock(_mutex);

    if (!topologyDescription.containsServerAddress(serverDescription->getAddress())) {
        LOG(kLogLevel) << kLogPrefix << "ignoring isMaster reply from server that is not in the "
                       << "topology: " << serverDescription->getAddress();
        return;
    }

    switch (topologyDescription.getType()) {
        case TopologyType::kLoadBalanced:
            LOG(kLogLevel) << kLogPrefix << "ignoring isMaster reply in a load balanced topology: "
                           << serverDescription->getAddress();
            return;
        case TopologyType::kSingle:
            installSingleServerDescription(topologyDescription, serverDescription);
            return;
        default:
            break;
    }

    installServerDescription(topologyDescription, serverDescription, false);

    auto& action = _stt[idx(topologyDescription.getType())][idx(serverDescription->getType())];
    action(topologyDescription, serverDescription);
}

void TopologyStateMachine::installSingleServerDescription(
    TopologyDescription& topologyDescription, const ServerDescriptionPtr& serverDescription) {
    const auto& expectedSetName = _config.getSetName();
    const auto serverType = serverDescription->getType();

    boost::optional<std::string> error;
    if (expectedSetName && serverType != ServerType::kUnknown &&
        serverDescription->getSetName() != expectedSetName) {
        error = "replica set name mismatch: expected '" + *expectedSetName + "' but server '" +
            serverDescription->getAddress().toString() + "' reported '" +
            serverDescription->getSetName().value_or("") + "'";
    } else if (serverType == ServerType::kLoadBalancer) {
        error = "server '" + serverDescription->getAddress().toString() +
            "' is a load balancer but the topology is not load balanced";
    }

    if (error) {
        LOG_WARNING() << kLogPrefix << *error;
        auto unknown = ServerDescriptionBuilder()
                           .withAddress(serverDescription->getAddress())
                           .withType(ServerType::kUnknown)
                           .withLastUpdateTime(serverDescription->getLastUpdateTime())
                           .withError(*error)
                           .instance();
        installServerDescription(topologyDescription, unknown, false);
        return;
    }

    installServerDescription(topologyDescription, serverDescription, false);
}

void TopologyStateMachine::updateUnknownWithStandalone(
    TopologyDescription& topologyDescription, const ServerDescriptionPtr& serverDescription) {
    if (!topologyDescription.containsServerAddress(serverDescription->getAddress()))
        return;

    if (_config.getSeedList() && (*_config.getSeedList()).size() == 1) {
        modifyTopologyType(topologyDescription, TopologyType::kSingle);
    } else {
        removeServerDescription(topologyDescription, serverDescription->getAddress());
    }
}

void TopologyStateMachine::updateRSWithoutPrimary(TopologyDescription& topologyDescription,
                                                  const ServerDescriptionPtr& serverDescription) {
    const auto& serverDescAddress = serverDescription->getAddress();

    if (!topologyDescription.containsServerAddress(serverDescAddress))
        return;

    const auto& currentSetName = topologyDescription.getSetName();
    const auto& serverDescSetName = serverDescription->getSetName();
    if (currentSetName == boost::none) {
        modifySetName(topologyDescription, serverDescSetName);
    } else if (currentSetName != serverDescSetName) {
        removeServerDescription(topologyDescription, serverDescAddress);
        return;
    }

    addUnknownServers(topologyDescription, serverDescription);

    const auto& me = serverDescription->getMe();
    if (me && serverDescAddress != *me) {
        removeServerDescription(topologyDescription, serverDescAddress);
    }
}

void TopologyStateMachine::addUnknownServers(TopologyDescription& topologyDescription,
                                             const ServerDescriptionPtr& serverDescription) {
    const std::set<ServerAddress>* addressSets[3]{&serverDescription->getHosts(),
                                                  &serverDescription->getPassives(),
                                                  &serverDescription->getArbiters()};
    for (const auto addresses : addressSets) {
        for (const auto& addressFromSet : *addresses) {
            if (!topologyDescription.containsServerAddress(addressFromSet)) {
                installServerDescription(
                    topologyDescription, std::make_shared<ServerDescription>(addressFromSet), true);
            }
        }
    }
}

void TopologyStateMachine::updateRSWithPrimaryFromMember(
    TopologyDescription& topologyDescription, const ServerDescriptionPtr& serverDescription) {
    const auto& serverDescAddress = serverDescription->getAddress();
    if (!topologyDescription.containsServerAddress(serverDescAddress)) {
        return;
    }

    invariant(serverDescription->getSetName() != boost::none);
    if (topologyDescription.getSetName() != serverDescription->getSetName()) {
        removeAndCheckIfHasPrimary(topologyDescription, serverDescription);
        return;
    }

    const auto& me = serverDescription->getMe();
    if (me && serverDescAddress != *me) {
        removeAndCheckIfHasPrimary(topologyDescription, serverDescription);
        return;
    }

    if (!topologyDescription.getPrimary()) {
        modifyTopologyType(topologyDescription, TopologyType::kReplicaSetNoPrimary);
    }
}

bool TopologyStateMachine::isStalePrimary(const TopologyDescription& topologyDescription,
                                          const ServerDescriptionPtr& serverDescription) const {
    // boost::optional orders none before any value.
    const auto& electionId = serverDescription->getElectionId();
    const auto& maxElectionId = topologyDescription.getMaxElectionId();
    if (electionId != maxElectionId) {
        return electionId < maxElectionId;
    }
    return serverDescription->getSetVersion() < topologyDescription.getMaxSetVersion();
}

void TopologyStateMachine::updateRSFromPrimary(TopologyDescription& topologyDescription,
                                               const ServerDescriptionPtr& serverDescription) {
    const auto& serverDescAddress = serverDescription->getAddress();
    if (!topologyDescription.containsServerAddress(serverDescAddress)) {
        return;
    }

    auto topologySetName = topologyDescription.getSetName();
    auto serverDescSetName = serverDescription->getSetName();
    if (!topologySetName && serverDescSetName) {
        modifySetName(topologyDescription, serverDescSetName);
    } else if (topologySetName != serverDescSetName) {
        // We found a primary but it doesn't have the setName
        // provided by the user or previously discovered.
        removeAndCheckIfHasPrimary(topologyDescription, serverDescription);
        return;
    }

    if (isStalePrimary(topologyDescription, serverDescription)) {
        LOG(0) << kLogPrefix << ErrorCodes::StalePrimaryDemotion << ": " << serverDescAddress
               << " reported electionId " << serverDescription->getElectionId()
               << " and setVersion "
               << serverDescription->getSetVersion() << " which is older than the topology's "
               << topologyDescription.getMaxElectionId() << " and "
               << topologyDescription.getMaxSetVersion();
        auto stalePrimary = ServerDescriptionBuilder()
                                .withAddress(serverDescAddress)
                                .withType(ServerType::kUnknown)
                                .withLastUpdateTime(serverDescription->getLastUpdateTime())
                                .withError("primary marked stale due to electionId/setVersion")
                                .instance();
        installServerDescription(topologyDescription, stalePrimary, false);
        checkIfHasPrimary(topologyDescription, serverDescription);
        return;
    }

    if (const auto& electionId = serverDescription->getElectionId()) {
        modifyMaxElectionId(topologyDescription, *electionId);
        topologyDescription._maxSetVersion = serverDescription->getSetVersion();
    } else if (const auto& setVersion = serverDescription->getSetVersion()) {
        if (!topologyDescription.getMaxSetVersion() ||
            *setVersion > *topologyDescription.getMaxSetVersion()) {
            modifyMaxSetVersion(topologyDescription, *setVersion);
        }
    }

    auto oldPrimaries = topologyDescription.findServers(
        [serverDescAddress](const ServerDescriptionPtr& description) {
            return (description->getAddress() != serverDescAddress &&
                    description->getType() == ServerType::kRSPrimary);
        });
    invariant(oldPrimaries.size() <= 1);
    for (const auto& server : oldPrimaries) {
        LOG(kLogLevel) << kLogPrefix << "demoting previous primary " << server->getAddress();
        installServerDescription(
            topologyDescription, std::make_shared<ServerDescription>(server->getAddress()), false);
    }

    addUnknownServers(topologyDescription, serverDescription);

    std::vector<ServerAddress> toRemove;
    for (const auto& currentServerDescription : topologyDescription.getServers()) {
        const auto& currentServerAddress = currentServerDescription->getAddress();
        auto hosts = serverDescription->getHosts().find(currentServerAddress);
        auto passives = serverDescription->getPassives().find(currentServerAddress);
        auto arbiters = serverDescription->getArbiters().find(currentServerAddress);

        if (hosts == serverDescription->getHosts().end() &&
            passives == serverDescription->getPassives().end() &&
            arbiters == serverDescription->getArbiters().end()) {
            toRemove.push_back(currentServerAddress);
        }
    }
    for (const auto& serverAddress : toRemove) {
        removeServerDescription(topologyDescription, serverAddress);
    }

    checkIfHasPrimary(topologyDescription, serverDescription);
}

void TopologyStateMachine::removeAndStopMonitoring(TopologyDescription& topologyDescription,
                                                   const ServerDescriptionPtr& serverDescription) {
    removeServerDescription(topologyDescription, serverDescription->getAddress());
}

void TopologyStateMachine::checkIfHasPrimary(TopologyDescription& topologyDescription,
                                             const ServerDescriptionPtr& serverDescription) {
    if (topologyDescription.getServers().empty()) {
        // every member was removed
        modifyTopologyType(topologyDescription, TopologyType::kUnknown);
        return;
    }

    if (topologyDescription.getPrimary()) {
        modifyTopologyType(topologyDescription, TopologyType::kReplicaSetWithPrimary);
    } else {
        modifyTopologyType(topologyDescription, TopologyType::kReplicaSetNoPrimary);
    }
}

void TopologyStateMachine::removeAndCheckIfHasPrimary(
    TopologyDescription& topologyDescription, const ServerDescriptionPtr& serverDescription) {
    removeAndStopMonitoring(topologyDescription, serverDescription);
    checkIfHasPrimary(topologyDescription, serverDescription);
}

TransitionAction TopologyStateMachine::setTopologyType(TopologyType type) {
    return [this, type](TopologyDescription& topologyDescription, const ServerDescriptionPtr&) {
        modifyTopologyType(topologyDescription, type);
    };
}

TransitionAction TopologyStateMachine::setTopologyTypeAndUpdateRSFromPrimary(TopologyType type) {
    return [this, type](TopologyDescription& topologyDescription,
                        const ServerDescriptionPtr& newServerDescription) {
        modifyTopologyType(topologyDescription, type);
        updateRSFromPrimary(topologyDescription, newServerDescription);
    };
}

TransitionAction TopologyStateMachine::setTopologyTypeAndUpdateRSWithoutPrimary(TopologyType type) {
    return [this, type](TopologyDescription& topologyDescription,
                        const ServerDescriptionPtr& newServerDescription) {
        modifyTopologyType(topologyDescription, type);
        updateRSWithoutPrimary(topologyDescription, newServerDescription);
    };
}

void TopologyStateMachine::removeServerDescription(TopologyDescription& topologyDescription,
                                                   const ServerAddress serverAddress) {
    topologyDescription.removeServerDescription(serverAddress);
    LOG(kLogLevel) << kLogPrefix << "server '" << serverAddress
                   << "' was removed from the topology.";

    const auto type = topologyDescription.getType();
    if (topologyDescription.getServers().empty() &&
        (type == TopologyType::kReplicaSetNoPrimary ||
         type == TopologyType::kReplicaSetWithPrimary)) {
        modifyTopologyType(topologyDescription, TopologyType::kUnknown);
    }
}

void TopologyStateMachine::modifyTopologyType(TopologyDescription& topologyDescription,
                                              TopologyType topologyType) {
    if (topologyDescription._type == topologyType)
        return;
    LOG(kLogLevel) << kLogPrefix << "topology type changed from " << topologyDescription._type
                   << " to " << topologyType;
    topologyDescription._type = topologyType;
}

void TopologyStateMachine::modifySetName(TopologyDescription& topologyDescription,
                                         const boost::optional<std::string>& setName) {
    topologyDescription._setName = setName;
}

void TopologyStateMachine::installServerDescription(TopologyDescription& topologyDescription,
                                                    ServerDescriptionPtr newServerDescription,
                                                    bool newServer) {
    LOG(kLogLevel + 1) << kLogPrefix << (newServer ? "add new " : "install ")
                       << "server description " << newServerDescription;
    topologyDescription.installServerDescription(newServerDescription);
}

void TopologyStateMachine::modifyMaxElectionId(TopologyDescription& topologyDescription,
                                               const OID& newMaxElectionId) {
    topologyDescription._maxElectionId = newMaxElectionId;
}

void TopologyStateMachine::modifyMaxSetVersion(TopologyDescription& topologyDescription,
                                               int newMaxSetVersion) {
    topologyDescription._maxSetVersion = newMaxSetVersion;
}
}  // namespace docdriver::sdam
