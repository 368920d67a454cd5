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

#include "docdriver/client/sdam/server_selector.h"

#include <algorithm>
#include <iterator>

#include "docdriver/util/assert_util.h"
#include "docdriver/util/log.h"
#include "docdriver/util/time_support.h"

namespace docdriver::sdam {
namespace {
bool isWritable(const ServerDescriptionPtr& server) {
    switch (server->getType()) {
        case ServerType::kRSPrimary:
        case ServerType::kStandalone:
        case ServerType::kMongos:
        case ServerType::kLoadBalancer:
            return true;
        default:
            return false;
    }
}

bool isType(const ServerDescriptionPtr& server, ServerType type) {
    return server->getType() == type;
}
}  // namespace

ServerSelector::~ServerSelector() {}

const ReadPreferenceSetting& SelectionCriteria::getReadPreference() const {
    invariant(_readPreference);
    return *_readPreference;
}

std::string SelectionCriteria::toString() const {
    return isWrite() ? std::string("{ writable: true }") : _readPreference->toString();
}

SdamServerSelector::SdamServerSelector(const ServerSelectionConfiguration& config)
    : _config(config), _random(Date_t::now().toMillisSinceEpoch()) {}

boost::optional<std::vector<ServerDescriptionPtr>> SdamServerSelector::selectServers(
    const TopologyDescriptionPtr topologyDescription, const SelectionCriteria& criteria) {
    // If the topology wire version is invalid, raise an error
    if (!topologyDescription->isWireVersionCompatible()) {
        uasserted(ErrorCodes::IncompatibleServerVersion,
                  *topologyDescription->getWireVersionCompatibleError());
    }

    if (!criteria.isWrite()) {
        uassertStatusOK(
            criteria.getReadPreference().validate(_config.getHeartBeatFrequencyMs()));
    }

    if (topologyDescription->getType() == TopologyType::kUnknown) {
        return boost::none;
    }

    auto candidateServers = _getCandidateServers(topologyDescription, criteria);
    if (candidateServers.empty()) {
        return boost::none;
    }
    return candidateServers;
}

std::vector<ServerDescriptionPtr> SdamServerSelector::_getCandidateServers(
    const TopologyDescriptionPtr& topologyDescription, const SelectionCriteria& criteria) {
    switch (topologyDescription->getType()) {
        case TopologyType::kSingle:
            return topologyDescription->findServers([&](const ServerDescriptionPtr& s) {
                return !isType(s, ServerType::kUnknown) && (!criteria.isWrite() || isWritable(s));
            });
        case TopologyType::kSharded:
            return topologyDescription->findServers(
                [](const ServerDescriptionPtr& s) { return isType(s, ServerType::kMongos); });
        case TopologyType::kLoadBalanced:
            return topologyDescription->findServers([](const ServerDescriptionPtr& s) {
                return isType(s, ServerType::kLoadBalancer);
            });
        case TopologyType::kReplicaSetNoPrimary:
        case TopologyType::kReplicaSetWithPrimary:
            if (criteria.isWrite()) {
                return topologyDescription->findServers([](const ServerDescriptionPtr& s) {
                    return isType(s, ServerType::kRSPrimary);
                });
            }
            return _getReplicaSetCandidates(topologyDescription, criteria.getReadPreference());
        case TopologyType::kUnknown:
            return {};
    }
    DOCDRIVER_UNREACHABLE;
}

std::vector<ServerDescriptionPtr> SdamServerSelector::_getReplicaSetCandidates(
    const TopologyDescriptionPtr& topologyDescription, const ReadPreferenceSetting& readPref) {
    const auto isRecent = _recencyFilter(topologyDescription, readPref);

    auto primaries = [&]() {
        return topologyDescription->findServers(
            [](const ServerDescriptionPtr& s) { return isType(s, ServerType::kRSPrimary); });
    };

    auto secondaries = [&]() {
        auto result = topologyDescription->findServers([&](const ServerDescriptionPtr& s) {
            return isType(s, ServerType::kRSSecondary) && isRecent(s);
        });
        filterTags(&result, readPref.tags);
        return result;
    };

    switch (readPref.pref) {
        case ReadPreference::PrimaryOnly:
            return primaries();
        case ReadPreference::PrimaryPreferred: {
            auto result = primaries();
            return result.empty() ? secondaries() : result;
        }
        case ReadPreference::SecondaryOnly:
            return secondaries();
        case ReadPreference::SecondaryPreferred: {
            auto result = secondaries();
            return result.empty() ? primaries() : result;
        }
        case ReadPreference::Nearest: {
            auto result = topologyDescription->findServers([&](const ServerDescriptionPtr& s) {
                return (isType(s, ServerType::kRSPrimary) ||
                        isType(s, ServerType::kRSSecondary)) &&
                    isRecent(s);
            });
            filterTags(&result, readPref.tags);
            return result;
        }
    }
    DOCDRIVER_UNREACHABLE;
}

SdamServerSelector::ServerPredicate SdamServerSelector::_recencyFilter(
    const TopologyDescriptionPtr& topologyDescription,
    const ReadPreferenceSetting& readPref) const {
    if (readPref.maxStalenessSeconds.count() == 0) {
        return [](const ServerDescriptionPtr&) { return true; };
    }

    return [this, topologyDescription, maxStaleness = readPref.maxStalenessSeconds](
               const ServerDescriptionPtr& s) {
        return calculateStaleness(topologyDescription, s) <= maxStaleness;
    };
}

// staleness for a ServerDescription is defined as:
//   with a primary:    (S.lastUpdateTime - S.lastWriteDate) - (P.lastUpdateTime - P.lastWriteDate)
//                      + heartbeatFrequencyMS
//   without a primary: SMax.lastWriteDate - S.lastWriteDate + heartbeatFrequencyMS
Milliseconds SdamServerSelector::calculateStaleness(
    const TopologyDescriptionPtr& topologyDescription,
    const ServerDescriptionPtr& serverDescription) const {
    if (serverDescription->getType() != ServerType::kRSSecondary)
        return Milliseconds(0);

    const auto heartbeatFrequency = _config.getHeartBeatFrequencyMs();
    if (!serverDescription->getLastWriteDate())
        return heartbeatFrequency;

    const Date_t& lastWriteDate = *serverDescription->getLastWriteDate();

    if (topologyDescription->getType() == TopologyType::kReplicaSetWithPrimary) {
        auto maybePrimaryDescription = topologyDescription->getPrimary();
        invariant(maybePrimaryDescription);
        auto& primaryDescription = *maybePrimaryDescription;

        const auto primaryLag = primaryDescription->getLastWriteDate()
            ? primaryDescription->getLastUpdateTime() - *primaryDescription->getLastWriteDate()
            : Milliseconds(0);

        return (serverDescription->getLastUpdateTime() - lastWriteDate) - primaryLag +
            heartbeatFrequency;
    } else if (topologyDescription->getType() == TopologyType::kReplicaSetNoPrimary) {
        Date_t maxLastWriteDate = Date_t::min();

        // identify secondary with max last write date.
        for (const auto& s : topologyDescription->getServers()) {
            if (s->getType() != ServerType::kRSSecondary || !s->getLastWriteDate())
                continue;
            if (*s->getLastWriteDate() > maxLastWriteDate) {
                maxLastWriteDate = *s->getLastWriteDate();
            }
        }

        return (maxLastWriteDate - lastWriteDate) + heartbeatFrequency;
    } else {
        // Not a replica set
        return Milliseconds(0);
    }
}

void SdamServerSelector::filterTags(std::vector<ServerDescriptionPtr>* servers,
                                    const TagSet& tagSet) {
    const auto& tagDocuments = tagSet.getTags();

    // an empty list of tag documents places no restriction on the servers.
    if (tagDocuments.empty())
        return;

    for (const auto& tags : tagDocuments) {
        std::vector<ServerDescriptionPtr> matching;
        std::copy_if(servers->begin(),
                     servers->end(),
                     std::back_inserter(matching),
                     [&](const ServerDescriptionPtr& s) { return _containsAllTags(s, tags); });
        if (!matching.empty()) {
            *servers = std::move(matching);
            return;
        }
    }
    servers->clear();
}

bool SdamServerSelector::_containsAllTags(const ServerDescriptionPtr& server,
                                          const TagSet::Tags& tags) const {
    const auto& serverTags = server->getTags();
    return std::all_of(tags.begin(), tags.end(), [&](const auto& tag) {
        auto it = serverTags.find(tag.first);
        return it != serverTags.end() && it->second == tag.second;
    });
}

ServerDescriptionPtr SdamServerSelector::_randomSelect(
    const std::vector<ServerDescriptionPtr>& servers) const {
    invariant(!servers.empty());
    std::lock_guard<std::mutex> lk(_randomMutex);
    return servers[_random.nextInt64(static_cast<int64_t>(servers.size()))];
}

boost::optional<ServerDescriptionPtr> SdamServerSelector::selectServer(
    const TopologyDescriptionPtr topologyDescription, const SelectionCriteria& criteria) {
    auto servers = selectServers(topologyDescription, criteria);
    if (!servers)
        return boost::none;

    ServerDescriptionPtr minServer =
        *std::min_element(servers->begin(), servers->end(), LatencyWindow::rttCompareFn);

    auto latencyWindow =
        LatencyWindow(LatencyWindow::rttOf(minServer), _config.getLocalThresholdMs());
    latencyWindow.filterServers(&(*servers));

    auto selected = _randomSelect(*servers);
    LOG(3) << "selected " << selected->getAddress() << " for " << criteria.toString() << " from "
           << servers->size() << " server(s) in the latency window";
    return selected;
}

bool LatencyWindow::isWithinWindow(IsMasterRTT latency) const {
    return latency == lower || (lower <= latency && latency < upper);
}

void LatencyWindow::filterServers(std::vector<ServerDescriptionPtr>* servers) const {
    servers->erase(std::remove_if(servers->begin(),
                                  servers->end(),
                                  [&](const ServerDescriptionPtr& s) {
                                      return !this->isWithinWindow(rttOf(s));
                                  }),
                   servers->end());
}
}  // namespace docdriver::sdam
