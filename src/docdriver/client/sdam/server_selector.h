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
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "docdriver/client/read_preference.h"
#include "docdriver/client/sdam/sdam_configuration.h"
#include "docdriver/client/sdam/sdam_datatypes.h"
#include "docdriver/client/sdam/server_description.h"
#include "docdriver/client/sdam/topology_description.h"
#include "docdriver/platform/random.h"

namespace docdriver::sdam {
/**
 * What an operation needs from a server: either a writable server, or a server that satisfies a
 * read preference.
 */
class SelectionCriteria {
public:
    static SelectionCriteria forWrite() {
        return SelectionCriteria(boost::none);
    }

    static SelectionCriteria forRead(ReadPreferenceSetting readPreference) {
        return SelectionCriteria(std::move(readPreference));
    }

    bool isWrite() const {
        return !_readPreference;
    }

    /**
     * Only valid for read criteria.
     */
    const ReadPreferenceSetting& getReadPreference() const;

    std::string toString() const;

private:
    explicit SelectionCriteria(boost::optional<ReadPreferenceSetting> readPreference)
        : _readPreference(std::move(readPreference)) {}

    boost::optional<ReadPreferenceSetting> _readPreference;
};

/**
 * This is the interface that allows one to select a server to satisfy a DB operation given a
 * TopologyDescription and a SelectionCriteria.
 *
 * This is exposed as an interface so that tests can feel free to use their own version of the
 * server selection algorithm if necessary.
 */
class ServerSelector {
public:
    /**
     * Finds a list of candidate servers according to the SelectionCriteria. Throws a
     * DBException with code IncompatibleServerVersion if the topology contains a server this
     * driver cannot talk to, and BadValue if the read preference is invalid.
     */
    virtual boost::optional<std::vector<ServerDescriptionPtr>> selectServers(
        const TopologyDescriptionPtr topologyDescription, const SelectionCriteria& criteria) = 0;

    /**
     * Select a single server according to the SelectionCriteria and latency of the
     * ServerDescription(s). The server is chosen randomly from those that are within the
     * latency window.
     */
    virtual boost::optional<ServerDescriptionPtr> selectServer(
        const TopologyDescriptionPtr topologyDescription, const SelectionCriteria& criteria) = 0;

    virtual ~ServerSelector();
};
using ServerSelectorPtr = std::unique_ptr<ServerSelector>;

class SdamServerSelector : public ServerSelector {
public:
    explicit SdamServerSelector(const ServerSelectionConfiguration& config);

    boost::optional<std::vector<ServerDescriptionPtr>> selectServers(
        const TopologyDescriptionPtr topologyDescription,
        const SelectionCriteria& criteria) override;

    boost::optional<ServerDescriptionPtr> selectServer(
        const TopologyDescriptionPtr topologyDescription,
        const SelectionCriteria& criteria) override;

    // remove servers that do not match the TagSet
    void filterTags(std::vector<ServerDescriptionPtr>* servers, const TagSet& tagSet);

    /**
     * Estimated replication lag of a secondary. Zero for every other server type.
     */
    Milliseconds calculateStaleness(const TopologyDescriptionPtr& topologyDescription,
                                    const ServerDescriptionPtr& serverDescription) const;

private:
    std::vector<ServerDescriptionPtr> _getCandidateServers(
        const TopologyDescriptionPtr& topologyDescription, const SelectionCriteria& criteria);

    std::vector<ServerDescriptionPtr> _getReplicaSetCandidates(
        const TopologyDescriptionPtr& topologyDescription, const ReadPreferenceSetting& readPref);

    bool _containsAllTags(const ServerDescriptionPtr& server, const TagSet::Tags& tags) const;

    ServerDescriptionPtr _randomSelect(const std::vector<ServerDescriptionPtr>& servers) const;

    using ServerPredicate = std::function<bool(const ServerDescriptionPtr&)>;

    // true for servers whose staleness is within the read preference's bound
    ServerPredicate _recencyFilter(const TopologyDescriptionPtr& topologyDescription,
                                   const ReadPreferenceSetting& readPref) const;

    ServerSelectionConfiguration _config;

    mutable std::mutex _randomMutex;
    mutable PseudoRandom _random;
};

struct LatencyWindow {
    IsMasterRTT lower;
    IsMasterRTT upper;

    LatencyWindow(const IsMasterRTT lowerBound, const IsMasterRTT windowWidth)
        : lower(lowerBound), upper(lowerBound + windowWidth) {}

    /**
     * The lower bound is always inside the window; anything else must be strictly below the
     * upper bound.
     */
    bool isWithinWindow(IsMasterRTT latency) const;

    // remove servers not in the latency window in-place.
    void filterServers(std::vector<ServerDescriptionPtr>* servers) const;

    // servers without a round trip time count as 0ms
    static IsMasterRTT rttOf(const ServerDescriptionPtr& server) {
        return server->getRtt().value_or(IsMasterRTT(0));
    }

    static bool rttCompareFn(const ServerDescriptionPtr& a, const ServerDescriptionPtr& b) {
        return rttOf(a) < rttOf(b);
    }
};
}  // namespace docdriver::sdam
