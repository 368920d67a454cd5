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
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "docdriver/bson/oid.h"
#include "docdriver/client/sdam/sdam_configuration.h"
#include "docdriver/client/sdam/sdam_datatypes.h"
#include "docdriver/client/sdam/server_description.h"

namespace docdriver::sdam {
class TopologyDescription {
public:
    TopologyDescription() : TopologyDescription(SdamConfiguration()) {}

    /**
     * Initialize the TopologyDescription with the given configuration. Every seed becomes an
     * Unknown ServerDescription.
     */
    explicit TopologyDescription(const SdamConfiguration& config);

    /**
     * A copy keeps the topology id. The copy shares the (immutable) ServerDescriptions.
     */
    TopologyDescription(const TopologyDescription& source) = default;

    const UUID& getId() const;
    TopologyType getType() const;
    const boost::optional<std::string>& getSetName() const;

    const boost::optional<int>& getMaxSetVersion() const;
    const boost::optional<OID>& getMaxElectionId() const;

    const std::vector<ServerDescriptionPtr>& getServers() const;

    bool isWireVersionCompatible() const;
    const boost::optional<std::string>& getWireVersionCompatibleError() const;

    const boost::optional<int>& getLogicalSessionTimeoutMinutes() const;

    boost::optional<ServerDescriptionPtr> findServerByAddress(const ServerAddress& address) const;
    bool containsServerAddress(const ServerAddress& address) const;
    std::vector<ServerDescriptionPtr> findServers(
        std::function<bool(const ServerDescriptionPtr&)> predicate) const;

    /**
     * Returns the RSPrimary, if there is one.
     */
    boost::optional<ServerDescriptionPtr> getPrimary() const;

    /**
     * Adds the given ServerDescription or swaps it with an existing one using the description's
     * ServerAddress as the lookup key. If present, the previous server description is returned.
     */
    boost::optional<ServerDescriptionPtr> installServerDescription(
        const ServerDescriptionPtr& newServerDescription);
    void removeServerDescription(const ServerAddress& serverAddress);

    /**
     * True when both descriptions have the same type, setName, maxSetVersion, maxElectionId and
     * compatibility, and hold equivalent servers (see ServerDescription::isEquivalent). Round
     * trip times and update times are ignored.
     */
    bool isEquivalent(const TopologyDescription& other) const;

    std::string toString() const;

    void setType(TopologyType type);

private:

    /**
     * Checks if all server descriptions are compatible with this driver's wire version range.
     * If an incompatible description is found, the _compatible flag is set to false and an error
     * message is stored in _compatibleError. A ServerDescription which is not Unknown is
     * incompatible if:
     *  minWireVersion > serverMaxWireVersion, or maxWireVersion < serverMinWireVersion
     */
    void checkWireCompatibilityVersions();

    /**
     * The smallest logicalSessionTimeoutMinutes among data-bearing servers, or none if any of
     * them reports none.
     */
    void calculateLogicalSessionTimeout();

    // unique id for this topology
    UUID _id;

    // a TopologyType enum value.
    TopologyType _type = TopologyType::kUnknown;

    // setName: the replica set name. Default null.
    boost::optional<std::string> _setName;

    // maxSetVersion: an integer or null. The largest setVersion ever reported by a primary.
    // Default null.
    boost::optional<int> _maxSetVersion;

    // maxElectionId: an ObjectId or null. The largest electionId ever reported by a primary.
    // Default null.
    boost::optional<OID> _maxElectionId;

    // servers: a set of ServerDescription instances. Default contains one server:
    // "localhost:27017", ServerType Unknown.
    std::vector<ServerDescriptionPtr> _servers{
        std::make_shared<ServerDescription>(ServerAddress("localhost:27017"))};

    // compatible: a boolean. False if any server's wire protocol version range is incompatible with
    // the client's. Default true.
    bool _compatible = true;

    // compatibilityError: a string. The error message if "compatible" is false, otherwise null.
    boost::optional<std::string> _compatibleError;

    // logicalSessionTimeoutMinutes: integer or null. Default null.
    boost::optional<int> _logicalSessionTimeoutMinutes;

    friend class TopologyStateMachine;
};

std::ostream& operator<<(std::ostream& os, const TopologyDescription& description);
}  // namespace docdriver::sdam
