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

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/optional/optional_io.hpp>

#include "docdriver/client/sdam/sdam_test_base.h"
#include "docdriver/client/sdam/server_description.h"
#include "docdriver/client/sdam/topology_state_machine.h"
#include "docdriver/client/wire_version.h"
#include "docdriver/util/assert_util.h"

namespace docdriver::sdam {

class TopologyDescriptionTestFixture : public SdamTestFixture {
protected:
    void assertDefaultConfig(const TopologyDescription& topologyDescription);

    static std::vector<ServerAddress> addressesOf(const TopologyDescription& topologyDescription) {
        std::vector<ServerAddress> result;
        for (const auto& server : topologyDescription.getServers()) {
            result.push_back(server->getAddress());
        }
        return result;
    }

    static inline const std::vector<ServerAddress> ONE_SERVER{"foo:1234"};
    static inline const std::vector<ServerAddress> TWO_SERVERS_VARY_CASE{"FoO:1234", "BaR:1234"};
    static inline const std::vector<ServerAddress> TWO_SERVERS_NORMAL_CASE{"foo:1234", "bar:1234"};
};

void TopologyDescriptionTestFixture::assertDefaultConfig(
    const TopologyDescription& topologyDescription) {
    ASSERT_EQ(TopologyType::kUnknown, topologyDescription.getType());
    ASSERT_EQ(boost::none, topologyDescription.getSetName());
    ASSERT_EQ(boost::none, topologyDescription.getMaxElectionId());
    ASSERT_EQ(boost::none, topologyDescription.getMaxSetVersion());

    ASSERT_EQ(1u, topologyDescription.getServers().size());
    ASSERT_EQ(ServerDescription("localhost:27017"), *topologyDescription.getServers()[0]);

    ASSERT_TRUE(topologyDescription.isWireVersionCompatible());
    ASSERT_EQ(boost::none, topologyDescription.getWireVersionCompatibleError());
    ASSERT_EQ(boost::none, topologyDescription.getLogicalSessionTimeoutMinutes());
}

TEST_F(TopologyDescriptionTestFixture, ShouldHaveCorrectDefaultValues) {
    assertDefaultConfig(TopologyDescription(SdamConfiguration()));
    assertDefaultConfig(TopologyDescription());
}

TEST_F(TopologyDescriptionTestFixture, ShouldNormalizeInitialSeedList) {
    TopologyDescription topologyDescription{SdamConfiguration(TWO_SERVERS_VARY_CASE)};

    auto expectedAddresses =
        map<ServerAddress, ServerAddress>(TWO_SERVERS_VARY_CASE, [](const ServerAddress& addr) {
            return ServerAddress(boost::to_lower_copy(addr.host()), addr.port());
        });
    ASSERT_EQ(expectedAddresses, addressesOf(topologyDescription));
    ASSERT_EQ(TWO_SERVERS_NORMAL_CASE, addressesOf(topologyDescription));
}

TEST_F(TopologyDescriptionTestFixture, ShouldIgnoreDuplicateSeeds) {
    const std::vector<ServerAddress> seeds{"foo:1234", "FOO:1234", "bar:1234"};
    TopologyDescription topologyDescription{SdamConfiguration(seeds)};
    ASSERT_EQ(TWO_SERVERS_NORMAL_CASE, addressesOf(topologyDescription));
}

TEST_F(TopologyDescriptionTestFixture, ShouldAllowTypeSingleWithASingleSeed) {
    TopologyDescription topologyDescription{SdamConfiguration(ONE_SERVER, TopologyType::kSingle)};

    ASSERT_EQ(TopologyType::kSingle, topologyDescription.getType());
    ASSERT_EQ(ONE_SERVER, addressesOf(topologyDescription));
}

TEST_F(TopologyDescriptionTestFixture, DoesNotAllowMultipleSeedsWithSingle) {
    try {
        TopologyDescription topologyDescription{
            SdamConfiguration(TWO_SERVERS_NORMAL_CASE, TopologyType::kSingle)};
        FAIL() << "expected InvalidSeedList";
    } catch (const DBException& ex) {
        ASSERT_EQ(ErrorCodes::InvalidSeedList, ex.code());
    }
}

TEST_F(TopologyDescriptionTestFixture, DoesNotAllowAnEmptySeedList) {
    try {
        SdamConfiguration config(std::vector<ServerAddress>{});
        FAIL() << "expected InvalidSeedList";
    } catch (const DBException& ex) {
        ASSERT_EQ(ErrorCodes::InvalidSeedList, ex.code());
    }
}

TEST_F(TopologyDescriptionTestFixture, ShouldSetTheReplicaSetName) {
    const auto expectedSetName = std::string("baz");
    SdamConfiguration config(ONE_SERVER,
                             TopologyType::kReplicaSetNoPrimary,
                             Seconds(10),
                             SdamConfiguration::kDefaultConnectTimeoutMS,
                             SdamConfiguration::kDefaultLocalThresholdMS,
                             SdamConfiguration::kDefaultServerSelectionTimeoutMs,
                             expectedSetName);
    TopologyDescription topologyDescription(config);
    ASSERT_EQ(expectedSetName, *topologyDescription.getSetName());
}

TEST_F(TopologyDescriptionTestFixture, ShouldNotAllowTopologyTypeRSNoPrimaryWithoutSetName) {
    try {
        SdamConfiguration config(ONE_SERVER, TopologyType::kReplicaSetNoPrimary);
        FAIL() << "expected InvalidTopologyType";
    } catch (const DBException& ex) {
        ASSERT_EQ(ErrorCodes::InvalidTopologyType, ex.code());
    }
}

TEST_F(TopologyDescriptionTestFixture, ShouldOnlyAllowSingleAndRsNoPrimaryWithSetName) {
    auto topologyTypes = allTopologyTypes();
    topologyTypes.erase(std::remove_if(topologyTypes.begin(),
                                       topologyTypes.end(),
                                       [](const TopologyType& topologyType) {
                                           return topologyType == TopologyType::kSingle ||
                                               topologyType == TopologyType::kReplicaSetNoPrimary;
                                       }),
                        topologyTypes.end());

    for (const auto topologyType : topologyTypes) {
        try {
            SdamConfiguration config(ONE_SERVER,
                                     topologyType,
                                     Seconds(10),
                                     SdamConfiguration::kDefaultConnectTimeoutMS,
                                     SdamConfiguration::kDefaultLocalThresholdMS,
                                     SdamConfiguration::kDefaultServerSelectionTimeoutMs,
                                     std::string("setName"));
            FAIL() << "setName accepted for topology type " << toString(topologyType);
        } catch (const DBException& ex) {
            ASSERT_EQ(ErrorCodes::InvalidTopologyType, ex.code()) << toString(topologyType);
        }
    }
}

TEST_F(TopologyDescriptionTestFixture, ShouldDefaultHeartbeatToTenSecs) {
    SdamConfiguration config;
    ASSERT_EQ(Seconds(10), config.getHeartBeatFrequency());
    ASSERT_EQ(Milliseconds(500), config.getMinHeartbeatFrequency());
    ASSERT_EQ(Milliseconds(15), config.getLocalThreshold());
    ASSERT_EQ(Seconds(30), config.getServerSelectionTimeout());
}

TEST_F(TopologyDescriptionTestFixture, ShouldAllowSettingTheHeartbeatFrequency) {
    SdamConfiguration config(boost::none, TopologyType::kUnknown, Milliseconds(20 * 1000));
    ASSERT_EQ(Seconds(20), config.getHeartBeatFrequency());
}

TEST_F(TopologyDescriptionTestFixture, ShouldNotAllowChangingTheHeartbeatFrequencyBelow500Ms) {
    try {
        SdamConfiguration config(boost::none, TopologyType::kUnknown, Milliseconds(1));
        FAIL() << "expected InvalidHeartBeatFrequency";
    } catch (const DBException& ex) {
        ASSERT_EQ(ErrorCodes::InvalidHeartBeatFrequency, ex.code());
    }
}

TEST_F(TopologyDescriptionTestFixture, ShouldKeepTheIdOnCopy) {
    TopologyDescription topologyDescription{SdamConfiguration(ONE_SERVER)};
    TopologyDescription copy(topologyDescription);
    ASSERT_EQ(topologyDescription.getId(), copy.getId());
    ASSERT_NE(topologyDescription.getId(), TopologyDescription().getId());
}

TEST_F(TopologyDescriptionTestFixture,
       ShouldSetWireCompatibilityErrorForMinWireVersionWhenMinWireVersionIsGreater) {
    TopologyStateMachine stateMachine{SdamConfiguration(ONE_SERVER)};
    TopologyDescription topologyDescription{SdamConfiguration(ONE_SERVER)};
    const auto serverDescriptionMinVersion =
        ServerDescriptionBuilder()
            .withAddress(ONE_SERVER[0])
            .withType(ServerType::kMongos)
            .withMinWireVersion(WireVersion::LATEST_WIRE_VERSION + 1)
            .withMaxWireVersion(WireVersion::LATEST_WIRE_VERSION + 2)
            .instance();

    ASSERT_EQ(boost::none, topologyDescription.getWireVersionCompatibleError());
    stateMachine.onServerDescription(topologyDescription, serverDescriptionMinVersion);
    ASSERT_FALSE(topologyDescription.isWireVersionCompatible());
    ASSERT_NE(boost::none, topologyDescription.getWireVersionCompatibleError());
    ASSERT_NE(std::string::npos,
              topologyDescription.getWireVersionCompatibleError()->find("foo:1234"));
}

TEST_F(TopologyDescriptionTestFixture,
       ShouldSetWireCompatibilityErrorForMinWireVersionWhenMaxWireVersionIsLess) {
    TopologyStateMachine stateMachine{SdamConfiguration(ONE_SERVER)};
    TopologyDescription topologyDescription{SdamConfiguration(ONE_SERVER)};
    const auto serverDescriptionMaxVersion =
        ServerDescriptionBuilder()
            .withAddress(ONE_SERVER[0])
            .withType(ServerType::kMongos)
            .withMinWireVersion(0)
            .withMaxWireVersion(WireVersion::MIN_SUPPORTED_WIRE_VERSION - 1)
            .instance();

    ASSERT_EQ(boost::none, topologyDescription.getWireVersionCompatibleError());
    stateMachine.onServerDescription(topologyDescription, serverDescriptionMaxVersion);
    ASSERT_FALSE(topologyDescription.isWireVersionCompatible());
    ASSERT_NE(boost::none, topologyDescription.getWireVersionCompatibleError());
}

TEST_F(TopologyDescriptionTestFixture, ShouldNotSetWireCompatibilityErrorWhenServerTypeIsUnknown) {
    TopologyDescription topologyDescription{SdamConfiguration(ONE_SERVER)};
    const auto serverDescriptionMaxVersion =
        ServerDescriptionBuilder()
            .withAddress(ONE_SERVER[0])
            .withMaxWireVersion(WireVersion::MIN_SUPPORTED_WIRE_VERSION - 1)
            .instance();

    ASSERT_EQ(boost::none, topologyDescription.getWireVersionCompatibleError());
    topologyDescription.installServerDescription(serverDescriptionMaxVersion);
    ASSERT_TRUE(topologyDescription.isWireVersionCompatible());
    ASSERT_EQ(boost::none, topologyDescription.getWireVersionCompatibleError());
}

TEST_F(TopologyDescriptionTestFixture, ShouldClearWireCompatibilityErrorWhenServerIsRemoved) {
    TopologyDescription topologyDescription{SdamConfiguration(TWO_SERVERS_NORMAL_CASE)};
    topologyDescription.installServerDescription(
        ServerDescriptionBuilder()
            .withAddress(TWO_SERVERS_NORMAL_CASE[0])
            .withType(ServerType::kMongos)
            .withMinWireVersion(WireVersion::LATEST_WIRE_VERSION + 1)
            .withMaxWireVersion(WireVersion::LATEST_WIRE_VERSION + 1)
            .instance());
    ASSERT_FALSE(topologyDescription.isWireVersionCompatible());

    topologyDescription.removeServerDescription(TWO_SERVERS_NORMAL_CASE[0]);
    ASSERT_TRUE(topologyDescription.isWireVersionCompatible());
    ASSERT_EQ(boost::none, topologyDescription.getWireVersionCompatibleError());
}

TEST_F(TopologyDescriptionTestFixture, ShouldUseTheSmallestLogicalSessionTimeout) {
    TopologyDescription topologyDescription{SdamConfiguration(TWO_SERVERS_NORMAL_CASE)};
    topologyDescription.installServerDescription(ServerDescriptionBuilder()
                                                     .withAddress(TWO_SERVERS_NORMAL_CASE[0])
                                                     .withType(ServerType::kMongos)
                                                     .withLogicalSessionTimeoutMinutes(30)
                                                     .instance());
    ASSERT_EQ(30, *topologyDescription.getLogicalSessionTimeoutMinutes());

    topologyDescription.installServerDescription(ServerDescriptionBuilder()
                                                     .withAddress(TWO_SERVERS_NORMAL_CASE[1])
                                                     .withType(ServerType::kMongos)
                                                     .withLogicalSessionTimeoutMinutes(20)
                                                     .instance());
    ASSERT_EQ(20, *topologyDescription.getLogicalSessionTimeoutMinutes());
}

TEST_F(TopologyDescriptionTestFixture,
       ShouldHaveNoLogicalSessionTimeoutWhenADataBearingServerHasNone) {
    TopologyDescription topologyDescription{SdamConfiguration(TWO_SERVERS_NORMAL_CASE)};
    topologyDescription.installServerDescription(ServerDescriptionBuilder()
                                                     .withAddress(TWO_SERVERS_NORMAL_CASE[0])
                                                     .withType(ServerType::kMongos)
                                                     .withLogicalSessionTimeoutMinutes(30)
                                                     .instance());
    topologyDescription.installServerDescription(ServerDescriptionBuilder()
                                                     .withAddress(TWO_SERVERS_NORMAL_CASE[1])
                                                     .withType(ServerType::kMongos)
                                                     .instance());
    ASSERT_EQ(boost::none, topologyDescription.getLogicalSessionTimeoutMinutes());
}

TEST_F(TopologyDescriptionTestFixture, ShouldIgnoreRoundTripTimesWhenComparing) {
    TopologyDescription topologyDescription{SdamConfiguration(TWO_SERVERS_NORMAL_CASE)};
    auto mongos = ServerDescriptionBuilder()
                      .withAddress(TWO_SERVERS_NORMAL_CASE[0])
                      .withType(ServerType::kMongos)
                      .withRtt(IsMasterRTT(10))
                      .instance();
    topologyDescription.installServerDescription(mongos);

    TopologyDescription faster(topologyDescription);
    faster.installServerDescription(mongos->cloneWithRTT(IsMasterRTT(2)));
    ASSERT_TRUE(topologyDescription.isEquivalent(faster));

    TopologyDescription failed(topologyDescription);
    failed.installServerDescription(ServerDescriptionBuilder()
                                        .withAddress(TWO_SERVERS_NORMAL_CASE[0])
                                        .withError("connection refused")
                                        .instance());
    ASSERT_FALSE(topologyDescription.isEquivalent(failed));

    TopologyDescription fewer(topologyDescription);
    fewer.removeServerDescription(TWO_SERVERS_NORMAL_CASE[1]);
    ASSERT_FALSE(topologyDescription.isEquivalent(fewer));
}

TEST_F(TopologyDescriptionTestFixture, ShouldFindServersByAddressAndPredicate) {
    TopologyDescription topologyDescription{SdamConfiguration(TWO_SERVERS_NORMAL_CASE)};
    ASSERT_TRUE(topologyDescription.containsServerAddress(ServerAddress("FOO:1234")));
    ASSERT_FALSE(topologyDescription.containsServerAddress(ServerAddress("foo:1235")));
    ASSERT_EQ(boost::none, topologyDescription.getPrimary());

    auto primary = ServerDescriptionBuilder()
                       .withAddress(TWO_SERVERS_NORMAL_CASE[1])
                       .withType(ServerType::kRSPrimary)
                       .withSetName("rs0")
                       .instance();
    auto previous = topologyDescription.installServerDescription(primary);
    ASSERT_NE(boost::none, previous);
    ASSERT_EQ(ServerType::kUnknown, (*previous)->getType());

    ASSERT_EQ(primary, *topologyDescription.getPrimary());
    ASSERT_EQ(primary, *topologyDescription.findServerByAddress(TWO_SERVERS_NORMAL_CASE[1]));
    auto unknowns = topologyDescription.findServers([](const ServerDescriptionPtr& server) {
        return server->getType() == ServerType::kUnknown;
    });
    ASSERT_EQ(1u, unknowns.size());
    ASSERT_EQ(TWO_SERVERS_NORMAL_CASE[0], unknowns[0]->getAddress());
}

}  // namespace docdriver::sdam
