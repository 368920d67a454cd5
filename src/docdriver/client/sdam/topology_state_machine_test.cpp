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

#include "docdriver/client/sdam/topology_state_machine.h"

#include <boost/optional/optional_io.hpp>
#include <iostream>

#include "docdriver/client/sdam/sdam_test_base.h"
#include "docdriver/client/sdam/server_description.h"
#include "docdriver/client/sdam/topology_description.h"
#include "docdriver/platform/random.h"

namespace docdriver::sdam {
class TopologyStateMachineTestFixture : public SdamTestFixture {
protected:
    static inline const auto REPLICA_SET_NAME = std::string("replica_set");
    static inline const auto LOCAL_SERVER = ServerAddress("localhost:123");
    static inline const auto LOCAL_SERVER2 = ServerAddress("localhost:456");
    static inline const auto LOCAL_SERVER3 = ServerAddress("localhost:789");

    static inline const auto TWO_SEED_CONFIG =
        SdamConfiguration(std::vector<ServerAddress>{LOCAL_SERVER, LOCAL_SERVER2},
                          TopologyType::kUnknown,
                          Milliseconds(500));
    static inline const auto THREE_SEED_REPLICA_SET_CONFIG =
        SdamConfiguration(std::vector<ServerAddress>{LOCAL_SERVER, LOCAL_SERVER2, LOCAL_SERVER3},
                          TopologyType::kReplicaSetNoPrimary,
                          Milliseconds(500),
                          SdamConfiguration::kDefaultConnectTimeoutMS,
                          SdamConfiguration::kDefaultLocalThresholdMS,
                          SdamConfiguration::kDefaultServerSelectionTimeoutMs,
                          REPLICA_SET_NAME);

    static inline const auto SINGLE_CONFIG =
        SdamConfiguration(std::vector<ServerAddress>{LOCAL_SERVER}, TopologyType::kSingle);

    // Given we in 'starting' state with initial config 'initialConfig'. We receive a
    // ServerDescription with type 'incoming', and expected the ending topology state to be
    // 'ending'.
    struct TopologyTypeTestCase {
        SdamConfiguration initialConfig;
        TopologyType starting;
        ServerType incoming;
        TopologyType ending;
    };

    // This function sets up the test scenario defined by the given TopologyTypeTestCase. It
    // simulates receiving a ServerDescription, and asserts that the final topology type is in the
    // correct state.
    void assertTopologyTypeTestCase(TopologyTypeTestCase testCase) {
        TopologyStateMachine stateMachine(testCase.initialConfig);

        // setup the initial state
        TopologyDescription topologyDescription(testCase.initialConfig);
        topologyDescription.setType(testCase.starting);

        auto serverDescriptionBuilder =
            ServerDescriptionBuilder().withType(testCase.incoming).withAddress(LOCAL_SERVER);

        // update the known hosts in the ServerDescription
        if (testCase.initialConfig.getSeedList()) {
            for (auto address : *testCase.initialConfig.getSeedList()) {
                serverDescriptionBuilder.withHost(address);
            }
        }

        if (testCase.incoming == ServerType::kRSPrimary) {
            serverDescriptionBuilder.withPrimary(LOCAL_SERVER);
        }

        // set the replica set name if appropriate
        const std::vector<ServerType> replicaSetServerTypes{ServerType::kRSPrimary,
                                                            ServerType::kRSOther,
                                                            ServerType::kRSSecondary,
                                                            ServerType::kRSArbiter};
        if (std::find(replicaSetServerTypes.begin(),
                      replicaSetServerTypes.end(),
                      testCase.incoming) != replicaSetServerTypes.end()) {
            serverDescriptionBuilder.withSetName(REPLICA_SET_NAME);
        }

        const auto serverDescription = serverDescriptionBuilder.instance();

        // simulate the ServerDescription being received
        stateMachine.onServerDescription(topologyDescription, serverDescription);

        ASSERT_EQ(testCase.ending, topologyDescription.getType());
    }

    static void runTestCases(const std::vector<TopologyTypeTestCase>& testCases,
                             const std::function<void(TopologyTypeTestCase)>& runner) {
        int count = 0;
        for (const auto& testCase : testCases) {
            SCOPED_TRACE(::testing::Message()
                         << "case " << ++count << " starting TopologyType: "
                         << toString(testCase.starting)
                         << "; incoming ServerType: " << toString(testCase.incoming)
                         << "; expect ending TopologyType: " << toString(testCase.ending));
            runner(testCase);
        }
    }

    std::vector<ServerType> allServerTypesExceptPrimary() {
        auto allExceptPrimary = allServerTypes();
        allExceptPrimary.erase(
            std::remove_if(allExceptPrimary.begin(),
                           allExceptPrimary.end(),
                           [](const ServerType t) { return t == ServerType::kRSPrimary; }),
            allExceptPrimary.end());
        return allExceptPrimary;
    }

    // A primary of the three member replica set, reporting every member.
    static ServerDescriptionPtr makePrimary(const ServerAddress& address,
                                            boost::optional<OID> electionId,
                                            boost::optional<int> setVersion) {
        auto builder = ServerDescriptionBuilder()
                           .withAddress(address)
                           .withMe(address)
                           .withType(ServerType::kRSPrimary)
                           .withSetName(REPLICA_SET_NAME)
                           .withPrimary(address)
                           .withHost(LOCAL_SERVER)
                           .withHost(LOCAL_SERVER2)
                           .withHost(LOCAL_SERVER3);
        if (electionId)
            builder.withElectionId(*electionId);
        if (setVersion)
            builder.withSetVersion(*setVersion);
        return builder.instance();
    }

    static ServerDescriptionPtr makeSecondary(const ServerAddress& address) {
        return ServerDescriptionBuilder()
            .withAddress(address)
            .withMe(address)
            .withType(ServerType::kRSSecondary)
            .withSetName(REPLICA_SET_NAME)
            .withHost(LOCAL_SERVER)
            .withHost(LOCAL_SERVER2)
            .withHost(LOCAL_SERVER3)
            .instance();
    }

    static ServerType typeOf(const TopologyDescription& topologyDescription,
                             const ServerAddress& address) {
        auto server = topologyDescription.findServerByAddress(address);
        return server ? (*server)->getType() : ServerType::kUnknown;
    }

    static size_t countPrimaries(const TopologyDescription& topologyDescription) {
        return topologyDescription
            .findServers([](const ServerDescriptionPtr& server) {
                return server->getType() == ServerType::kRSPrimary;
            })
            .size();
    }
};

TEST_F(TopologyStateMachineTestFixture, ShouldInstallServerDescriptionInSingleTopology) {
    TopologyStateMachine stateMachine(SINGLE_CONFIG);
    TopologyDescription topologyDescription(SINGLE_CONFIG);

    auto updatedMeAddress = ServerAddress("foo:1234");
    auto serverDescription = ServerDescriptionBuilder()
                                 .withAddress(LOCAL_SERVER)
                                 .withMe(updatedMeAddress)
                                 .withType(ServerType::kStandalone)
                                 .instance();

    stateMachine.onServerDescription(topologyDescription, serverDescription);
    ASSERT_EQ(1u, topologyDescription.getServers().size());
    ASSERT_EQ(TopologyType::kSingle, topologyDescription.getType());

    auto result = topologyDescription.findServerByAddress(LOCAL_SERVER);
    ASSERT_TRUE(result);
    ASSERT_EQ(serverDescription, *result);
}

TEST_F(TopologyStateMachineTestFixture, ShouldMarkSingleServerUnknownOnSetNameMismatch) {
    const SdamConfiguration config(std::vector<ServerAddress>{LOCAL_SERVER},
                                   TopologyType::kSingle,
                                   Milliseconds(500),
                                   SdamConfiguration::kDefaultConnectTimeoutMS,
                                   SdamConfiguration::kDefaultLocalThresholdMS,
                                   SdamConfiguration::kDefaultServerSelectionTimeoutMs,
                                   std::string("expected"));
    TopologyStateMachine stateMachine(config);
    TopologyDescription topologyDescription(config);

    stateMachine.onServerDescription(topologyDescription,
                                     ServerDescriptionBuilder()
                                         .withAddress(LOCAL_SERVER)
                                         .withType(ServerType::kRSSecondary)
                                         .withSetName("other")
                                         .instance());

    ASSERT_EQ(TopologyType::kSingle, topologyDescription.getType());
    ASSERT_EQ(1u, topologyDescription.getServers().size());
    const auto& server = topologyDescription.getServers().front();
    ASSERT_EQ(ServerType::kUnknown, server->getType());
    ASSERT_TRUE(server->getError());
}

TEST_F(TopologyStateMachineTestFixture, ShouldMarkLoadBalancerUnknownInSingleTopology) {
    TopologyStateMachine stateMachine(SINGLE_CONFIG);
    TopologyDescription topologyDescription(SINGLE_CONFIG);

    stateMachine.onServerDescription(
        topologyDescription,
        ServerDescriptionBuilder()
            .withAddress(LOCAL_SERVER)
            .withType(ServerType::kLoadBalancer)
            .instance());

    ASSERT_EQ(ServerType::kUnknown, topologyDescription.getServers().front()->getType());
    ASSERT_TRUE(topologyDescription.getServers().front()->getError());
}

TEST_F(TopologyStateMachineTestFixture, ShouldIgnoreServersThatAreNotInTheTopology) {
    TopologyStateMachine stateMachine(TWO_SEED_CONFIG);
    TopologyDescription topologyDescription(TWO_SEED_CONFIG);

    stateMachine.onServerDescription(
        topologyDescription,
        ServerDescriptionBuilder()
            .withAddress(ServerAddress("elsewhere:1"))
            .withType(ServerType::kMongos)
            .instance());

    ASSERT_EQ(TopologyType::kUnknown, topologyDescription.getType());
    ASSERT_EQ(2u, topologyDescription.getServers().size());
    ASSERT_FALSE(topologyDescription.containsServerAddress(ServerAddress("elsewhere:1")));
}

TEST_F(TopologyStateMachineTestFixture, ShouldIgnoreRepliesInALoadBalancedTopology) {
    const SdamConfiguration config(std::vector<ServerAddress>{LOCAL_SERVER},
                                   TopologyType::kLoadBalanced);
    TopologyStateMachine stateMachine(config);
    TopologyDescription topologyDescription(config);
    const auto before = topologyDescription.getServers().front();

    stateMachine.onServerDescription(
        topologyDescription,
        ServerDescriptionBuilder()
            .withAddress(LOCAL_SERVER)
            .withType(ServerType::kMongos)
            .instance());

    ASSERT_EQ(TopologyType::kLoadBalanced, topologyDescription.getType());
    ASSERT_EQ(before, topologyDescription.getServers().front());
}

TEST_F(TopologyStateMachineTestFixture, ShouldRemoveServerDescriptionIfNotInHostsList) {
    const auto primary = (*TWO_SEED_CONFIG.getSeedList()).front();

    TopologyStateMachine stateMachine(TWO_SEED_CONFIG);
    TopologyDescription topologyDescription(TWO_SEED_CONFIG);

    auto serverDescription = ServerDescriptionBuilder()
                                 .withAddress(primary)
                                 .withType(ServerType::kRSPrimary)
                                 .withSetName(REPLICA_SET_NAME)
                                 .withPrimary(primary)
                                 .withHost(primary)
                                 .instance();

    ASSERT_EQ(2u, topologyDescription.getServers().size());
    stateMachine.onServerDescription(topologyDescription, serverDescription);
    ASSERT_EQ(1u, topologyDescription.getServers().size());
    ASSERT_EQ(serverDescription, topologyDescription.getServers().front());
    ASSERT_EQ(REPLICA_SET_NAME, *topologyDescription.getSetName());
}

TEST_F(TopologyStateMachineTestFixture,
       ShouldRemoveNonPrimaryServerWhenTopologyIsReplicaSetNoPrimaryAndMeDoesntMatchAddress) {
    const auto serverAddress = LOCAL_SERVER;
    const auto me = ServerAddress("foo" + serverAddress.host(), serverAddress.port());

    TopologyStateMachine stateMachine(THREE_SEED_REPLICA_SET_CONFIG);
    TopologyDescription topologyDescription(THREE_SEED_REPLICA_SET_CONFIG);

    auto serverDescription = ServerDescriptionBuilder()
                                 .withAddress(serverAddress)
                                 .withMe(me)
                                 .withSetName(REPLICA_SET_NAME)
                                 .withType(ServerType::kRSSecondary)
                                 .instance();

    ASSERT_EQ(3u, topologyDescription.getServers().size());
    stateMachine.onServerDescription(topologyDescription, serverDescription);
    ASSERT_EQ(2u, topologyDescription.getServers().size());
    ASSERT_FALSE(topologyDescription.containsServerAddress(serverAddress));
    ASSERT_EQ(TopologyType::kReplicaSetNoPrimary, topologyDescription.getType());
}

TEST_F(TopologyStateMachineTestFixture, ShouldRemoveMemberOfADifferentReplicaSet) {
    TopologyStateMachine stateMachine(THREE_SEED_REPLICA_SET_CONFIG);
    TopologyDescription topologyDescription(THREE_SEED_REPLICA_SET_CONFIG);

    stateMachine.onServerDescription(topologyDescription,
                                     ServerDescriptionBuilder()
                                         .withAddress(LOCAL_SERVER2)
                                         .withType(ServerType::kRSPrimary)
                                         .withSetName("another_set")
                                         .withHost(LOCAL_SERVER2)
                                         .instance());

    ASSERT_FALSE(topologyDescription.containsServerAddress(LOCAL_SERVER2));
    ASSERT_EQ(TopologyType::kReplicaSetNoPrimary, topologyDescription.getType());
    ASSERT_EQ(REPLICA_SET_NAME, *topologyDescription.getSetName());
}

TEST_F(TopologyStateMachineTestFixture,
       ShouldAddServerDescriptionIfInHostsListButNotInTopologyDescription) {
    const auto primary = (*TWO_SEED_CONFIG.getSeedList()).front();
    const auto secondary = (*TWO_SEED_CONFIG.getSeedList()).back();
    const auto newHost = ServerAddress("newhost:123");

    TopologyStateMachine stateMachine(TWO_SEED_CONFIG);
    TopologyDescription topologyDescription(TWO_SEED_CONFIG);

    auto serverDescription = ServerDescriptionBuilder()
                                 .withAddress(primary)
                                 .withType(ServerType::kRSPrimary)
                                 .withSetName(REPLICA_SET_NAME)
                                 .withPrimary(primary)
                                 .withHost(primary)
                                 .withHost(secondary)
                                 .withHost(newHost)
                                 .instance();

    ASSERT_EQ(2u, topologyDescription.getServers().size());
    stateMachine.onServerDescription(topologyDescription, serverDescription);
    ASSERT_EQ(3u, topologyDescription.getServers().size());

    auto newHostResult = topologyDescription.findServerByAddress(newHost);
    ASSERT_TRUE(newHostResult);
    ASSERT_EQ(newHost, (*newHostResult)->getAddress());
    ASSERT_EQ(ServerType::kUnknown, (*newHostResult)->getType());
}

TEST_F(TopologyStateMachineTestFixture, ShouldSaveNewMaxSetVersion) {
    TopologyDescription topologyDescription(THREE_SEED_REPLICA_SET_CONFIG);
    TopologyStateMachine stateMachine(THREE_SEED_REPLICA_SET_CONFIG);

    stateMachine.onServerDescription(topologyDescription,
                                     makePrimary(LOCAL_SERVER, boost::none, 100));
    ASSERT_EQ(100, topologyDescription.getMaxSetVersion());

    stateMachine.onServerDescription(topologyDescription,
                                     makePrimary(LOCAL_SERVER, boost::none, 200));
    ASSERT_EQ(200, topologyDescription.getMaxSetVersion());
}

TEST_F(TopologyStateMachineTestFixture, ShouldSaveNewMaxElectionId) {
    TopologyDescription topologyDescription(THREE_SEED_REPLICA_SET_CONFIG);
    TopologyStateMachine stateMachine(THREE_SEED_REPLICA_SET_CONFIG);

    const OID oidOne(std::string("000000000000000000000001"));
    const OID oidTwo(std::string("000000000000000000000002"));

    stateMachine.onServerDescription(topologyDescription, makePrimary(LOCAL_SERVER, oidOne, 1));
    ASSERT_EQ(oidOne, topologyDescription.getMaxElectionId());

    stateMachine.onServerDescription(topologyDescription, makePrimary(LOCAL_SERVER, oidTwo, 1));
    ASSERT_EQ(oidTwo, topologyDescription.getMaxElectionId());
}

TEST_F(TopologyStateMachineTestFixture, ShouldMarkPrimaryWithOlderElectionIdAsUnknown) {
    TopologyDescription topologyDescription(THREE_SEED_REPLICA_SET_CONFIG);
    TopologyStateMachine stateMachine(THREE_SEED_REPLICA_SET_CONFIG);

    stateMachine.onServerDescription(topologyDescription,
                                     makePrimary(LOCAL_SERVER, OID::fromCounter(5), 1));
    ASSERT_EQ(TopologyType::kReplicaSetWithPrimary, topologyDescription.getType());

    stateMachine.onServerDescription(topologyDescription,
                                     makePrimary(LOCAL_SERVER2, OID::fromCounter(3), 1));

    ASSERT_EQ(ServerType::kRSPrimary, typeOf(topologyDescription, LOCAL_SERVER));
    const auto stale = *topologyDescription.findServerByAddress(LOCAL_SERVER2);
    ASSERT_EQ(ServerType::kUnknown, stale->getType());
    ASSERT_TRUE(stale->getError());
    ASSERT_EQ(OID::fromCounter(5), *topologyDescription.getMaxElectionId());
    ASSERT_EQ(TopologyType::kReplicaSetWithPrimary, topologyDescription.getType());
}

TEST_F(TopologyStateMachineTestFixture, ShouldCompareElectionIdBeforeSetVersion) {
    TopologyDescription topologyDescription(THREE_SEED_REPLICA_SET_CONFIG);
    TopologyStateMachine stateMachine(THREE_SEED_REPLICA_SET_CONFIG);

    stateMachine.onServerDescription(topologyDescription,
                                     makePrimary(LOCAL_SERVER, OID::fromCounter(1), 5));
    // A newer election wins even with a smaller setVersion.
    stateMachine.onServerDescription(topologyDescription,
                                     makePrimary(LOCAL_SERVER2, OID::fromCounter(2), 1));

    ASSERT_EQ(ServerType::kUnknown, typeOf(topologyDescription, LOCAL_SERVER));
    ASSERT_EQ(ServerType::kRSPrimary, typeOf(topologyDescription, LOCAL_SERVER2));
    ASSERT_EQ(OID::fromCounter(2), *topologyDescription.getMaxElectionId());
    ASSERT_EQ(1, *topologyDescription.getMaxSetVersion());

    // The old primary reporting again is stale.
    stateMachine.onServerDescription(topologyDescription,
                                     makePrimary(LOCAL_SERVER, OID::fromCounter(1), 5));
    ASSERT_EQ(ServerType::kUnknown, typeOf(topologyDescription, LOCAL_SERVER));
    ASSERT_EQ(ServerType::kRSPrimary, typeOf(topologyDescription, LOCAL_SERVER2));
}

TEST_F(TopologyStateMachineTestFixture, ShouldDemotePreviousPrimaryOnNewElection) {
    TopologyDescription topologyDescription(THREE_SEED_REPLICA_SET_CONFIG);
    TopologyStateMachine stateMachine(THREE_SEED_REPLICA_SET_CONFIG);

    stateMachine.onServerDescription(topologyDescription,
                                     makePrimary(LOCAL_SERVER, OID::fromCounter(1), 1));
    stateMachine.onServerDescription(topologyDescription, makeSecondary(LOCAL_SERVER2));
    stateMachine.onServerDescription(topologyDescription,
                                     makePrimary(LOCAL_SERVER3, OID::fromCounter(2), 1));

    ASSERT_EQ(ServerType::kUnknown, typeOf(topologyDescription, LOCAL_SERVER));
    ASSERT_EQ(ServerType::kRSSecondary, typeOf(topologyDescription, LOCAL_SERVER2));
    ASSERT_EQ(ServerType::kRSPrimary, typeOf(topologyDescription, LOCAL_SERVER3));
    ASSERT_EQ(1u, countPrimaries(topologyDescription));
}

TEST_F(TopologyStateMachineTestFixture, ShouldReachTheSameStateRegardlessOfArrivalOrder) {
    const std::vector<ServerDescriptionPtr> descriptions{
        makePrimary(LOCAL_SERVER, OID::fromCounter(2), 1),
        makeSecondary(LOCAL_SERVER2),
        makePrimary(LOCAL_SERVER3, OID::fromCounter(1), 1)};

    std::vector<std::vector<size_t>> orders{
        {0, 1, 2}, {0, 2, 1}, {1, 0, 2}, {1, 2, 0}, {2, 0, 1}, {2, 1, 0}};
    for (const auto& order : orders) {
        TopologyDescription topologyDescription(THREE_SEED_REPLICA_SET_CONFIG);
        TopologyStateMachine stateMachine(THREE_SEED_REPLICA_SET_CONFIG);
        for (auto index : order) {
            stateMachine.onServerDescription(topologyDescription, descriptions[index]);
        }

        SCOPED_TRACE(::testing::Message() << "order " << order[0] << order[1] << order[2]);
        ASSERT_EQ(TopologyType::kReplicaSetWithPrimary, topologyDescription.getType());
        ASSERT_EQ(ServerType::kRSPrimary, typeOf(topologyDescription, LOCAL_SERVER));
        ASSERT_EQ(ServerType::kRSSecondary, typeOf(topologyDescription, LOCAL_SERVER2));
        ASSERT_EQ(ServerType::kUnknown, typeOf(topologyDescription, LOCAL_SERVER3));
        ASSERT_EQ(OID::fromCounter(2), *topologyDescription.getMaxElectionId());
    }
}

TEST_F(TopologyStateMachineTestFixture, ShouldNeverHaveMoreThanOnePrimary) {
    PseudoRandom random(1234);
    const std::vector<ServerAddress> members{LOCAL_SERVER, LOCAL_SERVER2, LOCAL_SERVER3};

    for (int round = 0; round < 50; ++round) {
        TopologyDescription topologyDescription(THREE_SEED_REPLICA_SET_CONFIG);
        TopologyStateMachine stateMachine(THREE_SEED_REPLICA_SET_CONFIG);

        for (int step = 0; step < 40; ++step) {
            const auto& address =
                members[random.nextInt32(static_cast<int32_t>(members.size()))];
            ServerDescriptionPtr description;
            switch (random.nextInt32(3)) {
                case 0:
                    description = makePrimary(address,
                                              OID::fromCounter(1 + random.nextInt32(4)),
                                              1 + random.nextInt32(3));
                    break;
                case 1:
                    description = makeSecondary(address);
                    break;
                default:
                    description = std::make_shared<ServerDescription>(address);
                    break;
            }
            stateMachine.onServerDescription(topologyDescription, description);

            ASSERT_LE(countPrimaries(topologyDescription), 1u);
            const auto hasPrimary = countPrimaries(topologyDescription) == 1;
            ASSERT_EQ(hasPrimary ? TopologyType::kReplicaSetWithPrimary
                                 : TopologyType::kReplicaSetNoPrimary,
                      topologyDescription.getType());
        }
    }
}

// The following two tests (ShouldNotUpdateToplogyType, ShouldUpdateToCorrectToplogyType) assert
// that the topology type is correct given an initial state and a ServerType.

TEST_F(TopologyStateMachineTestFixture, ShouldNotUpdateToplogyType) {
    using T = TopologyTypeTestCase;

    // test cases that should not change TopologyType
    std::vector<TopologyTypeTestCase> testCases{
        T{TWO_SEED_CONFIG, TopologyType::kUnknown, ServerType::kUnknown, TopologyType::kUnknown},
        T{TWO_SEED_CONFIG, TopologyType::kUnknown, ServerType::kStandalone, TopologyType::kUnknown},
        T{TWO_SEED_CONFIG, TopologyType::kUnknown, ServerType::kRSGhost, TopologyType::kUnknown},
        T{TWO_SEED_CONFIG,
          TopologyType::kUnknown,
          ServerType::kLoadBalancer,
          TopologyType::kUnknown},
        T{TWO_SEED_CONFIG,
          TopologyType::kReplicaSetNoPrimary,
          ServerType::kUnknown,
          TopologyType::kReplicaSetNoPrimary},
    };
    for (auto serverType : allServerTypes()) {
        testCases.push_back(
            T{TWO_SEED_CONFIG, TopologyType::kSharded, serverType, TopologyType::kSharded});
    }

    const auto& allExceptPrimary = allServerTypesExceptPrimary();
    for (auto serverType : allExceptPrimary) {
        testCases.push_back(T{TWO_SEED_CONFIG,
                              TopologyType::kReplicaSetNoPrimary,
                              serverType,
                              TopologyType::kReplicaSetNoPrimary});
    }

    runTestCases(testCases, [this](TopologyTypeTestCase testCase) {
        assertTopologyTypeTestCase(testCase);
    });
}

TEST_F(TopologyStateMachineTestFixture, ShouldUpdateToCorrectToplogyType) {
    using T = TopologyTypeTestCase;

    // test cases that should change TopologyType
    const std::vector<TopologyTypeTestCase> testCases{
        T{TWO_SEED_CONFIG, TopologyType::kUnknown, ServerType::kMongos, TopologyType::kSharded},
        T{TWO_SEED_CONFIG,
          TopologyType::kUnknown,
          ServerType::kRSPrimary,
          TopologyType::kReplicaSetWithPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kUnknown,
          ServerType::kRSSecondary,
          TopologyType::kReplicaSetNoPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kUnknown,
          ServerType::kRSArbiter,
          TopologyType::kReplicaSetNoPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kUnknown,
          ServerType::kRSOther,
          TopologyType::kReplicaSetNoPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kReplicaSetNoPrimary,
          ServerType::kRSPrimary,
          TopologyType::kReplicaSetWithPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kReplicaSetWithPrimary,
          ServerType::kUnknown,
          TopologyType::kReplicaSetNoPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kReplicaSetWithPrimary,
          ServerType::kStandalone,
          TopologyType::kReplicaSetNoPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kReplicaSetWithPrimary,
          ServerType::kMongos,
          TopologyType::kReplicaSetNoPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kReplicaSetWithPrimary,
          ServerType::kLoadBalancer,
          TopologyType::kReplicaSetNoPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kReplicaSetWithPrimary,
          ServerType::kRSPrimary,
          TopologyType::kReplicaSetWithPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kReplicaSetWithPrimary,
          ServerType::kRSSecondary,
          TopologyType::kReplicaSetNoPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kReplicaSetWithPrimary,
          ServerType::kRSOther,
          TopologyType::kReplicaSetNoPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kReplicaSetWithPrimary,
          ServerType::kRSArbiter,
          TopologyType::kReplicaSetNoPrimary},
        T{TWO_SEED_CONFIG,
          TopologyType::kReplicaSetWithPrimary,
          ServerType::kRSGhost,
          TopologyType::kReplicaSetNoPrimary}};

    runTestCases(testCases, [this](TopologyTypeTestCase testCase) {
        assertTopologyTypeTestCase(testCase);
    });
}
}  // namespace docdriver::sdam
