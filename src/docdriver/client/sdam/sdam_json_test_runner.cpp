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

#include <algorithm>
#include <boost/filesystem.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/format.hpp>
#include <boost/optional/optional_io.hpp>
#include <boost/program_options.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include "docdriver/client/client_uri.h"
#include "docdriver/client/sdam/topology_manager.h"
#include "docdriver/util/clock_source_mock.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;
namespace pt = boost::property_tree;
using namespace docdriver::sdam;

namespace docdriver::sdam {
std::string banner(const std::string text) {
    std::stringstream output;
    const auto border = std::string(text.size(), '-');
    output << border << std::endl << text << std::endl << border << std::endl;
    return output.str();
}

class ArgParser {
public:
    ArgParser(int argc, char* argv[]) {
        po::options_description optionsDescription("Arguments");
        try {
            optionsDescription.add_options()("help", "help")(
                optionName(kSourceDirOptionShort, kSourceDirOptionLong).c_str(),
                po::value<std::string>(&SourceDirectory)->default_value(kSourceDirDefault),
                "set source directory")(optionName(kFilterOptionShort, kFilterOptionLong).c_str(),
                                        po::value<std::vector<std::string>>(&TestFilters),
                                        "filter tests to run");
            po::store(po::parse_command_line(argc, argv, optionsDescription), Values);
            po::notify(Values);

            if (helpRequested()) {
                printHelpAndExit(argv[0], optionsDescription);
            }
        } catch (const boost::program_options::unknown_option& ex) {
            std::cout << "Error while parsing command-line arguments!" << std::endl
                      << ex.what() << std::endl
                      << std::endl;
            printHelpAndExit(argv[0], optionsDescription);
        }
    }

    po::variables_map Values;
    std::string SourceDirectory;
    std::vector<std::string> TestFilters;

private:
    constexpr static auto kSourceDirOptionLong = "source-dir";
    constexpr static auto kSourceDirOptionShort = "s";
    constexpr static auto kSourceDirDefault = ".";

    constexpr static auto kFilterOptionLong = "filter";
    constexpr static auto kFilterOptionShort = "f";

    std::string optionName(const char* shortName, const char* longName) {
        static auto format = boost::format("%1%,%2%");
        format % longName;
        format % shortName;
        return format.str();
    }

    bool helpRequested() {
        return Values.count("help") > 0;
    }

    void printHelpAndExit(char* programName, const po::options_description& desc) {
        std::cout << programName << ":" << std::endl << desc << std::endl;
        std::exit(1);
    }
};

// Accessors for the property tree form of a JSON document. The JSON parser keeps every scalar
// as a string, so null arrives as the string "null".
bool isNull(const pt::ptree& node) {
    return node.empty() && node.data() == "null";
}

boost::optional<const pt::ptree&> field(const pt::ptree& node, const std::string& name) {
    auto child = node.get_child_optional(pt::ptree::path_type(name, '\0'));
    if (!child || isNull(*child))
        return boost::none;
    return child;
}

boost::optional<std::string> stringField(const pt::ptree& node, const std::string& name) {
    auto child = field(node, name);
    if (!child)
        return boost::none;
    return child->data();
}

boost::optional<int64_t> numberField(const pt::ptree& node, const std::string& name) {
    auto child = field(node, name);
    if (!child)
        return boost::none;
    // {"$numberLong": "5"}
    if (auto numberLong = stringField(*child, "$numberLong"))
        return std::stoll(*numberLong);
    return std::stoll(child->data());
}

bool boolField(const pt::ptree& node, const std::string& name) {
    auto value = stringField(node, name);
    return value && (*value == "true" || *value == "1" || *value == "1.0");
}

boost::optional<OID> oidField(const pt::ptree& node, const std::string& name) {
    auto child = field(node, name);
    if (!child)
        return boost::none;
    return OID(child->get<std::string>("$oid"));
}

std::vector<std::string> stringArrayField(const pt::ptree& node, const std::string& name) {
    std::vector<std::string> result;
    if (auto child = field(node, name)) {
        for (const auto& element : *child) {
            result.push_back(element.second.data());
        }
    }
    return result;
}

IsMasterReply parseIsMasterReply(const pt::ptree& bsonIsMaster) {
    IsMasterReply reply;
    reply.ok = boolField(bsonIsMaster, "ok");
    reply.isMaster =
        boolField(bsonIsMaster, "ismaster") || boolField(bsonIsMaster, "isWritablePrimary");
    reply.secondary = boolField(bsonIsMaster, "secondary");
    reply.arbiterOnly = boolField(bsonIsMaster, "arbiterOnly");
    reply.hidden = boolField(bsonIsMaster, "hidden");
    reply.isReplicaSet = boolField(bsonIsMaster, "isreplicaset");

    reply.msg = stringField(bsonIsMaster, "msg");
    reply.setName = stringField(bsonIsMaster, "setName");
    if (auto setVersion = numberField(bsonIsMaster, "setVersion"))
        reply.setVersion = static_cast<int>(*setVersion);
    reply.electionId = oidField(bsonIsMaster, "electionId");
    reply.primary = stringField(bsonIsMaster, "primary");
    reply.me = stringField(bsonIsMaster, "me");

    reply.hosts = stringArrayField(bsonIsMaster, "hosts");
    reply.passives = stringArrayField(bsonIsMaster, "passives");
    reply.arbiters = stringArrayField(bsonIsMaster, "arbiters");
    if (auto tags = field(bsonIsMaster, "tags")) {
        for (const auto& tag : *tags) {
            reply.tags[tag.first] = tag.second.data();
        }
    }

    reply.minWireVersion =
        static_cast<int>(numberField(bsonIsMaster, "minWireVersion").value_or(0));
    reply.maxWireVersion =
        static_cast<int>(numberField(bsonIsMaster, "maxWireVersion").value_or(0));

    if (auto lstm = numberField(bsonIsMaster, "logicalSessionTimeoutMinutes"))
        reply.logicalSessionTimeoutMinutes = static_cast<int>(*lstm);

    if (auto lastWrite = field(bsonIsMaster, "lastWrite")) {
        if (auto lastWriteDate = field(*lastWrite, "lastWriteDate")) {
            reply.lastWriteDate =
                Date_t::fromMillisSinceEpoch(*numberField(*lastWriteDate, "$date"));
        }
    }

    if (auto bsonTopologyVersion = field(bsonIsMaster, "topologyVersion")) {
        TopologyVersion topologyVersion;
        topologyVersion.processId = *oidField(*bsonTopologyVersion, "processId");
        topologyVersion.counter = *numberField(*bsonTopologyVersion, "counter");
        reply.topologyVersion = topologyVersion;
    }

    reply.serviceId = oidField(bsonIsMaster, "serviceId");
    return reply;
}

// This class is responsible for parsing and executing a single 'phase' of the json test
class TestCasePhase {
public:
    TestCasePhase(int phaseNum, const pt::ptree& phase) : _phaseNum(phaseNum) {
        if (auto responses = field(phase, "responses")) {
            for (const auto& response : *responses) {
                const auto& pair = response.second;
                auto it = pair.begin();
                const auto address = it->second.data();
                const auto& bsonIsMaster = (++it)->second;

                // an empty document stands for a network error
                if (bsonIsMaster.empty()) {
                    _isMasterResponses.push_back(IsMasterOutcome(address, "network error"));
                } else {
                    _isMasterResponses.push_back(
                        IsMasterOutcome(address, parseIsMasterReply(bsonIsMaster), kLatency));
                }
            }
        }
        _topologyOutcome = phase.get_child("outcome");
    }

    // pair of error subject & error description
    using TestPhaseError = std::pair<std::string, std::string>;
    struct PhaseResult {
        bool success;
        // the vector only has items if success is false
        std::vector<TestPhaseError> errorDescriptions;
        int phaseNumber;
    };

    PhaseResult execute(TopologyManager& topology) const {
        PhaseResult testResult{true, {}, _phaseNum};

        for (const auto& response : _isMasterResponses) {
            auto descriptionStr =
                (response.getResponse()) ? response.getResponse()->toString() : "[ Network Error ]";
            std::cout << "Sending server description: " << response.getServer() << " : "
                      << descriptionStr << std::endl;
            topology.onServerDescription(response);
        }

        validateServers(topology.getTopologyDescription(),
                        _topologyOutcome.get_child("servers"),
                        testResult);
        validateTopologyDescription(
            topology.getTopologyDescription(), _topologyOutcome, testResult);

        return testResult;
    }

    int getPhaseNum() const {
        return _phaseNum;
    }

private:
    template <typename T, typename U>
    std::string errorMessageNotEqual(T expected, U actual) const {
        std::stringstream errorMessage;
        errorMessage << "expected '" << actual << "' to equal '" << expected << "'";
        return errorMessage.str();
    }

    std::string serverDescriptionFieldName(const ServerDescriptionPtr serverDescription,
                                           std::string field) const {
        std::stringstream name;
        name << "(" << serverDescription->getAddress() << ") " << field;
        return name.str();
    }

    std::string topologyDescriptionFieldName(std::string field) const {
        std::stringstream name;
        name << "(topologyDescription) " << field;
        return name.str();
    }

    template <typename T>
    void checkEqual(const std::string& subject,
                    const T& expected,
                    const T& actual,
                    PhaseResult& result) const {
        if (expected != actual) {
            result.success = false;
            result.errorDescriptions.push_back(
                std::make_pair(subject, errorMessageNotEqual(expected, actual)));
        }
    }

    static boost::optional<int> optionalInt(const pt::ptree& node, const std::string& name) {
        auto value = numberField(node, name);
        if (!value)
            return boost::none;
        return static_cast<int>(*value);
    }

    void validateServerField(const ServerDescriptionPtr& serverDescription,
                             const std::string& fieldName,
                             const pt::ptree& expectedServer,
                             PhaseResult& result) const {
        const auto subject = serverDescriptionFieldName(serverDescription, fieldName);
        if (fieldName == "type") {
            auto serverTypeParseStatus = parseServerType(expectedServer.get<std::string>("type"));
            if (!serverTypeParseStatus.isOK()) {
                result.success = false;
                result.errorDescriptions.push_back(
                    std::make_pair(subject, serverTypeParseStatus.getStatus().toString()));
                return;
            }
            checkEqual(
                subject, serverTypeParseStatus.getValue(), serverDescription->getType(), result);
        } else if (fieldName == "setName") {
            checkEqual(subject,
                       stringField(expectedServer, fieldName),
                       serverDescription->getSetName(),
                       result);
        } else if (fieldName == "setVersion") {
            checkEqual(subject,
                       optionalInt(expectedServer, fieldName),
                       serverDescription->getSetVersion(),
                       result);
        } else if (fieldName == "electionId") {
            checkEqual(subject,
                       oidField(expectedServer, fieldName),
                       serverDescription->getElectionId(),
                       result);
        } else if (fieldName == "logicalSessionTimeoutMinutes") {
            checkEqual(subject,
                       optionalInt(expectedServer, fieldName),
                       serverDescription->getLogicalSessionTimeoutMinutes(),
                       result);
        } else if (fieldName == "minWireVersion") {
            checkEqual(subject,
                       *optionalInt(expectedServer, fieldName),
                       serverDescription->getMinWireVersion(),
                       result);
        } else if (fieldName == "maxWireVersion") {
            checkEqual(subject,
                       *optionalInt(expectedServer, fieldName),
                       serverDescription->getMaxWireVersion(),
                       result);
        } else if (fieldName == "topologyVersionCounter") {
            boost::optional<int64_t> actualCounter;
            if (serverDescription->getTopologyVersion())
                actualCounter = serverDescription->getTopologyVersion()->counter;
            checkEqual(subject, numberField(expectedServer, fieldName), actualCounter, result);
        } else {
            result.success = false;
            result.errorDescriptions.push_back(
                std::make_pair(subject, "unsupported field in the expected outcome"));
        }
    }

    void validateServers(const TopologyDescriptionPtr topologyDescription,
                         const pt::ptree& bsonServers,
                         PhaseResult& result) const {
        auto actualNumServers = topologyDescription->getServers().size();
        auto expectedNumServers = bsonServers.size();

        if (actualNumServers != expectedNumServers) {
            result.success = false;
            std::stringstream errorMessage;
            errorMessage << "expected " << expectedNumServers
                         << " server(s) in topology description. actual was " << actualNumServers
                         << ": ";
            for (const auto& server : topologyDescription->getServers()) {
                errorMessage << server->getAddress() << ", ";
            }
            result.errorDescriptions.push_back(std::make_pair("servers", errorMessage.str()));
        }

        for (const auto& bsonExpectedServer : bsonServers) {
            const auto& serverAddress = bsonExpectedServer.first;
            const auto& expectedServerDescriptionFields = bsonExpectedServer.second;

            const auto serverDescription =
                topologyDescription->findServerByAddress(ServerAddress(serverAddress));
            if (serverDescription) {
                for (const auto& field : expectedServerDescriptionFields) {
                    validateServerField(
                        *serverDescription, field.first, expectedServerDescriptionFields, result);
                }
            } else {
                std::stringstream errorMessage;
                errorMessage << "could not find server '" << serverAddress
                             << "' in topology description.";
                result.errorDescriptions.push_back(std::make_pair("servers", errorMessage.str()));
                result.success = false;
            }
        }
    }

    void validateTopologyDescription(const TopologyDescriptionPtr topologyDescription,
                                     const pt::ptree& bsonTopologyDescription,
                                     PhaseResult& result) const {
        checkEqual(topologyDescriptionFieldName("topologyType"),
                   bsonTopologyDescription.get<std::string>("topologyType"),
                   toString(topologyDescription->getType()),
                   result);

        checkEqual(topologyDescriptionFieldName("setName"),
                   stringField(bsonTopologyDescription, "setName"),
                   topologyDescription->getSetName(),
                   result);

        checkEqual(topologyDescriptionFieldName("logicalSessionTimeoutMinutes"),
                   optionalInt(bsonTopologyDescription, "logicalSessionTimeoutMinutes"),
                   topologyDescription->getLogicalSessionTimeoutMinutes(),
                   result);

        if (bsonTopologyDescription.count("maxSetVersion")) {
            checkEqual(topologyDescriptionFieldName("maxSetVersion"),
                       optionalInt(bsonTopologyDescription, "maxSetVersion"),
                       topologyDescription->getMaxSetVersion(),
                       result);
        }

        if (bsonTopologyDescription.count("maxElectionId")) {
            checkEqual(topologyDescriptionFieldName("maxElectionId"),
                       oidField(bsonTopologyDescription, "maxElectionId"),
                       topologyDescription->getMaxElectionId(),
                       result);
        }

        if (bsonTopologyDescription.count("compatible")) {
            checkEqual(topologyDescriptionFieldName("compatible"),
                       boolField(bsonTopologyDescription, "compatible"),
                       topologyDescription->isWireVersionCompatible(),
                       result);
        }
    }

    // the json tests don't actually use this value.
    constexpr static auto kLatency = docdriver::Milliseconds(100);

    int _phaseNum;
    std::vector<IsMasterOutcome> _isMasterResponses;
    pt::ptree _topologyOutcome;
};

// This class is responsible for parsing and executing a single json test file.
class JsonTestCase {
public:
    JsonTestCase(fs::path testFilePath) {
        parseTest(testFilePath);
    }

    struct TestCaseResult {
        bool success;
        std::vector<TestCasePhase::PhaseResult> phaseResults;
        std::string file;
        std::string name;
    };

    TestCaseResult execute() {
        auto clockSource = std::make_unique<ClockSourceMock>();
        TopologyManager topology(_testUri->getSdamConfiguration(), clockSource.get());

        TestCaseResult result{true, {}, _testFilePath, _testName};

        for (const auto& testPhase : _testPhases) {
            std::cout << banner("Phase " + std::to_string(testPhase.getPhaseNum()));
            auto phaseResult = testPhase.execute(topology);
            result.phaseResults.push_back(phaseResult);
            result.success = result.success && phaseResult.success;
            if (!result.success) {
                std::cout << "Phase " << phaseResult.phaseNumber << " failed." << std::endl;
                break;
            }
        }

        topology.close();
        return result;
    }

    const std::string& Name() const {
        return _testName;
    }

private:
    void parseTest(fs::path testFilePath) {
        _testFilePath = testFilePath.string();

        pt::ptree jsonTest;
        {
            std::ifstream testFile(_testFilePath);
            pt::read_json(testFile, jsonTest);
        }

        _testName = jsonTest.get<std::string>("description");
        _testUri = uassertStatusOK(ClientURI::parse(jsonTest.get<std::string>("uri")));

        int phase = 0;
        for (const auto& bsonPhase : jsonTest.get_child("phases")) {
            _testPhases.push_back(TestCasePhase(phase++, bsonPhase.second));
        }
    }

    std::string _testName;
    boost::optional<ClientURI> _testUri;
    std::string _testFilePath;
    std::vector<TestCasePhase> _testPhases;
};

// This class runs (potentially) multiple json tests and reports their results.
class SdamJsonTestRunner {
public:
    SdamJsonTestRunner(std::string testDirectory, std::vector<std::string> testFilters)
        : _testFiles(scanTestFiles(testDirectory, testFilters)) {}

    std::vector<JsonTestCase::TestCaseResult> runTests() {
        std::vector<JsonTestCase::TestCaseResult> results;
        const auto testFiles = getTestFiles();
        for (const auto& jsonTest : testFiles) {
            const auto failure = [&](const std::string& name, const std::string& what) {
                std::stringstream error;
                error << "Exception while executing " << jsonTest.string() << ": " << what;
                std::string errorStr = error.str();
                results.push_back(JsonTestCase::TestCaseResult{
                    false,
                    {TestCasePhase::PhaseResult{false, {std::make_pair("exception", errorStr)}, 0}},
                    jsonTest.string(),
                    name});
                std::cerr << errorStr << std::endl;
            };

            try {
                auto testCase = JsonTestCase(jsonTest);
                std::cout << banner("Executing " + testCase.Name());
                results.push_back(testCase.execute());
            } catch (const DBException& ex) {
                failure(jsonTest.filename().string(), ex.toStatus().toString());
            } catch (const pt::ptree_error& ex) {
                failure(jsonTest.filename().string(), ex.what());
            }
        }
        return results;
    }

    int report(std::vector<JsonTestCase::TestCaseResult> results) {
        int numTestCases = results.size();
        int numSuccess = 0;
        int numFailed = 0;

        if (std::any_of(
                results.begin(), results.end(), [](const JsonTestCase::TestCaseResult& result) {
                    return !result.success;
                })) {
            std::cout << std::endl << banner("Failed Test Results");
        }

        for (const auto& result : results) {
            if (result.success) {
                ++numSuccess;
            } else {
                std::cout << banner(result.name) << "error in file: " << result.file << std::endl;
                ++numFailed;
                const auto printError = [](const TestCasePhase::TestPhaseError& error) {
                    std::cout << "\t" << error.first << ": " << error.second << std::endl;
                };
                for (const auto& phaseResult : result.phaseResults) {
                    std::cout << "Phase " << phaseResult.phaseNumber << ": " << std::endl;
                    if (!phaseResult.success)
                        for (const auto& error : phaseResult.errorDescriptions)
                            printError(error);
                }
                std::cout << std::endl;
            }
        }
        std::cout << numTestCases << " test cases; " << numSuccess << " success; " << numFailed
                  << " failed." << std::endl;

        // an empty run means the source directory is wrong
        return numTestCases == 0 ? 1 : numFailed;
    }

    const std::vector<fs::path>& getTestFiles() const {
        return _testFiles;
    }

private:
    std::vector<fs::path> scanTestFiles(std::string testDirectory,
                                        std::vector<std::string> filters) {
        std::vector<fs::path> results;
        for (const auto& entry : fs::recursive_directory_iterator(testDirectory)) {
            if (matchesFilter(entry, filters) && !fs::is_directory(entry) &&
                entry.path().extension() == ".json") {
                results.push_back(entry.path());
            }
        }
        std::sort(results.begin(), results.end());
        return results;
    }

    bool matchesFilter(const fs::directory_entry& entry, std::vector<std::string> filters) {
        if (filters.size() == 0) {
            return true;
        }

        for (const auto& filter : filters) {
            if (entry.path().filename().string().find(filter) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::vector<fs::path> _testFiles;
};
}  // namespace docdriver::sdam

int main(int argc, char* argv[]) {
    ArgParser args(argc, argv);
    SdamJsonTestRunner testRunner(args.SourceDirectory, args.TestFilters);
    return testRunner.report(testRunner.runTests());
}
