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

#include "docdriver/client/client_uri.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <limits>
#include <map>
#include <utility>

#include "docdriver/util/assert_util.h"

namespace docdriver {
namespace {

const std::string kURIPrefix = "mongodb://";

/**
 * Splits a string into exactly 2 pieces at the first occurrence of 'c'.
 */
std::pair<std::string, std::string> partitionForward(const std::string& str, const char c) {
    const auto delim = str.find(c);
    if (delim == std::string::npos) {
        return {str, std::string()};
    }
    return {str.substr(0, delim), str.substr(delim + 1)};
}

long long parseNonNegativeInteger(const std::string& key, const std::string& value) {
    uassert(ErrorCodes::FailedToParse,
            "Value for option '" + key + "' must be a non-negative integer, got '" + value + "'",
            !value.empty());

    long long result = 0;
    for (char c : value) {
        uassert(ErrorCodes::FailedToParse,
                "Value for option '" + key + "' must be a non-negative integer, got '" + value +
                    "'",
                c >= '0' && c <= '9');
        uassert(ErrorCodes::FailedToParse,
                "Value for option '" + key + "' is out of range: " + value,
                result <= (std::numeric_limits<int>::max() - (c - '0')) / 10);
        result = result * 10 + (c - '0');
    }
    return result;
}

bool parseBoolean(const std::string& key, const std::string& value) {
    if (boost::iequals(value, "true"))
        return true;
    if (boost::iequals(value, "false"))
        return false;
    uasserted(ErrorCodes::FailedToParse,
              "Value for option '" + key + "' must be 'true' or 'false', got '" + value + "'");
}

/**
 * Parses one readPreferenceTags value, "k1:v1,k2:v2". An empty value matches any node.
 */
TagSet::Tags parseTags(const std::string& value) {
    TagSet::Tags tags;
    if (value.empty())
        return tags;

    std::vector<std::string> pairs;
    boost::algorithm::split(pairs, value, boost::is_any_of(","));
    for (const auto& pair : pairs) {
        const auto kv = partitionForward(pair, ':');
        uassert(ErrorCodes::FailedToParse,
                "readPreferenceTags must be a list of key:value pairs, got '" + value + "'",
                !kv.first.empty() && pair.find(':') != std::string::npos);
        tags[kv.first] = kv.second;
    }
    return tags;
}

/**
 * Breakout method for parsing option pairs, foo=bar&baz=qux&...
 *
 * Keys are lower cased. Every option keeps each of its values in order, so repeatable options
 * such as readPreferenceTags can be read back in full.
 */
std::map<std::string, std::vector<std::string>> parseOptions(const std::string& options,
                                                             const std::string& url) {
    std::map<std::string, std::vector<std::string>> ret;
    if (options.empty()) {
        return ret;
    }

    uassert(ErrorCodes::FailedToParse,
            "URI Cannot Contain multiple questions marks for mongodb:// URL: " + url,
            options.find('?') == std::string::npos);

    std::vector<std::string> opts;
    boost::algorithm::split(opts, options, boost::is_any_of("&"));
    for (const auto& opt : opts) {
        uassert(ErrorCodes::FailedToParse,
                "Missing a key/value pair in the options for mongodb:// URL: " + url,
                !opt.empty());

        const auto kvPair = partitionForward(opt, '=');
        uassert(ErrorCodes::FailedToParse,
                "Missing a key for key/value pair in the options for mongodb:// URL: " + url,
                !kvPair.first.empty());

        const auto key = boost::algorithm::to_lower_copy(kvPair.first);
        uassert(ErrorCodes::FailedToParse,
                "Missing value for key '" + kvPair.first +
                    "' in the options for mongodb:// URL: " + url,
                !kvPair.second.empty() || key == "readpreferencetags");

        ret[key].push_back(kvPair.second);
    }

    return ret;
}

}  // namespace

StatusWith<ClientURI> ClientURI::parse(const std::string& url) try {
    return parseImpl(url);
} catch (const DBException& e) {
    return e.toStatus();
}

ClientURI ClientURI::parseImpl(const std::string& url) {
    // 1. Validate and remove the scheme prefix
    uassert(ErrorCodes::FailedToParse,
            "URI must begin with " + kURIPrefix + ": " + url,
            boost::starts_with(url, kURIPrefix));
    const auto uriWithoutPrefix = url.substr(kURIPrefix.size());

    // 2. Split the host identifiers from the options. The slash before the options is optional.
    const auto hostsAndOptions = partitionForward(uriWithoutPrefix, '?');
    auto hostIdentifiers = hostsAndOptions.first;
    const auto slash = hostIdentifiers.find('/');
    if (slash != std::string::npos) {
        uassert(ErrorCodes::FailedToParse,
                "Database names are not supported in mongodb:// URL: " + url,
                slash + 1 == hostIdentifiers.size());
        hostIdentifiers.resize(slash);
    }

    uassert(ErrorCodes::FailedToParse,
            "User credentials are not supported in mongodb:// URL: " + url,
            hostIdentifiers.find('@') == std::string::npos);

    // 3. Split and validate the host identifiers
    std::vector<std::string> hosts;
    boost::algorithm::split(hosts, hostIdentifiers, boost::is_any_of(","));
    std::vector<HostAndPort> servers;
    for (const auto& host : hosts) {
        if (host.empty()) {
            continue;
        }
        servers.push_back(uassertStatusOK(HostAndPort::parse(host)));
    }
    uassert(ErrorCodes::FailedToParse, "No server(s) specified", !servers.empty());

    // 4. Interpret the options
    const auto options = parseOptions(hostsAndOptions.second, url);

    boost::optional<std::string> setName;
    bool directConnection = false;
    bool loadBalanced = false;
    auto heartbeatFrequency = sdam::SdamConfiguration::kDefaultHeartbeatFrequencyMs;
    auto serverSelectionTimeout = sdam::SdamConfiguration::kDefaultServerSelectionTimeoutMs;
    auto localThreshold = sdam::SdamConfiguration::kDefaultLocalThresholdMS;
    auto connectTimeout = sdam::SdamConfiguration::kDefaultConnectTimeoutMS;
    auto monitoringMode = sdam::ServerMonitoringMode::kAuto;
    executor::ConnectionPool::Options poolOptions;
    auto readPreference = ReadPreference::PrimaryOnly;
    std::vector<TagSet::Tags> tags;
    Seconds maxStaleness{0};

    for (const auto& option : options) {
        const auto& key = option.first;
        const auto& value = option.second.back();

        if (key == "replicaset") {
            setName = value;
        } else if (key == "directconnection") {
            directConnection = parseBoolean(key, value);
        } else if (key == "loadbalanced") {
            loadBalanced = parseBoolean(key, value);
        } else if (key == "heartbeatfrequencyms") {
            heartbeatFrequency = Milliseconds(parseNonNegativeInteger(key, value));
        } else if (key == "serverselectiontimeoutms") {
            serverSelectionTimeout = Milliseconds(parseNonNegativeInteger(key, value));
        } else if (key == "localthresholdms") {
            localThreshold = Milliseconds(parseNonNegativeInteger(key, value));
        } else if (key == "connecttimeoutms") {
            connectTimeout = Milliseconds(parseNonNegativeInteger(key, value));
        } else if (key == "servermonitoringmode") {
            monitoringMode = uassertStatusOK(sdam::parseServerMonitoringMode(value));
        } else if (key == "maxpoolsize") {
            poolOptions.maxPoolSize = parseNonNegativeInteger(key, value);
        } else if (key == "minpoolsize") {
            poolOptions.minPoolSize = parseNonNegativeInteger(key, value);
        } else if (key == "maxidletimems") {
            const auto maxIdleTime = parseNonNegativeInteger(key, value);
            if (maxIdleTime > 0)
                poolOptions.maxIdleTime = Milliseconds(maxIdleTime);
        } else if (key == "waitqueuetimeoutms") {
            poolOptions.waitQueueTimeout = Milliseconds(parseNonNegativeInteger(key, value));
        } else if (key == "readpreference") {
            readPreference = uassertStatusOK(parseReadPreferenceMode(value));
        } else if (key == "readpreferencetags") {
            for (const auto& tagDocument : option.second) {
                tags.push_back(parseTags(tagDocument));
            }
        } else if (key == "maxstalenessseconds") {
            // -1 means no bound.
            if (value != "-1")
                maxStaleness = Seconds(parseNonNegativeInteger(key, value));
        } else {
            uasserted(ErrorCodes::FailedToParse,
                      "Unsupported option '" + key + "' in mongodb:// URL: " + url);
        }
    }
    poolOptions.connectTimeout = connectTimeout;
    poolOptions.validate();

    // 5. Derive the initial topology type
    auto initialType = sdam::TopologyType::kUnknown;
    if (loadBalanced) {
        uassert(ErrorCodes::InvalidTopologyType,
                "loadBalanced cannot be combined with directConnection",
                !directConnection);
        initialType = sdam::TopologyType::kLoadBalanced;
    } else if (directConnection) {
        initialType = sdam::TopologyType::kSingle;
    } else if (setName) {
        initialType = sdam::TopologyType::kReplicaSetNoPrimary;
    }

    sdam::SdamConfiguration sdamConfiguration(servers,
                                              initialType,
                                              heartbeatFrequency,
                                              connectTimeout,
                                              localThreshold,
                                              serverSelectionTimeout,
                                              setName,
                                              monitoringMode);

    ReadPreferenceSetting readPreferenceSetting = tags.empty()
        ? ReadPreferenceSetting(readPreference, maxStaleness)
        : ReadPreferenceSetting(readPreference, TagSet(std::move(tags)), maxStaleness);
    uassertStatusOK(readPreferenceSetting.validate(heartbeatFrequency));

    return ClientURI(url,
                     std::move(servers),
                     std::move(sdamConfiguration),
                     std::move(poolOptions),
                     std::move(readPreferenceSetting));
}

}  // namespace docdriver
