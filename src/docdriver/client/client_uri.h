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
#include <string>
#include <vector>

#include "docdriver/base/status_with.h"
#include "docdriver/client/read_preference.h"
#include "docdriver/client/sdam/sdam_configuration.h"
#include "docdriver/executor/connection_pool.h"
#include "docdriver/util/net/host_and_port.h"

namespace docdriver {

/**
 * ClientURI handles parsing of connection strings of the form
 *
 * mongodb://host1[:port1][,host2[:port2],...][/][?options]
 *
 * into the configuration of a topology: the SdamConfiguration, the options of every connection
 * pool and the default read preference. Option names are case insensitive. User credentials,
 * database names and unknown options are rejected.
 */
class ClientURI {
public:
    static StatusWith<ClientURI> parse(const std::string& url);

    const std::vector<HostAndPort>& getServers() const {
        return _servers;
    }

    const boost::optional<std::string>& getSetName() const {
        return _sdamConfiguration.getSetName();
    }

    const sdam::SdamConfiguration& getSdamConfiguration() const {
        return _sdamConfiguration;
    }

    const executor::ConnectionPool::Options& getConnectionPoolOptions() const {
        return _poolOptions;
    }

    const ReadPreferenceSetting& getReadPreferenceSetting() const {
        return _readPreference;
    }

    const std::string& toString() const {
        return _url;
    }

private:
    ClientURI(std::string url,
              std::vector<HostAndPort> servers,
              sdam::SdamConfiguration sdamConfiguration,
              executor::ConnectionPool::Options poolOptions,
              ReadPreferenceSetting readPreference)
        : _url(std::move(url)),
          _servers(std::move(servers)),
          _sdamConfiguration(std::move(sdamConfiguration)),
          _poolOptions(std::move(poolOptions)),
          _readPreference(std::move(readPreference)) {}

    static ClientURI parseImpl(const std::string& url);

    std::string _url;
    std::vector<HostAndPort> _servers;
    sdam::SdamConfiguration _sdamConfiguration;
    executor::ConnectionPool::Options _poolOptions;
    ReadPreferenceSetting _readPreference;
};

}  // namespace docdriver
