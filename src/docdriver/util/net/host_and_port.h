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

#include <functional>
#include <iosfwd>
#include <string>

#include "docdriver/base/status_with.h"

namespace docdriver {

/**
 * Name of a process on the network.
 *
 * The host portion is normalized to lower case on construction, and a missing port defaults to
 * 27017. Two HostAndPorts compare equal when both host and port match after normalization.
 */
class HostAndPort {
public:
    static constexpr int kDefaultPort = 27017;

    /**
     * Parses a HostAndPort from its "host[:port]" or "[ipv6]:port" string form.
     */
    static StatusWith<HostAndPort> parse(const std::string& text);

    /**
     * Constructs an empty HostAndPort.
     */
    HostAndPort() = default;

    /**
     * Constructs a HostAndPort by parsing "text". Throws DBException(FailedToParse) on malformed
     * input.
     */
    HostAndPort(const std::string& text);  // NOLINT
    HostAndPort(const char* text);         // NOLINT

    HostAndPort(const std::string& host, int port);

    bool operator<(const HostAndPort& r) const;
    bool operator==(const HostAndPort& r) const;
    bool operator!=(const HostAndPort& r) const {
        return !(*this == r);
    }

    bool empty() const {
        return _host.empty() && _port < 0;
    }

    const std::string& host() const {
        return _host;
    }

    int port() const {
        return (_port < 0) ? kDefaultPort : _port;
    }

    bool hasPort() const {
        return _port >= 0;
    }

    /**
     * Returns "host:port", bracketing IPv6 literals.
     */
    std::string toString() const;

private:
    std::string _host;
    int _port = -1;
};

std::ostream& operator<<(std::ostream& os, const HostAndPort& hp);

}  // namespace docdriver

namespace std {
template <>
struct hash<docdriver::HostAndPort> {
    size_t operator()(const docdriver::HostAndPort& host) const;
};
}  // namespace std
