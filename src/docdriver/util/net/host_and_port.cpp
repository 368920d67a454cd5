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

#include "docdriver/util/net/host_and_port.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/functional/hash.hpp>
#include <ostream>
#include <tuple>

namespace docdriver {
namespace {

StatusWith<int> parsePort(const std::string& text, const std::string& whole) {
    if (text.empty()) {
        return Status(ErrorCodes::FailedToParse, "Empty port number in \"" + whole + "\"");
    }
    int port = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return Status(ErrorCodes::FailedToParse,
                          "Port number must be numeric, got \"" + text + "\" in \"" + whole +
                              "\"");
        }
        port = port * 10 + (c - '0');
        if (port > 65535) {
            break;
        }
    }
    if (port <= 0 || port > 65535) {
        return Status(ErrorCodes::FailedToParse,
                      "Port number " + text + " out of range parsing HostAndPort from \"" +
                          whole + "\"");
    }
    return port;
}

}  // namespace

StatusWith<HostAndPort> HostAndPort::parse(const std::string& text) {
    std::string host;
    std::string portPart;
    bool hasPort = false;

    if (!text.empty() && text[0] == '[') {
        auto close = text.find(']');
        if (close == std::string::npos) {
            return Status(ErrorCodes::FailedToParse,
                          "Missing closing bracket parsing HostAndPort from \"" + text + "\"");
        }
        host = text.substr(1, close - 1);
        if (close + 1 < text.size()) {
            if (text[close + 1] != ':') {
                return Status(ErrorCodes::FailedToParse,
                              "Extraneous characters after ']' in \"" + text + "\"");
            }
            portPart = text.substr(close + 2);
            hasPort = true;
        }
    } else {
        auto colon = text.rfind(':');
        if (colon != std::string::npos && text.find(':') != colon) {
            // More than one colon without brackets: a bare IPv6 literal with no port.
            host = text;
        } else if (colon != std::string::npos) {
            host = text.substr(0, colon);
            portPart = text.substr(colon + 1);
            hasPort = true;
        } else {
            host = text;
        }
    }

    if (host.empty()) {
        return Status(ErrorCodes::FailedToParse,
                      "Empty host component parsing HostAndPort from \"" + text + "\"");
    }

    if (!hasPort) {
        return HostAndPort(host, -1);
    }

    auto swPort = parsePort(portPart, text);
    if (!swPort.isOK()) {
        return swPort.getStatus();
    }
    return HostAndPort(host, swPort.getValue());
}

HostAndPort::HostAndPort(const std::string& text) {
    *this = uassertStatusOK(parse(text));
}

HostAndPort::HostAndPort(const char* text) : HostAndPort(std::string(text)) {}

HostAndPort::HostAndPort(const std::string& host, int port)
    : _host(boost::algorithm::to_lower_copy(host)), _port(port) {}

bool HostAndPort::operator<(const HostAndPort& r) const {
    return std::forward_as_tuple(_host, port()) < std::forward_as_tuple(r._host, r.port());
}

bool HostAndPort::operator==(const HostAndPort& r) const {
    return _host == r._host && port() == r.port();
}

std::string HostAndPort::toString() const {
    std::string out;
    if (_host.find(':') != std::string::npos) {
        out = "[" + _host + "]";
    } else {
        out = _host;
    }
    return out + ":" + std::to_string(port());
}

std::ostream& operator<<(std::ostream& os, const HostAndPort& hp) {
    return os << hp.toString();
}

}  // namespace docdriver

namespace std {
size_t hash<docdriver::HostAndPort>::operator()(const docdriver::HostAndPort& host) const {
    size_t seed = 0;
    boost::hash_combine(seed, host.host());
    boost::hash_combine(seed, host.port());
    return seed;
}
}  // namespace std
