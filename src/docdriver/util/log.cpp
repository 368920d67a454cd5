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

#include "docdriver/util/log.h"

#include <atomic>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <iostream>
#include <mutex>
#include <ostream>

namespace docdriver {
namespace logger {
namespace {

constexpr int kUnsetSeverity = -100;
constexpr auto kNumComponents = static_cast<size_t>(LogComponent::kNumLogComponents);

std::atomic<int> minimumSeverity{LogSeverity::Log().toInt()};  // NOLINT

// Indexed by LogComponent.
std::atomic<int> componentSeverities[kNumComponents] = {  // NOLINT
    {kUnsetSeverity},
    {kUnsetSeverity},
    {kUnsetSeverity},
    {kUnsetSeverity}};

void formatRecord(const boost::log::record_view& rec, boost::log::formatting_ostream& strm) {
    if (auto timestamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
        strm << boost::posix_time::to_iso_extended_string(*timestamp) << ' ';
    }
    if (auto severity = boost::log::extract<LogSeverity>("Severity", rec)) {
        strm << severity->toString() << ' ';
    }
    if (auto component = boost::log::extract<LogComponent>("Channel", rec)) {
        strm << '[' << toString(*component) << "] ";
    }
    if (auto message = boost::log::extract<std::string>("Message", rec)) {
        strm << *message;
    }
}

}  // namespace

std::string toString(LogComponent component) {
    switch (component) {
        case LogComponent::kDefault:
            return "default";
        case LogComponent::kNetwork:
            return "network";
        case LogComponent::kConnectionPool:
            return "connectionPool";
        case LogComponent::kTopology:
            return "topology";
        default:
            return "unknown";
    }
}

std::ostream& operator<<(std::ostream& os, LogComponent component) {
    return os << toString(component);
}

std::string LogSeverity::toString() const {
    switch (_severity) {
        case -4:
            return "F";
        case -3:
            return "E";
        case -2:
            return "W";
        case -1:
        case 0:
            return "I";
        default:
            return "D" + std::to_string(_severity);
    }
}

std::ostream& operator<<(std::ostream& os, LogSeverity severity) {
    return os << severity.toString();
}

bool shouldLog(LogComponent component, LogSeverity severity) {
    auto componentSeverity = componentSeverities[static_cast<size_t>(component)].load();
    auto threshold = (componentSeverity == kUnsetSeverity) ? minimumSeverity.load()
                                                           : componentSeverity;
    return severity.toInt() <= threshold;
}

void setMinimumLoggedSeverity(LogSeverity severity) {
    minimumSeverity.store(severity.toInt());
}

void setComponentSeverity(LogComponent component, LogSeverity severity) {
    componentSeverities[static_cast<size_t>(component)].store(severity.toInt());
}

void clearComponentSeverity(LogComponent component) {
    componentSeverities[static_cast<size_t>(component)].store(kUnsetSeverity);
}

void initializeLogging() {
    static std::once_flag initialized;
    std::call_once(initialized, [] {
        boost::log::add_common_attributes();
        auto sink = boost::log::add_console_log(std::clog);
        sink->set_formatter(&formatRecord);
        sink->locked_backend()->auto_flush(true);
    });
}

}  // namespace logger
}  // namespace docdriver
