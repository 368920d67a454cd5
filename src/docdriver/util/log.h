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

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <iosfwd>
#include <string>

namespace docdriver {
namespace logger {

/**
 * Log components partition the log output so that verbosity can be set per subsystem.
 */
enum class LogComponent { kDefault, kNetwork, kConnectionPool, kTopology, kNumLogComponents };

std::string toString(LogComponent component);
std::ostream& operator<<(std::ostream& os, LogComponent component);

/**
 * Severity of a log record. Lower integer values are more severe; zero is the plain "Log" level
 * and positive values are debug levels.
 */
class LogSeverity {
public:
    LogSeverity() : _severity(0) {}

    static LogSeverity Severe() {
        return LogSeverity(-4);
    }
    static LogSeverity Error() {
        return LogSeverity(-3);
    }
    static LogSeverity Warning() {
        return LogSeverity(-2);
    }
    static LogSeverity Info() {
        return LogSeverity(-1);
    }
    static LogSeverity Log() {
        return LogSeverity(0);
    }
    static LogSeverity Debug(int debugLevel) {
        return LogSeverity(debugLevel);
    }

    int toInt() const {
        return _severity;
    }

    LogSeverity lessSevere() const {
        return LogSeverity(_severity + 1);
    }

    LogSeverity moreSevere() const {
        return LogSeverity(_severity - 1);
    }

    std::string toString() const;

    bool operator==(LogSeverity other) const {
        return _severity == other._severity;
    }
    bool operator!=(LogSeverity other) const {
        return _severity != other._severity;
    }

private:
    template <typename BaseT, typename LevelT>
    friend class boost::log::sources::basic_severity_logger;

    explicit LogSeverity(int severity) : _severity(severity) {}

    int _severity;
};

std::ostream& operator<<(std::ostream& os, LogSeverity severity);

using LoggerType = boost::log::sources::severity_channel_logger_mt<LogSeverity, LogComponent>;

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(GlobalLogger, LoggerType)

/**
 * Returns true if a record of the given severity for the given component would be emitted.
 */
bool shouldLog(LogComponent component, LogSeverity severity);

void setMinimumLoggedSeverity(LogSeverity severity);
void setComponentSeverity(LogComponent component, LogSeverity severity);
void clearComponentSeverity(LogComponent component);

/**
 * Installs the console sink and its formatter. Safe to call more than once.
 */
void initializeLogging();

}  // namespace logger
}  // namespace docdriver

#ifndef DOCDRIVER_LOG_DEFAULT_COMPONENT
#define DOCDRIVER_LOG_DEFAULT_COMPONENT ::docdriver::logger::LogComponent::kDefault
#endif

#define DOCDRIVER_LOG_COMPONENT_SEVERITY(COMPONENT, SEVERITY)                    \
    if (!::docdriver::logger::shouldLog((COMPONENT), (SEVERITY))) {             \
    } else                                                                      \
        BOOST_LOG_CHANNEL_SEV(                                                  \
            ::docdriver::logger::GlobalLogger::get(), (COMPONENT), (SEVERITY))

#define LOG(DLEVEL)                                            \
    DOCDRIVER_LOG_COMPONENT_SEVERITY(DOCDRIVER_LOG_DEFAULT_COMPONENT, \
                                     ::docdriver::logger::LogSeverity::Debug(DLEVEL))

#define LOG_INFO()                                             \
    DOCDRIVER_LOG_COMPONENT_SEVERITY(DOCDRIVER_LOG_DEFAULT_COMPONENT, \
                                     ::docdriver::logger::LogSeverity::Info())

#define LOG_WARNING()                                          \
    DOCDRIVER_LOG_COMPONENT_SEVERITY(DOCDRIVER_LOG_DEFAULT_COMPONENT, \
                                     ::docdriver::logger::LogSeverity::Warning())

#define LOG_ERROR()                                            \
    DOCDRIVER_LOG_COMPONENT_SEVERITY(DOCDRIVER_LOG_DEFAULT_COMPONENT, \
                                     ::docdriver::logger::LogSeverity::Error())

#define LOG_SEVERE()                                           \
    DOCDRIVER_LOG_COMPONENT_SEVERITY(DOCDRIVER_LOG_DEFAULT_COMPONENT, \
                                     ::docdriver::logger::LogSeverity::Severe())
