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

#define DOCDRIVER_LOG_DEFAULT_COMPONENT ::docdriver::logger::LogComponent::kDefault

#include "docdriver/util/assert_util.h"

#include <cstdlib>
#include <iostream>

#include "docdriver/util/log.h"

namespace docdriver {

DBException::DBException(Status status) : _status(std::move(status)), _what(_status.toString()) {}

void uasserted(ErrorCodes::Error code, const std::string& msg) {
    uassertedWithStatus(Status(code, msg));
}

void uassertedWithStatus(const Status& status) {
    LOG(1) << "User Assertion: " << status;
    throw DBException(status);
}

void invariantFailed(const char* expr, const char* file, unsigned line) noexcept {
    LOG_SEVERE() << "Invariant failure " << expr << " " << file << " " << line;
    std::cerr << "\n\n***aborting after invariant() failure\n\n" << std::endl;
    std::abort();
}

void invariantFailedWithMsg(const char* expr,
                            const std::string& msg,
                            const char* file,
                            unsigned line) noexcept {
    LOG_SEVERE() << "Invariant failure " << expr << " Message: " << msg << " " << file << " "
                 << line;
    std::cerr << "\n\n***aborting after invariant() failure\n\n" << std::endl;
    std::abort();
}

Status exceptionToStatus() noexcept {
    try {
        throw;
    } catch (const DBException& ex) {
        return ex.toStatus();
    } catch (const std::exception& ex) {
        return Status(ErrorCodes::InternalError,
                      std::string("Caught std::exception: ") + ex.what());
    }
}

}  // namespace docdriver
