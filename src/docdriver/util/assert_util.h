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

#include <exception>
#include <string>

#include "docdriver/base/status.h"

namespace docdriver {

template <typename T>
class StatusWith;

/**
 * The exception type thrown by uassert and friends. It carries a full Status, including any
 * ErrorExtraInfo attached to it.
 */
class DBException : public std::exception {
public:
    explicit DBException(Status status);

    const char* what() const noexcept override {
        return _what.c_str();
    }

    ErrorCodes::Error code() const {
        return _status.code();
    }

    const std::string& reason() const {
        return _status.reason();
    }

    const Status& toStatus() const {
        return _status;
    }

private:
    Status _status;
    std::string _what;
};

[[noreturn]] void uasserted(ErrorCodes::Error code, const std::string& msg);
[[noreturn]] void uassertedWithStatus(const Status& status);

inline void uassertStatusOK(const Status& status) {
    if (!status.isOK()) {
        uassertedWithStatus(status);
    }
}

template <typename T>
T uassertStatusOK(StatusWith<T> sw) {
    uassertStatusOK(sw.getStatus());
    return std::move(sw.getValue());
}

[[noreturn]] void invariantFailed(const char* expr, const char* file, unsigned line) noexcept;
[[noreturn]] void invariantFailedWithMsg(const char* expr,
                                         const std::string& msg,
                                         const char* file,
                                         unsigned line) noexcept;

/**
 * Converts the exception currently being handled into a Status. Must be called from a catch
 * block.
 */
Status exceptionToStatus() noexcept;

}  // namespace docdriver

#define DOCDRIVER_uassert(code, msg, expr)              \
    do {                                                \
        if (!(expr)) {                                  \
            ::docdriver::uasserted((code), (msg));      \
        }                                               \
    } while (false)
#define uassert DOCDRIVER_uassert

#define DOCDRIVER_invariant(expr)                                            \
    do {                                                                     \
        if (!(expr)) {                                                       \
            ::docdriver::invariantFailed(#expr, __FILE__, __LINE__);         \
        }                                                                    \
    } while (false)
#define invariant DOCDRIVER_invariant

#define DOCDRIVER_UNREACHABLE \
    ::docdriver::invariantFailed("Hit a DOCDRIVER_UNREACHABLE!", __FILE__, __LINE__)
