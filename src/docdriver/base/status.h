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

#include <iosfwd>
#include <memory>
#include <string>

#include "docdriver/base/error_codes.h"
#include "docdriver/base/error_extra_info.h"

namespace docdriver {

/**
 * Status represents an error state or the absence thereof.
 *
 * A Status uses the standardized error codes from ErrorCodes, a context dependent reason string
 * and, optionally, code specific extra info (a subclass of ErrorExtraInfo).
 */
class [[nodiscard]] Status {
public:
    static Status OK() {
        return Status();
    }

    Status(ErrorCodes::Error code, std::string reason);

    /**
     * Builds a Status with a subclass of ErrorExtraInfo. The code is taken from the extra info.
     */
    template <typename Extra>
    Status(std::shared_ptr<const Extra> extra, std::string reason)
        : Status(Extra::code, std::move(reason), std::shared_ptr<const ErrorExtraInfo>(extra)) {}

    Status withContext(const std::string& reasonPrefix) const;

    bool isOK() const {
        return !_error;
    }

    ErrorCodes::Error code() const {
        return _error ? _error->code : ErrorCodes::OK;
    }

    std::string codeString() const {
        return ErrorCodes::errorString(code());
    }

    /** Returns the reason string or the empty string if isOK(). */
    const std::string& reason() const;

    std::shared_ptr<const ErrorExtraInfo> extraInfo() const {
        return isOK() ? nullptr : _error->extra;
    }

    /** Returns a specific subclass of ErrorExtraInfo if the error code matches that type. */
    template <typename T>
    std::shared_ptr<const T> extraInfo() const {
        if (isOK() || code() != T::code)
            return nullptr;
        return std::dynamic_pointer_cast<const T>(_error->extra);
    }

    std::string toString() const;

    /** Only compares codes. Ignores reason strings. */
    bool operator==(const Status& other) const {
        return code() == other.code();
    }
    bool operator!=(const Status& other) const {
        return !(*this == other);
    }
    bool operator==(ErrorCodes::Error other) const {
        return code() == other;
    }
    bool operator!=(ErrorCodes::Error other) const {
        return !(*this == other);
    }

private:
    Status() = default;

    Status(ErrorCodes::Error code,
           std::string reason,
           std::shared_ptr<const ErrorExtraInfo> extra);

    struct ErrorInfo {
        ErrorCodes::Error code;
        std::string reason;
        std::shared_ptr<const ErrorExtraInfo> extra;
    };

    std::shared_ptr<const ErrorInfo> _error;
};

std::ostream& operator<<(std::ostream& os, const Status& status);

}  // namespace docdriver
