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

#include "docdriver/base/error_codes.h"

#include <ostream>

namespace docdriver {

std::string ErrorCodes::errorString(Error err) {
    switch (err) {
        case OK:
            return "OK";
        case InternalError:
            return "InternalError";
        case BadValue:
            return "BadValue";
        case HostUnreachable:
            return "HostUnreachable";
        case HostNotFound:
            return "HostNotFound";
        case FailedToParse:
            return "FailedToParse";
        case NetworkTimeout:
            return "NetworkTimeout";
        case CallbackCanceled:
            return "CallbackCanceled";
        case ShutdownInProgress:
            return "ShutdownInProgress";
        case ExceededTimeLimit:
            return "ExceededTimeLimit";
        case IncompatibleServerVersion:
            return "IncompatibleServerVersion";
        case SocketException:
            return "SocketException";
        case InvalidSeedList:
            return "InvalidSeedList";
        case InvalidTopologyType:
            return "InvalidTopologyType";
        case InvalidHeartBeatFrequency:
            return "InvalidHeartBeatFrequency";
        case ConnectionPoolExpired:
            return "ConnectionPoolExpired";
        case PoolTimeout:
            return "PoolTimeout";
        case ServerSelectionTimeout:
            return "ServerSelectionTimeout";
        case PoolCleared:
            return "PoolCleared";
        case StaleUpdate:
            return "StaleUpdate";
        case StalePrimaryDemotion:
            return "StalePrimaryDemotion";
        default:
            return "Location" + std::to_string(int(err));
    }
}

bool ErrorCodes::isNetworkError(Error err) {
    switch (err) {
        case HostUnreachable:
        case HostNotFound:
        case NetworkTimeout:
        case SocketException:
            return true;
        default:
            return false;
    }
}

bool ErrorCodes::isConfigurationError(Error err) {
    switch (err) {
        case InvalidSeedList:
        case InvalidTopologyType:
        case InvalidHeartBeatFrequency:
            return true;
        default:
            return false;
    }
}

bool ErrorCodes::isShutdownError(Error err) {
    return err == ShutdownInProgress;
}

bool ErrorCodes::isTimeoutError(Error err) {
    switch (err) {
        case NetworkTimeout:
        case ExceededTimeLimit:
        case PoolTimeout:
        case ServerSelectionTimeout:
            return true;
        default:
            return false;
    }
}

bool ErrorCodes::isCancelationError(Error err) {
    return err == CallbackCanceled || err == ShutdownInProgress;
}

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code) {
    return stream << ErrorCodes::errorString(code);
}

}  // namespace docdriver
