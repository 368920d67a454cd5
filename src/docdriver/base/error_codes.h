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
#include <string>

namespace docdriver {

/**
 * The set of error codes used by the driver's topology, selection and pooling layers.
 */
class ErrorCodes {
public:
    enum Error {
        OK = 0,
        InternalError = 1,
        BadValue = 2,
        HostUnreachable = 6,
        HostNotFound = 7,
        FailedToParse = 9,
        NetworkTimeout = 89,
        CallbackCanceled = 90,
        ShutdownInProgress = 91,
        ExceededTimeLimit = 262,
        IncompatibleServerVersion = 354,
        SocketException = 9001,
        InvalidSeedList = 10000,
        InvalidTopologyType = 10001,
        InvalidHeartBeatFrequency = 10002,
        ConnectionPoolExpired = 10003,
        PoolTimeout = 10004,
        ServerSelectionTimeout = 10005,
        PoolCleared = 10006,
        StaleUpdate = 10007,
        StalePrimaryDemotion = 10008,
        MaxError
    };

    static std::string errorString(Error err);

    /**
     * Connect, read and write failures. These trigger a pool clear and an immediate re-check of
     * the node they were observed on.
     */
    static bool isNetworkError(Error err);

    /**
     * Errors raised when a configuration is contradictory. These are fatal at construction.
     */
    static bool isConfigurationError(Error err);

    static bool isShutdownError(Error err);

    static bool isTimeoutError(Error err);

    static bool isCancelationError(Error err);
};

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code);

}  // namespace docdriver
