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

#include "docdriver/client/wire_version.h"

namespace docdriver {

const char* minimumRequiredServerVersionString(int wireVersion) {
    switch (wireVersion) {
        case RELEASE_2_4_AND_BEFORE:
            return "1.0";
        case SUPPORTS_OP_MSG:
            return "3.6";
        case REPLICA_SET_TRANSACTIONS:
            return "4.0";
        case SHARDED_TRANSACTIONS:
            return "4.2";
        case STREAMABLE_IS_MASTER:
            return "4.4";
        case WIRE_VERSION_47:
            return "4.7";
        case WIRE_VERSION_50:
            return "5.0";
        case WIRE_VERSION_60:
            return "6.0";
        case WIRE_VERSION_70:
            return "7.0";
        default:
            return "UNKNOWN";
    }
}

}  // namespace docdriver
