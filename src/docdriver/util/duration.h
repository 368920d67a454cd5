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

#include <chrono>
#include <cstdint>
#include <ostream>

namespace docdriver {

using Nanoseconds = std::chrono::nanoseconds;
using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;
using Minutes = std::chrono::minutes;

using std::chrono::duration_cast;

template <typename ToDuration, typename FromDuration>
int64_t durationCount(FromDuration d) {
    return static_cast<int64_t>(duration_cast<ToDuration>(d).count());
}

inline std::ostream& operator<<(std::ostream& os, Nanoseconds d) {
    return os << d.count() << "ns";
}

inline std::ostream& operator<<(std::ostream& os, Microseconds d) {
    return os << d.count() << "\xce\xbcs";
}

inline std::ostream& operator<<(std::ostream& os, Milliseconds d) {
    return os << d.count() << "ms";
}

inline std::ostream& operator<<(std::ostream& os, Seconds d) {
    return os << d.count() << "s";
}

inline std::ostream& operator<<(std::ostream& os, Minutes d) {
    return os << d.count() << "min";
}

}  // namespace docdriver
