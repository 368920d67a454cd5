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
#include <iosfwd>
#include <limits>
#include <string>

#include "docdriver/util/duration.h"

namespace docdriver {

/**
 * Representation of a point in time, with millisecond resolution, measured from the Unix epoch.
 */
class Date_t {
public:
    static Date_t now();

    static Date_t fromMillisSinceEpoch(int64_t millis) {
        return Date_t(millis);
    }

    static Date_t fromDurationSinceEpoch(Milliseconds d) {
        return Date_t(d.count());
    }

    static constexpr Date_t min() {
        return Date_t(std::numeric_limits<int64_t>::min());
    }

    static constexpr Date_t max() {
        return Date_t(std::numeric_limits<int64_t>::max());
    }

    constexpr Date_t() = default;

    int64_t toMillisSinceEpoch() const {
        return _millis;
    }

    Milliseconds toDurationSinceEpoch() const {
        return Milliseconds(_millis);
    }

    std::chrono::system_clock::time_point toSystemTimePoint() const;

    std::string toString() const;

    Date_t& operator+=(Milliseconds d) {
        _millis += d.count();
        return *this;
    }

    Date_t& operator-=(Milliseconds d) {
        _millis -= d.count();
        return *this;
    }

    Date_t operator+(Milliseconds d) const {
        return Date_t(*this) += d;
    }

    Date_t operator-(Milliseconds d) const {
        return Date_t(*this) -= d;
    }

    Milliseconds operator-(Date_t other) const {
        return Milliseconds(_millis - other._millis);
    }

    bool operator==(Date_t other) const {
        return _millis == other._millis;
    }
    bool operator!=(Date_t other) const {
        return _millis != other._millis;
    }
    bool operator<(Date_t other) const {
        return _millis < other._millis;
    }
    bool operator>(Date_t other) const {
        return _millis > other._millis;
    }
    bool operator<=(Date_t other) const {
        return _millis <= other._millis;
    }
    bool operator>=(Date_t other) const {
        return _millis >= other._millis;
    }

private:
    constexpr explicit Date_t(int64_t millis) : _millis(millis) {}

    int64_t _millis = 0;
};

std::ostream& operator<<(std::ostream& os, Date_t date);

}  // namespace docdriver
