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

#include "docdriver/util/time_support.h"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <ostream>

namespace docdriver {

Date_t Date_t::now() {
    return fromDurationSinceEpoch(duration_cast<Milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()));
}

std::chrono::system_clock::time_point Date_t::toSystemTimePoint() const {
    return std::chrono::system_clock::time_point(
        duration_cast<std::chrono::system_clock::duration>(toDurationSinceEpoch()));
}

std::string Date_t::toString() const {
    if (*this == min())
        return "Date_t::min()";
    if (*this == max())
        return "Date_t::max()";

    static const boost::posix_time::ptime kEpoch(boost::gregorian::date(1970, 1, 1));
    auto when = kEpoch + boost::posix_time::milliseconds(_millis);
    return boost::posix_time::to_iso_extended_string(when) + "Z";
}

std::ostream& operator<<(std::ostream& os, Date_t date) {
    return os << date.toString();
}

}  // namespace docdriver
