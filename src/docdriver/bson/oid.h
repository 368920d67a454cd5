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

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "docdriver/base/status_with.h"

namespace docdriver {

/**
 * Object ID type: a 12 byte identifier. Replica set election ids and the process id of a
 * server's topology version are OIDs.
 *
 * The layout is a 4-byte big endian timestamp (seconds since epoch), a 5-byte per process random
 * value and a 3-byte big endian counter, so that ids compare mostly in creation order.
 */
class OID {
public:
    static constexpr size_t kOIDSize = 12;
    static constexpr size_t kTimestampSize = 4;
    static constexpr size_t kInstanceUniqueSize = 5;
    static constexpr size_t kIncrementSize = 3;

    /**
     * Constructs an all zero OID.
     */
    OID() {
        _data.fill(0);
    }

    /**
     * Constructs an OID from its 24 hex digit string form. Throws on malformed input.
     */
    explicit OID(const std::string& hex);

    static StatusWith<OID> parse(const std::string& hex);

    /**
     * Generates a new, process unique OID.
     */
    static OID gen();

    /**
     * Returns an OID whose trailing 8 bytes hold 'value' big endian. Handy for election ids.
     */
    static OID fromCounter(uint64_t value);

    bool isSet() const;

    /** @return the object ID output as 24 hex digits */
    std::string toString() const;

    int compare(const OID& other) const;

    const unsigned char* data() const {
        return _data.data();
    }

    bool operator==(const OID& other) const {
        return compare(other) == 0;
    }
    bool operator!=(const OID& other) const {
        return compare(other) != 0;
    }
    bool operator<(const OID& other) const {
        return compare(other) < 0;
    }
    bool operator<=(const OID& other) const {
        return compare(other) <= 0;
    }
    bool operator>(const OID& other) const {
        return compare(other) > 0;
    }
    bool operator>=(const OID& other) const {
        return compare(other) >= 0;
    }

private:
    std::array<unsigned char, kOIDSize> _data;
};

std::ostream& operator<<(std::ostream& os, const OID& oid);

}  // namespace docdriver
