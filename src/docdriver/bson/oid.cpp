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

#include "docdriver/bson/oid.h"

#include <atomic>
#include <cstring>
#include <ctime>
#include <ostream>
#include <random>

namespace docdriver {
namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

struct InstanceUnique {
    unsigned char bytes[OID::kInstanceUniqueSize];
};

const InstanceUnique& instanceUnique() {
    static const InstanceUnique unique = [] {
        InstanceUnique result;
        std::random_device rd;
        std::mt19937_64 gen(rd());
        uint64_t value = gen();
        std::memcpy(result.bytes, &value, OID::kInstanceUniqueSize);
        return result;
    }();
    return unique;
}

std::atomic<uint32_t> oidCounter{static_cast<uint32_t>(std::random_device{}())};  // NOLINT

}  // namespace

OID::OID(const std::string& hex) {
    auto sw = parse(hex);
    uassertStatusOK(sw.getStatus());
    *this = sw.getValue();
}

StatusWith<OID> OID::parse(const std::string& hex) {
    if (hex.size() != kOIDSize * 2) {
        return Status(ErrorCodes::FailedToParse,
                      "Invalid string length for parsing to OID, expected 24 but found " +
                          std::to_string(hex.size()));
    }

    OID result;
    for (size_t i = 0; i < kOIDSize; ++i) {
        int high = hexValue(hex[2 * i]);
        int low = hexValue(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            return Status(ErrorCodes::FailedToParse,
                          "Invalid character found in hex string: " + hex);
        }
        result._data[i] = static_cast<unsigned char>((high << 4) | low);
    }
    return result;
}

OID OID::gen() {
    OID result;

    auto seconds = static_cast<uint32_t>(std::time(nullptr));
    for (size_t i = 0; i < kTimestampSize; ++i) {
        result._data[i] = static_cast<unsigned char>(seconds >> (8 * (kTimestampSize - 1 - i)));
    }

    std::memcpy(&result._data[kTimestampSize], instanceUnique().bytes, kInstanceUniqueSize);

    uint32_t increment = oidCounter.fetch_add(1);
    for (size_t i = 0; i < kIncrementSize; ++i) {
        result._data[kTimestampSize + kInstanceUniqueSize + i] =
            static_cast<unsigned char>(increment >> (8 * (kIncrementSize - 1 - i)));
    }
    return result;
}

OID OID::fromCounter(uint64_t value) {
    OID result;
    for (size_t i = 0; i < 8; ++i) {
        result._data[kOIDSize - 1 - i] = static_cast<unsigned char>(value >> (8 * i));
    }
    return result;
}

bool OID::isSet() const {
    for (auto byte : _data) {
        if (byte != 0)
            return true;
    }
    return false;
}

std::string OID::toString() const {
    static const char kHexChars[] = "0123456789abcdef";
    std::string out;
    out.reserve(kOIDSize * 2);
    for (auto byte : _data) {
        out.push_back(kHexChars[byte >> 4]);
        out.push_back(kHexChars[byte & 0x0F]);
    }
    return out;
}

int OID::compare(const OID& other) const {
    return std::memcmp(_data.data(), other._data.data(), kOIDSize);
}

std::ostream& operator<<(std::ostream& os, const OID& oid) {
    return os << oid.toString();
}

}  // namespace docdriver
