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

#include "docdriver/platform/random.h"


#include "docdriver/util/assert_util.h"

namespace docdriver {

PseudoRandom::PseudoRandom(int64_t seed) {
    _x = static_cast<uint32_t>(seed >> 32);
    _y = 362436069;
    _z = 521288629;
    _w = static_cast<uint32_t>(seed);
    if (_x == 0 && _w == 0)
        _w = 88675123;
}

int32_t PseudoRandom::nextInt32() {
    uint32_t t = _x ^ (_x << 11);
    _x = _y;
    _y = _z;
    _z = _w;
    _w = _w ^ (_w >> 19) ^ (t ^ (t >> 8));
    return static_cast<int32_t>(_w);
}

int64_t PseudoRandom::nextInt64() {
    uint64_t a = static_cast<uint32_t>(nextInt32());
    uint64_t b = static_cast<uint32_t>(nextInt32());
    return static_cast<int64_t>((a << 32) | b);
}

int32_t PseudoRandom::nextInt32(int32_t max) {
    invariant(max > 0);
    return static_cast<int32_t>(static_cast<uint32_t>(nextInt32()) % static_cast<uint32_t>(max));
}

int64_t PseudoRandom::nextInt64(int64_t max) {
    invariant(max > 0);
    return static_cast<int64_t>(static_cast<uint64_t>(nextInt64()) % static_cast<uint64_t>(max));
}

double PseudoRandom::nextCanonicalDouble() {
    return static_cast<double>(static_cast<uint64_t>(nextInt64()) >> 11) /
        static_cast<double>(uint64_t(1) << 53);
}

}  // namespace docdriver
