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

#include <cstdint>

namespace docdriver {

/**
 * A fast, non-cryptographic source of random numbers (xorshift128).
 * Not thread safe; callers synchronize access.
 */
class PseudoRandom {
public:
    explicit PseudoRandom(int64_t seed);

    int32_t nextInt32();

    int64_t nextInt64();

    /**
     * Returns a random number in the range [0, max).
     */
    int32_t nextInt32(int32_t max);

    /**
     * Returns a random number in the range [0, max).
     */
    int64_t nextInt64(int64_t max);

    /**
     * Returns a random number in the range [0, 1).
     */
    double nextCanonicalDouble();

private:
    uint32_t _x;
    uint32_t _y;
    uint32_t _z;
    uint32_t _w;
};

}  // namespace docdriver
