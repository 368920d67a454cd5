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

#include <map>
#include <string>
#include <vector>

#include "docdriver/base/status_with.h"
#include "docdriver/util/duration.h"

namespace docdriver {

enum class ReadPreference {
    /**
     * Read from primary only. All operations produce an error (throw an exception where
     * applicable) if primary is unavailable. Cannot be combined with tags.
     */
    PrimaryOnly = 0,

    /**
     * Read from primary if available, otherwise a secondary.
     */
    PrimaryPreferred,

    /**
     * Read from secondary if available, otherwise error.
     */
    SecondaryOnly,

    /**
     * Read from a secondary if available, otherwise read from the primary.
     */
    SecondaryPreferred,

    /**
     * Read from any member.
     */
    Nearest,
};

StatusWith<ReadPreference> parseReadPreferenceMode(const std::string& mode);
std::string toString(ReadPreference pref);

/**
 * An ordered list of tag documents. A server matches a tag document when it carries every
 * key/value pair of that document; the first document matched by at least one candidate wins.
 */
class TagSet {
public:
    using Tags = std::map<std::string, std::string>;

    /**
     * Creates a TagSet that matches any node: a list with a single empty document, [{}].
     */
    TagSet();

    explicit TagSet(std::vector<Tags> tags) : _tags(std::move(tags)) {}

    /**
     * Returns an empty TagSet, []. This is the only TagSet allowed with PrimaryOnly.
     */
    static TagSet primaryOnly();

    const std::vector<Tags>& getTags() const {
        return _tags;
    }

    bool isPrimaryOnly() const {
        return _tags.empty();
    }

    /**
     * True for [] and for any list containing an empty document.
     */
    bool isMatchAnyNode() const;

    bool operator==(const TagSet& other) const {
        return _tags == other._tags;
    }
    bool operator!=(const TagSet& other) const {
        return !(*this == other);
    }

    std::string toString() const;

private:
    std::vector<Tags> _tags;
};

struct ReadPreferenceSetting {
    /**
     * The minimal value maxStalenessSeconds can have.
     */
    static constexpr Seconds kMinimalMaxStalenessValue = Seconds(90);

    /**
     * Servers write to their oplog at least this often, which bounds the staleness estimate's
     * error.
     */
    static constexpr Seconds kIdleWritePeriod = Seconds(10);

    ReadPreferenceSetting(ReadPreference pref, TagSet tags, Seconds maxStalenessSeconds);
    ReadPreferenceSetting(ReadPreference pref, Seconds maxStalenessSeconds);
    ReadPreferenceSetting(ReadPreference pref, TagSet tags);
    explicit ReadPreferenceSetting(ReadPreference pref);
    ReadPreferenceSetting() : ReadPreferenceSetting(ReadPreference::PrimaryOnly) {}

    /**
     * Checks that the mode, tags and staleness bound can be combined, given the topology's
     * heartbeat frequency.
     */
    Status validate(Milliseconds heartbeatFrequency) const;

    bool canRunOnSecondary() const {
        return pref != ReadPreference::PrimaryOnly;
    }

    bool equals(const ReadPreferenceSetting& other) const {
        return pref == other.pref && tags == other.tags &&
            maxStalenessSeconds == other.maxStalenessSeconds;
    }

    std::string toString() const;

    ReadPreference pref;
    TagSet tags;

    // Zero means no bound.
    Seconds maxStalenessSeconds{};
};

}  // namespace docdriver
