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

#include "docdriver/client/read_preference.h"

#include <algorithm>
#include <sstream>

namespace docdriver {

constexpr Seconds ReadPreferenceSetting::kMinimalMaxStalenessValue;
constexpr Seconds ReadPreferenceSetting::kIdleWritePeriod;

namespace {
const char kModePrimary[] = "primary";
const char kModePrimaryPreferred[] = "primaryPreferred";
const char kModeSecondary[] = "secondary";
const char kModeSecondaryPreferred[] = "secondaryPreferred";
const char kModeNearest[] = "nearest";

TagSet defaultTagSetForMode(ReadPreference mode) {
    switch (mode) {
        case ReadPreference::PrimaryOnly:
            return TagSet::primaryOnly();
        default:
            return TagSet();
    }
}
}  // namespace

StatusWith<ReadPreference> parseReadPreferenceMode(const std::string& mode) {
    if (mode == kModePrimary)
        return ReadPreference::PrimaryOnly;
    if (mode == kModePrimaryPreferred)
        return ReadPreference::PrimaryPreferred;
    if (mode == kModeSecondary)
        return ReadPreference::SecondaryOnly;
    if (mode == kModeSecondaryPreferred)
        return ReadPreference::SecondaryPreferred;
    if (mode == kModeNearest)
        return ReadPreference::Nearest;
    return Status(ErrorCodes::FailedToParse, "Could not parse read preference mode: " + mode);
}

std::string toString(ReadPreference pref) {
    switch (pref) {
        case ReadPreference::PrimaryOnly:
            return kModePrimary;
        case ReadPreference::PrimaryPreferred:
            return kModePrimaryPreferred;
        case ReadPreference::SecondaryOnly:
            return kModeSecondary;
        case ReadPreference::SecondaryPreferred:
            return kModeSecondaryPreferred;
        case ReadPreference::Nearest:
            return kModeNearest;
    }
    DOCDRIVER_UNREACHABLE;
}

TagSet::TagSet() : _tags{Tags{}} {}

TagSet TagSet::primaryOnly() {
    return TagSet(std::vector<Tags>{});
}

bool TagSet::isMatchAnyNode() const {
    return _tags.empty() ||
        std::any_of(_tags.begin(), _tags.end(), [](const Tags& tags) { return tags.empty(); });
}

std::string TagSet::toString() const {
    std::ostringstream ss;
    ss << "[";
    bool firstDoc = true;
    for (const auto& doc : _tags) {
        ss << (firstDoc ? " " : ", ") << "{";
        bool firstTag = true;
        for (const auto& tag : doc) {
            ss << (firstTag ? " " : ", ") << tag.first << ": \"" << tag.second << "\"";
            firstTag = false;
        }
        ss << (doc.empty() ? "}" : " }");
        firstDoc = false;
    }
    ss << (_tags.empty() ? "]" : " ]");
    return ss.str();
}

ReadPreferenceSetting::ReadPreferenceSetting(ReadPreference pref,
                                             TagSet tags,
                                             Seconds maxStalenessSeconds)
    : pref(pref), tags(std::move(tags)), maxStalenessSeconds(maxStalenessSeconds) {}

ReadPreferenceSetting::ReadPreferenceSetting(ReadPreference pref, Seconds maxStalenessSeconds)
    : ReadPreferenceSetting(pref, defaultTagSetForMode(pref), maxStalenessSeconds) {}

ReadPreferenceSetting::ReadPreferenceSetting(ReadPreference pref, TagSet tags)
    : pref(pref), tags(std::move(tags)) {}

ReadPreferenceSetting::ReadPreferenceSetting(ReadPreference pref)
    : ReadPreferenceSetting(pref, defaultTagSetForMode(pref)) {}

Status ReadPreferenceSetting::validate(Milliseconds heartbeatFrequency) const {
    if (pref == ReadPreference::PrimaryOnly) {
        if (!tags.isPrimaryOnly() && !(tags.getTags().size() == 1 && tags.isMatchAnyNode())) {
            return Status(ErrorCodes::BadValue,
                          "Only empty tags are allowed with primary read preference");
        }
        if (maxStalenessSeconds.count() != 0) {
            return Status(ErrorCodes::BadValue,
                          "maxStalenessSeconds is not allowed with primary read preference");
        }
        return Status::OK();
    }

    if (maxStalenessSeconds.count() < 0) {
        return Status(ErrorCodes::BadValue, "maxStalenessSeconds must be a non-negative integer");
    }

    if (maxStalenessSeconds.count() != 0) {
        auto floor = std::max<Milliseconds>(kMinimalMaxStalenessValue,
                                            heartbeatFrequency + kIdleWritePeriod);
        if (maxStalenessSeconds < floor) {
            std::ostringstream ss;
            ss << "maxStalenessSeconds must be at least " << durationCount<Seconds>(floor)
               << " seconds, got " << maxStalenessSeconds.count();
            return Status(ErrorCodes::BadValue, ss.str());
        }
    }
    return Status::OK();
}

std::string ReadPreferenceSetting::toString() const {
    std::ostringstream ss;
    ss << "{ mode: \"" << docdriver::toString(pref) << "\"";
    if (tags != defaultTagSetForMode(pref)) {
        ss << ", tags: " << tags.toString();
    }
    if (maxStalenessSeconds.count() != 0) {
        ss << ", maxStalenessSeconds: " << maxStalenessSeconds.count();
    }
    ss << " }";
    return ss.str();
}

}  // namespace docdriver
