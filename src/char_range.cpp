/*
 * Copyright (c) 2024 Chiradip Mandal
 * Author: Chiradip Mandal
 * Organization: Space-RF.org
 *
 * This file is part of Minterm Classifier.
 *
 * Licensed under the MIT License. See LICENSE file for details.
 */

#include "char_range.hpp"
#include "classifier_error.hpp"

#include <algorithm>
#include <string>

namespace minterm {

RangeSet::RangeSet(std::initializer_list<CharRange> ranges) {
    for (const CharRange& range : ranges) {
        add(range.start, range.end);
    }
}

RangeSet& RangeSet::add(uint32_t start, uint32_t end) {
    if (start > end || end > kMaxCodeUnit) {
        throw ClassifierError(ClassifierErrorCode::InvalidRange,
                              "range [" + std::to_string(start) + ", " +
                              std::to_string(end) + "]");
    }

    // First range that overlaps or touches [start, end]
    auto first = std::lower_bound(ranges_.begin(), ranges_.end(), start,
        [](const CharRange& range, uint32_t value) {
            return range.end + 1 < value;
        });

    auto last = first;
    while (last != ranges_.end() && last->start <= end + 1) {
        start = std::min(start, last->start);
        end = std::max(end, last->end);
        ++last;
    }

    first = ranges_.erase(first, last);
    ranges_.insert(first, CharRange{start, end});
    return *this;
}

bool RangeSet::contains(uint32_t code) const noexcept {
    auto it = std::upper_bound(ranges_.begin(), ranges_.end(), code,
        [](uint32_t value, const CharRange& range) {
            return value < range.start;
        });
    if (it == ranges_.begin()) {
        return false;
    }
    --it;
    return code <= it->end;
}

std::vector<CharRange> to_ranges(const RangeSet& set) {
    return set.ranges();
}

}  // namespace minterm
