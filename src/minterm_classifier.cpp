/*
 * Copyright (c) 2024 Chiradip Mandal
 * Author: Chiradip Mandal
 * Organization: Space-RF.org
 *
 * This file is part of Minterm Classifier.
 *
 * Licensed under the MIT License. See LICENSE file for details.
 */

#include "minterm_classifier.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace minterm {

namespace {

// Every code maps to minterm 0; shared by all single-minterm classifiers.
const std::shared_ptr<const std::vector<MintermId>>& empty_lookup() {
    static const std::shared_ptr<const std::vector<MintermId>> table =
        std::make_shared<std::vector<MintermId>>(kCodeUnitCount, MintermId{0});
    return table;
}

std::string describe(size_t id, const CharRange& range) {
    return "minterm " + std::to_string(id) + " range [" +
           std::to_string(range.start) + ", " + std::to_string(range.end) + "]";
}

struct OwnedRange {
    CharRange range;
    size_t id;
};

void validate(const std::vector<std::vector<CharRange>>& minterm_ranges) {
    if (minterm_ranges.empty()) {
        throw ClassifierError(ClassifierErrorCode::EmptyPartition,
                              "at least one minterm is required");
    }
    if (minterm_ranges.size() > kMaxMinterms) {
        throw ClassifierError(ClassifierErrorCode::TooManyMinterms,
                              std::to_string(minterm_ranges.size()) + " minterms, at most " +
                              std::to_string(kMaxMinterms) + " supported");
    }
    if (!minterm_ranges[0].empty()) {
        throw ClassifierError(ClassifierErrorCode::RangeForDefaultClass,
                              describe(0, minterm_ranges[0].front()));
    }

    std::vector<OwnedRange> all;
    for (size_t id = 1; id < minterm_ranges.size(); ++id) {
        const auto& ranges = minterm_ranges[id];
        for (size_t i = 0; i < ranges.size(); ++i) {
            const CharRange& range = ranges[i];
            if (range.start > range.end || range.end > kMaxCodeUnit) {
                throw ClassifierError(ClassifierErrorCode::InvalidRange, describe(id, range));
            }
            if (i > 0 && range.start <= ranges[i - 1].end) {
                throw ClassifierError(ClassifierErrorCode::UnsortedRanges, describe(id, range));
            }
            all.push_back({range, id});
        }
    }

    // Ranges within a minterm are already known disjoint, so any overlap
    // left after sorting is between two different minterms.
    std::sort(all.begin(), all.end(), [](const OwnedRange& a, const OwnedRange& b) {
        return a.range.start < b.range.start;
    });
    for (size_t i = 1; i < all.size(); ++i) {
        if (all[i].range.start <= all[i - 1].range.end) {
            throw ClassifierError(ClassifierErrorCode::OverlappingRanges,
                                  describe(all[i - 1].id, all[i - 1].range) + " overlaps " +
                                  describe(all[i].id, all[i].range));
        }
    }
}

}  // namespace

MintermClassifier::MintermClassifier(const std::vector<std::vector<CharRange>>& minterm_ranges)
        : lookup_(nullptr)
        , minterm_count_(minterm_ranges.size())
        , ascii_only_(false) {
    validate(minterm_ranges);

    if (minterm_count_ == 1) {
        storage_ = empty_lookup();
        lookup_ = storage_->data();
        return;
    }

    // Ranges are sorted, so the last one holds the highest code of a minterm
    ascii_only_ = true;
    for (size_t id = 1; id < minterm_count_; ++id) {
        const auto& ranges = minterm_ranges[id];
        if (!ranges.empty() && ranges.back().end >= kAsciiLimit) {
            ascii_only_ = false;
            break;
        }
    }

    // Unclaimed codes stay at minterm 0
    auto table = std::make_shared<std::vector<MintermId>>(
        ascii_only_ ? kAsciiLimit : kCodeUnitCount, MintermId{0});
    for (size_t id = 1; id < minterm_count_; ++id) {
        for (const CharRange& range : minterm_ranges[id]) {
            std::fill_n(table->begin() + range.start, range.length(),
                        static_cast<MintermId>(id));
        }
    }

    lookup_ = table->data();
    storage_ = std::move(table);
}

void MintermClassifier::classify(const char16_t* input, size_t size,
                                 MintermId* output) const noexcept {
    if (ascii_only_) {
        for (size_t i = 0; i < size; ++i) {
            uint32_t code = input[i];
            output[i] = code < kAsciiLimit ? lookup_[code] : MintermId{0};
        }
        return;
    }

    for (size_t i = 0; i < size; ++i) {
        output[i] = lookup_[static_cast<uint32_t>(input[i])];
    }
}

void MintermClassifier::code_out_of_range(uint32_t code) noexcept {
    std::cerr << "MintermClassifier: code " << code
              << " outside the UTF-16 code-unit space\n";
    std::abort();
}

bool MintermClassifier::shares_empty_lookup() const noexcept {
    return storage_ == empty_lookup();
}

}  // namespace minterm
