/*
 * Copyright (c) 2024 Chiradip Mandal
 * Author: Chiradip Mandal
 * Organization: Space-RF.org
 *
 * This file is part of Minterm Classifier.
 *
 * Licensed under the MIT License. See LICENSE file for details.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace minterm {

// Size of the UTF-16 code-unit space (0x0000 - 0xFFFF)
inline constexpr uint32_t kCodeUnitCount = 0x10000;
inline constexpr uint32_t kMaxCodeUnit = kCodeUnitCount - 1;

// Inclusive range [start, end] of code units
struct CharRange {
    uint32_t start;
    uint32_t end;

    [[nodiscard]] uint32_t length() const noexcept { return end + 1 - start; }

    bool operator==(const CharRange& other) const noexcept {
        return start == other.start && end == other.end;
    }
    bool operator!=(const CharRange& other) const noexcept { return !(*this == other); }
};

/**
 * Set of code units stored as ranges.
 *
 * Serves as the class descriptor handed to MintermClassifier. Ranges may be
 * added in any order and may overlap; the stored ranges are kept sorted
 * ascending with overlapping and adjacent ranges merged.
 */
class RangeSet {
public:
    RangeSet() = default;
    RangeSet(std::initializer_list<CharRange> ranges);

    // Throws ClassifierError(InvalidRange) if start > end or end > 0xFFFF
    RangeSet& add(uint32_t start, uint32_t end);
    RangeSet& add(uint32_t code) { return add(code, code); }

    [[nodiscard]] const std::vector<CharRange>& ranges() const noexcept { return ranges_; }
    [[nodiscard]] bool contains(uint32_t code) const noexcept;
    [[nodiscard]] bool empty() const noexcept { return ranges_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return ranges_.size(); }

private:
    std::vector<CharRange> ranges_;
};

// Range conversion for RangeSet descriptors: sorted, disjoint, inclusive.
[[nodiscard]] std::vector<CharRange> to_ranges(const RangeSet& set);

}  // namespace minterm
