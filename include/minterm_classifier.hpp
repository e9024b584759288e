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

#include "char_range.hpp"
#include "classifier_error.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace minterm {

// Minterm IDs 0..65535. Minterm 0 is the implicit "everything else" class.
using MintermId = uint16_t;

inline constexpr uint32_t kAsciiLimit = 128;
inline constexpr size_t kMaxMinterms = kCodeUnitCount;

/**
 * Maps every UTF-16 code unit to the ID of its minterm.
 *
 * Minterms compress the input alphabet into equivalence classes of
 * characters the automaton treats identically, e.g. "[0-9]*" has two: the
 * digits, and everything else. The table is built once and never written
 * again, so a classifier (and every copy of it) may be read from any number
 * of threads without locking.
 *
 * Table shapes:
 *   - single minterm: shared zero-filled 65536-entry table
 *   - every explicit range below 128: 128-entry table, codes >= 128 map to 0
 *   - otherwise: 65536-entry table
 */
class MintermClassifier {
public:
    // Entry i holds the ranges of minterm i. Entry 0 must be empty.
    explicit MintermClassifier(const std::vector<std::vector<CharRange>>& minterm_ranges);

    // Converts descriptors 1..N-1 with to_ranges. Descriptor 0 is never
    // converted; its members are whatever the others leave unclaimed.
    template<typename Descriptor, typename RangeConverter>
    MintermClassifier(const std::vector<Descriptor>& minterms, RangeConverter&& to_ranges)
        : MintermClassifier(convert(minterms, to_ranges)) {}

    // Moves copy: a moved-from classifier keeps its table and stays usable.
    MintermClassifier(const MintermClassifier&) = default;
    MintermClassifier& operator=(const MintermClassifier&) = default;

    // Aborts on a code outside 0..0xFFFF in every build type
    [[nodiscard]] MintermId classify(uint32_t code) const noexcept {
        if (code > kMaxCodeUnit) {
            code_out_of_range(code);
        }
        if (ascii_only_ && code >= kAsciiLimit) {
            return 0;
        }
        return lookup_[code];
    }

    // Classifies each code unit of input into output. Surrogate halves are
    // classified independently.
    void classify(const char16_t* input, size_t size, MintermId* output) const noexcept;

    [[nodiscard]] bool is_ascii_only() const noexcept { return ascii_only_; }
    [[nodiscard]] size_t table_size() const noexcept { return storage_->size(); }
    [[nodiscard]] size_t minterm_count() const noexcept { return minterm_count_; }
    [[nodiscard]] bool shares_empty_lookup() const noexcept;

private:
    [[noreturn]] static void code_out_of_range(uint32_t code) noexcept;

    template<typename Descriptor, typename RangeConverter>
    static std::vector<std::vector<CharRange>> convert(const std::vector<Descriptor>& minterms,
                                                       RangeConverter& to_ranges) {
        std::vector<std::vector<CharRange>> result(minterms.size());
        for (size_t id = 1; id < minterms.size(); ++id) {
            result[id] = to_ranges(minterms[id]);
        }
        return result;
    }

    std::shared_ptr<const std::vector<MintermId>> storage_;
    const MintermId* lookup_;
    size_t minterm_count_;
    bool ascii_only_;
};

}  // namespace minterm
