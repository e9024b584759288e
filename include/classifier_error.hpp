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

#include <cstdint>
#include <stdexcept>
#include <string>

namespace minterm {

// Construction-time contract violations. These indicate a defect in the
// partitioning stage feeding the classifier, never bad user input.
enum class ClassifierErrorCode : uint8_t {
    EmptyPartition,        // no descriptors at all
    TooManyMinterms,       // IDs would not fit in MintermId
    RangeForDefaultClass,  // a range was supplied for minterm 0
    InvalidRange,          // start > end, or end outside the code-unit space
    UnsortedRanges,        // ranges of one minterm not ascending and disjoint
    OverlappingRanges      // two minterms claim the same code
};

const char* error_code_name(ClassifierErrorCode code) noexcept;

class ClassifierError : public std::logic_error {
public:
    ClassifierError(ClassifierErrorCode code, const std::string& message)
        : std::logic_error(std::string(error_code_name(code)) + ": " + message)
        , code_(code) {}

    [[nodiscard]] ClassifierErrorCode code() const noexcept { return code_; }

private:
    ClassifierErrorCode code_;
};

}  // namespace minterm
