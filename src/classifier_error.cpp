/*
 * Copyright (c) 2024 Chiradip Mandal
 * Author: Chiradip Mandal
 * Organization: Space-RF.org
 *
 * This file is part of Minterm Classifier.
 *
 * Licensed under the MIT License. See LICENSE file for details.
 */

#include "classifier_error.hpp"

namespace minterm {

const char* error_code_name(ClassifierErrorCode code) noexcept {
    switch (code) {
        case ClassifierErrorCode::EmptyPartition: return "EmptyPartition";
        case ClassifierErrorCode::TooManyMinterms: return "TooManyMinterms";
        case ClassifierErrorCode::RangeForDefaultClass: return "RangeForDefaultClass";
        case ClassifierErrorCode::InvalidRange: return "InvalidRange";
        case ClassifierErrorCode::UnsortedRanges: return "UnsortedRanges";
        case ClassifierErrorCode::OverlappingRanges: return "OverlappingRanges";
    }
    return "Unknown";
}

}  // namespace minterm
