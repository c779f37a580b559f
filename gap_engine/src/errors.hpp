#pragma once

#include <string>

// Non-fatal conditions reported by the gap engine. None of them leave the
// engine in an inconsistent state.
enum class GapError {
    OutOfOrderInput,
    DuplicateGap,
    InsufficientData,
    UnknownGap,
    InvalidObservation
};

constexpr int kGapErrorKinds = 5;

std::string to_string(GapError error);
