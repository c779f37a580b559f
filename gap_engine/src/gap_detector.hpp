#pragma once

#include "candle_window.hpp"
#include "gap.hpp"
#include <optional>

class GapDetector {
public:
    // Checks c1/c3 of a closed triple for a price imbalance. At most one gap
    // per triple; equal boundary prices do not count.
    static std::optional<Gap> detect(const StreamKey& key, const CandleTriple& triple);
};
