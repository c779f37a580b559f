#include "gap_detector.hpp"

std::optional<Gap> GapDetector::detect(const StreamKey& key, const CandleTriple& triple) {
    const Candle& first = triple[0];
    const Candle& third = triple[2];

    // Strict comparisons already exclude zero-width intervals
    if (third.low > first.high) {
        return Gap(key, Direction::Bullish, first.high, third.low, third.close_time_ms);
    }

    if (third.high < first.low) {
        return Gap(key, Direction::Bearish, third.high, first.low, third.close_time_ms);
    }

    return std::nullopt;
}
