#pragma once

#include "gap.hpp"
#include <optional>
#include <vector>

struct StatsFilter {
    std::optional<int64_t> from_ms; // inclusive, on formed_at
    std::optional<int64_t> to_ms;   // inclusive, on formed_at
    std::optional<Direction> direction;

    bool matches(const Gap& gap) const;
};

struct StatsResult {
    size_t total = 0;
    size_t bullish = 0;
    size_t bearish = 0;
    size_t active = 0;
    size_t partially_mitigated = 0;
    size_t fully_mitigated = 0;

    double mitigation_rate = 0.0;  // fully_mitigated / total
    double average_size = 0.0;
    double average_size_pct = 0.0;
    double average_middle = 0.0;
    // Empty when nothing in the set is fully mitigated
    std::optional<double> average_time_to_mitigation_ms;
};

class StatsAggregator {
public:
    static StatsResult compute(const std::vector<Gap>& snapshot, const StatsFilter& filter = {});
};
