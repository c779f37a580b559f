#include "stats.hpp"

bool StatsFilter::matches(const Gap& gap) const {
    if (from_ms && gap.formed_at_ms() < *from_ms) return false;
    if (to_ms && gap.formed_at_ms() > *to_ms) return false;
    if (direction && gap.direction() != *direction) return false;
    return true;
}

StatsResult StatsAggregator::compute(const std::vector<Gap>& snapshot, const StatsFilter& filter) {
    StatsResult result;

    double size_sum = 0.0;
    double size_pct_sum = 0.0;
    double middle_sum = 0.0;
    double mitigation_ms_sum = 0.0;

    for (const auto& gap : snapshot) {
        if (!filter.matches(gap)) continue;

        result.total++;
        if (gap.direction() == Direction::Bullish) {
            result.bullish++;
        } else {
            result.bearish++;
        }

        size_sum += gap.size();
        size_pct_sum += gap.size_pct();
        middle_sum += gap.middle();

        switch (gap.state()) {
            case GapState::Active:
                result.active++;
                break;
            case GapState::PartiallyMitigated:
                result.partially_mitigated++;
                break;
            case GapState::FullyMitigated:
                result.fully_mitigated++;
                if (gap.mitigation_completed_at_ms()) {
                    mitigation_ms_sum += static_cast<double>(
                        *gap.mitigation_completed_at_ms() - gap.formed_at_ms());
                }
                break;
        }
    }

    if (result.total == 0) return result;

    double n = static_cast<double>(result.total);
    result.mitigation_rate = static_cast<double>(result.fully_mitigated) / n;
    result.average_size = size_sum / n;
    result.average_size_pct = size_pct_sum / n;
    result.average_middle = middle_sum / n;

    if (result.fully_mitigated > 0) {
        result.average_time_to_mitigation_ms =
            mitigation_ms_sum / static_cast<double>(result.fully_mitigated);
    }

    return result;
}
