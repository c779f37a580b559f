#include "gap_json.hpp"
#include "util.hpp"

namespace {

nlohmann::json optional_ts(const std::optional<int64_t>& ts) {
    if (!ts) return nullptr;
    return *ts;
}

} // namespace

void to_json(nlohmann::json& j, const StreamKey& key) {
    j = {
        {"instrument", key.instrument},
        {"timeframe", key.timeframe}
    };
}

void to_json(nlohmann::json& j, const Gap& gap) {
    j = {
        {"id", gap.id()},
        {"instrument", gap.key().instrument},
        {"timeframe", gap.key().timeframe},
        {"direction", to_string(gap.direction())},
        {"lower_bound", gap.lower_bound()},
        {"upper_bound", gap.upper_bound()},
        {"size", gap.size()},
        {"size_pct", gap.size_pct()},
        {"middle", gap.middle()},
        {"formed_at", gap.formed_at_ms()},
        {"formed_at_iso", util::format_iso8601_ms(gap.formed_at_ms())},
        {"state", to_string(gap.state())},
        {"mitigation_started_at", optional_ts(gap.mitigation_started_at_ms())},
        {"mitigation_completed_at", optional_ts(gap.mitigation_completed_at_ms())},
        {"last_touched_at", optional_ts(gap.last_touched_at_ms())}
    };
}

void to_json(nlohmann::json& j, const StatsResult& stats) {
    j = {
        {"total", stats.total},
        {"bullish", stats.bullish},
        {"bearish", stats.bearish},
        {"active", stats.active},
        {"partially_mitigated", stats.partially_mitigated},
        {"fully_mitigated", stats.fully_mitigated},
        {"mitigation_rate", stats.mitigation_rate},
        {"average_size", stats.average_size},
        {"average_size_pct", stats.average_size_pct},
        {"average_middle", stats.average_middle},
        {"average_time_to_mitigation_ms", nullptr},
        {"average_time_to_mitigation_hours", nullptr}
    };
    if (stats.average_time_to_mitigation_ms) {
        j["average_time_to_mitigation_ms"] = *stats.average_time_to_mitigation_ms;
        j["average_time_to_mitigation_hours"] = *stats.average_time_to_mitigation_ms / 3600000.0;
    }
}

nlohmann::json gaps_to_json(const StreamKey& key, const std::vector<Gap>& gaps) {
    return {
        {"stream", key},
        {"count", gaps.size()},
        {"gaps", gaps}
    };
}
