#include "gap.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

Gap::Gap(StreamKey key, Direction direction, double lower_bound, double upper_bound,
         int64_t formed_at_ms)
    : key_(std::move(key))
    , direction_(direction)
    , lower_bound_(lower_bound)
    , upper_bound_(upper_bound)
    , formed_at_ms_(formed_at_ms)
{
    if (!std::isfinite(lower_bound_) || !std::isfinite(upper_bound_)) {
        throw std::invalid_argument("gap bounds must be finite");
    }
    if (upper_bound_ <= lower_bound_) {
        throw std::invalid_argument("gap upper_bound must exceed lower_bound");
    }
}

bool Gap::same_identity(const Gap& other) const {
    return key_ == other.key_ &&
           formed_at_ms_ == other.formed_at_ms_ &&
           direction_ == other.direction_;
}

std::string to_string(Direction direction) {
    return direction == Direction::Bullish ? "bullish" : "bearish";
}

std::string to_string(GapState state) {
    switch (state) {
        case GapState::Active: return "active";
        case GapState::PartiallyMitigated: return "partially_mitigated";
        case GapState::FullyMitigated: return "fully_mitigated";
    }
    return "unknown";
}

std::optional<Direction> parse_direction(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "bullish" || lower == "bull") return Direction::Bullish;
    if (lower == "bearish" || lower == "bear") return Direction::Bearish;
    return std::nullopt;
}
