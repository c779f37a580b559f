#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

enum class Direction {
    Bullish,
    Bearish
};

enum class GapState {
    Active,
    PartiallyMitigated,
    FullyMitigated
};

using GapId = uint64_t;

struct StreamKey {
    std::string instrument;
    std::string timeframe;

    bool operator<(const StreamKey& other) const {
        return std::tie(instrument, timeframe) < std::tie(other.instrument, other.timeframe);
    }
    bool operator==(const StreamKey& other) const {
        return instrument == other.instrument && timeframe == other.timeframe;
    }
    std::string label() const { return instrument + ":" + timeframe; }
};

// Fair value gap. Bounds, direction and formation time are fixed at
// construction; only the registry moves the lifecycle fields.
class Gap {
public:
    // Throws std::invalid_argument unless upper_bound > lower_bound
    Gap(StreamKey key, Direction direction, double lower_bound, double upper_bound,
        int64_t formed_at_ms);

    GapId id() const { return id_; }
    const StreamKey& key() const { return key_; }
    Direction direction() const { return direction_; }
    double lower_bound() const { return lower_bound_; }
    double upper_bound() const { return upper_bound_; }
    int64_t formed_at_ms() const { return formed_at_ms_; }

    GapState state() const { return state_; }
    std::optional<int64_t> mitigation_started_at_ms() const { return mitigation_started_at_ms_; }
    std::optional<int64_t> mitigation_completed_at_ms() const { return mitigation_completed_at_ms_; }
    // Latest observation that entered the zone, including repeated partial hits
    std::optional<int64_t> last_touched_at_ms() const { return last_touched_at_ms_; }

    double size() const { return upper_bound_ - lower_bound_; }
    double middle() const { return (upper_bound_ + lower_bound_) / 2.0; }
    double size_pct() const { return size() / lower_bound_ * 100.0; }

    bool is_open() const { return state_ != GapState::FullyMitigated; }
    bool same_identity(const Gap& other) const;

private:
    friend class GapRegistry;

    GapId id_ = 0;
    StreamKey key_;
    Direction direction_;
    double lower_bound_;
    double upper_bound_;
    int64_t formed_at_ms_;

    GapState state_ = GapState::Active;
    std::optional<int64_t> mitigation_started_at_ms_;
    std::optional<int64_t> mitigation_completed_at_ms_;
    std::optional<int64_t> last_touched_at_ms_;
};

std::string to_string(Direction direction);
std::string to_string(GapState state);
std::optional<Direction> parse_direction(const std::string& text);
