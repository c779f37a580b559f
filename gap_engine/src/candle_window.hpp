#pragma once

#include "candle.hpp"
#include <array>
#include <deque>
#include <optional>
#include <vector>

enum class AppendStatus {
    Appended,
    Replaced,
    OutOfOrder
};

struct AppendResult {
    AppendStatus status;
    // Candles that became closed by this append, oldest first
    std::vector<Candle> newly_closed;
};

using CandleTriple = std::array<Candle, 3>;

// Bounded rolling window of the most recent candles of one stream.
class CandleWindow {
public:
    static constexpr size_t kMinCapacity = 3;

    // Throws std::invalid_argument if capacity < kMinCapacity
    explicit CandleWindow(size_t capacity);

    // Keeps capacity closed candles plus the in-progress one
    AppendResult append(const Candle& candle);

    // Three most recent closed candles, oldest first
    std::optional<CandleTriple> latest_triple() const;
    // Closed triple whose third candle opened at open_time_ms
    std::optional<CandleTriple> triple_ending_at(int64_t open_time_ms) const;

    size_t size() const { return candles_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return candles_.empty(); }
    const Candle& latest() const { return candles_.back().candle; }

private:
    struct Slot {
        Candle candle;
        bool closed;
    };

    size_t capacity_;
    std::deque<Slot> candles_;

    std::optional<CandleTriple> triple_at(size_t last_index) const;
};
