#include "candle_window.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

CandleWindow::CandleWindow(size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ < kMinCapacity) {
        throw std::invalid_argument("candle window capacity must be at least 3");
    }
}

AppendResult CandleWindow::append(const Candle& candle) {
    AppendResult result{AppendStatus::Appended, {}};

    if (!candles_.empty()) {
        Slot& last = candles_.back();

        if (candle.open_time_ms < last.candle.open_time_ms) {
            spdlog::warn("Rejected out-of-order candle: open_time {} < latest {}",
                         candle.open_time_ms, last.candle.open_time_ms);
            result.status = AppendStatus::OutOfOrder;
            return result;
        }

        if (candle.open_time_ms == last.candle.open_time_ms) {
            result.status = AppendStatus::Replaced;
            // A final candle is never reopened by a late in-progress update
            if (last.closed) {
                return result;
            }
            last.candle = candle;
            if (candle.closed) {
                last.closed = true;
                result.newly_closed.push_back(candle);
            }
            return result;
        }

        // Newer candle supersedes the previous one
        if (!last.closed) {
            last.closed = true;
            result.newly_closed.push_back(last.candle);
        }
    }

    candles_.push_back(Slot{candle, candle.closed});
    if (candle.closed) {
        result.newly_closed.push_back(candle);
    }

    // Every newly closed candle still needs its two predecessors for detection
    size_t keep = capacity_ + (candles_.back().closed ? 0 : 1);
    if (result.newly_closed.size() > 1) {
        keep += result.newly_closed.size() - 1;
    }
    while (candles_.size() > keep) {
        candles_.pop_front();
    }

    return result;
}

std::optional<CandleTriple> CandleWindow::triple_at(size_t last_index) const {
    if (last_index < 2 || last_index >= candles_.size()) {
        return std::nullopt;
    }
    for (size_t i = last_index - 2; i <= last_index; ++i) {
        if (!candles_[i].closed) return std::nullopt;
    }
    return CandleTriple{candles_[last_index - 2].candle,
                        candles_[last_index - 1].candle,
                        candles_[last_index].candle};
}

std::optional<CandleTriple> CandleWindow::latest_triple() const {
    if (candles_.empty()) return std::nullopt;

    // Only the newest candle can still be in progress
    size_t last = candles_.size() - 1;
    if (!candles_[last].closed) {
        if (last == 0) return std::nullopt;
        --last;
    }
    return triple_at(last);
}

std::optional<CandleTriple> CandleWindow::triple_ending_at(int64_t open_time_ms) const {
    for (size_t i = candles_.size(); i-- > 0;) {
        if (candles_[i].candle.open_time_ms == open_time_ms) {
            return triple_at(i);
        }
        if (candles_[i].candle.open_time_ms < open_time_ms) break;
    }
    return std::nullopt;
}
