#include "candle.hpp"
#include <cmath>
#include <stdexcept>

namespace {

bool finite_price(double v) {
    return std::isfinite(v) && v > 0.0;
}

} // namespace

Candle Candle::make(int64_t open_time_ms, int64_t close_time_ms,
                    double open, double high, double low, double close,
                    double volume, bool closed) {
    if (!finite_price(open) || !finite_price(high) ||
        !finite_price(low) || !finite_price(close)) {
        throw std::invalid_argument("candle prices must be finite and positive");
    }
    if (high < low) {
        throw std::invalid_argument("candle high below low");
    }
    if (open > high || open < low || close > high || close < low) {
        throw std::invalid_argument("candle open/close outside high-low range");
    }
    if (!std::isfinite(volume) || volume < 0.0) {
        throw std::invalid_argument("candle volume must be non-negative");
    }
    if (close_time_ms < open_time_ms) {
        throw std::invalid_argument("candle close_time before open_time");
    }

    Candle c;
    c.open_time_ms = open_time_ms;
    c.close_time_ms = close_time_ms;
    c.open = open;
    c.high = high;
    c.low = low;
    c.close = close;
    c.volume = volume;
    c.closed = closed;
    return c;
}

PriceObservation PriceObservation::tick(double price, int64_t timestamp_ms) {
    if (!finite_price(price)) {
        throw std::invalid_argument("tick price must be finite and positive");
    }
    return PriceObservation{ObservationKind::Tick, price, price, timestamp_ms};
}

PriceObservation PriceObservation::range(double high, double low, int64_t timestamp_ms) {
    if (!finite_price(high) || !finite_price(low)) {
        throw std::invalid_argument("range prices must be finite and positive");
    }
    if (high < low) {
        throw std::invalid_argument("range high below low");
    }
    return PriceObservation{ObservationKind::CandleRange, high, low, timestamp_ms};
}

// A closed candle is observed at its close time
PriceObservation PriceObservation::from_candle(const Candle& candle) {
    return PriceObservation{ObservationKind::CandleRange, candle.high, candle.low,
                            candle.close_time_ms};
}

std::string to_string(ObservationKind kind) {
    switch (kind) {
        case ObservationKind::Tick: return "tick";
        case ObservationKind::CandleRange: return "range";
    }
    return "unknown";
}
