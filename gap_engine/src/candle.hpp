#pragma once

#include <cstdint>
#include <string>

// OHLCV candle, validated on construction. Immutable once built.
struct Candle {
    int64_t open_time_ms;
    int64_t close_time_ms;
    double open;
    double high;
    double low;
    double close;
    double volume;
    bool closed; // exchange marked the candle as final

    // Throws std::invalid_argument on inconsistent OHLC values
    static Candle make(int64_t open_time_ms, int64_t close_time_ms,
                       double open, double high, double low, double close,
                       double volume, bool closed = true);
};

enum class ObservationKind {
    Tick,
    CandleRange
};

// A traded price (tick) or a traded range (candle high/low) at a point in time.
struct PriceObservation {
    ObservationKind kind;
    double high;
    double low;
    int64_t timestamp_ms;

    static PriceObservation tick(double price, int64_t timestamp_ms);
    static PriceObservation range(double high, double low, int64_t timestamp_ms);
    static PriceObservation from_candle(const Candle& candle);
};

std::string to_string(ObservationKind kind);
