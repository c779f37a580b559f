#pragma once

#include "candle.hpp"
#include <string>
#include <nlohmann/json.hpp>

struct CandleMessage {
    std::string instrument;
    std::string timeframe;
    Candle candle;
};

struct ObservationMessage {
    std::string instrument;
    std::string timeframe;
    PriceObservation observation;
};

// Converts feed messages into engine values. Prices may arrive as JSON
// numbers or as decimal strings. Throws std::invalid_argument on bad input.
class FeedParser {
public:
    static CandleMessage parse_candle(const nlohmann::json& msg);
    static ObservationMessage parse_observation(const nlohmann::json& msg);

private:
    static double get_number(const nlohmann::json& msg, const char* field);
    static int64_t get_timestamp(const nlohmann::json& msg, const char* field);
    static void parse_stream(const nlohmann::json& msg, std::string& instrument,
                             std::string& timeframe);
};
