#include "feed_parser.hpp"
#include "timeframe.hpp"
#include "util.hpp"
#include <stdexcept>

double FeedParser::get_number(const nlohmann::json& msg, const char* field) {
    if (!msg.contains(field)) {
        throw std::invalid_argument(std::string("missing field: ") + field);
    }
    const auto& val = msg.at(field);
    if (val.is_number()) return val.get<double>();
    if (val.is_string()) {
        try {
            return std::stod(val.get<std::string>());
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("non-numeric field: ") + field);
        }
    }
    throw std::invalid_argument(std::string("non-numeric field: ") + field);
}

int64_t FeedParser::get_timestamp(const nlohmann::json& msg, const char* field) {
    if (!msg.contains(field)) {
        throw std::invalid_argument(std::string("missing field: ") + field);
    }
    const auto& val = msg.at(field);
    if (val.is_number_integer()) return val.get<int64_t>();
    if (val.is_string()) {
        try {
            return std::stoll(val.get<std::string>());
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("bad timestamp: ") + field);
        }
    }
    throw std::invalid_argument(std::string("bad timestamp: ") + field);
}

void FeedParser::parse_stream(const nlohmann::json& msg, std::string& instrument,
                              std::string& timeframe) {
    if (!msg.contains("instrument") || !msg["instrument"].is_string()) {
        throw std::invalid_argument("missing instrument");
    }
    if (!msg.contains("timeframe") || !msg["timeframe"].is_string()) {
        throw std::invalid_argument("missing timeframe");
    }

    instrument = util::to_upper(msg["instrument"].get<std::string>());
    if (instrument.empty()) {
        throw std::invalid_argument("empty instrument");
    }

    auto tf = Timeframe::normalize(msg["timeframe"].get<std::string>());
    if (!tf) {
        throw std::invalid_argument("unknown timeframe: " + msg["timeframe"].get<std::string>());
    }
    timeframe = *tf;
}

CandleMessage FeedParser::parse_candle(const nlohmann::json& msg) {
    CandleMessage out;
    parse_stream(msg, out.instrument, out.timeframe);

    int64_t open_time = get_timestamp(msg, "open_time");
    // Exchange convention: close_time is the last millisecond of the interval
    int64_t close_time = msg.contains("close_time")
        ? get_timestamp(msg, "close_time")
        : open_time + Timeframe::interval_ms(out.timeframe) - 1;

    double volume = msg.contains("volume") ? get_number(msg, "volume") : 0.0;
    bool closed = msg.value("closed", true);

    out.candle = Candle::make(open_time, close_time,
                              get_number(msg, "open"), get_number(msg, "high"),
                              get_number(msg, "low"), get_number(msg, "close"),
                              volume, closed);
    return out;
}

ObservationMessage FeedParser::parse_observation(const nlohmann::json& msg) {
    std::string instrument;
    std::string timeframe;
    parse_stream(msg, instrument, timeframe);

    int64_t ts = get_timestamp(msg, "ts");

    if (msg.contains("price")) {
        return ObservationMessage{instrument, timeframe,
                                  PriceObservation::tick(get_number(msg, "price"), ts)};
    }
    if (msg.contains("high") && msg.contains("low")) {
        return ObservationMessage{instrument, timeframe,
                                  PriceObservation::range(get_number(msg, "high"),
                                                          get_number(msg, "low"), ts)};
    }
    throw std::invalid_argument("observation needs price or high/low");
}
