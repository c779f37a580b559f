#include "timeframe.hpp"
#include "util.hpp"
#include <map>
#include <stdexcept>

namespace {

const std::map<std::string, int64_t>& intervals() {
    static const std::map<std::string, int64_t> table = {
        {"M1", 60LL * 1000},
        {"M3", 3LL * 60 * 1000},
        {"M5", 5LL * 60 * 1000},
        {"M15", 15LL * 60 * 1000},
        {"H1", 60LL * 60 * 1000},
        {"H4", 4LL * 60 * 60 * 1000},
        {"D1", 24LL * 60 * 60 * 1000},
    };
    return table;
}

const std::map<std::string, std::string>& aliases() {
    static const std::map<std::string, std::string> table = {
        {"1m", "M1"}, {"3m", "M3"}, {"5m", "M5"}, {"15m", "M15"},
        {"1h", "H1"}, {"4h", "H4"}, {"1d", "D1"},
    };
    return table;
}

} // namespace

std::optional<std::string> Timeframe::normalize(const std::string& label) {
    auto alias = aliases().find(label);
    if (alias != aliases().end()) return alias->second;

    std::string upper = util::to_upper(label);
    if (intervals().count(upper)) return upper;

    return std::nullopt;
}

int64_t Timeframe::interval_ms(const std::string& label) {
    auto canonical = normalize(label);
    if (!canonical) {
        throw std::invalid_argument("unknown timeframe: " + label);
    }
    return intervals().at(*canonical);
}
