#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace util {

std::string current_iso8601() {
    return format_iso8601_ms(current_timestamp_ms());
}

std::string format_iso8601_ms(int64_t timestamp_ms) {
    std::time_t secs = static_cast<std::time_t>(timestamp_ms / 1000);
    int millis = static_cast<int>(timestamp_ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%T") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return str;
}

} // namespace util
