#pragma once

#include <cstdint>
#include <string>
#include <chrono>

namespace util {
    std::string current_iso8601();
    std::string format_iso8601_ms(int64_t timestamp_ms);
    int64_t current_timestamp_ms();
    std::string to_upper(std::string str);
}
