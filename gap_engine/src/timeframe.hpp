#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Timeframe labels: M1 M3 M5 M15 H1 H4 D1, plus exchange aliases
// such as "15m" or "4h".
class Timeframe {
public:
    // Canonical upper-case label, or nullopt if the label is unknown
    static std::optional<std::string> normalize(const std::string& label);
    // Throws std::invalid_argument for unknown labels
    static int64_t interval_ms(const std::string& label);
};
