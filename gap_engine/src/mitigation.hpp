#pragma once

#include "candle.hpp"
#include "gap.hpp"

enum class MitigationOutcome {
    NoChange,
    Partial,
    Full
};

struct MitigationVerdict {
    MitigationOutcome outcome;
    int64_t timestamp_ms;
};

class MitigationEvaluator {
public:
    // Geometric overlap of the observed range with the gap interval.
    // Observations at or before formed_at never mitigate.
    static MitigationVerdict evaluate(const PriceObservation& obs, const Gap& gap);

    static bool intersects(double low, double high, const Gap& gap);
    static bool covers(double low, double high, const Gap& gap);
};

std::string to_string(MitigationOutcome outcome);
