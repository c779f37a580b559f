#include "mitigation.hpp"

bool MitigationEvaluator::intersects(double low, double high, const Gap& gap) {
    return low <= gap.upper_bound() && high >= gap.lower_bound();
}

bool MitigationEvaluator::covers(double low, double high, const Gap& gap) {
    return low <= gap.lower_bound() && high >= gap.upper_bound();
}

MitigationVerdict MitigationEvaluator::evaluate(const PriceObservation& obs, const Gap& gap) {
    MitigationVerdict verdict{MitigationOutcome::NoChange, obs.timestamp_ms};

    if (!gap.is_open()) return verdict;
    if (obs.timestamp_ms <= gap.formed_at_ms()) return verdict;

    if (covers(obs.low, obs.high, gap)) {
        verdict.outcome = MitigationOutcome::Full;
    } else if (intersects(obs.low, obs.high, gap)) {
        verdict.outcome = MitigationOutcome::Partial;
    }

    return verdict;
}

std::string to_string(MitigationOutcome outcome) {
    switch (outcome) {
        case MitigationOutcome::NoChange: return "no_change";
        case MitigationOutcome::Partial: return "partial";
        case MitigationOutcome::Full: return "full";
    }
    return "unknown";
}
