#pragma once

#include "errors.hpp"
#include "gap.hpp"
#include "mitigation.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <vector>

struct InsertResult {
    GapId id; // id of the stored gap, or of the existing one on duplicate
    std::optional<GapError> error;

    bool inserted() const { return !error.has_value(); }
};

struct ApplyResult {
    bool changed;
    GapState state;
    std::optional<GapError> error;
};

// Owns every gap of every (instrument, timeframe) stream. All access goes
// through one mutex so readers never see a half-applied transition.
class GapRegistry {
public:
    InsertResult insert(const Gap& gap);
    ApplyResult apply_mitigation(GapId id, const MitigationVerdict& verdict);

    // Copies ordered by formed_at within a stream; the all-stream snapshot
    // is grouped by stream key
    std::vector<Gap> snapshot() const;
    std::vector<Gap> snapshot(const StreamKey& key) const;
    std::map<StreamKey, std::vector<Gap>> active_gaps() const;
    std::vector<Gap> active_gaps(const StreamKey& key) const;

    std::optional<Gap> find(GapId id) const;
    std::vector<StreamKey> streams() const;
    size_t size() const;

    // Retention hook for callers; the registry itself never drops gaps
    size_t prune_formed_before(const StreamKey& key, int64_t cutoff_ms);

private:
    mutable std::mutex mutex_;
    GapId next_id_ = 1;
    std::map<GapId, Gap> gaps_;
    std::map<StreamKey, std::vector<GapId>> order_;

    std::vector<Gap> collect(const std::vector<GapId>& ids, bool open_only) const;
};
