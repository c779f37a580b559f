#include "gap_registry.hpp"
#include <algorithm>
#include <cstddef>
#include <spdlog/spdlog.h>

InsertResult GapRegistry::insert(const Gap& gap) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& ids = order_[gap.key()];

    // ids are sorted by formed_at; identities can only collide inside the
    // run of equal formation times
    auto pos = std::upper_bound(ids.begin(), ids.end(), gap.formed_at_ms(),
        [this](int64_t formed_at, GapId id) {
            return formed_at < gaps_.at(id).formed_at_ms();
        });

    for (auto it = pos; it != ids.begin();) {
        --it;
        const Gap& existing = gaps_.at(*it);
        if (existing.formed_at_ms() != gap.formed_at_ms()) break;
        if (existing.same_identity(gap)) {
            spdlog::debug("Duplicate {} gap on {} formed at {}",
                          to_string(gap.direction()), gap.key().label(), gap.formed_at_ms());
            return InsertResult{existing.id(), GapError::DuplicateGap};
        }
    }

    Gap stored = gap;
    stored.id_ = next_id_++;
    stored.state_ = GapState::Active;
    stored.mitigation_started_at_ms_.reset();
    stored.mitigation_completed_at_ms_.reset();
    stored.last_touched_at_ms_.reset();

    GapId id = stored.id_;
    ids.insert(pos, id);
    gaps_.emplace(id, std::move(stored));

    return InsertResult{id, std::nullopt};
}

ApplyResult GapRegistry::apply_mitigation(GapId id, const MitigationVerdict& verdict) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = gaps_.find(id);
    if (it == gaps_.end()) {
        spdlog::debug("Mitigation for unknown gap {}", id);
        return ApplyResult{false, GapState::Active, GapError::UnknownGap};
    }

    Gap& gap = it->second;
    ApplyResult result{false, gap.state_, std::nullopt};

    if (gap.state_ == GapState::FullyMitigated) return result;
    if (verdict.timestamp_ms <= gap.formed_at_ms_) return result;

    switch (verdict.outcome) {
        case MitigationOutcome::NoChange:
            break;

        case MitigationOutcome::Partial:
            gap.last_touched_at_ms_ = std::max(verdict.timestamp_ms,
                                               gap.last_touched_at_ms_.value_or(verdict.timestamp_ms));
            if (gap.state_ == GapState::Active) {
                gap.state_ = GapState::PartiallyMitigated;
                gap.mitigation_started_at_ms_ = verdict.timestamp_ms;
                result.changed = true;
            }
            break;

        case MitigationOutcome::Full: {
            int64_t started = gap.mitigation_started_at_ms_.value_or(verdict.timestamp_ms);
            gap.mitigation_started_at_ms_ = started;
            gap.mitigation_completed_at_ms_ = std::max(verdict.timestamp_ms, started);
            gap.last_touched_at_ms_ = std::max(*gap.mitigation_completed_at_ms_,
                                               gap.last_touched_at_ms_.value_or(verdict.timestamp_ms));
            gap.state_ = GapState::FullyMitigated;
            result.changed = true;
            break;
        }
    }

    result.state = gap.state_;
    return result;
}

std::vector<Gap> GapRegistry::collect(const std::vector<GapId>& ids, bool open_only) const {
    std::vector<Gap> out;
    out.reserve(ids.size());
    for (GapId id : ids) {
        const Gap& gap = gaps_.at(id);
        if (open_only && !gap.is_open()) continue;
        out.push_back(gap);
    }
    return out;
}

std::vector<Gap> GapRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Gap> out;
    out.reserve(gaps_.size());
    for (const auto& [key, ids] : order_) {
        auto part = collect(ids, false);
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

std::vector<Gap> GapRegistry::snapshot(const StreamKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = order_.find(key);
    if (it == order_.end()) return {};
    return collect(it->second, false);
}

std::map<StreamKey, std::vector<Gap>> GapRegistry::active_gaps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<StreamKey, std::vector<Gap>> out;
    for (const auto& [key, ids] : order_) {
        out[key] = collect(ids, true);
    }
    return out;
}

std::vector<Gap> GapRegistry::active_gaps(const StreamKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = order_.find(key);
    if (it == order_.end()) return {};
    return collect(it->second, true);
}

std::optional<Gap> GapRegistry::find(GapId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gaps_.find(id);
    if (it == gaps_.end()) return std::nullopt;
    return it->second;
}

std::vector<StreamKey> GapRegistry::streams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StreamKey> keys;
    for (const auto& [key, _] : order_) {
        keys.push_back(key);
    }
    return keys;
}

size_t GapRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gaps_.size();
}

size_t GapRegistry::prune_formed_before(const StreamKey& key, int64_t cutoff_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = order_.find(key);
    if (it == order_.end()) return 0;

    auto& ids = it->second;
    size_t removed = 0;
    while (removed < ids.size() && gaps_.at(ids[removed]).formed_at_ms() < cutoff_ms) {
        gaps_.erase(ids[removed]);
        ++removed;
    }
    ids.erase(ids.begin(), ids.begin() + static_cast<std::ptrdiff_t>(removed));

    if (removed > 0) {
        spdlog::debug("Pruned {} gaps on {} formed before {}", removed, key.label(), cutoff_ms);
    }
    return removed;
}
