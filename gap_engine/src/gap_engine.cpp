#include "gap_engine.hpp"
#include "gap_detector.hpp"
#include "mitigation.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string to_string(GapEvent event) {
    switch (event) {
        case GapEvent::Formed: return "formed";
        case GapEvent::PartiallyMitigated: return "partially_mitigated";
        case GapEvent::FullyMitigated: return "fully_mitigated";
    }
    return "unknown";
}

bool IngestReport::has_error(GapError error) const {
    return std::find(errors.begin(), errors.end(), error) != errors.end();
}

GapEngine::GapEngine(size_t window_capacity)
    : window_capacity_(window_capacity)
{
    if (window_capacity_ < CandleWindow::kMinCapacity) {
        throw std::invalid_argument("window capacity must be at least 3");
    }
    for (auto& count : error_counts_) {
        count.store(0);
    }
}

void GapEngine::set_event_callback(EventCallback callback) {
    on_event_ = std::move(callback);
}

GapEngine::StreamPipeline& GapEngine::pipeline(const StreamKey& key) {
    std::lock_guard<std::mutex> lock(pipelines_mutex_);
    auto& slot = pipelines_[key];
    if (!slot) {
        slot = std::make_unique<StreamPipeline>(window_capacity_);
        spdlog::info("Tracking stream {} (window {})", key.label(), window_capacity_);
    }
    return *slot;
}

void GapEngine::record(IngestReport& report, GapError error) {
    report.errors.push_back(error);
    error_counts_[static_cast<size_t>(error)].fetch_add(1);
}

void GapEngine::queue(PendingEvents& pending, GapEvent event, GapId id) const {
    if (!on_event_) return;
    auto gap = registry_.find(id);
    if (!gap) return;
    pending.emplace_back(event, std::move(*gap));
}

void GapEngine::dispatch(const PendingEvents& pending) {
    for (const auto& [event, gap] : pending) {
        try {
            on_event_(event, gap);
        } catch (const std::exception& e) {
            spdlog::error("Gap event callback failed: {}", e.what());
        }
    }
}

IngestReport GapEngine::ingest_candle(const std::string& instrument,
                                      const std::string& timeframe,
                                      const Candle& candle) {
    IngestReport report;
    StreamKey key{instrument, timeframe};
    StreamPipeline& p = pipeline(key);
    PendingEvents pending;

    {
        std::lock_guard<std::mutex> lock(p.mutex);

        auto appended = p.window.append(candle);
        if (appended.status == AppendStatus::OutOfOrder) {
            report.accepted = false;
            record(report, GapError::OutOfOrderInput);
            return report;
        }

        for (const auto& closed : appended.newly_closed) {
            // Existing gaps see the closed candle before it can confirm a new one
            mitigate(key, PriceObservation::from_candle(closed), report, pending);
            detect_at(key, p, closed, report, pending);
        }
    }

    dispatch(pending);
    return report;
}

void GapEngine::detect_at(const StreamKey& key, StreamPipeline& p, const Candle& closed,
                          IngestReport& report, PendingEvents& pending) {
    if (p.last_detected_open_ms && closed.open_time_ms <= *p.last_detected_open_ms) {
        return;
    }

    auto triple = p.window.triple_ending_at(closed.open_time_ms);
    if (!triple) {
        spdlog::debug("Not enough closed candles on {} for detection", key.label());
        record(report, GapError::InsufficientData);
        return;
    }
    p.last_detected_open_ms = closed.open_time_ms;

    auto gap = GapDetector::detect(key, *triple);
    if (!gap) return;

    auto inserted = registry_.insert(*gap);
    if (!inserted.inserted()) {
        record(report, *inserted.error);
        return;
    }

    report.gaps_formed.push_back(inserted.id);
    spdlog::info("{} {} gap #{} [{:.6f}, {:.6f}] size {:.4f}%",
                 key.label(), to_string(gap->direction()), inserted.id,
                 gap->lower_bound(), gap->upper_bound(), gap->size_pct());
    queue(pending, GapEvent::Formed, inserted.id);
}

IngestReport GapEngine::ingest_price_observation(const std::string& instrument,
                                                 const std::string& timeframe,
                                                 const PriceObservation& observation) {
    IngestReport report;
    StreamKey key{instrument, timeframe};

    if (observation.high < observation.low) {
        report.accepted = false;
        record(report, GapError::InvalidObservation);
        return report;
    }

    StreamPipeline& p = pipeline(key);
    PendingEvents pending;

    {
        std::lock_guard<std::mutex> lock(p.mutex);

        if (p.last_observation_ms && observation.timestamp_ms < *p.last_observation_ms) {
            spdlog::warn("Rejected out-of-order observation on {}: ts {} < latest {}",
                         key.label(), observation.timestamp_ms, *p.last_observation_ms);
            report.accepted = false;
            record(report, GapError::OutOfOrderInput);
            return report;
        }
        p.last_observation_ms = observation.timestamp_ms;

        mitigate(key, observation, report, pending);
    }

    dispatch(pending);
    return report;
}

void GapEngine::mitigate(const StreamKey& key, const PriceObservation& obs,
                         IngestReport& report, PendingEvents& pending) {
    for (const auto& gap : registry_.active_gaps(key)) {
        auto verdict = MitigationEvaluator::evaluate(obs, gap);
        if (verdict.outcome == MitigationOutcome::NoChange) continue;

        auto applied = registry_.apply_mitigation(gap.id(), verdict);
        if (applied.error) {
            // Gap pruned between the read and the write
            record(report, *applied.error);
            continue;
        }
        if (!applied.changed) continue;

        report.transitions++;
        if (applied.state == GapState::FullyMitigated) {
            spdlog::info("{} {} gap #{} fully mitigated by {} at {}",
                         key.label(), to_string(gap.direction()), gap.id(),
                         to_string(obs.kind), verdict.timestamp_ms);
            queue(pending, GapEvent::FullyMitigated, gap.id());
        } else {
            spdlog::debug("{} {} gap #{} partially mitigated at {}",
                          key.label(), to_string(gap.direction()), gap.id(),
                          verdict.timestamp_ms);
            queue(pending, GapEvent::PartiallyMitigated, gap.id());
        }
    }
}

std::vector<Gap> GapEngine::get_snapshot(const std::string& instrument,
                                         const std::string& timeframe) const {
    return registry_.snapshot(StreamKey{instrument, timeframe});
}

std::vector<Gap> GapEngine::get_active_gaps(const std::string& instrument,
                                            const std::string& timeframe) const {
    return registry_.active_gaps(StreamKey{instrument, timeframe});
}

StatsResult GapEngine::get_stats(const std::string& instrument, const std::string& timeframe,
                                 const StatsFilter& filter) const {
    return StatsAggregator::compute(get_snapshot(instrument, timeframe), filter);
}

std::vector<StreamKey> GapEngine::streams() const {
    std::lock_guard<std::mutex> lock(pipelines_mutex_);
    std::vector<StreamKey> keys;
    for (const auto& [key, _] : pipelines_) {
        keys.push_back(key);
    }
    return keys;
}

size_t GapEngine::prune_formed_before(const std::string& instrument,
                                      const std::string& timeframe, int64_t cutoff_ms) {
    return registry_.prune_formed_before(StreamKey{instrument, timeframe}, cutoff_ms);
}

uint64_t GapEngine::error_count(GapError error) const {
    return error_counts_[static_cast<size_t>(error)].load();
}

std::map<std::string, uint64_t> GapEngine::error_counts() const {
    std::map<std::string, uint64_t> out;
    for (int i = 0; i < kGapErrorKinds; ++i) {
        auto error = static_cast<GapError>(i);
        out[to_string(error)] = error_count(error);
    }
    return out;
}
