#pragma once

#include "candle.hpp"
#include "candle_window.hpp"
#include "errors.hpp"
#include "gap.hpp"
#include "gap_registry.hpp"
#include "stats.hpp"
#include <array>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class GapEvent {
    Formed,
    PartiallyMitigated,
    FullyMitigated
};

std::string to_string(GapEvent event);

struct IngestReport {
    bool accepted = true;
    std::vector<GapError> errors;
    std::vector<GapId> gaps_formed;
    size_t transitions = 0;

    bool has_error(GapError error) const;
};

// Entry point used by the data feed and the display side. One pipeline
// (window + detector position) per instrument/timeframe; all pipelines
// share a single registry.
class GapEngine {
public:
    using EventCallback = std::function<void(GapEvent, const Gap&)>;

    explicit GapEngine(size_t window_capacity = 200);

    IngestReport ingest_candle(const std::string& instrument, const std::string& timeframe,
                               const Candle& candle);
    IngestReport ingest_price_observation(const std::string& instrument,
                                          const std::string& timeframe,
                                          const PriceObservation& observation);

    std::vector<Gap> get_snapshot(const std::string& instrument, const std::string& timeframe) const;
    std::vector<Gap> get_active_gaps(const std::string& instrument, const std::string& timeframe) const;
    StatsResult get_stats(const std::string& instrument, const std::string& timeframe,
                          const StatsFilter& filter = {}) const;

    std::vector<StreamKey> streams() const;
    size_t prune_formed_before(const std::string& instrument, const std::string& timeframe,
                               int64_t cutoff_ms);

    // Must be set before ingestion starts. Runs after the stream lock is
    // released, so it may block or call back into the engine.
    void set_event_callback(EventCallback callback);

    uint64_t error_count(GapError error) const;
    std::map<std::string, uint64_t> error_counts() const;

    const GapRegistry& registry() const { return registry_; }

private:
    struct StreamPipeline {
        explicit StreamPipeline(size_t capacity) : window(capacity) {}

        std::mutex mutex;
        CandleWindow window;
        std::optional<int64_t> last_detected_open_ms;
        std::optional<int64_t> last_observation_ms;
    };

    size_t window_capacity_;
    GapRegistry registry_;
    EventCallback on_event_;

    mutable std::mutex pipelines_mutex_;
    std::map<StreamKey, std::unique_ptr<StreamPipeline>> pipelines_;

    std::array<std::atomic<uint64_t>, kGapErrorKinds> error_counts_;

    // Gap copies taken at the transition, delivered once the lock is gone
    using PendingEvents = std::vector<std::pair<GapEvent, Gap>>;

    StreamPipeline& pipeline(const StreamKey& key);
    void detect_at(const StreamKey& key, StreamPipeline& p, const Candle& closed,
                   IngestReport& report, PendingEvents& pending);
    void mitigate(const StreamKey& key, const PriceObservation& obs, IngestReport& report,
                  PendingEvents& pending);
    void record(IngestReport& report, GapError error);
    void queue(PendingEvents& pending, GapEvent event, GapId id) const;
    void dispatch(const PendingEvents& pending);
};
