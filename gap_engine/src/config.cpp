#include "config.hpp"
#include "candle_window.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "tcp://127.0.0.1:6379");
    cfg.stream_candles = get_env("STREAM_CANDLES", "fvg.feed.candles");
    cfg.stream_ticks = get_env("STREAM_TICKS", "fvg.feed.ticks");
    cfg.stream_gap_events = get_env("STREAM_GAP_EVENTS", "fvg.gap.events");
    cfg.consumer_group = get_env("CONSUMER_GROUP", "gap_engine");
    cfg.consumer_name = get_env("CONSUMER_NAME", "gap_engine_1");
    cfg.read_block_ms = get_env_int("READ_BLOCK_MS", 100);
    cfg.read_batch = get_env_int("READ_BATCH", 100);

    // 200 candles per stream matches the backfill depth of the feed
    cfg.window_capacity = get_env_int("WINDOW_CAPACITY", 200);
    cfg.gap_retention_hours = get_env_int("GAP_RETENTION_HOURS", 0);
    cfg.stats_log_interval_sec = get_env_int("STATS_LOG_INTERVAL_SEC", 60);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8090);

    cfg.service_name = get_env("SERVICE_NAME", "gap_engine");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (redis_url.empty()) {
        throw std::runtime_error("REDIS_URL is required");
    }
    if (stream_candles.empty() || stream_ticks.empty()) {
        throw std::runtime_error("STREAM_CANDLES and STREAM_TICKS are required");
    }
    if (window_capacity < static_cast<int>(CandleWindow::kMinCapacity)) {
        throw std::runtime_error("WINDOW_CAPACITY must be at least 3");
    }
    if (gap_retention_hours < 0) {
        throw std::runtime_error("GAP_RETENTION_HOURS must not be negative");
    }
    if (read_batch <= 0 || read_block_ms < 0) {
        throw std::runtime_error("READ_BATCH must be positive and READ_BLOCK_MS non-negative");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT out of range");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Streams: candles={}, ticks={}, events={}",
                 stream_candles, stream_ticks, stream_gap_events);
    spdlog::info("  Window capacity: {}, retention: {}h", window_capacity, gap_retention_hours);
}
