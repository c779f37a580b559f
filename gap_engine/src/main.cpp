#include "config.hpp"
#include "feed_parser.hpp"
#include "gap_engine.hpp"
#include "gap_json.hpp"
#include "health.hpp"
#include "redis_bus.hpp"
#include "timeframe.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("fvgscout", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void candle_loop(const Config& config, std::shared_ptr<RedisBus> bus,
                 GapEngine& engine, HealthCheck& health) {
    spdlog::info("Starting candle loop on {}", config.stream_candles);
    health.set_loop_status("candles", "running");

    while (!shutdown_requested) {
        auto messages = bus->read_messages(config.stream_candles, config.consumer_group,
                                           config.consumer_name, config.read_batch,
                                           config.read_block_ms);
        for (const auto& [msg_id, msg] : messages) {
            try {
                auto parsed = FeedParser::parse_candle(msg);
                auto report = engine.ingest_candle(parsed.instrument, parsed.timeframe,
                                                   parsed.candle);
                if (!report.accepted) {
                    spdlog::debug("Candle {} not applied", msg_id);
                }
            } catch (const std::exception& e) {
                spdlog::error("Error processing candle {}: {}", msg_id, e.what());
            }
            bus->ack_message(config.stream_candles, config.consumer_group, msg_id);
        }
    }

    health.set_loop_status("candles", "stopped");
    spdlog::info("Candle loop stopped");
}

void observation_loop(const Config& config, std::shared_ptr<RedisBus> bus,
                      GapEngine& engine, HealthCheck& health) {
    spdlog::info("Starting observation loop on {}", config.stream_ticks);
    health.set_loop_status("observations", "running");

    while (!shutdown_requested) {
        auto messages = bus->read_messages(config.stream_ticks, config.consumer_group,
                                           config.consumer_name, config.read_batch,
                                           config.read_block_ms);
        for (const auto& [msg_id, msg] : messages) {
            try {
                auto parsed = FeedParser::parse_observation(msg);
                engine.ingest_price_observation(parsed.instrument, parsed.timeframe,
                                                parsed.observation);
            } catch (const std::exception& e) {
                spdlog::error("Error processing observation {}: {}", msg_id, e.what());
            }
            bus->ack_message(config.stream_ticks, config.consumer_group, msg_id);
        }
    }

    health.set_loop_status("observations", "stopped");
    spdlog::info("Observation loop stopped");
}

// Periodic stats line per stream and the optional retention policy
void housekeeping_loop(const Config& config, GapEngine& engine, HealthCheck& health) {
    health.set_loop_status("housekeeping", "running");
    auto last_run = std::chrono::steady_clock::now();

    while (!shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        auto now = std::chrono::steady_clock::now();
        if (now - last_run < std::chrono::seconds(config.stats_log_interval_sec)) continue;
        last_run = now;

        for (const auto& key : engine.streams()) {
            if (config.gap_retention_hours > 0) {
                int64_t cutoff = util::current_timestamp_ms() -
                                 static_cast<int64_t>(config.gap_retention_hours) * 3600 * 1000;
                engine.prune_formed_before(key.instrument, key.timeframe, cutoff);
            }

            auto stats = engine.get_stats(key.instrument, key.timeframe);
            spdlog::info("{}: {} gaps ({} bull / {} bear), {} open, mitigation rate {:.1f}%, "
                         "avg size {:.4f}%, avg time to mitigation {}",
                         key.label(), stats.total, stats.bullish, stats.bearish,
                         stats.active + stats.partially_mitigated,
                         stats.mitigation_rate * 100.0, stats.average_size_pct,
                         stats.average_time_to_mitigation_ms
                             ? std::to_string(*stats.average_time_to_mitigation_ms / 3600000.0) + "h"
                             : std::string("n/a"));
        }
    }

    health.set_loop_status("housekeeping", "stopped");
}

bool parse_query_ts(const httplib::Request& req, const char* name, std::optional<int64_t>& out) {
    if (!req.has_param(name)) return true;
    try {
        out = std::stoll(req.get_param_value(name));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::optional<StreamKey> stream_from_request(const httplib::Request& req, httplib::Response& res) {
    if (!req.has_param("instrument") || !req.has_param("timeframe")) {
        res.status = 400;
        res.set_content(R"({"error":"instrument and timeframe are required"})",
                        "application/json");
        return std::nullopt;
    }
    auto timeframe = Timeframe::normalize(req.get_param_value("timeframe"));
    if (!timeframe) {
        res.status = 400;
        res.set_content(R"({"error":"unknown timeframe"})", "application/json");
        return std::nullopt;
    }
    return StreamKey{util::to_upper(req.get_param_value("instrument")), *timeframe};
}

void register_routes(httplib::Server& server, GapEngine& engine, HealthCheck& health) {
    server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
        auto status = health.get_status();
        res.set_content(status.dump(), "application/json");
        res.status = status["ok"].get<bool>() ? 200 : 503;
    });

    server.Get("/gaps", [&engine](const httplib::Request& req, httplib::Response& res) {
        auto key = stream_from_request(req, res);
        if (!key) return;

        bool active_only = req.has_param("state") && req.get_param_value("state") == "active";
        auto gaps = active_only ? engine.get_active_gaps(key->instrument, key->timeframe)
                                : engine.get_snapshot(key->instrument, key->timeframe);
        res.set_content(gaps_to_json(*key, gaps).dump(), "application/json");
    });

    server.Get("/stats", [&engine](const httplib::Request& req, httplib::Response& res) {
        auto key = stream_from_request(req, res);
        if (!key) return;

        StatsFilter filter;
        if (!parse_query_ts(req, "from", filter.from_ms) ||
            !parse_query_ts(req, "to", filter.to_ms)) {
            res.status = 400;
            res.set_content(R"({"error":"from/to must be epoch milliseconds"})",
                            "application/json");
            return;
        }
        if (req.has_param("direction")) {
            filter.direction = parse_direction(req.get_param_value("direction"));
            if (!filter.direction) {
                res.status = 400;
                res.set_content(R"({"error":"direction must be bullish or bearish"})",
                                "application/json");
                return;
            }
        }

        nlohmann::json body = {
            {"stream", *key},
            {"stats", engine.get_stats(key->instrument, key->timeframe, filter)}
        };
        res.set_content(body.dump(), "application/json");
    });
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("FvgScout Gap Engine");
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        GapEngine engine(static_cast<size_t>(config.window_capacity));

        // Separate connections so the two blocking readers never share one
        auto candle_bus = std::make_shared<RedisBus>(config.redis_url);
        auto tick_bus = std::make_shared<RedisBus>(config.redis_url);
        auto event_bus = std::make_shared<RedisBus>(config.redis_url);

        candle_bus->create_consumer_group(config.stream_candles, config.consumer_group);
        tick_bus->create_consumer_group(config.stream_ticks, config.consumer_group);

        if (!config.stream_gap_events.empty()) {
            engine.set_event_callback([event_bus, &config](GapEvent event, const Gap& gap) {
                nlohmann::json payload = {
                    {"type", "gap." + to_string(event)},
                    {"gap", gap},
                    {"ts", util::current_iso8601()}
                };
                event_bus->publish_event(config.stream_gap_events, payload);
            });
        }

        HealthCheck health(event_bus, engine);

        std::thread candle_thread(candle_loop, std::cref(config), candle_bus,
                                  std::ref(engine), std::ref(health));
        std::thread observation_thread(observation_loop, std::cref(config), tick_bus,
                                       std::ref(engine), std::ref(health));
        std::thread housekeeping_thread(housekeeping_loop, std::cref(config),
                                        std::ref(engine), std::ref(health));

        httplib::Server server;
        register_routes(server, engine, health);

        std::thread http_thread([&server, &config]() {
            spdlog::info("Starting HTTP server on {}:{}", config.listen_addr, config.listen_port);
            server.listen(config.listen_addr.c_str(), config.listen_port);
        });

        spdlog::info("Gap engine started");

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        spdlog::info("Stopping services...");
        server.stop();

        if (candle_thread.joinable()) candle_thread.join();
        if (observation_thread.joinable()) observation_thread.join();
        if (housekeeping_thread.joinable()) housekeeping_thread.join();
        if (http_thread.joinable()) http_thread.join();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
