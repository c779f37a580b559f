#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Redis feed bus
    std::string redis_url;
    std::string stream_candles;
    std::string stream_ticks;
    std::string stream_gap_events;
    std::string consumer_group;
    std::string consumer_name;
    int read_block_ms;
    int read_batch;

    // Engine
    int window_capacity;
    int gap_retention_hours;  // 0 keeps every gap
    int stats_log_interval_sec;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
