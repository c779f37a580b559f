#pragma once

#include "gap_engine.hpp"
#include "redis_bus.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisBus> redis, const GapEngine& engine);

    nlohmann::json get_status();

    void set_loop_status(const std::string& worker, const std::string& status);

private:
    std::shared_ptr<RedisBus> redis_;
    const GapEngine& engine_;

    std::mutex mutex_;
    std::map<std::string, std::string> loop_status_;
};
