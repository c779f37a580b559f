#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis, const GapEngine& engine)
    : redis_(redis), engine_(engine) {}

void HealthCheck::set_loop_status(const std::string& worker, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_[worker] = status;
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();

    nlohmann::json loops = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [worker, status] : loop_status_) {
            loops[worker] = status;
        }
    }

    return {
        {"ok", redis_ok},
        {"redis", redis_ok},
        {"loops", loops},
        {"streams", engine_.streams().size()},
        {"gaps", engine_.registry().size()},
        {"errors", engine_.error_counts()},
        {"ts", util::current_iso8601()}
    };
}
