#pragma once

#include "gap.hpp"
#include "stats.hpp"
#include <nlohmann/json.hpp>
#include <vector>

void to_json(nlohmann::json& j, const StreamKey& key);
void to_json(nlohmann::json& j, const Gap& gap);
void to_json(nlohmann::json& j, const StatsResult& stats);

nlohmann::json gaps_to_json(const StreamKey& key, const std::vector<Gap>& gaps);
