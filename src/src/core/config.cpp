#include "core/config.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace TaskLattice {

WeightTable default_weight_table() {
    return {
        {"pre_launch", {{"assessment", 1.0}, {"communication", 1.0}, {"content", 1.2},
                        {"materials", 1.3}, {"technical", 1.5}, {"setup", 1.7}}},
        {"launch_week", {{"assessment", 1.5}, {"communication", 1.4}, {"content", 1.2},
                         {"materials", 1.0}, {"technical", 1.0}, {"setup", 1.0}}},
        {"week_one", {{"assessment", 1.7}, {"communication", 1.5}, {"content", 1.2},
                      {"materials", 1.0}, {"technical", 1.0}, {"setup", 0.8}}},
        {"in_term", {{"assessment", 3.0}, {"communication", 2.5}, {"content", 2.0},
                     {"materials", 1.5}, {"technical", 1.0}, {"setup", 0.5}}},
    };
}

namespace {

void require(bool ok, const std::string& message) {
    if (!ok) throw ConfigError(message);
}

bool finite(double value) {
    return std::isfinite(value);
}

} // namespace

void Config::validate() const {
    require(solver_timeout_ms > 0, "solver_timeout_ms must be positive");
    require(max_exact_candidates > 0, "max_exact_candidates must be positive");
    require(default_k > 0, "default_k must be positive");
    require(default_timebox_minutes >= 0, "default_timebox_minutes must be non-negative");
    require(min_courses >= 0, "min_courses must be non-negative");
    require(min_items >= 0, "min_items must be non-negative");
    require(heavy_threshold_minutes > 0, "heavy_threshold_minutes must be positive");
    require(!max_heavy || *max_heavy >= 0, "max_heavy must be non-negative");
    require(!wip_cap || *wip_cap >= 0, "wip_cap must be non-negative");

    require(weight_table.count(phase) > 0, "phase '" + phase + "' has no weight table row");
    for (const auto& [row, weights] : weight_table) {
        for (const auto& [category, value] : weights) {
            require(finite(value), "weight for " + row + "." + category + " is not finite");
        }
    }

    require(finite(urgency.weight) && finite(urgency.max_points) && urgency.max_points >= 0.0,
            "urgency.max_points must be finite and non-negative");
    require(finite(urgency.midpoint_days), "urgency.midpoint_days must be finite");
    require(finite(urgency.scale_days) && urgency.scale_days > 0.0,
            "urgency.scale_days must be positive");
    require(finite(impact.weight) && impact.weight >= 0.0, "impact.weight must be non-negative");
    require(finite(impact.cap) && impact.cap >= 0.0, "impact.cap must be non-negative");
    require(finite(impact.half_saturation) && impact.half_saturation > 0.0,
            "impact.half_saturation must be positive");
    require(finite(category_coefficient), "category_coefficient must be finite");
    require(finite(anchor_bonus), "anchor_bonus must be finite");
    require(finite(chain_head_bonus), "chain_head_bonus must be finite");
}

double Config::categoryWeight(const std::string& category) const {
    auto row = weight_table.find(phase);
    if (row == weight_table.end()) return 0.0;

    std::string key = category;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = row->second.find(key);
    return it == row->second.end() ? 0.0 : it->second;
}

} // namespace TaskLattice
