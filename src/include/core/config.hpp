#ifndef CORE_CONFIG_HPP_
#define CORE_CONFIG_HPP_

#include <map>
#include <optional>
#include <string>

namespace TaskLattice {

// urgency raw = max_points * (1 - sigmoid((days_left - midpoint_days) / scale_days))
struct UrgencyDecayParams {
    double weight = 1.0;
    double max_points = 10.0;
    double midpoint_days = 3.0;
    double scale_days = 2.0;
};

// impact raw = cap * n / (n + half_saturation)
struct ImpactParams {
    double weight = 3.0;
    double cap = 10.0;
    double half_saturation = 2.0;
};

using CategoryWeights = std::map<std::string, double>;
using WeightTable = std::map<std::string, CategoryWeights>;

WeightTable default_weight_table();

struct Config {
    // --- Selection ---
    bool exact_solver_enabled = true;
    int solver_timeout_ms = 2000;
    int max_exact_candidates = 40;
    int default_k = 3;
    int default_timebox_minutes = 90;
    int min_courses = 2;
    int min_items = 0;
    int heavy_threshold_minutes = 60;
    std::optional<int> max_heavy;
    std::optional<int> wip_cap;

    // --- Scoring ---
    std::string phase = "in_term";
    WeightTable weight_table = default_weight_table();
    UrgencyDecayParams urgency;
    ImpactParams impact;
    double category_coefficient = 0.5;
    double anchor_bonus = 15.0;
    double chain_head_bonus = 10.0;

    /**
     * @brief Throws ConfigError describing the first bad field.
     */
    void validate() const;

    /**
     * @brief Weight of a category in the active phase row (case-insensitive),
     * 0.0 when the row has no entry for it.
     */
    double categoryWeight(const std::string& category) const;
};

} // namespace TaskLattice

#endif // CORE_CONFIG_HPP_
