#include "core/phase.hpp"

#include <chrono>

namespace TaskLattice {

std::vector<PhaseWindow> default_phase_windows() {
    return {
        {"pre_launch", -30, -8},
        {"launch_week", -7, 0},
        {"week_one", 1, 7},
        {"in_term", 8, 120},
    };
}

std::string detect_phase(Timestamp semester_start, Timestamp today,
                         const std::vector<PhaseWindow>& windows, const std::string& fallback) {
    using Days = std::chrono::duration<long long, std::ratio<86400>>;
    const long long days = std::chrono::floor<Days>(today - semester_start).count();

    for (const auto& window : windows) {
        if (window.first_day <= days && days <= window.last_day) return window.key;
    }
    return fallback;
}

} // namespace TaskLattice
