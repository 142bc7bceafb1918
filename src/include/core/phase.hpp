#ifndef CORE_PHASE_HPP_
#define CORE_PHASE_HPP_

#include "task.hpp"

#include <string>
#include <vector>

namespace TaskLattice {

// Inclusive window of days relative to the semester's first day.
struct PhaseWindow {
    std::string key;
    int first_day;
    int last_day;
};

std::vector<PhaseWindow> default_phase_windows();

/**
 * @brief Picks the weight-table row for a calendar day.
 *
 * Days before the semester start are negative. The first matching window
 * wins; days outside every window fall back to `fallback`.
 */
std::string detect_phase(Timestamp semester_start, Timestamp today,
                         const std::vector<PhaseWindow>& windows = default_phase_windows(),
                         const std::string& fallback = "in_term");

} // namespace TaskLattice

#endif // CORE_PHASE_HPP_
