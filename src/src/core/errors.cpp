#include "core/errors.hpp"

#include <sstream>

namespace TaskLattice {

std::string describe_cycle(const CycleReport& cycle) {
    std::ostringstream oss;
    for (const auto& id : cycle.path) {
        oss << id << " -> ";
    }
    if (!cycle.path.empty()) oss << cycle.path.front();
    oss << " (suggest removing " << cycle.break_suggestion.from << " -> "
        << cycle.break_suggestion.to << ")";
    return oss.str();
}

GraphCycleError::GraphCycleError(CycleReport cycle)
    : std::runtime_error("dependency cycle: " + describe_cycle(cycle)),
      cycle_(std::move(cycle)) {}

InvalidTransitionError::InvalidTransitionError(const std::string& task_id, Status from, Status to)
    : std::logic_error("invalid transition for " + task_id + ": " + to_string(from) + " -> " +
                       to_string(to)),
      task_id_(task_id),
      from_(from),
      to_(to) {}

InfeasibleSelectionError::InfeasibleSelectionError(RelaxedConstraint constraint,
                                                   const std::string& what)
    : std::runtime_error(what), constraint_(constraint) {}

TaskNotFoundError::TaskNotFoundError(const std::string& task_id)
    : std::out_of_range("unknown task: " + task_id), task_id_(task_id) {}

} // namespace TaskLattice
