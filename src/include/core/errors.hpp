#ifndef CORE_ERRORS_HPP_
#define CORE_ERRORS_HPP_

#include "task.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace TaskLattice {

// Edge "from depends on to".
struct DependencyEdge {
    std::string from;
    std::string to;
};

struct CycleReport {
    std::vector<std::string> path;   // starts at the lowest id, follows depends_on
    DependencyEdge break_suggestion;
};

std::string describe_cycle(const CycleReport& cycle);

class GraphCycleError : public std::runtime_error {
public:
    explicit GraphCycleError(CycleReport cycle);

    const CycleReport& cycle() const { return cycle_; }

private:
    CycleReport cycle_;
};

class InvalidTransitionError : public std::logic_error {
public:
    InvalidTransitionError(const std::string& task_id, Status from, Status to);

    const std::string& taskId() const { return task_id_; }
    Status from() const { return from_; }
    Status to() const { return to_; }

private:
    std::string task_id_;
    Status from_;
    Status to_;
};

// Exact solver ran past its wall-clock budget. Never leaves the selector.
class SolverTimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class RelaxedConstraint { MinItems, MinCourses };

// A soft constraint could not be met. The selector recovers by relaxing it.
class InfeasibleSelectionError : public std::runtime_error {
public:
    InfeasibleSelectionError(RelaxedConstraint constraint, const std::string& what);

    RelaxedConstraint constraint() const { return constraint_; }

private:
    RelaxedConstraint constraint_;
};

class TaskNotFoundError : public std::out_of_range {
public:
    explicit TaskNotFoundError(const std::string& task_id);

    const std::string& taskId() const { return task_id_; }

private:
    std::string task_id_;
};

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class RefreshCancelledError : public std::runtime_error {
public:
    RefreshCancelledError() : std::runtime_error("refresh cancelled") {}
};

} // namespace TaskLattice

#endif // CORE_ERRORS_HPP_
