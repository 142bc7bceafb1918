#ifndef CORE_GRAPH_HPP_
#define CORE_GRAPH_HPP_

#include "errors.hpp"
#include "task.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace TaskLattice {

using TaskIndex = std::size_t;

struct TaskMetrics {
    bool is_chain_head = false;
    int unblock_count = 0;  // open dependents for which this task is the last blocker
    int depth = 0;          // open dependency hops until a chain-head
    bool cyclic = false;
};

/**
 * @brief Dependency graph over one snapshot.
 *
 * Tasks live in a flat array sorted by id and every edge is an index into it,
 * so iteration order is the id order. Unknown dependency ids are dropped;
 * duplicate task ids keep the first record.
 */
class DependencyGraph {
public:
    explicit DependencyGraph(std::vector<Task> tasks);

    std::size_t size() const { return tasks_.size(); }
    const Task& task(TaskIndex i) const { return tasks_[i]; }
    const std::vector<Task>& tasks() const { return tasks_; }

    std::optional<TaskIndex> find(const std::string& id) const;
    TaskIndex indexOf(const std::string& id) const;  // throws TaskNotFoundError

    const std::vector<TaskIndex>& dependencies(TaskIndex i) const { return dependencies_[i]; }
    const std::vector<TaskIndex>& dependents(TaskIndex i) const { return dependents_[i]; }
    const TaskMetrics& metrics(TaskIndex i) const { return metrics_[i]; }

    bool isDone(TaskIndex i) const { return tasks_[i].status == Status::Done; }

    // --- Cycles ---
    bool isAcyclic() const { return cycles_.empty(); }
    // One report per cyclic component, ordered by lowest member id.
    const std::vector<CycleReport>& cycles() const { return cycles_; }
    const CycleReport* cycleContaining(TaskIndex i) const;
    void requireAcyclic() const;

private:
    std::vector<Task> tasks_;
    std::vector<std::vector<TaskIndex>> dependencies_;
    std::vector<std::vector<TaskIndex>> dependents_;
    std::vector<TaskMetrics> metrics_;
    std::vector<int> component_;
    std::vector<int> cycle_of_component_;
    std::vector<CycleReport> cycles_;

    void buildEdges();
    void detectCycles();
    bool traceCycle(TaskIndex start, std::vector<char>& state,
                    std::vector<TaskIndex>& cycle) const;
    CycleReport makeReport(std::vector<TaskIndex> cycle) const;
    void computeMetrics();
    void computeDepths();
};

} // namespace TaskLattice

#endif // CORE_GRAPH_HPP_
