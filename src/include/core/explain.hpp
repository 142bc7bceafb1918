#ifndef CORE_EXPLAIN_HPP_
#define CORE_EXPLAIN_HPP_

#include "errors.hpp"
#include "graph.hpp"
#include "scoring.hpp"

#include <optional>
#include <string>
#include <vector>

namespace TaskLattice {

struct FactorBreakdown {
    std::string task_id;
    double total = 0.0;
    std::vector<Factor> factors;
    bool is_chain_head = false;
    int unblock_count = 0;
    int depth = 0;
    std::string phase;
};

enum class CutKind { Actionable, Finite, Unreachable };

std::string to_string(CutKind kind);

struct UnblockCut {
    std::string task_id;
    CutKind kind = CutKind::Actionable;
    std::vector<std::string> blockers;  // sorted ids, empty unless Finite
    std::optional<CycleReport> cycle;   // set when Unreachable
};

/**
 * @brief Factor breakdown of a task's score record, with the graph facts
 * behind it.
 *
 * Throws TaskNotFoundError for unknown ids and GraphCycleError when the task
 * sits on a cycle; such tasks are not scored.
 */
FactorBreakdown explain_score(const DependencyGraph& graph, const std::vector<ScoreRecord>& scores,
                              const std::string& task_id, const std::string& phase);

/**
 * @brief Every not-done ancestor that has to finish before the task becomes a
 * chain-head.
 *
 * Dependencies are conjunctive, so the minimal cut is the whole open ancestor
 * set. Done tasks are satisfied and end the walk. If the walk meets a task on
 * a cycle the cut is Unreachable rather than a partial answer.
 */
UnblockCut minimal_unblock_cut(const DependencyGraph& graph, const std::string& task_id);

} // namespace TaskLattice

#endif // CORE_EXPLAIN_HPP_
