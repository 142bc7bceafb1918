#include "core/explain.hpp"

#include <algorithm>

namespace TaskLattice {

std::string to_string(CutKind kind) {
    switch (kind) {
        case CutKind::Actionable: return "actionable";
        case CutKind::Finite: return "finite";
        case CutKind::Unreachable: return "unreachable";
    }
    return "unknown";
}

FactorBreakdown explain_score(const DependencyGraph& graph, const std::vector<ScoreRecord>& scores,
                              const std::string& task_id, const std::string& phase) {
    const TaskIndex i = graph.indexOf(task_id);
    if (const CycleReport* cycle = graph.cycleContaining(i)) {
        throw GraphCycleError(*cycle);
    }

    auto it = std::find_if(scores.begin(), scores.end(),
                           [&task_id](const ScoreRecord& r) { return r.task_id == task_id; });
    if (it == scores.end()) throw TaskNotFoundError(task_id);

    const TaskMetrics& m = graph.metrics(i);
    FactorBreakdown breakdown;
    breakdown.task_id = task_id;
    breakdown.total = it->total;
    breakdown.factors = it->factors;
    breakdown.is_chain_head = m.is_chain_head;
    breakdown.unblock_count = m.unblock_count;
    breakdown.depth = m.depth;
    breakdown.phase = phase;
    return breakdown;
}

UnblockCut minimal_unblock_cut(const DependencyGraph& graph, const std::string& task_id) {
    const TaskIndex target = graph.indexOf(task_id);

    UnblockCut cut;
    cut.task_id = task_id;

    if (const CycleReport* cycle = graph.cycleContaining(target)) {
        cut.kind = CutKind::Unreachable;
        cut.cycle = *cycle;
        return cut;
    }
    if (graph.metrics(target).is_chain_head) {
        cut.kind = CutKind::Actionable;
        return cut;
    }

    std::vector<bool> seen(graph.size(), false);
    std::vector<TaskIndex> stack{target};
    seen[target] = true;
    std::vector<TaskIndex> open;

    while (!stack.empty()) {
        const TaskIndex u = stack.back();
        stack.pop_back();
        for (TaskIndex w : graph.dependencies(u)) {
            if (seen[w] || graph.isDone(w)) continue;
            seen[w] = true;
            if (const CycleReport* cycle = graph.cycleContaining(w)) {
                cut.kind = CutKind::Unreachable;
                cut.cycle = *cycle;
                return cut;
            }
            open.push_back(w);
            stack.push_back(w);
        }
    }

    // Indices follow id order.
    std::sort(open.begin(), open.end());
    cut.kind = CutKind::Finite;
    for (TaskIndex w : open) cut.blockers.push_back(graph.task(w).id);
    return cut;
}

} // namespace TaskLattice
