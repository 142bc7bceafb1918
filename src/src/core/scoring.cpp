#include "core/scoring.hpp"

#include <algorithm>
#include <cmath>

namespace TaskLattice {

namespace {

double sigmoid(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

Factor make_factor(const char* name, double raw, double weight) {
    return Factor{name, raw, weight, raw * weight};
}

} // namespace

double urgency_raw(const std::optional<Timestamp>& due_at, Timestamp as_of,
                   const UrgencyDecayParams& params) {
    if (!due_at) return 0.0;
    const double days_left =
        static_cast<double>((*due_at - as_of).count()) / 86400.0;
    const double value =
        params.max_points * (1.0 - sigmoid((days_left - params.midpoint_days) / params.scale_days));
    return std::max(0.0, value);
}

double impact_raw(int unblock_count, const ImpactParams& params) {
    if (unblock_count <= 0) return 0.0;
    const double n = static_cast<double>(unblock_count);
    return params.cap * n / (n + params.half_saturation);
}

bool ranks_before(const RankKey& a, const RankKey& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.unblock_count != b.unblock_count) return a.unblock_count > b.unblock_count;
    if (a.is_chain_head != b.is_chain_head) return a.is_chain_head;
    if (a.due_at != b.due_at) {
        if (!a.due_at) return false;
        if (!b.due_at) return true;
        return *a.due_at < *b.due_at;
    }
    return a.id < b.id;
}

Scorer::Scorer(const DependencyGraph& graph, const Config& config, Timestamp as_of)
    : graph_(graph), config_(config), as_of_(as_of) {}

ScoreRecord Scorer::score(TaskIndex i) const {
    const Task& task = graph_.task(i);
    const TaskMetrics& m = graph_.metrics(i);

    ScoreRecord record;
    record.task_id = task.id;
    record.factors.reserve(5);
    record.factors.push_back(make_factor("urgency", urgency_raw(task.due_at, as_of_, config_.urgency),
                                         config_.urgency.weight));
    record.factors.push_back(make_factor("impact", impact_raw(m.unblock_count, config_.impact),
                                         config_.impact.weight));
    record.factors.push_back(make_factor("category_weight", config_.categoryWeight(task.category),
                                         config_.category_coefficient));
    record.factors.push_back(make_factor("anchor_bonus", task.anchor ? 1.0 : 0.0,
                                         config_.anchor_bonus));
    record.factors.push_back(make_factor("chain_head_bonus", m.is_chain_head ? 1.0 : 0.0,
                                         config_.chain_head_bonus));

    // Summed in factor order; explanations add up the same way.
    double total = 0.0;
    for (const auto& f : record.factors) total += f.contribution;
    record.total = total;
    return record;
}

std::vector<ScoreRecord> Scorer::scoreAll() const {
    std::vector<ScoreRecord> records;
    std::vector<RankKey> keys;
    for (TaskIndex i = 0; i < graph_.size(); ++i) {
        if (graph_.metrics(i).cyclic) continue;
        records.push_back(score(i));
        keys.push_back(rankKey(i, records.back().total));
    }

    std::vector<std::size_t> order(records.size());
    for (std::size_t k = 0; k < order.size(); ++k) order[k] = k;
    std::sort(order.begin(), order.end(),
              [&keys](std::size_t a, std::size_t b) { return ranks_before(keys[a], keys[b]); });

    std::vector<ScoreRecord> ranked;
    ranked.reserve(records.size());
    for (std::size_t k : order) ranked.push_back(std::move(records[k]));
    return ranked;
}

RankKey Scorer::rankKey(TaskIndex i, double score) const {
    const Task& task = graph_.task(i);
    const TaskMetrics& m = graph_.metrics(i);
    return RankKey{score, m.unblock_count, m.is_chain_head, task.due_at, task.id};
}

} // namespace TaskLattice
