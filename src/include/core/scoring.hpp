#ifndef CORE_SCORING_HPP_
#define CORE_SCORING_HPP_

#include "config.hpp"
#include "graph.hpp"
#include "task.hpp"

#include <optional>
#include <string>
#include <vector>

namespace TaskLattice {

struct Factor {
    std::string name;
    double raw = 0.0;
    double weight = 0.0;
    double contribution = 0.0;
};

struct ScoreRecord {
    std::string task_id;
    double total = 0.0;
    std::vector<Factor> factors;  // urgency, impact, category_weight, anchor_bonus, chain_head_bonus
};

// --- Factor curves ---
double urgency_raw(const std::optional<Timestamp>& due_at, Timestamp as_of,
                   const UrgencyDecayParams& params);
double impact_raw(int unblock_count, const ImpactParams& params);

/**
 * @brief Everything the ranking order looks at.
 *
 * Higher score first, then higher unblock_count, then chain-heads, then the
 * earlier due date (missing dates last), then the smaller id.
 */
struct RankKey {
    double score = 0.0;
    int unblock_count = 0;
    bool is_chain_head = false;
    std::optional<Timestamp> due_at;
    std::string id;
};

bool ranks_before(const RankKey& a, const RankKey& b);

class Scorer {
public:
    Scorer(const DependencyGraph& graph, const Config& config, Timestamp as_of);

    ScoreRecord score(TaskIndex i) const;

    // Score records for every task outside a cycle, in ranking order.
    std::vector<ScoreRecord> scoreAll() const;

    RankKey rankKey(TaskIndex i, double score) const;

private:
    const DependencyGraph& graph_;
    const Config& config_;
    Timestamp as_of_;
};

} // namespace TaskLattice

#endif // CORE_SCORING_HPP_
