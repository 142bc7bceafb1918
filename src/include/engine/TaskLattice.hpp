#ifndef TASK_LATTICE_HPP_
#define TASK_LATTICE_HPP_

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/explain.hpp"
#include "core/graph.hpp"
#include "core/scoring.hpp"
#include "core/selector.hpp"
#include "core/task.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace TaskLattice {

// Per-call overrides; unset fields take the configured defaults.
struct RefreshRequest {
    std::optional<int> timebox_minutes;
    std::optional<int> k;
    std::optional<int> min_courses;
    std::set<std::string> courses;  // empty: every course
};

struct HealthReport {
    bool dag_ok = true;
    std::optional<std::vector<std::string>> cycle_path;
    std::optional<DependencyEdge> break_suggestion;
    std::size_t cyclic_components = 0;
};

/**
 * @brief Graph facts and score records for one snapshot.
 */
class Analysis {
public:
    Analysis(Snapshot snapshot, const Config& config);

    const DependencyGraph& graph() const { return graph_; }
    const std::vector<ScoreRecord>& scores() const { return scores_; }  // ranking order
    Timestamp asOf() const { return as_of_; }
    const std::string& phase() const { return phase_; }

    std::vector<Candidate> candidates(const std::set<std::string>& courses) const;
    HealthReport health() const;

private:
    DependencyGraph graph_;
    Timestamp as_of_;
    std::string phase_;
    std::vector<ScoreRecord> scores_;
    std::vector<int> score_of_;  // TaskIndex -> position in scores_, -1 for cyclic tasks
};

struct RefreshResult {
    std::shared_ptr<const Analysis> analysis;
    NowQueue queue;
};

/**
 * @brief Caller-facing entry point: refresh, explain and health.
 *
 * Every refresh reads one snapshot from the store and runs graph analysis,
 * scoring and selection over it without shared state. The finished result
 * replaces the previous one in a single swap; explain() and health() read
 * whichever result is current, or analyse a fresh snapshot before the first
 * refresh.
 */
class Engine {
public:
    Engine(const TaskStore& store, Config config);

    NowQueue refresh(const RefreshRequest& request = {},
                     const std::atomic<bool>* cancel = nullptr);

    FactorBreakdown explain(const std::string& task_id) const;
    UnblockCut unblockCut(const std::string& task_id) const;
    HealthReport health() const;
    std::vector<ScoreRecord> scores() const;

    std::shared_ptr<const RefreshResult> latest() const;
    const Config& config() const { return config_; }

private:
    const TaskStore& store_;
    const Config config_;

    mutable std::mutex mu_;
    std::shared_ptr<const RefreshResult> latest_;

    SelectionLimits limitsFor(const RefreshRequest& request) const;
    std::shared_ptr<const Analysis> currentAnalysis() const;
};

} // namespace TaskLattice

#endif // TASK_LATTICE_HPP_
