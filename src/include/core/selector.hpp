#ifndef CORE_SELECTOR_HPP_
#define CORE_SELECTOR_HPP_

#include "config.hpp"
#include "errors.hpp"
#include "scoring.hpp"
#include "task.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace TaskLattice {

struct Candidate {
    RankKey rank;
    std::string course;
    int est_minutes = 0;
    Status status = Status::Todo;

    const std::string& id() const { return rank.id; }
    double score() const { return rank.score; }
};

struct SelectionLimits {
    int timebox_minutes = 90;
    int k = 3;
    int min_items = 0;
    int min_courses = 0;
    int heavy_threshold_minutes = 60;
    std::optional<int> max_heavy;
    std::optional<int> wip_cap;
};

enum class SelectionReason { Ranked, DiversitySwap, CapacityCutoff, CardinalityCutoff };
enum class StrategyKind { Exact, Heuristic };

std::string to_string(SelectionReason reason);
std::string to_string(StrategyKind kind);
std::string to_string(RelaxedConstraint constraint);

struct QueueItem {
    std::string task_id;
    std::string course;
    double score = 0.0;
    int est_minutes = 0;
    SelectionReason reason = SelectionReason::Ranked;
};

struct NowQueue {
    std::vector<QueueItem> items;  // ranking order
    int total_minutes = 0;
    double total_score = 0.0;
    StrategyKind strategy = StrategyKind::Heuristic;
    std::vector<RelaxedConstraint> relaxed;

    bool isRelaxed(RelaxedConstraint constraint) const;
    std::vector<std::string> ids() const;
};

/**
 * @brief Candidates in ranking order plus the limits to honour.
 *
 * course_target and size_target are the soft goals after clamping to what
 * the candidate pool could ever provide.
 */
struct SelectionProblem {
    std::vector<Candidate> candidates;
    SelectionLimits limits;
    int course_target = 0;
    int size_target = 0;
};

// Chosen indices plus the ones the course goal alone brought in.
struct Selection {
    std::vector<std::size_t> chosen;
    std::vector<std::size_t> diversity_picks;
};

// Incremental bookkeeping for the hard constraints.
class SelectionState {
public:
    explicit SelectionState(const SelectionProblem& problem);

    bool canAdd(std::size_t i) const;
    bool canSwap(std::size_t out, std::size_t in) const;
    void add(std::size_t i);
    void remove(std::size_t i);

    const std::vector<std::size_t>& chosen() const { return chosen_; }
    int minutes() const { return minutes_; }
    double score() const { return score_; }
    int distinctCourses() const { return distinct_; }
    int courseCount(const std::string& course) const;

private:
    const SelectionProblem& problem_;
    std::vector<std::size_t> chosen_;
    std::vector<int> course_count_;   // by course slot
    std::vector<int> course_slot_;    // candidate -> course slot, -1 for no course
    int minutes_ = 0;
    int heavy_ = 0;
    int doing_ = 0;
    int distinct_ = 0;
    double score_ = 0.0;

    bool isHeavy(std::size_t i) const;
    bool isDoing(std::size_t i) const;
};

class SelectionStrategy {
public:
    virtual ~SelectionStrategy() = default;
    virtual StrategyKind kind() const = 0;

    // Indices into problem.candidates, ascending.
    virtual std::vector<std::size_t> solve(const SelectionProblem& problem) = 0;
};

/**
 * @brief Branch-and-bound over candidates in ranking order.
 *
 * Maximises total score under the hard limits and requires both soft goals.
 * Equal-valued subsets resolve to the first one met in include-first order.
 * Throws SolverTimeoutError past the deadline and InfeasibleSelectionError
 * when no subset meets the soft goals.
 */
class ExactSolver : public SelectionStrategy {
public:
    ExactSolver(std::chrono::steady_clock::time_point deadline,
                const std::atomic<bool>* cancel = nullptr);

    StrategyKind kind() const override { return StrategyKind::Exact; }
    std::vector<std::size_t> solve(const SelectionProblem& problem) override;

    std::size_t nodesVisited() const { return nodes_; }

private:
    std::chrono::steady_clock::time_point deadline_;
    const std::atomic<bool>* cancel_;
    std::size_t nodes_ = 0;

    // --- Search state ---
    const SelectionProblem* problem_ = nullptr;
    std::vector<double> bound_prefix_;
    std::vector<std::size_t> best_;
    double best_score_ = 0.0;
    bool has_best_ = false;

    void branch(std::size_t i, SelectionState& state);
    double upperBound(std::size_t i, std::size_t slots) const;
    void checkBudget();
};

/**
 * @brief Greedy fill in ranking order, then a bounded diversity repair.
 */
class GreedySolver : public SelectionStrategy {
public:
    StrategyKind kind() const override { return StrategyKind::Heuristic; }
    std::vector<std::size_t> solve(const SelectionProblem& problem) override;

    // Candidates the repair pass traded in during the last solve, ascending.
    const std::vector<std::size_t>& swappedIn() const { return swapped_in_; }

private:
    std::vector<std::size_t> swapped_in_;
};

class QueueSelector {
public:
    explicit QueueSelector(const Config& config, const std::atomic<bool>* cancel = nullptr);

    NowQueue select(std::vector<Candidate> candidates, const SelectionLimits& limits) const;

private:
    const Config& config_;
    const std::atomic<bool>* cancel_;

    std::optional<Selection> solveExact(const SelectionProblem& problem) const;
    NowQueue buildQueue(const SelectionProblem& problem, const Selection& selection,
                        StrategyKind strategy) const;
};

} // namespace TaskLattice

#endif // CORE_SELECTOR_HPP_
