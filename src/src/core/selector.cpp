#include "core/selector.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

namespace TaskLattice {

namespace {

constexpr double kScoreEpsilon = 1e-9;

} // namespace

std::string to_string(SelectionReason reason) {
    switch (reason) {
        case SelectionReason::Ranked: return "ranked";
        case SelectionReason::DiversitySwap: return "diversity swap";
        case SelectionReason::CapacityCutoff: return "capacity-bound cutoff";
        case SelectionReason::CardinalityCutoff: return "cardinality cutoff";
    }
    return "unknown";
}

std::string to_string(StrategyKind kind) {
    return kind == StrategyKind::Exact ? "exact" : "heuristic";
}

std::string to_string(RelaxedConstraint constraint) {
    return constraint == RelaxedConstraint::MinCourses ? "min_courses" : "min_items";
}

bool NowQueue::isRelaxed(RelaxedConstraint constraint) const {
    return std::find(relaxed.begin(), relaxed.end(), constraint) != relaxed.end();
}

std::vector<std::string> NowQueue::ids() const {
    std::vector<std::string> out;
    out.reserve(items.size());
    for (const auto& item : items) out.push_back(item.task_id);
    return out;
}

// ------------------------------
// SelectionState
// ------------------------------

SelectionState::SelectionState(const SelectionProblem& problem)
    : problem_(problem), course_slot_(problem.candidates.size(), -1) {
    std::vector<std::string> courses;
    for (const auto& c : problem.candidates) {
        if (!c.course.empty()) courses.push_back(c.course);
    }
    std::sort(courses.begin(), courses.end());
    courses.erase(std::unique(courses.begin(), courses.end()), courses.end());
    course_count_.assign(courses.size(), 0);

    for (std::size_t i = 0; i < problem.candidates.size(); ++i) {
        const auto& course = problem.candidates[i].course;
        if (course.empty()) continue;
        auto it = std::lower_bound(courses.begin(), courses.end(), course);
        course_slot_[i] = static_cast<int>(it - courses.begin());
    }
}

bool SelectionState::isHeavy(std::size_t i) const {
    return problem_.candidates[i].est_minutes >= problem_.limits.heavy_threshold_minutes;
}

bool SelectionState::isDoing(std::size_t i) const {
    return problem_.candidates[i].status == Status::Doing;
}

bool SelectionState::canAdd(std::size_t i) const {
    const auto& limits = problem_.limits;
    if (static_cast<int>(chosen_.size()) >= limits.k) return false;
    if (minutes_ + problem_.candidates[i].est_minutes > limits.timebox_minutes) return false;
    if (limits.max_heavy && isHeavy(i) && heavy_ >= *limits.max_heavy) return false;
    if (limits.wip_cap && isDoing(i) && doing_ >= *limits.wip_cap) return false;
    return true;
}

bool SelectionState::canSwap(std::size_t out, std::size_t in) const {
    const auto& limits = problem_.limits;
    const int minutes =
        minutes_ - problem_.candidates[out].est_minutes + problem_.candidates[in].est_minutes;
    if (minutes > limits.timebox_minutes) return false;
    if (limits.max_heavy && heavy_ - isHeavy(out) + isHeavy(in) > *limits.max_heavy) return false;
    if (limits.wip_cap && doing_ - isDoing(out) + isDoing(in) > *limits.wip_cap) return false;
    return true;
}

void SelectionState::add(std::size_t i) {
    chosen_.insert(std::lower_bound(chosen_.begin(), chosen_.end(), i), i);
    minutes_ += problem_.candidates[i].est_minutes;
    score_ += problem_.candidates[i].score();
    if (isHeavy(i)) ++heavy_;
    if (isDoing(i)) ++doing_;
    const int slot = course_slot_[i];
    if (slot >= 0 && course_count_[slot]++ == 0) ++distinct_;
}

void SelectionState::remove(std::size_t i) {
    auto it = std::lower_bound(chosen_.begin(), chosen_.end(), i);
    if (it == chosen_.end() || *it != i) return;
    chosen_.erase(it);
    minutes_ -= problem_.candidates[i].est_minutes;
    score_ -= problem_.candidates[i].score();
    if (isHeavy(i)) --heavy_;
    if (isDoing(i)) --doing_;
    const int slot = course_slot_[i];
    if (slot >= 0 && --course_count_[slot] == 0) --distinct_;
}

int SelectionState::courseCount(const std::string& course) const {
    for (std::size_t i = 0; i < problem_.candidates.size(); ++i) {
        if (course_slot_[i] >= 0 && problem_.candidates[i].course == course) {
            return course_count_[course_slot_[i]];
        }
    }
    return 0;
}

// ------------------------------
// ExactSolver
// ------------------------------

ExactSolver::ExactSolver(std::chrono::steady_clock::time_point deadline,
                         const std::atomic<bool>* cancel)
    : deadline_(deadline), cancel_(cancel) {}

std::vector<std::size_t> ExactSolver::solve(const SelectionProblem& problem) {
    problem_ = &problem;
    nodes_ = 0;
    best_.clear();
    best_score_ = 0.0;
    has_best_ = false;

    // Candidates arrive best score first, so the next `slots` positive scores
    // bound anything the remaining suffix can add.
    const std::size_t n = problem.candidates.size();
    bound_prefix_.assign(n + 1, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        bound_prefix_[i + 1] = bound_prefix_[i] + std::max(0.0, problem.candidates[i].score());
    }

    SelectionState state(problem);
    branch(0, state);

    if (!has_best_) {
        const bool courses_short = problem.course_target > 0;
        throw InfeasibleSelectionError(
            courses_short ? RelaxedConstraint::MinCourses : RelaxedConstraint::MinItems,
            "no selection satisfies min_courses=" + std::to_string(problem.course_target) +
                " and min_items=" + std::to_string(problem.size_target));
    }
    return best_;
}

double ExactSolver::upperBound(std::size_t i, std::size_t slots) const {
    const std::size_t end = std::min(bound_prefix_.size() - 1, i + slots);
    return bound_prefix_[end] - bound_prefix_[i];
}

void ExactSolver::checkBudget() {
    if ((nodes_++ & 0xFF) != 0) return;
    if (cancel_ && cancel_->load()) throw RefreshCancelledError();
    if (std::chrono::steady_clock::now() >= deadline_) {
        throw SolverTimeoutError("exact selection exceeded its time budget after " +
                                 std::to_string(nodes_) + " nodes");
    }
}

void ExactSolver::branch(std::size_t i, SelectionState& state) {
    checkBudget();

    const auto& problem = *problem_;
    const std::size_t n = problem.candidates.size();
    const std::size_t taken = state.chosen().size();
    const std::size_t slots = static_cast<std::size_t>(problem.limits.k) > taken
                                  ? static_cast<std::size_t>(problem.limits.k) - taken
                                  : 0;
    const std::size_t reachable = std::min(slots, n - i);

    if (taken + reachable < static_cast<std::size_t>(problem.size_target)) return;
    if (static_cast<std::size_t>(state.distinctCourses()) + reachable <
        static_cast<std::size_t>(problem.course_target)) {
        return;
    }
    if (has_best_ && state.score() + upperBound(i, slots) <= best_score_ + kScoreEpsilon) return;

    if (i == n || slots == 0) {
        // Both soft goals hold here thanks to the pruning above.
        best_ = state.chosen();
        best_score_ = state.score();
        has_best_ = true;
        return;
    }

    if (state.canAdd(i)) {
        state.add(i);
        branch(i + 1, state);
        state.remove(i);
    }
    branch(i + 1, state);
}

// ------------------------------
// GreedySolver
// ------------------------------

std::vector<std::size_t> GreedySolver::solve(const SelectionProblem& problem) {
    const std::size_t n = problem.candidates.size();
    SelectionState state(problem);
    swapped_in_.clear();

    for (std::size_t i = 0; i < n; ++i) {
        if (static_cast<int>(state.chosen().size()) >= problem.limits.k) break;
        if (state.canAdd(i)) state.add(i);
    }

    // Repair pass: trade the weakest member of a doubled-up course for the
    // best candidate from a course not yet represented.
    std::size_t swaps = 0;
    while (state.distinctCourses() < problem.course_target && swaps < n) {
        bool swapped = false;
        for (std::size_t in = 0; in < n && !swapped; ++in) {
            const auto& course = problem.candidates[in].course;
            if (course.empty() || state.courseCount(course) > 0) continue;

            const std::vector<std::size_t> members = state.chosen();
            for (auto it = members.rbegin(); it != members.rend(); ++it) {
                const std::size_t out = *it;
                const auto& out_course = problem.candidates[out].course;
                if (!out_course.empty() && state.courseCount(out_course) < 2) continue;
                if (!state.canSwap(out, in)) continue;

                log::debug() << "Diversity swap: " << problem.candidates[out].id() << " -> "
                             << problem.candidates[in].id() << std::endl;
                state.remove(out);
                state.add(in);
                swapped_in_.push_back(in);
                swapped = true;
                ++swaps;
                break;
            }
        }
        if (!swapped) break;
    }

    std::sort(swapped_in_.begin(), swapped_in_.end());
    return state.chosen();
}

// ------------------------------
// QueueSelector
// ------------------------------

QueueSelector::QueueSelector(const Config& config, const std::atomic<bool>* cancel)
    : config_(config), cancel_(cancel) {}

NowQueue QueueSelector::select(std::vector<Candidate> candidates,
                               const SelectionLimits& limits) const {
    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& a, const Candidate& b) { return ranks_before(a.rank, b.rank); });

    SelectionProblem problem;
    problem.candidates = std::move(candidates);
    problem.limits = limits;

    std::set<std::string> courses;
    for (const auto& c : problem.candidates) {
        if (!c.course.empty()) courses.insert(c.course);
    }
    const int pool = static_cast<int>(problem.candidates.size());
    problem.course_target =
        std::min({limits.min_courses, static_cast<int>(courses.size()), limits.k});
    problem.size_target = std::min({limits.min_items, pool, limits.k});

    if (config_.exact_solver_enabled && pool <= config_.max_exact_candidates) {
        if (auto selection = solveExact(problem)) {
            return buildQueue(problem, *selection, StrategyKind::Exact);
        }
    } else if (config_.exact_solver_enabled) {
        log::debug() << pool << " candidates exceed the exact solver limit of "
                     << config_.max_exact_candidates << ", using heuristic" << std::endl;
    }

    GreedySolver greedy;
    SelectionStrategy& strategy = greedy;
    Selection selection;
    selection.chosen = strategy.solve(problem);
    for (std::size_t i : greedy.swappedIn()) {
        if (std::binary_search(selection.chosen.begin(), selection.chosen.end(), i)) {
            selection.diversity_picks.push_back(i);
        }
    }
    return buildQueue(problem, selection, strategy.kind());
}

std::optional<Selection> QueueSelector::solveExact(const SelectionProblem& problem) const {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.solver_timeout_ms);

    auto run = [&](int course_target, int size_target) {
        SelectionProblem attempt = problem;
        attempt.course_target = course_target;
        attempt.size_target = size_target;

        ExactSolver exact(deadline, cancel_);
        SelectionStrategy& strategy = exact;
        auto chosen = strategy.solve(attempt);
        log::debug() << "Exact selection finished after " << exact.nodesVisited() << " nodes"
                     << std::endl;
        return chosen;
    };

    // Soft goals are dropped in this order until a selection exists.
    const int c = problem.course_target;
    const int s = problem.size_target;
    std::vector<std::pair<int, int>> attempts;
    for (const auto& attempt : {std::make_pair(c, s), std::make_pair(0, s), std::make_pair(c, 0),
                                std::make_pair(0, 0)}) {
        if (std::find(attempts.begin(), attempts.end(), attempt) == attempts.end()) {
            attempts.push_back(attempt);
        }
    }

    for (const auto& [course_target, size_target] : attempts) {
        try {
            Selection selection;
            selection.chosen = run(course_target, size_target);

            // Items missing from the best selection without the course goal
            // are there because of it.
            if (course_target > 0) {
                const std::vector<std::size_t> baseline = run(0, size_target);
                std::set_difference(selection.chosen.begin(), selection.chosen.end(),
                                    baseline.begin(), baseline.end(),
                                    std::back_inserter(selection.diversity_picks));
            }
            return selection;
        } catch (const InfeasibleSelectionError& e) {
            log::debug() << "Relaxing soft constraint " << to_string(e.constraint()) << ": "
                         << e.what() << std::endl;
        } catch (const SolverTimeoutError& e) {
            log::debug() << e.what() << ", falling back to heuristic" << std::endl;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

NowQueue QueueSelector::buildQueue(const SelectionProblem& problem, const Selection& selection,
                                   StrategyKind strategy) const {
    const auto& chosen = selection.chosen;
    const auto& limits = problem.limits;
    const auto& candidates = problem.candidates;

    SelectionState state(problem);
    for (std::size_t i : chosen) state.add(i);

    NowQueue queue;
    queue.strategy = strategy;
    queue.total_minutes = state.minutes();

    std::vector<bool> selected(candidates.size(), false);
    for (std::size_t i : chosen) selected[i] = true;

    std::optional<std::size_t> last_ranked;
    for (std::size_t i : chosen) {
        const Candidate& c = candidates[i];
        QueueItem item;
        item.task_id = c.id();
        item.course = c.course;
        item.score = c.score();
        item.est_minutes = c.est_minutes;

        const auto& picks = selection.diversity_picks;
        if (std::find(picks.begin(), picks.end(), i) != picks.end()) {
            item.reason = SelectionReason::DiversitySwap;
        } else {
            last_ranked = queue.items.size();
        }
        queue.total_score += c.score();
        queue.items.push_back(std::move(item));
    }

    if (last_ranked) {
        const int remaining = limits.timebox_minutes - state.minutes();
        bool capacity_bound = false;
        for (std::size_t u = 0; u < candidates.size(); ++u) {
            if (!selected[u] && candidates[u].est_minutes > remaining) {
                capacity_bound = true;
                break;
            }
        }
        auto& item = queue.items[*last_ranked];
        if (static_cast<int>(chosen.size()) >= limits.k) {
            item.reason = SelectionReason::CardinalityCutoff;
        } else if (capacity_bound) {
            item.reason = SelectionReason::CapacityCutoff;
        }
    }

    if (limits.min_courses > 0 && state.distinctCourses() < limits.min_courses) {
        queue.relaxed.push_back(RelaxedConstraint::MinCourses);
    }
    if (static_cast<int>(chosen.size()) < limits.min_items) {
        queue.relaxed.push_back(RelaxedConstraint::MinItems);
    }
    for (auto constraint : queue.relaxed) {
        log::info() << "Now Queue relaxed " << to_string(constraint) << std::endl;
    }
    return queue;
}

} // namespace TaskLattice
