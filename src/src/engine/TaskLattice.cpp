#include "engine/TaskLattice.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <stdexcept>

namespace TaskLattice {

// ------------------------------
// Analysis
// ------------------------------

Analysis::Analysis(Snapshot snapshot, const Config& config)
    : graph_(std::move(snapshot.tasks)), as_of_(snapshot.as_of), phase_(config.phase) {
    Scorer scorer(graph_, config, as_of_);
    scores_ = scorer.scoreAll();

    score_of_.assign(graph_.size(), -1);
    for (std::size_t k = 0; k < scores_.size(); ++k) {
        score_of_[graph_.indexOf(scores_[k].task_id)] = static_cast<int>(k);
    }
}

std::vector<Candidate> Analysis::candidates(const std::set<std::string>& courses) const {
    std::vector<Candidate> out;
    for (TaskIndex i = 0; i < graph_.size(); ++i) {
        const Task& task = graph_.task(i);
        const TaskMetrics& m = graph_.metrics(i);
        if (m.cyclic || !m.is_chain_head || task.status == Status::Done) continue;
        if (!courses.empty() && courses.count(task.course) == 0) continue;

        const ScoreRecord& record = scores_[score_of_[i]];
        Candidate c;
        c.rank = RankKey{record.total, m.unblock_count, m.is_chain_head, task.due_at, task.id};
        c.course = task.course;
        c.est_minutes = task.est_minutes;
        c.status = task.status;
        out.push_back(std::move(c));
    }
    return out;
}

HealthReport Analysis::health() const {
    HealthReport report;
    report.dag_ok = graph_.isAcyclic();
    report.cyclic_components = graph_.cycles().size();
    if (!report.dag_ok) {
        const CycleReport& first = graph_.cycles().front();
        report.cycle_path = first.path;
        report.break_suggestion = first.break_suggestion;
    }
    return report;
}

// ------------------------------
// Engine
// ------------------------------

Engine::Engine(const TaskStore& store, Config config)
    : store_(store), config_(std::move(config)) {
    config_.validate();
}

SelectionLimits Engine::limitsFor(const RefreshRequest& request) const {
    SelectionLimits limits;
    limits.timebox_minutes = request.timebox_minutes.value_or(config_.default_timebox_minutes);
    limits.k = request.k.value_or(config_.default_k);
    limits.min_courses = request.min_courses.value_or(config_.min_courses);
    limits.min_items = std::min(config_.min_items, limits.k);
    limits.heavy_threshold_minutes = config_.heavy_threshold_minutes;
    limits.max_heavy = config_.max_heavy;
    limits.wip_cap = config_.wip_cap;

    if (limits.timebox_minutes < 0) throw std::invalid_argument("timebox must be non-negative");
    if (limits.k < 0) throw std::invalid_argument("k must be non-negative");
    if (limits.min_courses < 0) throw std::invalid_argument("min_courses must be non-negative");

    // A course filter caps how many courses can ever show up.
    if (!request.courses.empty()) {
        limits.min_courses =
            std::min(limits.min_courses, static_cast<int>(request.courses.size()));
    }
    return limits;
}

NowQueue Engine::refresh(const RefreshRequest& request, const std::atomic<bool>* cancel) {
    const SelectionLimits limits = limitsFor(request);
    auto cancelled = [cancel] { return cancel != nullptr && cancel->load(); };

    Snapshot snapshot = store_.snapshot();
    log::debug() << "Refreshing over " << snapshot.tasks.size() << " tasks as of "
                 << format_date(snapshot.as_of) << " (phase " << config_.phase << ")" << std::endl;

    auto analysis = std::make_shared<const Analysis>(std::move(snapshot), config_);
    if (cancelled()) throw RefreshCancelledError();

    QueueSelector selector(config_, cancel);
    NowQueue queue = selector.select(analysis->candidates(request.courses), limits);
    if (cancelled()) throw RefreshCancelledError();

    auto result = std::make_shared<RefreshResult>();
    result->analysis = analysis;
    result->queue = queue;
    {
        std::lock_guard<std::mutex> lk(mu_);
        latest_ = std::move(result);
    }

    log::info() << "Now Queue: " << queue.items.size() << " tasks, " << queue.total_minutes
                << " minutes (" << to_string(queue.strategy) << ")" << std::endl;
    return queue;
}

std::shared_ptr<const RefreshResult> Engine::latest() const {
    std::lock_guard<std::mutex> lk(mu_);
    return latest_;
}

std::shared_ptr<const Analysis> Engine::currentAnalysis() const {
    if (auto result = latest()) return result->analysis;
    return std::make_shared<const Analysis>(store_.snapshot(), config_);
}

FactorBreakdown Engine::explain(const std::string& task_id) const {
    auto analysis = currentAnalysis();
    return explain_score(analysis->graph(), analysis->scores(), task_id, analysis->phase());
}

UnblockCut Engine::unblockCut(const std::string& task_id) const {
    return minimal_unblock_cut(currentAnalysis()->graph(), task_id);
}

HealthReport Engine::health() const {
    return currentAnalysis()->health();
}

std::vector<ScoreRecord> Engine::scores() const {
    return currentAnalysis()->scores();
}

} // namespace TaskLattice
