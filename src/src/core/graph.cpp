#include "core/graph.hpp"
#include "core/log.hpp"

#include <algorithm>

namespace TaskLattice {

namespace {

// Tarjan's strongly connected components over depends_on edges.
class ComponentFinder {
public:
    explicit ComponentFinder(const std::vector<std::vector<TaskIndex>>& edges)
        : edges_(edges),
          index_(edges.size(), -1),
          low_(edges.size(), 0),
          on_stack_(edges.size(), false),
          component_(edges.size(), -1) {}

    std::vector<int> run() {
        for (TaskIndex v = 0; v < edges_.size(); ++v) {
            if (index_[v] < 0) strongConnect(v);
        }
        return component_;
    }

    int count() const { return components_; }

private:
    const std::vector<std::vector<TaskIndex>>& edges_;
    std::vector<int> index_;
    std::vector<int> low_;
    std::vector<bool> on_stack_;
    std::vector<int> component_;
    std::vector<TaskIndex> stack_;
    int counter_ = 0;
    int components_ = 0;

    struct Frame {
        TaskIndex v;
        std::size_t next;
    };

    void visit(TaskIndex v) {
        index_[v] = low_[v] = counter_++;
        stack_.push_back(v);
        on_stack_[v] = true;
    }

    // Explicit call stack so long chains cannot exhaust the thread stack.
    void strongConnect(TaskIndex root) {
        std::vector<Frame> calls;
        visit(root);
        calls.push_back({root, 0});

        while (!calls.empty()) {
            Frame& f = calls.back();
            const TaskIndex v = f.v;
            if (f.next < edges_[v].size()) {
                const TaskIndex w = edges_[v][f.next++];
                if (index_[w] < 0) {
                    visit(w);
                    calls.push_back({w, 0});
                } else if (on_stack_[w]) {
                    low_[v] = std::min(low_[v], index_[w]);
                }
                continue;
            }

            calls.pop_back();
            if (!calls.empty()) {
                const TaskIndex parent = calls.back().v;
                low_[parent] = std::min(low_[parent], low_[v]);
            }

            if (low_[v] == index_[v]) {
                TaskIndex w;
                do {
                    w = stack_.back();
                    stack_.pop_back();
                    on_stack_[w] = false;
                    component_[w] = components_;
                } while (w != v);
                ++components_;
            }
        }
    }
};

} // namespace

DependencyGraph::DependencyGraph(std::vector<Task> tasks) {
    std::stable_sort(tasks.begin(), tasks.end(),
                     [](const Task& a, const Task& b) { return a.id < b.id; });

    tasks_.reserve(tasks.size());
    for (auto& task : tasks) {
        if (!tasks_.empty() && tasks_.back().id == task.id) {
            log::warn() << "Duplicate task id " << task.id << ", keeping the first record" << std::endl;
            continue;
        }
        tasks_.push_back(std::move(task));
    }

    buildEdges();
    detectCycles();
    computeMetrics();
}

std::optional<TaskIndex> DependencyGraph::find(const std::string& id) const {
    auto it = std::lower_bound(tasks_.begin(), tasks_.end(), id,
                               [](const Task& t, const std::string& key) { return t.id < key; });
    if (it == tasks_.end() || it->id != id) return std::nullopt;
    return static_cast<TaskIndex>(it - tasks_.begin());
}

TaskIndex DependencyGraph::indexOf(const std::string& id) const {
    auto i = find(id);
    if (!i) throw TaskNotFoundError(id);
    return *i;
}

const CycleReport* DependencyGraph::cycleContaining(TaskIndex i) const {
    if (!metrics_[i].cyclic) return nullptr;
    const int report = cycle_of_component_[component_[i]];
    return report < 0 ? nullptr : &cycles_[report];
}

void DependencyGraph::requireAcyclic() const {
    if (!cycles_.empty()) throw GraphCycleError(cycles_.front());
}

void DependencyGraph::buildEdges() {
    dependencies_.assign(tasks_.size(), {});
    dependents_.assign(tasks_.size(), {});

    for (TaskIndex i = 0; i < tasks_.size(); ++i) {
        auto& deps = dependencies_[i];
        for (const auto& dep_id : tasks_[i].depends_on) {
            auto j = find(dep_id);
            if (!j) {
                log::debug() << "Task " << tasks_[i].id << " depends on unknown id " << dep_id
                             << ", ignored" << std::endl;
                continue;
            }
            deps.push_back(*j);
        }
        std::sort(deps.begin(), deps.end());
        deps.erase(std::unique(deps.begin(), deps.end()), deps.end());
        for (TaskIndex j : deps) dependents_[j].push_back(i);
    }
    // Dependents were appended in increasing i, so they are already sorted.
}

void DependencyGraph::detectCycles() {
    const std::size_t n = tasks_.size();
    metrics_.assign(n, {});

    ComponentFinder finder(dependencies_);
    component_ = finder.run();
    cycle_of_component_.assign(finder.count(), -1);

    std::vector<std::size_t> sizes(finder.count(), 0);
    for (TaskIndex i = 0; i < n; ++i) ++sizes[component_[i]];

    for (TaskIndex i = 0; i < n; ++i) {
        const auto& deps = dependencies_[i];
        const bool self_loop = std::binary_search(deps.begin(), deps.end(), i);
        if (sizes[component_[i]] > 1 || self_loop) metrics_[i].cyclic = true;
    }

    // Indices follow id order, so the first member met is the lowest id.
    std::vector<char> state(n, 0);
    for (TaskIndex i = 0; i < n; ++i) {
        if (!metrics_[i].cyclic || cycle_of_component_[component_[i]] >= 0) continue;

        std::vector<TaskIndex> cycle;
        if (traceCycle(i, state, cycle)) {
            cycle_of_component_[component_[i]] = static_cast<int>(cycles_.size());
            cycles_.push_back(makeReport(std::move(cycle)));
        }
    }

    for (const auto& report : cycles_) {
        log::info() << "Dependency cycle detected: " << describe_cycle(report) << std::endl;
    }
}

// DFS along depends_on edges inside one component with an on-stack marker.
// state: 0 unseen, 1 on the stack, 2 finished. The frames double as the path.
bool DependencyGraph::traceCycle(TaskIndex start, std::vector<char>& state,
                                 std::vector<TaskIndex>& cycle) const {
    struct Frame {
        TaskIndex v;
        std::size_t next;
    };
    std::vector<Frame> calls{{start, 0}};
    state[start] = 1;

    while (!calls.empty()) {
        Frame& f = calls.back();
        const TaskIndex v = f.v;
        const auto& deps = dependencies_[v];
        if (f.next == deps.size()) {
            state[v] = 2;
            calls.pop_back();
            continue;
        }

        const TaskIndex w = deps[f.next++];
        if (component_[w] != component_[v]) continue;
        if (state[w] == 1) {
            auto it = std::find_if(calls.begin(), calls.end(),
                                   [w](const Frame& c) { return c.v == w; });
            for (; it != calls.end(); ++it) cycle.push_back(it->v);
            return true;
        }
        if (state[w] == 0) {
            state[w] = 1;
            calls.push_back({w, 0});
        }
    }
    return false;
}

CycleReport DependencyGraph::makeReport(std::vector<TaskIndex> cycle) const {
    std::rotate(cycle.begin(), std::min_element(cycle.begin(), cycle.end()), cycle.end());

    CycleReport report;
    for (TaskIndex i : cycle) report.path.push_back(tasks_[i].id);

    // Cheapest edge by combined endpoint weight; first one wins ties.
    std::size_t best = 0;
    double best_cost = 0.0;
    for (std::size_t k = 0; k < cycle.size(); ++k) {
        const TaskIndex from = cycle[k];
        const TaskIndex to = cycle[(k + 1) % cycle.size()];
        const double cost = tasks_[from].weight + tasks_[to].weight;
        if (k == 0 || cost < best_cost) {
            best = k;
            best_cost = cost;
        }
    }
    report.break_suggestion.from = tasks_[cycle[best]].id;
    report.break_suggestion.to = tasks_[cycle[(best + 1) % cycle.size()]].id;
    return report;
}

void DependencyGraph::computeMetrics() {
    const std::size_t n = tasks_.size();

    for (TaskIndex i = 0; i < n; ++i) {
        const auto& deps = dependencies_[i];
        metrics_[i].is_chain_head =
            std::all_of(deps.begin(), deps.end(), [this](TaskIndex j) { return isDone(j); });
    }

    for (TaskIndex i = 0; i < n; ++i) {
        if (isDone(i) || metrics_[i].cyclic) continue;

        int count = 0;
        for (TaskIndex d : dependents_[i]) {
            if (isDone(d)) continue;
            const auto& deps = dependencies_[d];
            const bool last_blocker = std::all_of(deps.begin(), deps.end(), [&](TaskIndex j) {
                return j == i || isDone(j);
            });
            if (last_blocker) ++count;
        }
        metrics_[i].unblock_count = count;
    }

    computeDepths();
}

// Depth in topological order over the acyclic part. A cyclic task is depth 0
// and ends any chain that reaches it; done dependencies add no hop.
void DependencyGraph::computeDepths() {
    const std::size_t n = tasks_.size();
    std::vector<int> pending(n, 0);
    std::vector<TaskIndex> ready;

    for (TaskIndex i = 0; i < n; ++i) {
        if (metrics_[i].cyclic) continue;
        for (TaskIndex j : dependencies_[i]) {
            if (!isDone(j) && !metrics_[j].cyclic) ++pending[i];
        }
        if (pending[i] == 0) ready.push_back(i);
    }

    while (!ready.empty()) {
        const TaskIndex i = ready.back();
        ready.pop_back();

        int depth = 0;
        for (TaskIndex j : dependencies_[i]) {
            if (isDone(j)) continue;
            depth = std::max(depth, 1 + metrics_[j].depth);
        }
        metrics_[i].depth = depth;

        if (isDone(i)) continue;
        for (TaskIndex d : dependents_[i]) {
            if (metrics_[d].cyclic) continue;
            if (--pending[d] == 0) ready.push_back(d);
        }
    }
}

} // namespace TaskLattice
