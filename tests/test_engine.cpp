#include <catch2/catch.hpp>

#include "engine/TaskLattice.hpp"
#include "fixtures.hpp"

#include <thread>

using namespace TaskLattice;
using TaskLattice::testing::MemoryTaskStore;
using TaskLattice::testing::at;
using TaskLattice::testing::make_task;

namespace {

std::vector<Task> term_tasks() {
    Task quiz = make_task("A", "BIO");
    quiz.category = "assessment";
    quiz.due_at = at("2025-09-02");

    Task lab = make_task("C", "CHEM");
    lab.est_minutes = 45;

    return {
        quiz,
        make_task("B", "CHEM", {"A"}),
        lab,
        make_task("D", "HIST", {}, Status::Done),
    };
}

// Five tasks over two courses; T1 waits only on T2, which is done.
std::vector<Task> two_course_tasks() {
    Task t1 = make_task("T1", "BIO", {"T2"});
    t1.anchor = true;

    Task t3 = make_task("T3", "CHEM");
    t3.category = "assessment";
    t3.due_at = at("2025-09-02");
    t3.est_minutes = 60;

    Task t4 = make_task("T4", "BIO");
    t4.category = "assessment";
    t4.due_at = at("2025-09-05");
    t4.est_minutes = 45;

    Task t5 = make_task("T5", "CHEM");
    t5.category = "communication";
    t5.est_minutes = 20;

    return {t1, make_task("T2", "BIO", {}, Status::Done), t3, t4, t5};
}

} // namespace

TEST_CASE("Refresh builds a Now Queue from chain-heads", "[engine]") {
    MemoryTaskStore store(term_tasks(), at("2025-09-01"));
    Engine engine(store, Config{});

    REQUIRE(engine.latest() == nullptr);
    const NowQueue queue = engine.refresh();

    REQUIRE(queue.ids() == std::vector<std::string>{"A", "C"});
    REQUIRE(queue.total_minutes == 75);
    REQUIRE(queue.strategy == StrategyKind::Exact);
    REQUIRE(queue.relaxed.empty());

    auto latest = engine.latest();
    REQUIRE(latest != nullptr);
    REQUIRE(latest->queue.ids() == queue.ids());
    for (const auto& item : queue.items) {
        const auto& g = latest->analysis->graph();
        const TaskIndex i = g.indexOf(item.task_id);
        REQUIRE(g.metrics(i).is_chain_head);
        REQUIRE_FALSE(g.isDone(i));
    }
}

TEST_CASE("Refresh overrides apply per call", "[engine]") {
    MemoryTaskStore store(term_tasks(), at("2025-09-01"));
    Engine engine(store, Config{});

    RefreshRequest only_chem;
    only_chem.courses = {"CHEM"};
    const NowQueue chem = engine.refresh(only_chem);
    REQUIRE(chem.ids() == std::vector<std::string>{"C"});
    REQUIRE(chem.relaxed.empty());

    RefreshRequest short_box;
    short_box.timebox_minutes = 30;
    REQUIRE(engine.refresh(short_box).ids() == std::vector<std::string>{"A"});

    RefreshRequest one;
    one.k = 1;
    REQUIRE(engine.refresh(one).items.size() == 1);

    RefreshRequest negative;
    negative.timebox_minutes = -1;
    REQUIRE_THROWS_AS(engine.refresh(negative), std::invalid_argument);
}

TEST_CASE("Explain, cut and scores use the current analysis", "[engine]") {
    MemoryTaskStore store(term_tasks(), at("2025-09-01"));
    Engine engine(store, Config{});

    // Works before the first refresh too.
    const FactorBreakdown a = engine.explain("A");
    REQUIRE(a.unblock_count == 1);
    REQUIRE(a.phase == "in_term");

    const UnblockCut cut = engine.unblockCut("B");
    REQUIRE(cut.kind == CutKind::Finite);
    REQUIRE(cut.blockers == std::vector<std::string>{"A"});

    engine.refresh();
    REQUIRE(engine.scores().size() == 4);
    REQUIRE(engine.scores().front().task_id == "A");
    REQUIRE_THROWS_AS(engine.explain("Q"), TaskNotFoundError);
}

TEST_CASE("Health reports the first cycle", "[engine]") {
    std::vector<Task> tasks = term_tasks();
    tasks.push_back(make_task("X", "BIO", {"Y"}));
    tasks.push_back(make_task("Y", "BIO", {"X"}));
    MemoryTaskStore store(tasks, at("2025-09-01"));
    Engine engine(store, Config{});

    const NowQueue queue = engine.refresh();
    for (const auto& id : queue.ids()) {
        REQUIRE(id != "X");
        REQUIRE(id != "Y");
    }

    const HealthReport health = engine.health();
    REQUIRE_FALSE(health.dag_ok);
    REQUIRE(health.cycle_path == std::vector<std::string>{"X", "Y"});
    REQUIRE(health.break_suggestion.has_value());
    REQUIRE(health.cyclic_components == 1);
    REQUIRE_THROWS_AS(engine.explain("X"), GraphCycleError);
}

TEST_CASE("A healthy graph reports dag_ok", "[engine]") {
    MemoryTaskStore store(term_tasks(), at("2025-09-01"));
    Engine engine(store, Config{});
    const HealthReport health = engine.health();
    REQUIRE(health.dag_ok);
    REQUIRE_FALSE(health.cycle_path.has_value());
    REQUIRE_FALSE(health.break_suggestion.has_value());
}

TEST_CASE("A cancelled refresh publishes nothing", "[engine]") {
    MemoryTaskStore store(term_tasks(), at("2025-09-01"));
    Engine engine(store, Config{});
    std::atomic<bool> cancel{true};

    REQUIRE_THROWS_AS(engine.refresh({}, &cancel), RefreshCancelledError);
    REQUIRE(engine.latest() == nullptr);

    cancel = false;
    REQUIRE_NOTHROW(engine.refresh({}, &cancel));
    REQUIRE(engine.latest() != nullptr);
}

TEST_CASE("Invalid configuration is rejected up front", "[engine]") {
    MemoryTaskStore store(term_tasks(), at("2025-09-01"));
    Config config;
    config.phase = "summer";
    REQUIRE_THROWS_AS(Engine(store, config), ConfigError);
}

TEST_CASE("Concurrent refreshes publish whole results", "[engine]") {
    MemoryTaskStore store(term_tasks(), at("2025-09-01"));
    Engine engine(store, Config{});

    std::vector<std::thread> workers;
    std::atomic<int> mismatches{0};
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&engine, &mismatches] {
            for (int round = 0; round < 10; ++round) {
                const NowQueue q = engine.refresh();
                auto latest = engine.latest();
                if (q.ids() != std::vector<std::string>{"A", "C"} || !latest ||
                    latest->queue.ids() != q.ids()) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(mismatches.load() == 0);
}

TEST_CASE("Two courses with a finished prerequisite fill a 90 minute box", "[engine]") {
    MemoryTaskStore store(two_course_tasks(), at("2025-09-01"));
    Engine engine(store, Config{});

    const FactorBreakdown t1 = engine.explain("T1");
    REQUIRE(t1.is_chain_head);
    REQUIRE(t1.unblock_count == 0);
    REQUIRE(t1.depth == 0);
    REQUIRE(t1.total == Approx(26.0));

    RefreshRequest request;
    request.timebox_minutes = 90;
    request.k = 3;
    const NowQueue queue = engine.refresh(request);

    REQUIRE(queue.strategy == StrategyKind::Exact);
    REQUIRE(queue.ids() == std::vector<std::string>{"T1", "T3"});
    REQUIRE(queue.total_minutes == 90);
    REQUIRE(queue.relaxed.empty());
    REQUIRE(queue.items[0].reason == SelectionReason::Ranked);
    REQUIRE(queue.items[1].reason == SelectionReason::CapacityCutoff);

    auto latest = engine.latest();
    REQUIRE(latest != nullptr);
    const auto& g = latest->analysis->graph();
    for (const char* id : {"T1", "T3", "T4", "T5"}) {
        const TaskMetrics& m = g.metrics(g.indexOf(id));
        REQUIRE(m.is_chain_head);
        REQUIRE(m.unblock_count == 0);
    }
    REQUIRE(g.isDone(g.indexOf("T2")));

    const auto& scores = engine.scores();
    REQUIRE(scores.size() == 5);
    REQUIRE(scores[0].task_id == "T1");
    REQUIRE(scores[1].task_id == "T3");
    REQUIRE(scores[2].task_id == "T4");
    REQUIRE(scores[3].task_id == "T5");

    Config heuristic;
    heuristic.exact_solver_enabled = false;
    Engine greedy(store, heuristic);
    const NowQueue fallback = greedy.refresh(request);
    REQUIRE(fallback.strategy == StrategyKind::Heuristic);
    REQUIRE(fallback.ids() == queue.ids());
    REQUIRE(fallback.total_minutes == 90);
}

TEST_CASE("Finishing the last blocker turns its dependent into a chain-head", "[engine]") {
    std::vector<Task> tasks = two_course_tasks();
    tasks[1].status = Status::Todo;
    MemoryTaskStore store(tasks, at("2025-09-01"));
    Engine engine(store, Config{});

    const FactorBreakdown t2 = engine.explain("T2");
    REQUIRE(t2.unblock_count == 1);
    REQUIRE_FALSE(engine.explain("T1").is_chain_head);

    const NowQueue queue = engine.refresh();
    for (const auto& id : queue.ids()) REQUIRE(id != "T1");
}
