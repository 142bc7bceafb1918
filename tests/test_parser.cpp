#include <catch2/catch.hpp>

#include "core/errors.hpp"
#include "core/log.hpp"
#include "parser/parser.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

using namespace TaskLattice;

namespace {

// Keeps skipped-line warnings out of the test output.
struct QuietLog {
    QuietLog() : previous(log::level()) { log::set_level(log::Level::Quiet); }
    ~QuietLog() { log::set_level(previous); }
    log::Level previous;
};

} // namespace

TEST_CASE("Task lines parse every field", "[parser]") {
    std::istringstream in(
        "# id | course | title | status | due | minutes | weight | category | anchor | deps\n"
        "\n"
        "T1 | BIO 101 | Post syllabus | todo | 2025-09-01 | 45 | 2.5 | Setup | yes | \n"
        "T2 | BIO 101 | Quiz 1 | blocked | 2025-09-10T17:00 | 30 | | assessment | no | T1, 'T3'\n"
        "T3 | CHEM | Lab | in_progress | | | | | | | 2025-08-01 | 2025-08-02\n");

    const auto tasks = parse_tasks(in);
    REQUIRE(tasks.size() == 3);

    const Task& t1 = tasks[0];
    REQUIRE(t1.id == "T1");
    REQUIRE(t1.course == "BIO 101");
    REQUIRE(t1.title == "Post syllabus");
    REQUIRE(t1.status == Status::Todo);
    REQUIRE(format_date(*t1.due_at) == "2025-09-01");
    REQUIRE(t1.est_minutes == 45);
    REQUIRE(t1.weight == Approx(2.5));
    REQUIRE(t1.category == "setup");
    REQUIRE(t1.anchor);
    REQUIRE(t1.depends_on.empty());

    const Task& t2 = tasks[1];
    REQUIRE(t2.status == Status::Blocked);
    REQUIRE(t2.weight == 1.0);
    REQUIRE_FALSE(t2.anchor);
    REQUIRE(t2.depends_on == std::vector<std::string>{"T1", "T3"});
    REQUIRE(*t2.due_at == *parse_timestamp("2025-09-10T17:00"));

    const Task& t3 = tasks[2];
    REQUIRE(t3.status == Status::Doing);
    REQUIRE_FALSE(t3.due_at.has_value());
    REQUIRE(t3.est_minutes == 0);
    REQUIRE(t3.created_at.has_value());
    REQUIRE(format_date(*t3.updated_at) == "2025-08-02");
}

TEST_CASE("Malformed task lines are skipped", "[parser]") {
    QuietLog quiet;
    std::istringstream in(
        "T1 | BIO | ok | todo | | 30 | | | | \n"
        "T2 | BIO | too few fields\n"
        "T3 | BIO | bad status | waiting | | 30 | | | | \n"
        "T4 | BIO | bad minutes | todo | | thirty | | | | \n"
        "T5 | BIO | bad date | todo | tomorrow | 30 | | | | \n"
        "T6 | BIO | bad anchor | todo | | 30 | | | maybe | \n"
        " | BIO | no id | todo | | 30 | | | | \n"
        "T7 | BIO | negative | todo | | -5 | | | | \n"
        "T8 | BIO | fine | done | | 10 | | | | T1\n");

    const auto tasks = parse_tasks(in);
    REQUIRE(tasks.size() == 2);
    REQUIRE(tasks[0].id == "T1");
    REQUIRE(tasks[1].id == "T8");
}

TEST_CASE("Task files are read from disk", "[parser]") {
    const std::string path = "tasklattice_parser_test_tasks.txt";
    {
        std::ofstream out(path);
        out << "A | BIO | first | todo | | 20 | | | | \n";
        out << "B | BIO | second | todo | | 20 | | | | A\n";
    }

    REQUIRE(parse_task_file(path).size() == 2);

    FileTaskStore store(path, parse_timestamp("2025-09-01"));
    const Snapshot snapshot = store.snapshot();
    REQUIRE(snapshot.tasks.size() == 2);
    REQUIRE(format_date(snapshot.as_of) == "2025-09-01");

    std::remove(path.c_str());

    QuietLog quiet;
    REQUIRE(parse_task_file(path).empty());
}

TEST_CASE("Contracts override defaults", "[parser][config]") {
    std::istringstream in(
        "# selection\n"
        "default_k = 5\n"
        "default_timebox_minutes = 120   # two hours\n"
        "exact_solver_enabled = false\n"
        "max_heavy = 2\n"
        "wip_cap = none\n"
        "phase = week_one\n"
        "urgency.midpoint_days = 4.5\n"
        "impact.cap = 12\n"
        "anchor_bonus = 20\n"
        "\n"
        "[weights.week_one]\n"
        "Assessment = 2.0\n"
        "lab = 1.25\n");

    const Config config = parse_config(in);
    REQUIRE(config.default_k == 5);
    REQUIRE(config.default_timebox_minutes == 120);
    REQUIRE_FALSE(config.exact_solver_enabled);
    REQUIRE(config.max_heavy == 2);
    REQUIRE_FALSE(config.wip_cap.has_value());
    REQUIRE(config.phase == "week_one");
    REQUIRE(config.urgency.midpoint_days == Approx(4.5));
    REQUIRE(config.impact.cap == Approx(12.0));
    REQUIRE(config.anchor_bonus == Approx(20.0));

    // The section replaces the built-in row.
    const auto& row = config.weight_table.at("week_one");
    REQUIRE(row.size() == 2);
    REQUIRE(config.categoryWeight("assessment") == Approx(2.0));
    REQUIRE(config.categoryWeight("LAB") == Approx(1.25));
    REQUIRE(config.categoryWeight("setup") == 0.0);

    // Other rows keep their defaults.
    REQUIRE(config.weight_table.at("in_term").at("assessment") == Approx(3.0));
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Contracts can add a new phase row", "[parser][config]") {
    std::istringstream in(
        "phase = finals\n"
        "[weights.finals]\n"
        "assessment = 4\n");
    const Config config = parse_config(in);
    REQUIRE(config.weight_table.count("finals") == 1);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Bad contracts are rejected with a line number", "[parser][config]") {
    SECTION("bad number") {
        std::istringstream in("default_k = 3\nsolver_timeout_ms = soon\n");
        REQUIRE_THROWS_WITH(parse_config(in), Catch::Contains("line 2"));
    }
    SECTION("trailing characters") {
        std::istringstream in("default_k = 3x\n");
        REQUIRE_THROWS_AS(parse_config(in), ConfigError);
    }
    SECTION("bad boolean") {
        std::istringstream in("exact_solver_enabled = sometimes\n");
        REQUIRE_THROWS_AS(parse_config(in), ConfigError);
    }
    SECTION("missing equals sign") {
        std::istringstream in("default_k 3\n");
        REQUIRE_THROWS_AS(parse_config(in), ConfigError);
    }
    SECTION("unknown section") {
        std::istringstream in("[scoring]\n");
        REQUIRE_THROWS_AS(parse_config(in), ConfigError);
    }
    SECTION("missing file") {
        REQUIRE_THROWS_AS(parse_config_file("does/not/exist.contracts"), ConfigError);
    }
}

TEST_CASE("Unknown contract keys are ignored", "[parser][config]") {
    QuietLog quiet;
    std::istringstream in("colour = blue\ndefault_k = 4\n");
    const Config config = parse_config(in);
    REQUIRE(config.default_k == 4);
}
