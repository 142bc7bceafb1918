#include <filesystem>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <string>

#include "core/log.hpp"
#include "core/phase.hpp"
#include "engine/TaskLattice.hpp"
#include "parser/parser.hpp"

using namespace TaskLattice;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <refresh|explain ID|cut ID|health|scores> --tasks=PATH [options]\n";
    std::cout << "  --contracts=PATH        priority contracts file\n";
    std::cout << "  --phase=KEY             weight-table row to use\n";
    std::cout << "  --semester-start=DATE   derive the phase from the calendar instead\n";
    std::cout << "  --as-of=DATE            evaluate urgency at this instant (default: now)\n";
    std::cout << "  --timebox=N --k=N --min-courses=N --courses=A,B\n";
    std::cout << "  --heuristic             skip the exact solver\n";
    std::cout << "  --verbose               diagnostics on stderr\n";
}

bool parse_int(const std::string& value, int& out) {
    try {
        std::size_t used = 0;
        out = std::stoi(value, &used);
        return used == value.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

std::set<std::string> parse_courses(const std::string& value) {
    std::set<std::string> courses;
    std::stringstream ss(value);
    std::string course;
    while (std::getline(ss, course, ',')) {
        if (!course.empty()) courses.insert(course);
    }
    return courses;
}

void print_queue(const NowQueue& queue, const Analysis& analysis) {
    std::cout << "NOW QUEUE (" << to_string(queue.strategy) << ")" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    int rank = 1;
    for (const auto& item : queue.items) {
        const TaskIndex i = analysis.graph().indexOf(item.task_id);
        const Task& task = analysis.graph().task(i);
        const TaskMetrics& m = analysis.graph().metrics(i);
        std::cout << std::setw(2) << rank++ << ". [" << item.course << "] " << task.title << " ("
                  << item.task_id << ")" << std::endl;
        std::cout << "     Score: " << std::fixed << std::setprecision(1) << item.score
                  << " | " << item.est_minutes << "m"
                  << " | Due: " << (task.due_at ? format_date(*task.due_at) : "N/A")
                  << " | Unblocks: " << m.unblock_count
                  << " | " << to_string(item.reason) << std::endl;
    }
    std::cout << std::string(60, '=') << std::endl;
    std::cout << "Total: " << queue.total_minutes << " minutes, score " << queue.total_score
              << std::endl;
    for (auto constraint : queue.relaxed) {
        std::cout << "Relaxed: " << to_string(constraint) << std::endl;
    }
}

void print_health(const HealthReport& health) {
    std::cout << "dag_ok: " << (health.dag_ok ? "true" : "false") << std::endl;
    if (health.cycle_path) {
        std::cout << "cycle_path:";
        for (const auto& id : *health.cycle_path) std::cout << " " << id;
        std::cout << std::endl;
    }
    if (health.break_suggestion) {
        std::cout << "break_suggestion: " << health.break_suggestion->from << " -> "
                  << health.break_suggestion->to << std::endl;
    }
    if (health.cyclic_components > 1) {
        std::cout << "cyclic components: " << health.cyclic_components << std::endl;
    }
}

void print_breakdown(const FactorBreakdown& breakdown) {
    std::cout << "Task " << breakdown.task_id << " (phase " << breakdown.phase << ")" << std::endl;
    std::cout << std::fixed << std::setprecision(3);
    for (const auto& f : breakdown.factors) {
        std::cout << "  " << std::left << std::setw(18) << f.name << std::right
                  << " raw " << std::setw(8) << f.raw << "  x " << std::setw(7) << f.weight
                  << "  = " << std::setw(8) << f.contribution << std::endl;
    }
    std::cout << "  total " << breakdown.total << std::endl;
    std::cout << "  chain-head: " << (breakdown.is_chain_head ? "yes" : "no")
              << ", unblocks " << breakdown.unblock_count << ", depth " << breakdown.depth
              << std::endl;
}

void print_cut(const UnblockCut& cut) {
    std::cout << "Task " << cut.task_id << ": " << to_string(cut.kind) << std::endl;
    for (const auto& id : cut.blockers) std::cout << "  - " << id << std::endl;
    if (cut.cycle) std::cout << "  cycle: " << describe_cycle(*cut.cycle) << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::string command;
    std::string target;
    std::string tasks_path;
    std::string contracts_path;
    std::string phase;
    std::string semester_start;
    std::string as_of;
    bool heuristic_only = false;
    RefreshRequest request;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        auto value_of = [&arg](const std::string& prefix) { return arg.substr(prefix.size()); };
        int n = 0;
        if (arg.rfind("--tasks=", 0) == 0) {
            tasks_path = value_of("--tasks=");
        } else if (arg.rfind("--contracts=", 0) == 0) {
            contracts_path = value_of("--contracts=");
        } else if (arg.rfind("--phase=", 0) == 0) {
            phase = value_of("--phase=");
        } else if (arg.rfind("--semester-start=", 0) == 0) {
            semester_start = value_of("--semester-start=");
        } else if (arg.rfind("--as-of=", 0) == 0) {
            as_of = value_of("--as-of=");
        } else if (arg.rfind("--timebox=", 0) == 0 && parse_int(value_of("--timebox="), n)) {
            request.timebox_minutes = n;
        } else if (arg.rfind("--k=", 0) == 0 && parse_int(value_of("--k="), n)) {
            request.k = n;
        } else if (arg.rfind("--min-courses=", 0) == 0 && parse_int(value_of("--min-courses="), n)) {
            request.min_courses = n;
        } else if (arg.rfind("--courses=", 0) == 0) {
            request.courses = parse_courses(value_of("--courses="));
        } else if (arg == "--heuristic") {
            heuristic_only = true;
        } else if (arg == "--verbose") {
            log::set_level(log::Level::Debug);
        } else if (command.empty() && arg.rfind("--", 0) != 0) {
            command = arg;
        } else if (target.empty() && arg.rfind("--", 0) != 0) {
            target = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    if (command.empty() || tasks_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }
    if (!std::filesystem::exists(tasks_path)) {
        std::cerr << "Tasks file not found: " << tasks_path << std::endl;
        return 1;
    }

    std::optional<Timestamp> as_of_ts;
    if (!as_of.empty()) {
        as_of_ts = parse_timestamp(as_of);
        if (!as_of_ts) {
            std::cerr << "Bad --as-of date: " << as_of << std::endl;
            return 2;
        }
    }

    try {
        Config config = contracts_path.empty() ? Config{} : parse_config_file(contracts_path);
        if (heuristic_only) config.exact_solver_enabled = false;
        if (!phase.empty()) {
            config.phase = phase;
        } else if (!semester_start.empty()) {
            auto start = parse_timestamp(semester_start);
            if (!start) {
                std::cerr << "Bad --semester-start date: " << semester_start << std::endl;
                return 2;
            }
            config.phase = detect_phase(*start, as_of_ts ? *as_of_ts : current_time());
        }

        FileTaskStore store(tasks_path, as_of_ts);
        Engine engine(store, std::move(config));

        if (command == "refresh") {
            NowQueue queue = engine.refresh(request);
            print_queue(queue, *engine.latest()->analysis);
            HealthReport health = engine.health();
            if (!health.dag_ok) {
                std::cout << std::endl;
                print_health(health);
            }
        } else if (command == "explain" && !target.empty()) {
            print_breakdown(engine.explain(target));
        } else if (command == "cut" && !target.empty()) {
            print_cut(engine.unblockCut(target));
        } else if (command == "health") {
            HealthReport health = engine.health();
            print_health(health);
            return health.dag_ok ? 0 : 3;
        } else if (command == "scores") {
            std::cout << std::fixed << std::setprecision(2);
            for (const auto& record : engine.scores()) {
                std::cout << std::setw(8) << record.total << "  " << record.task_id << std::endl;
            }
        } else {
            print_usage(argv[0]);
            return 2;
        }
    } catch (const GraphCycleError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 3;
    } catch (const TaskNotFoundError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
