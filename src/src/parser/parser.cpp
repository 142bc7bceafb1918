#include "parser/parser.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <sstream>

namespace TaskLattice {

namespace {

std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
    return s;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, sep)) {
        parts.push_back(trim(part));
    }
    // getline drops a trailing empty field
    if (!text.empty() && text.back() == sep) parts.emplace_back();
    return parts;
}

std::vector<std::string> parse_dependencies(std::string deps_str) {
    std::vector<std::string> deps;
    deps_str.erase(std::remove(deps_str.begin(), deps_str.end(), '\''), deps_str.end());

    for (auto& dep : split(deps_str, ',')) {
        if (!dep.empty()) deps.push_back(dep);
    }
    return deps;
}

std::optional<bool> parse_flag(const std::string& text) {
    const std::string s = lower(text);
    if (s.empty() || s == "no" || s == "false" || s == "0" || s == "n") return false;
    if (s == "yes" || s == "true" || s == "1" || s == "y") return true;
    return std::nullopt;
}

std::optional<Timestamp> parse_optional_time(const std::string& text, const char* field) {
    if (text.empty()) return std::nullopt;
    auto ts = parse_timestamp(text);
    if (!ts) throw std::invalid_argument(std::string("bad ") + field + " '" + text + "'");
    return ts;
}

// Expects exactly one number in the whole field.
template <typename T, typename Convert>
T parse_number(const std::string& text, Convert convert) {
    std::size_t used = 0;
    T value = convert(text, &used);
    if (used != text.size()) throw std::invalid_argument("trailing characters in '" + text + "'");
    return value;
}

int to_int(const std::string& text) {
    return parse_number<int>(text, [](const std::string& s, std::size_t* n) { return std::stoi(s, n); });
}

double to_double(const std::string& text) {
    return parse_number<double>(text,
                                [](const std::string& s, std::size_t* n) { return std::stod(s, n); });
}

Task parse_task_line(const std::vector<std::string>& parts) {
    if (parts.size() < 10 || parts.size() > 12) {
        throw std::invalid_argument("expected 10 to 12 fields, found " +
                                    std::to_string(parts.size()));
    }

    Task t;
    t.id = parts[0];
    if (t.id.empty()) throw std::invalid_argument("empty task id");
    t.course = parts[1];
    t.title = parts[2];

    if (!parts[3].empty()) {
        auto status = parse_status(parts[3]);
        if (!status) throw std::invalid_argument("unknown status '" + parts[3] + "'");
        t.status = *status;
    }

    t.due_at = parse_optional_time(parts[4], "due_at");

    if (!parts[5].empty()) {
        t.est_minutes = to_int(parts[5]);
        if (t.est_minutes < 0) throw std::invalid_argument("est_minutes must be non-negative");
    }
    if (!parts[6].empty()) {
        t.weight = to_double(parts[6]);
        if (!(t.weight > 0.0)) throw std::invalid_argument("weight must be positive");
    }

    t.category = lower(parts[7]);

    auto anchor = parse_flag(parts[8]);
    if (!anchor) throw std::invalid_argument("bad anchor flag '" + parts[8] + "'");
    t.anchor = *anchor;

    t.depends_on = parse_dependencies(parts[9]);

    if (parts.size() > 10) t.created_at = parse_optional_time(parts[10], "created_at");
    if (parts.size() > 11) t.updated_at = parse_optional_time(parts[11], "updated_at");
    return t;
}

} // namespace

std::vector<Task> parse_tasks(std::istream& in) {
    std::vector<Task> tasks;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        const std::string content = trim(line);
        // Ignore comments and blank lines
        if (content.empty() || content.rfind("#", 0) == 0) continue;

        try {
            tasks.push_back(parse_task_line(split(content, '|')));
        } catch (const std::logic_error& e) {
            log::warn() << "Task line " << line_no << " skipped: " << e.what() << std::endl;
        }
    }
    return tasks;
}

std::vector<Task> parse_task_file(const std::filesystem::path& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        log::warn() << "Could not open task file " << filename << std::endl;
        return {};
    }
    return parse_tasks(file);
}

Config parse_config(std::istream& in, Config base) {
    Config config = std::move(base);

    auto as_int = [](int& field) {
        return [&field](const std::string& v) { field = to_int(v); };
    };
    auto as_double = [](double& field) {
        return [&field](const std::string& v) { field = to_double(v); };
    };
    auto as_limit = [](std::optional<int>& field) {
        return [&field](const std::string& v) {
            if (lower(v) == "none") {
                field.reset();
            } else {
                field = to_int(v);
            }
        };
    };

    const std::map<std::string, std::function<void(const std::string&)>> setters = {
        {"exact_solver_enabled",
         [&config](const std::string& v) {
             auto flag = parse_flag(v);
             if (!flag) throw std::invalid_argument("expected a boolean, found '" + v + "'");
             config.exact_solver_enabled = *flag;
         }},
        {"solver_timeout_ms", as_int(config.solver_timeout_ms)},
        {"max_exact_candidates", as_int(config.max_exact_candidates)},
        {"default_k", as_int(config.default_k)},
        {"default_timebox_minutes", as_int(config.default_timebox_minutes)},
        {"min_courses", as_int(config.min_courses)},
        {"min_items", as_int(config.min_items)},
        {"heavy_threshold_minutes", as_int(config.heavy_threshold_minutes)},
        {"max_heavy", as_limit(config.max_heavy)},
        {"wip_cap", as_limit(config.wip_cap)},
        {"phase", [&config](const std::string& v) { config.phase = v; }},
        {"urgency.weight", as_double(config.urgency.weight)},
        {"urgency.max_points", as_double(config.urgency.max_points)},
        {"urgency.midpoint_days", as_double(config.urgency.midpoint_days)},
        {"urgency.scale_days", as_double(config.urgency.scale_days)},
        {"impact.weight", as_double(config.impact.weight)},
        {"impact.cap", as_double(config.impact.cap)},
        {"impact.half_saturation", as_double(config.impact.half_saturation)},
        {"category_coefficient", as_double(config.category_coefficient)},
        {"anchor_bonus", as_double(config.anchor_bonus)},
        {"chain_head_bonus", as_double(config.chain_head_bonus)},
    };

    std::string line;
    int line_no = 0;
    std::optional<std::string> row;  // active [weights.<phase>] section
    std::set<std::string> replaced;

    while (std::getline(in, line)) {
        ++line_no;
        const auto hash = line.find('#');
        const std::string content = trim(hash == std::string::npos ? line : line.substr(0, hash));
        if (content.empty()) continue;

        const std::string where = "contracts line " + std::to_string(line_no);

        if (content.front() == '[') {
            if (content.back() != ']') throw ConfigError(where + ": unterminated section");
            const std::string name = trim(content.substr(1, content.size() - 2));
            const std::string prefix = "weights.";
            if (name.rfind(prefix, 0) != 0 || name.size() == prefix.size()) {
                throw ConfigError(where + ": unknown section [" + name + "]");
            }
            row = name.substr(prefix.size());
            if (replaced.insert(*row).second) config.weight_table[*row].clear();
            continue;
        }

        const auto eq = content.find('=');
        if (eq == std::string::npos) throw ConfigError(where + ": expected key = value");
        const std::string key = trim(content.substr(0, eq));
        const std::string value = trim(content.substr(eq + 1));

        try {
            if (row) {
                config.weight_table[*row][lower(key)] = to_double(value);
                continue;
            }
            auto setter = setters.find(key);
            if (setter == setters.end()) {
                log::warn() << where << ": unknown key '" << key << "' ignored" << std::endl;
                continue;
            }
            setter->second(value);
        } catch (const std::logic_error& e) {
            throw ConfigError(where + ": bad value for '" + key + "': " + e.what());
        }
    }
    return config;
}

Config parse_config_file(const std::filesystem::path& filename, Config base) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigError("could not open contracts file " + filename.string());
    }
    return parse_config(file, std::move(base));
}

FileTaskStore::FileTaskStore(std::filesystem::path filename, std::optional<Timestamp> as_of)
    : filename_(std::move(filename)), as_of_(as_of) {}

Snapshot FileTaskStore::snapshot() const {
    Snapshot snapshot;
    snapshot.as_of = as_of_ ? *as_of_ : current_time();
    snapshot.tasks = parse_task_file(filename_);
    return snapshot;
}

} // namespace TaskLattice
