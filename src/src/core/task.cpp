#include "core/task.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace TaskLattice {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
long days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

void civil_from_days(long z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe) + static_cast<int>(era * 400) + (m <= 2);
}

bool read_number(const std::string& text, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > text.size()) return false;
    int value = 0;
    for (std::size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

} // namespace

std::string to_string(Status status) {
    switch (status) {
        case Status::Blocked: return "blocked";
        case Status::Todo: return "todo";
        case Status::Doing: return "doing";
        case Status::Review: return "review";
        case Status::Done: return "done";
    }
    return "unknown";
}

std::optional<Status> parse_status(const std::string& text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "blocked") return Status::Blocked;
    if (s == "todo") return Status::Todo;
    if (s == "doing" || s == "in_progress") return Status::Doing;
    if (s == "review") return Status::Review;
    if (s == "done" || s == "completed") return Status::Done;
    return std::nullopt;
}

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0;
    if (!read_number(text, 0, 4, year) || text.size() < 10 || text[4] != '-' ||
        !read_number(text, 5, 2, month) || text[7] != '-' || !read_number(text, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;

    int hour = 0, minute = 0, second = 0;
    std::size_t pos = 10;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        if (!read_number(text, pos + 1, 2, hour) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !read_number(text, pos + 4, 2, minute)) {
            return std::nullopt;
        }
        pos += 6;
        if (pos < text.size() && text[pos] == ':') {
            if (!read_number(text, pos + 1, 2, second)) return std::nullopt;
            pos += 3;
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
    }
    if (pos < text.size() && text[pos] == 'Z') ++pos;
    if (pos != text.size()) return std::nullopt;

    const long days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    // Days past the end of the month roll over; reject them.
    int check_year = 0;
    unsigned check_month = 0, check_day = 0;
    civil_from_days(days, check_year, check_month, check_day);
    if (check_year != year || check_month != static_cast<unsigned>(month) ||
        check_day != static_cast<unsigned>(day)) {
        return std::nullopt;
    }

    const long long secs = static_cast<long long>(days) * 86400 + hour * 3600 + minute * 60 + second;
    return Timestamp(std::chrono::seconds(secs));
}

std::string format_date(Timestamp ts) {
    const long long secs = ts.time_since_epoch().count();
    long days = static_cast<long>(secs / 86400);
    if (secs % 86400 < 0) --days;
    int y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return buf;
}

Timestamp current_time() {
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

std::optional<Status> next_status(Status status) {
    switch (status) {
        case Status::Blocked: return Status::Todo;
        case Status::Todo: return Status::Doing;
        case Status::Doing: return Status::Review;
        case Status::Review: return Status::Done;
        case Status::Done: return std::nullopt;
    }
    return std::nullopt;
}

void apply_transition(Task& task, Status to, Timestamp now) {
    auto next = next_status(task.status);
    if (!next || *next != to) {
        throw InvalidTransitionError(task.id, task.status, to);
    }
    task.status = to;
    task.updated_at = now;
}

void reopen(Task& task, const std::vector<Task>& tasks, Timestamp now) {
    const bool has_open_dependencies =
        std::any_of(task.depends_on.begin(), task.depends_on.end(), [&](const std::string& id) {
            auto it = std::find_if(tasks.begin(), tasks.end(),
                                   [&id](const Task& t) { return t.id == id; });
            return it != tasks.end() && it->status != Status::Done;
        });
    const Status target = has_open_dependencies ? Status::Blocked : Status::Todo;
    if (task.status != Status::Done) {
        throw InvalidTransitionError(task.id, task.status, target);
    }
    task.status = target;
    task.updated_at = now;
}

void add_dependency(Task& task, const Task& dependency, Timestamp now) {
    if (dependency.id == task.id) {
        throw std::invalid_argument("task " + task.id + " cannot depend on itself");
    }
    const bool open = dependency.status != Status::Done;
    if (open && task.status == Status::Done) {
        // Reopen first; done is never left as a side effect.
        throw InvalidTransitionError(task.id, task.status, Status::Blocked);
    }
    if (std::find(task.depends_on.begin(), task.depends_on.end(), dependency.id) ==
        task.depends_on.end()) {
        task.depends_on.push_back(dependency.id);
    }
    if (open && task.status != Status::Blocked) {
        task.status = Status::Blocked;
    }
    task.updated_at = now;
}

} // namespace TaskLattice
