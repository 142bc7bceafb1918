#ifndef CORE_TASK_HPP_
#define CORE_TASK_HPP_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace TaskLattice {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

enum class Status { Blocked, Todo, Doing, Review, Done };

struct Task {
    std::string id;
    std::string course;
    std::string title;
    Status status = Status::Todo;
    std::optional<Timestamp> due_at;
    int est_minutes = 0;
    double weight = 1.0;
    std::string category;
    bool anchor = false;
    std::vector<std::string> depends_on;
    std::optional<Timestamp> created_at;
    std::optional<Timestamp> updated_at;
};

// One point-in-time view of the task set. as_of is the only "now" the
// engine ever looks at.
struct Snapshot {
    std::vector<Task> tasks;
    Timestamp as_of;
};

class TaskStore {
public:
    virtual ~TaskStore() = default;
    virtual Snapshot snapshot() const = 0;
};

std::string to_string(Status status);
std::optional<Status> parse_status(const std::string& text);

/**
 * @brief Parses "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM[:SS][Z]" as UTC.
 *
 * @return std::nullopt on malformed input.
 */
std::optional<Timestamp> parse_timestamp(const std::string& text);
std::string format_date(Timestamp ts);
Timestamp current_time();

// --- Status state machine ---
// blocked -> todo -> doing -> review -> done, one step at a time.

std::optional<Status> next_status(Status status);

/**
 * @brief Moves a task one step along the status table.
 *
 * Throws InvalidTransitionError for anything but the next status; the task is
 * left untouched in that case. A done task can only go back through reopen().
 */
void apply_transition(Task& task, Status to, Timestamp now);

/**
 * @brief Explicit path out of done: back to todo, or to blocked when some
 * dependency is still open.
 *
 * Dependencies are looked up by id in @p tasks; ids not found there are
 * ignored, as the graph ignores them.
 */
void reopen(Task& task, const std::vector<Task>& tasks, Timestamp now);

/**
 * @brief Records a new dependency. An open task that gains an unfinished
 * dependency becomes blocked.
 */
void add_dependency(Task& task, const Task& dependency, Timestamp now);

} // namespace TaskLattice

#endif // CORE_TASK_HPP_
