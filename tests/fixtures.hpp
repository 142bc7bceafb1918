#ifndef TESTS_FIXTURES_HPP_
#define TESTS_FIXTURES_HPP_

#include "core/task.hpp"

#include <string>
#include <vector>

namespace TaskLattice {
namespace testing {

inline Timestamp at(const std::string& text) {
    return *parse_timestamp(text);
}

inline Task make_task(const std::string& id, const std::string& course,
                      std::vector<std::string> deps = {}, Status status = Status::Todo) {
    Task t;
    t.id = id;
    t.course = course;
    t.title = "Task " + id;
    t.status = status;
    t.est_minutes = 30;
    t.category = "content";
    t.depends_on = std::move(deps);
    return t;
}

// Store that hands out a fixed snapshot.
class MemoryTaskStore : public TaskStore {
public:
    MemoryTaskStore(std::vector<Task> tasks, Timestamp as_of) {
        snapshot_.tasks = std::move(tasks);
        snapshot_.as_of = as_of;
    }

    Snapshot snapshot() const override { return snapshot_; }

private:
    Snapshot snapshot_;
};

} // namespace testing
} // namespace TaskLattice

#endif // TESTS_FIXTURES_HPP_
