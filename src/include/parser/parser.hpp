#ifndef PARSER_PARSER_HPP
#define PARSER_PARSER_HPP

#include "core/config.hpp"
#include "core/task.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <vector>

namespace TaskLattice {

/**
 * @brief Reads a task file and parses its contents into task records.
 *
 * One task per line, fields separated by '|':
 *
 *   id | course | title | status | due_at | est_minutes | weight | category | anchor | depends_on [| created_at | updated_at]
 *
 * depends_on is a comma-separated id list; empty fields take their defaults.
 * Lines starting with '#' are comments. Malformed lines are reported on
 * std::cerr and skipped.
 *
 * @param filename The path to the task file.
 * @return The tasks in file order.
 */
std::vector<Task> parse_task_file(const std::filesystem::path& filename);
std::vector<Task> parse_tasks(std::istream& in);

/**
 * @brief Reads a priority contracts file on top of `base`.
 *
 * "key = value" lines; "[weights.<phase>]" opens a weight-table row that
 * replaces the built-in row of the same name. Throws ConfigError on a value
 * that does not parse; unknown keys are reported and ignored. The result is
 * not validated here.
 */
Config parse_config_file(const std::filesystem::path& filename, Config base = {});
Config parse_config(std::istream& in, Config base = {});

/**
 * @brief Task Store backed by a task file, re-read on every snapshot.
 */
class FileTaskStore : public TaskStore {
public:
    explicit FileTaskStore(std::filesystem::path filename,
                           std::optional<Timestamp> as_of = std::nullopt);

    Snapshot snapshot() const override;

private:
    std::filesystem::path filename_;
    std::optional<Timestamp> as_of_;
};

} // namespace TaskLattice

#endif // PARSER_PARSER_HPP
