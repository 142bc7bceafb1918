#ifndef CORE_LOG_HPP_
#define CORE_LOG_HPP_

#include <ostream>

namespace TaskLattice {
namespace log {

enum class Level { Quiet = 0, Warn = 1, Info = 2, Debug = 3 };

void set_level(Level level);
Level level();

// Diagnostic streams. Each one is std::cerr when enabled, a sink otherwise.
std::ostream& warn();
std::ostream& info();
std::ostream& debug();

} // namespace log
} // namespace TaskLattice

#endif // CORE_LOG_HPP_
