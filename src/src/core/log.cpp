#include "core/log.hpp"

#include <atomic>
#include <iostream>
#include <streambuf>

namespace TaskLattice {
namespace log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Warn)};

class NullBuffer : public std::streambuf {
protected:
    int overflow(int c) override { return c; }
};

std::ostream& sink() {
    static NullBuffer buffer;
    static std::ostream stream(&buffer);
    return stream;
}

std::ostream& stream_for(Level wanted) {
    return g_level.load() >= static_cast<int>(wanted) ? std::cerr : sink();
}

} // namespace

void set_level(Level level) {
    g_level.store(static_cast<int>(level));
}

Level level() {
    return static_cast<Level>(g_level.load());
}

std::ostream& warn() { return stream_for(Level::Warn); }
std::ostream& info() { return stream_for(Level::Info); }
std::ostream& debug() { return stream_for(Level::Debug); }

} // namespace log
} // namespace TaskLattice
