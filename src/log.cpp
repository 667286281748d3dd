// =============================================================================
// log.cpp - Leveled stderr logging
// =============================================================================

#include "crossnav/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace crossnav {
namespace log {

namespace {

std::atomic<uint8_t> current_level{static_cast<uint8_t>(Level::INFO)};
std::mutex write_mutex;

} // namespace

std::optional<Level> parse_level(const std::string& name) {
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn" || name == "warning") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "off") return Level::OFF;
    return std::nullopt;
}

const char* level_name(Level level) {
    switch (level) {
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::OFF: return "off";
    }
    return "unknown";
}

void set_level(Level level) {
    current_level.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(current_level.load(std::memory_order_relaxed));
}

bool enabled(Level lvl) {
    return lvl != Level::OFF &&
           static_cast<uint8_t>(lvl) >= current_level.load(std::memory_order_relaxed);
}

void write(Level lvl, const char* component, const std::string& message) {
    std::lock_guard lock(write_mutex);
    std::cerr << "[" << level_name(lvl) << "] " << component << ": " << message << std::endl;
}

} // namespace log
} // namespace crossnav
