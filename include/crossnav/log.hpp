#ifndef CROSSNAV_LOG_HPP
#define CROSSNAV_LOG_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace crossnav {
namespace log {

enum class Level : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

// "debug", "info", "warn", "error", "off"
std::optional<Level> parse_level(const std::string& name);
const char* level_name(Level level);

void set_level(Level level);
Level level();
bool enabled(Level level);

// Writes "[level] component: message" to stderr
void write(Level level, const char* component, const std::string& message);

inline void debug(const char* component, const std::string& message) {
    if (enabled(Level::DEBUG)) write(Level::DEBUG, component, message);
}

inline void info(const char* component, const std::string& message) {
    if (enabled(Level::INFO)) write(Level::INFO, component, message);
}

inline void warn(const char* component, const std::string& message) {
    if (enabled(Level::WARN)) write(Level::WARN, component, message);
}

inline void error(const char* component, const std::string& message) {
    if (enabled(Level::ERROR)) write(Level::ERROR, component, message);
}

} // namespace log
} // namespace crossnav

#endif // CROSSNAV_LOG_HPP
