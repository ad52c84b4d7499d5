#ifndef MCPVISOR_DEBUG_LOG_HPP
#define MCPVISOR_DEBUG_LOG_HPP

// Leveled logging to stderr. Stdout is reserved for protocol traffic.

#include <string>

namespace debug_log {

enum class Level {
    error = 0,
    warn = 1,
    info = 2,
    debug = 3,
};

// Parse "error", "warn", "info" or "debug" (case-insensitive). Unknown values yield info.
Level parse_level(const std::string &text);

// Name of a level as printed in the log prefix.
const char *level_name(Level level);

// Threshold from MCPVISOR_LOG_LEVEL (default info). MCPVISOR_DEBUG=1|true|yes forces debug.
// Read once on first use; set_level() overrides it.
Level current_level();
void set_level(Level level);

// Returns true if messages at the given level are written.
bool is_enabled(Level level);

// Returns true if the debug level is enabled.
bool is_debug_enabled();

void write(Level level, const std::string &message);

void error(const std::string &message);
void warn(const std::string &message);
void info(const std::string &message);

// Writes message at debug level.
void log(const std::string &message);

} // namespace debug_log

#endif // MCPVISOR_DEBUG_LOG_HPP
