#include "utils/debug_log.hpp"

#include <cstdlib>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <string>

namespace debug_log {

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static bool is_truthy(const char *value) {
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

static Level level_from_environment() {
    if (is_truthy(std::getenv("MCPVISOR_DEBUG"))) {
        return Level::debug;
    }
    const char *value = std::getenv("MCPVISOR_LOG_LEVEL");
    if (value == nullptr || value[0] == '\0') {
        return Level::info;
    }
    return parse_level(value);
}

// -1 until first use; then the numeric value of the active level.
static int active_level = -1;

Level parse_level(const std::string &text) {
    std::string normalized = to_lower(text);
    if (normalized == "error") {
        return Level::error;
    }
    if (normalized == "warn" || normalized == "warning") {
        return Level::warn;
    }
    if (normalized == "debug" || normalized == "trace") {
        return Level::debug;
    }
    return Level::info;
}

const char *level_name(Level level) {
    switch (level) {
    case Level::error:
        return "error";
    case Level::warn:
        return "warn";
    case Level::info:
        return "info";
    case Level::debug:
        return "debug";
    }
    return "info";
}

Level current_level() {
    if (active_level < 0) {
        active_level = static_cast<int>(level_from_environment());
    }
    return static_cast<Level>(active_level);
}

void set_level(Level level) {
    active_level = static_cast<int>(level);
}

bool is_enabled(Level level) {
    return static_cast<int>(level) <= static_cast<int>(current_level());
}

bool is_debug_enabled() {
    return is_enabled(Level::debug);
}

void write(Level level, const std::string &message) {
    if (!is_enabled(level)) {
        return;
    }
    std::cerr << "[mcpvisor] [" << level_name(level) << "] " << message << std::endl;
}

void error(const std::string &message) {
    write(Level::error, message);
}

void warn(const std::string &message) {
    write(Level::warn, message);
}

void info(const std::string &message) {
    write(Level::info, message);
}

void log(const std::string &message) {
    write(Level::debug, message);
}

} // namespace debug_log
