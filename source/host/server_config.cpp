#include "host/server_config.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace server_config {

static std::string environment_value(const std::string &key) {
    const char *value = std::getenv(key.c_str());
    return value == nullptr ? "" : std::string(value);
}

static std::string trim(const std::string &text) {
    std::size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }
    std::size_t last = text.size();
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
        --last;
    }
    return text.substr(first, last - first);
}

std::vector<std::string> split_command_line(const std::string &command_line) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = '\0';

    for (std::size_t index = 0; index < command_line.size(); ++index) {
        char character = command_line[index];
        if (quote != '\0') {
            if (character == quote) {
                quote = '\0';
            } else if (character == '\\' && quote == '"' && index + 1 < command_line.size()) {
                current += command_line[++index];
            } else {
                current += character;
            }
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(character))) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
            continue;
        }
        in_word = true;
        if (character == '"' || character == '\'') {
            quote = character;
        } else if (character == '\\' && index + 1 < command_line.size()) {
            current += command_line[++index];
        } else {
            current += character;
        }
    }

    if (quote != '\0') {
        throw std::runtime_error("Unterminated quote in MCP cmdLine: " + command_line);
    }
    if (in_word) {
        words.push_back(current);
    }
    if (words.empty()) {
        throw std::runtime_error("Empty MCP cmdLine");
    }
    return words;
}

ServerConfig make_server_config(const std::string &name, const std::string &command_line) {
    std::vector<std::string> words = split_command_line(command_line);
    ServerConfig config;
    config.name = name;
    config.command = words.front();
    config.args.assign(words.begin() + 1, words.end());
    return config;
}

// The server binary shipped next to the running executable, else whatever PATH finds.
static std::string default_command_line() {
    std::string executable_path = platform::current_executable_path();
    if (!executable_path.empty()) {
        std::filesystem::path sibling =
            std::filesystem::path(executable_path).parent_path() / DEFAULT_SERVER_EXECUTABLE;
        std::error_code error;
        if (std::filesystem::exists(sibling, error)) {
            return sibling.string();
        }
    }
    return DEFAULT_SERVER_EXECUTABLE;
}

ServerConfig config_from_environment(const std::string &name) {
    const std::string prefix = "MCP_" + name + "_";

    std::string command_line = trim(environment_value(prefix + "CMD"));
    if (command_line.empty()) {
        command_line = default_command_line();
    }
    std::string extra_arguments = trim(environment_value(prefix + "ARGS"));
    if (!extra_arguments.empty()) {
        command_line += " " + extra_arguments;
    }

    ServerConfig config = make_server_config(name, command_line);
    config.cwd = trim(environment_value(prefix + "CWD"));

    std::string log_level = trim(environment_value("MCP_LOG_LEVEL"));
    if (!log_level.empty()) {
        config.env["MCPVISOR_LOG_LEVEL"] = log_level;
    }
    std::string manifest_path = trim(environment_value(prefix + "MANIFEST"));
    if (!manifest_path.empty()) {
        config.env["MCP_MANIFEST_PATH"] = manifest_path;
    }

    std::string framing_text = trim(environment_value(prefix + "FRAMING"));
    if (!framing_text.empty()) {
        framing::Framing requested = framing::parse_framing(framing_text);
        if (requested == framing::Framing::unknown) {
            debug_log::warn("Ignoring unknown framing \"" + framing_text + "\" for MCP server " + name);
        } else {
            config.framing = requested;
        }
    }
    return config;
}

ServerCatalog catalog_from_environment() {
    std::string names = environment_value("MCP_SERVERS");
    if (trim(names).empty()) {
        names = DEFAULT_SERVER_NAME;
    }

    ServerCatalog catalog;
    std::size_t start = 0;
    while (start <= names.size()) {
        std::size_t comma = names.find(',', start);
        if (comma == std::string::npos) {
            comma = names.size();
        }
        std::string name = trim(names.substr(start, comma - start));
        if (!name.empty()) {
            catalog[name] = config_from_environment(name);
        }
        start = comma + 1;
    }
    return catalog;
}

long long parse_integer(const std::string &text, long long fallback) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return fallback;
    }
    std::size_t index = 0;
    if (trimmed[0] == '-' || trimmed[0] == '+') {
        index = 1;
    }
    if (index == trimmed.size()) {
        return fallback;
    }
    for (std::size_t position = index; position < trimmed.size(); ++position) {
        if (!std::isdigit(static_cast<unsigned char>(trimmed[position]))) {
            return fallback;
        }
    }
    try {
        return std::stoll(trimmed);
    } catch (const std::out_of_range &) {
        return fallback;
    }
}

SupervisorOptions options_from_environment() {
    SupervisorOptions options;
    options.request_timeout = std::chrono::milliseconds(
        parse_integer(environment_value("MCP_REQUEST_TIMEOUT_MS"), options.request_timeout.count()));
    options.idle_ttl = std::chrono::milliseconds(
        parse_integer(environment_value("MCP_IDLE_TTL_MS"), options.idle_ttl.count()));
    return options;
}

json describe(const ServerConfig &config) {
    json result;
    result["name"] = config.name;
    result["command"] = config.command;
    result["args"] = config.args;
    result["cwd"] = config.cwd.empty() ? json(nullptr) : json(config.cwd);
    result["env"] = config.env;
    result["framing"] = framing::framing_name(config.framing);
    return result;
}

} // namespace server_config
