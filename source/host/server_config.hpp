#ifndef MCPVISOR_SERVER_CONFIG_HPP
#define MCPVISOR_SERVER_CONFIG_HPP

// Host-side configuration: how to launch each tool server and how to supervise it.
//
// Per-server environment variables (for a server named "auditor"):
//   MCP_auditor_CMD       full command line (whitespace separated, quotes group words)
//   MCP_auditor_ARGS      extra arguments appended to the command line
//   MCP_auditor_CWD       working directory of the child
//   MCP_auditor_MANIFEST  exported to the child as MCP_MANIFEST_PATH
//   MCP_auditor_FRAMING   "ndjson" (default) or "lsp" for host-to-child writes
// Shared:
//   MCP_SERVERS           comma separated server names (default "auditor")
//   MCP_LOG_LEVEL         exported to children as MCPVISOR_LOG_LEVEL
//   MCP_REQUEST_TIMEOUT_MS, MCP_IDLE_TTL_MS

#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "protocol/framing.hpp"

namespace server_config {

using json = nlohmann::json;

constexpr const char *DEFAULT_SERVER_NAME = "auditor";
constexpr const char *DEFAULT_SERVER_EXECUTABLE = "mcpvisor-server";

struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::string cwd; // Empty: inherit.
    std::map<std::string, std::string> env;
    framing::Framing framing = framing::Framing::ndjson;
};

using ServerCatalog = std::map<std::string, ServerConfig>;

struct SupervisorOptions {
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds idle_ttl{120000}; // Zero or negative disables idle shutdown.
    std::chrono::milliseconds initialize_timeout{10000};
    std::chrono::milliseconds probe_timeout{5000};
    std::chrono::milliseconds ensure_ready_probe_timeout{8000};
    std::chrono::milliseconds probe_initial_delay{120};
    double probe_backoff_factor = 1.6;
    std::chrono::milliseconds probe_max_delay{1000};
    int probe_attempts = 5;
    std::chrono::milliseconds stop_grace{200};
    std::string protocol_version = "2024-11-05";
    std::string client_name = "mcpvisor";
    std::string client_version = "0.1.0";
};

// Split a command line on whitespace. Single or double quotes group words; a backslash
// escapes the next character outside single quotes. Throws std::runtime_error
// "Empty MCP cmdLine" when no word remains, or on an unterminated quote.
std::vector<std::string> split_command_line(const std::string &command_line);

// Build a config from a command line: the first word is the command, the rest args.
ServerConfig make_server_config(const std::string &name, const std::string &command_line);

// Config for one server from the MCP_<name>_* variables. Without MCP_<name>_CMD the
// command is the mcpvisor-server binary next to the running executable, or on PATH.
ServerConfig config_from_environment(const std::string &name);

// Configs for every name in MCP_SERVERS.
ServerCatalog catalog_from_environment();

// Supervisor options from MCP_REQUEST_TIMEOUT_MS and MCP_IDLE_TTL_MS. Values that are
// not integers fall back to the defaults.
SupervisorOptions options_from_environment();

// Parse a decimal integer (optional sign), falling back when the text is not one.
long long parse_integer(const std::string &text, long long fallback);

json describe(const ServerConfig &config);

} // namespace server_config

#endif // MCPVISOR_SERVER_CONFIG_HPP
