// mcpvisor: command-line host for MCP tool servers.
//
//   mcpvisor <server> ping
//   mcpvisor <server> manifest
//   mcpvisor <server> list
//   mcpvisor <server> call <tool> [json-arguments]
//
// Servers come from MCP_SERVERS and the MCP_<name>_* variables. Results are printed as
// JSON on stdout; failures go to stderr with exit code 1.

#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "host/process_supervisor.hpp"
#include "host/server_config.hpp"
#include "host/server_registry.hpp"
#include "platform/platform_abi.hpp"
#include "runtime/event_loop.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

static void print_usage() {
    std::cerr << "Usage: mcpvisor <server> ping|manifest|list|call <tool> [json-arguments]" << std::endl;
}

static int run_command(server_registry::Registry &registry, const std::vector<std::string> &arguments) {
    const std::string &server_name = arguments[0];
    const std::string &command = arguments[1];

    json output;
    if (command == "ping" && arguments.size() == 2) {
        output = registry.request(server_name, "ping");
    } else if (command == "manifest" && arguments.size() == 2) {
        output = registry.request(server_name, "manifest/get");
    } else if (command == "list" && arguments.size() == 2) {
        output = registry.list_tools(server_name);
    } else if (command == "call" && (arguments.size() == 3 || arguments.size() == 4)) {
        json tool_arguments = json::object();
        if (arguments.size() == 4) {
            try {
                tool_arguments = json::parse(arguments[3]);
            } catch (const json::parse_error &error) {
                std::cerr << "[mcpvisor] Invalid JSON arguments: " << error.what() << std::endl;
                return 1;
            }
        }
        output = registry.call_tool(server_name, arguments[2], tool_arguments);
    } else {
        print_usage();
        return 1;
    }

    std::cout << output.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return 0;
}

int main(int argc, char *argv[]) {
    std::vector<std::string> arguments(argv + 1, argv + argc);
    if (arguments.size() < 2) {
        print_usage();
        return 1;
    }

    platform::ignore_broken_pipe();

    int exit_code = 1;
    try {
        event_loop::EventLoop loop;
        server_registry::Registry registry(loop, server_config::catalog_from_environment(),
                                           server_config::options_from_environment());
        exit_code = run_command(registry, arguments);
        registry.close_all();
        // Let the stopped children be reaped before exiting.
        loop.run();
    } catch (const process_supervisor::RpcException &error) {
        json details = error.error().to_json();
        std::cerr << "[mcpvisor] " << error.what() << std::endl;
        std::cerr << details.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
        exit_code = 1;
    } catch (const std::exception &error) {
        debug_log::error(error.what());
        exit_code = 1;
    }
    return exit_code;
}
