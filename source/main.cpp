// mcpvisor-server: MCP tool server over stdio.
// Entry point: loads the manifest, binds the built-in tools, serves JSON-RPC 2.0 on
// stdin/stdout until EOF or SIGINT/SIGTERM.
//
// Logs go to stderr; stdout carries protocol traffic only.

#include <nlohmann/json.hpp>
#include <signal.h>
#include <unistd.h>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "platform/platform_abi.hpp"
#include "runtime/event_loop.hpp"
#include "server/manifest.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

// No SA_RESTART, so a signal interrupts poll() and the loop notices the flag.
static void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

static void print_usage() {
    std::cerr << "Usage: mcpvisor-server [--manifest <path>]" << std::endl;
}

// Manifest env entries fill in variables the environment does not already set.
static void apply_manifest_environment(const manifest::Manifest &loaded) {
    for (const auto &entry : loaded.env) {
        setenv(entry.first.c_str(), entry.second.c_str(), 0);
    }
}

int main(int argc, char *argv[]) {
    std::string manifest_path;
    for (int index = 1; index < argc; ++index) {
        std::string argument = argv[index];
        if (argument == "--manifest" && index + 1 < argc) {
            manifest_path = argv[++index];
        } else if (argument == "--help" || argument == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "[mcpvisor] Unknown argument: " << argument << std::endl;
            print_usage();
            return 2;
        }
    }

    install_signal_handlers();
    platform::ignore_broken_pipe();

    manifest::Manifest loaded;
    try {
        loaded = manifest::load(manifest_path);
    } catch (const manifest::ManifestError &error) {
        std::string details = error.data().is_null() ? "" : " " + error.data().dump();
        debug_log::error(std::string(error.what()) + details);
        return 1;
    }
    apply_manifest_environment(loaded);

    event_loop::EventLoop loop;
    mcp_tools::ToolTable tools;
    try {
        tools = mcp_tools::build_tool_table(loaded, tool_handlers::builtin_implementations());
    } catch (const std::exception &error) {
        debug_log::error(std::string("Cannot build tool table: ") + error.what());
        return 1;
    }

    mcp_dispatch::Dispatcher dispatcher(loop, loaded, std::move(tools));
    mcp_stdio::StdioServer server(loop, dispatcher, STDIN_FILENO, mcp_stdio::descriptor_sink(STDOUT_FILENO));
    server.start();

    debug_log::info(loaded.name + " " + loaded.version + " serving " + std::to_string(dispatcher.tools().size()) +
                    " tool(s) from " + loaded.source_path);

    // Main loop: serve until input ends (and in-flight calls settle) or a signal arrives.
    while (shutdown_requested == 0 && !server.finished()) {
        if (!loop.run_once()) {
            break;
        }
    }

    if (shutdown_requested != 0) {
        debug_log::info("Signal received. Shutting down.");
    } else {
        debug_log::log("EOF on stdin. Shutting down.");
    }
    return 0;
}
