#include "tool_handlers/tool_handlers.hpp"
#include "protocol/json_rpc.hpp"
#include "runtime/event_loop.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>

using json = nlohmann::json;

// One day.
static constexpr double MAXIMUM_SLEEP_MILLISECONDS = 86400000.0;

// Resolves {slept_ms} after "ms" milliseconds. The wait is a loop timer, so other
// requests keep being served meanwhile.
static void handle_sleep(const json &arguments, const mcp_tools::ToolContext &context,
                         mcp_tools::ToolResponder responder) {
    if (!arguments.is_object() || !arguments.contains("ms") || !arguments["ms"].is_number() ||
        !(arguments["ms"].get<double>() >= 0)) {
        throw mcp_tools::ToolError(json_rpc::INVALID_PARAMS, "sleep requires a non-negative number 'ms'.");
    }
    if (arguments["ms"].get<double>() > MAXIMUM_SLEEP_MILLISECONDS) {
        throw mcp_tools::ToolError(json_rpc::INVALID_PARAMS, "sleep 'ms' must not exceed 86400000.");
    }

    std::int64_t milliseconds = static_cast<std::int64_t>(arguments["ms"].get<double>());
    debug_log::log("sleep invoked ms=" + std::to_string(milliseconds));

    context.loop.schedule_timer(std::chrono::milliseconds(milliseconds), [responder, milliseconds]() {
        responder.resolve(json{{"slept_ms", milliseconds}});
    });
}

namespace tool_sleep {

void register_tool(mcp_tools::ImplementationTable &table) {
    table["sleep"] = handle_sleep;
}

} // namespace tool_sleep
