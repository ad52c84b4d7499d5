#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Returns the arguments unchanged.
static void handle_echo(const json &arguments, const mcp_tools::ToolContext &context,
                        mcp_tools::ToolResponder responder) {
    debug_log::log(context.tool_name + " invoked with " + std::to_string(arguments.size()) + " argument(s)");
    responder.resolve(arguments);
}

namespace tool_echo {

void register_tool(mcp_tools::ImplementationTable &table) {
    table["echo"] = handle_echo;
}

} // namespace tool_echo
