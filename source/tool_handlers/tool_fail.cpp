#include "tool_handlers/tool_handlers.hpp"
#include "protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Always fails, with the error code, message and data taken from the arguments.
static void handle_fail(const json &arguments, const mcp_tools::ToolContext &context,
                        mcp_tools::ToolResponder responder) {
    (void)context;
    (void)responder;

    int code = json_rpc::SERVER_ERROR;
    std::string message = "Tool failed on request";
    json data = nullptr;

    if (arguments.is_object()) {
        if (arguments.contains("code") && arguments["code"].is_number_integer()) {
            code = arguments["code"].get<int>();
        }
        if (arguments.contains("message") && arguments["message"].is_string()) {
            message = arguments["message"].get<std::string>();
        }
        if (arguments.contains("data")) {
            data = arguments["data"];
        }
    }

    throw mcp_tools::ToolError(code, message, data);
}

namespace tool_fail {

void register_tool(mcp_tools::ImplementationTable &table) {
    table["fail"] = handle_fail;
}

} // namespace tool_fail
