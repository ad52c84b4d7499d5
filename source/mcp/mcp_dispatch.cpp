#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "runtime/event_loop.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <memory>
#include <utility>

namespace mcp_dispatch {

static std::int64_t unix_time_milliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

Dispatcher::Dispatcher(event_loop::EventLoop &loop, const manifest::Manifest &manifest, mcp_tools::ToolTable tools)
    : loop_(loop), manifest_(manifest), tools_(std::move(tools)) {}

// Handle the "initialize" request.
json Dispatcher::handle_initialize(const json &request_id, const json &params) const {
    (void)params; // We accept any client capabilities.

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = manifest_.name;
    server_info["version"] = manifest_.version;
    if (!manifest_.description.empty()) {
        server_info["description"] = manifest_.description;
    }

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_ping(const json &request_id) const {
    return json_rpc::build_response(request_id, json{{"ok", true}, {"ts", unix_time_milliseconds()}});
}

json Dispatcher::handle_manifest_get(const json &request_id) const {
    return json_rpc::build_response(request_id, manifest_.describe());
}

json Dispatcher::handle_tools_list(const json &request_id) const {
    json result;
    result["tools"] = tools_.list();
    return json_rpc::build_response(request_id, result);
}

// Per-call bookkeeping shared by the deadline timer and the tool's responder.
struct PendingCall {
    bool replied = false;
    event_loop::TimerId deadline_timer = event_loop::INVALID_TIMER;
};

// Validate, execute under the tool's deadline, validate the output, reply once.
void Dispatcher::handle_tools_call(const json &request_id, const json &params, const ReplyFunction &reply) {
    if (!params.contains("name") || !params["name"].is_string() || params["name"].get<std::string>().empty()) {
        reply(json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, "Missing tool name"));
        return;
    }
    std::string tool_name = params["name"].get<std::string>();

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    const mcp_tools::ToolDefinition *tool = tools_.find(tool_name);
    if (tool == nullptr) {
        reply(json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND, "Unknown tool: " + tool_name,
                                             json{{"name", tool_name}}));
        return;
    }

    json_schema::ValidationResult input_check = tool->input_validator.validate(arguments);
    if (!input_check.valid) {
        debug_log::log("Invalid input for " + tool_name + ": " + input_check.summary());
        reply(json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                             "Invalid input for `" + tool_name + "`",
                                             json{{"errors", input_check.errors_json()}}));
        return;
    }

    if (!tool->exec) {
        reply(json_rpc::build_error_response(request_id, json_rpc::SERVER_ERROR,
                                             "Tool `" + tool_name + "` is not implemented"));
        return;
    }

    auto call = std::make_shared<PendingCall>();
    ++in_flight_;

    // Tool definitions live as long as the dispatcher, so the pointer stays valid for
    // callbacks the loop runs later.
    auto finish = [this, call, reply](const json &response) {
        call->replied = true;
        if (call->deadline_timer != event_loop::INVALID_TIMER) {
            loop_.cancel_timer(call->deadline_timer);
            call->deadline_timer = event_loop::INVALID_TIMER;
        }
        --in_flight_;
        reply(response);
    };

    long long timeout_ms = static_cast<long long>(tool->timeout.count());
    call->deadline_timer = loop_.schedule_timer(tool->timeout, [call, finish, request_id, tool_name, timeout_ms]() {
        call->deadline_timer = event_loop::INVALID_TIMER;
        if (call->replied) {
            return;
        }
        debug_log::warn("Tool " + tool_name + " timed out after " + std::to_string(timeout_ms) + " ms");
        finish(json_rpc::build_error_response(request_id, json_rpc::SERVER_ERROR,
                                              "Tool `" + tool_name + "` timed out after " +
                                                  std::to_string(timeout_ms) + " ms",
                                              json{{"timeoutMs", timeout_ms}}));
    });

    mcp_tools::ToolResponder responder([call, finish, request_id, tool](const mcp_tools::ToolOutcome &outcome) {
        if (call->replied) {
            // The deadline already answered; cancellation is advisory.
            debug_log::log("Late completion of tool " + tool->name + " ignored");
            return;
        }
        if (!outcome.success) {
            debug_log::log("Tool " + tool->name + " failed: " + outcome.message);
            finish(json_rpc::build_error_response(request_id, outcome.code, outcome.message, outcome.data));
            return;
        }
        if (tool->has_output_schema) {
            json_schema::ValidationResult output_check = tool->output_validator.validate(outcome.result);
            if (!output_check.valid) {
                debug_log::warn("Tool " + tool->name + " produced invalid output: " + output_check.summary());
                finish(json_rpc::build_error_response(request_id, json_rpc::INVALID_TOOL_OUTPUT,
                                                      "Tool `" + tool->name + "` produced invalid output",
                                                      json{{"errors", output_check.errors_json()}}));
                return;
            }
        }
        json result;
        result["name"] = tool->name;
        result["result"] = outcome.result;
        finish(json_rpc::build_response(request_id, result));
    });

    mcp_tools::ToolContext context{loop_, manifest_, tool->name};
    try {
        tool->exec(arguments, context, responder);
    } catch (const mcp_tools::ToolError &error) {
        responder.reject(error);
    } catch (const std::exception &error) {
        responder.reject(json_rpc::SERVER_ERROR, error.what());
    }
}

void Dispatcher::handle_message(const json &message, const ReplyFunction &reply) {
    json_rpc::MessageKind kind = json_rpc::classify(message);

    if (kind == json_rpc::MessageKind::notification) {
        // "notifications/initialized" and friends need no response.
        debug_log::log("Notification received: " + json_rpc::get_method(message));
        return;
    }
    if (kind == json_rpc::MessageKind::response) {
        debug_log::log("Ignoring response message on the server side");
        return;
    }

    json request_id = json_rpc::get_id(message);
    if (kind == json_rpc::MessageKind::invalid) {
        reply(json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Invalid Request"));
        return;
    }

    // Guarantees one reply per request even if a handler throws after replying.
    auto replied = std::make_shared<bool>(false);
    ReplyFunction reply_once = [replied, reply](const json &response) {
        if (*replied) {
            return;
        }
        *replied = true;
        reply(response);
    };

    std::string method = json_rpc::get_method(message);
    json params = json_rpc::get_params(message);

    try {
        if (method == "initialize") {
            reply_once(handle_initialize(request_id, params));
        } else if (method == "ping") {
            reply_once(handle_ping(request_id));
        } else if (method == "manifest/get") {
            reply_once(handle_manifest_get(request_id));
        } else if (method == "tools/list") {
            reply_once(handle_tools_list(request_id));
        } else if (method == "tools/call") {
            handle_tools_call(request_id, params, reply_once);
        } else {
            reply_once(json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                                      "Method not found: " + method));
        }
    } catch (const std::exception &error) {
        debug_log::error("Handler for " + method + " failed: " + error.what());
        reply_once(json_rpc::build_error_response(request_id, json_rpc::SERVER_ERROR, "Internal error",
                                                  json{{"message", error.what()}}));
    }
}

} // namespace mcp_dispatch
