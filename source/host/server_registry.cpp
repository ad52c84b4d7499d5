#include "host/server_registry.hpp"
#include "runtime/event_loop.hpp"
#include "utils/debug_log.hpp"

#include <stdexcept>
#include <utility>

namespace server_registry {

using process_supervisor::RpcOutcome;

json extract_tools(const json &result) {
    if (result.is_object() && result.contains("tools") && result["tools"].is_array()) {
        return result["tools"];
    }
    if (result.is_array()) {
        return result;
    }
    return json::array();
}

json extract_call_result(const json &result) {
    if (result.is_object() && result.contains("result")) {
        return result["result"];
    }
    return result;
}

Registry::Registry(event_loop::EventLoop &loop, server_config::ServerCatalog catalog,
                   server_config::SupervisorOptions options)
    : loop_(loop), catalog_(std::move(catalog)), options_(std::move(options)) {}

Registry::~Registry() {
    close_all();
}

std::vector<std::string> Registry::known_servers() const {
    std::vector<std::string> names;
    for (const auto &entry : catalog_) {
        names.push_back(entry.first);
    }
    return names;
}

process_supervisor::Supervisor *Registry::find(const std::string &server_name) {
    auto it = supervisors_.find(server_name);
    return it == supervisors_.end() ? nullptr : it->second.get();
}

process_supervisor::Supervisor &Registry::get_or_create(const std::string &server_name) {
    if (server_name.empty()) {
        throw std::invalid_argument("MCP server name is required");
    }
    auto existing = supervisors_.find(server_name);
    if (existing != supervisors_.end()) {
        return *existing->second;
    }

    auto config = catalog_.find(server_name);
    if (config == catalog_.end()) {
        std::string known;
        for (const auto &name : known_servers()) {
            known += (known.empty() ? "" : ", ") + name;
        }
        throw std::invalid_argument("Unknown MCP server \"" + server_name + "\". Known: " +
                                    (known.empty() ? std::string("(none)") : known));
    }

    debug_log::log("Creating supervisor for MCP \"" + server_name + "\"");
    auto supervisor = std::make_unique<process_supervisor::Supervisor>(loop_, config->second, options_);
    process_supervisor::Supervisor &reference = *supervisor;
    supervisors_.emplace(server_name, std::move(supervisor));
    return reference;
}

void Registry::ensure_ready_async(const std::string &server_name, RpcCallback callback) {
    get_or_create(server_name).ensure_ready(std::move(callback));
}

void Registry::list_tools_async(const std::string &server_name, RpcCallback callback) {
    get_or_create(server_name).rpc("tools/list", json::object(), [callback](const RpcOutcome &outcome) {
        if (!outcome.success) {
            callback(outcome);
            return;
        }
        callback(RpcOutcome::ok(extract_tools(outcome.result)));
    });
}

void Registry::call_tool_async(const std::string &server_name, const std::string &tool_name, const json &arguments,
                               RpcCallback callback) {
    if (tool_name.empty()) {
        throw std::invalid_argument("Tool name is required");
    }
    json params;
    params["name"] = tool_name;
    params["arguments"] = arguments.is_null() ? json::object() : arguments;
    get_or_create(server_name).rpc("tools/call", params, [callback](const RpcOutcome &outcome) {
        if (!outcome.success) {
            callback(outcome);
            return;
        }
        callback(RpcOutcome::ok(extract_call_result(outcome.result)));
    });
}

void Registry::request_async(const std::string &server_name, const std::string &method, const json &params,
                             RpcCallback callback) {
    get_or_create(server_name).rpc(method, params, std::move(callback));
}

// Runs the loop until the callback fires. Supervisors always answer (response, timeout or
// exit), so the loop cannot run dry first.
json Registry::wait_for(const std::function<void(RpcCallback)> &start) {
    auto outcome = std::make_shared<RpcOutcome>();
    auto done = std::make_shared<bool>(false);
    start([outcome, done](const RpcOutcome &result) {
        *outcome = result;
        *done = true;
    });
    loop_.run_until([done]() { return *done; });
    if (!outcome->success) {
        throw process_supervisor::RpcException(outcome->error);
    }
    return outcome->result;
}

json Registry::ensure_ready(const std::string &server_name) {
    return wait_for([this, &server_name](RpcCallback callback) { ensure_ready_async(server_name, callback); });
}

json Registry::list_tools(const std::string &server_name) {
    return wait_for([this, &server_name](RpcCallback callback) { list_tools_async(server_name, callback); });
}

json Registry::call_tool(const std::string &server_name, const std::string &tool_name, const json &arguments) {
    return wait_for([this, &server_name, &tool_name, &arguments](RpcCallback callback) {
        call_tool_async(server_name, tool_name, arguments, callback);
    });
}

json Registry::request(const std::string &server_name, const std::string &method, const json &params) {
    return wait_for([this, &server_name, &method, &params](RpcCallback callback) {
        request_async(server_name, method, params, callback);
    });
}

void Registry::close_all() {
    std::map<std::string, std::unique_ptr<process_supervisor::Supervisor>> supervisors = std::move(supervisors_);
    supervisors_.clear();
    for (auto &entry : supervisors) {
        entry.second->stop();
    }
}

} // namespace server_registry
