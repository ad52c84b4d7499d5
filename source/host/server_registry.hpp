#ifndef MCPVISOR_SERVER_REGISTRY_HPP
#define MCPVISOR_SERVER_REGISTRY_HPP

// Host entry point: one lazily created Supervisor per configured server name.
//
// The *_async methods deliver their outcome through a callback from the event loop.
// The blocking methods run the loop until the outcome arrives and throw
// process_supervisor::RpcException on failure.

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "host/process_supervisor.hpp"
#include "host/server_config.hpp"

namespace event_loop {
class EventLoop;
}

namespace server_registry {

using json = nlohmann::json;
using process_supervisor::RpcCallback;

class Registry {
public:
    Registry(event_loop::EventLoop &loop, server_config::ServerCatalog catalog,
             server_config::SupervisorOptions options = server_config::SupervisorOptions());
    ~Registry();

    Registry(const Registry &) = delete;
    Registry &operator=(const Registry &) = delete;

    // Existing supervisor, or a new (not yet started) one. Throws std::invalid_argument
    // for names missing from the catalog.
    process_supervisor::Supervisor &get_or_create(const std::string &server_name);

    // Existing supervisor or nullptr.
    process_supervisor::Supervisor *find(const std::string &server_name);

    void ensure_ready_async(const std::string &server_name, RpcCallback callback);
    void list_tools_async(const std::string &server_name, RpcCallback callback);
    void call_tool_async(const std::string &server_name, const std::string &tool_name, const json &arguments,
                         RpcCallback callback);
    void request_async(const std::string &server_name, const std::string &method, const json &params,
                       RpcCallback callback);

    json ensure_ready(const std::string &server_name);
    // The tools array: result.tools, or the result itself when it is an array, else [].
    json list_tools(const std::string &server_name);
    // result.result when present, else the whole result.
    json call_tool(const std::string &server_name, const std::string &tool_name, const json &arguments);
    json request(const std::string &server_name, const std::string &method, const json &params = json::object());

    // Stop every supervisor and forget them.
    void close_all();

    std::vector<std::string> known_servers() const;
    std::size_t active_count() const { return supervisors_.size(); }

private:
    json wait_for(const std::function<void(RpcCallback)> &start);

    event_loop::EventLoop &loop_;
    server_config::ServerCatalog catalog_;
    server_config::SupervisorOptions options_;
    std::map<std::string, std::unique_ptr<process_supervisor::Supervisor>> supervisors_;
};

// Unwrap helpers shared by the async and blocking paths.
json extract_tools(const json &result);
json extract_call_result(const json &result);

} // namespace server_registry

#endif // MCPVISOR_SERVER_REGISTRY_HPP
