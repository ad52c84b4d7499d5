#ifndef MCPVISOR_MCP_DISPATCH_HPP
#define MCPVISOR_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch for a tool server.
// Methods: initialize, ping, manifest/get, tools/list, tools/call.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <string>

#include "mcp/mcp_tools.hpp"
#include "server/manifest.hpp"

namespace event_loop {
class EventLoop;
}

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we answer initialize with.
constexpr const char *PROTOCOL_VERSION = "2024-11-05";

// Receives the single response to a request.
using ReplyFunction = std::function<void(const json &response)>;

class Dispatcher {
public:
    // The manifest must outlive the dispatcher.
    Dispatcher(event_loop::EventLoop &loop, const manifest::Manifest &manifest, mcp_tools::ToolTable tools);

    Dispatcher(const Dispatcher &) = delete;
    Dispatcher &operator=(const Dispatcher &) = delete;

    // Handle one decoded message. Requests get exactly one reply, possibly later from an
    // event loop callback; notifications and stray responses get none.
    void handle_message(const json &message, const ReplyFunction &reply);

    // Requests whose reply has not been sent yet.
    std::size_t in_flight() const { return in_flight_; }

    const mcp_tools::ToolTable &tools() const { return tools_; }

private:
    json handle_initialize(const json &request_id, const json &params) const;
    json handle_ping(const json &request_id) const;
    json handle_manifest_get(const json &request_id) const;
    json handle_tools_list(const json &request_id) const;
    void handle_tools_call(const json &request_id, const json &params, const ReplyFunction &reply);

    event_loop::EventLoop &loop_;
    const manifest::Manifest &manifest_;
    mcp_tools::ToolTable tools_;
    std::size_t in_flight_ = 0;
};

} // namespace mcp_dispatch

#endif // MCPVISOR_MCP_DISPATCH_HPP
