#ifndef MCPVISOR_MCP_TOOLS_HPP
#define MCPVISOR_MCP_TOOLS_HPP

// MCP tool table: the manifest's declared tools bound to their implementations, with
// compiled input/output schemas and a per-tool deadline.

#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "schema/json_schema.hpp"

namespace event_loop {
class EventLoop;
}

namespace manifest {
struct Manifest;
}

namespace mcp_tools {

using json = nlohmann::json;

// Thrown by a tool implementation to fail a call with a specific error code and data.
class ToolError : public std::runtime_error {
public:
    ToolError(int code, const std::string &message, json data = nullptr);

    int code() const { return code_; }
    const json &data() const { return data_; }

private:
    int code_;
    json data_;
};

// How a tool execution ended.
struct ToolOutcome {
    bool success = false;
    json result;
    int code = 0;
    std::string message;
    json data;
};

// Completion handle passed to a tool. Copies share one state: the first resolve() or
// reject() settles the call, later ones are ignored.
class ToolResponder {
public:
    using SettleFunction = std::function<void(const ToolOutcome &outcome)>;

    explicit ToolResponder(SettleFunction settle);

    void resolve(const json &result) const;
    void reject(int code, const std::string &message, const json &data = nullptr) const;
    void reject(const ToolError &error) const;

    bool settled() const;

private:
    void settle(ToolOutcome outcome) const;

    struct State {
        bool settled = false;
        SettleFunction settle;
    };
    std::shared_ptr<State> state_;
};

// What a tool may use while executing. Valid only during the exec call; tools keep
// the referenced objects (not the context) if they finish later.
struct ToolContext {
    event_loop::EventLoop &loop;
    const manifest::Manifest &manifest;
    const std::string &tool_name;
};

// A tool implementation. It may settle the responder before returning or later from an
// event loop callback. Throwing ToolError or std::exception fails the call.
using ToolExec = std::function<void(const json &arguments, const ToolContext &context, ToolResponder responder)>;

// Implementations by tool name.
using ImplementationTable = std::map<std::string, ToolExec>;

// A tool as served by the dispatcher.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema;                       // Listed document.
    json_schema::Schema input_validator;
    bool has_output_schema = false;
    json_schema::Schema output_validator;
    std::chrono::milliseconds timeout{0};
    bool optional = false;
    ToolExec exec;                           // Empty when no implementation is bound.
};

class ToolTable {
public:
    // Throws std::invalid_argument on a duplicate name.
    void add(ToolDefinition definition);

    const ToolDefinition *find(const std::string &tool_name) const;

    // Payload of tools/list: [{name, description, input_schema}] in declaration order.
    json list() const;

    std::size_t size() const { return tools_.size(); }
    const std::vector<ToolDefinition> &tools() const { return tools_; }

private:
    std::vector<ToolDefinition> tools_;
};

// Bind every manifest tool to its implementation. An optional tool without one is left
// out; a required tool without one is kept and fails when called.
ToolTable build_tool_table(const manifest::Manifest &manifest, const ImplementationTable &implementations);

} // namespace mcp_tools

#endif // MCPVISOR_MCP_TOOLS_HPP
