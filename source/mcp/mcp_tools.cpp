#include "mcp/mcp_tools.hpp"
#include "server/manifest.hpp"
#include "utils/debug_log.hpp"

#include <utility>

namespace mcp_tools {

ToolError::ToolError(int code, const std::string &message, json data)
    : std::runtime_error(message), code_(code), data_(std::move(data)) {}

ToolResponder::ToolResponder(SettleFunction settle) : state_(std::make_shared<State>()) {
    state_->settle = std::move(settle);
}

void ToolResponder::settle(ToolOutcome outcome) const {
    if (state_->settled) {
        debug_log::log("Tool responder settled twice; ignoring the later outcome");
        return;
    }
    state_->settled = true;
    SettleFunction settle_function = std::move(state_->settle);
    state_->settle = nullptr;
    if (settle_function) {
        settle_function(outcome);
    }
}

void ToolResponder::resolve(const json &result) const {
    ToolOutcome outcome;
    outcome.success = true;
    outcome.result = result;
    settle(std::move(outcome));
}

void ToolResponder::reject(int code, const std::string &message, const json &data) const {
    ToolOutcome outcome;
    outcome.success = false;
    outcome.code = code;
    outcome.message = message;
    outcome.data = data;
    settle(std::move(outcome));
}

void ToolResponder::reject(const ToolError &error) const {
    reject(error.code(), error.what(), error.data());
}

bool ToolResponder::settled() const {
    return state_->settled;
}

void ToolTable::add(ToolDefinition definition) {
    if (find(definition.name) != nullptr) {
        throw std::invalid_argument("Duplicate tool name: " + definition.name);
    }
    tools_.push_back(std::move(definition));
}

const ToolDefinition *ToolTable::find(const std::string &tool_name) const {
    for (const auto &tool : tools_) {
        if (tool.name == tool_name) {
            return &tool;
        }
    }
    return nullptr;
}

json ToolTable::list() const {
    json tools_array = json::array();
    for (const auto &tool : tools_) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["input_schema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }
    return tools_array;
}

ToolTable build_tool_table(const manifest::Manifest &manifest, const ImplementationTable &implementations) {
    ToolTable table;
    for (const auto &entry : manifest.tools) {
        auto implementation = implementations.find(entry.name);
        bool implemented = implementation != implementations.end() && implementation->second;
        if (!implemented && entry.optional) {
            debug_log::info("Optional tool " + entry.name + " has no implementation; not served");
            continue;
        }
        if (!implemented) {
            debug_log::warn("Tool " + entry.name + " has no implementation; calls will fail");
        }

        ToolDefinition definition;
        definition.name = entry.name;
        definition.description = entry.description;
        definition.input_schema = entry.input_schema;
        definition.input_validator = json_schema::Schema(entry.input_schema);
        if (!entry.output_schema.is_null()) {
            definition.has_output_schema = true;
            definition.output_validator = json_schema::Schema(entry.output_schema);
        }
        definition.timeout = std::chrono::milliseconds(entry.effective_timeout_ms(manifest.limits));
        definition.optional = entry.optional;
        if (implemented) {
            definition.exec = implementation->second;
        }
        table.add(std::move(definition));
    }
    return table;
}

} // namespace mcp_tools
