#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_echo { void register_tool(mcp_tools::ImplementationTable &table); }
namespace tool_sleep { void register_tool(mcp_tools::ImplementationTable &table); }
namespace tool_fail { void register_tool(mcp_tools::ImplementationTable &table); }

namespace tool_handlers {

mcp_tools::ImplementationTable builtin_implementations() {
    mcp_tools::ImplementationTable table;
    tool_echo::register_tool(table);
    tool_sleep::register_tool(table);
    tool_fail::register_tool(table);
    return table;
}

} // namespace tool_handlers
