#ifndef MCPVISOR_TOOL_HANDLERS_HPP
#define MCPVISOR_TOOL_HANDLERS_HPP

// Built-in tool implementations.
// Each tool_*.cpp file provides a register function that adds itself to the table; the
// manifest decides which of them a server actually exposes.

#include "mcp/mcp_tools.hpp"

namespace tool_handlers {

// Implementations of every built-in tool, keyed by tool name.
mcp_tools::ImplementationTable builtin_implementations();

} // namespace tool_handlers

#endif // MCPVISOR_TOOL_HANDLERS_HPP
