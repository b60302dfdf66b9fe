#ifndef NASAMCP_TOOL_HANDLERS_HPP
#define NASAMCP_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_support.hpp"

namespace tool_handlers {

// Register every NASA tool with the registry. Throws
// mcp_tools::DuplicateToolError if two tools share a name.
void register_all_tools(mcp_tools::ToolRegistry &registry, const tool_support::ToolContext &context);

} // namespace tool_handlers

#endif // NASAMCP_TOOL_HANDLERS_HPP
