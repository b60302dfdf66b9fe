#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_get_add { void register_tool(mcp_tools::ToolRegistry &, const tool_support::ToolContext &); }
namespace tool_get_apod { void register_tool(mcp_tools::ToolRegistry &, const tool_support::ToolContext &); }
namespace tool_get_mars_image { void register_tool(mcp_tools::ToolRegistry &, const tool_support::ToolContext &); }
namespace tool_get_neo_feed { void register_tool(mcp_tools::ToolRegistry &, const tool_support::ToolContext &); }
namespace tool_get_earth_image { void register_tool(mcp_tools::ToolRegistry &, const tool_support::ToolContext &); }
namespace tool_get_gibs_image { void register_tool(mcp_tools::ToolRegistry &, const tool_support::ToolContext &); }
namespace tool_get_gibs_layers { void register_tool(mcp_tools::ToolRegistry &, const tool_support::ToolContext &); }
namespace tool_get_image_analyze { void register_tool(mcp_tools::ToolRegistry &, const tool_support::ToolContext &); }

namespace tool_handlers {

void register_all_tools(mcp_tools::ToolRegistry &registry, const tool_support::ToolContext &context) {
    tool_get_add::register_tool(registry, context);
    tool_get_apod::register_tool(registry, context);
    tool_get_mars_image::register_tool(registry, context);
    tool_get_neo_feed::register_tool(registry, context);
    tool_get_earth_image::register_tool(registry, context);
    tool_get_gibs_image::register_tool(registry, context);
    tool_get_gibs_layers::register_tool(registry, context);
    tool_get_image_analyze::register_tool(registry, context);
}

} // namespace tool_handlers
