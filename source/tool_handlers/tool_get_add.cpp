#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_content.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <climits>
#include <string>
#include <utility>

using json = nlohmann::json;

// Tool handler for "get_add".
// Adds two integers. Both operands may arrive as numbers or numeric strings.

static mcp_content::ToolResult handle_get_add(const json &arguments) {
    tool_support::IntegerArgument first = tool_support::read_integer(arguments, "a");
    if (!first.success) {
        return mcp_content::failure(first.error_message);
    }
    tool_support::IntegerArgument second = tool_support::read_integer(arguments, "b");
    if (!second.success) {
        return mcp_content::failure(second.error_message);
    }
    if (!first.value) {
        return mcp_content::failure("Missing required parameter 'a'");
    }
    if (!second.value) {
        return mcp_content::failure("Missing required parameter 'b'");
    }

    long long a = *first.value;
    long long b = *second.value;
    if ((b > 0 && a > LLONG_MAX - b) || (b < 0 && a < LLONG_MIN - b)) {
        return mcp_content::failure("Result is out of range");
    }

    debug_log::log("get_add invoked");
    return mcp_content::success_text(std::to_string(a + b));
}

namespace tool_get_add {

void register_tool(mcp_tools::ToolRegistry &registry, const tool_support::ToolContext &) {
    mcp_tools::ToolDescriptor descriptor;
    descriptor.name = "get_add";
    descriptor.description = "Add two integers and return their sum.";
    descriptor.parameters = {
        {"a", "integer", true, "First operand", {}},
        {"b", "integer", true, "Second operand", {}},
    };

    registry.register_tool(std::move(descriptor),
                           [](const json &arguments, const mcp_tools::CancellationFlag &) {
                               return handle_get_add(arguments);
                           });
}

} // namespace tool_get_add
