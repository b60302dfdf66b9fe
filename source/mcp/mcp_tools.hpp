#ifndef NASAMCP_MCP_TOOLS_HPP
#define NASAMCP_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and lookup of tools.
// Built once at startup, frozen, then shared read-only by every transport.

#include <nlohmann/json.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcp/mcp_content.hpp"

namespace mcp_tools {

using json = nlohmann::json;

// Set by a transport when the caller went away; adapters poll it during
// long upstream calls.
class CancellationFlag {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// A tool handler: receives the call arguments (always a JSON object) and
// returns a ToolResult. Expected failures are returned, not thrown.
using ToolHandler = std::function<mcp_content::ToolResult(const json &arguments,
                                                          const CancellationFlag &cancellation)>;

// One input parameter of a tool, rendered into the inputSchema.
struct ParameterSpec {
    std::string name;
    std::string type;                         // JSON Schema type: string, integer, number, boolean
    bool required = false;
    std::string description;
    std::vector<std::string> allowed_values;  // rendered as "enum" when non-empty
};

// Description of a tool, matching the MCP tool schema.
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;    // in schema order
};

struct RegisteredTool {
    ToolDescriptor descriptor;
    ToolHandler handler;
};

class DuplicateToolError : public std::runtime_error {
public:
    explicit DuplicateToolError(const std::string &tool_name)
        : std::runtime_error("Duplicate tool name: " + tool_name), tool_name_(tool_name) {}

    const std::string &tool_name() const { return tool_name_; }

private:
    std::string tool_name_;
};

// Render a descriptor's parameters as {"type":"object","properties":{...},"required":[...]}.
json build_input_schema(const ToolDescriptor &descriptor);

class ToolRegistry {
public:
    // Throws DuplicateToolError if the name is taken, std::logic_error once frozen.
    void register_tool(ToolDescriptor descriptor, ToolHandler handler);

    // After this no registration is accepted; concurrent lookups need no locking.
    void freeze() { frozen_ = true; }
    bool is_frozen() const { return frozen_; }

    // Registered tools in insertion order.
    const std::vector<RegisteredTool> &list() const { return tools_; }

    // Exact, case-sensitive lookup. Returns nullptr when the name is unknown.
    const RegisteredTool *resolve(const std::string &tool_name) const;

    std::size_t size() const { return tools_.size(); }

    // Build the response payload for tools/list.
    json build_tools_list_response() const;

private:
    std::vector<RegisteredTool> tools_;
    std::unordered_map<std::string, std::size_t> index_by_name_;
    bool frozen_ = false;
};

} // namespace mcp_tools

#endif // NASAMCP_MCP_TOOLS_HPP
