#ifndef NASAMCP_MCP_CONTENT_HPP
#define NASAMCP_MCP_CONTENT_HPP

// MCP content blocks and the single result type every tool adapter returns.

#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace mcp_content {

using json = nlohmann::json;

// {"type": "text", "text": ...}
struct TextContent {
    std::string text;
};

// {"type": "image", "data": <base64>, "mimeType": ...}
struct ImageContent {
    std::string data;
    std::string mime_type;
};

// {"type": "resource", "resource": {"uri", "mimeType", "name"}}
struct EmbeddedResource {
    std::string uri;
    std::string mime_type;
    std::string name;
};

using ContentBlock = std::variant<TextContent, ImageContent, EmbeddedResource>;

// Outcome of one tool invocation. On success content holds at least one
// block; on failure error_message describes what went wrong (without the
// "Error: " prefix, which the dispatcher adds).
struct ToolResult {
    bool success = false;
    std::vector<ContentBlock> content;
    std::string error_message;
};

// Text block with the text sanitized to valid UTF-8.
ContentBlock make_text(std::string text);

ContentBlock make_image(std::string base64_data, std::string mime_type);

ContentBlock make_resource(std::string uri, std::string mime_type, std::string name);

ToolResult success(std::vector<ContentBlock> content);

// Shorthand for a success carrying one text block.
ToolResult success_text(std::string text);

ToolResult failure(std::string error_message);

json to_json(const ContentBlock &block);

json to_json(const std::vector<ContentBlock> &blocks);

// Build the tools/call result payload: {"content": [...], "isError": bool}.
// A failure becomes exactly one text block "Error: <message>".
json build_call_result(const ToolResult &result);

} // namespace mcp_content

#endif // NASAMCP_MCP_CONTENT_HPP
