#ifndef NASAMCP_MCP_DISPATCH_HPP
#define NASAMCP_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Turns one decoded message (or one raw payload) into its response frames.
// Shared by the stdio and HTTP transports; holds no mutable state, so one
// instance may be used from many threads at once.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "mcp/mcp_tools.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we support.
extern const char PROTOCOL_VERSION[];

// Server info.
extern const char SERVER_NAME[];
extern const char SERVER_VERSION[];

// Frames produced for one raw payload, in generation order. Empty when the
// payload held only notifications.
struct DispatchResult {
    std::vector<json> frames;
    bool parse_error = false;      // payload was not valid JSON
    bool invalid_request = false;  // valid JSON, but not a request (or an empty batch)
};

class Dispatcher {
public:
    // The registry must be frozen; throws std::logic_error otherwise.
    explicit Dispatcher(const mcp_tools::ToolRegistry &registry);

    // Dispatch a single JSON-RPC message. Returns the response JSON, or a
    // null json value for notifications (which require no response).
    json dispatch_message(const json &message, const mcp_tools::CancellationFlag &cancellation) const;

    // Decode a raw payload (one request or a batch array) and dispatch it.
    DispatchResult dispatch_payload(const std::string &raw_payload,
                                    const mcp_tools::CancellationFlag &cancellation) const;

    const mcp_tools::ToolRegistry &registry() const { return registry_; }

private:
    json dispatch_single(const json &message, const mcp_tools::CancellationFlag &cancellation,
                         bool &invalid_request) const;
    json handle_initialize(const json &request_id, const json &params) const;
    json handle_tools_list(const json &request_id) const;
    json handle_tools_call(const json &request_id, const json &params,
                           const mcp_tools::CancellationFlag &cancellation) const;
    mcp_content::ToolResult invoke_tool(const mcp_tools::RegisteredTool &tool, const json &arguments,
                                        const mcp_tools::CancellationFlag &cancellation) const;

    const mcp_tools::ToolRegistry &registry_;
};

} // namespace mcp_dispatch

#endif // NASAMCP_MCP_DISPATCH_HPP
