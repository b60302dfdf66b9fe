#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <exception>
#include <stdexcept>

namespace mcp_dispatch {

const char PROTOCOL_VERSION[] = "2024-11-05";

const char SERVER_NAME[] = "nasa-mcp-server";
const char SERVER_VERSION[] = "1.0.0";

// Sent back from initialize so that MCP clients can tell what this server is for.
static const char SERVER_INSTRUCTIONS[] =
    "NASA open data server. Use these tools to fetch the Astronomy Picture of the Day, "
    "Mars rover photos, near Earth object feeds, EPIC Earth images and GIBS satellite "
    "imagery. Dates are always YYYY-MM-DD. Tool failures come back as a text block "
    "starting with \"Error: \"; correct the arguments and call again.";

Dispatcher::Dispatcher(const mcp_tools::ToolRegistry &registry) : registry_(registry) {
    if (!registry_.is_frozen()) {
        throw std::logic_error("Dispatcher requires a frozen tool registry");
    }
}

// Handle the "initialize" request. No state changes; any number of calls
// return the same payload.
json Dispatcher::handle_initialize(const json &request_id, const json &params) const {
    (void)params; // We accept any client capabilities.

    json capabilities;
    capabilities["tools"]["listChanged"] = false;

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;
    result["instructions"] = SERVER_INSTRUCTIONS;

    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_tools_list(const json &request_id) const {
    return json_rpc::build_response(request_id, registry_.build_tools_list_response());
}

mcp_content::ToolResult Dispatcher::invoke_tool(const mcp_tools::RegisteredTool &tool, const json &arguments,
                                                const mcp_tools::CancellationFlag &cancellation) const {
    const std::string &tool_name = tool.descriptor.name;

    for (const auto &parameter : tool.descriptor.parameters) {
        if (!parameter.required) {
            continue;
        }
        if (!arguments.contains(parameter.name) || arguments[parameter.name].is_null()) {
            return mcp_content::failure("Missing required parameter '" + parameter.name + "'");
        }
    }

    // Last line of defence: nothing an adapter throws reaches the transport.
    mcp_content::ToolResult result;
    try {
        result = tool.handler(arguments, cancellation);
    } catch (const std::exception &error) {
        debug_log::log("tool " + tool_name + " threw: " + error.what());
        return mcp_content::failure(error.what());
    } catch (...) {
        debug_log::log("tool " + tool_name + " threw a non-standard exception");
        return mcp_content::failure("Tool '" + tool_name + "' failed unexpectedly");
    }

    if (result.success && result.content.empty()) {
        return mcp_content::failure("Tool '" + tool_name + "' returned no content");
    }
    return result;
}

// Handle the "tools/call" request.
json Dispatcher::handle_tools_call(const json &request_id, const json &params,
                                   const mcp_tools::CancellationFlag &cancellation) const {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in tools/call");
    }
    std::string tool_name = params["name"].get<std::string>();

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                  "'arguments' in tools/call must be an object");
        }
        arguments = params["arguments"];
    }

    const mcp_tools::RegisteredTool *tool = registry_.resolve(tool_name);
    if (tool == nullptr) {
        return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                              "Unknown tool: " + tool_name);
    }

    debug_log::log("tools/call " + tool_name + " arguments=" + arguments.dump());
    mcp_content::ToolResult result = invoke_tool(*tool, arguments, cancellation);
    if (!result.success) {
        debug_log::log("tools/call " + tool_name + " failed: " + result.error_message);
    }

    return json_rpc::build_response(request_id, mcp_content::build_call_result(result));
}

json Dispatcher::dispatch_single(const json &message, const mcp_tools::CancellationFlag &cancellation,
                                 bool &invalid_request) const {
    json_rpc::ParseRequestResult parsed = json_rpc::parse_request(message);
    if (!parsed.success) {
        invalid_request = true;
        return json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST,
                                              "Invalid request: " + parsed.error_message);
    }

    const json_rpc::Request &request = parsed.request;

    // Notifications (e.g. "notifications/initialized") get no response.
    if (!request.id.has_value()) {
        debug_log::log("notification " + request.method + " acknowledged silently");
        return nullptr;
    }
    const json &request_id = *request.id;

    if (request.method == "initialize") {
        return handle_initialize(request_id, request.params);
    }
    if (request.method == "tools/list") {
        return handle_tools_list(request_id);
    }
    if (request.method == "tools/call") {
        return handle_tools_call(request_id, request.params, cancellation);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                          "Unknown method: " + request.method);
}

json Dispatcher::dispatch_message(const json &message, const mcp_tools::CancellationFlag &cancellation) const {
    bool invalid_request = false;
    return dispatch_single(message, cancellation, invalid_request);
}

DispatchResult Dispatcher::dispatch_payload(const std::string &raw_payload,
                                            const mcp_tools::CancellationFlag &cancellation) const {
    DispatchResult dispatch_result;

    json parsed_payload;
    try {
        parsed_payload = json::parse(raw_payload);
    } catch (const json::parse_error &error) {
        debug_log::log(std::string("Failed to parse incoming JSON: ") + error.what());
        dispatch_result.parse_error = true;
        dispatch_result.frames.push_back(
            json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error"));
        return dispatch_result;
    }

    if (!parsed_payload.is_array()) {
        json response = dispatch_single(parsed_payload, cancellation, dispatch_result.invalid_request);
        if (!response.is_null()) {
            dispatch_result.frames.push_back(response);
        }
        return dispatch_result;
    }

    if (parsed_payload.empty()) {
        dispatch_result.invalid_request = true;
        dispatch_result.frames.push_back(
            json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST, "Invalid request: empty batch"));
        return dispatch_result;
    }

    // Batch: one frame per non-notification element, in order. Invalid
    // elements are answered individually without failing the whole batch.
    for (const auto &message : parsed_payload) {
        if (cancellation.is_cancelled()) {
            break;
        }
        bool element_invalid = false;
        json response = dispatch_single(message, cancellation, element_invalid);
        if (!response.is_null()) {
            dispatch_result.frames.push_back(response);
        }
    }
    return dispatch_result;
}

} // namespace mcp_dispatch
