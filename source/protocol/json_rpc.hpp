#ifndef NASAMCP_JSON_RPC_HPP
#define NASAMCP_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>
#include <optional>

namespace json_rpc {

using json = nlohmann::json;

constexpr const char *JSONRPC_VERSION = "2.0";

// Standard JSON-RPC error codes. Fixed meanings, never reused for anything else.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// A validated request or notification.
struct Request {
    std::string method;
    json params = json::object();  // object or array; empty object when absent
    std::optional<json> id;        // absent for notifications; may hold null
};

// Result of validating one decoded JSON value as a request.
struct ParseRequestResult {
    bool success = false;
    Request request;
    std::string error_message;     // set when !success; answer with INVALID_REQUEST
};

// A decoded response envelope. Exactly one of result / error is meaningful.
struct Response {
    json id;
    bool is_error = false;
    json result;
    int error_code = 0;
    std::string error_message;
};

struct DecodeResponseResult {
    bool success = false;
    Response response;
    std::string error_message;
};

// Validate a decoded JSON value as a JSON-RPC 2.0 request.
// Requires an object with jsonrpc "2.0" and a string method; params, when
// present, must be an object or an array; id must be a string, an integer or null.
ParseRequestResult parse_request(const json &message);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Serialize a response envelope to its wire form (compact, no trailing newline).
std::string encode_response(const json &response);

// Parse a wire response back into its fields. Fails on invalid JSON, on a
// missing or wrong jsonrpc member, and on envelopes carrying both or neither
// of result / error.
DecodeResponseResult decode_response(const std::string &encoded);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

} // namespace json_rpc

#endif // NASAMCP_JSON_RPC_HPP
