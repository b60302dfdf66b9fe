#ifndef NASAMCP_HTTP_ROUTES_HPP
#define NASAMCP_HTTP_ROUTES_HPP

// HTTP request handling for the MCP endpoint, independent of the socket
// layer: every function maps a request to a complete reply.
//
//   POST /mcp   JSON-RPC payload; one frame as JSON, several as SSE
//   GET  /mcp   liveness / capability probe
//   GET  /      plain text banner

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

#include "mcp/mcp_dispatch.hpp"

namespace http_routes {

using json = nlohmann::json;

extern const char MCP_PATH[];
extern const char BANNER_TEXT[];

struct HttpReply {
    int status = 200;
    std::string content_type = "application/json";
    std::vector<std::string> chunks;  // written in order; empty for no body
    bool event_stream = false;        // no content length, one chunk per SSE frame
};

// True for "/mcp" and "/mcp/".
bool is_mcp_path(const std::string &path);

HttpReply handle_get(const std::string &path);

// Dispatch a POST body. Never throws: anything escaping the dispatcher
// becomes a 500 with an internal error envelope.
HttpReply handle_post(const std::string &path, const std::string &body, const mcp_dispatch::Dispatcher &dispatcher,
                      const mcp_tools::CancellationFlag &cancellation);

// Map dispatcher output to a reply:
//   no frames (notifications only)     202, empty body
//   parse error / invalid request      400, JSON
//   one frame                          200, JSON
//   several frames                     200, text/event-stream
HttpReply build_frames_reply(const mcp_dispatch::DispatchResult &dispatch_result);

// Whether a Content-Length header value announces a body. "0" (or blank)
// does not; anything else, malformed values included, is left to the body
// reader.
bool declares_body(const std::string &content_length_value);

HttpReply body_too_large(std::size_t limit_bytes);
HttpReply internal_error(const std::string &detail);
HttpReply not_found();
HttpReply method_not_allowed();

// "data: <json>\n\n"
std::string format_sse_frame(const json &frame);

// Sum of all chunk sizes.
std::size_t content_length(const HttpReply &reply);

} // namespace http_routes

#endif // NASAMCP_HTTP_ROUTES_HPP
