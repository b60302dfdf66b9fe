#include "http/http_routes.hpp"
#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"

#include <exception>

namespace http_routes {

const char MCP_PATH[] = "/mcp";
const char BANNER_TEXT[] = "NASA MCP Server is running";

static HttpReply json_reply(int status, const json &payload) {
    HttpReply reply;
    reply.status = status;
    reply.content_type = "application/json";
    reply.chunks.push_back(json_rpc::encode_response(payload));
    return reply;
}

static HttpReply text_reply(int status, const std::string &text) {
    HttpReply reply;
    reply.status = status;
    reply.content_type = "text/plain; charset=utf-8";
    reply.chunks.push_back(text);
    return reply;
}

bool is_mcp_path(const std::string &path) {
    return path == MCP_PATH || path == std::string(MCP_PATH) + "/";
}

bool declares_body(const std::string &content_length_value) {
    bool digits_only = true;
    bool nonzero = false;
    for (char character : content_length_value) {
        if (character == ' ' || character == '\t') {
            continue;
        }
        if (character < '0' || character > '9') {
            digits_only = false;
        } else if (character != '0') {
            nonzero = true;
        }
    }
    return !digits_only || nonzero;
}

HttpReply handle_get(const std::string &path) {
    if (is_mcp_path(path)) {
        // Clients probe the endpoint before negotiating; answer with a
        // one-frame event stream that ends immediately.
        HttpReply reply;
        reply.status = 200;
        reply.content_type = "text/event-stream";
        reply.event_stream = true;
        reply.chunks.push_back(format_sse_frame(json{{"type", "ping"}}));
        return reply;
    }
    if (path == "/") {
        return text_reply(200, BANNER_TEXT);
    }
    return not_found();
}

HttpReply handle_post(const std::string &path, const std::string &body, const mcp_dispatch::Dispatcher &dispatcher,
                      const mcp_tools::CancellationFlag &cancellation) {
    if (!is_mcp_path(path)) {
        return not_found();
    }

    try {
        return build_frames_reply(dispatcher.dispatch_payload(body, cancellation));
    } catch (const std::exception &error) {
        mcp_stdio::log_message(std::string("Internal error while dispatching HTTP request: ") + error.what());
        return internal_error(error.what());
    } catch (...) {
        mcp_stdio::log_message("Internal error while dispatching HTTP request (non-standard exception)");
        return internal_error("unknown failure");
    }
}

HttpReply build_frames_reply(const mcp_dispatch::DispatchResult &dispatch_result) {
    if (dispatch_result.frames.empty()) {
        HttpReply reply;
        reply.status = 202;
        return reply;
    }

    if (dispatch_result.parse_error || dispatch_result.invalid_request) {
        return json_reply(400, dispatch_result.frames.front());
    }

    if (dispatch_result.frames.size() == 1) {
        return json_reply(200, dispatch_result.frames.front());
    }

    HttpReply reply;
    reply.status = 200;
    reply.content_type = "text/event-stream";
    reply.event_stream = true;
    for (const auto &frame : dispatch_result.frames) {
        reply.chunks.push_back(format_sse_frame(frame));
    }
    return reply;
}

HttpReply body_too_large(std::size_t limit_bytes) {
    return json_reply(413, json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST,
                                                          "Request body exceeds " + std::to_string(limit_bytes) +
                                                              " bytes"));
}

HttpReply internal_error(const std::string &detail) {
    return json_reply(500, json_rpc::build_error_response(nullptr, json_rpc::INTERNAL_ERROR,
                                                          "Internal error: " + detail));
}

HttpReply not_found() {
    return text_reply(404, "Not found");
}

HttpReply method_not_allowed() {
    return text_reply(405, "Method not allowed");
}

std::string format_sse_frame(const json &frame) {
    return "data: " + json_rpc::encode_response(frame) + "\n\n";
}

std::size_t content_length(const HttpReply &reply) {
    std::size_t total = 0;
    for (const auto &chunk : reply.chunks) {
        total += chunk.size();
    }
    return total;
}

} // namespace http_routes
