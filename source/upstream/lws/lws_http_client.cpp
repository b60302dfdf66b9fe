#include "upstream/lws/lws_http_client.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <utility>

namespace lws_http_client {

namespace {

// State of one GET, reached from the callback through the opaque user data.
struct FetchState {
    const ClientOptions *options = nullptr;
    upstream::HttpResponse response;
    bool finished = false;
    bool body_overflow = false;
    std::string connection_error;
};

struct ContextDeleter {
    void operator()(struct lws_context *context) const {
        if (context != nullptr) {
            lws_context_destroy(context);
        }
    }
};

using ContextPointer = std::unique_ptr<struct lws_context, ContextDeleter>;

int http_client_callback(struct lws *connection, enum lws_callback_reasons reason, void *user_data,
                         void *incoming_data, size_t incoming_length);

const struct lws_protocols client_protocols[] = {
    {
        "nasamcp-upstream",
        http_client_callback,
        0, // per-session data size
        0  // rx buffer size (default)
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

int http_client_callback(struct lws *connection, enum lws_callback_reasons reason, void *user_data,
                         void *incoming_data, size_t incoming_length) {
    FetchState *state = static_cast<FetchState *>(lws_get_opaque_user_data(connection));

    switch (reason) {
    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
        if (state != nullptr) {
            state->connection_error = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
            state->finished = true;
        }
        break;

    case LWS_CALLBACK_CLIENT_APPEND_HANDSHAKE_HEADER: {
        if (state == nullptr) {
            break;
        }
        unsigned char **position = static_cast<unsigned char **>(incoming_data);
        unsigned char *end = (*position) + incoming_length;
        const std::string &user_agent = state->options->user_agent;
        if (lws_add_http_header_by_token(connection, WSI_TOKEN_HTTP_USER_AGENT,
                                         reinterpret_cast<const unsigned char *>(user_agent.c_str()),
                                         static_cast<int>(user_agent.size()), position, end)) {
            return -1;
        }
        static const char accept_any[] = "*/*";
        if (lws_add_http_header_by_token(connection, WSI_TOKEN_HTTP_ACCEPT,
                                         reinterpret_cast<const unsigned char *>(accept_any),
                                         static_cast<int>(sizeof(accept_any) - 1), position, end)) {
            return -1;
        }
        break;
    }

    case LWS_CALLBACK_ESTABLISHED_CLIENT_HTTP: {
        if (state == nullptr) {
            break;
        }
        state->response.status_code = static_cast<int>(lws_http_client_http_response(connection));
        char content_type[256];
        int copied = lws_hdr_copy(connection, content_type, sizeof(content_type), WSI_TOKEN_HTTP_CONTENT_TYPE);
        if (copied > 0) {
            state->response.content_type.assign(content_type, static_cast<size_t>(copied));
        }
        break;
    }

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP_READ:
        if (state == nullptr) {
            break;
        }
        if (state->response.body.size() + incoming_length > state->options->max_body_bytes) {
            state->body_overflow = true;
            state->finished = true;
            return -1;
        }
        state->response.body.append(static_cast<const char *>(incoming_data), incoming_length);
        return 0;

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP: {
        // Ask libwebsockets to pull the next chunk; it arrives via _HTTP_READ.
        char buffer[4096 + LWS_PRE];
        char *pointer = buffer + LWS_PRE;
        int length = static_cast<int>(sizeof(buffer) - LWS_PRE);
        if (lws_http_client_read(connection, &pointer, &length) < 0) {
            return -1;
        }
        return 0;
    }

    case LWS_CALLBACK_COMPLETED_CLIENT_HTTP:
        if (state != nullptr) {
            state->response.success = true;
            state->finished = true;
        }
        break;

    case LWS_CALLBACK_CLOSED_CLIENT_HTTP:
        if (state != nullptr) {
            // Bodies without a content length end when the server closes.
            if (!state->finished && state->response.status_code > 0) {
                state->response.success = true;
            }
            state->finished = true;
        }
        break;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
}

upstream::HttpResponse failed_response(const std::string &detail) {
    upstream::HttpResponse response;
    response.error_detail = detail;
    return response;
}

} // namespace

ParsedUrl parse_url(const std::string &url) {
    ParsedUrl parsed;

    std::string remainder;
    if (url.compare(0, 8, "https://") == 0) {
        parsed.use_tls = true;
        parsed.port = 443;
        remainder = url.substr(8);
    } else if (url.compare(0, 7, "http://") == 0) {
        parsed.use_tls = false;
        parsed.port = 80;
        remainder = url.substr(7);
    } else {
        parsed.error_message = "Only http:// and https:// URLs are supported";
        return parsed;
    }

    // Split host:port from path.
    std::string host_and_port;
    auto path_position = remainder.find_first_of("/?");
    if (path_position != std::string::npos) {
        host_and_port = remainder.substr(0, path_position);
        parsed.path = remainder.substr(path_position);
        if (parsed.path[0] == '?') {
            parsed.path.insert(0, "/");
        }
    } else {
        host_and_port = remainder;
        parsed.path = "/";
    }

    // Split host from port.
    auto colon_position = host_and_port.rfind(':');
    if (colon_position != std::string::npos) {
        std::string port_text = host_and_port.substr(colon_position + 1);
        host_and_port.resize(colon_position);
        try {
            size_t consumed = 0;
            int port = std::stoi(port_text, &consumed);
            if (consumed != port_text.size() || port < 1 || port > 65535) {
                parsed.error_message = "Invalid port in URL: " + port_text;
                return parsed;
            }
            parsed.port = port;
        } catch (const std::exception &) {
            parsed.error_message = "Invalid port in URL: " + port_text;
            return parsed;
        }
    }

    if (host_and_port.empty()) {
        parsed.error_message = "URL has no host";
        return parsed;
    }
    parsed.host = host_and_port;
    parsed.success = true;
    return parsed;
}

LwsHttpClient::LwsHttpClient(ClientOptions options) : options_(std::move(options)) {}

upstream::HttpResponse LwsHttpClient::get(const std::string &url,
                                          const mcp_tools::CancellationFlag &cancellation) const {
    ParsedUrl parsed = parse_url(url);
    if (!parsed.success) {
        return failed_response(parsed.error_message);
    }

    debug_log::log("upstream GET " + (parsed.use_tls ? std::string("https://") : std::string("http://")) +
                   parsed.host + ":" + std::to_string(parsed.port) + parsed.path);

    // Declared before the context: destroying the context still runs callbacks
    // that touch the state.
    FetchState state;
    state.options = &options_;

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = client_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    context_info.timeout_secs = static_cast<unsigned int>(options_.timeout_milliseconds / 1000 + 1);

    ContextPointer context(lws_create_context(&context_info));
    if (!context) {
        return failed_response("Failed to create libwebsockets client context");
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = context.get();
    connect_info.address = parsed.host.c_str();
    connect_info.port = parsed.port;
    connect_info.path = parsed.path.c_str();
    connect_info.host = parsed.host.c_str();
    connect_info.origin = parsed.host.c_str();
    connect_info.method = "GET";
    connect_info.protocol = client_protocols[0].name;
    connect_info.ssl_connection = parsed.use_tls ? LCCSCF_USE_SSL : 0;
    connect_info.opaque_user_data = &state;

    if (lws_client_connect_via_info(&connect_info) == nullptr) {
        return failed_response("Failed to start connection to " + parsed.host);
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!state.finished) {
        lws_service(context.get(), 50);

        if (cancellation.is_cancelled()) {
            upstream::HttpResponse response = failed_response("Request cancelled");
            response.cancelled = true;
            return response;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > options_.timeout_milliseconds) {
            debug_log::log("upstream GET timed out after " + std::to_string(options_.timeout_milliseconds) + " ms");
            upstream::HttpResponse response = failed_response("Request timed out");
            response.timed_out = true;
            return response;
        }
    }

    if (state.body_overflow) {
        return failed_response("Response exceeds " + std::to_string(options_.max_body_bytes) + " bytes");
    }
    if (!state.connection_error.empty()) {
        return failed_response("Connection failed: " + state.connection_error);
    }
    if (!state.response.success) {
        return failed_response("Connection closed before a complete response was received");
    }

    debug_log::log("upstream GET finished status=" + std::to_string(state.response.status_code) +
                   " bytes=" + std::to_string(state.response.body.size()));
    return std::move(state.response);
}

} // namespace lws_http_client
