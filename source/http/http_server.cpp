#include "http/http_server.hpp"
#include "http/http_routes.hpp"
#include "http/worker_pool.hpp"
#include "mcp/mcp_stdio.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <cstring>
#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace http_server {

namespace {

// Hand-over point between a worker and the event loop.
struct PendingReply {
    std::mutex mutex;
    bool done = false;
    http_routes::HttpReply reply;
    mcp_tools::CancellationFlag cancellation;
};

// One request/response exchange on a connection. Owned by the event loop.
struct Exchange {
    struct lws *connection = nullptr;
    std::string path;
    std::string body;
    bool body_too_large = false;
    std::shared_ptr<PendingReply> pending;

    bool reply_ready = false;
    http_routes::HttpReply reply;
    bool headers_sent = false;
    size_t next_chunk = 0;
};

// Module-level server state (one server per process). Event loop thread only.
struct ServerState {
    const mcp_dispatch::Dispatcher *dispatcher = nullptr;
    worker_pool::WorkerPool *workers = nullptr;
    size_t max_body_bytes = 0;
    std::unordered_map<struct lws *, std::unique_ptr<Exchange>> exchanges;
    std::set<Exchange *> awaiting_workers;
};

ServerState server_state;
std::atomic<struct lws_context *> active_context{nullptr};

int http_callback(struct lws *connection, enum lws_callback_reasons reason, void *user_data,
                  void *incoming_data, size_t incoming_length);

const struct lws_protocols http_protocols[] = {
    {
        "nasamcp-http",
        http_callback,
        0,                   // no per-session data; exchanges are keyed by connection
        0                    // rx buffer size (default)
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

Exchange *find_exchange(struct lws *connection) {
    auto found = server_state.exchanges.find(connection);
    return found == server_state.exchanges.end() ? nullptr : found->second.get();
}

void release_exchange(struct lws *connection) {
    auto found = server_state.exchanges.find(connection);
    if (found == server_state.exchanges.end()) {
        return;
    }
    Exchange *exchange = found->second.get();
    if (exchange->pending) {
        // Worker may still be running; tell it nobody is listening any more.
        exchange->pending->cancellation.cancel();
    }
    server_state.awaiting_workers.erase(exchange);
    server_state.exchanges.erase(found);
}

void set_reply(Exchange &exchange, http_routes::HttpReply reply) {
    exchange.reply = std::move(reply);
    exchange.reply_ready = true;
    lws_callback_on_writable(exchange.connection);
}

void submit_to_workers(Exchange &exchange) {
    auto pending = std::make_shared<PendingReply>();
    exchange.pending = pending;

    const mcp_dispatch::Dispatcher *dispatcher = server_state.dispatcher;
    std::string path = exchange.path;
    std::string body = std::move(exchange.body);

    bool accepted = server_state.workers->submit([pending, dispatcher, path, body = std::move(body)]() {
        if (pending->cancellation.is_cancelled()) {
            return; // client went away while queued
        }
        http_routes::HttpReply reply = http_routes::handle_post(path, body, *dispatcher, pending->cancellation);
        {
            std::lock_guard<std::mutex> lock(pending->mutex);
            pending->reply = std::move(reply);
            pending->done = true;
        }
        struct lws_context *context = active_context.load();
        if (context != nullptr) {
            lws_cancel_service(context);
        }
    });

    if (!accepted) {
        exchange.pending.reset();
        set_reply(exchange, http_routes::internal_error("server is shutting down"));
        return;
    }
    server_state.awaiting_workers.insert(&exchange);
}

// Runs on the event loop after lws_cancel_service(): pick up finished replies.
void collect_finished_exchanges() {
    for (auto iterator = server_state.awaiting_workers.begin(); iterator != server_state.awaiting_workers.end();) {
        Exchange *exchange = *iterator;
        bool done = false;
        {
            std::lock_guard<std::mutex> lock(exchange->pending->mutex);
            done = exchange->pending->done;
            if (done) {
                exchange->reply = std::move(exchange->pending->reply);
            }
        }
        if (done) {
            exchange->reply_ready = true;
            lws_callback_on_writable(exchange->connection);
            iterator = server_state.awaiting_workers.erase(iterator);
        } else {
            ++iterator;
        }
    }
}

int finish_transaction(struct lws *connection) {
    // Nonzero means the connection must close (no keep-alive).
    if (lws_http_transaction_completed(connection)) {
        return -1;
    }
    return 0;
}

// Headers first, then one chunk per writable callback.
int write_reply(Exchange &exchange) {
    struct lws *connection = exchange.connection;
    const http_routes::HttpReply &reply = exchange.reply;

    if (!exchange.headers_sent) {
        unsigned char header_buffer[LWS_PRE + 1024];
        unsigned char *start = header_buffer + LWS_PRE;
        unsigned char *position = start;
        unsigned char *end = header_buffer + sizeof(header_buffer) - 1;

        lws_filepos_t length = reply.event_stream ? LWS_ILLEGAL_HTTP_CONTENT_LEN
                                                  : static_cast<lws_filepos_t>(http_routes::content_length(reply));
        if (lws_add_http_common_headers(connection, static_cast<unsigned int>(reply.status),
                                        reply.content_type.c_str(), length, &position, end)) {
            return 1;
        }
        if (reply.event_stream) {
            static const char no_cache[] = "no-cache";
            if (lws_add_http_header_by_name(connection, reinterpret_cast<const unsigned char *>("cache-control:"),
                                            reinterpret_cast<const unsigned char *>(no_cache),
                                            static_cast<int>(sizeof(no_cache) - 1), &position, end)) {
                return 1;
            }
        }
        if (lws_finalize_write_http_header(connection, start, &position, end)) {
            return 1;
        }
        exchange.headers_sent = true;

        if (reply.chunks.empty()) {
            return finish_transaction(connection);
        }
        lws_callback_on_writable(connection);
        return 0;
    }

    if (exchange.next_chunk >= reply.chunks.size()) {
        return 0;
    }

    const std::string &chunk = reply.chunks[exchange.next_chunk++];
    bool last_chunk = exchange.next_chunk >= reply.chunks.size();

    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + chunk.size());
    memcpy(send_buffer.data() + LWS_PRE, chunk.data(), chunk.size());

    int bytes_written = lws_write(connection, send_buffer.data() + LWS_PRE, chunk.size(),
                                  last_chunk ? LWS_WRITE_HTTP_FINAL : LWS_WRITE_HTTP);
    if (bytes_written < static_cast<int>(chunk.size())) {
        debug_log::log("HTTP write failed; closing connection.");
        return -1;
    }

    if (last_chunk) {
        return finish_transaction(connection);
    }
    lws_callback_on_writable(connection);
    return 0;
}

// A POST announces its body with Content-Length or chunked transfer coding.
// Without either, libwebsockets never reports body completion.
bool has_request_body(struct lws *connection) {
    if (lws_hdr_total_length(connection, WSI_TOKEN_HTTP_TRANSFER_ENCODING) > 0) {
        return true;
    }
    int length = lws_hdr_total_length(connection, WSI_TOKEN_HTTP_CONTENT_LENGTH);
    if (length <= 0) {
        return false;
    }
    std::string content_length(static_cast<size_t>(length) + 1, '\0');
    if (lws_hdr_copy(connection, &content_length[0], length + 1, WSI_TOKEN_HTTP_CONTENT_LENGTH) < 0) {
        return true;
    }
    content_length.resize(static_cast<size_t>(length));
    return http_routes::declares_body(content_length);
}

void finish_body(Exchange &exchange) {
    if (exchange.body_too_large) {
        set_reply(exchange, http_routes::body_too_large(server_state.max_body_bytes));
        return;
    }
    submit_to_workers(exchange);
}

int http_callback(struct lws *connection, enum lws_callback_reasons reason, void *user_data,
                  void *incoming_data, size_t incoming_length) {
    switch (reason) {
    case LWS_CALLBACK_HTTP: {
        // Keep-alive connections start a new exchange per request.
        release_exchange(connection);
        std::unique_ptr<Exchange> &slot = server_state.exchanges[connection];
        slot.reset(new Exchange());
        Exchange &exchange = *slot;
        exchange.connection = connection;
        exchange.path = incoming_data ? static_cast<const char *>(incoming_data) : "/";

        if (lws_hdr_total_length(connection, WSI_TOKEN_POST_URI) > 0) {
            debug_log::log("HTTP POST " + exchange.path);
            if (!has_request_body(connection)) {
                // No body callbacks will follow; dispatch the empty payload now.
                finish_body(exchange);
            }
            return 0; // otherwise wait for the body
        }
        if (lws_hdr_total_length(connection, WSI_TOKEN_GET_URI) > 0) {
            debug_log::log("HTTP GET " + exchange.path);
            set_reply(exchange, http_routes::handle_get(exchange.path));
        } else {
            set_reply(exchange, http_routes::method_not_allowed());
        }
        return 0;
    }

    case LWS_CALLBACK_HTTP_BODY: {
        Exchange *found = find_exchange(connection);
        if (found == nullptr) {
            return 0;
        }
        Exchange &exchange = *found;
        if (exchange.body_too_large) {
            return 0;
        }
        if (exchange.body.size() + incoming_length > server_state.max_body_bytes) {
            exchange.body_too_large = true;
            exchange.body.clear();
            return 0;
        }
        exchange.body.append(static_cast<const char *>(incoming_data), incoming_length);
        return 0;
    }

    case LWS_CALLBACK_HTTP_BODY_COMPLETION: {
        Exchange *found = find_exchange(connection);
        if (found != nullptr && !found->pending && !found->reply_ready) {
            finish_body(*found);
        }
        return 0;
    }

    case LWS_CALLBACK_HTTP_WRITEABLE: {
        Exchange *found = find_exchange(connection);
        if (found == nullptr || !found->reply_ready) {
            return 0;
        }
        return write_reply(*found);
    }

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
        collect_finished_exchanges();
        return 0;

    case LWS_CALLBACK_CLOSED_HTTP:
    case LWS_CALLBACK_HTTP_DROP_PROTOCOL:
        if (Exchange *found = find_exchange(connection)) {
            debug_log::log("HTTP connection closed for " + found->path);
        }
        release_exchange(connection);
        break;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
}

} // namespace

void wake() {
    struct lws_context *context = active_context.load();
    if (context != nullptr) {
        lws_cancel_service(context);
    }
}

int run(const ServerOptions &options, const mcp_dispatch::Dispatcher &dispatcher,
        const std::atomic<bool> &shutdown_requested) {
    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = options.port;
    context_info.iface = (options.bind_address.empty() || options.bind_address == "0.0.0.0")
                             ? nullptr
                             : options.bind_address.c_str();
    context_info.protocols = http_protocols;
    context_info.gid = -1;
    context_info.uid = -1;

    struct lws_context *context = lws_create_context(&context_info);
    if (context == nullptr) {
        mcp_stdio::log_message("Failed to create HTTP server on " + options.bind_address + ":" +
                               std::to_string(options.port));
        return 1;
    }

    worker_pool::WorkerPool workers(static_cast<size_t>(options.worker_count));
    server_state.dispatcher = &dispatcher;
    server_state.workers = &workers;
    server_state.max_body_bytes = options.max_body_bytes;
    active_context.store(context);

    mcp_stdio::log_message("Serving MCP over HTTP at http://" + options.bind_address + ":" +
                           std::to_string(options.port) + http_routes::MCP_PATH + " with " +
                           std::to_string(workers.thread_count()) + " worker(s).");

    while (!shutdown_requested.load()) {
        if (lws_service(context, 100) < 0) {
            mcp_stdio::log_message("HTTP event loop failed.");
            break;
        }
    }

    // Stop waking a context that is about to go away, abandon in-flight
    // requests, let the workers wind down, then close every connection.
    active_context.store(nullptr);
    for (Exchange *exchange : server_state.awaiting_workers) {
        exchange->pending->cancellation.cancel();
    }
    workers.shutdown();
    lws_context_destroy(context);

    server_state.awaiting_workers.clear();
    server_state.exchanges.clear();
    server_state.workers = nullptr;
    server_state.dispatcher = nullptr;

    mcp_stdio::log_message("HTTP server stopped.");
    return 0;
}

} // namespace http_server
