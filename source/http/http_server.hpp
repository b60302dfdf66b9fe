#ifndef NASAMCP_HTTP_SERVER_HPP
#define NASAMCP_HTTP_SERVER_HPP

// MCP HTTP transport on libwebsockets.
// One event loop thread owns every connection; POST bodies are dispatched on
// a worker pool and the loop is woken when a reply is ready. A connection
// that closes early cancels its request.

#include <atomic>
#include <cstddef>
#include <string>

#include "mcp/mcp_dispatch.hpp"

namespace http_server {

struct ServerOptions {
    std::string bind_address = "0.0.0.0";
    int port = 8000;
    int worker_count = 4;
    std::size_t max_body_bytes = 1024u * 1024u;
};

// Serve until shutdown_requested becomes true. Returns the process exit code.
int run(const ServerOptions &options, const mcp_dispatch::Dispatcher &dispatcher,
        const std::atomic<bool> &shutdown_requested);

// Wake the event loop so it notices shutdown_requested. Async-signal-safe.
void wake();

} // namespace http_server

#endif // NASAMCP_HTTP_SERVER_HPP
