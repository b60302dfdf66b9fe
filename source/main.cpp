// NASA MCP Server – Model Context Protocol gateway to NASA open-data APIs.
// Entry point: builds the tool registry, then serves MCP over HTTP (default)
// or over stdin/stdout (--stdio).
//
// Logs go to stderr; stdout carries protocol frames only in stdio mode.

#include <libwebsockets.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include "config/server_config.hpp"
#include "http/http_server.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "upstream/lws/lws_http_client.hpp"
#include "utils/debug_log.hpp"

// Global flag for graceful shutdown.
static std::atomic<bool> shutdown_requested{false};

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested.store(true);
    http_server::wake();
}

int main(int argc, char **argv) {
    const std::string program_name = argc > 0 ? argv[0] : "nasamcp";

    server_config::LoadResult loaded = server_config::load(argc, argv);
    if (loaded.help_requested) {
        std::cout << server_config::usage_text(program_name);
        return 0;
    }
    if (!loaded.success) {
        std::cerr << "[nasamcp] " << loaded.error_message << "\n" << server_config::usage_text(program_name);
        return 2;
    }
    const server_config::ServerConfig &config = loaded.config;

    std::cerr << "[nasamcp] nasamcp – NASA MCP Server, build " << __DATE__ << " " << __TIME__ << std::endl;
    for (const auto &warning : loaded.warnings) {
        mcp_stdio::log_message("Configuration: " + warning);
    }
    if (config.nasa_api_key == "DEMO_KEY") {
        mcp_stdio::log_message("NASA_API_KEY not set; using DEMO_KEY (heavily rate limited).");
    }

    lws_set_log_level(debug_log::is_debug_enabled() ? (LLL_ERR | LLL_WARN | LLL_NOTICE) : (LLL_ERR | LLL_WARN),
                      nullptr);

    lws_http_client::ClientOptions client_options;
    client_options.timeout_milliseconds = config.upstream_timeout_milliseconds;
    client_options.max_body_bytes = config.max_upstream_bytes;
    client_options.user_agent = config.user_agent;
    lws_http_client::LwsHttpClient upstream_client(client_options);

    tool_support::ToolContext context{config, upstream_client};
    mcp_tools::ToolRegistry registry;
    try {
        tool_handlers::register_all_tools(registry, context);
    } catch (const mcp_tools::DuplicateToolError &error) {
        mcp_stdio::log_message(std::string("Fatal: ") + error.what());
        return 1;
    }
    registry.freeze();
    debug_log::log("Registered " + std::to_string(registry.size()) + " tools");

    mcp_dispatch::Dispatcher dispatcher(registry);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int exit_code = 0;
    if (config.transport == server_config::Transport::stdio) {
        mcp_stdio::log_message("NASA MCP Server started. Waiting for MCP messages on stdin.");
        exit_code = mcp_stdio::serve(std::cin, std::cout, dispatcher, shutdown_requested);
    } else {
        http_server::ServerOptions server_options;
        server_options.bind_address = config.http_host;
        server_options.port = config.http_port;
        server_options.worker_count = config.http_workers;
        server_options.max_body_bytes = config.max_request_body_bytes;
        exit_code = http_server::run(server_options, dispatcher, shutdown_requested);
    }

    mcp_stdio::log_message("NASA MCP Server shut down.");
    return exit_code;
}
