#include "config/server_config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace server_config {

static bool parse_int(const std::string &text, long long minimum, long long maximum, long long &value) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(text, &consumed);
        if (consumed != text.size() || parsed < minimum || parsed > maximum) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

static void read_string(const char *name, std::string &target) {
    const char *value = std::getenv(name);
    if (value != nullptr && value[0] != '\0') {
        target = value;
    }
}

template <typename Integer>
static void read_int(const char *name, long long minimum, long long maximum, Integer &target,
                     std::vector<std::string> &warnings) {
    const char *value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return;
    }
    long long parsed = 0;
    if (!parse_int(value, minimum, maximum, parsed)) {
        warnings.push_back(std::string("Ignoring ") + name + "=" + value + " (expected an integer in [" +
                           std::to_string(minimum) + ", " + std::to_string(maximum) + "])");
        return;
    }
    target = static_cast<Integer>(parsed);
}

static void load_environment(ServerConfig &config, std::vector<std::string> &warnings) {
    read_string("NASA_API_KEY", config.nasa_api_key);
    read_string("NASAMCP_APOD_URL", config.apod_base_url);
    read_string("NASAMCP_MARS_URL", config.mars_base_url);
    read_string("NASAMCP_NEOWS_URL", config.neows_base_url);
    read_string("NASAMCP_EPIC_URL", config.epic_base_url);
    read_string("NASAMCP_GIBS_URL", config.gibs_base_url);
    read_string("NASAMCP_HTTP_HOST", config.http_host);

    read_int("NASAMCP_HTTP_PORT", 1, 65535, config.http_port, warnings);
    read_int("NASAMCP_HTTP_WORKERS", 1, 256, config.http_workers, warnings);
    read_int("NASAMCP_UPSTREAM_TIMEOUT_MS", 100, 600000, config.upstream_timeout_milliseconds, warnings);
    read_int("NASAMCP_MAX_BODY_BYTES", 1024, 64LL * 1024 * 1024, config.max_request_body_bytes, warnings);
    read_int("NASAMCP_MAX_UPSTREAM_BYTES", 1024, 256LL * 1024 * 1024, config.max_upstream_bytes, warnings);
}

LoadResult load(int argument_count, const char *const *arguments) {
    LoadResult result;
    load_environment(result.config, result.warnings);

    for (int index = 1; index < argument_count; ++index) {
        std::string argument = arguments[index];

        if (argument == "--stdio") {
            result.config.transport = Transport::stdio;
        } else if (argument == "--http") {
            result.config.transport = Transport::http;
        } else if (argument == "--help" || argument == "-h") {
            result.help_requested = true;
        } else if (argument == "--host" || argument == "--port") {
            if (index + 1 >= argument_count) {
                result.error_message = argument + " requires a value";
                return result;
            }
            std::string value = arguments[++index];
            if (argument == "--host") {
                result.config.http_host = value;
            } else {
                long long port = 0;
                if (!parse_int(value, 1, 65535, port)) {
                    result.error_message = "Invalid port: " + value;
                    return result;
                }
                result.config.http_port = static_cast<int>(port);
            }
        } else {
            result.error_message = "Unknown argument: " + argument;
            return result;
        }
    }

    result.success = true;
    return result;
}

std::string usage_text(const std::string &program_name) {
    return "Usage: " + program_name + " [--stdio | --http] [--host HOST] [--port PORT]\n"
           "\n"
           "  --stdio        Serve MCP over stdin/stdout (one JSON-RPC message per line).\n"
           "  --http         Serve MCP over HTTP at /mcp (default).\n"
           "  --host HOST    Address to bind the HTTP server to (default 0.0.0.0).\n"
           "  --port PORT    Port for the HTTP server (default 8000).\n"
           "\n"
           "Environment: NASA_API_KEY, NASAMCP_DEBUG, NASAMCP_HTTP_HOST, NASAMCP_HTTP_PORT,\n"
           "NASAMCP_HTTP_WORKERS, NASAMCP_UPSTREAM_TIMEOUT_MS, NASAMCP_MAX_BODY_BYTES,\n"
           "NASAMCP_MAX_UPSTREAM_BYTES, NASAMCP_APOD_URL, NASAMCP_MARS_URL, NASAMCP_NEOWS_URL,\n"
           "NASAMCP_EPIC_URL, NASAMCP_GIBS_URL.\n";
}

} // namespace server_config
