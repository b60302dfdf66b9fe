#ifndef NASAMCP_SERVER_CONFIG_HPP
#define NASAMCP_SERVER_CONFIG_HPP

// Process configuration, built once at startup and passed by reference to
// the transports and tool handlers.

#include <cstddef>
#include <string>
#include <vector>

namespace server_config {

enum class Transport {
    http,
    stdio
};

struct ServerConfig {
    // Upstream services.
    std::string nasa_api_key = "DEMO_KEY";
    std::string apod_base_url = "https://api.nasa.gov/planetary/apod";
    std::string mars_base_url = "https://api.nasa.gov/mars-photos/api/v1/rovers/curiosity/photos";
    std::string neows_base_url = "https://api.nasa.gov/neo/rest/v1/feed";
    std::string epic_base_url = "https://epic.gsfc.nasa.gov";
    std::string gibs_base_url = "https://gibs.earthdata.nasa.gov/wms";
    std::string user_agent = "nasamcp/1.0";
    int upstream_timeout_milliseconds = 30000;
    std::size_t max_upstream_bytes = 16u * 1024u * 1024u;

    // Transports.
    Transport transport = Transport::http;
    std::string http_host = "0.0.0.0";
    int http_port = 8000;
    int http_workers = 4;
    std::size_t max_request_body_bytes = 1024u * 1024u;
};

// Result of building the configuration. Problems with individual values are
// collected as warnings and the defaults kept; only a bad command line fails.
struct LoadResult {
    bool success = false;
    ServerConfig config;
    std::vector<std::string> warnings;
    std::string error_message;
    bool help_requested = false;
};

// Read environment variables (NASA_API_KEY, NASAMCP_*) and then apply the
// command line (--stdio, --http, --host H, --port N, --help).
LoadResult load(int argument_count, const char *const *arguments);

// Usage text for --help and command line errors.
std::string usage_text(const std::string &program_name);

} // namespace server_config

#endif // NASAMCP_SERVER_CONFIG_HPP
