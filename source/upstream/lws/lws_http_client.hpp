#ifndef NASAMCP_LWS_HTTP_CLIENT_HPP
#define NASAMCP_LWS_HTTP_CLIENT_HPP

// libwebsockets implementation of the upstream HTTP client.
// Each get() runs its own client context on the calling thread, so calls
// from different worker threads never share libwebsockets state.

#include <cstddef>
#include <string>

#include "upstream/upstream_abi.hpp"

namespace lws_http_client {

struct ClientOptions {
    int timeout_milliseconds = 30000;
    std::size_t max_body_bytes = 16u * 1024u * 1024u;
    std::string user_agent = "nasamcp/1.0";
};

// Pieces of an http:// or https:// URL as libwebsockets wants them.
struct ParsedUrl {
    bool success = false;
    bool use_tls = false;
    std::string host;
    int port = 0;
    std::string path;  // always starts with '/', includes the query string
    std::string error_message;
};

ParsedUrl parse_url(const std::string &url);

class LwsHttpClient : public upstream::UpstreamClient {
public:
    explicit LwsHttpClient(ClientOptions options);

    upstream::HttpResponse get(const std::string &url,
                               const mcp_tools::CancellationFlag &cancellation) const override;

private:
    ClientOptions options_;
};

} // namespace lws_http_client

#endif // NASAMCP_LWS_HTTP_CLIENT_HPP
