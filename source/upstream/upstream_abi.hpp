#ifndef NASAMCP_UPSTREAM_ABI_HPP
#define NASAMCP_UPSTREAM_ABI_HPP

// Upstream HTTP abstraction interface.
// Tool handlers fetch NASA data through this interface only, which keeps
// them decoupled from the HTTP library and lets tests substitute canned
// responses.

#include <string>

#include "mcp/mcp_tools.hpp"

namespace upstream {

// Result of one GET. success means a complete HTTP response was read,
// whatever its status code; transport problems leave success false and
// describe themselves in error_detail.
struct HttpResponse {
    bool success = false;
    int status_code = 0;
    std::string content_type;
    std::string body;
    bool timed_out = false;
    bool cancelled = false;
    std::string error_detail;
};

class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    // Blocking GET with the implementation's fixed timeout. Must return
    // promptly (cancelled = true) once cancellation is set.
    virtual HttpResponse get(const std::string &url, const mcp_tools::CancellationFlag &cancellation) const = 0;
};

} // namespace upstream

#endif // NASAMCP_UPSTREAM_ABI_HPP
