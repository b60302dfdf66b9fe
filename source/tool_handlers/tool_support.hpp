#ifndef NASAMCP_TOOL_SUPPORT_HPP
#define NASAMCP_TOOL_SUPPORT_HPP

// Shared plumbing for the tool handlers: argument reading with coercion,
// date checks, URL building, upstream fetches and small text helpers.
// Every function reports problems as values; nothing here throws.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"
#include "upstream/upstream_abi.hpp"

namespace tool_support {

using json = nlohmann::json;
using QueryParameters = std::vector<std::pair<std::string, std::string>>;

// What every tool handler gets at registration time. Both references must
// outlive the registry.
struct ToolContext {
    const server_config::ServerConfig &config;
    const upstream::UpstreamClient &upstream;
};

// An optional string argument. Absent, null and "" all mean "not given".
struct StringArgument {
    bool success = true;
    std::optional<std::string> value;
    std::string error_message;
};

// An optional integer argument. Accepts JSON integers, integral floats and
// numeric strings ("42"), since agents often send numbers as strings.
struct IntegerArgument {
    bool success = true;
    std::optional<long long> value;
    std::string error_message;
};

StringArgument read_string(const json &arguments, const std::string &name);

IntegerArgument read_integer(const json &arguments, const std::string &name);

struct CalendarDate {
    int year = 0;
    int month = 0;
    int day = 0;
};

// Strict YYYY-MM-DD that also names a real calendar day.
bool parse_date(const std::string &text, CalendarDate &date);

// Days since 1970-01-01 (proleptic Gregorian).
long long days_since_epoch(const CalendarDate &date);

// Percent-encode everything except unreserved characters and , : /
std::string url_encode(const std::string &value);

// base_url + "?" + k=v&k=v (values encoded). No "?" when query is empty.
std::string build_url(const std::string &base_url, const QueryParameters &query);

// Result of a GET that must come back 2xx.
struct FetchResult {
    bool success = false;
    upstream::HttpResponse response;  // kept for status specific messages
    std::string error_message;
};

FetchResult fetch(const ToolContext &context, const std::string &url,
                  const mcp_tools::CancellationFlag &cancellation);

// Result of a GET that must come back 2xx with a JSON body.
struct JsonFetchResult {
    bool success = false;
    json document;
    std::string error_message;
};

JsonFetchResult fetch_json(const ToolContext &context, const std::string &url,
                           const mcp_tools::CancellationFlag &cancellation);

// Message for a response that did not succeed: timeout, cancellation,
// transport failure or "HTTP <status>[: <upstream message>]".
std::string describe_failure(const upstream::HttpResponse &response);

// Value of object[key] as text: strings as-is, other scalars dumped,
// fallback when missing or null.
std::string text_field(const json &object, const std::string &key, const std::string &fallback);

// Fixed-point formatting, e.g. format_fixed(0.12345, 3) == "0.123".
std::string format_fixed(double value, int precision);

std::string to_upper(std::string text);
std::string to_lower(std::string text);

// Media type without parameters: "image/png; charset=x" -> "image/png".
std::string media_type(const std::string &content_type);

// Guess an image media type from a URL's extension (image/jpeg when unknown).
std::string image_type_for_url(const std::string &url);

// Base64 text for an image payload. Fails on an empty payload or one too
// large to encode, so no tool ever returns an image block without data.
struct EncodedImage {
    bool success = false;
    std::string data;
    std::string error_message;
};

EncodedImage base64_encode(const std::string &bytes);

} // namespace tool_support

#endif // NASAMCP_TOOL_SUPPORT_HPP
