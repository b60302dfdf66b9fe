// Tests for the NASA tool handlers, run through the dispatcher against a
// canned upstream client. No network access.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

#include "config/server_config.hpp"
#include "fake_upstream.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"

using json = nlohmann::json;

namespace test_tool_handlers {

static const mcp_tools::CancellationFlag never_cancelled;

// Registers every tool against the given context and freezes the registry.
static const mcp_tools::ToolRegistry &register_and_freeze(mcp_tools::ToolRegistry &registry,
                                                         const tool_support::ToolContext &context) {
    tool_handlers::register_all_tools(registry, context);
    registry.freeze();
    return registry;
}

// Full registry wired to a fake upstream. Not copyable: handlers keep
// references to config and upstream.
struct Harness {
    server_config::ServerConfig config;
    fake_upstream::FakeUpstreamClient upstream;
    mcp_tools::ToolRegistry registry;
    mcp_dispatch::Dispatcher dispatcher;

    Harness() : dispatcher(register_and_freeze(registry, tool_support::ToolContext{config, upstream})) {}

    Harness(const Harness &) = delete;
    Harness &operator=(const Harness &) = delete;

    // Returns the tools/call result object ({content, isError}).
    json call(const std::string &name, const json &arguments) {
        json request = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                        {"params", {{"name", name}, {"arguments", arguments}}}};
        return dispatcher.dispatch_message(request, never_cancelled)["result"];
    }

    std::string last_url() const {
        return upstream.requested_urls.empty() ? std::string() : upstream.requested_urls.back();
    }
};

static std::string first_text(const json &result) {
    if (!result.contains("content") || result["content"].empty() || !result["content"][0].contains("text")) {
        return "";
    }
    return result["content"][0]["text"].get<std::string>();
}

static bool contains(const std::string &text, const std::string &needle) {
    return text.find(needle) != std::string::npos;
}

static bool report(bool success, const std::string &description, const json &result) {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << " -- got " << result.dump() << std::endl;
    }
    return success;
}

// Test: Every tool is registered, in a stable order.
static bool test_all_tools_registered() {
    Harness harness;
    json tools = harness.registry.build_tools_list_response()["tools"];
    json names = json::array();
    for (const auto &tool : tools) {
        names.push_back(tool["name"]);
    }
    json expected = {"get_add", "get_apod", "get_mars_image", "get_neo_feed", "get_earth_image_tool",
                     "get_gibs_image", "get_gibs_layers", "get_image_analyze"};
    return report(names == expected, "All eight tools registered in order", names);
}

// Test: Every name listed by tools/list can be called through tools/call.
static bool test_listed_tools_are_callable() {
    Harness harness;
    harness.upstream.reply_json("{}");

    json list_request = {{"jsonrpc", "2.0"}, {"id", "list"}, {"method", "tools/list"}};
    json listing = harness.dispatcher.dispatch_message(list_request, never_cancelled);
    if (!listing.contains("result") || listing["result"]["tools"].size() != harness.registry.size()) {
        return report(false, "tools/list returns every registered tool", listing);
    }

    int request_id = 0;
    for (const auto &tool : listing["result"]["tools"]) {
        json call_request = {{"jsonrpc", "2.0"}, {"id", ++request_id}, {"method", "tools/call"},
                             {"params", {{"name", tool["name"]}, {"arguments", json::object()}}}};
        json reply = harness.dispatcher.dispatch_message(call_request, never_cancelled);
        bool callable = reply.contains("result") && !reply.contains("error") && reply["id"] == request_id &&
                        reply["result"]["content"].is_array() && !reply["result"]["content"].empty() &&
                        reply["result"]["isError"].is_boolean();
        if (!callable) {
            return report(false, "tools/call resolves " + tool["name"].get<std::string>(), reply);
        }
    }
    return report(true, "Every listed tool resolves through tools/call", listing["result"]["tools"].size());
}

// Test: get_add coerces numeric strings.
static bool test_get_add_coerces_strings() {
    Harness harness;
    json result = harness.call("get_add", {{"a", "2"}, {"b", "3"}});
    json expected = {{"content", json::array({{{"type", "text"}, {"text", "5"}}})}, {"isError", false}};
    return report(result == expected, "get_add(\"2\", \"3\") is \"5\"", result);
}

// Test: get_add rejects non-numeric operands as a tool-tier error.
static bool test_get_add_rejects_text() {
    Harness harness;
    json result = harness.call("get_add", {{"a", "two"}, {"b", 3}});
    return report(result["isError"] == true && first_text(result) == "Error: a must be an integer",
                  "get_add rejects non-numeric operand", result);
}

// Test: get_apod refuses date combined with start_date, before any fetch.
static bool test_apod_date_with_range_rejected() {
    Harness harness;
    json result = harness.call("get_apod", {{"date", "2099-01-01"}, {"start_date", "2099-01-01"}});
    return report(result["isError"] == true && contains(first_text(result), "cannot be used with") &&
                      harness.upstream.requested_urls.empty(),
                  "get_apod date + start_date is rejected", result);
}

// Test: get_apod refuses count combined with a date.
static bool test_apod_count_with_date_rejected() {
    Harness harness;
    json result = harness.call("get_apod", {{"count", 3}, {"date", "2024-01-01"}});
    return report(first_text(result) == "Error: count cannot be used with date, start_date, or end_date",
                  "get_apod count + date is rejected", result);
}

// Test: get_apod validates dates against the calendar and range order.
static bool test_apod_date_validation() {
    Harness harness;
    json bad_day = harness.call("get_apod", {{"date", "2023-02-29"}});
    json reversed = harness.call("get_apod", {{"start_date", "2024-01-10"}, {"end_date", "2024-01-01"}});
    json end_only = harness.call("get_apod", {{"end_date", "2024-01-01"}});
    bool success = first_text(bad_day) == "Error: date must be in YYYY-MM-DD format" &&
                   reversed["isError"] == true && end_only["isError"] == true &&
                   harness.upstream.requested_urls.empty();
    return report(success, "get_apod date validation", json::array({bad_day, reversed, end_only}));
}

// Test: A single APOD entry is formatted and its image offered as a resource.
static bool test_apod_single_image() {
    Harness harness;
    harness.upstream.reply_json(json{{"date", "2024-01-01"},
                                     {"title", "Ring Nebula"},
                                     {"url", "https://apod.nasa.gov/image/ring.jpg"},
                                     {"hdurl", "https://apod.nasa.gov/image/ring_hd.png"},
                                     {"media_type", "image"},
                                     {"explanation", "A planetary nebula."}}
                                    .dump());
    json result = harness.call("get_apod", {{"date", "2024-01-01"}});
    std::string text = first_text(result);
    bool success = result["isError"] == false && contains(text, "NASA Astronomy Picture of the Day") &&
                   contains(text, "Title: Ring Nebula") &&
                   contains(text, "Image URL: https://apod.nasa.gov/image/ring_hd.png") &&
                   result["content"].size() == 2 && result["content"][1]["type"] == "resource" &&
                   result["content"][1]["resource"]["mimeType"] == "image/png" &&
                   contains(harness.last_url(), "https://api.nasa.gov/planetary/apod?date=2024-01-01") &&
                   contains(harness.last_url(), "api_key=DEMO_KEY");
    return report(success, "get_apod single image formatted with resource", result);
}

// Test: A list of APOD entries is formatted as a numbered list.
static bool test_apod_list() {
    Harness harness;
    harness.upstream.reply_json(json::array({{{"date", "2024-01-01"}, {"title", "One"}, {"url", "u1"}},
                                             {{"date", "2024-01-02"}, {"title", "Two"}, {"url", "u2"}}})
                                    .dump());
    json result = harness.call("get_apod", {{"count", "2"}});
    std::string text = first_text(result);
    bool success = contains(text, "Found 2 APOD images:") && contains(text, "--- Image 2 ---") &&
                   contains(text, "Title: Two") && contains(harness.last_url(), "count=2");
    return report(success, "get_apod list response", result);
}

// Test: get_mars_image defaults to sol 1000 and normalizes the camera name.
static bool test_mars_query_building() {
    Harness harness;
    harness.upstream.reply_json(R"({"photos":[]})");
    json defaults = harness.call("get_mars_image", json::object());
    std::string default_url = harness.last_url();
    harness.call("get_mars_image", {{"earth_date", "2015-06-03"}, {"camera", "navcam"}});
    std::string camera_url = harness.last_url();

    bool success = first_text(defaults) == "No images are found for the specified parameters" &&
                   contains(default_url, "sol=1000") && contains(default_url, "page=1") &&
                   contains(camera_url, "earth_date=2015-06-03") && contains(camera_url, "camera=NAVCAM");
    return report(success, "get_mars_image query building", json::array({default_url, camera_url}));
}

// Test: get_mars_image rejects unknown cameras and negative sols.
static bool test_mars_validation() {
    Harness harness;
    json camera = harness.call("get_mars_image", {{"camera", "selfie"}});
    json sol = harness.call("get_mars_image", {{"sol", -1}});
    bool success = contains(first_text(camera), "Invalid camera 'selfie'. Valid options: FHAZ, RHAZ") &&
                   first_text(sol) == "Error: sol must be a non-negative integer" &&
                   harness.upstream.requested_urls.empty();
    return report(success, "get_mars_image argument validation", json::array({camera, sol}));
}

// Test: get_mars_image reports the first photo.
static bool test_mars_photo_found() {
    Harness harness;
    harness.upstream.reply_json(json{{"photos", json::array({{{"img_src", "http://mars.jpl.nasa.gov/a.JPG"},
                                                              {"earth_date", "2015-05-30"},
                                                              {"sol", 1000},
                                                              {"camera", {{"name", "MAST"},
                                                                          {"full_name", "Mast Camera"}}}}})}}
                                    .dump());
    json result = harness.call("get_mars_image", {{"sol", "1000"}});
    std::string text = first_text(result);
    bool success = contains(text, "Mars Rover Image Found!") && contains(text, "Camera: Mast Camera (MAST)") &&
                   contains(text, "Sol: 1000") && contains(text, "Total photos available: 1") &&
                   result["content"].size() == 2 && result["content"][1]["resource"]["mimeType"] == "image/jpeg";
    return report(success, "get_mars_image formats the first photo", result);
}

// Test: get_neo_feed enforces the 7 day window.
static bool test_neo_date_rules() {
    Harness harness;
    json too_long = harness.call("get_neo_feed", {{"start_date", "2024-01-01"}, {"end_date", "2024-01-09"}});
    json reversed = harness.call("get_neo_feed", {{"start_date", "2024-01-05"}, {"end_date", "2024-01-01"}});
    json end_only = harness.call("get_neo_feed", {{"end_date", "2024-01-05"}});
    json bad_limit = harness.call("get_neo_feed", {{"limit_per_day", 0}});
    bool success = first_text(too_long) == "Error: Date range cannot exceed 7 days" &&
                   reversed["isError"] == true && end_only["isError"] == true && bad_limit["isError"] == true &&
                   harness.upstream.requested_urls.empty();
    return report(success, "get_neo_feed date and limit rules", json::array({too_long, reversed, end_only}));
}

// Test: get_neo_feed surfaces error_message from a failed upstream call.
static bool test_neo_upstream_error_message() {
    Harness harness;
    harness.upstream.reply(403, "application/json", R"({"error_message":"API key missing"})");
    json result = harness.call("get_neo_feed", json::object());
    return report(first_text(result) == "Error: API Error: API key missing",
                  "get_neo_feed reports upstream error_message", result);
}

// Test: get_neo_feed formats days, limits per day and counts hazards.
static bool test_neo_feed_formatting() {
    Harness harness;
    json asteroid = {{"name", "(2024 AB)"},
                     {"id", "123"},
                     {"absolute_magnitude_h", 22.1},
                     {"estimated_diameter", {{"kilometers", {{"estimated_diameter_min", 0.1},
                                                             {"estimated_diameter_max", 0.25}}}}},
                     {"is_potentially_hazardous_asteroid", true},
                     {"close_approach_data", json::array({{{"close_approach_date_full", "2024-Jan-01 10:00"},
                                                           {"relative_velocity", {{"kilometers_per_hour", "1000"}}},
                                                           {"miss_distance", {{"kilometers", "5000"},
                                                                              {"lunar", "13"}}},
                                                           {"orbiting_body", "Earth"}}})}};
    json harmless = {{"name", "(2024 CD)"}, {"id", "456"}, {"is_potentially_hazardous_asteroid", false}};
    json feed = {{"element_count", 3},
                 {"near_earth_objects", {{"2024-01-01", json::array({asteroid, harmless, harmless})}}}};
    harness.upstream.reply_json(feed.dump());

    json result = harness.call("get_neo_feed", {{"start_date", "2024-01-01"}, {"end_date", "2024-01-02"}});
    std::string text = first_text(result);
    bool success = contains(text, "Total asteroids found: 3") &&
                   contains(text, "=== 2024-01-01 (3 asteroids total, showing 2) ===") &&
                   contains(text, "Estimated Diameter: 0.100 - 0.250 km") &&
                   contains(text, "Potentially Hazardous: Yes") &&
                   contains(text, "Miss Distance: 5000 km (13 lunar distances)") &&
                   contains(text, "Asteroids shown: 2") &&
                   contains(text, "Potentially hazardous asteroids (total): 1") &&
                   contains(text, "Non-hazardous asteroids (total): 2") &&
                   contains(text, "Date range: 2024-01-01 to 2024-01-02");
    return report(success, "get_neo_feed formatting and summary", result);
}

// Test: get_earth_image_tool builds archive URLs and caps the image count.
static bool test_earth_images() {
    Harness harness;
    json images = json::array();
    for (int index = 0; index < 12; ++index) {
        images.push_back({{"image", "epic_1b_" + std::to_string(index)},
                          {"date", "2015-10-31 00:36:33"},
                          {"caption", "Earth"}});
    }
    harness.upstream.reply_json(images.dump());

    json result = harness.call("get_earth_image_tool",
                               {{"type", "Enhanced"}, {"limit", 50}, {"earth_date", "2015-10-31"}});
    std::string text = first_text(result);
    bool success = harness.last_url() == "https://epic.gsfc.nasa.gov/api/enhanced/date/2015-10-31" &&
                   contains(text, "Images returned: 10 of 12 available") && contains(text, "Image Type: Enhanced") &&
                   result["content"].size() == 11 &&
                   result["content"][1]["resource"]["uri"] ==
                       "https://epic.gsfc.nasa.gov/archive/enhanced/2015/10/31/png/epic_1b_0.png";
    return report(success, "get_earth_image_tool archive URLs and cap", result["content"][1]);
}

// Test: get_earth_image_tool rejects unknown types and a zero limit.
static bool test_earth_validation() {
    Harness harness;
    json type = harness.call("get_earth_image_tool", {{"type", "infrared"}});
    json limit = harness.call("get_earth_image_tool", {{"limit", 0}});
    bool success = contains(first_text(type), "Invalid type 'infrared'") &&
                   first_text(limit) == "Error: limit must be at least 1" && harness.upstream.requested_urls.empty();
    return report(success, "get_earth_image_tool argument validation", json::array({type, limit}));
}

// Test: get_gibs_image validates size, bbox and format before fetching.
static bool test_gibs_validation() {
    Harness harness;
    json width = harness.call("get_gibs_image", {{"width", 4096}});
    json bbox = harness.call("get_gibs_image", {{"bbox", "10,10,0,20"}});
    json bbox_parts = harness.call("get_gibs_image", {{"bbox", "1,2,3"}});
    json format = harness.call("get_gibs_image", {{"format", "image/gif"}});
    bool success = first_text(width) == "Error: width must be between 1 and 2048 pixels" &&
                   first_text(bbox) == "Error: Invalid bounding box coordinates" &&
                   contains(first_text(bbox_parts), "bbox must be in format") &&
                   contains(first_text(format), "Invalid format 'image/gif'") &&
                   harness.upstream.requested_urls.empty();
    return report(success, "get_gibs_image argument validation", json::array({width, bbox, format}));
}

// Test: get_gibs_image returns the fetched bytes as an image block.
static bool test_gibs_image_returned() {
    Harness harness;
    harness.upstream.reply(200, "image/png", std::string("\x89PNG", 4));
    json result = harness.call("get_gibs_image", {{"bbox", "-10,30,40,50"}, {"date", "2023-07-01"}});
    std::string url = harness.last_url();
    bool success = result["isError"] == false && result["content"].size() == 2 &&
                   contains(first_text(result), "GIBS Satellite Image Retrieved!") &&
                   result["content"][1]["type"] == "image" && result["content"][1]["data"] == "iVBORw==" &&
                   result["content"][1]["mimeType"] == "image/png" &&
                   contains(url, "https://gibs.earthdata.nasa.gov/wms/epsg4326/best/wms.cgi?SERVICE=WMS") &&
                   contains(url, "BBOX=-10,30,40,50") && contains(url, "CRS=EPSG:4326") &&
                   contains(url, "TIME=2023-07-01");
    return report(success, "get_gibs_image returns an image block", result);
}

// Test: An empty image payload is a tool-tier error, never an empty image block.
static bool test_empty_image_payload_rejected() {
    Harness harness;
    harness.upstream.reply(200, "image/png", "");
    json gibs = harness.call("get_gibs_image", json::object());
    json analyze = harness.call("get_image_analyze", {{"image_url", "https://example.org/empty.png"}});
    bool success = gibs["isError"] == true && gibs["content"].size() == 1 &&
                   first_text(gibs) == "Error: GIBS image could not be returned: Image data is empty" &&
                   analyze["isError"] == true && analyze["content"].size() == 1 &&
                   first_text(analyze) == "Error: Failed to read image: Image data is empty";
    return report(success, "Empty image payloads become tool-tier errors", json::array({gibs, analyze}));
}

// Test: A WMS exception document is reported as a service error.
static bool test_gibs_service_exception() {
    Harness harness;
    harness.upstream.reply(200, "text/xml", "<ServiceExceptionReport><ServiceException/></ServiceExceptionReport>");
    json result = harness.call("get_gibs_image", json::object());
    return report(first_text(result) == "Error: GIBS service returned an error. Please check your parameters.",
                  "get_gibs_image reports WMS exceptions", result);
}

// Test: get_gibs_layers needs no upstream.
static bool test_gibs_layers_catalog() {
    Harness harness;
    json result = harness.call("get_gibs_layers", json::object());
    std::string text = first_text(result);
    bool success = contains(text, "Available GIBS Layers:") &&
                   contains(text, "MODIS_Terra_CorrectedReflectance_TrueColor") &&
                   contains(text, "World: -180,-90,180,90") && harness.upstream.requested_urls.empty();
    return report(success, "get_gibs_layers static catalog", result);
}

// Test: get_image_analyze requires an http(s) image.
static bool test_image_analyze() {
    Harness harness;
    json scheme = harness.call("get_image_analyze", {{"image_url", "file:///etc/passwd"}});
    json missing = harness.call("get_image_analyze", json::object());
    harness.upstream.reply(200, "text/html; charset=utf-8", "<html></html>");
    json html = harness.call("get_image_analyze", {{"image_url", "https://example.org/page"}});
    harness.upstream.reply(200, "image/jpeg", "abc");
    json image = harness.call("get_image_analyze", {{"image_url", "https://example.org/a.jpg"}});

    bool success = first_text(scheme) == "Error: image_url must be an http or https URL" &&
                   first_text(missing) == "Error: Missing required parameter 'image_url'" &&
                   contains(first_text(html), "URL does not point to an image") &&
                   image["isError"] == false && image["content"][0]["type"] == "image" &&
                   image["content"][0]["data"] == "YWJj" && image["content"][0]["mimeType"] == "image/jpeg";
    return report(success, "get_image_analyze validation and image block", image);
}

// Test: An upstream timeout is a tool-tier error with the fixed message.
static bool test_timeout_message() {
    Harness harness;
    harness.upstream.time_out();
    json result = harness.call("get_apod", json::object());
    return report(first_text(result) == "Error: Request timed out. Please try again.",
                  "Upstream timeout becomes a tool-tier error", result);
}

// Test: Non-2xx responses report the status and upstream message.
static bool test_http_status_message() {
    Harness harness;
    harness.upstream.reply(429, "application/json", R"({"error":{"code":"OVER_RATE_LIMIT","message":"Slow down"}})");
    json result = harness.call("get_apod", json::object());
    return report(first_text(result) == "Error: HTTP 429: Slow down", "HTTP status failure message", result);
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_all_tools_registered();
    all_passed &= test_listed_tools_are_callable();
    all_passed &= test_get_add_coerces_strings();
    all_passed &= test_get_add_rejects_text();
    all_passed &= test_apod_date_with_range_rejected();
    all_passed &= test_apod_count_with_date_rejected();
    all_passed &= test_apod_date_validation();
    all_passed &= test_apod_single_image();
    all_passed &= test_apod_list();
    all_passed &= test_mars_query_building();
    all_passed &= test_mars_validation();
    all_passed &= test_mars_photo_found();
    all_passed &= test_neo_date_rules();
    all_passed &= test_neo_upstream_error_message();
    all_passed &= test_neo_feed_formatting();
    all_passed &= test_earth_images();
    all_passed &= test_earth_validation();
    all_passed &= test_gibs_validation();
    all_passed &= test_gibs_image_returned();
    all_passed &= test_empty_image_payload_rejected();
    all_passed &= test_gibs_service_exception();
    all_passed &= test_gibs_layers_catalog();
    all_passed &= test_image_analyze();
    all_passed &= test_timeout_message();
    all_passed &= test_http_status_message();
    return all_passed;
}

} // namespace test_tool_handlers
