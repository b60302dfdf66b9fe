#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_content.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <string>
#include <utility>

using json = nlohmann::json;

// Tool handler for "get_neo_feed".
// Near Earth Objects by closest approach date (NeoWs feed, at most 7 days).

static const long long MAX_RANGE_DAYS = 7;
static const long long DEFAULT_LIMIT_PER_DAY = 2;

static bool is_hazardous(const json &asteroid) {
    return asteroid.is_object() && asteroid.contains("is_potentially_hazardous_asteroid") &&
           asteroid["is_potentially_hazardous_asteroid"].is_boolean() &&
           asteroid["is_potentially_hazardous_asteroid"].get<bool>();
}

static double number_field(const json &object, const char *key) {
    if (object.is_object() && object.contains(key) && object[key].is_number()) {
        return object[key].get<double>();
    }
    return 0.0;
}

static std::string format_asteroid(const json &asteroid, size_t index) {
    std::string text = "\n--- Asteroid " + std::to_string(index) + " ---\n";
    text += "Name: " + tool_support::text_field(asteroid, "name", "Unknown") + "\n";
    text += "ID: " + tool_support::text_field(asteroid, "id", "Unknown") + "\n";
    text += "Absolute Magnitude: " + tool_support::text_field(asteroid, "absolute_magnitude_h", "Unknown") + "\n";

    if (asteroid.contains("estimated_diameter") && asteroid["estimated_diameter"].is_object()) {
        const json &diameter = asteroid["estimated_diameter"];
        if (diameter.contains("kilometers") && diameter["kilometers"].is_object() &&
            !diameter["kilometers"].empty()) {
            const json &kilometers = diameter["kilometers"];
            text += "Estimated Diameter: " + tool_support::format_fixed(number_field(kilometers, "estimated_diameter_min"), 3) +
                    " - " + tool_support::format_fixed(number_field(kilometers, "estimated_diameter_max"), 3) + " km\n";
        }
    }

    text += std::string("Potentially Hazardous: ") + (is_hazardous(asteroid) ? "Yes" : "No") + "\n";

    if (asteroid.contains("close_approach_data") && asteroid["close_approach_data"].is_array() &&
        !asteroid["close_approach_data"].empty()) {
        const json &approach = asteroid["close_approach_data"][0];
        text += "Close Approach Date: " + tool_support::text_field(approach, "close_approach_date_full", "Unknown") + "\n";

        if (approach.contains("relative_velocity") && approach["relative_velocity"].is_object()) {
            text += "Relative Velocity: " +
                    tool_support::text_field(approach["relative_velocity"], "kilometers_per_hour", "Unknown") + " km/h\n";
        }
        if (approach.contains("miss_distance") && approach["miss_distance"].is_object()) {
            const json &miss_distance = approach["miss_distance"];
            text += "Miss Distance: " + tool_support::text_field(miss_distance, "kilometers", "Unknown") + " km (" +
                    tool_support::text_field(miss_distance, "lunar", "Unknown") + " lunar distances)\n";
        }
        text += "Orbiting Body: " + tool_support::text_field(approach, "orbiting_body", "Unknown") + "\n";
    }

    std::string jpl_url = tool_support::text_field(asteroid, "nasa_jpl_url", "");
    if (!jpl_url.empty()) {
        text += "More Details: " + jpl_url + "\n";
    }
    return text;
}

static std::string format_feed(const json &document, long long limit_per_day, const std::string &date_range) {
    long long element_count = static_cast<long long>(number_field(document, "element_count"));
    json near_earth_objects = document.contains("near_earth_objects") && document["near_earth_objects"].is_object()
                                  ? document["near_earth_objects"]
                                  : json::object();

    std::string text = "NASA Near Earth Objects (NEO) Feed\n";
    text += "Total asteroids found: " + std::to_string(element_count) + "\n";
    text += "Showing up to " + std::to_string(limit_per_day) + " asteroids per day\n";
    text += date_range + "\n\n";

    long long total_shown = 0;
    long long hazardous_count = 0;
    // Object keys iterate sorted, so YYYY-MM-DD days come out in order.
    for (auto day = near_earth_objects.begin(); day != near_earth_objects.end(); ++day) {
        if (!day.value().is_array()) {
            continue;
        }
        const json &asteroids = day.value();
        size_t shown = std::min(asteroids.size(), static_cast<size_t>(limit_per_day));
        total_shown += static_cast<long long>(shown);

        text += "=== " + day.key() + " (" + std::to_string(asteroids.size()) + " asteroids total, showing " +
                std::to_string(shown) + ") ===\n";
        for (size_t index = 0; index < shown; ++index) {
            text += format_asteroid(asteroids[index], index + 1);
        }
        text += "\n";

        for (const auto &asteroid : asteroids) {
            if (is_hazardous(asteroid)) {
                ++hazardous_count;
            }
        }
    }

    text += "Summary:\n";
    text += "Total asteroids in feed: " + std::to_string(element_count) + "\n";
    text += "Asteroids shown: " + std::to_string(total_shown) + "\n";
    text += "Potentially hazardous asteroids (total): " + std::to_string(hazardous_count) + "\n";
    text += "Non-hazardous asteroids (total): " + std::to_string(element_count - hazardous_count);
    return text;
}

static mcp_content::ToolResult handle_get_neo_feed(const tool_support::ToolContext &context, const json &arguments,
                                                   const mcp_tools::CancellationFlag &cancellation) {
    tool_support::StringArgument start_date = tool_support::read_string(arguments, "start_date");
    if (!start_date.success) {
        return mcp_content::failure(start_date.error_message);
    }
    tool_support::StringArgument end_date = tool_support::read_string(arguments, "end_date");
    if (!end_date.success) {
        return mcp_content::failure(end_date.error_message);
    }
    tool_support::IntegerArgument limit = tool_support::read_integer(arguments, "limit_per_day");
    if (!limit.success) {
        return mcp_content::failure(limit.error_message);
    }

    long long limit_per_day = limit.value.value_or(DEFAULT_LIMIT_PER_DAY);
    if (limit_per_day <= 0) {
        return mcp_content::failure("limit_per_day must be a positive integer");
    }

    tool_support::QueryParameters query;
    std::string date_range = "Date range: Next 7 days (default)";

    if (end_date.value && !start_date.value) {
        return mcp_content::failure("start_date must be provided to use end_date");
    }
    if (start_date.value) {
        tool_support::CalendarDate start;
        if (!tool_support::parse_date(*start_date.value, start)) {
            return mcp_content::failure("start_date must be in YYYY-MM-DD format");
        }
        query.emplace_back("start_date", *start_date.value);

        if (end_date.value) {
            tool_support::CalendarDate end;
            if (!tool_support::parse_date(*end_date.value, end)) {
                return mcp_content::failure("end_date must be in YYYY-MM-DD format");
            }
            long long span = tool_support::days_since_epoch(end) - tool_support::days_since_epoch(start);
            if (span > MAX_RANGE_DAYS) {
                return mcp_content::failure("Date range cannot exceed 7 days");
            }
            if (span < 0) {
                return mcp_content::failure("end_date must be after start_date");
            }
            query.emplace_back("end_date", *end_date.value);
        }
        date_range = "Date range: " + *start_date.value + " to " + end_date.value.value_or("auto");
    }

    query.emplace_back("api_key", context.config.nasa_api_key);
    std::string url = tool_support::build_url(context.config.neows_base_url, query);
    debug_log::log("get_neo_feed fetching " + context.config.neows_base_url);

    upstream::HttpResponse response = context.upstream.get(url, cancellation);
    if (!response.success) {
        return mcp_content::failure(tool_support::describe_failure(response));
    }

    // NeoWs reports problems as {"error_message": ...}, sometimes with 200.
    json document = json::parse(response.body, nullptr, false);
    if (!document.is_discarded() && document.is_object() && document.contains("error_message")) {
        return mcp_content::failure("API Error: " + tool_support::text_field(document, "error_message",
                                                                              "Unknown error occurred"));
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        if (response.status_code == 400) {
            return mcp_content::failure("Invalid date format or date range exceeds 7 days");
        }
        if (response.status_code == 403) {
            return mcp_content::failure("Invalid API key");
        }
        return mcp_content::failure(tool_support::describe_failure(response));
    }
    if (document.is_discarded() || !document.is_object()) {
        return mcp_content::failure("Upstream returned invalid JSON");
    }

    if (number_field(document, "element_count") == 0.0) {
        return mcp_content::success_text("No Near Earth Objects found for the specified date range");
    }
    return mcp_content::success_text(format_feed(document, limit_per_day, date_range));
}

namespace tool_get_neo_feed {

void register_tool(mcp_tools::ToolRegistry &registry, const tool_support::ToolContext &context) {
    mcp_tools::ToolDescriptor descriptor;
    descriptor.name = "get_neo_feed";
    descriptor.description =
        "List Near Earth Objects (asteroids) by closest approach date from NASA NeoWs. "
        "The date range is at most 7 days; without dates the next 7 days are returned.";
    descriptor.parameters = {
        {"start_date", "string", false, "First day of the search (YYYY-MM-DD)", {}},
        {"end_date", "string", false, "Last day of the search (YYYY-MM-DD); needs start_date", {}},
        {"limit_per_day", "integer", false, "Maximum asteroids shown per day (default 2)", {}},
    };

    registry.register_tool(std::move(descriptor),
                           [context](const json &arguments, const mcp_tools::CancellationFlag &cancellation) {
                               return handle_get_neo_feed(context, arguments, cancellation);
                           });
}

} // namespace tool_get_neo_feed
