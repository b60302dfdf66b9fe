#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_content.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// Tool handler for "get_apod".
// Astronomy Picture of the Day: one day, a date range, or count random entries.

static const long long MAX_APOD_COUNT = 100;

static std::string apod_image_url(const json &entry) {
    std::string hd_url = tool_support::text_field(entry, "hdurl", "");
    if (!hd_url.empty()) {
        return hd_url;
    }
    return tool_support::text_field(entry, "url", "No image URL");
}

static std::string format_apod_list(const json &entries) {
    std::string text = "Found " + std::to_string(entries.size()) + " APOD images:\n\n";
    size_t index = 1;
    for (const auto &entry : entries) {
        text += "--- Image " + std::to_string(index++) + " ---\n";
        text += "Date: " + tool_support::text_field(entry, "date", "Unknown") + "\n";
        text += "Title: " + tool_support::text_field(entry, "title", "No title") + "\n";
        text += "Image URL: " + apod_image_url(entry) + "\n";
        text += "Explanation: " + tool_support::text_field(entry, "explanation", "No explanation available") + "\n\n";
    }
    while (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

static mcp_content::ToolResult format_apod_single(const json &entry) {
    std::string image_url = apod_image_url(entry);
    std::string title = tool_support::text_field(entry, "title", "No title");

    std::string text = "NASA Astronomy Picture of the Day\n";
    text += "Date: " + tool_support::text_field(entry, "date", "Unknown") + "\n";
    text += "Title: " + title + "\n";
    text += "Image URL: " + image_url + "\n";
    text += "Explanation: " + tool_support::text_field(entry, "explanation", "No explanation available");

    std::vector<mcp_content::ContentBlock> content;
    content.push_back(mcp_content::make_text(text));
    // Videos and interactive entries have nothing to embed.
    if (tool_support::text_field(entry, "media_type", "image") == "image" && image_url != "No image URL") {
        content.push_back(mcp_content::make_resource(image_url, tool_support::image_type_for_url(image_url), title));
    }
    return mcp_content::success(std::move(content));
}

static mcp_content::ToolResult handle_get_apod(const tool_support::ToolContext &context, const json &arguments,
                                               const mcp_tools::CancellationFlag &cancellation) {
    tool_support::StringArgument date = tool_support::read_string(arguments, "date");
    tool_support::StringArgument start_date = tool_support::read_string(arguments, "start_date");
    tool_support::StringArgument end_date = tool_support::read_string(arguments, "end_date");
    tool_support::IntegerArgument count = tool_support::read_integer(arguments, "count");
    for (const auto *argument : {&date, &start_date, &end_date}) {
        if (!argument->success) {
            return mcp_content::failure(argument->error_message);
        }
    }
    if (!count.success) {
        return mcp_content::failure(count.error_message);
    }

    tool_support::QueryParameters query;

    if (count.value) {
        if (date.value || start_date.value || end_date.value) {
            return mcp_content::failure("count cannot be used with date, start_date, or end_date");
        }
        if (*count.value <= 0) {
            return mcp_content::failure("count must be a positive integer");
        }
        if (*count.value > MAX_APOD_COUNT) {
            return mcp_content::failure("count cannot exceed " + std::to_string(MAX_APOD_COUNT));
        }
        query.emplace_back("count", std::to_string(*count.value));
    } else if (start_date.value || end_date.value) {
        if (date.value) {
            return mcp_content::failure("date cannot be used with start_date or end_date");
        }
        if (!start_date.value) {
            return mcp_content::failure("end_date requires start_date");
        }

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
            if (tool_support::days_since_epoch(end) < tool_support::days_since_epoch(start)) {
                return mcp_content::failure("end_date must not be before start_date");
            }
            query.emplace_back("end_date", *end_date.value);
        }
    } else if (date.value) {
        tool_support::CalendarDate day;
        if (!tool_support::parse_date(*date.value, day)) {
            return mcp_content::failure("date must be in YYYY-MM-DD format");
        }
        query.emplace_back("date", *date.value);
    }

    query.emplace_back("api_key", context.config.nasa_api_key);
    std::string url = tool_support::build_url(context.config.apod_base_url, query);
    debug_log::log("get_apod fetching " + context.config.apod_base_url);

    tool_support::JsonFetchResult fetched = tool_support::fetch_json(context, url, cancellation);
    if (!fetched.success) {
        return mcp_content::failure(fetched.error_message);
    }

    const json &document = fetched.document;
    if (document.is_array()) {
        if (document.empty()) {
            return mcp_content::success_text("No APOD images found for the specified parameters");
        }
        return mcp_content::success_text(format_apod_list(document));
    }
    if (document.is_object()) {
        return format_apod_single(document);
    }
    return mcp_content::failure("Unexpected APOD response");
}

namespace tool_get_apod {

void register_tool(mcp_tools::ToolRegistry &registry, const tool_support::ToolContext &context) {
    mcp_tools::ToolDescriptor descriptor;
    descriptor.name = "get_apod";
    descriptor.description =
        "Fetch NASA's Astronomy Picture of the Day with its title and explanation. "
        "Use date for one day, start_date/end_date for a range, or count for random entries; "
        "these options cannot be combined. Defaults to today.";
    descriptor.parameters = {
        {"date", "string", false, "Day of the picture (YYYY-MM-DD)", {}},
        {"start_date", "string", false, "Start of a date range (YYYY-MM-DD)", {}},
        {"end_date", "string", false, "End of a date range (YYYY-MM-DD); needs start_date", {}},
        {"count", "integer", false, "Number of randomly chosen pictures (1-100)", {}},
    };

    registry.register_tool(std::move(descriptor),
                           [context](const json &arguments, const mcp_tools::CancellationFlag &cancellation) {
                               return handle_get_apod(context, arguments, cancellation);
                           });
}

} // namespace tool_get_apod
