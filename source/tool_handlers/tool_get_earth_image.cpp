#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_content.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// Tool handler for "get_earth_image_tool".
// Full-disc Earth images from the EPIC camera on DSCOVR.

static const std::vector<std::string> IMAGE_TYPES = {"natural", "enhanced", "aerosol", "cloud"};
static const long long MAX_IMAGES = 10;

// "2015-10-31 00:36:33" -> "<epic>/archive/natural/2015/10/31/png/<name>.png"
static std::string archive_url(const std::string &epic_base_url, const std::string &image_type,
                               const std::string &image_date, const std::string &image_name) {
    tool_support::CalendarDate day;
    if (image_name.empty() || image_date.size() < 10 || !tool_support::parse_date(image_date.substr(0, 10), day)) {
        return "";
    }
    return epic_base_url + "/archive/" + image_type + "/" + image_date.substr(0, 4) + "/" + image_date.substr(5, 2) +
           "/" + image_date.substr(8, 2) + "/png/" + image_name + ".png";
}

static mcp_content::ToolResult handle_get_earth_image(const tool_support::ToolContext &context, const json &arguments,
                                                      const mcp_tools::CancellationFlag &cancellation) {
    tool_support::StringArgument earth_date = tool_support::read_string(arguments, "earth_date");
    if (!earth_date.success) {
        return mcp_content::failure(earth_date.error_message);
    }
    tool_support::StringArgument type = tool_support::read_string(arguments, "type");
    if (!type.success) {
        return mcp_content::failure(type.error_message);
    }
    tool_support::IntegerArgument limit_argument = tool_support::read_integer(arguments, "limit");
    if (!limit_argument.success) {
        return mcp_content::failure(limit_argument.error_message);
    }

    long long limit = limit_argument.value.value_or(1);
    if (limit < 1) {
        return mcp_content::failure("limit must be at least 1");
    }
    limit = std::min(limit, MAX_IMAGES);

    std::string image_type = "natural";
    if (type.value) {
        image_type = tool_support::to_lower(*type.value);
        if (std::find(IMAGE_TYPES.begin(), IMAGE_TYPES.end(), image_type) == IMAGE_TYPES.end()) {
            return mcp_content::failure("Invalid type '" + *type.value +
                                        "'. Valid options: 'natural', 'enhanced', 'aerosol', 'cloud'");
        }
    }

    std::string url = context.config.epic_base_url + "/api/" + image_type;
    if (earth_date.value) {
        tool_support::CalendarDate day;
        if (!tool_support::parse_date(*earth_date.value, day)) {
            return mcp_content::failure("earth_date must be in YYYY-MM-DD format");
        }
        url += "/date/" + *earth_date.value;
    }
    debug_log::log("get_earth_image_tool fetching " + url);

    tool_support::JsonFetchResult fetched = tool_support::fetch_json(context, url, cancellation);
    if (!fetched.success) {
        return mcp_content::failure(fetched.error_message);
    }

    const json &images = fetched.document;
    if (!images.is_array() || images.empty()) {
        return mcp_content::success_text("No images found for the specified parameters");
    }

    size_t returned = std::min(images.size(), static_cast<size_t>(limit));
    std::string display_type = image_type;
    display_type[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(display_type[0])));

    std::string text = std::string("Earth Image") + (returned > 1 ? "s" : "") + " Found!\n";
    text += "Image Type: " + display_type + "\n";
    text += "Images returned: " + std::to_string(returned) + " of " + std::to_string(images.size()) + " available\n";

    std::vector<mcp_content::ContentBlock> resources;
    for (size_t index = 0; index < returned; ++index) {
        const json &image = images[index];
        std::string image_date = tool_support::text_field(image, "date", "");
        std::string image_name = tool_support::text_field(image, "image", "");
        std::string image_url = archive_url(context.config.epic_base_url, image_type, image_date, image_name);

        text += "\nImage " + std::to_string(index + 1) + ":\n";
        text += "  URL: " + (image_url.empty() ? std::string("Unavailable") : image_url) + "\n";
        text += "  Date: " + (image_date.empty() ? std::string("Unknown") : image_date) + "\n";
        text += "  Caption: " + tool_support::text_field(image, "caption", "No caption available") + "\n";

        if (!image_url.empty()) {
            resources.push_back(mcp_content::make_resource(image_url, "image/png", image_name));
        }
    }

    std::vector<mcp_content::ContentBlock> content;
    content.push_back(mcp_content::make_text(text));
    for (auto &resource : resources) {
        content.push_back(std::move(resource));
    }
    return mcp_content::success(std::move(content));
}

namespace tool_get_earth_image {

void register_tool(mcp_tools::ToolRegistry &registry, const tool_support::ToolContext &context) {
    mcp_tools::ToolDescriptor descriptor;
    descriptor.name = "get_earth_image_tool";
    descriptor.description =
        "Fetch full-disc images of Earth from NASA's EPIC camera on the DSCOVR satellite. "
        "Without a date the most recent images are returned.";
    descriptor.parameters = {
        {"earth_date", "string", false, "Day the images were taken (YYYY-MM-DD)", {}},
        {"type", "string", false, "Image type (default natural)", IMAGE_TYPES},
        {"limit", "integer", false, "Number of images to return (1-10, default 1)", {}},
    };

    registry.register_tool(std::move(descriptor),
                           [context](const json &arguments, const mcp_tools::CancellationFlag &cancellation) {
                               return handle_get_earth_image(context, arguments, cancellation);
                           });
}

} // namespace tool_get_earth_image
