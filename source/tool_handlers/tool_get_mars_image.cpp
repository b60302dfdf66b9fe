#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_content.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// Tool handler for "get_mars_image".
// Curiosity rover photos by Martian sol or Earth date, optionally for one camera.

static const std::vector<std::string> VALID_CAMERAS = {
    "FHAZ", "RHAZ", "MAST", "CHEMCAM", "MAHLI", "MARDI", "NAVCAM", "PANCAM", "MINITES"
};

static const long long DEFAULT_SOL = 1000;

static std::string join_cameras() {
    std::string joined;
    for (const auto &camera : VALID_CAMERAS) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += camera;
    }
    return joined;
}

static mcp_content::ToolResult handle_get_mars_image(const tool_support::ToolContext &context, const json &arguments,
                                                     const mcp_tools::CancellationFlag &cancellation) {
    tool_support::StringArgument earth_date = tool_support::read_string(arguments, "earth_date");
    if (!earth_date.success) {
        return mcp_content::failure(earth_date.error_message);
    }
    tool_support::IntegerArgument sol = tool_support::read_integer(arguments, "sol");
    if (!sol.success) {
        return mcp_content::failure(sol.error_message);
    }
    tool_support::StringArgument camera = tool_support::read_string(arguments, "camera");
    if (!camera.success) {
        return mcp_content::failure(camera.error_message);
    }

    tool_support::QueryParameters query;

    // sol wins over earth_date when both are given.
    if (sol.value) {
        if (*sol.value < 0) {
            return mcp_content::failure("sol must be a non-negative integer");
        }
        query.emplace_back("sol", std::to_string(*sol.value));
    } else if (earth_date.value) {
        tool_support::CalendarDate day;
        if (!tool_support::parse_date(*earth_date.value, day)) {
            return mcp_content::failure("earth_date must be in YYYY-MM-DD format");
        }
        query.emplace_back("earth_date", *earth_date.value);
    } else {
        query.emplace_back("sol", std::to_string(DEFAULT_SOL));
    }

    if (camera.value) {
        std::string camera_upper = tool_support::to_upper(*camera.value);
        if (std::find(VALID_CAMERAS.begin(), VALID_CAMERAS.end(), camera_upper) == VALID_CAMERAS.end()) {
            return mcp_content::failure("Invalid camera '" + *camera.value + "'. Valid options: " + join_cameras());
        }
        query.emplace_back("camera", camera_upper);
    }

    query.emplace_back("page", "1");
    query.emplace_back("api_key", context.config.nasa_api_key);
    std::string url = tool_support::build_url(context.config.mars_base_url, query);
    debug_log::log("get_mars_image fetching " + context.config.mars_base_url);

    tool_support::JsonFetchResult fetched = tool_support::fetch_json(context, url, cancellation);
    if (!fetched.success) {
        return mcp_content::failure(fetched.error_message);
    }

    const json &document = fetched.document;
    if (!document.is_object() || !document.contains("photos") || !document["photos"].is_array() ||
        document["photos"].empty()) {
        return mcp_content::success_text("No images are found for the specified parameters");
    }

    const json &photos = document["photos"];
    const json &photo = photos[0];
    std::string image_url = tool_support::text_field(photo, "img_src", "");
    json camera_info = photo.is_object() && photo.contains("camera") ? photo["camera"] : json::object();

    std::string text = "Mars Rover Image Found!\n";
    text += "Image URL: " + image_url + "\n";
    text += "Camera: " + tool_support::text_field(camera_info, "full_name", "Unknown") + " (" +
            tool_support::text_field(camera_info, "name", "Unknown") + ")\n";
    text += "Earth Date: " + tool_support::text_field(photo, "earth_date", "Unknown") + "\n";
    text += "Sol: " + tool_support::text_field(photo, "sol", "Unknown") + "\n";
    text += "Total photos available: " + std::to_string(photos.size());

    std::vector<mcp_content::ContentBlock> content;
    content.push_back(mcp_content::make_text(text));
    if (!image_url.empty()) {
        content.push_back(mcp_content::make_resource(image_url, tool_support::image_type_for_url(image_url),
                                                     "Mars rover photo"));
    }
    return mcp_content::success(std::move(content));
}

namespace tool_get_mars_image {

void register_tool(mcp_tools::ToolRegistry &registry, const tool_support::ToolContext &context) {
    mcp_tools::ToolDescriptor descriptor;
    descriptor.name = "get_mars_image";
    descriptor.description =
        "Fetch a photo taken by the Curiosity Mars rover. Query by Martian sol (default 1000) "
        "or by Earth date, optionally restricted to one camera.";
    descriptor.parameters = {
        {"earth_date", "string", false, "Earth date the photo was taken (YYYY-MM-DD)", {}},
        {"sol", "integer", false, "Martian sol of the mission (0 or more)", {}},
        {"camera", "string", false, "Camera abbreviation", VALID_CAMERAS},
    };

    registry.register_tool(std::move(descriptor),
                           [context](const json &arguments, const mcp_tools::CancellationFlag &cancellation) {
                               return handle_get_mars_image(context, arguments, cancellation);
                           });
}

} // namespace tool_get_mars_image
