#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_content.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// Tool handler for "get_gibs_image".
// One WMS GetMap request against NASA GIBS; the image is returned inline.

static const std::vector<std::string> VALID_FORMATS = {"image/png", "image/jpeg"};
static const std::vector<std::string> VALID_PROJECTIONS = {"epsg4326", "epsg3857"};
static const char *DEFAULT_LAYER = "MODIS_Terra_CorrectedReflectance_TrueColor";
static const char *DEFAULT_BBOX = "-180,-90,180,90";
static const long long DEFAULT_SIZE = 512;
static const long long MAX_SIZE = 2048;

struct BoundingBox {
    double min_longitude = 0.0;
    double min_latitude = 0.0;
    double max_longitude = 0.0;
    double max_latitude = 0.0;
};

static std::string join(const std::vector<std::string> &values) {
    std::string joined;
    for (const auto &value : values) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += value;
    }
    return joined;
}

// Returns an empty string on success, the failure message otherwise.
static std::string parse_bounding_box(const std::string &text, BoundingBox &box) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t comma = text.find(',', start);
        parts.push_back(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    if (parts.size() != 4) {
        return "bbox must be in format 'min_lon,min_lat,max_lon,max_lat'";
    }

    double values[4];
    for (size_t index = 0; index < parts.size(); ++index) {
        const char *begin = parts[index].c_str();
        char *end = nullptr;
        errno = 0;
        values[index] = std::strtod(begin, &end);
        while (end != nullptr && *end == ' ') {
            ++end;
        }
        if (end == begin || end == nullptr || *end != '\0' || errno == ERANGE || !std::isfinite(values[index])) {
            return "bbox coordinates must be valid numbers";
        }
    }

    box.min_longitude = values[0];
    box.min_latitude = values[1];
    box.max_longitude = values[2];
    box.max_latitude = values[3];

    if (box.min_longitude >= box.max_longitude || box.min_latitude >= box.max_latitude) {
        return "Invalid bounding box coordinates";
    }
    if (box.min_longitude < -180.0 || box.max_longitude > 180.0 || box.min_latitude < -90.0 ||
        box.max_latitude > 90.0) {
        return "Coordinates must be within valid ranges (lon: -180 to 180, lat: -90 to 90)";
    }
    return "";
}

static mcp_content::ToolResult handle_get_gibs_image(const tool_support::ToolContext &context, const json &arguments,
                                                     const mcp_tools::CancellationFlag &cancellation) {
    tool_support::StringArgument layer = tool_support::read_string(arguments, "layer");
    tool_support::StringArgument bbox = tool_support::read_string(arguments, "bbox");
    tool_support::StringArgument date = tool_support::read_string(arguments, "date");
    tool_support::StringArgument format = tool_support::read_string(arguments, "format");
    tool_support::StringArgument projection = tool_support::read_string(arguments, "projection");
    for (const auto *argument : {&layer, &bbox, &date, &format, &projection}) {
        if (!argument->success) {
            return mcp_content::failure(argument->error_message);
        }
    }
    tool_support::IntegerArgument width_argument = tool_support::read_integer(arguments, "width");
    if (!width_argument.success) {
        return mcp_content::failure(width_argument.error_message);
    }
    tool_support::IntegerArgument height_argument = tool_support::read_integer(arguments, "height");
    if (!height_argument.success) {
        return mcp_content::failure(height_argument.error_message);
    }

    std::string layer_name = layer.value.value_or(DEFAULT_LAYER);
    std::string bbox_text = bbox.value.value_or(DEFAULT_BBOX);
    std::string image_format = format.value.value_or("image/png");
    std::string projection_name = tool_support::to_lower(projection.value.value_or("epsg4326"));
    long long width = width_argument.value.value_or(DEFAULT_SIZE);
    long long height = height_argument.value.value_or(DEFAULT_SIZE);

    if (std::find(VALID_FORMATS.begin(), VALID_FORMATS.end(), image_format) == VALID_FORMATS.end()) {
        return mcp_content::failure("Invalid format '" + image_format + "'. Valid options: " + join(VALID_FORMATS));
    }
    if (std::find(VALID_PROJECTIONS.begin(), VALID_PROJECTIONS.end(), projection_name) == VALID_PROJECTIONS.end()) {
        return mcp_content::failure("Invalid projection '" + projection.value.value_or("") +
                                    "'. Valid options: " + join(VALID_PROJECTIONS));
    }
    if (width < 1 || width > MAX_SIZE) {
        return mcp_content::failure("width must be between 1 and 2048 pixels");
    }
    if (height < 1 || height > MAX_SIZE) {
        return mcp_content::failure("height must be between 1 and 2048 pixels");
    }

    BoundingBox box;
    std::string bbox_error = parse_bounding_box(bbox_text, box);
    if (!bbox_error.empty()) {
        return mcp_content::failure(bbox_error);
    }

    if (date.value) {
        tool_support::CalendarDate day;
        if (!tool_support::parse_date(*date.value, day)) {
            return mcp_content::failure("date must be in YYYY-MM-DD format");
        }
    }

    tool_support::QueryParameters query = {
        {"SERVICE", "WMS"},
        {"REQUEST", "GetMap"},
        {"VERSION", "1.3.0"},
        {"LAYERS", layer_name},
        {"BBOX", bbox_text},
        {"WIDTH", std::to_string(width)},
        {"HEIGHT", std::to_string(height)},
        {"FORMAT", image_format},
        {"CRS", "EPSG:" + projection_name.substr(4)},
    };
    if (date.value) {
        query.emplace_back("TIME", *date.value);
    }
    std::string url = tool_support::build_url(
        context.config.gibs_base_url + "/" + projection_name + "/best/wms.cgi", query);
    debug_log::log("get_gibs_image fetching " + url);

    tool_support::FetchResult fetched = tool_support::fetch(context, url, cancellation);
    if (!fetched.success) {
        if (fetched.response.success && fetched.response.status_code == 400) {
            return mcp_content::failure("Bad request. Please check your parameters (layer name, bbox, date, etc.)");
        }
        if (fetched.response.success && fetched.response.status_code == 404) {
            return mcp_content::failure("Layer not found or no data available for the specified date/area");
        }
        return mcp_content::failure(fetched.error_message);
    }

    const upstream::HttpResponse &response = fetched.response;
    std::string content_type = tool_support::media_type(response.content_type);
    if (content_type.compare(0, 6, "image/") != 0) {
        // WMS reports bad parameters as an XML ServiceException with status 200.
        if (response.body.find("ServiceException") != std::string::npos ||
            response.body.find("Error") != std::string::npos) {
            return mcp_content::failure("GIBS service returned an error. Please check your parameters.");
        }
        return mcp_content::failure("Unexpected response type: " + response.content_type);
    }

    std::string text = "GIBS Satellite Image Retrieved!\n";
    text += "Image URL: " + url + "\n";
    text += "Layer: " + layer_name + "\n";
    text += "Date: " + date.value.value_or("Most recent available") + "\n";
    text += "Bounding Box: " + bbox_text + "\n";
    text += "Coverage Area: " + tool_support::format_fixed(box.max_longitude - box.min_longitude, 2) +
            "\xC2\xB0 longitude \xC3\x97 " + tool_support::format_fixed(box.max_latitude - box.min_latitude, 2) +
            "\xC2\xB0 latitude\n";
    text += "Image Size: " + std::to_string(width) + "\xC3\x97" + std::to_string(height) + " pixels\n";
    text += "Format: " + image_format + "\n";
    text += "Projection: " + tool_support::to_upper(projection_name) + "\n";
    text += "Data Size: " + std::to_string(response.body.size()) + " bytes";

    tool_support::EncodedImage encoded = tool_support::base64_encode(response.body);
    if (!encoded.success) {
        return mcp_content::failure("GIBS image could not be returned: " + encoded.error_message);
    }

    std::vector<mcp_content::ContentBlock> content;
    content.push_back(mcp_content::make_text(text));
    content.push_back(mcp_content::make_image(std::move(encoded.data), content_type));
    return mcp_content::success(std::move(content));
}

namespace tool_get_gibs_image {

void register_tool(mcp_tools::ToolRegistry &registry, const tool_support::ToolContext &context) {
    mcp_tools::ToolDescriptor descriptor;
    descriptor.name = "get_gibs_image";
    descriptor.description =
        "Fetch satellite imagery of Earth from NASA GIBS (Global Imagery Browse Services) as an image. "
        "Call get_gibs_layers for layer names and example bounding boxes.";
    descriptor.parameters = {
        {"layer", "string", false, "Imagery layer (default MODIS_Terra_CorrectedReflectance_TrueColor)", {}},
        {"bbox", "string", false, "Bounding box min_lon,min_lat,max_lon,max_lat (default whole world)", {}},
        {"date", "string", false, "Imagery date (YYYY-MM-DD); most recent when omitted", {}},
        {"width", "integer", false, "Image width in pixels (1-2048, default 512)", {}},
        {"height", "integer", false, "Image height in pixels (1-2048, default 512)", {}},
        {"format", "string", false, "Image format (default image/png)", VALID_FORMATS},
        {"projection", "string", false, "Coordinate system (default epsg4326)", VALID_PROJECTIONS},
    };

    registry.register_tool(std::move(descriptor),
                           [context](const json &arguments, const mcp_tools::CancellationFlag &cancellation) {
                               return handle_get_gibs_image(context, arguments, cancellation);
                           });
}

} // namespace tool_get_gibs_image
