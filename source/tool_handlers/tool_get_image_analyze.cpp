#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_content.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// Tool handler for "get_image_analyze".
// Downloads an image so the calling model can look at it. The bytes are
// forwarded as fetched; no decoding or resizing happens here.

static bool has_http_scheme(const std::string &url) {
    std::string lowered = tool_support::to_lower(url.substr(0, 8));
    return lowered.compare(0, 7, "http://") == 0 || lowered.compare(0, 8, "https://") == 0;
}

static mcp_content::ToolResult handle_get_image_analyze(const tool_support::ToolContext &context, const json &arguments,
                                                        const mcp_tools::CancellationFlag &cancellation) {
    tool_support::StringArgument image_url = tool_support::read_string(arguments, "image_url");
    if (!image_url.success) {
        return mcp_content::failure(image_url.error_message);
    }
    if (!image_url.value) {
        return mcp_content::failure("Missing required parameter 'image_url'");
    }
    if (!has_http_scheme(*image_url.value)) {
        return mcp_content::failure("image_url must be an http or https URL");
    }

    debug_log::log("get_image_analyze fetching " + *image_url.value);
    tool_support::FetchResult fetched = tool_support::fetch(context, *image_url.value, cancellation);
    if (!fetched.success) {
        return mcp_content::failure("Failed to fetch image: " + fetched.error_message);
    }

    const upstream::HttpResponse &response = fetched.response;
    std::string content_type = tool_support::media_type(response.content_type);
    if (content_type.compare(0, 6, "image/") != 0) {
        return mcp_content::failure("URL does not point to an image. Content-Type: " + response.content_type);
    }
    tool_support::EncodedImage encoded = tool_support::base64_encode(response.body);
    if (!encoded.success) {
        return mcp_content::failure("Failed to read image: " + encoded.error_message);
    }

    std::string text = "Image ready for analysis\n";
    text += "Source URL: " + *image_url.value + "\n";
    text += "Type: " + content_type + "\n";
    text += "Size: " + std::to_string(response.body.size()) + " bytes";

    std::vector<mcp_content::ContentBlock> content;
    content.push_back(mcp_content::make_image(std::move(encoded.data), content_type));
    content.push_back(mcp_content::make_text(text));
    return mcp_content::success(std::move(content));
}

namespace tool_get_image_analyze {

void register_tool(mcp_tools::ToolRegistry &registry, const tool_support::ToolContext &context) {
    mcp_tools::ToolDescriptor descriptor;
    descriptor.name = "get_image_analyze";
    descriptor.description =
        "Download an image from an http(s) URL (for example one returned by another tool) and "
        "return it inline so it can be viewed and analyzed.";
    descriptor.parameters = {
        {"image_url", "string", true, "URL of the image to fetch", {}},
    };

    registry.register_tool(std::move(descriptor),
                           [context](const json &arguments, const mcp_tools::CancellationFlag &cancellation) {
                               return handle_get_image_analyze(context, arguments, cancellation);
                           });
}

} // namespace tool_get_image_analyze
