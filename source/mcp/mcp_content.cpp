#include "mcp/mcp_content.hpp"
#include "utils/utf8_sanitize.hpp"

#include <utility>

namespace mcp_content {

namespace {

struct BlockSerializer {
    json operator()(const TextContent &text_content) const {
        json block;
        block["type"] = "text";
        block["text"] = text_content.text;
        return block;
    }

    json operator()(const ImageContent &image_content) const {
        json block;
        block["type"] = "image";
        block["data"] = image_content.data;
        block["mimeType"] = image_content.mime_type;
        return block;
    }

    json operator()(const EmbeddedResource &resource) const {
        json block;
        block["type"] = "resource";
        block["resource"]["uri"] = resource.uri;
        block["resource"]["mimeType"] = resource.mime_type;
        block["resource"]["name"] = resource.name;
        return block;
    }
};

} // namespace

ContentBlock make_text(std::string text) {
    utf8_sanitize::sanitize(text);
    return TextContent{std::move(text)};
}

ContentBlock make_image(std::string base64_data, std::string mime_type) {
    return ImageContent{std::move(base64_data), std::move(mime_type)};
}

ContentBlock make_resource(std::string uri, std::string mime_type, std::string name) {
    utf8_sanitize::sanitize(uri);
    utf8_sanitize::sanitize(name);
    return EmbeddedResource{std::move(uri), std::move(mime_type), std::move(name)};
}

ToolResult success(std::vector<ContentBlock> content) {
    ToolResult result;
    result.success = true;
    result.content = std::move(content);
    return result;
}

ToolResult success_text(std::string text) {
    std::vector<ContentBlock> content;
    content.push_back(make_text(std::move(text)));
    return success(std::move(content));
}

ToolResult failure(std::string error_message) {
    ToolResult result;
    result.success = false;
    result.error_message = std::move(error_message);
    return result;
}

json to_json(const ContentBlock &block) {
    return std::visit(BlockSerializer{}, block);
}

json to_json(const std::vector<ContentBlock> &blocks) {
    json array = json::array();
    for (const auto &block : blocks) {
        array.push_back(to_json(block));
    }
    return array;
}

json build_call_result(const ToolResult &result) {
    json payload;
    if (result.success) {
        payload["content"] = to_json(result.content);
        payload["isError"] = false;
    } else {
        payload["content"] = json::array({to_json(make_text("Error: " + result.error_message))});
        payload["isError"] = true;
    }
    return payload;
}

} // namespace mcp_content
