#include "mcp/mcp_tools.hpp"

#include <utility>

namespace mcp_tools {

json build_input_schema(const ToolDescriptor &descriptor) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    json required = json::array();
    for (const auto &parameter : descriptor.parameters) {
        json property;
        property["type"] = parameter.type;
        if (!parameter.description.empty()) {
            property["description"] = parameter.description;
        }
        if (!parameter.allowed_values.empty()) {
            property["enum"] = parameter.allowed_values;
        }
        input_schema["properties"][parameter.name] = property;

        if (parameter.required) {
            required.push_back(parameter.name);
        }
    }
    input_schema["required"] = required;
    return input_schema;
}

void ToolRegistry::register_tool(ToolDescriptor descriptor, ToolHandler handler) {
    if (frozen_) {
        throw std::logic_error("Tool registry is frozen; cannot register " + descriptor.name);
    }
    if (index_by_name_.count(descriptor.name) != 0) {
        throw DuplicateToolError(descriptor.name);
    }

    index_by_name_.emplace(descriptor.name, tools_.size());
    tools_.push_back(RegisteredTool{std::move(descriptor), std::move(handler)});
}

const RegisteredTool *ToolRegistry::resolve(const std::string &tool_name) const {
    auto iterator = index_by_name_.find(tool_name);
    if (iterator == index_by_name_.end()) {
        return nullptr;
    }
    return &tools_[iterator->second];
}

json ToolRegistry::build_tools_list_response() const {
    json tools_array = json::array();
    for (const auto &tool : tools_) {
        json tool_entry;
        tool_entry["name"] = tool.descriptor.name;
        tool_entry["description"] = tool.descriptor.description;
        tool_entry["inputSchema"] = build_input_schema(tool.descriptor);
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

} // namespace mcp_tools
