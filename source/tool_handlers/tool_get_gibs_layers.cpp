#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_content.hpp"
#include "mcp/mcp_tools.hpp"

#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// Tool handler for "get_gibs_layers".
// Static catalog of commonly used GIBS layers and bounding boxes; no upstream call.

struct LayerCategory {
    const char *name;
    std::vector<const char *> layers;
};

static const std::vector<LayerCategory> LAYER_CATEGORIES = {
    {"True Color Imagery",
     {"MODIS_Terra_CorrectedReflectance_TrueColor", "MODIS_Aqua_CorrectedReflectance_TrueColor",
      "VIIRS_SNPP_CorrectedReflectance_TrueColor", "VIIRS_NOAA20_CorrectedReflectance_TrueColor"}},
    {"False Color Imagery",
     {"MODIS_Terra_CorrectedReflectance_Bands721", "MODIS_Aqua_CorrectedReflectance_Bands721",
      "VIIRS_SNPP_CorrectedReflectance_Bands_M11-I2-I1", "VIIRS_NOAA20_CorrectedReflectance_Bands_M11-I2-I1"}},
    {"Environmental Data",
     {"MODIS_Terra_Aerosol", "MODIS_Aqua_Aerosol", "MODIS_Terra_Land_Surface_Temp_Day",
      "MODIS_Terra_Land_Surface_Temp_Night", "MODIS_Terra_Sea_Ice", "MODIS_Terra_Snow_Cover"}},
    {"Reference Data",
     {"Reference_Labels_15m", "Reference_Features_15m", "Coastlines_15m", "SRTM_GL1_Hillshade"}},
};

static std::string build_catalog_text() {
    std::string text = "Available GIBS Layers:\n\n";
    for (const auto &category : LAYER_CATEGORIES) {
        text += std::string(category.name) + ":\n";
        for (const char *layer : category.layers) {
            text += std::string("  - ") + layer + "\n";
        }
        text += "\n";
    }

    text += "Popular Bounding Boxes:\n"
            "  - World: -180,-90,180,90\n"
            "  - North America: -170,15,-50,75\n"
            "  - Europe: -25,35,45,70\n"
            "  - Asia: 60,-10,150,55\n"
            "  - Australia: 110,-45,160,-10\n"
            "  - Africa: -25,-40,55,40\n"
            "  - South America: -85,-60,-30,15\n\n";

    text += "Usage Tips:\n"
            "- Use epsg4326 for geographic data, epsg3857 for web mapping\n"
            "- PNG format preserves transparency, JPEG is smaller file size\n"
            "- Date format: YYYY-MM-DD (not all layers support all dates)\n"
            "- Smaller bounding boxes provide higher detail\n"
            "- Maximum image size: 2048x2048 pixels";
    return text;
}

namespace tool_get_gibs_layers {

void register_tool(mcp_tools::ToolRegistry &registry, const tool_support::ToolContext &) {
    mcp_tools::ToolDescriptor descriptor;
    descriptor.name = "get_gibs_layers";
    descriptor.description =
        "List commonly used NASA GIBS imagery layers, example bounding boxes and usage tips "
        "for get_gibs_image.";

    registry.register_tool(std::move(descriptor), [](const json &, const mcp_tools::CancellationFlag &) {
        return mcp_content::success_text(build_catalog_text());
    });
}

} // namespace tool_get_gibs_layers
