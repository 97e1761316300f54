#include "PlantType.h"
#include <array>

namespace GardenSim {

static const std::array<const char*, 5> TIER_NAMES = {
    { "common", "rare", "mythic", "legendary", "tool" }
};

static const std::array<const char*, TOOL_KIND_COUNT> TOOL_KIND_NAMES = {
    { "fertilizer", "hoe", "shovel" }
};

static const std::array<const char*, MAX_TOOL_LEVEL + 1> TOOL_LEVEL_NAMES = {
    { "Basic", "Iron", "Gold", "Diamond" }
};

const char* getTierName(Tier tier)
{
    return TIER_NAMES[static_cast<size_t>(tier)];
}

std::optional<Tier> parseTier(const std::string& name)
{
    for (size_t i = 0; i < TIER_NAMES.size(); ++i) {
        if (name == TIER_NAMES[i]) return static_cast<Tier>(i);
    }
    return std::nullopt;
}

const char* getToolKindName(ToolKind kind)
{
    return TOOL_KIND_NAMES[static_cast<size_t>(kind)];
}

std::optional<ToolKind> parseToolKind(const std::string& name)
{
    for (size_t i = 0; i < TOOL_KIND_NAMES.size(); ++i) {
        if (name == TOOL_KIND_NAMES[i]) return static_cast<ToolKind>(i);
    }
    return std::nullopt;
}

const char* getToolLevelName(int level)
{
    if (level < 0 || level > MAX_TOOL_LEVEL) return "Unknown";
    return TOOL_LEVEL_NAMES[static_cast<size_t>(level)];
}

void to_json(nlohmann::json& j, const Color& color)
{
    j = nlohmann::json::array({ color.r, color.g, color.b });
}

void from_json(const nlohmann::json& j, Color& color)
{
    color.r = j.at(0).get<uint8_t>();
    color.g = j.at(1).get<uint8_t>();
    color.b = j.at(2).get<uint8_t>();
}

void to_json(nlohmann::json& j, const PlantType& type)
{
    j = nlohmann::json{ { "name", type.name },
                        { "seed_cost", type.seed_cost },
                        { "tier", getTierName(type.tier) },
                        { "color", type.color } };

    if (type.isTool()) {
        j["tool"] = getToolKindName(type.tool.value_or(ToolKind::FERTILIZER));
        j["level"] = type.tool_level;
        return;
    }

    j["sell_value"] = type.sell_value;
    j["growth_time"] = type.growth_time;
    j["fruit_color"] = type.fruit_color;
    j["size"] = nlohmann::json::array({ type.footprint.width, type.footprint.height });
    j["shape"] = getFootprintShapeName(type.footprint.shape);
}

} // namespace GardenSim
