#pragma once

#include "Footprint.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace GardenSim {

enum class Tier : uint8_t {
    COMMON = 0,
    RARE,
    MYTHIC,
    LEGENDARY,
    TOOL
};

enum class ToolKind : uint8_t {
    FERTILIZER = 0,
    HOE,
    SHOVEL
};

constexpr int TOOL_KIND_COUNT = 3;
constexpr int MAX_TOOL_LEVEL = 3;

const char* getTierName(Tier tier);
std::optional<Tier> parseTier(const std::string& name);

const char* getToolKindName(ToolKind kind);
std::optional<ToolKind> parseToolKind(const std::string& name);

// Basic, Iron, Gold, Diamond.
const char* getToolLevelName(int level);

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Color& other) const = default;
};

/**
 * Static definition of a purchasable catalog entry: a plantable seed, or a
 * tool tier upgrade. Immutable once the Catalog is built.
 */
struct PlantType {
    std::string name;
    double seed_cost = 0.0;
    double sell_value = 0.0; // Derived from the sell-value table; 0 for tools.
    double growth_time = 0.0; // Seconds from planting to harvestable.
    Color color;
    Color fruit_color;
    Footprint footprint;
    Tier tier = Tier::COMMON;

    // Set only for TOOL entries.
    std::optional<ToolKind> tool;
    int tool_level = 0;

    bool isTool() const { return tier == Tier::TOOL; }
};

void to_json(nlohmann::json& j, const Color& color);
void from_json(const nlohmann::json& j, Color& color);

void to_json(nlohmann::json& j, const PlantType& type);

} // namespace GardenSim
