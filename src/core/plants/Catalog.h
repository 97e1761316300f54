#pragma once

#include "PlantType.h"
#include <array>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace GardenSim {

/**
 * Growth/range effect of each tool tier, indexed by tier 0 (Basic) to 3 (Diamond).
 */
struct ToolTierTable {
    std::array<double, MAX_TOOL_LEVEL + 1> fertilizer_multipliers = { { 1.0, 2.0, 10.0, 100.0 } };
    std::array<int, MAX_TOOL_LEVEL + 1> hoe_ranges = { { 2, 8, 20, 100 } };
    std::array<int, MAX_TOOL_LEVEL + 1> shovel_ranges = { { 1, 4, 8, 15 } };
};

// Authoring input for a seed entry; the sell value is derived at build time.
struct PlantDefinition {
    std::string name;
    double seed_cost = 0.0;
    double growth_time = 0.0;
    Color color;
    Color fruit_color;
    Footprint footprint;
    Tier tier = Tier::COMMON;
};

// Authoring input for a tool tier upgrade (level 1..3).
struct ToolDefinition {
    std::string name;
    double cost = 0.0;
    ToolKind kind = ToolKind::FERTILIZER;
    int level = 1;
    Color color;
};

/**
 * Static definition of every plantable and purchasable item.
 *
 * Built once at startup, validated on construction, immutable afterwards.
 * Construction throws ConfigError for any authoring mistake (unknown sell
 * value, star footprint on a non-3x3 box, duplicate names, ...).
 * PlantType pointers handed out stay valid for the Catalog's lifetime.
 */
class Catalog {
public:
    Catalog(
        const std::vector<PlantDefinition>& plants,
        const std::vector<ToolDefinition>& tools,
        const ToolTierTable& tiers = ToolTierTable{});

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;
    Catalog(Catalog&&) = default;
    Catalog& operator=(Catalog&&) = default;

    // Stock catalog: common, rare, mythic and legendary seeds plus tools.
    static Catalog createDefault();

    static Catalog fromJson(const nlohmann::json& j);

    // @throws ConfigError when the file is missing, malformed or invalid.
    static Catalog loadFromFile(const std::string& path);

    // Null when no item has this name.
    const PlantType* find(const std::string& name) const;

    // @throws std::out_of_range when no item has this name.
    const PlantType& at(const std::string& name) const;

    const PlantType* findTool(ToolKind kind, int level) const;

    // All entries in shop order (category, then authoring order).
    const std::vector<PlantType>& getItems() const { return items_; }

    std::vector<const PlantType*> getItemsInTier(Tier tier) const;

    const ToolTierTable& getToolTiers() const { return tiers_; }

    size_t size() const { return items_.size(); }

    nlohmann::json toJson() const;

private:
    void addPlant(const PlantDefinition& def);
    void addTool(const ToolDefinition& def);
    void validateTiers() const;

    std::vector<PlantType> items_;
    std::unordered_map<std::string, size_t> index_;
    ToolTierTable tiers_;
};

std::vector<PlantDefinition> getDefaultPlantDefinitions();
std::vector<ToolDefinition> getDefaultToolDefinitions();

} // namespace GardenSim
