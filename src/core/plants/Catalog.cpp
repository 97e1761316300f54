#include "Catalog.h"
#include "SellValueTable.h"
#include "core/Errors.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <fstream>
#include <spdlog/fmt/fmt.h>

namespace GardenSim {

namespace {

int tierOrder(Tier tier)
{
    return static_cast<int>(tier);
}

} // namespace

Catalog::Catalog(
    const std::vector<PlantDefinition>& plants,
    const std::vector<ToolDefinition>& tools,
    const ToolTierTable& tiers)
    : tiers_(tiers)
{
    items_.reserve(plants.size() + tools.size());

    // Shop order: category first, authoring order within a category.
    std::vector<PlantDefinition> ordered(plants.begin(), plants.end());
    std::stable_sort(
        ordered.begin(), ordered.end(), [](const PlantDefinition& a, const PlantDefinition& b) {
            return tierOrder(a.tier) < tierOrder(b.tier);
        });

    for (const auto& def : ordered) {
        addPlant(def);
    }
    for (const auto& def : tools) {
        addTool(def);
    }
    validateTiers();

    LoggingChannels::catalog()->info(
        "Catalog: built {} entries ({} seeds, {} tools)", items_.size(), plants.size(), tools.size());
}

void Catalog::addPlant(const PlantDefinition& def)
{
    if (def.name.empty()) {
        throw ConfigError("catalog entry with empty name");
    }
    if (index_.count(def.name)) {
        throw ConfigError("duplicate catalog entry: " + def.name);
    }
    if (def.tier == Tier::TOOL) {
        throw ConfigError("seed entry '" + def.name + "' declared with tool tier");
    }
    if (def.seed_cost <= 0.0) {
        throw ConfigError("seed entry '" + def.name + "' must have a positive cost");
    }
    if (def.growth_time <= 0.0) {
        throw ConfigError("seed entry '" + def.name + "' must have a positive growth time");
    }
    if (def.footprint.width < 1 || def.footprint.height < 1) {
        throw ConfigError("seed entry '" + def.name + "' has an empty footprint box");
    }
    if (def.footprint.shape == FootprintShape::STAR
        && (def.footprint.width != 3 || def.footprint.height != 3)) {
        throw ConfigError(fmt::format(
            "seed entry '{}' uses a star footprint on a {}x{} box (star requires 3x3)",
            def.name,
            def.footprint.width,
            def.footprint.height));
    }
    if (occupiedTiles(def.footprint, Vector2i{ 0, 0 }).empty()) {
        throw ConfigError("seed entry '" + def.name + "' footprint covers no tiles");
    }

    auto sellValue = lookupSellValue(def.seed_cost);
    if (!sellValue.has_value()) {
        throw ConfigError(fmt::format(
            "seed entry '{}' costs ${:.2f}, which has no sell value in the table",
            def.name,
            def.seed_cost));
    }

    PlantType type;
    type.name = def.name;
    type.seed_cost = def.seed_cost;
    type.sell_value = *sellValue;
    type.growth_time = def.growth_time;
    type.color = def.color;
    type.fruit_color = def.fruit_color;
    type.footprint = def.footprint;
    type.tier = def.tier;

    LoggingChannels::catalog()->debug(
        "Catalog: {} '{}' ${} -> ${} in {}s ({}x{} {})",
        getTierName(type.tier),
        type.name,
        type.seed_cost,
        type.sell_value,
        type.growth_time,
        type.footprint.width,
        type.footprint.height,
        getFootprintShapeName(type.footprint.shape));

    index_.emplace(type.name, items_.size());
    items_.push_back(std::move(type));
}

void Catalog::addTool(const ToolDefinition& def)
{
    if (def.name.empty()) {
        throw ConfigError("catalog entry with empty name");
    }
    if (index_.count(def.name)) {
        throw ConfigError("duplicate catalog entry: " + def.name);
    }
    if (def.level < 1 || def.level > MAX_TOOL_LEVEL) {
        throw ConfigError(fmt::format(
            "tool '{}' has level {} (must be 1..{})", def.name, def.level, MAX_TOOL_LEVEL));
    }
    if (def.cost <= 0.0) {
        throw ConfigError("tool '" + def.name + "' must have a positive cost");
    }
    if (findTool(def.kind, def.level)) {
        throw ConfigError(fmt::format(
            "tool '{}' duplicates {} level {}", def.name, getToolKindName(def.kind), def.level));
    }

    PlantType type;
    type.name = def.name;
    type.seed_cost = def.cost;
    type.color = def.color;
    type.fruit_color = def.color;
    type.tier = Tier::TOOL;
    type.tool = def.kind;
    type.tool_level = def.level;

    index_.emplace(type.name, items_.size());
    items_.push_back(std::move(type));
}

void Catalog::validateTiers() const
{
    for (double m : tiers_.fertilizer_multipliers) {
        if (m <= 0.0) throw ConfigError("fertilizer multipliers must be positive");
    }
    for (int r : tiers_.hoe_ranges) {
        if (r < 0) throw ConfigError("hoe ranges must not be negative");
    }
    for (int r : tiers_.shovel_ranges) {
        if (r < 0) throw ConfigError("shovel ranges must not be negative");
    }
}

const PlantType* Catalog::find(const std::string& name) const
{
    auto it = index_.find(name);
    return it != index_.end() ? &items_[it->second] : nullptr;
}

const PlantType& Catalog::at(const std::string& name) const
{
    const PlantType* type = find(name);
    if (!type) {
        throw std::out_of_range("no catalog entry named " + name);
    }
    return *type;
}

const PlantType* Catalog::findTool(ToolKind kind, int level) const
{
    for (const auto& item : items_) {
        if (item.isTool() && item.tool == kind && item.tool_level == level) {
            return &item;
        }
    }
    return nullptr;
}

std::vector<const PlantType*> Catalog::getItemsInTier(Tier tier) const
{
    std::vector<const PlantType*> result;
    for (const auto& item : items_) {
        if (item.tier == tier) {
            result.push_back(&item);
        }
    }
    return result;
}

nlohmann::json Catalog::toJson() const
{
    nlohmann::json plants = nlohmann::json::array();
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& item : items_) {
        if (item.isTool()) {
            tools.push_back({ { "name", item.name },
                              { "cost", item.seed_cost },
                              { "tool", getToolKindName(*item.tool) },
                              { "level", item.tool_level },
                              { "color", item.color } });
        }
        else {
            nlohmann::json entry = item;
            // Derived on load; never authored.
            entry.erase("sell_value");
            plants.push_back(entry);
        }
    }

    return nlohmann::json{ { "plants", plants },
                           { "tools", tools },
                           { "tool_tiers",
                             { { "fertilizer_multipliers", tiers_.fertilizer_multipliers },
                               { "hoe_ranges", tiers_.hoe_ranges },
                               { "shovel_ranges", tiers_.shovel_ranges } } } };
}

Catalog Catalog::fromJson(const nlohmann::json& j)
{
    std::vector<PlantDefinition> plants;
    std::vector<ToolDefinition> tools;
    ToolTierTable tiers;

    try {
        for (const auto& entry : j.at("plants")) {
            PlantDefinition def;
            def.name = entry.at("name").get<std::string>();
            def.seed_cost = entry.at("seed_cost").get<double>();
            def.growth_time = entry.at("growth_time").get<double>();
            def.color = entry.at("color").get<Color>();
            def.fruit_color = entry.contains("fruit_color") ? entry["fruit_color"].get<Color>()
                                                            : def.color;

            if (entry.contains("size")) {
                def.footprint.width = entry["size"].at(0).get<int>();
                def.footprint.height = entry["size"].at(1).get<int>();
            }

            const std::string shapeName = entry.value("shape", std::string("rect"));
            auto shape = parseFootprintShape(shapeName);
            if (!shape) {
                throw ConfigError("unknown footprint shape '" + shapeName + "' for " + def.name);
            }
            def.footprint.shape = *shape;

            const std::string tierName = entry.value("tier", std::string("common"));
            auto tier = parseTier(tierName);
            if (!tier) {
                throw ConfigError("unknown tier '" + tierName + "' for " + def.name);
            }
            def.tier = *tier;

            plants.push_back(std::move(def));
        }

        if (j.contains("tools")) {
            for (const auto& entry : j["tools"]) {
                ToolDefinition def;
                def.name = entry.at("name").get<std::string>();
                def.cost = entry.at("cost").get<double>();
                def.level = entry.at("level").get<int>();
                def.color = entry.contains("color") ? entry["color"].get<Color>() : Color{};

                const std::string kindName = entry.at("tool").get<std::string>();
                auto kind = parseToolKind(kindName);
                if (!kind) {
                    throw ConfigError("unknown tool kind '" + kindName + "' for " + def.name);
                }
                def.kind = *kind;

                tools.push_back(std::move(def));
            }
        }

        if (j.contains("tool_tiers")) {
            const auto& t = j["tool_tiers"];
            if (t.contains("fertilizer_multipliers")) {
                t["fertilizer_multipliers"].get_to(tiers.fertilizer_multipliers);
            }
            if (t.contains("hoe_ranges")) {
                t["hoe_ranges"].get_to(tiers.hoe_ranges);
            }
            if (t.contains("shovel_ranges")) {
                t["shovel_ranges"].get_to(tiers.shovel_ranges);
            }
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("malformed catalog: ") + e.what());
    }

    return Catalog(plants, tools, tiers);
}

Catalog Catalog::loadFromFile(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open catalog file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("failed to parse catalog file " + path + ": " + e.what());
    }

    LoggingChannels::catalog()->info("Catalog: loading from {}", path);
    return fromJson(j);
}

Catalog Catalog::createDefault()
{
    return Catalog(getDefaultPlantDefinitions(), getDefaultToolDefinitions());
}

} // namespace GardenSim
