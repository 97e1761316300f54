#pragma once

#include "ItemCounts.h"
#include "core/plants/Catalog.h"
#include <array>
#include <nlohmann/json.hpp>

namespace GardenSim {

/**
 * Player economy: wallet, seed and harvested-item counts, and the three tool
 * tiers. Tiers range 0 (Basic) to MAX_TOOL_LEVEL; ordering rules are the
 * Shop's concern, not this class's.
 */
class ProgressionState {
public:
    ProgressionState(double startingMoney, const ToolTierTable& tiers);

    double getMoney() const { return money_; }
    void credit(double amount);

    // False (and unchanged) when the wallet cannot cover amount.
    bool debit(double amount);

    ItemCounts& seeds() { return seeds_; }
    const ItemCounts& seeds() const { return seeds_; }
    ItemCounts& items() { return items_; }
    const ItemCounts& items() const { return items_; }

    int getToolLevel(ToolKind kind) const;
    void setToolLevel(ToolKind kind, int level);

    // Growth speed factor for the current fertilizer tier.
    double getFertilizerMultiplier() const;
    // Chebyshev search radius for planting, from the hoe tier.
    int getPlantingRange() const;
    // Circular harvest radius, from the shovel tier.
    int getHarvestRange() const;

private:
    double money_;
    ItemCounts seeds_;
    ItemCounts items_;
    std::array<int, TOOL_KIND_COUNT> tool_levels_ = { { 0, 0, 0 } };
    ToolTierTable tiers_;
};

void to_json(nlohmann::json& j, const ProgressionState& state);

} // namespace GardenSim
