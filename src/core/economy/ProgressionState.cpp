#include "ProgressionState.h"
#include <algorithm>
#include <stdexcept>

namespace GardenSim {

ProgressionState::ProgressionState(double startingMoney, const ToolTierTable& tiers)
    : money_(std::max(0.0, startingMoney)), tiers_(tiers)
{}

void ProgressionState::credit(double amount)
{
    if (amount > 0.0) {
        money_ += amount;
    }
}

bool ProgressionState::debit(double amount)
{
    if (amount < 0.0 || money_ < amount) {
        return false;
    }
    money_ -= amount;
    return true;
}

int ProgressionState::getToolLevel(ToolKind kind) const
{
    return tool_levels_[static_cast<size_t>(kind)];
}

void ProgressionState::setToolLevel(ToolKind kind, int level)
{
    if (level < 0 || level > MAX_TOOL_LEVEL) {
        throw std::out_of_range("tool level out of range");
    }
    tool_levels_[static_cast<size_t>(kind)] = level;
}

double ProgressionState::getFertilizerMultiplier() const
{
    return tiers_.fertilizer_multipliers[static_cast<size_t>(getToolLevel(ToolKind::FERTILIZER))];
}

int ProgressionState::getPlantingRange() const
{
    return tiers_.hoe_ranges[static_cast<size_t>(getToolLevel(ToolKind::HOE))];
}

int ProgressionState::getHarvestRange() const
{
    return tiers_.shovel_ranges[static_cast<size_t>(getToolLevel(ToolKind::SHOVEL))];
}

void to_json(nlohmann::json& j, const ProgressionState& state)
{
    nlohmann::json tools = nlohmann::json::object();
    for (int k = 0; k < TOOL_KIND_COUNT; ++k) {
        const auto kind = static_cast<ToolKind>(k);
        tools[getToolKindName(kind)] = {
            { "level", state.getToolLevel(kind) },
            { "name", getToolLevelName(state.getToolLevel(kind)) },
        };
    }

    j = nlohmann::json{ { "money", state.getMoney() },
                        { "seeds", state.seeds() },
                        { "items", state.items() },
                        { "tools", tools },
                        { "fertilizer_multiplier", state.getFertilizerMultiplier() },
                        { "planting_range", state.getPlantingRange() },
                        { "harvest_range", state.getHarvestRange() } };
}

} // namespace GardenSim
