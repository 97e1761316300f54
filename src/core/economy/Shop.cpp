#include "Shop.h"
#include "core/LoggingChannels.h"
#include <cstdint>
#include <spdlog/fmt/fmt.h>

namespace GardenSim {

namespace {

CommandResult fail(FailureReason reason, std::string message)
{
    return CommandResult::error(TransactionError(reason, std::move(message)));
}

Result<double, TransactionError> failSale(FailureReason reason, std::string message)
{
    return Result<double, TransactionError>::error(TransactionError(reason, std::move(message)));
}

} // namespace

CommandResult Shop::buy(ProgressionState& state, const std::string& itemName, int quantity) const
{
    const PlantType* type = catalog_.find(itemName);
    if (!type) {
        LoggingChannels::economy()->warn("Shop: Unknown item '{}'", itemName);
        return fail(FailureReason::UnknownItem, "Unknown item: " + itemName);
    }

    if (type->isTool()) {
        return buyToolTier(state, *type->tool, type->tool_level);
    }

    if (quantity <= 0) {
        return fail(FailureReason::InvalidQuantity, "Quantity must be positive");
    }
    if (!state.seeds().canAdd(itemName, quantity)) {
        return fail(
            FailureReason::InvalidQuantity,
            fmt::format("Cannot hold {} more {}", quantity, itemName));
    }

    const double cost = type->seed_cost * quantity;
    if (!state.debit(cost)) {
        LoggingChannels::economy()->debug(
            "Shop: Cannot afford {} x{} (${:.2f} > ${:.2f})",
            itemName,
            quantity,
            cost,
            state.getMoney());
        return fail(
            FailureReason::InsufficientFunds,
            fmt::format("Not enough money! Need ${:.2f}", cost));
    }

    state.seeds().add(itemName, quantity);
    LoggingChannels::economy()->info(
        "Shop: Bought {} x{} for ${:.2f} (wallet ${:.2f})",
        itemName,
        quantity,
        cost,
        state.getMoney());
    return CommandResult::okay();
}

CommandResult Shop::buyToolTier(ProgressionState& state, ToolKind kind, int level) const
{
    const PlantType* tool = catalog_.findTool(kind, level);
    if (!tool) {
        LoggingChannels::economy()->warn(
            "Shop: No {} tool at level {}", getToolKindName(kind), level);
        return fail(
            FailureReason::UnknownItem,
            fmt::format("Unknown {} level {}", getToolKindName(kind), level));
    }

    const int current = state.getToolLevel(kind);
    if (current >= level) {
        return fail(FailureReason::TierAlreadyOwned, "You already own " + tool->name + "!");
    }
    if (current != level - 1) {
        return fail(FailureReason::TierOutOfOrder, "Cannot purchase this item yet!");
    }
    if (!state.debit(tool->seed_cost)) {
        return fail(
            FailureReason::InsufficientFunds,
            fmt::format("Not enough money! Need ${:.2f}", tool->seed_cost));
    }

    state.setToolLevel(kind, level);
    LoggingChannels::economy()->info(
        "Shop: Upgraded {} to {} for ${:.2f}",
        getToolKindName(kind),
        getToolLevelName(level),
        tool->seed_cost);
    return CommandResult::okay();
}

Result<double, TransactionError> Shop::sell(
    ProgressionState& state, const std::string& itemName, int quantity) const
{
    const PlantType* type = catalog_.find(itemName);
    if (!type || type->isTool()) {
        LoggingChannels::economy()->warn("Shop: Cannot sell unknown item '{}'", itemName);
        return failSale(FailureReason::UnknownItem, "Cannot sell " + itemName);
    }
    if (quantity <= 0) {
        return failSale(FailureReason::InvalidQuantity, "Quantity must be positive");
    }
    if (!state.items().remove(itemName, quantity)) {
        return failSale(
            FailureReason::InsufficientItems,
            fmt::format("Not enough {} to sell (have {})", itemName, state.items().count(itemName)));
    }

    const double earned = type->sell_value * quantity;
    state.credit(earned);
    LoggingChannels::economy()->info(
        "Shop: Sold {} x{} for ${:.2f}", itemName, quantity, earned);
    return Result<double, TransactionError>::okay(earned);
}

Result<double, TransactionError> Shop::sellAll(ProgressionState& state) const
{
    if (state.items().empty()) {
        return failSale(FailureReason::NothingToSell, "Nothing to sell!");
    }

    double earned = 0.0;
    int64_t sold = 0;
    for (const auto& [name, quantity] : state.items().snapshot()) {
        const PlantType* type = catalog_.find(name);
        if (!type || type->isTool()) continue;

        const double value = type->sell_value * quantity;
        earned += value;
        sold += quantity;
        state.credit(value);
        state.items().erase(name);
    }

    if (sold == 0) {
        return failSale(FailureReason::NothingToSell, "Nothing to sell!");
    }

    LoggingChannels::economy()->info("Shop: Sold {} items for ${:.2f}", sold, earned);
    return Result<double, TransactionError>::okay(earned);
}

} // namespace GardenSim
