#pragma once

#include "ProgressionState.h"
#include "core/Errors.h"
#include "core/plants/Catalog.h"
#include <string>

namespace GardenSim {

/**
 * Buy and sell transactions against a ProgressionState.
 *
 * Every operation either succeeds completely or returns a TransactionError
 * with the state untouched. Sell-area gating is applied by the world, not
 * here.
 */
class Shop {
public:
    explicit Shop(const Catalog& catalog) : catalog_(catalog) {}

    /**
     * Buy quantity seeds, or one tool tier when itemName names a tool
     * (quantity is ignored for tools).
     */
    CommandResult buy(ProgressionState& state, const std::string& itemName, int quantity = 1) const;

    /**
     * Advance a tool to level. Requires the current level to be level - 1.
     */
    CommandResult buyToolTier(ProgressionState& state, ToolKind kind, int level) const;

    // @return Money earned.
    Result<double, TransactionError> sell(
        ProgressionState& state, const std::string& itemName, int quantity = 1) const;

    /**
     * Sell every harvested item the catalog knows, iterating a snapshot of
     * the holdings. Unknown names are left in place.
     * @return Money earned.
     */
    Result<double, TransactionError> sellAll(ProgressionState& state) const;

private:
    const Catalog& catalog_;
};

} // namespace GardenSim
