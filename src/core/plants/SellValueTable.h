#pragma once

#include <optional>
#include <utility>
#include <vector>

namespace GardenSim {

/**
 * Fixed (seed cost -> sell value) pairs, in authoring order.
 *
 * This is a discrete lookup, not a formula. Two costs ($500 and $5,000) are
 * listed twice; lookupSellValue() resolves them to the later entry.
 */
const std::vector<std::pair<double, double>>& getSellValueTable();

/**
 * Sell value for an exact seed cost, or nullopt when the cost is not listed.
 * Callers building a catalog must treat nullopt as a configuration error.
 */
std::optional<double> lookupSellValue(double seedCost);

} // namespace GardenSim
