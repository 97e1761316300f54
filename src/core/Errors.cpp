#include "Errors.h"

namespace GardenSim {

const char* getFailureReasonName(FailureReason reason)
{
    switch (reason) {
        case FailureReason::InsufficientFunds:
            return "insufficient_funds";
        case FailureReason::TierAlreadyOwned:
            return "tier_already_owned";
        case FailureReason::TierOutOfOrder:
            return "tier_out_of_order";
        case FailureReason::NoPlantingSpot:
            return "no_planting_spot";
        case FailureReason::NoSeeds:
            return "no_seeds";
        case FailureReason::NothingToHarvest:
            return "nothing_to_harvest";
        case FailureReason::UnknownItem:
            return "unknown_item";
        case FailureReason::InsufficientItems:
            return "insufficient_items";
        case FailureReason::InvalidQuantity:
            return "invalid_quantity";
        case FailureReason::NotInSellArea:
            return "not_in_sell_area";
        case FailureReason::NothingToSell:
            return "nothing_to_sell";
        case FailureReason::Blocked:
            return "blocked";
    }
    return "unknown";
}

} // namespace GardenSim
