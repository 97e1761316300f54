#pragma once

#include <stdexcept>
#include <string>
#include <variant>

#include "Result.h"

namespace GardenSim {

/**
 * Fatal configuration problem (bad catalog entry, unreadable settings file).
 * Raised while building immutable configuration; the host must refuse to run.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

enum class FailureReason {
    InsufficientFunds,
    TierAlreadyOwned,
    TierOutOfOrder,
    NoPlantingSpot,
    NoSeeds,
    NothingToHarvest,
    UnknownItem,
    InsufficientItems,
    InvalidQuantity,
    NotInSellArea,
    NothingToSell,
    Blocked
};

const char* getFailureReasonName(FailureReason reason);

/**
 * Recoverable failure of a player transaction. Nothing was mutated.
 */
struct TransactionError {
    FailureReason reason = FailureReason::UnknownItem;
    std::string message;

    TransactionError() = default;
    TransactionError(FailureReason r, std::string msg) : reason(r), message(std::move(msg)) {}
};

using OkayType = std::monostate;
using CommandResult = Result<OkayType, TransactionError>;

} // namespace GardenSim
