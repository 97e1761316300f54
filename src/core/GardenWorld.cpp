#include "GardenWorld.h"
#include "LoggingChannels.h"
#include "plants/Cultivar.h"
#include <utility>

namespace GardenSim {

namespace {

uint32_t resolveSeed(uint32_t configured)
{
    if (configured != 0) {
        return configured;
    }
    std::random_device rd;
    return rd();
}

const GameSettings& validated(const GameSettings& settings)
{
    validateGameSettings(settings);
    return settings;
}

} // namespace

GardenWorld::GardenWorld(const GameSettings& settings, const Catalog& catalog)
    : GardenWorld(settings, catalog, TileGrid::generate(settings.map_width, settings.map_height))
{}

GardenWorld::GardenWorld(const GameSettings& settings, const Catalog& catalog, TileGrid grid)
    : settings_(validated(settings)),
      catalog_(catalog),
      grid_(std::move(grid)),
      progression_(settings.starting_money, catalog.getToolTiers()),
      environment_(settings),
      shop_(catalog),
      rng_(resolveSeed(settings.rng_seed)),
      player_tile_(grid_.getCenter())
{
    if (!grid_.isWalkable(player_tile_)) {
        throw ConfigError("map center " + player_tile_.toString() + " is not walkable");
    }

    LoggingChannels::world()->info(
        "GardenWorld: {}x{} map, player at {}, wallet ${:.2f}, {} catalog entries",
        grid_.getWidth(),
        grid_.getHeight(),
        player_tile_.toString(),
        progression_.getMoney(),
        catalog_.size());
}

// =================================================================
// TIME
// =================================================================

void GardenWorld::step(double dt)
{
    if (dt <= 0.0) return;

    elapsed_ += dt;
    environment_.update(dt, rng_);
    field_.advanceAll(
        dt, environment_.getGrowthMultiplier(), progression_.getFertilizerMultiplier(), grid_);

    if (advisory_remaining_ > 0.0) {
        advisory_remaining_ -= dt;
        if (advisory_remaining_ <= 0.0) {
            advisory_remaining_ = 0.0;
            advisory_.clear();
        }
    }
}

// =================================================================
// COMMANDS
// =================================================================

template <typename T>
Result<T, TransactionError> GardenWorld::reject(TransactionError error)
{
    LoggingChannels::world()->debug(
        "GardenWorld: {} ({})", error.message, getFailureReasonName(error.reason));
    postAdvisory(error.message);
    return Result<T, TransactionError>::error(std::move(error));
}

void GardenWorld::postAdvisory(const std::string& message)
{
    advisory_ = message;
    advisory_remaining_ = settings_.advisory_seconds;
}

Result<CultivarId, TransactionError> GardenWorld::plantAtPlayer()
{
    auto seedName = progression_.seeds().first();
    if (!seedName) {
        return reject<CultivarId>({ FailureReason::NoSeeds, "No seeds in inventory!" });
    }

    const PlantType* type = catalog_.find(*seedName);
    if (!type || type->isTool()) {
        return reject<CultivarId>(
            { FailureReason::UnknownItem, "Cannot plant " + *seedName });
    }

    auto spot = field_.findPlantingSpot(
        grid_, player_tile_, type->footprint, progression_.getPlantingRange(), rng_);
    if (!spot) {
        return reject<CultivarId>({ FailureReason::NoPlantingSpot,
                                    "Error: Not enough space to place that seed here" });
    }

    const CultivarId id = field_.plant(grid_, *type, *spot);
    if (id == INVALID_CULTIVAR_ID) {
        return reject<CultivarId>({ FailureReason::NoPlantingSpot,
                                    "Error: Not enough space to place that seed here" });
    }

    progression_.seeds().remove(*seedName, 1);
    return Result<CultivarId, TransactionError>::okay(id);
}

Result<int, TransactionError> GardenWorld::harvestAtPlayer()
{
    const auto harvested = field_.harvestAt(player_tile_, progression_.getHarvestRange());
    if (harvested.empty()) {
        return reject<int>({ FailureReason::NothingToHarvest, "Nothing ready to harvest nearby" });
    }

    for (const PlantType* type : harvested) {
        if (!progression_.items().add(type->name, 1)) {
            LoggingChannels::world()->warn("GardenWorld: Item count for {} is full", type->name);
        }
    }
    return Result<int, TransactionError>::okay(static_cast<int>(harvested.size()));
}

CommandResult GardenWorld::buy(const std::string& itemName, int quantity)
{
    auto result = shop_.buy(progression_, itemName, quantity);
    if (result.isError()) {
        return reject<OkayType>(result.errorValue());
    }
    return result;
}

Result<double, TransactionError> GardenWorld::sell(const std::string& itemName, int quantity)
{
    if (!isPlayerInSellArea()) {
        return reject<double>({ FailureReason::NotInSellArea, "Go to the sell area to sell!" });
    }

    auto result = shop_.sell(progression_, itemName, quantity);
    if (result.isError()) {
        return reject<double>(result.errorValue());
    }
    return result;
}

Result<double, TransactionError> GardenWorld::sellAll()
{
    if (!isPlayerInSellArea()) {
        return reject<double>({ FailureReason::NotInSellArea, "Go to the sell area to sell!" });
    }

    auto result = shop_.sellAll(progression_);
    if (result.isError()) {
        return reject<double>(result.errorValue());
    }
    return result;
}

CommandResult GardenWorld::movePlayer(int dx, int dy)
{
    return setPlayerTile({ player_tile_.x + dx, player_tile_.y + dy });
}

CommandResult GardenWorld::setPlayerTile(const Vector2i& tile)
{
    if (!grid_.isWalkable(tile)) {
        return reject<OkayType>({ FailureReason::Blocked, "Can't walk there" });
    }

    player_tile_ = tile;
    LoggingChannels::world()->trace("GardenWorld: Player at {}", tile.toString());
    return CommandResult::okay();
}

// =================================================================
// QUERIES
// =================================================================

double GardenWorld::getEffectiveGrowthRate(const Vector2i& tile) const
{
    const TileKind kind = grid_.kindAt(tile).value_or(TileKind::GRASS);
    return environment_.getGrowthMultiplier() * progression_.getFertilizerMultiplier()
        * soilMultiplier(kind);
}

nlohmann::json GardenWorld::statusJson() const
{
    return nlohmann::json{ { "elapsed", elapsed_ },
                           { "player", player_tile_ },
                           { "in_sell_area", isPlayerInSellArea() },
                           { "progression", progression_ },
                           { "environment", environment_ },
                           { "cultivars", field_.count() },
                           { "harvestable", field_.countHarvestable() },
                           { "advisory", advisory_ } };
}

} // namespace GardenSim
