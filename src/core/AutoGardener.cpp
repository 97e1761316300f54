#include "AutoGardener.h"
#include "GardenWorld.h"
#include "LoggingChannels.h"
#include <algorithm>
#include <array>
#include <limits>

namespace GardenSim {

namespace {

constexpr int MAX_SEEDS_PER_TRIP = 8;

int sign(int v)
{
    return (v > 0) - (v < 0);
}

} // namespace

static const std::array<const char*, 8> PHASE_NAMES = {
    { "buy", "go_to_field", "plant", "wait", "harvest", "go_to_market", "sell", "idle" }
};

const char* getPhaseName(AutoGardener::Phase phase)
{
    return PHASE_NAMES[static_cast<size_t>(phase)];
}

AutoGardener::AutoGardener(GardenWorld& world)
    : world_(world), field_tile_(findFieldTile(world)), market_tile_(world.getGrid().getCenter())
{
    if (!field_tile_) {
        LoggingChannels::world()->warn("AutoGardener: No tillable land on this map");
        phase_ = Phase::IDLE;
        return;
    }

    LoggingChannels::world()->info(
        "AutoGardener: Field at {}, market at {}",
        field_tile_->toString(),
        market_tile_.toString());
}

std::optional<Vector2i> AutoGardener::findFieldTile(const GardenWorld& world)
{
    const TileGrid& grid = world.getGrid();
    const Vector2i center = grid.getCenter();
    const int maxRadius = std::max(grid.getWidth(), grid.getHeight());

    for (int r = 0; r <= maxRadius; ++r) {
        for (int dy = -r; dy <= r; ++dy) {
            for (int dx = -r; dx <= r; ++dx) {
                const Vector2i offset{ dx, dy };
                if (offset.chebyshev() != r) continue;

                const Vector2i tile = center + offset;
                if (grid.isTillable(tile)) {
                    return tile;
                }
            }
        }
    }
    return std::nullopt;
}

void AutoGardener::setPhase(Phase phase)
{
    if (phase == phase_) return;

    LoggingChannels::world()->debug(
        "AutoGardener: {} -> {}", getPhaseName(phase_), getPhaseName(phase));
    phase_ = phase;
}

void AutoGardener::tick()
{
    switch (phase_) {
        case Phase::BUY:
            buySeeds();
            break;
        case Phase::GO_TO_FIELD:
            if (stepToward(*field_tile_)) setPhase(Phase::PLANT);
            break;
        case Phase::PLANT:
            plantAll();
            break;
        case Phase::WAIT: {
            const FieldIndex& field = world_.getField();
            if (field.count() == 0) {
                setPhase(Phase::GO_TO_MARKET);
            }
            else if (field.countHarvestable() == field.count()) {
                setPhase(Phase::HARVEST);
            }
            break;
        }
        case Phase::HARVEST:
            harvestNearest();
            break;
        case Phase::GO_TO_MARKET:
            if (stepToward(market_tile_)) setPhase(Phase::SELL);
            break;
        case Phase::SELL:
            sell();
            break;
        case Phase::IDLE:
            break;
    }
}

void AutoGardener::buySeeds()
{
    const ProgressionState& progression = world_.getProgression();
    const PlantType* best = nullptr;

    for (const PlantType* type : world_.getCatalog().getItemsInTier(Tier::COMMON)) {
        if (type->seed_cost > progression.getMoney()) continue;
        if (!best || type->seed_cost > best->seed_cost) {
            best = type;
        }
    }

    if (best) {
        const int quantity = std::min(
            MAX_SEEDS_PER_TRIP, static_cast<int>(progression.getMoney() / best->seed_cost));
        auto result = world_.buy(best->name, quantity);
        if (result.isError()) {
            LoggingChannels::world()->warn(
                "AutoGardener: Buy failed: {}", result.errorValue().message);
        }
    }

    if (progression.seeds().empty()) {
        // Broke with nothing growing or held: nothing left to do.
        if (world_.getField().count() == 0 && progression.items().empty()) {
            setPhase(Phase::IDLE);
        }
        else {
            setPhase(Phase::GO_TO_FIELD);
        }
        return;
    }
    setPhase(Phase::GO_TO_FIELD);
}

void AutoGardener::plantAll()
{
    while (!world_.getProgression().seeds().empty()) {
        auto result = world_.plantAtPlayer();
        if (result.isError()) {
            LoggingChannels::world()->debug(
                "AutoGardener: Stopped planting: {}", result.errorValue().message);
            break;
        }
    }
    setPhase(Phase::WAIT);
}

void AutoGardener::harvestNearest()
{
    const Vector2i& player = world_.getPlayerTile();
    const int range = world_.getProgression().getHarvestRange();

    std::optional<Vector2i> nearest;
    int bestDistance = std::numeric_limits<int>::max();
    for (const auto& [id, cultivar] : world_.getField().getCultivars()) {
        if (!cultivar.isHarvestable()) continue;
        for (const auto& tile : cultivar.occupiedTiles()) {
            const int d = (tile - player).magnitudeSquared();
            if (d < bestDistance) {
                bestDistance = d;
                nearest = tile;
            }
        }
    }

    if (!nearest) {
        setPhase(world_.getField().count() == 0 ? Phase::GO_TO_MARKET : Phase::WAIT);
        return;
    }

    if (bestDistance <= range * range) {
        auto result = world_.harvestAtPlayer();
        if (result.isValue()) {
            harvested_ += result.value();
        }
        return;
    }
    stepToward(*nearest);
}

void AutoGardener::sell()
{
    if (!world_.getProgression().items().empty()) {
        auto result = world_.sellAll();
        if (result.isValue()) {
            earned_ += result.value();
        }
    }
    setPhase(Phase::BUY);
}

bool AutoGardener::stepToward(const Vector2i& target)
{
    const Vector2i& here = world_.getPlayerTile();
    if (here == target) return true;

    const TileGrid& grid = world_.getGrid();
    const Vector2i alongX{ here.x + sign(target.x - here.x), here.y };
    const Vector2i alongY{ here.x, here.y + sign(target.y - here.y) };

    Vector2i next = target; // Water in the way on both axes: teleport.
    if (alongX != here && grid.isWalkable(alongX)) {
        next = alongX;
    }
    else if (alongY != here && grid.isWalkable(alongY)) {
        next = alongY;
    }

    auto result = world_.setPlayerTile(next);
    if (result.isError()) {
        LoggingChannels::world()->warn(
            "AutoGardener: Cannot move to {}: {}", next.toString(), result.errorValue().message);
    }
    return world_.getPlayerTile() == target;
}

} // namespace GardenSim
