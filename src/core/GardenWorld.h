#pragma once

#include "EnvironmentState.h"
#include "Errors.h"
#include "GameSettings.h"
#include "TileGrid.h"
#include "economy/ProgressionState.h"
#include "economy/Shop.h"
#include "plants/Catalog.h"
#include "plants/FieldIndex.h"

#include <nlohmann/json.hpp>
#include <random>
#include <string>

namespace GardenSim {

/**
 * The garden simulation: terrain, planted field, player economy and
 * environment behind one command/query surface.
 *
 * Single writer. step() is the only entry point that advances time; the
 * commands are player transactions that either succeed or leave every piece
 * of state untouched and post an advisory message.
 */
class GardenWorld {
public:
    /**
     * @param settings Validated on construction.
     * @param catalog Must outlive the world.
     * @throws ConfigError on invalid settings or a map whose center is not walkable.
     */
    GardenWorld(const GameSettings& settings, const Catalog& catalog);

    // Use a prebuilt map instead of generating one from the settings.
    GardenWorld(const GameSettings& settings, const Catalog& catalog, TileGrid grid);

    GardenWorld(const GardenWorld&) = delete;
    GardenWorld& operator=(const GardenWorld&) = delete;

    // =================================================================
    // TIME
    // =================================================================

    /**
     * Advance weather, day/night, every cultivar, and the advisory timer by
     * dt seconds of wall-clock time.
     */
    void step(double dt);

    // =================================================================
    // COMMANDS
    // =================================================================

    // Plant the first seed in inventory near the player.
    Result<CultivarId, TransactionError> plantAtPlayer();

    // @return Number of cultivars harvested.
    Result<int, TransactionError> harvestAtPlayer();

    CommandResult buy(const std::string& itemName, int quantity = 1);

    // Both sales require the player to stand in the sell area.
    Result<double, TransactionError> sell(const std::string& itemName, int quantity = 1);
    Result<double, TransactionError> sellAll();

    CommandResult movePlayer(int dx, int dy);
    CommandResult setPlayerTile(const Vector2i& tile);

    // =================================================================
    // QUERIES
    // =================================================================

    const GameSettings& getSettings() const { return settings_; }
    const Catalog& getCatalog() const { return catalog_; }
    const TileGrid& getGrid() const { return grid_; }
    const FieldIndex& getField() const { return field_; }
    const ProgressionState& getProgression() const { return progression_; }
    const EnvironmentState& getEnvironment() const { return environment_; }

    // Hosts and tests may force the weather or grant money directly.
    EnvironmentState& getEnvironment() { return environment_; }
    ProgressionState& getProgression() { return progression_; }

    const Vector2i& getPlayerTile() const { return player_tile_; }
    bool isPlayerInSellArea() const { return grid_.isSellArea(player_tile_); }

    // Empty once the advisory has expired.
    const std::string& getAdvisory() const { return advisory_; }

    // weather x fertilizer x soil bonus for a cultivar rooted at tile.
    double getEffectiveGrowthRate(const Vector2i& tile) const;

    double getElapsedSeconds() const { return elapsed_; }

    nlohmann::json statusJson() const;

private:
    template <typename T>
    Result<T, TransactionError> reject(TransactionError error);

    void postAdvisory(const std::string& message);

    GameSettings settings_;
    const Catalog& catalog_;
    TileGrid grid_;
    FieldIndex field_;
    ProgressionState progression_;
    EnvironmentState environment_;
    Shop shop_;
    std::mt19937 rng_;

    Vector2i player_tile_;
    std::string advisory_;
    double advisory_remaining_ = 0.0;
    double elapsed_ = 0.0;
};

} // namespace GardenSim
