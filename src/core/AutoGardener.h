#pragma once

#include "Vector2.h"
#include <cstdint>
#include <optional>

namespace GardenSim {

class GardenWorld;

/**
 * Scripted player for headless runs: buy seeds at the market, walk to the
 * nearest tillable land, plant, wait, harvest, walk back and sell.
 *
 * One decision per tick(); the host interleaves ticks with world steps.
 */
class AutoGardener {
public:
    enum class Phase : uint8_t {
        BUY,
        GO_TO_FIELD,
        PLANT,
        WAIT,
        HARVEST,
        GO_TO_MARKET,
        SELL,
        IDLE // No tillable land reachable.
    };

    explicit AutoGardener(GardenWorld& world);

    void tick();

    Phase getPhase() const { return phase_; }
    const std::optional<Vector2i>& getFieldTile() const { return field_tile_; }
    int getHarvestedCount() const { return harvested_; }
    double getEarned() const { return earned_; }

    // Nearest tillable tile to the map center, by Chebyshev ring.
    static std::optional<Vector2i> findFieldTile(const GardenWorld& world);

private:
    void buySeeds();
    void plantAll();
    void harvestNearest();
    void sell();

    // Move one tile toward target. @return true once standing on target.
    bool stepToward(const Vector2i& target);

    void setPhase(Phase phase);

    GardenWorld& world_;
    Phase phase_ = Phase::BUY;
    std::optional<Vector2i> field_tile_;
    Vector2i market_tile_;
    int harvested_ = 0;
    double earned_ = 0.0;
};

const char* getPhaseName(AutoGardener::Phase phase);

} // namespace GardenSim
