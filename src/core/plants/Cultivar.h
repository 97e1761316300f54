#pragma once

#include "PlantType.h"
#include "core/TileGrid.h"
#include "core/Vector2.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

namespace GardenSim {

/**
 * Unique identifier for a planted cultivar.
 */
using CultivarId = uint32_t;

/**
 * Invalid cultivar ID sentinel value.
 */
constexpr CultivarId INVALID_CULTIVAR_ID = 0;

/**
 * Growth stages, ordered. A cultivar only ever moves forward through them.
 */
enum class GrowthStage : uint8_t {
    SEED,       // progress < 0.2
    SPROUT,     // progress >= 0.2
    YOUNG,      // progress >= 0.5
    MATURE,     // progress >= 0.8
    HARVESTABLE // remaining growth time reached 0.
};

const char* getGrowthStageName(GrowthStage stage);

// Stage for a progress fraction (1 - remaining / growth_time).
GrowthStage stageForProgress(double progress);

/**
 * One planted, growing or harvestable plant instance.
 *
 * Holds a non-owning pointer to its PlantType; the Catalog outlives every
 * cultivar. remaining_growth_time never increases.
 */
class Cultivar {
public:
    // Growth rate bonus for a cultivar whose origin sits on soil.
    static constexpr double SOIL_GROWTH_BONUS = 1.1;

    Cultivar(CultivarId id, const PlantType& type, const Vector2i& origin);

    /**
     * Advance growth by dt seconds of wall-clock time.
     *
     * Effective progress is dt * weatherMult * fertilizerMult * soil bonus.
     * No-op once harvestable, and for non-positive dt or rate.
     *
     * @return true if the stage changed.
     */
    bool advance(double dt, double weatherMult, double fertilizerMult, TileKind originKind);

    CultivarId getId() const { return id_; }
    const PlantType& getType() const { return *type_; }
    const Vector2i& getOrigin() const { return origin_; }
    double getRemainingGrowthTime() const { return remaining_; }
    GrowthStage getStage() const { return stage_; }

    bool isHarvestable() const { return stage_ == GrowthStage::HARVESTABLE; }

    // 0.0 at planting, 1.0 when harvestable.
    double getProgress() const;

    std::vector<Vector2i> occupiedTiles() const;

private:
    CultivarId id_;
    const PlantType* type_;
    Vector2i origin_;
    double remaining_;
    GrowthStage stage_ = GrowthStage::SEED;
};

// Multiplier the origin tile contributes to growth.
double soilMultiplier(TileKind kind);

void to_json(nlohmann::json& j, const Cultivar& cultivar);

} // namespace GardenSim
