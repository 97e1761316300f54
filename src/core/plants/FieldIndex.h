#pragma once

#include "Cultivar.h"
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace GardenSim {

class TileGrid;

/**
 * Owns every live cultivar and maps each occupied tile to its owner.
 *
 * A tile key is present iff a live cultivar's footprint covers it, and no
 * two cultivars share a tile. Placement is validated before a cultivar is
 * registered; harvest removes a cultivar from every tile it covers at once.
 */
class FieldIndex {
public:
    FieldIndex() = default;

    /**
     * True when every tile of the footprint at origin is in bounds,
     * tillable (soil or grass) and unclaimed.
     */
    bool canPlaceFootprint(
        const TileGrid& grid, const Footprint& footprint, const Vector2i& origin) const;

    /**
     * Expanding-ring search for a placement origin.
     *
     * Tries Chebyshev radius 0 (origin itself), then the perimeter of each
     * larger box up to maxRadius. Candidates within a ring are shuffled so
     * no direction is preferred.
     *
     * @return The first placeable origin, or nullopt when none exists.
     */
    std::optional<Vector2i> findPlantingSpot(
        const TileGrid& grid,
        const Vector2i& origin,
        const Footprint& footprint,
        int maxRadius,
        std::mt19937& rng) const;

    /**
     * Create a cultivar at origin and claim its footprint.
     * @return The new id, or INVALID_CULTIVAR_ID if the footprint cannot be placed.
     */
    CultivarId plant(const TileGrid& grid, const PlantType& type, const Vector2i& origin);

    /**
     * Harvest every harvestable cultivar touching the circular range around
     * center (dx^2 + dy^2 <= radius^2). Each cultivar is removed from all of
     * its tiles and reported once, in scan order.
     *
     * @return The types harvested, one entry per cultivar.
     */
    std::vector<const PlantType*> harvestAt(const Vector2i& center, int radius);

    void removeCultivar(CultivarId id);

    /**
     * Advance every live cultivar. The soil bonus is taken from the tile
     * kind at each cultivar's origin.
     * @return Number of cultivars whose stage changed.
     */
    int advanceAll(double dt, double weatherMult, double fertilizerMult, const TileGrid& grid);

    const Cultivar* getCultivar(CultivarId id) const;
    CultivarId getCultivarIdAt(const Vector2i& tile) const;
    const Cultivar* getCultivarAt(const Vector2i& tile) const;

    size_t count() const { return cultivars_.size(); }
    size_t countHarvestable() const;

    const std::unordered_map<CultivarId, Cultivar>& getCultivars() const { return cultivars_; }
    const std::unordered_map<Vector2i, CultivarId>& getTileIndex() const
    {
        return tile_to_cultivar_;
    }

private:
    std::unordered_map<CultivarId, Cultivar> cultivars_;
    std::unordered_map<Vector2i, CultivarId> tile_to_cultivar_;
    CultivarId next_cultivar_id_ = 1;
};

} // namespace GardenSim
