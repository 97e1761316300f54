#include "FieldIndex.h"
#include "core/LoggingChannels.h"
#include "core/TileGrid.h"
#include <algorithm>

namespace GardenSim {

namespace {

// Cells at exactly Chebyshev distance r from center.
std::vector<Vector2i> ringAt(const Vector2i& center, int r)
{
    if (r == 0) {
        return { center };
    }

    std::vector<Vector2i> ring;
    ring.reserve(static_cast<size_t>(8 * r));
    for (int dy = -r; dy <= r; ++dy) {
        for (int dx = -r; dx <= r; ++dx) {
            const Vector2i offset{ dx, dy };
            if (offset.chebyshev() == r) {
                ring.push_back(center + offset);
            }
        }
    }
    return ring;
}

} // namespace

bool FieldIndex::canPlaceFootprint(
    const TileGrid& grid, const Footprint& footprint, const Vector2i& origin) const
{
    const auto tiles = occupiedTiles(footprint, origin);
    if (tiles.empty()) {
        return false;
    }

    for (const auto& tile : tiles) {
        if (!grid.isTillable(tile)) {
            return false;
        }
        if (tile_to_cultivar_.count(tile)) {
            return false;
        }
    }
    return true;
}

std::optional<Vector2i> FieldIndex::findPlantingSpot(
    const TileGrid& grid,
    const Vector2i& origin,
    const Footprint& footprint,
    int maxRadius,
    std::mt19937& rng) const
{
    for (int radius = 0; radius <= maxRadius; ++radius) {
        auto candidates = ringAt(origin, radius);
        std::shuffle(candidates.begin(), candidates.end(), rng);

        for (const auto& candidate : candidates) {
            if (canPlaceFootprint(grid, footprint, candidate)) {
                LoggingChannels::field()->trace(
                    "FieldIndex: Found spot {} at ring {} from {}",
                    candidate.toString(),
                    radius,
                    origin.toString());
                return candidate;
            }
        }
    }

    LoggingChannels::field()->debug(
        "FieldIndex: No {}x{} spot within {} of {}",
        footprint.width,
        footprint.height,
        maxRadius,
        origin.toString());
    return std::nullopt;
}

CultivarId FieldIndex::plant(const TileGrid& grid, const PlantType& type, const Vector2i& origin)
{
    if (type.isTool()) {
        LoggingChannels::field()->warn("FieldIndex: Refusing to plant tool '{}'", type.name);
        return INVALID_CULTIVAR_ID;
    }
    if (!canPlaceFootprint(grid, type.footprint, origin)) {
        LoggingChannels::field()->warn(
            "FieldIndex: Cannot place '{}' at {}", type.name, origin.toString());
        return INVALID_CULTIVAR_ID;
    }

    CultivarId id = next_cultivar_id_++;
    Cultivar cultivar(id, type, origin);

    for (const auto& tile : cultivar.occupiedTiles()) {
        tile_to_cultivar_[tile] = id;
    }

    LoggingChannels::field()->info(
        "FieldIndex: Planted {} {} at {} ({} tiles)",
        type.name,
        id,
        origin.toString(),
        cultivar.occupiedTiles().size());

    cultivars_.emplace(id, std::move(cultivar));
    return id;
}

std::vector<const PlantType*> FieldIndex::harvestAt(const Vector2i& center, int radius)
{
    std::vector<CultivarId> found;

    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            if (dx * dx + dy * dy > radius * radius) continue;

            auto it = tile_to_cultivar_.find({ center.x + dx, center.y + dy });
            if (it == tile_to_cultivar_.end()) continue;

            const CultivarId id = it->second;
            if (std::find(found.begin(), found.end(), id) != found.end()) continue;

            if (cultivars_.at(id).isHarvestable()) {
                found.push_back(id);
            }
        }
    }

    std::vector<const PlantType*> harvested;
    harvested.reserve(found.size());
    for (CultivarId id : found) {
        harvested.push_back(&cultivars_.at(id).getType());
        removeCultivar(id);
    }

    if (!harvested.empty()) {
        LoggingChannels::field()->info(
            "FieldIndex: Harvested {} cultivars within {} of {}",
            harvested.size(),
            radius,
            center.toString());
    }
    return harvested;
}

void FieldIndex::removeCultivar(CultivarId id)
{
    auto it = cultivars_.find(id);
    if (it == cultivars_.end()) {
        LoggingChannels::field()->warn(
            "FieldIndex: Attempted to remove non-existent cultivar {}", id);
        return;
    }

    for (const auto& tile : it->second.occupiedTiles()) {
        tile_to_cultivar_.erase(tile);
    }
    cultivars_.erase(it);

    LoggingChannels::field()->debug("FieldIndex: Removed cultivar {}", id);
}

int FieldIndex::advanceAll(
    double dt, double weatherMult, double fertilizerMult, const TileGrid& grid)
{
    int changed = 0;
    for (auto& [id, cultivar] : cultivars_) {
        const TileKind kind = grid.kindAt(cultivar.getOrigin()).value_or(TileKind::GRASS);
        if (cultivar.advance(dt, weatherMult, fertilizerMult, kind)) {
            changed++;
        }
    }

    LoggingChannels::field()->trace(
        "FieldIndex: Advanced {} cultivars by {:.3f}s ({} stage changes)",
        cultivars_.size(),
        dt,
        changed);
    return changed;
}

const Cultivar* FieldIndex::getCultivar(CultivarId id) const
{
    auto it = cultivars_.find(id);
    return it != cultivars_.end() ? &it->second : nullptr;
}

CultivarId FieldIndex::getCultivarIdAt(const Vector2i& tile) const
{
    auto it = tile_to_cultivar_.find(tile);
    return it != tile_to_cultivar_.end() ? it->second : INVALID_CULTIVAR_ID;
}

const Cultivar* FieldIndex::getCultivarAt(const Vector2i& tile) const
{
    return getCultivar(getCultivarIdAt(tile));
}

size_t FieldIndex::countHarvestable() const
{
    return static_cast<size_t>(
        std::count_if(cultivars_.begin(), cultivars_.end(), [](const auto& entry) {
            return entry.second.isHarvestable();
        }));
}

} // namespace GardenSim
