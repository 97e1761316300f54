#pragma once

#include "Vector2.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace GardenSim {

/**
 * \file
 * Static terrain of the garden map. Generated once, immutable afterwards.
 */

enum class TileKind : uint8_t {
    WATER = 0,
    SOIL,
    GRASS,
    STONE,
    SELL_AREA
};

const char* getTileKindName(TileKind kind);

class TileGrid {
public:
    // Width of the water ring around the map edge.
    static constexpr int WATER_BORDER = 8;
    // Sell area is the (2*SELL_AREA_HALF_SIZE+1)^2 block at the map center.
    static constexpr int SELL_AREA_HALF_SIZE = 2;

    /**
     * Generate terrain deterministically from a smooth noise function of
     * (x, y), a water border, and a central sell-area block.
     */
    static TileGrid generate(int width, int height);

    /**
     * Build a grid from explicit rows (rows[y][x]); for tests and custom maps.
     */
    static TileGrid fromRows(const std::vector<std::vector<TileKind>>& rows);

    /**
     * Classify a single coordinate with the generation rules. Pure.
     */
    static TileKind classify(int x, int y, int width, int height);

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    Vector2i getCenter() const { return { width_ / 2, height_ / 2 }; }

    bool inBounds(int x, int y) const
    {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
    bool inBounds(const Vector2i& tile) const { return inBounds(tile.x, tile.y); }

    // Empty when (x, y) is outside the grid.
    std::optional<TileKind> kindAt(int x, int y) const;
    std::optional<TileKind> kindAt(const Vector2i& tile) const { return kindAt(tile.x, tile.y); }

    // Out-of-bounds coordinates are neither walkable, tillable nor sell area.
    bool isWalkable(int x, int y) const;
    bool isTillable(int x, int y) const;
    bool isSellArea(int x, int y) const;

    bool isWalkable(const Vector2i& tile) const { return isWalkable(tile.x, tile.y); }
    bool isTillable(const Vector2i& tile) const { return isTillable(tile.x, tile.y); }
    bool isSellArea(const Vector2i& tile) const { return isSellArea(tile.x, tile.y); }

private:
    TileGrid(int width, int height, std::vector<TileKind> tiles);

    int width_ = 0;
    int height_ = 0;
    std::vector<TileKind> tiles_; // Flat array: tiles_[y * width_ + x]
};

void to_json(nlohmann::json& j, TileKind kind);

} // namespace GardenSim
