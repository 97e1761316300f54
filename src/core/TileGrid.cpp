#include "TileGrid.h"
#include "Errors.h"
#include "LoggingChannels.h"
#include <array>
#include <cmath>
#include <cstdlib>

namespace GardenSim {

static const std::array<const char*, 5> TILE_KIND_NAMES = {
    { "water", "soil", "grass", "stone", "sell_area" }
};

const char* getTileKindName(TileKind kind)
{
    return TILE_KIND_NAMES[static_cast<size_t>(kind)];
}

void to_json(nlohmann::json& j, TileKind kind)
{
    j = getTileKindName(kind);
}

TileGrid::TileGrid(int width, int height, std::vector<TileKind> tiles)
    : width_(width), height_(height), tiles_(std::move(tiles))
{}

TileKind TileGrid::classify(int x, int y, int width, int height)
{
    if (x < WATER_BORDER || x >= width - WATER_BORDER || y < WATER_BORDER
        || y >= height - WATER_BORDER) {
        return TileKind::WATER;
    }

    const int center_x = width / 2;
    const int center_y = height / 2;
    if (std::abs(x - center_x) <= SELL_AREA_HALF_SIZE
        && std::abs(y - center_y) <= SELL_AREA_HALF_SIZE) {
        return TileKind::SELL_AREA;
    }

    const double noise =
        (std::sin(x * 0.1) + std::cos(y * 0.1) + std::sin(x * 0.05 + y * 0.05)) / 3.0;

    if (noise < -0.3) {
        return TileKind::WATER;
    }
    else if (noise < 0.1) {
        return TileKind::SOIL;
    }
    else if (noise < 0.5) {
        return TileKind::GRASS;
    }
    return TileKind::STONE;
}

TileGrid TileGrid::generate(int width, int height)
{
    if (width <= 0 || height <= 0) {
        throw ConfigError("TileGrid dimensions must be positive");
    }

    std::vector<TileKind> tiles;
    tiles.reserve(static_cast<size_t>(width) * height);

    std::array<int, 5> counts{};
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            TileKind kind = classify(x, y, width, height);
            counts[static_cast<size_t>(kind)]++;
            tiles.push_back(kind);
        }
    }

    LoggingChannels::world()->info(
        "TileGrid: generated {}x{} map (water={}, soil={}, grass={}, stone={}, sell={})",
        width,
        height,
        counts[0],
        counts[1],
        counts[2],
        counts[3],
        counts[4]);

    return TileGrid(width, height, std::move(tiles));
}

TileGrid TileGrid::fromRows(const std::vector<std::vector<TileKind>>& rows)
{
    if (rows.empty() || rows.front().empty()) {
        throw ConfigError("TileGrid rows must not be empty");
    }

    const int width = static_cast<int>(rows.front().size());
    const int height = static_cast<int>(rows.size());

    std::vector<TileKind> tiles;
    tiles.reserve(static_cast<size_t>(width) * height);
    for (const auto& row : rows) {
        if (static_cast<int>(row.size()) != width) {
            throw ConfigError("TileGrid rows must all have the same width");
        }
        tiles.insert(tiles.end(), row.begin(), row.end());
    }

    return TileGrid(width, height, std::move(tiles));
}

std::optional<TileKind> TileGrid::kindAt(int x, int y) const
{
    if (!inBounds(x, y)) {
        return std::nullopt;
    }
    return tiles_[static_cast<size_t>(y) * width_ + x];
}

bool TileGrid::isWalkable(int x, int y) const
{
    auto kind = kindAt(x, y);
    return kind.has_value() && *kind != TileKind::WATER;
}

bool TileGrid::isTillable(int x, int y) const
{
    auto kind = kindAt(x, y);
    return kind.has_value() && (*kind == TileKind::SOIL || *kind == TileKind::GRASS);
}

bool TileGrid::isSellArea(int x, int y) const
{
    auto kind = kindAt(x, y);
    return kind.has_value() && *kind == TileKind::SELL_AREA;
}

} // namespace GardenSim
