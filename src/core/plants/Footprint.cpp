#include "Footprint.h"
#include <algorithm>
#include <array>

namespace GardenSim {

static const std::array<const char*, 4> SHAPE_NAMES = { { "rect", "circle", "star", "curved" } };

// Offsets relative to the origin of a 3x3 box.
static constexpr std::array<Vector2i, 7> STAR_OFFSETS = { { { 1, 0 },
                                                             { 0, 1 },
                                                             { 2, 1 },
                                                             { 0, 2 },
                                                             { 2, 2 },
                                                             { 1, 1 },
                                                             { 1, 2 } } };

const char* getFootprintShapeName(FootprintShape shape)
{
    return SHAPE_NAMES[static_cast<size_t>(shape)];
}

std::optional<FootprintShape> parseFootprintShape(const std::string& name)
{
    for (size_t i = 0; i < SHAPE_NAMES.size(); ++i) {
        if (name == SHAPE_NAMES[i]) {
            return static_cast<FootprintShape>(i);
        }
    }
    // Accept the long spelling as well.
    if (name == "rectangle") {
        return FootprintShape::RECT;
    }
    return std::nullopt;
}

std::vector<Vector2i> occupiedTiles(const Footprint& footprint, const Vector2i& origin)
{
    const int w = footprint.width;
    const int h = footprint.height;
    std::vector<Vector2i> tiles;

    switch (footprint.shape) {
        case FootprintShape::RECT:
            tiles.reserve(static_cast<size_t>(std::max(0, w * h)));
            for (int dy = 0; dy < h; ++dy) {
                for (int dx = 0; dx < w; ++dx) {
                    tiles.push_back({ origin.x + dx, origin.y + dy });
                }
            }
            break;

        case FootprintShape::CIRCLE: {
            const Vector2i center{ origin.x + w / 2, origin.y + h / 2 };
            const int radius = std::min(w, h) / 2;
            for (int dy = -radius; dy <= radius; ++dy) {
                for (int dx = -radius; dx <= radius; ++dx) {
                    if (dx * dx + dy * dy <= radius * radius) {
                        tiles.push_back({ center.x + dx, center.y + dy });
                    }
                }
            }
            break;
        }

        case FootprintShape::STAR:
            tiles.reserve(STAR_OFFSETS.size());
            for (const auto& offset : STAR_OFFSETS) {
                tiles.push_back(origin + offset);
            }
            break;

        case FootprintShape::CURVED:
            for (int dy = 0; dy < h; ++dy) {
                for (int dx = 0; dx < w; ++dx) {
                    const bool corner = (dx == 0 || dx == w - 1) && (dy == 0 || dy == h - 1);
                    if (!corner) {
                        tiles.push_back({ origin.x + dx, origin.y + dy });
                    }
                }
            }
            break;
    }

    return tiles;
}

} // namespace GardenSim
