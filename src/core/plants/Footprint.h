#pragma once

#include "core/Vector2.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace GardenSim {

enum class FootprintShape : uint8_t {
    RECT,   // Every cell of the w x h box.
    CIRCLE, // Cells within radius min(w,h)/2 of the box center.
    STAR,   // Fixed 7-cell pattern. Only defined for a 3x3 box.
    CURVED  // The w x h box minus its four corners.
};

const char* getFootprintShapeName(FootprintShape shape);
std::optional<FootprintShape> parseFootprintShape(const std::string& name);

struct Footprint {
    int width = 1;
    int height = 1;
    FootprintShape shape = FootprintShape::RECT;

    bool operator==(const Footprint& other) const = default;
};

/**
 * Tiles covered by a footprint placed with its bounding box at origin.
 *
 * Pure; the same result drives placement validation, planting and harvest
 * removal. Catalog authors must only pair STAR with a 3x3 box; this function
 * does not check it. CIRCLE on an even-sized box may reach one cell past the
 * box on the right/bottom edge.
 */
std::vector<Vector2i> occupiedTiles(const Footprint& footprint, const Vector2i& origin);

} // namespace GardenSim
