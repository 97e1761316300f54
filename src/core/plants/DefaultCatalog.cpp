#include "Catalog.h"

namespace GardenSim {

namespace {

constexpr Color TRUNK{ 139, 69, 19 };
constexpr Color IRON{ 128, 128, 128 };
constexpr Color GOLD{ 255, 215, 0 };
constexpr Color DIAMOND{ 185, 242, 255 };

PlantDefinition seed(
    Tier tier,
    const char* name,
    double cost,
    double time,
    Color color,
    Color fruit,
    int w = 1,
    int h = 1,
    FootprintShape shape = FootprintShape::RECT)
{
    return PlantDefinition{ name, cost, time, color, fruit, Footprint{ w, h, shape }, tier };
}

PlantDefinition common(const char* name, double cost, double time, Color color)
{
    return seed(Tier::COMMON, name, cost, time, color, color);
}

PlantDefinition common(const char* name, double cost, double time, Color color, Color fruit)
{
    return seed(Tier::COMMON, name, cost, time, color, fruit);
}

} // namespace

std::vector<PlantDefinition> getDefaultPlantDefinitions()
{
    using S = FootprintShape;
    const Tier R = Tier::RARE;
    const Tier M = Tier::MYTHIC;
    const Tier L = Tier::LEGENDARY;

    return {
        // Common seeds, all single tile.
        common("Radish", 1, 5, { 255, 100, 100 }),
        common("Lettuce", 2, 6, { 100, 255, 100 }),
        common("Spinach", 3, 4, { 50, 200, 50 }),
        common("Herbs", 5, 7, { 100, 150, 50 }),
        common("Green Onion", 8, 8, { 200, 255, 200 }),
        common("Carrot", 15, 15, { 255, 140, 0 }),
        common("Tomato", 20, 20, { 255, 0, 0 }, { 255, 50, 50 }),
        common("Potato", 25, 25, { 160, 82, 45 }),
        common("Corn", 30, 30, { 255, 255, 0 }, { 255, 255, 100 }),
        common("Broccoli", 35, 35, { 0, 128, 0 }),
        common("Cabbage", 40, 40, { 100, 200, 100 }),
        common("Pepper", 50, 45, { 255, 100, 0 }, { 255, 0, 0 }),
        common("Cucumber", 60, 50, { 0, 255, 100 }),
        common("Eggplant", 80, 60, { 128, 0, 128 }),
        common("Sunflower", 100, 70, { 255, 255, 0 }, { 255, 215, 0 }),
        common("Pumpkin", 120, 80, { 255, 165, 0 }),
        common("Strawberry", 150, 90, { 255, 192, 203 }, { 255, 0, 100 }),
        common("Blueberry", 180, 100, { 100, 149, 237 }, { 0, 0, 255 }),
        common("Apple Tree", 200, 120, TRUNK, { 255, 0, 0 }),
        common("Orange Tree", 250, 140, TRUNK, { 255, 165, 0 }),
        common("Cherry Tree", 280, 160, TRUNK, { 255, 20, 147 }),
        common("Peach Tree", 300, 180, TRUNK, { 255, 218, 185 }),
        common("Pear Tree", 320, 200, TRUNK, { 255, 255, 0 }),
        common("Grape Vine", 350, 220, { 128, 0, 128 }, { 148, 0, 211 }),
        common("Avocado Tree", 380, 240, TRUNK, { 107, 142, 35 }),
        common("Mango Tree", 400, 260, TRUNK, { 255, 165, 0 }),
        common("Coconut Palm", 420, 280, TRUNK, TRUNK),
        common("Lemon Tree", 450, 300, TRUNK, { 255, 255, 0 }),
        common("Lime Tree", 480, 320, TRUNK, { 0, 255, 0 }),
        common("Banana Tree", 500, 340, TRUNK, { 255, 255, 0 }),

        // Rare seeds.
        seed(R, "Dragon Fruit", 500, 360, { 255, 20, 147 }, { 255, 192, 203 }, 3, 3),
        seed(R, "Golden Apple", 750, 420, { 255, 215, 0 }, { 255, 223, 0 }, 2, 1),
        seed(R, "Rainbow Rose", 1000, 480, { 255, 105, 180 }, { 255, 20, 147 }, 3, 2),
        seed(R, "Crystal Lotus", 1250, 540, { 224, 255, 255 }, { 173, 216, 230 }, 3, 1),
        seed(R, "Starfruit", 1500, 600, { 255, 255, 0 }, { 255, 215, 0 }, 3, 3, S::STAR),
        seed(R, "Phoenix Flower", 1750, 660, { 255, 69, 0 }, { 255, 140, 0 }, 2, 1),
        seed(R, "Moonberry", 2000, 720, { 230, 230, 250 }, { 147, 112, 219 }, 3, 2),
        seed(R, "Thunder Melon", 2250, 780, { 255, 0, 255 }, { 138, 43, 226 }, 3, 1),
        seed(R, "Ice Mint", 2500, 840, { 173, 216, 230 }, { 224, 255, 255 }, 3, 3, S::CIRCLE),
        seed(R, "Fire Pepper", 2750, 900, { 255, 69, 0 }, { 255, 0, 0 }, 2, 1),
        seed(R, "Wind Blossom", 3000, 960, { 144, 238, 144 }, { 0, 255, 127 }, 3, 2),
        seed(R, "Solar Orchid", 3250, 1020, { 255, 215, 0 }, { 255, 255, 0 }, 3, 1),
        seed(R, "Storm Lily", 3500, 1080, { 75, 0, 130 }, { 147, 112, 219 }, 3, 3, S::STAR),
        seed(R, "Earth Root", 3750, 1140, { 139, 69, 19 }, { 160, 82, 45 }, 2, 1),
        seed(R, "Void Berry", 4000, 1200, { 25, 25, 112 }, { 72, 61, 139 }, 3, 2),
        seed(R, "Light Sage", 4250, 1260, { 255, 255, 224 }, { 255, 255, 255 }, 3, 1),
        seed(R, "Shadow Thorn", 4500, 1320, { 47, 79, 79 }, { 0, 0, 0 }, 3, 3, S::CURVED),
        seed(R, "Time Blossom", 4750, 1380, { 255, 20, 147 }, { 255, 105, 180 }, 2, 1),
        seed(R, "Space Fruit", 5000, 1440, { 25, 25, 112 }, { 65, 105, 225 }, 3, 2),

        // Mythic seeds.
        seed(M, "Eternal Fruit", 5000, 1800, { 255, 215, 0 }, { 255, 223, 0 }),
        seed(M, "Mystic Herb", 10000, 2400, { 138, 43, 226 }, { 147, 112, 219 }, 2, 1),
        seed(M, "Cosmic Berry", 15000, 3000, { 75, 0, 130 }, { 123, 104, 238 }, 1, 2),
        seed(M, "Divine Rose", 20000, 3600, { 255, 20, 147 }, { 255, 182, 193 }, 2, 2),
        seed(M, "Celestial Apple", 25000, 4200, { 255, 215, 0 }, { 255, 255, 224 }, 3, 1),
        seed(M, "Quantum Melon", 30000, 4800, { 0, 255, 255 }, { 224, 255, 255 }, 1, 3),
        seed(M, "Infinity Bloom", 35000, 5400, { 255, 105, 180 }, { 255, 20, 147 }, 3, 3, S::STAR),
        seed(M, "Galaxy Grape", 40000, 6000, { 75, 0, 130 }, { 138, 43, 226 }, 4, 3, S::CURVED),
        seed(M, "Universe Berry", 45000, 6600, { 25, 25, 112 }, { 72, 61, 139 }, 3, 4, S::CURVED),
        seed(M, "Reality Stone Fruit", 50000, 7200, { 255, 0, 0 }, { 220, 20, 60 }),
        seed(M, "Time Crystal Plant", 55000, 7800, { 173, 216, 230 }, { 224, 255, 255 }, 2, 1),
        seed(M, "Power Gem Flower", 60000, 8400, { 255, 165, 0 }, { 255, 215, 0 }, 1, 2),
        seed(M, "Mind Stone Herb", 65000, 9000, { 138, 43, 226 }, { 147, 112, 219 }, 2, 2),
        seed(M, "Soul Stone Berry", 70000, 9600, { 255, 140, 0 }, { 255, 165, 0 }, 3, 1),
        seed(M, "Space Stone Vine", 75000, 10200, { 0, 0, 255 }, { 65, 105, 225 }, 1, 3),
        seed(M, "Dimensional Fruit", 80000, 10800, { 255, 20, 147 }, { 255, 105, 180 }, 3, 3, S::CIRCLE),
        seed(M, "Multiverse Bloom", 85000, 11400, { 255, 215, 0 }, { 255, 255, 0 }, 4, 3),
        seed(M, "Omniversal Plant", 90000, 12000, { 255, 255, 255 }, { 224, 255, 255 }, 3, 4),
        seed(M, "Creator Seed", 95000, 12600, { 255, 215, 0 }, { 255, 223, 0 }),
        seed(M, "God Tier Fruit", 100000, 13200, { 255, 215, 0 }, { 255, 255, 224 }, 2, 1),

        // Legendary seeds, all 4x4.
        seed(L, "World Tree Sapling", 200000, 14400, TRUNK, { 0, 255, 0 }, 4, 4),
        seed(L, "Universe Heart", 1000000, 25600, { 255, 20, 147 }, { 255, 105, 180 }, 4, 4, S::CIRCLE),
        seed(L, "Infinity Garden", 3000000, 106800, { 255, 215, 0 }, { 255, 255, 0 }, 4, 4, S::CURVED),
        seed(L, "Creation Essence", 5000000, 280000, { 255, 255, 255 }, { 224, 255, 255 }, 4, 4),
        seed(L, "Omnipotent Bloom", 10000000, 1900200, { 255, 215, 0 }, { 255, 223, 0 }, 4, 4, S::CIRCLE),
    };
}

std::vector<ToolDefinition> getDefaultToolDefinitions()
{
    return {
        { "Iron Fertilizer", 10000, ToolKind::FERTILIZER, 1, IRON },
        { "Gold Fertilizer", 150000, ToolKind::FERTILIZER, 2, GOLD },
        { "Diamond Fertilizer", 2500000, ToolKind::FERTILIZER, 3, DIAMOND },
        { "Iron Hoe", 5000, ToolKind::HOE, 1, IRON },
        { "Gold Hoe", 50000, ToolKind::HOE, 2, GOLD },
        { "Diamond Hoe", 250000, ToolKind::HOE, 3, DIAMOND },
        { "Iron Shovel", 20000, ToolKind::SHOVEL, 1, IRON },
        { "Gold Shovel", 100000, ToolKind::SHOVEL, 2, GOLD },
        { "Diamond Shovel", 500000, ToolKind::SHOVEL, 3, DIAMOND },
    };
}

} // namespace GardenSim
