#include "core/TileGrid.h"
#include "core/plants/FieldIndex.h"
#include <algorithm>
#include <gtest/gtest.h>
#include <memory>

using namespace GardenSim;

namespace {

PlantType makeType(const std::string& name, Footprint footprint, double growthTime = 10.0)
{
    PlantType type;
    type.name = name;
    type.seed_cost = 1.0;
    type.sell_value = 1.01;
    type.growth_time = growthTime;
    type.footprint = footprint;
    return type;
}

TileGrid uniformGrid(int width, int height, TileKind kind)
{
    return TileGrid::fromRows(std::vector<std::vector<TileKind>>(
        static_cast<size_t>(height), std::vector<TileKind>(static_cast<size_t>(width), kind)));
}

} // namespace

class FieldIndexTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        grid = std::make_unique<TileGrid>(uniformGrid(12, 12, TileKind::GRASS));
        field = std::make_unique<FieldIndex>();
    }

    // Every index key maps to a cultivar that covers it, and nothing else is indexed.
    void expectIndexConsistent() const
    {
        size_t covered = 0;
        for (const auto& [id, cultivar] : field->getCultivars()) {
            for (const auto& tile : cultivar.occupiedTiles()) {
                EXPECT_EQ(field->getCultivarIdAt(tile), id);
                covered++;
            }
        }
        EXPECT_EQ(field->getTileIndex().size(), covered);
    }

    std::unique_ptr<TileGrid> grid;
    std::unique_ptr<FieldIndex> field;
    std::mt19937 rng{ 42 };

    PlantType single = makeType("Single", Footprint{});
    PlantType square = makeType("Square", Footprint{ 2, 2, FootprintShape::RECT });
    PlantType star = makeType("Star", Footprint{ 3, 3, FootprintShape::STAR });
};

TEST_F(FieldIndexTest, PlantRegistersEveryFootprintTile)
{
    CultivarId id = field->plant(*grid, square, Vector2i{ 3, 3 });

    ASSERT_NE(id, INVALID_CULTIVAR_ID);
    EXPECT_EQ(field->count(), 1u);
    EXPECT_EQ(field->getCultivarIdAt({ 3, 3 }), id);
    EXPECT_EQ(field->getCultivarIdAt({ 4, 4 }), id);
    EXPECT_EQ(field->getCultivarIdAt({ 5, 5 }), INVALID_CULTIVAR_ID);
    EXPECT_EQ(field->getCultivarAt({ 4, 3 }), field->getCultivar(id));
    expectIndexConsistent();
}

TEST_F(FieldIndexTest, OverlappingPlantIsRejected)
{
    ASSERT_NE(field->plant(*grid, square, Vector2i{ 0, 0 }), INVALID_CULTIVAR_ID);

    EXPECT_EQ(field->plant(*grid, square, Vector2i{ 1, 1 }), INVALID_CULTIVAR_ID);
    EXPECT_NE(field->plant(*grid, square, Vector2i{ 2, 2 }), INVALID_CULTIVAR_ID);
    EXPECT_EQ(field->count(), 2u);
    expectIndexConsistent();
}

TEST_F(FieldIndexTest, StarGapsStayFree)
{
    ASSERT_NE(field->plant(*grid, star, Vector2i{ 0, 0 }), INVALID_CULTIVAR_ID);

    // (0, 0) and (2, 0) are outside the star pattern.
    EXPECT_EQ(field->getCultivarIdAt({ 0, 0 }), INVALID_CULTIVAR_ID);
    EXPECT_NE(field->plant(*grid, single, Vector2i{ 0, 0 }), INVALID_CULTIVAR_ID);
    EXPECT_NE(field->plant(*grid, single, Vector2i{ 2, 0 }), INVALID_CULTIVAR_ID);
    expectIndexConsistent();
}

TEST_F(FieldIndexTest, CanPlaceRequiresTillableInBoundsTiles)
{
    auto rows = std::vector<std::vector<TileKind>>(4, std::vector<TileKind>(4, TileKind::SOIL));
    rows[1][1] = TileKind::WATER;
    rows[2][3] = TileKind::STONE;
    rows[0][3] = TileKind::SELL_AREA;
    TileGrid mixed = TileGrid::fromRows(rows);

    EXPECT_TRUE(field->canPlaceFootprint(mixed, Footprint{}, { 0, 0 }));
    EXPECT_FALSE(field->canPlaceFootprint(mixed, Footprint{}, { 1, 1 }));
    EXPECT_FALSE(field->canPlaceFootprint(mixed, Footprint{}, { 3, 2 }));
    EXPECT_FALSE(field->canPlaceFootprint(mixed, Footprint{}, { 3, 0 }));
    EXPECT_FALSE(field->canPlaceFootprint(mixed, Footprint{ 2, 2 }, { 0, 0 }));
    EXPECT_FALSE(field->canPlaceFootprint(mixed, Footprint{ 2, 2 }, { 3, 3 }));
    EXPECT_FALSE(field->canPlaceFootprint(mixed, Footprint{}, { -1, 0 }));
    EXPECT_FALSE(field->canPlaceFootprint(mixed, Footprint{ 2, 2 }, { 2, 2 }));
    EXPECT_TRUE(field->canPlaceFootprint(mixed, Footprint{ 2, 1 }, { 0, 3 }));
}

TEST_F(FieldIndexTest, ZeroRadiusSearchOnlyReturnsOwnTile)
{
    auto spot = field->findPlantingSpot(*grid, { 6, 6 }, Footprint{}, 0, rng);
    ASSERT_TRUE(spot.has_value());
    EXPECT_EQ(*spot, (Vector2i{ 6, 6 }));

    ASSERT_NE(field->plant(*grid, single, { 6, 6 }), INVALID_CULTIVAR_ID);
    EXPECT_FALSE(field->findPlantingSpot(*grid, { 6, 6 }, Footprint{}, 0, rng).has_value());
}

TEST_F(FieldIndexTest, SearchExpandsRingByRing)
{
    ASSERT_NE(field->plant(*grid, single, { 6, 6 }), INVALID_CULTIVAR_ID);

    for (int i = 0; i < 8; ++i) {
        auto spot = field->findPlantingSpot(*grid, { 6, 6 }, Footprint{}, 2, rng);
        ASSERT_TRUE(spot.has_value());
        EXPECT_EQ((*spot - Vector2i{ 6, 6 }).chebyshev(), 1);
        ASSERT_NE(field->plant(*grid, single, *spot), INVALID_CULTIVAR_ID);
    }

    // Ring 1 is now full; the next spot comes from ring 2.
    auto spot = field->findPlantingSpot(*grid, { 6, 6 }, Footprint{}, 2, rng);
    ASSERT_TRUE(spot.has_value());
    EXPECT_EQ((*spot - Vector2i{ 6, 6 }).chebyshev(), 2);
    expectIndexConsistent();
}

TEST_F(FieldIndexTest, SearchFailsWhenNothingFits)
{
    TileGrid stone = uniformGrid(5, 5, TileKind::STONE);
    EXPECT_FALSE(field->findPlantingSpot(stone, { 2, 2 }, Footprint{}, 10, rng).has_value());
}

TEST_F(FieldIndexTest, HarvestRangeIsCircular)
{
    CultivarId near = field->plant(*grid, single, { 5, 6 });
    CultivarId far = field->plant(*grid, single, { 7, 7 });
    ASSERT_NE(near, INVALID_CULTIVAR_ID);
    ASSERT_NE(far, INVALID_CULTIVAR_ID);
    field->advanceAll(100.0, 1.0, 1.0, *grid);

    auto harvested = field->harvestAt({ 5, 5 }, 1);

    ASSERT_EQ(harvested.size(), 1u);
    EXPECT_EQ(harvested.front()->name, "Single");
    EXPECT_EQ(field->getCultivar(near), nullptr);
    EXPECT_NE(field->getCultivar(far), nullptr);
    expectIndexConsistent();
}

TEST_F(FieldIndexTest, HarvestSkipsDiagonalOutsideRadius)
{
    // (6, 6) is sqrt(2) from (5, 5): inside the square, outside radius 1.
    ASSERT_NE(field->plant(*grid, single, { 6, 6 }), INVALID_CULTIVAR_ID);
    field->advanceAll(100.0, 1.0, 1.0, *grid);

    EXPECT_TRUE(field->harvestAt({ 5, 5 }, 1).empty());
    EXPECT_EQ(field->harvestAt({ 5, 5 }, 2).size(), 1u);
}

TEST_F(FieldIndexTest, HarvestRemovesWholeFootprintOnce)
{
    CultivarId id = field->plant(*grid, square, { 5, 6 });
    ASSERT_NE(id, INVALID_CULTIVAR_ID);
    field->advanceAll(100.0, 1.0, 1.0, *grid);

    // Radius 2 reaches all four tiles of the same cultivar.
    auto harvested = field->harvestAt({ 5, 5 }, 2);

    EXPECT_EQ(harvested.size(), 1u);
    EXPECT_EQ(field->count(), 0u);
    EXPECT_TRUE(field->getTileIndex().empty());
}

TEST_F(FieldIndexTest, HarvestTouchingOneTileTakesAllTiles)
{
    ASSERT_NE(field->plant(*grid, square, { 5, 6 }), INVALID_CULTIVAR_ID);
    field->advanceAll(100.0, 1.0, 1.0, *grid);

    ASSERT_EQ(field->harvestAt({ 5, 5 }, 1).size(), 1u);
    EXPECT_EQ(field->getCultivarIdAt({ 6, 7 }), INVALID_CULTIVAR_ID);
}

TEST_F(FieldIndexTest, GrowingCultivarsAreNotHarvested)
{
    ASSERT_NE(field->plant(*grid, single, { 5, 5 }), INVALID_CULTIVAR_ID);
    field->advanceAll(1.0, 1.0, 1.0, *grid);

    EXPECT_TRUE(field->harvestAt({ 5, 5 }, 3).empty());
    EXPECT_EQ(field->count(), 1u);
}

TEST_F(FieldIndexTest, HarvestCollectsSeveralCultivars)
{
    ASSERT_NE(field->plant(*grid, single, { 4, 5 }), INVALID_CULTIVAR_ID);
    ASSERT_NE(field->plant(*grid, single, { 6, 5 }), INVALID_CULTIVAR_ID);
    ASSERT_NE(field->plant(*grid, single, { 5, 4 }), INVALID_CULTIVAR_ID);
    field->advanceAll(100.0, 1.0, 1.0, *grid);

    EXPECT_EQ(field->harvestAt({ 5, 5 }, 1).size(), 3u);
    EXPECT_EQ(field->count(), 0u);
}

TEST_F(FieldIndexTest, SoilOriginGrowsFaster)
{
    auto rows = std::vector<std::vector<TileKind>>(2, std::vector<TileKind>(2, TileKind::GRASS));
    rows[0][0] = TileKind::SOIL;
    TileGrid mixed = TileGrid::fromRows(rows);

    CultivarId onSoil = field->plant(mixed, single, { 0, 0 });
    CultivarId onGrass = field->plant(mixed, single, { 1, 1 });
    field->advanceAll(5.0, 1.0, 1.0, mixed);

    EXPECT_NEAR(field->getCultivar(onSoil)->getRemainingGrowthTime(), 10.0 - 5.5, 1e-9);
    EXPECT_NEAR(field->getCultivar(onGrass)->getRemainingGrowthTime(), 5.0, 1e-9);
}

TEST_F(FieldIndexTest, RandomPlantHarvestKeepsIndexExclusive)
{
    std::uniform_int_distribution<int> coord(0, 11);
    std::uniform_int_distribution<int> pick(0, 2);
    const PlantType* types[] = { &single, &square, &star };

    for (int i = 0; i < 300; ++i) {
        const Vector2i at{ coord(rng), coord(rng) };
        if (i % 5 == 4) {
            field->advanceAll(4.0, 1.0, 1.0, *grid);
            field->harvestAt(at, 3);
        }
        else {
            const PlantType& type = *types[pick(rng)];
            auto spot = field->findPlantingSpot(*grid, at, type.footprint, 2, rng);
            if (spot) {
                EXPECT_NE(field->plant(*grid, type, *spot), INVALID_CULTIVAR_ID);
            }
        }
        expectIndexConsistent();
    }
}

TEST_F(FieldIndexTest, RemoveUnknownCultivarIsHarmless)
{
    field->removeCultivar(999);
    EXPECT_EQ(field->count(), 0u);
}
