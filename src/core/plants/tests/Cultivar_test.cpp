#include "core/plants/Cultivar.h"
#include <gtest/gtest.h>
#include <random>

using namespace GardenSim;

namespace {

PlantType makeType(double growthTime, Footprint footprint = Footprint{})
{
    PlantType type;
    type.name = "Test Plant";
    type.seed_cost = 1.0;
    type.sell_value = 1.01;
    type.growth_time = growthTime;
    type.footprint = footprint;
    return type;
}

} // namespace

TEST(CultivarTest, StartsAsSeedWithFullGrowthTime)
{
    PlantType type = makeType(100.0);
    Cultivar cultivar(1, type, Vector2i{ 3, 4 });

    EXPECT_EQ(cultivar.getStage(), GrowthStage::SEED);
    EXPECT_DOUBLE_EQ(cultivar.getRemainingGrowthTime(), 100.0);
    EXPECT_DOUBLE_EQ(cultivar.getProgress(), 0.0);
    EXPECT_FALSE(cultivar.isHarvestable());
}

TEST(CultivarTest, StagesFollowProgressThresholds)
{
    PlantType type = makeType(100.0);
    Cultivar cultivar(1, type, Vector2i{ 0, 0 });

    cultivar.advance(10.0, 1.0, 1.0, TileKind::GRASS);
    EXPECT_EQ(cultivar.getStage(), GrowthStage::SEED);

    cultivar.advance(15.0, 1.0, 1.0, TileKind::GRASS);
    EXPECT_EQ(cultivar.getStage(), GrowthStage::SPROUT);

    cultivar.advance(30.0, 1.0, 1.0, TileKind::GRASS);
    EXPECT_EQ(cultivar.getStage(), GrowthStage::YOUNG);

    cultivar.advance(30.0, 1.0, 1.0, TileKind::GRASS);
    EXPECT_EQ(cultivar.getStage(), GrowthStage::MATURE);

    cultivar.advance(15.0, 1.0, 1.0, TileKind::GRASS);
    EXPECT_EQ(cultivar.getStage(), GrowthStage::HARVESTABLE);
    EXPECT_DOUBLE_EQ(cultivar.getRemainingGrowthTime(), 0.0);
}

TEST(CultivarTest, RainOnSoilGrowsAtTwoPointTwoTimes)
{
    PlantType type = makeType(100.0);
    Cultivar cultivar(1, type, Vector2i{ 0, 0 });

    // 100 / 2.2 = 45.4545...
    cultivar.advance(45.0, 2.0, 1.0, TileKind::SOIL);
    EXPECT_FALSE(cultivar.isHarvestable());
    EXPECT_NEAR(cultivar.getRemainingGrowthTime(), 1.0, 1e-9);

    cultivar.advance(0.46, 2.0, 1.0, TileKind::SOIL);
    EXPECT_TRUE(cultivar.isHarvestable());
}

TEST(CultivarTest, SoilBonusOnlyOnSoil)
{
    EXPECT_DOUBLE_EQ(soilMultiplier(TileKind::SOIL), 1.1);
    EXPECT_DOUBLE_EQ(soilMultiplier(TileKind::GRASS), 1.0);
    EXPECT_DOUBLE_EQ(soilMultiplier(TileKind::STONE), 1.0);
}

TEST(CultivarTest, AllMultipliersCompose)
{
    PlantType type = makeType(1000.0);
    Cultivar cultivar(1, type, Vector2i{ 0, 0 });

    cultivar.advance(10.0, 0.75, 10.0, TileKind::SOIL);

    EXPECT_NEAR(cultivar.getRemainingGrowthTime(), 1000.0 - 10.0 * 0.75 * 10.0 * 1.1, 1e-9);
}

TEST(CultivarTest, HarvestableIsFrozen)
{
    PlantType type = makeType(5.0);
    Cultivar cultivar(1, type, Vector2i{ 0, 0 });

    EXPECT_TRUE(cultivar.advance(10.0, 1.0, 1.0, TileKind::GRASS));
    ASSERT_TRUE(cultivar.isHarvestable());

    EXPECT_FALSE(cultivar.advance(10.0, 2.0, 100.0, TileKind::SOIL));
    EXPECT_TRUE(cultivar.isHarvestable());
    EXPECT_DOUBLE_EQ(cultivar.getRemainingGrowthTime(), 0.0);
}

TEST(CultivarTest, NonPositiveDeltaIsNoOp)
{
    PlantType type = makeType(50.0);
    Cultivar cultivar(1, type, Vector2i{ 0, 0 });

    EXPECT_FALSE(cultivar.advance(0.0, 1.0, 1.0, TileKind::GRASS));
    EXPECT_FALSE(cultivar.advance(-5.0, 1.0, 1.0, TileKind::GRASS));
    EXPECT_DOUBLE_EQ(cultivar.getRemainingGrowthTime(), 50.0);
}

TEST(CultivarTest, GrowthIsMonotone)
{
    PlantType type = makeType(300.0);
    Cultivar cultivar(1, type, Vector2i{ 0, 0 });

    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> dt(0.0, 2.0);
    std::uniform_real_distribution<double> weather(0.5, 2.0);

    double lastRemaining = cultivar.getRemainingGrowthTime();
    GrowthStage lastStage = cultivar.getStage();
    for (int i = 0; i < 1000; ++i) {
        const TileKind kind = (i % 2 == 0) ? TileKind::SOIL : TileKind::GRASS;
        cultivar.advance(dt(rng), weather(rng), 1.0, kind);

        EXPECT_LE(cultivar.getRemainingGrowthTime(), lastRemaining);
        EXPECT_GE(static_cast<int>(cultivar.getStage()), static_cast<int>(lastStage));
        lastRemaining = cultivar.getRemainingGrowthTime();
        lastStage = cultivar.getStage();
    }
    EXPECT_TRUE(cultivar.isHarvestable());
}

TEST(CultivarTest, OccupiedTilesFollowFootprint)
{
    PlantType type = makeType(10.0, Footprint{ 3, 3, FootprintShape::STAR });
    Cultivar cultivar(7, type, Vector2i{ 2, 2 });

    auto tiles = cultivar.occupiedTiles();
    EXPECT_EQ(tiles.size(), 7u);
    EXPECT_EQ(cultivar.getId(), 7u);
    EXPECT_EQ(cultivar.getOrigin(), (Vector2i{ 2, 2 }));
}

TEST(CultivarTest, StageForProgress)
{
    EXPECT_EQ(stageForProgress(0.0), GrowthStage::SEED);
    EXPECT_EQ(stageForProgress(0.25), GrowthStage::SPROUT);
    EXPECT_EQ(stageForProgress(0.5), GrowthStage::YOUNG);
    EXPECT_EQ(stageForProgress(0.9), GrowthStage::MATURE);
    EXPECT_EQ(stageForProgress(1.0), GrowthStage::HARVESTABLE);
    EXPECT_STREQ(getGrowthStageName(GrowthStage::YOUNG), "Young");
}
