#include "core/economy/ProgressionState.h"
#include <gtest/gtest.h>

using namespace GardenSim;

TEST(ProgressionStateTest, StartsAtBasicTiers)
{
    ProgressionState state(10.0, ToolTierTable{});

    EXPECT_DOUBLE_EQ(state.getMoney(), 10.0);
    EXPECT_EQ(state.getToolLevel(ToolKind::FERTILIZER), 0);
    EXPECT_DOUBLE_EQ(state.getFertilizerMultiplier(), 1.0);
    EXPECT_EQ(state.getPlantingRange(), 2);
    EXPECT_EQ(state.getHarvestRange(), 1);
}

TEST(ProgressionStateTest, TiersDriveMultipliersAndRanges)
{
    ProgressionState state(0.0, ToolTierTable{});

    state.setToolLevel(ToolKind::FERTILIZER, 2);
    state.setToolLevel(ToolKind::HOE, 3);
    state.setToolLevel(ToolKind::SHOVEL, 1);

    EXPECT_DOUBLE_EQ(state.getFertilizerMultiplier(), 10.0);
    EXPECT_EQ(state.getPlantingRange(), 100);
    EXPECT_EQ(state.getHarvestRange(), 4);
}

TEST(ProgressionStateTest, DebitNeverGoesNegative)
{
    ProgressionState state(5.0, ToolTierTable{});

    EXPECT_FALSE(state.debit(5.01));
    EXPECT_DOUBLE_EQ(state.getMoney(), 5.0);
    EXPECT_TRUE(state.debit(5.0));
    EXPECT_DOUBLE_EQ(state.getMoney(), 0.0);
}

TEST(ProgressionStateTest, LevelOutOfRangeThrows)
{
    ProgressionState state(0.0, ToolTierTable{});
    EXPECT_THROW(state.setToolLevel(ToolKind::HOE, 4), std::out_of_range);
    EXPECT_THROW(state.setToolLevel(ToolKind::HOE, -1), std::out_of_range);
}

TEST(ProgressionStateTest, JsonSnapshot)
{
    ProgressionState state(12.5, ToolTierTable{});
    state.seeds().add("Radish", 3);
    state.setToolLevel(ToolKind::SHOVEL, 3);

    nlohmann::json j = state;

    EXPECT_DOUBLE_EQ(j["money"].get<double>(), 12.5);
    EXPECT_EQ(j["seeds"][0][0], "Radish");
    EXPECT_EQ(j["tools"]["shovel"]["name"], "Diamond");
    EXPECT_EQ(j["harvest_range"], 15);
}
