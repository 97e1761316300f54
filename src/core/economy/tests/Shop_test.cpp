#include "core/economy/Shop.h"
#include <gtest/gtest.h>
#include <limits>
#include <memory>

using namespace GardenSim;

class ShopTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { catalog = new Catalog(Catalog::createDefault()); }

    static void TearDownTestSuite()
    {
        delete catalog;
        catalog = nullptr;
    }

    void SetUp() override
    {
        shop = std::make_unique<Shop>(*catalog);
        state = std::make_unique<ProgressionState>(10.0, catalog->getToolTiers());
    }

    static Catalog* catalog;
    std::unique_ptr<Shop> shop;
    std::unique_ptr<ProgressionState> state;
};

Catalog* ShopTest::catalog = nullptr;

TEST_F(ShopTest, BuySeedsDebitsAndCredits)
{
    auto result = shop->buy(*state, "Lettuce", 3);

    ASSERT_TRUE(result.isValue());
    EXPECT_DOUBLE_EQ(state->getMoney(), 4.0);
    EXPECT_EQ(state->seeds().count("Lettuce"), 3);
}

TEST_F(ShopTest, BuyWithoutFundsChangesNothing)
{
    auto result = shop->buy(*state, "Carrot", 1);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().reason, FailureReason::InsufficientFunds);
    EXPECT_EQ(result.errorValue().message, "Not enough money! Need $15.00");
    EXPECT_DOUBLE_EQ(state->getMoney(), 10.0);
    EXPECT_TRUE(state->seeds().empty());
}

TEST_F(ShopTest, NoPartialPurchase)
{
    auto result = shop->buy(*state, "Spinach", 4);

    ASSERT_TRUE(result.isError());
    EXPECT_DOUBLE_EQ(state->getMoney(), 10.0);
    EXPECT_EQ(state->seeds().count("Spinach"), 0);
}

TEST_F(ShopTest, BuyRejectsUnknownAndBadQuantity)
{
    EXPECT_EQ(shop->buy(*state, "Moon Cheese").errorValue().reason, FailureReason::UnknownItem);
    EXPECT_EQ(shop->buy(*state, "Radish", 0).errorValue().reason, FailureReason::InvalidQuantity);
}

TEST_F(ShopTest, ToolTiersMustBeBoughtInOrder)
{
    state->credit(1000000.0);

    auto gold = shop->buy(*state, "Gold Hoe");
    ASSERT_TRUE(gold.isError());
    EXPECT_EQ(gold.errorValue().reason, FailureReason::TierOutOfOrder);
    EXPECT_EQ(gold.errorValue().message, "Cannot purchase this item yet!");

    EXPECT_TRUE(shop->buy(*state, "Iron Hoe").isValue());
    EXPECT_EQ(state->getToolLevel(ToolKind::HOE), 1);
    EXPECT_EQ(state->getPlantingRange(), 8);

    auto again = shop->buy(*state, "Iron Hoe");
    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.errorValue().reason, FailureReason::TierAlreadyOwned);

    EXPECT_TRUE(shop->buy(*state, "Gold Hoe").isValue());
    EXPECT_EQ(state->getToolLevel(ToolKind::HOE), 2);
}

TEST_F(ShopTest, ToolPurchaseIgnoresQuantity)
{
    state->credit(20000.0);

    ASSERT_TRUE(shop->buy(*state, "Iron Fertilizer", 5).isValue());
    EXPECT_DOUBLE_EQ(state->getMoney(), 20010.0 - 10000.0);
    EXPECT_DOUBLE_EQ(state->getFertilizerMultiplier(), 2.0);
}

TEST_F(ShopTest, ToolWithoutFundsKeepsTier)
{
    auto result = shop->buyToolTier(*state, ToolKind::SHOVEL, 1);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().reason, FailureReason::InsufficientFunds);
    EXPECT_EQ(state->getToolLevel(ToolKind::SHOVEL), 0);
}

TEST_F(ShopTest, SellCreditsSellValue)
{
    state->items().add("Carrot", 3);

    auto result = shop->sell(*state, "Carrot", 2);

    ASSERT_TRUE(result.isValue());
    EXPECT_DOUBLE_EQ(result.value(), 52.0);
    EXPECT_DOUBLE_EQ(state->getMoney(), 62.0);
    EXPECT_EQ(state->items().count("Carrot"), 1);
}

TEST_F(ShopTest, SellMoreThanHeldFails)
{
    state->items().add("Carrot", 1);

    auto result = shop->sell(*state, "Carrot", 2);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().reason, FailureReason::InsufficientItems);
    EXPECT_EQ(state->items().count("Carrot"), 1);
    EXPECT_DOUBLE_EQ(state->getMoney(), 10.0);
}

TEST_F(ShopTest, ToolsCannotBeSold)
{
    auto result = shop->sell(*state, "Iron Hoe", 1);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().reason, FailureReason::UnknownItem);
}

TEST_F(ShopTest, SellAllCreditsEveryHolding)
{
    // Herbs sells for 6.30, Corn for 40.
    state->items().add("Herbs", 2);
    state->items().add("Corn", 1);

    auto result = shop->sellAll(*state);

    ASSERT_TRUE(result.isValue());
    EXPECT_DOUBLE_EQ(result.value(), 2 * 6.30 + 40.0);
    EXPECT_DOUBLE_EQ(state->getMoney(), 10.0 + 2 * 6.30 + 40.0);
    EXPECT_TRUE(state->items().empty());
}

TEST(ShopSellAllTest, CreditsExactTotalAndEmptiesItems)
{
    // A sells for 3.10, B for 11.
    Catalog catalog(
        { PlantDefinition{ "A", 3.0, 10.0, Color{}, Color{}, Footprint{}, Tier::COMMON },
          PlantDefinition{ "B", 8.0, 10.0, Color{}, Color{}, Footprint{}, Tier::COMMON } },
        {});
    Shop shop(catalog);
    ProgressionState state(0.0, catalog.getToolTiers());
    state.items().add("A", 2);
    state.items().add("B", 1);

    auto result = shop.sellAll(state);

    ASSERT_TRUE(result.isValue());
    EXPECT_DOUBLE_EQ(result.value(), 2 * 3.10 + 11.0);
    EXPECT_DOUBLE_EQ(state.getMoney(), 2 * 3.10 + 11.0);
    EXPECT_TRUE(state.items().empty());
}

TEST_F(ShopTest, SellAllWithNothingFails)
{
    auto result = shop->sellAll(*state);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().reason, FailureReason::NothingToSell);
}

TEST_F(ShopTest, SellAllLeavesUnknownNames)
{
    state->items().add("Mystery", 2);
    state->items().add("Radish", 1);

    auto result = shop->sellAll(*state);

    ASSERT_TRUE(result.isValue());
    EXPECT_DOUBLE_EQ(result.value(), 1.01);
    EXPECT_EQ(state->items().count("Mystery"), 2);
}

TEST_F(ShopTest, BuyThatWouldOverflowSeedCountIsRejected)
{
    const int maxCount = std::numeric_limits<int>::max();
    state->credit(1.2e10);
    ASSERT_TRUE(shop->buy(*state, "Radish", maxCount).isValue());
    const double wallet = state->getMoney();

    auto result = shop->buy(*state, "Radish", maxCount);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().reason, FailureReason::InvalidQuantity);
    EXPECT_DOUBLE_EQ(state->getMoney(), wallet);
    EXPECT_EQ(state->seeds().count("Radish"), maxCount);
    EXPECT_FALSE(shop->buy(*state, "Radish", 1).isValue());
}
