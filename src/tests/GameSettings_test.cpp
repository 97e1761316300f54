#include "core/Errors.h"
#include "core/GameSettings.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace GardenSim;

TEST(GameSettingsTest, DefaultsMatchStockGame)
{
    const GameSettings settings = getDefaultGameSettings();

    EXPECT_EQ(settings.map_width, 150);
    EXPECT_EQ(settings.map_height, 150);
    EXPECT_DOUBLE_EQ(settings.starting_money, 10.0);
    EXPECT_DOUBLE_EQ(settings.day_length_seconds, 600.0);
    EXPECT_DOUBLE_EQ(settings.weather_check_interval_seconds, 85.0);
    EXPECT_DOUBLE_EQ(settings.special_weather_chance, 0.4);
    EXPECT_EQ(settings.rng_seed, 0u);
    EXPECT_NO_THROW(validateGameSettings(settings));
}

TEST(GameSettingsTest, PartialJsonKeepsDefaults)
{
    const nlohmann::json j = { { "starting_money", 500.0 }, { "rng_seed", 99 } };

    const GameSettings settings = j.get<GameSettings>();

    EXPECT_DOUBLE_EQ(settings.starting_money, 500.0);
    EXPECT_EQ(settings.rng_seed, 99u);
    EXPECT_EQ(settings.map_width, 150);
    EXPECT_DOUBLE_EQ(settings.advisory_seconds, 3.0);
}

TEST(GameSettingsTest, JsonRoundTripPreservesValues)
{
    GameSettings settings = getDefaultGameSettings();
    settings.map_width = 64;
    settings.snow_growth_multiplier = 0.5;

    const GameSettings copy = nlohmann::json(settings).get<GameSettings>();

    EXPECT_EQ(copy.map_width, 64);
    EXPECT_DOUBLE_EQ(copy.snow_growth_multiplier, 0.5);
}

TEST(GameSettingsTest, ValidateRejectsOutOfRangeValues)
{
    GameSettings settings = getDefaultGameSettings();
    settings.special_weather_chance = 1.5;
    EXPECT_THROW(validateGameSettings(settings), ConfigError);

    settings = getDefaultGameSettings();
    settings.special_weather_max_seconds = 10.0;
    EXPECT_THROW(validateGameSettings(settings), ConfigError);

    settings = getDefaultGameSettings();
    settings.map_height = 0;
    EXPECT_THROW(validateGameSettings(settings), ConfigError);
}

TEST(GameSettingsTest, MapMustFitBorderAndSellArea)
{
    GameSettings settings = getDefaultGameSettings();
    settings.map_width = 21;
    settings.map_height = 21;
    EXPECT_NO_THROW(validateGameSettings(settings));

    settings.map_width = 10;
    EXPECT_THROW(validateGameSettings(settings), ConfigError);
}

TEST(GameSettingsTest, LoadMissingFileThrows)
{
    EXPECT_THROW(loadGameSettings("/nonexistent/game-settings.json"), ConfigError);
}

TEST(GameSettingsTest, LoadsOverridesFromFile)
{
    const auto path = std::filesystem::temp_directory_path() / "garden-sim-settings-test.json";
    {
        std::ofstream out(path);
        out << R"({ "map_width": 40, "map_height": 30, "day_length_seconds": 120 })";
    }

    const GameSettings settings = loadGameSettings(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(settings.map_width, 40);
    EXPECT_EQ(settings.map_height, 30);
    EXPECT_DOUBLE_EQ(settings.day_length_seconds, 120.0);
    EXPECT_DOUBLE_EQ(settings.starting_money, 10.0);
}

TEST(GameSettingsTest, LoadRejectsMalformedJson)
{
    const auto path = std::filesystem::temp_directory_path() / "garden-sim-bad-settings.json";
    {
        std::ofstream out(path);
        out << "{ \"map_width\": ";
    }

    EXPECT_THROW(loadGameSettings(path.string()), ConfigError);
    std::filesystem::remove(path);
}
