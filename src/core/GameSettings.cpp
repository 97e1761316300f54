#include "GameSettings.h"
#include "Errors.h"
#include "LoggingChannels.h"
#include "TileGrid.h"
#include <fstream>
#include <string>

namespace GardenSim {

GameSettings getDefaultGameSettings()
{
    return GameSettings{ .map_width = 150,
                         .map_height = 150,
                         .starting_money = 10.0,
                         .day_length_seconds = 600.0,
                         .initial_time_of_day = 0.5,
                         .weather_check_interval_seconds = 85.0,
                         .special_weather_chance = 0.4,
                         .special_weather_min_seconds = 80.0,
                         .special_weather_max_seconds = 180.0,
                         .rain_growth_multiplier = 2.0,
                         .snow_growth_multiplier = 0.75,
                         .advisory_seconds = 3.0,
                         .rng_seed = 0 };
}

void to_json(nlohmann::json& j, const GameSettings& settings)
{
    j = nlohmann::json{ { "map_width", settings.map_width },
                        { "map_height", settings.map_height },
                        { "starting_money", settings.starting_money },
                        { "day_length_seconds", settings.day_length_seconds },
                        { "initial_time_of_day", settings.initial_time_of_day },
                        { "weather_check_interval_seconds",
                          settings.weather_check_interval_seconds },
                        { "special_weather_chance", settings.special_weather_chance },
                        { "special_weather_min_seconds", settings.special_weather_min_seconds },
                        { "special_weather_max_seconds", settings.special_weather_max_seconds },
                        { "rain_growth_multiplier", settings.rain_growth_multiplier },
                        { "snow_growth_multiplier", settings.snow_growth_multiplier },
                        { "advisory_seconds", settings.advisory_seconds },
                        { "rng_seed", settings.rng_seed } };
}

void from_json(const nlohmann::json& j, GameSettings& settings)
{
    const GameSettings defaults = getDefaultGameSettings();
    settings.map_width = j.value("map_width", defaults.map_width);
    settings.map_height = j.value("map_height", defaults.map_height);
    settings.starting_money = j.value("starting_money", defaults.starting_money);
    settings.day_length_seconds = j.value("day_length_seconds", defaults.day_length_seconds);
    settings.initial_time_of_day = j.value("initial_time_of_day", defaults.initial_time_of_day);
    settings.weather_check_interval_seconds =
        j.value("weather_check_interval_seconds", defaults.weather_check_interval_seconds);
    settings.special_weather_chance =
        j.value("special_weather_chance", defaults.special_weather_chance);
    settings.special_weather_min_seconds =
        j.value("special_weather_min_seconds", defaults.special_weather_min_seconds);
    settings.special_weather_max_seconds =
        j.value("special_weather_max_seconds", defaults.special_weather_max_seconds);
    settings.rain_growth_multiplier =
        j.value("rain_growth_multiplier", defaults.rain_growth_multiplier);
    settings.snow_growth_multiplier =
        j.value("snow_growth_multiplier", defaults.snow_growth_multiplier);
    settings.advisory_seconds = j.value("advisory_seconds", defaults.advisory_seconds);
    settings.rng_seed = j.value("rng_seed", defaults.rng_seed);
}

void validateGameSettings(const GameSettings& settings)
{
    // Room for the water border on both sides plus the whole sell area.
    constexpr int minMapSize = 2 * TileGrid::WATER_BORDER + 2 * TileGrid::SELL_AREA_HALF_SIZE + 1;
    if (settings.map_width < minMapSize || settings.map_height < minMapSize) {
        throw ConfigError("map dimensions must be at least " + std::to_string(minMapSize));
    }
    if (settings.starting_money < 0.0) {
        throw ConfigError("starting_money must not be negative");
    }
    if (settings.day_length_seconds <= 0.0) {
        throw ConfigError("day_length_seconds must be positive");
    }
    if (settings.initial_time_of_day < 0.0 || settings.initial_time_of_day >= 1.0) {
        throw ConfigError("initial_time_of_day must be in [0, 1)");
    }
    if (settings.weather_check_interval_seconds <= 0.0) {
        throw ConfigError("weather_check_interval_seconds must be positive");
    }
    if (settings.special_weather_chance < 0.0 || settings.special_weather_chance > 1.0) {
        throw ConfigError("special_weather_chance must be in [0, 1]");
    }
    if (settings.special_weather_min_seconds <= 0.0
        || settings.special_weather_max_seconds < settings.special_weather_min_seconds) {
        throw ConfigError("special weather duration range is invalid");
    }
    if (settings.rain_growth_multiplier < 0.0 || settings.snow_growth_multiplier < 0.0) {
        throw ConfigError("weather growth multipliers must not be negative");
    }
}

GameSettings loadGameSettings(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open settings file: " + path);
    }

    GameSettings settings;
    try {
        settings = nlohmann::json::parse(in).get<GameSettings>();
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError("failed to parse settings file " + path + ": " + e.what());
    }

    validateGameSettings(settings);
    LoggingChannels::config()->info("Loaded game settings from {}", path);
    return settings;
}

} // namespace GardenSim
