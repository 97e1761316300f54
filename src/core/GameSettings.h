#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace GardenSim {

/**
 * @brief Tunable parameters of the garden simulation.
 *
 * Use getDefaultGameSettings() for the stock values. A JSON file may override
 * any subset of the fields; absent keys keep their defaults.
 */
struct GameSettings {
    int map_width;
    int map_height;
    double starting_money;
    double day_length_seconds;
    double initial_time_of_day;
    double weather_check_interval_seconds;
    double special_weather_chance;
    double special_weather_min_seconds;
    double special_weather_max_seconds;
    double rain_growth_multiplier;
    double snow_growth_multiplier;
    double advisory_seconds;
    uint32_t rng_seed; // 0 = seed from std::random_device.
};

GameSettings getDefaultGameSettings();

/**
 * @brief Load settings overrides from a JSON file on top of the defaults.
 * @throws ConfigError if the file cannot be read, parsed, or holds invalid values.
 */
GameSettings loadGameSettings(const std::string& path);

/**
 * @brief Check value ranges.
 * @throws ConfigError describing the first offending field.
 */
void validateGameSettings(const GameSettings& settings);

void to_json(nlohmann::json& j, const GameSettings& settings);
void from_json(const nlohmann::json& j, GameSettings& settings);

} // namespace GardenSim
