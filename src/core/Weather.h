#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>

namespace GardenSim {

struct GameSettings;

enum class WeatherMode : uint8_t {
    SUNNY = 0,
    CLOUDY,
    RAINY,
    SNOWING
};

const char* getWeatherModeName(WeatherMode mode);
std::optional<WeatherMode> parseWeatherMode(const std::string& name);

/**
 * Time-driven weather state machine.
 *
 * Normal modes (sunny, cloudy) roll for a change every check interval:
 * with special_chance the weather turns rainy or snowing for a random
 * duration, otherwise it flips between sunny and cloudy. A special mode
 * counts down its own duration and then returns to a random normal mode,
 * resetting the check timer.
 */
class Weather {
public:
    struct Config {
        double check_interval = 85.0;
        double special_chance = 0.4;
        double special_min_seconds = 80.0;
        double special_max_seconds = 180.0;
        double rain_multiplier = 2.0;
        double snow_multiplier = 0.75;
    };

    Weather();
    explicit Weather(const Config& config);
    explicit Weather(const GameSettings& settings);

    void update(double dt, std::mt19937& rng);

    WeatherMode getMode() const { return mode_; }
    bool isSpecial() const { return mode_ == WeatherMode::RAINY || mode_ == WeatherMode::SNOWING; }

    // Rainy speeds growth up, snow slows it down, otherwise 1.0.
    double getGrowthMultiplier() const;

    double getCheckTimer() const { return check_timer_; }
    double getSpecialRemaining() const { return special_remaining_; }
    const Config& getConfig() const { return config_; }

    // Force a mode, for hosts and tests. Special modes need a duration.
    void setMode(WeatherMode mode, double specialDuration = 0.0);

private:
    void rollForChange(std::mt19937& rng);

    Config config_;
    WeatherMode mode_ = WeatherMode::SUNNY;
    double check_timer_ = 0.0;
    double special_remaining_ = 0.0;
};

void to_json(nlohmann::json& j, WeatherMode mode);

} // namespace GardenSim
