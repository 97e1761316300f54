#pragma once

#include "DayNightCycle.h"
#include "Weather.h"
#include <nlohmann/json.hpp>
#include <random>

namespace GardenSim {

struct GameSettings;

/**
 * Weather plus day/night. Only the weather feeds growth.
 */
class EnvironmentState {
public:
    explicit EnvironmentState(const GameSettings& settings);

    void update(double dt, std::mt19937& rng);

    double getGrowthMultiplier() const { return weather_.getGrowthMultiplier(); }

    Weather& getWeather() { return weather_; }
    const Weather& getWeather() const { return weather_; }
    const DayNightCycle& getDayNight() const { return day_night_; }

private:
    Weather weather_;
    DayNightCycle day_night_;
};

void to_json(nlohmann::json& j, const EnvironmentState& env);

} // namespace GardenSim
