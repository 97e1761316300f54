#include "EnvironmentState.h"
#include "GameSettings.h"

namespace GardenSim {

EnvironmentState::EnvironmentState(const GameSettings& settings)
    : weather_(settings),
      day_night_(settings.day_length_seconds, settings.initial_time_of_day)
{}

void EnvironmentState::update(double dt, std::mt19937& rng)
{
    weather_.update(dt, rng);
    day_night_.update(dt);
}

void to_json(nlohmann::json& j, const EnvironmentState& env)
{
    j = nlohmann::json{ { "weather", env.getWeather().getMode() },
                        { "growth_multiplier", env.getGrowthMultiplier() },
                        { "time_of_day", env.getDayNight().getTimeOfDay() },
                        { "darkness", env.getDayNight().getDarkness() },
                        { "lighting_alpha", env.getDayNight().getLightingAlpha() } };
}

} // namespace GardenSim
