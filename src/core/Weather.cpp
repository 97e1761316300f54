#include "Weather.h"
#include "GameSettings.h"
#include "LoggingChannels.h"
#include <array>

namespace GardenSim {

static const std::array<const char*, 4> WEATHER_NAMES = {
    { "sunny", "cloudy", "rainy", "snowing" }
};

const char* getWeatherModeName(WeatherMode mode)
{
    return WEATHER_NAMES[static_cast<size_t>(mode)];
}

std::optional<WeatherMode> parseWeatherMode(const std::string& name)
{
    for (size_t i = 0; i < WEATHER_NAMES.size(); ++i) {
        if (name == WEATHER_NAMES[i]) return static_cast<WeatherMode>(i);
    }
    return std::nullopt;
}

Weather::Weather() : Weather(Config{})
{}

Weather::Weather(const Config& config) : config_(config)
{}

Weather::Weather(const GameSettings& settings)
    : Weather(Config{ .check_interval = settings.weather_check_interval_seconds,
                      .special_chance = settings.special_weather_chance,
                      .special_min_seconds = settings.special_weather_min_seconds,
                      .special_max_seconds = settings.special_weather_max_seconds,
                      .rain_multiplier = settings.rain_growth_multiplier,
                      .snow_multiplier = settings.snow_growth_multiplier })
{}

void Weather::update(double dt, std::mt19937& rng)
{
    if (dt <= 0.0) return;

    check_timer_ += dt;

    if (isSpecial()) {
        special_remaining_ -= dt;
        if (special_remaining_ <= 0.0) {
            std::bernoulli_distribution coin(0.5);
            const WeatherMode previous = mode_;
            mode_ = coin(rng) ? WeatherMode::SUNNY : WeatherMode::CLOUDY;
            special_remaining_ = 0.0;
            check_timer_ = 0.0;
            LoggingChannels::weather()->info(
                "Weather: {} ended, now {}", getWeatherModeName(previous), getWeatherModeName(mode_));
            return;
        }
    }

    if (check_timer_ >= config_.check_interval) {
        check_timer_ = 0.0;
        // Special modes only reset the timer here; their own countdown ends them.
        if (!isSpecial()) {
            rollForChange(rng);
        }
    }
}

void Weather::rollForChange(std::mt19937& rng)
{
    std::uniform_real_distribution<double> roll(0.0, 1.0);
    const WeatherMode previous = mode_;

    if (roll(rng) < config_.special_chance) {
        std::bernoulli_distribution coin(0.5);
        std::uniform_real_distribution<double> duration(
            config_.special_min_seconds, config_.special_max_seconds);
        mode_ = coin(rng) ? WeatherMode::RAINY : WeatherMode::SNOWING;
        special_remaining_ = duration(rng);
        LoggingChannels::weather()->info(
            "Weather: {} -> {} for {:.1f}s",
            getWeatherModeName(previous),
            getWeatherModeName(mode_),
            special_remaining_);
    }
    else {
        mode_ = mode_ == WeatherMode::SUNNY ? WeatherMode::CLOUDY : WeatherMode::SUNNY;
        LoggingChannels::weather()->debug(
            "Weather: {} -> {}", getWeatherModeName(previous), getWeatherModeName(mode_));
    }
}

double Weather::getGrowthMultiplier() const
{
    switch (mode_) {
        case WeatherMode::RAINY:
            return config_.rain_multiplier;
        case WeatherMode::SNOWING:
            return config_.snow_multiplier;
        case WeatherMode::SUNNY:
        case WeatherMode::CLOUDY:
            break;
    }
    return 1.0;
}

void Weather::setMode(WeatherMode mode, double specialDuration)
{
    mode_ = mode;
    special_remaining_ = isSpecial() ? specialDuration : 0.0;
    check_timer_ = 0.0;
}

void to_json(nlohmann::json& j, WeatherMode mode)
{
    j = getWeatherModeName(mode);
}

} // namespace GardenSim
