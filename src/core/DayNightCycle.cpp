#include "DayNightCycle.h"
#include "Errors.h"
#include <cmath>

namespace GardenSim {

DayNightCycle::DayNightCycle(double dayLengthSeconds, double initialTimeOfDay)
    : day_length_(dayLengthSeconds), time_of_day_(initialTimeOfDay)
{
    if (day_length_ <= 0.0) {
        throw ConfigError("day length must be positive");
    }
    if (time_of_day_ < 0.0 || time_of_day_ >= 1.0) {
        throw ConfigError("initial time of day must be in [0, 1)");
    }
}

void DayNightCycle::update(double dt)
{
    if (dt <= 0.0) return;

    time_of_day_ = std::fmod(time_of_day_ + dt / day_length_, 1.0);
}

double DayNightCycle::getDarkness() const
{
    const double t = time_of_day_;
    if (isNight()) {
        return NIGHT_DARKNESS;
    }

    if (t <= 0.3) {
        const double progress = (t - 0.2) / 0.1;
        return NIGHT_DARKNESS - progress * NIGHT_DARKNESS;
    }
    if (t >= 0.7) {
        const double progress = 1.0 - (t - 0.7) / 0.1;
        return NIGHT_DARKNESS - progress * NIGHT_DARKNESS;
    }
    return 0.0;
}

int DayNightCycle::getLightingAlpha() const
{
    return static_cast<int>(getDarkness() * 255);
}

} // namespace GardenSim
