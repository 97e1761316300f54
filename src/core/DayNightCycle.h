#pragma once

namespace GardenSim {

/**
 * Continuous time of day in [0, 1): 0 = midnight, 0.5 = noon.
 * Presentational only; growth does not depend on it.
 */
class DayNightCycle {
public:
    static constexpr double NIGHT_DARKNESS = 0.6;

    explicit DayNightCycle(double dayLengthSeconds = 600.0, double initialTimeOfDay = 0.5);

    // Advance by dt / day length, wrapping at 1.0.
    void update(double dt);

    double getTimeOfDay() const { return time_of_day_; }
    double getDayLength() const { return day_length_; }

    /**
     * Darkness in [0, NIGHT_DARKNESS]. Full night at t <= 0.2 or t >= 0.8,
     * linear ramps over sunrise (0.2, 0.3] and sunset [0.7, 0.8), 0 by day.
     */
    double getDarkness() const;

    // Overlay alpha, int(darkness * 255).
    int getLightingAlpha() const;

    bool isNight() const { return time_of_day_ <= 0.2 || time_of_day_ >= 0.8; }

private:
    double day_length_;
    double time_of_day_;
};

} // namespace GardenSim
