#include "SolarPanel.hpp"
#include <cmath>

// Local pi so we do not rely on M_PI.
static constexpr double SOLAR_PI = 3.141592653589793;

/**
 * SolarPanel
 *
 * Output between sunrise and sunset is
 *
 *   P_out = peak * sin(pi * (hour - 6) / 12) * (1 - cloud_coverage)
 *
 * and zero outside [06:00, 18:00). The day-length is fixed; seasons only
 * act through the cloud coverage draw.
 */
SolarPanel::SolarPanel(double peak_capacity_kw)
    : peak_capacity_kw_(peak_capacity_kw) {}

double SolarPanel::generate(double hour_of_day, double cloud_coverage) const {
    if (hour_of_day < kSunriseHour || hour_of_day >= kSunsetHour) {
        return 0.0;
    }

    if (!std::isfinite(cloud_coverage) || cloud_coverage < 0.0) cloud_coverage = 0.0;
    if (cloud_coverage > 1.0) cloud_coverage = 1.0;

    const double sun_angle = (hour_of_day - kSunriseHour) * (SOLAR_PI / 12.0);
    const double clear_sky = peak_capacity_kw_ * std::sin(sun_angle);

    return clear_sky * (1.0 - cloud_coverage);
}
