#pragma once

// Stateless PV model: a half-sine between 06:00 and 18:00 peaking at noon,
// scaled by (1 - cloud_coverage).
class SolarPanel {
public:
    explicit SolarPanel(double peak_capacity_kw);

    // hour_of_day in [0,24), cloud_coverage in [0,1]. Returns kW.
    double generate(double hour_of_day, double cloud_coverage = 0.0) const;

    double getPeakCapacityKw() const { return peak_capacity_kw_; }

    static constexpr double kSunriseHour = 6.0;
    static constexpr double kSunsetHour  = 18.0;

private:
    double peak_capacity_kw_;
};
