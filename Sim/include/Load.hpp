#pragma once
#include <vector>

class RandomSource;

// Household demand: base load, an evening peak window, a handful of
// scheduled appliance events outside the peak, and random noise.
class Load {
public:
    struct ScheduledEvent {
        int    hour;
        double probability;
        double min_kw;
        double max_kw;
    };

    Load(RandomSource& rng,
         double base_load_kw,
         double peak_hours_max_kw,
         int peak_hours_start,
         int peak_hours_end);

    // hour may be fractional; only its integer part selects the window.
    double generate(double hour);

    const std::vector<ScheduledEvent>& getScheduledEvents() const { return events_; }
    double getBaseLoadKw() const { return base_load_kw_; }

    static constexpr double kNoiseProbability = 0.3;
    static constexpr double kNoiseMaxKw       = 0.8;
    static constexpr double kPeakMinKw        = 1.0;

private:
    RandomSource& rng_;
    double base_load_kw_;
    double peak_max_kw_;
    int    peak_start_;
    int    peak_end_;
    std::vector<ScheduledEvent> events_;
};
