#include "Load.hpp"
#include "RandomSource.hpp"
#include <cmath>

Load::Load(RandomSource& rng,
           double base_load_kw,
           double peak_hours_max_kw,
           int peak_hours_start,
           int peak_hours_end)
    : rng_(rng),
      base_load_kw_(base_load_kw),
      peak_max_kw_(peak_hours_max_kw),
      peak_start_(peak_hours_start),
      peak_end_(peak_hours_end),
      events_{
          {6,  0.7, 1.0, 1.5},   // breakfast, kettle
          {7,  0.5, 0.8, 1.2},   // hair dryer
          {8,  0.4, 0.8, 1.2},   // washing machine
          {12, 0.6, 1.0, 1.5},   // lunch
          {22, 0.3, 0.5, 1.0},   // late activity
      } {}

double Load::generate(double hour) {
    const int hour_of_day = static_cast<int>(std::floor(hour));

    double demand = base_load_kw_;

    if (hour_of_day >= peak_start_ && hour_of_day < peak_end_) {
        demand += rng_.uniform(kPeakMinKw, peak_max_kw_);
    } else {
        for (const auto& ev : events_) {
            if (ev.hour != hour_of_day) continue;
            if (rng_.chance(ev.probability)) {
                demand += rng_.uniform(ev.min_kw, ev.max_kw);
            }
        }
    }

    // Noise can land in any hour
    if (rng_.chance(kNoiseProbability)) {
        demand += rng_.uniform(0.0, kNoiseMaxKw);
    }

    return demand;
}
