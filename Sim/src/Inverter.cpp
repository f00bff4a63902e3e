#include "Inverter.hpp"
#include "RandomSource.hpp"
#include <algorithm>
#include <stdexcept>

Inverter::Inverter(RandomSource& rng,
                   double max_output_kw,
                   double failure_rate_per_day,
                   int min_failure_hours,
                   int max_failure_hours)
    : Subsystem("Inverter"),
      rng_(rng),
      max_output_kw_(max_output_kw),
      failure_rate_(failure_rate_per_day),
      min_failure_hours_(min_failure_hours),
      max_failure_hours_(max_failure_hours) {
    // A failure always lasts at least one hour, so failing_ <=> hours_remaining_ > 0
    if (min_failure_hours_ < 1 || max_failure_hours_ < min_failure_hours_) {
        throw std::invalid_argument(
            "Inverter: failure durations must satisfy 1 <= min <= max hours");
    }
}

void Inverter::initialize() {
    failing_         = false;
    hours_remaining_ = 0.0;

    logState_(
        0, 0.0,
        {"operational","failure_hours_remaining","max_output_kW"},
        {1.0, 0.0, max_output_kw_}
    );
}

double Inverter::applyLimit(double raw_kw) const {
    if (failing_) return 0.0;
    return std::min(raw_kw, max_output_kw_);
}

bool Inverter::checkFailure() {
    if (failing_) return false;

    // One Bernoulli draw per day; the duration draw only happens on failure
    if (rng_.uniform01() < failure_rate_) {
        last_failure_hours_ = rng_.uniformInt(min_failure_hours_, max_failure_hours_);
        hours_remaining_    = static_cast<double>(last_failure_hours_);
        failing_            = true;
        return true;
    }
    return false;
}

bool Inverter::update(double hours_passed) {
    if (!failing_) return false;

    hours_remaining_ -= hours_passed;
    if (hours_remaining_ <= 0.0) {
        failing_         = false;
        hours_remaining_ = 0.0;
        return true;
    }
    return false;
}

void Inverter::forceFailure(int hours) {
    last_failure_hours_ = hours;
    hours_remaining_    = static_cast<double>(hours);
    failing_            = hours > 0;
}

void Inverter::tick(const TickContext& ctx) {
    update(ctx.dt);

    logState_(
        ctx.tick_index, ctx.time,
        {"operational","failure_hours_remaining","max_output_kW"},
        {failing_ ? 0.0 : 1.0, hours_remaining_, max_output_kw_}
    );
}

void Inverter::shutdown() {}
