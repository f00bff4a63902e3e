#include "Battery.hpp"
#include <algorithm>
#include <cmath>

Battery::Battery(double capacity_kwh, double round_trip_efficiency, double min_soc)
    : Subsystem("Battery"),
      capacity_kwh_(capacity_kwh),
      efficiency_(round_trip_efficiency),
      min_soc_(min_soc),
      one_way_eff_(std::sqrt(round_trip_efficiency)),
      min_energy_kwh_(capacity_kwh * min_soc),
      energy_kwh_(capacity_kwh * 0.5) {}   // Start 50% full

void Battery::initialize() {
    logState_(
        0,
        0.0,
        {"soc_pct","stored_kWh","capacity_kWh"},
        {getSoc(), energy_kwh_, capacity_kwh_}
    );
}

//
// Offered energy loses (1 - sqrt(eff)) on the way in. Only headroom can
// reject energy; the source always pays the loss on what was stored.
//
double Battery::charge(double offered_kwh) {
    if (offered_kwh <= 0.0) return 0.0;

    const double usable   = offered_kwh * one_way_eff_;
    const double headroom = std::max(0.0, capacity_kwh_ - energy_kwh_);
    const double stored   = std::min(usable, headroom);

    energy_kwh_ = std::min(energy_kwh_ + stored, capacity_kwh_);

    return stored / one_way_eff_;
}

//
// To deliver X kWh we must extract X / sqrt(eff), never below the floor.
// Returns kWh actually delivered.
//
double Battery::discharge(double requested_kwh) {
    if (requested_kwh <= 0.0) return 0.0;

    const double required  = requested_kwh / one_way_eff_;
    const double available = std::max(0.0, energy_kwh_ - min_energy_kwh_);
    const double extracted = std::min(required, available);

    energy_kwh_ -= extracted;

    return extracted * one_way_eff_;
}

double Battery::getSoc() const {
    return (energy_kwh_ / capacity_kwh_) * 100.0;
}

bool Battery::isFull(double threshold_pct) const {
    return getSoc() >= threshold_pct;
}

bool Battery::isEmpty() const {
    return energy_kwh_ <= min_energy_kwh_;
}

void Battery::tick(const TickContext& ctx) {
    // Only logs status; the EMS controls all charging/discharging
    logState_(
        ctx.tick_index,
        ctx.time,
        {"soc_pct","stored_kWh","capacity_kWh"},
        {getSoc(), energy_kwh_, capacity_kwh_}
    );
}

void Battery::shutdown() {}
