#include "EnergyManagementSystem.hpp"
#include "EnergyReservoir.hpp"
#include "GridConnection.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace {

double round6(double v) {
    return std::round(v * 1.0e6) / 1.0e6;
}

EnergyFlows finalize(EnergyFlows f) {
    f.unmet_load       = f.grid_to_load;

    f.solar_to_load    = round6(f.solar_to_load);
    f.solar_to_battery = round6(f.solar_to_battery);
    f.solar_to_grid    = round6(f.solar_to_grid);
    f.battery_to_load  = round6(f.battery_to_load);
    f.grid_to_load     = round6(f.grid_to_load);
    f.unmet_load       = round6(f.unmet_load);
    f.curtailed        = round6(f.curtailed);
    return f;
}

// Offer excess_kw to the battery. Returns the power it rejected.
double chargeFromSolar(double excess_kw, EnergyReservoir& battery, double dt_h,
                       EnergyFlows& f) {
    if (excess_kw <= 0.0) return 0.0;

    const double offered  = excess_kw * dt_h;
    const double consumed = battery.charge(offered);

    f.solar_to_battery = consumed / dt_h;
    return std::max(0.0, offered - consumed) / dt_h;
}

// Export excess_kw; whatever the cap refuses is curtailed.
void exportOrCurtail(double excess_kw, GridConnection& grid, double dt_h,
                     EnergyFlows& f) {
    if (excess_kw <= 0.0) return;

    const double exported = grid.exportEnergy(excess_kw, dt_h);
    f.solar_to_grid = exported;
    if (exported < excess_kw) {
        f.curtailed += excess_kw - exported;
    }
}

// Battery first, then an uncapped grid import for the rest.
void coverDeficit(double deficit_kw, EnergyReservoir& battery, GridConnection& grid,
                  double dt_h, EnergyFlows& f) {
    if (deficit_kw > 0.0) {
        const double delivered = battery.discharge(deficit_kw * dt_h);
        f.battery_to_load = delivered / dt_h;
        deficit_kw -= f.battery_to_load;
    }

    if (deficit_kw > 0.0) {
        grid.importEnergy(deficit_kw, dt_h);
        f.grid_to_load = deficit_kw;
    }
}

// ------------------------------------------------------------------
// LOAD_PRIORITY: house, battery, export; deficits from battery, grid
// ------------------------------------------------------------------
class LoadPriorityPolicy : public DispatchPolicy {
public:
    EnergyFlows dispatch(double solar_kw, double load_kw,
                         EnergyReservoir& battery, GridConnection& grid,
                         double dt_h) const override {
        EnergyFlows f;

        if (solar_kw >= load_kw) {
            f.solar_to_load = load_kw;
            const double rejected = chargeFromSolar(solar_kw - load_kw, battery, dt_h, f);
            exportOrCurtail(rejected, grid, dt_h, f);
        } else {
            f.solar_to_load = solar_kw;
            coverDeficit(load_kw - solar_kw, battery, grid, dt_h, f);
        }
        return finalize(f);
    }

    DispatchStrategy strategy() const override { return DispatchStrategy::LoadPriority; }
};

// ------------------------------------------------------------------
// CHARGE_PRIORITY: all solar to the battery first. With solar >= load
// the battery is never discharged in the same step; any gap is imported.
// ------------------------------------------------------------------
class ChargePriorityPolicy : public DispatchPolicy {
public:
    EnergyFlows dispatch(double solar_kw, double load_kw,
                         EnergyReservoir& battery, GridConnection& grid,
                         double dt_h) const override {
        EnergyFlows f;

        if (solar_kw >= load_kw) {
            const double remaining = chargeFromSolar(solar_kw, battery, dt_h, f);

            if (remaining >= load_kw) {
                f.solar_to_load = load_kw;
                exportOrCurtail(remaining - load_kw, grid, dt_h, f);
            } else {
                f.solar_to_load = remaining;
                const double deficit = load_kw - remaining;
                grid.importEnergy(deficit, dt_h);
                f.grid_to_load = deficit;
            }
        } else {
            // No charging while already short
            f.solar_to_load = solar_kw;
            coverDeficit(load_kw - solar_kw, battery, grid, dt_h, f);
        }
        return finalize(f);
    }

    DispatchStrategy strategy() const override { return DispatchStrategy::ChargePriority; }
};

// ------------------------------------------------------------------
// PRODUCE_PRIORITY: export up to the cap, then battery, then house.
// Can export and import in the same step when solar < load.
// ------------------------------------------------------------------
class ProducePriorityPolicy : public DispatchPolicy {
public:
    EnergyFlows dispatch(double solar_kw, double load_kw,
                         EnergyReservoir& battery, GridConnection& grid,
                         double dt_h) const override {
        EnergyFlows f;

        double remaining = solar_kw;
        if (remaining > 0.0) {
            f.solar_to_grid = grid.exportEnergy(remaining, dt_h);
            remaining -= f.solar_to_grid;
        }

        remaining = chargeFromSolar(remaining, battery, dt_h, f);

        double deficit = load_kw;
        if (remaining > 0.0) {
            f.solar_to_load = std::min(remaining, load_kw);
            deficit = load_kw - f.solar_to_load;
            if (remaining > f.solar_to_load) {
                f.curtailed = remaining - f.solar_to_load;
            }
        }

        coverDeficit(deficit, battery, grid, dt_h, f);
        return finalize(f);
    }

    DispatchStrategy strategy() const override { return DispatchStrategy::ProducePriority; }
};

} // anonymous namespace

DispatchStrategy parseStrategy(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (s == "LOAD_PRIORITY")    return DispatchStrategy::LoadPriority;
    if (s == "CHARGE_PRIORITY")  return DispatchStrategy::ChargePriority;
    if (s == "PRODUCE_PRIORITY") return DispatchStrategy::ProducePriority;

    throw std::invalid_argument(
        "Unknown strategy: '" + name +
        "'. Expected LOAD_PRIORITY, CHARGE_PRIORITY or PRODUCE_PRIORITY");
}

std::string strategyName(DispatchStrategy strategy) {
    switch (strategy) {
    case DispatchStrategy::LoadPriority:    return "LOAD_PRIORITY";
    case DispatchStrategy::ChargePriority:  return "CHARGE_PRIORITY";
    case DispatchStrategy::ProducePriority: return "PRODUCE_PRIORITY";
    }
    return "UNKNOWN";
}

std::unique_ptr<DispatchPolicy> makeDispatchPolicy(DispatchStrategy strategy) {
    switch (strategy) {
    case DispatchStrategy::LoadPriority:    return std::make_unique<LoadPriorityPolicy>();
    case DispatchStrategy::ChargePriority:  return std::make_unique<ChargePriorityPolicy>();
    case DispatchStrategy::ProducePriority: return std::make_unique<ProducePriorityPolicy>();
    }
    throw std::invalid_argument("makeDispatchPolicy: unhandled strategy");
}

EnergyManagementSystem::EnergyManagementSystem(DispatchStrategy strategy)
    : policy_(makeDispatchPolicy(strategy)) {}

EnergyManagementSystem::EnergyManagementSystem(const std::string& strategy)
    : policy_(makeDispatchPolicy(parseStrategy(strategy))) {}

EnergyFlows EnergyManagementSystem::distributeEnergy(double solar_kw, double load_kw,
                                                     EnergyReservoir& battery,
                                                     GridConnection& grid,
                                                     double dt_h) const {
    if (!(dt_h > 0.0)) {
        throw std::invalid_argument("distributeEnergy: time step must be positive");
    }
    return policy_->dispatch(solar_kw, load_kw, battery, grid, dt_h);
}
