#pragma once
#include <memory>
#include <string>

class EnergyReservoir;
class GridConnection;

enum class DispatchStrategy {
    LoadPriority,     // house, then battery, then export
    ChargePriority,   // battery, then house, then export
    ProducePriority   // export, then battery, then house
};

// Accepts LOAD_PRIORITY / CHARGE_PRIORITY / PRODUCE_PRIORITY (any case).
// Throws std::invalid_argument on anything else.
DispatchStrategy parseStrategy(const std::string& name);
std::string strategyName(DispatchStrategy strategy);

// Per-step flow breakdown. Every field is average power (kW) over the
// step, non-negative and rounded to 6 decimals.
struct EnergyFlows {
    double solar_to_load    = 0.0;
    double solar_to_battery = 0.0;   // drawn from solar, charge losses included
    double solar_to_grid    = 0.0;
    double battery_to_load  = 0.0;
    double grid_to_load     = 0.0;
    double unmet_load       = 0.0;   // == grid_to_load
    double curtailed        = 0.0;   // rejected by capacity or export cap
};

class DispatchPolicy {
public:
    virtual ~DispatchPolicy() = default;

    virtual EnergyFlows dispatch(double solar_kw, double load_kw,
                                 EnergyReservoir& battery, GridConnection& grid,
                                 double dt_h) const = 0;

    virtual DispatchStrategy strategy() const = 0;
};

std::unique_ptr<DispatchPolicy> makeDispatchPolicy(DispatchStrategy strategy);

// Routes solar and covers deficits each step according to one fixed
// strategy chosen at construction. Holds no state of its own.
class EnergyManagementSystem {
public:
    explicit EnergyManagementSystem(DispatchStrategy strategy = DispatchStrategy::LoadPriority);
    explicit EnergyManagementSystem(const std::string& strategy);

    EnergyFlows distributeEnergy(double solar_kw, double load_kw,
                                 EnergyReservoir& battery, GridConnection& grid,
                                 double dt_h) const;

    DispatchStrategy getStrategy() const { return policy_->strategy(); }

private:
    std::unique_ptr<DispatchPolicy> policy_;
};
