#pragma once
#include "Subsystem.hpp"
#include "EnergyReservoir.hpp"

class Battery : public Subsystem, public EnergyReservoir {
public:
    // round_trip_efficiency in (0,1], min_soc as a fraction of capacity.
    Battery(double capacity_kwh = 13.5,
            double round_trip_efficiency = 0.9,
            double min_soc = 0.05);

    void initialize() override;
    void tick(const TickContext& ctx) override;
    void shutdown() override;

    double charge(double offered_kwh) override;
    double discharge(double requested_kwh) override;

    // Percentage 0..100
    double getSoc() const override;
    bool isFull(double threshold_pct = 99.9) const;
    bool isEmpty() const;

    double getCapacityKwh() const { return capacity_kwh_; }
    double getStoredKwh() const { return energy_kwh_; }
    double getMinEnergyKwh() const { return min_energy_kwh_; }
    double getAvailableSpaceKwh() const { return capacity_kwh_ - energy_kwh_; }
    double getOneWayEfficiency() const { return one_way_eff_; }
    double getMinSoc() const { return min_soc_; }

private:
    double capacity_kwh_;
    double efficiency_;       // round trip
    double min_soc_;
    double one_way_eff_;      // sqrt(efficiency_)
    double min_energy_kwh_;
    double energy_kwh_;       // current stored energy
};
