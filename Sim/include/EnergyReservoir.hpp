#pragma once

// Storage capability the EMS dispatches against.
// All quantities are energy (kWh) over one step.
class EnergyReservoir {
public:
    virtual ~EnergyReservoir() = default;

    // Returns energy taken from the source, efficiency losses included.
    virtual double charge(double offered_kwh) = 0;

    // Returns energy actually delivered to the consumer.
    virtual double discharge(double requested_kwh) = 0;

    virtual double getSoc() const = 0;
};
