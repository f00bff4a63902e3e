#pragma once

// Utility-grid capability the EMS dispatches against.
class GridConnection {
public:
    virtual ~GridConnection() = default;

    // Buys power_kw for dt_h hours. Returns the cost of this import.
    virtual double importEnergy(double power_kw, double dt_h) = 0;

    // Sells up to the export cap. Returns the power actually exported (kW).
    virtual double exportEnergy(double power_kw, double dt_h) = 0;
};
