#include "Grid.hpp"
#include <algorithm>

Grid::Grid(double import_cost_per_kwh,
           double export_revenue_per_kwh,
           double export_limit_kw)
    : Subsystem("Grid"),
      import_price_(import_cost_per_kwh),
      export_price_(export_revenue_per_kwh),
      export_limit_kw_(export_limit_kw) {}

void Grid::initialize() {
    imported_kwh_   = 0.0;
    exported_kwh_   = 0.0;
    import_cost_    = 0.0;
    export_revenue_ = 0.0;
}

double Grid::importEnergy(double power_kw, double dt_h) {
    if (power_kw <= 0.0) return 0.0;

    const double energy = power_kw * dt_h;
    const double cost   = energy * import_price_;

    imported_kwh_ += energy;
    import_cost_  += cost;
    return cost;
}

double Grid::exportEnergy(double power_kw, double dt_h) {
    if (power_kw <= 0.0) return 0.0;

    // Cap POWER, not energy
    const double actual_kw = std::min(power_kw, export_limit_kw_);
    const double energy    = actual_kw * dt_h;

    exported_kwh_   += energy;
    export_revenue_ += energy * export_price_;
    return actual_kw;
}

void Grid::tick(const TickContext& ctx) {
    logState_(
        ctx.tick_index, ctx.time,
        {"imported_kWh","exported_kWh","import_cost","export_revenue","net_balance"},
        {imported_kwh_, exported_kwh_, import_cost_, export_revenue_, getNetBalance()}
    );
}

void Grid::shutdown() {}
