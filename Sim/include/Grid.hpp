#pragma once
#include "Subsystem.hpp"
#include "GridConnection.hpp"

// Energy ledger against the utility. Import is uncapped; export is capped
// in power (kW) and the cap is reapplied every call.
class Grid : public Subsystem, public GridConnection {
public:
    Grid(double import_cost_per_kwh,
         double export_revenue_per_kwh,
         double export_limit_kw);

    void initialize() override;
    void tick(const TickContext& ctx) override;
    void shutdown() override;

    double importEnergy(double power_kw, double dt_h) override;
    double exportEnergy(double power_kw, double dt_h) override;

    double getTotalImportedKwh() const { return imported_kwh_; }
    double getTotalExportedKwh() const { return exported_kwh_; }
    double getTotalCost() const { return import_cost_; }
    double getTotalRevenue() const { return export_revenue_; }
    // revenue - cost; positive is profit
    double getNetBalance() const { return export_revenue_ - import_cost_; }

    double getImportPrice() const { return import_price_; }
    double getExportPrice() const { return export_price_; }
    double getExportLimitKw() const { return export_limit_kw_; }

private:
    double import_price_;
    double export_price_;
    double export_limit_kw_;

    double imported_kwh_   = 0.0;
    double exported_kwh_   = 0.0;
    double import_cost_    = 0.0;
    double export_revenue_ = 0.0;
};
