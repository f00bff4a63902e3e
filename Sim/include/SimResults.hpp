#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "EnergyManagementSystem.hpp"

// One row per simulated step. Power columns are kW averaged over the step.
struct StepRecord {
    std::string timestamp;          // YYYY-MM-DD HH:MM:SS at step start
    long        step = 0;
    double      hour = 0.0;         // hour of day, fractional
    double      solar_available_kw = 0.0;   // panel output before the inverter
    double      solar_generated_kw = 0.0;   // after clipping / failure
    double      load_demand_kw     = 0.0;
    double      cloud_coverage     = 0.0;
    double      battery_soc        = 0.0;   // percent, after dispatch
    EnergyFlows flows;
    bool        inverter_operational = true;
};

// One row per simulated day (and one for a trailing partial day).
struct DaySummary {
    int    day = 0;                       // 1-based
    double solar_generated_kwh = 0.0;     // excludes curtailment
    double load_consumed_kwh   = 0.0;
    double grid_imported_kwh   = 0.0;
    double grid_exported_kwh   = 0.0;
    double curtailed_kwh       = 0.0;
    double battery_soc_end     = 0.0;
    double self_sufficiency_percent = 0.0;
};

struct SimEvent {
    std::string timestamp;
    std::string message;
};

struct RunResult {
    struct Summary {
        int         duration_days = 0;
        std::string season;
        std::string strategy;
        double total_solar_generated_kwh = 0.0;
        double total_load_consumed_kwh   = 0.0;
        double total_grid_imported_kwh   = 0.0;
        double total_grid_exported_kwh   = 0.0;
        double total_curtailed_kwh       = 0.0;
        double self_sufficiency_percent  = 0.0;
    } summary;

    struct Financial {
        double total_import_cost    = 0.0;
        double total_export_revenue = 0.0;
        double net_cost             = 0.0;   // cost - revenue
    } financial;

    struct BatteryStats {
        double average_soc_percent = 0.0;
        double final_soc_percent   = 0.0;
        double capacity_kwh        = 0.0;
        int    count               = 0;
        long   times_full          = 0;
        long   times_empty         = 0;
    } battery;

    struct Reliability {
        int    inverter_failures       = 0;
        double inverter_downtime_hours = 0.0;
        double total_unmet_load_kwh    = 0.0;
        double hours_with_unmet_load   = 0.0;
        double unmet_load_percentage   = 0.0;
    } reliability;

    struct System {
        int battery_count       = 0;
        int solar_panel_count   = 0;
        int inverter_count      = 0;
    } system;

    std::uint64_t seed = 0;

    std::vector<StepRecord> steps;
    std::vector<DaySummary> days;
    std::vector<SimEvent>   events;
};
