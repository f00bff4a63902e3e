#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Static run configuration. Defaults describe one 13.5 kWh battery, a
// 5 kW array behind a 5 kW inverter, and a 20 kW export cap.
struct SimConfig {
    struct SimulationParams {
        int         duration_days     = 30;
        int         time_step_minutes = 15;
        std::string season            = "summer";
        std::string start_date        = "2024-06-01";   // YYYY-MM-DD
        std::optional<std::uint64_t> random_seed;        // absent: generated
    } simulation;

    struct BatteryParams {
        double unit_capacity_kwh = 13.5;
        double efficiency        = 0.9;    // round trip
        double min_soc           = 0.05;   // fraction
        int    count             = 1;
    } battery;

    struct SolarParams {
        double unit_peak_power_kw = 5.0;
        int    count              = 1;
    } solar;

    struct InverterParams {
        double unit_max_output_kw         = 5.0;
        double failure_rate               = 0.005;  // per day
        int    min_failure_duration_hours = 4;
        int    max_failure_duration_hours = 72;
        int    count                      = 1;
    } inverter;

    struct LoadParams {
        double base_load_kw      = 0.5;
        double peak_hours_max_kw = 3.0;
        int    peak_hours_start  = 18;
        int    peak_hours_end    = 21;
    } load;

    struct GridParams {
        double import_cost_per_kwh    = 0.15;
        double export_revenue_per_kwh = 0.08;
        double export_limit_kw        = 20.0;
    } grid;

    std::string strategy = "LOAD_PRIORITY";

    // Write per-subsystem telemetry CSVs during the run.
    bool telemetry = true;

    double totalBatteryCapacityKwh() const { return battery.unit_capacity_kwh * battery.count; }
    double totalSolarPeakKw() const { return solar.unit_peak_power_kw * solar.count; }
    double totalInverterMaxKw() const { return inverter.unit_max_output_kw * inverter.count; }
    double timeStepHours() const { return simulation.time_step_minutes / 60.0; }
    long   totalSteps() const {
        return (static_cast<long>(simulation.duration_days) * 24 * 60) / simulation.time_step_minutes;
    }
    int    stepsPerDay() const { return (24 * 60) / simulation.time_step_minutes; }
};
