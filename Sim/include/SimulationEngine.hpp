#pragma once
#include <cstdint>
#include <memory>
#include <vector>

#include "Subsystem.hpp"
#include "SimConfig.hpp"
#include "SimResults.hpp"
#include "RandomSource.hpp"
#include "Battery.hpp"
#include "Inverter.hpp"
#include "Grid.hpp"
#include "SolarPanel.hpp"
#include "Load.hpp"
#include "CloudCoverage.hpp"
#include "EnergyManagementSystem.hpp"

class SimulationEngine {
public:
    // Validates cfg; throws std::invalid_argument on a bad configuration.
    explicit SimulationEngine(const SimConfig& cfg);
    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    void initialize();
    // Advance one step. Returns false once every step has run.
    bool tick();
    void shutdown();

    // initialize(), tick() until done, shutdown(), then compile results.
    RunResult run();

    RunResult compileResults() const;

    long getCurrentStep() const { return step_; }
    long getTotalSteps() const { return total_steps_; }
    std::uint64_t getSeed() const { return rng_.seed(); }
    double getCloudCoverage() const { return cloud_today_; }

    const Battery& getBattery() const { return battery_; }
    const Grid& getGrid() const { return grid_; }
    const Inverter& getInverter() const { return inverter_; }
    const EnergyManagementSystem& getEms() const { return ems_; }

    const std::vector<StepRecord>& getStepRecords() const { return steps_; }
    const std::vector<DaySummary>& getDaySummaries() const { return days_; }
    const std::vector<SimEvent>& getEvents() const { return events_; }

private:
    struct DailyTotals {
        double solar_kwh     = 0.0;
        double load_kwh      = 0.0;
        double import_kwh    = 0.0;
        double export_kwh    = 0.0;
        double curtailed_kwh = 0.0;
    };

    void onDayBoundary_(const std::string& timestamp);
    void closeDay_();
    void logEvent_(const std::string& timestamp, const std::string& message);
    void logRow_(const StepRecord& rec, double time_h);

    SimConfig cfg_;
    RandomSource rng_;

    Battery       battery_;
    Inverter      inverter_;
    Grid          grid_;
    SolarPanel    solar_;
    Load          load_;
    CloudCoverage clouds_;
    EnergyManagementSystem ems_;

    std::vector<Subsystem*> subsystems_;

    long   start_day_    = 0;
    long   total_steps_  = 0;
    long   steps_per_day_ = 0;
    double dt_h_         = 0.25;
    long   step_         = 0;
    int    current_day_  = 0;
    double cloud_today_  = 0.0;
    bool   initialized_  = false;

    DailyTotals daily_;
    std::vector<StepRecord> steps_;
    std::vector<DaySummary> days_;
    std::vector<SimEvent>   events_;
    int inverter_failures_ = 0;
};
