#include "SimulationEngine.hpp"
#include "Logger.hpp"
#include "helpers.hpp"

#include <sstream>

namespace {

// Validate and pin the seed so the run can be reproduced.
SimConfig prepared(const SimConfig& cfg) {
    GreenGridHelpers::validate_config(cfg);
    SimConfig out = cfg;
    if (!out.simulation.random_seed) {
        out.simulation.random_seed = GreenGridHelpers::generate_seed();
    }
    return out;
}

double selfSufficiency(double import_kwh, double load_kwh) {
    if (load_kwh <= 0.0) return 0.0;
    return (1.0 - import_kwh / load_kwh) * 100.0;
}

} // anonymous namespace

SimulationEngine::SimulationEngine(const SimConfig& cfg)
    : cfg_(prepared(cfg)),
      rng_(*cfg_.simulation.random_seed),
      battery_(cfg_.totalBatteryCapacityKwh(), cfg_.battery.efficiency, cfg_.battery.min_soc),
      inverter_(rng_,
                cfg_.totalInverterMaxKw(),
                cfg_.inverter.failure_rate,
                cfg_.inverter.min_failure_duration_hours,
                cfg_.inverter.max_failure_duration_hours),
      grid_(cfg_.grid.import_cost_per_kwh,
            cfg_.grid.export_revenue_per_kwh,
            cfg_.grid.export_limit_kw),
      solar_(cfg_.totalSolarPeakKw()),
      load_(rng_,
            cfg_.load.base_load_kw,
            cfg_.load.peak_hours_max_kw,
            cfg_.load.peak_hours_start,
            cfg_.load.peak_hours_end),
      clouds_(rng_, parseSeason(cfg_.simulation.season)),
      ems_(parseStrategy(cfg_.strategy)) {
    start_day_     = GreenGridHelpers::parse_date(cfg_.simulation.start_date);
    total_steps_   = cfg_.totalSteps();
    steps_per_day_ = cfg_.stepsPerDay();
    dt_h_          = cfg_.timeStepHours();

    // Order matters: the inverter's decay runs inside its tick
    subsystems_ = { &battery_, &grid_, &inverter_ };

    // First day's weather is drawn before any load or failure draw
    cloud_today_ = clouds_.getDailyCoverage();

    steps_.reserve(static_cast<std::size_t>(total_steps_));
}

void SimulationEngine::initialize() {
    if (initialized_) return;

    Logger::instance().setEnabled(cfg_.telemetry);
    for (auto* s : subsystems_) s->initialize();

    step_        = 0;
    current_day_ = 0;
    daily_       = DailyTotals{};
    initialized_ = true;
}

bool SimulationEngine::tick() {
    if (!initialized_) initialize();
    if (step_ >= total_steps_) return false;

    // Time always comes from the absolute step index
    const long   minutes   = step_ * cfg_.simulation.time_step_minutes;
    const double hour      = static_cast<double>(minutes % (24 * 60)) / 60.0;
    const std::string ts   = GreenGridHelpers::format_timestamp(start_day_, minutes);

    const double solar_available = solar_.generate(hour, cloud_today_);
    const double solar_generated = inverter_.applyLimit(solar_available);
    const double load_demand     = load_.generate(hour);

    const EnergyFlows flows = ems_.distributeEnergy(
        solar_generated, load_demand, battery_, grid_, dt_h_);

    StepRecord rec;
    rec.timestamp            = ts;
    rec.step                 = step_;
    rec.hour                 = hour;
    rec.solar_available_kw   = solar_available;
    rec.solar_generated_kw   = solar_generated;
    rec.load_demand_kw       = load_demand;
    rec.cloud_coverage       = cloud_today_;
    rec.battery_soc          = battery_.getSoc();
    rec.flows                = flows;
    rec.inverter_operational = inverter_.isOperational();
    steps_.push_back(rec);

    // Curtailed solar is not counted as generated
    daily_.solar_kwh     += (flows.solar_to_load + flows.solar_to_battery + flows.solar_to_grid) * dt_h_;
    daily_.load_kwh      += load_demand * dt_h_;
    daily_.import_kwh    += flows.grid_to_load * dt_h_;
    daily_.export_kwh    += flows.solar_to_grid * dt_h_;
    daily_.curtailed_kwh += flows.curtailed * dt_h_;

    logRow_(rec, static_cast<double>(step_) * dt_h_);

    // ---- advance ----
    step_ += 1;

    const bool was_down = !inverter_.isOperational();
    const TickContext ctx{ static_cast<int>(step_), static_cast<double>(step_) * dt_h_, dt_h_, hour };
    for (auto* s : subsystems_) s->tick(ctx);

    const std::string now = GreenGridHelpers::format_timestamp(
        start_day_, step_ * cfg_.simulation.time_step_minutes);

    if (was_down && inverter_.isOperational()) {
        logEvent_(now, "Inverter RESTORED");
    }

    if (step_ % steps_per_day_ == 0) {
        onDayBoundary_(now);
    }

    return true;
}

void SimulationEngine::onDayBoundary_(const std::string& timestamp) {
    closeDay_();
    if (step_ >= total_steps_) return;

    // One failure check per simulated day, then tomorrow's weather
    if (inverter_.checkFailure()) {
        ++inverter_failures_;
        std::ostringstream oss;
        oss << "Inverter FAILURE (duration: " << inverter_.getLastFailureDuration() << "h)";
        logEvent_(timestamp, oss.str());
    }

    cloud_today_ = clouds_.getDailyCoverage();
}

void SimulationEngine::closeDay_() {
    DaySummary d;
    d.day                      = current_day_ + 1;
    d.solar_generated_kwh      = daily_.solar_kwh;
    d.load_consumed_kwh        = daily_.load_kwh;
    d.grid_imported_kwh        = daily_.import_kwh;
    d.grid_exported_kwh        = daily_.export_kwh;
    d.curtailed_kwh            = daily_.curtailed_kwh;
    d.battery_soc_end          = battery_.getSoc();
    d.self_sufficiency_percent = selfSufficiency(daily_.import_kwh, daily_.load_kwh);
    days_.push_back(d);

    Logger::instance().log_wide(
        "SimulationEngine_daily", d.day, static_cast<double>(step_) * dt_h_,
        {"solar_kWh","load_kWh","import_kWh","export_kWh","curtailed_kWh",
         "battery_soc_end","self_sufficiency_pct"},
        {d.solar_generated_kwh, d.load_consumed_kwh, d.grid_imported_kwh,
         d.grid_exported_kwh, d.curtailed_kwh, d.battery_soc_end,
         d.self_sufficiency_percent}
    );

    daily_ = DailyTotals{};
    current_day_ += 1;
}

void SimulationEngine::shutdown() {
    // Trailing partial day
    if (daily_.solar_kwh > 0.0 || daily_.load_kwh > 0.0) {
        closeDay_();
    }
    for (auto* s : subsystems_) s->shutdown();
}

RunResult SimulationEngine::run() {
    initialize();
    while (tick()) {
    }
    shutdown();
    return compileResults();
}

void SimulationEngine::logEvent_(const std::string& timestamp, const std::string& message) {
    events_.push_back(SimEvent{timestamp, message});
    Logger::instance().log_text("SimulationEngine_events", timestamp, message);
}

void SimulationEngine::logRow_(const StepRecord& rec, double time_h) {
    const EnergyFlows& f = rec.flows;
    Logger::instance().log_wide(
        "SimulationEngine",
        static_cast<int>(rec.step),
        time_h,
        {
            "hour","solar_available_kW","solar_generated_kW","load_kW","cloud",
            "battery_soc","solar_to_load","solar_to_battery","solar_to_grid",
            "battery_to_load","grid_to_load","unmet_load","curtailed","inverter_ok"
        },
        {
            rec.hour, rec.solar_available_kw, rec.solar_generated_kw, rec.load_demand_kw,
            rec.cloud_coverage, rec.battery_soc, f.solar_to_load, f.solar_to_battery,
            f.solar_to_grid, f.battery_to_load, f.grid_to_load, f.unmet_load, f.curtailed,
            rec.inverter_operational ? 1.0 : 0.0
        }
    );
}

RunResult SimulationEngine::compileResults() const {
    RunResult r;

    r.summary.duration_days = cfg_.simulation.duration_days;
    r.summary.season        = seasonName(clouds_.getSeason());
    r.summary.strategy      = strategyName(ems_.getStrategy());
    for (const auto& d : days_) {
        r.summary.total_solar_generated_kwh += d.solar_generated_kwh;
        r.summary.total_load_consumed_kwh   += d.load_consumed_kwh;
        r.summary.total_grid_imported_kwh   += d.grid_imported_kwh;
        r.summary.total_grid_exported_kwh   += d.grid_exported_kwh;
        r.summary.total_curtailed_kwh       += d.curtailed_kwh;
    }
    r.summary.self_sufficiency_percent = selfSufficiency(
        r.summary.total_grid_imported_kwh, r.summary.total_load_consumed_kwh);

    // Priced from the recorded (rounded) flows so the sections agree
    r.financial.total_import_cost    = r.summary.total_grid_imported_kwh * grid_.getImportPrice();
    r.financial.total_export_revenue = r.summary.total_grid_exported_kwh * grid_.getExportPrice();
    r.financial.net_cost             = r.financial.total_import_cost - r.financial.total_export_revenue;

    const double full_threshold  = 100.0 - 0.1;
    const double empty_threshold = cfg_.battery.min_soc * 100.0 + 0.1;
    double soc_sum     = 0.0;
    long   down_steps  = 0;
    long   unmet_steps = 0;
    for (const auto& s : steps_) {
        soc_sum += s.battery_soc;
        if (s.battery_soc >= full_threshold)  ++r.battery.times_full;
        if (s.battery_soc <= empty_threshold) ++r.battery.times_empty;
        if (!s.inverter_operational) ++down_steps;
        if (s.flows.unmet_load > 0.0) ++unmet_steps;
    }

    r.battery.average_soc_percent = steps_.empty() ? 0.0 : soc_sum / static_cast<double>(steps_.size());
    r.battery.final_soc_percent   = battery_.getSoc();
    r.battery.capacity_kwh        = battery_.getCapacityKwh();
    r.battery.count               = cfg_.battery.count;

    const double total_hours = static_cast<double>(steps_.size()) * dt_h_;
    r.reliability.inverter_failures       = inverter_failures_;
    r.reliability.inverter_downtime_hours = static_cast<double>(down_steps) * dt_h_;
    r.reliability.total_unmet_load_kwh    = r.summary.total_grid_imported_kwh;
    r.reliability.hours_with_unmet_load   = static_cast<double>(unmet_steps) * dt_h_;
    r.reliability.unmet_load_percentage   =
        total_hours > 0.0 ? r.reliability.hours_with_unmet_load / total_hours * 100.0 : 0.0;

    r.system.battery_count     = cfg_.battery.count;
    r.system.solar_panel_count = cfg_.solar.count;
    r.system.inverter_count    = cfg_.inverter.count;

    r.seed   = rng_.seed();
    r.steps  = steps_;
    r.days   = days_;
    r.events = events_;
    return r;
}
