#include "SimulationEngine.hpp"
#include "Battery.hpp"
#include "Inverter.hpp"
#include "Grid.hpp"
#include "SolarPanel.hpp"
#include "Load.hpp"
#include "CloudCoverage.hpp"
#include "EnergyManagementSystem.hpp"
#include "RandomSource.hpp"
#include "ResultsExporter.hpp"
#include "Logger.hpp"
#include "helpers.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool near(double a, double b, double tol = 1e-6) {
    return std::fabs(a - b) <= tol;
}

// Quiet, seeded config for engine tests
static SimConfig small_config(int days, int step_minutes, std::uint64_t seed) {
    SimConfig cfg;
    cfg.simulation.duration_days     = days;
    cfg.simulation.time_step_minutes = step_minutes;
    cfg.simulation.random_seed       = seed;
    cfg.telemetry                    = false;
    return cfg;
}

template <typename Fn>
static bool throws_invalid_argument(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Battery
// ---------------------------------------------------------------------------
void test_battery_charge_efficiency() {
    // 30 kWh pack at 50% has 15 kWh headroom, enough for the full offer
    Battery battery(30.0, 0.9, 0.05);
    const double before = battery.getStoredKwh();

    const double consumed = battery.charge(10.0);
    const double stored   = battery.getStoredKwh() - before;

    assert(near(stored, 10.0 * std::sqrt(0.9), 1e-9));   // ~9.4868 kWh
    assert(near(consumed, 10.0, 1e-9));                   // losses paid by the source
    std::cout << "[PASS] Battery stores offer * sqrt(eff) and reports source energy.\n";
}

void test_battery_capacity_rejection() {
    Battery battery(13.5, 0.9, 0.05);   // starts at 6.75 kWh
    const double consumed = battery.charge(10.0);

    assert(near(battery.getStoredKwh(), 13.5, 1e-9));
    assert(battery.isFull());
    assert(near(consumed, 6.75 / std::sqrt(0.9), 1e-9));
    assert(consumed < 10.0);

    // Full battery takes nothing
    assert(near(battery.charge(5.0), 0.0, 1e-12));
    std::cout << "[PASS] Battery only rejects energy for lack of headroom.\n";
}

void test_battery_round_trip() {
    Battery battery(100.0, 0.9, 0.0);
    const double start = battery.getStoredKwh();

    battery.charge(10.0);
    const double delivered = battery.discharge(10.0 * 0.9);

    assert(near(delivered, 9.0, 1e-9));
    assert(near(battery.getStoredKwh(), start, 1e-9));
    std::cout << "[PASS] Charge then discharge recovers offer * round-trip efficiency.\n";
}

void test_battery_floor() {
    Battery battery(10.0, 1.0, 0.2);   // 5 kWh stored, 2 kWh floor
    const double delivered = battery.discharge(10.0);

    assert(near(delivered, 3.0, 1e-9));
    assert(battery.isEmpty());
    assert(near(battery.getSoc(), 20.0, 1e-9));
    assert(near(battery.discharge(1.0), 0.0, 1e-12));
    std::cout << "[PASS] Battery never discharges below min SoC.\n";
}

void test_battery_bounds() {
    RandomSource rng(2024);
    Battery battery(13.5, 0.92, 0.1);

    for (int i = 0; i < 5000; ++i) {
        if (rng.chance(0.5)) battery.charge(rng.uniform(0.0, 6.0));
        else                 battery.discharge(rng.uniform(0.0, 6.0));

        const double e = battery.getStoredKwh();
        assert(e >= battery.getMinEnergyKwh() - 1e-9);
        assert(e <= battery.getCapacityKwh() + 1e-9);
    }
    std::cout << "[PASS] Battery stayed within [min_energy, capacity].\n";
}

// ---------------------------------------------------------------------------
// Inverter
// ---------------------------------------------------------------------------
void test_inverter_clipping() {
    RandomSource rng(1);
    Inverter inv(rng, 4.0, 0.0);

    assert(near(inv.applyLimit(3.0), 3.0));
    assert(near(inv.applyLimit(5.0), 4.0));
    assert(near(inv.applyLimit(4.5), 4.0));

    for (int day = 0; day < 1000; ++day) {
        assert(!inv.checkFailure());
    }
    assert(inv.isOperational());
    std::cout << "[PASS] Inverter clips at max output and never fails at rate 0.\n";
}

void test_inverter_failure_cycle() {
    RandomSource rng(99);

    for (int trial = 0; trial < 50; ++trial) {
        Inverter inv(rng, 5.0, 1.0, 4, 72);
        assert(inv.checkFailure());
        assert(!inv.isOperational());

        const int duration = inv.getLastFailureDuration();
        assert(duration >= 4 && duration <= 72);
        assert(near(inv.applyLimit(100.0), 0.0));
        assert(near(inv.applyLimit(0.5), 0.0));

        // Already failing: no new failure
        assert(!inv.checkFailure());

        int hours_down = 0;
        while (!inv.isOperational()) {
            inv.update(1.0);
            ++hours_down;
        }
        assert(hours_down == duration);
        assert(near(inv.getFailureHoursRemaining(), 0.0));
        assert(near(inv.applyLimit(3.0), 3.0));
    }
    std::cout << "[PASS] Inverter failure lasts [min, max] hours and outputs 0 meanwhile.\n";
}

void test_inverter_forced_failure() {
    RandomSource rng(5);
    Inverter inv(rng, 5.0, 0.0);
    inv.forceFailure(2);

    assert(!inv.isOperational());
    assert(!inv.update(0.5));
    assert(!inv.update(1.0));
    assert(inv.update(0.5));   // restored by this call
    assert(inv.isOperational());
    std::cout << "[PASS] Inverter restores once remaining hours reach zero.\n";
}

void test_inverter_failure_has_hours() {
    RandomSource rng(17);

    assert(throws_invalid_argument([&] { Inverter inv(rng, 5.0, 1.0, 0, 0); }));
    assert(throws_invalid_argument([&] { Inverter inv(rng, 5.0, 1.0, 0, 6); }));
    assert(throws_invalid_argument([&] { Inverter inv(rng, 5.0, 1.0, 3, 2); }));

    // Shortest allowed outage: one hour, failing only while hours remain
    Inverter inv(rng, 5.0, 1.0, 1, 1);
    assert(inv.checkFailure());
    assert(inv.getLastFailureDuration() == 1);
    assert(!inv.isOperational());
    assert(inv.getFailureHoursRemaining() > 0.0);

    int quarters = 0;
    while (!inv.isOperational()) {
        inv.update(0.25);
        ++quarters;
        assert(inv.isOperational() == (inv.getFailureHoursRemaining() <= 0.0));
    }
    assert(quarters == 4);
    std::cout << "[PASS] Inverter failures always carry remaining hours.\n";
}

// ---------------------------------------------------------------------------
// Grid
// ---------------------------------------------------------------------------
void test_grid_export_cap() {
    Grid grid(0.15, 0.08, 20.0);

    for (double dt : {0.25, 0.5, 1.0, 3.0}) {
        assert(grid.exportEnergy(25.0, dt) == 20.0);
    }
    assert(near(grid.getTotalExportedKwh(), 20.0 * (0.25 + 0.5 + 1.0 + 3.0)));

    Grid g2(0.15, 0.08, 20.0);
    assert(near(g2.exportEnergy(8.0, 0.5), 8.0));
    assert(near(g2.getTotalExportedKwh(), 4.0));
    assert(near(g2.getTotalRevenue(), 0.32));
    std::cout << "[PASS] Grid export is capped in power for any step length.\n";
}

void test_grid_ledger() {
    Grid grid(0.15, 0.08, 20.0);

    const double cost = grid.importEnergy(2.0, 0.5);
    assert(near(cost, 0.15));
    grid.importEnergy(4.0, 1.0);
    grid.exportEnergy(3.0, 1.0);

    assert(near(grid.getTotalImportedKwh(), 5.0));
    assert(near(grid.getTotalCost(), 0.75));
    assert(near(grid.getTotalRevenue(), 0.24));
    assert(near(grid.getNetBalance(), 0.24 - 0.75));
    std::cout << "[PASS] Grid accumulates energy, cost and revenue.\n";
}

// ---------------------------------------------------------------------------
// Solar / Load / Clouds
// ---------------------------------------------------------------------------
void test_solar_profile() {
    SolarPanel panel(5.0);

    assert(near(panel.generate(0.0), 0.0));
    assert(near(panel.generate(5.99), 0.0));
    assert(near(panel.generate(18.0), 0.0));
    assert(near(panel.generate(23.5), 0.0));
    assert(near(panel.generate(6.0), 0.0));
    assert(near(panel.generate(12.0, 0.0), 5.0));
    assert(near(panel.generate(12.0, 0.5), 2.5));
    assert(near(panel.generate(9.0, 0.0), 5.0 * std::sin(3.141592653589793 / 4.0)));
    assert(near(panel.generate(9.0), panel.generate(15.0)));
    std::cout << "[PASS] Solar follows the 06-18 half-sine scaled by clouds.\n";
}

void test_load_ranges() {
    RandomSource rng(7);
    Load load(rng, 0.5, 3.0, 18, 21);

    for (int rep = 0; rep < 500; ++rep) {
        for (int h = 0; h < 24; ++h) {
            const double d = load.generate(h + 0.25);
            assert(d >= 0.5);

            if (h >= 18 && h < 21) {
                assert(d >= 1.5 && d <= 0.5 + 3.0 + 0.8);
            } else if (h == 6 || h == 12) {
                assert(d <= 0.5 + 1.5 + 0.8);
            } else if (h == 7 || h == 8) {
                assert(d <= 0.5 + 1.2 + 0.8);
            } else if (h == 22) {
                assert(d <= 0.5 + 1.0 + 0.8);
            } else {
                assert(d <= 0.5 + 0.8);
            }
        }
    }
    std::cout << "[PASS] Load stays inside base + peak/event + noise bounds.\n";
}

void test_cloud_coverage() {
    RandomSource rng(11);

    for (const char* s : {"spring", "summer", "fall", "Winter"}) {
        CloudCoverage clouds(rng, s);
        for (int i = 0; i < 2000; ++i) {
            const double c = clouds.getDailyCoverage();
            assert(c >= 0.0 && c < 0.9);

            const auto& band = CloudCoverage::coverageRanges()[clouds.getLastLevel()];
            assert(c >= band[0] && c < band[1]);
        }
    }

    assert(throws_invalid_argument([&] { CloudCoverage bad(rng, "monsoon"); }));
    assert(throws_invalid_argument([] { parseSeason(""); }));
    std::cout << "[PASS] Cloud coverage stays in its level band; bad season rejected.\n";
}

// ---------------------------------------------------------------------------
// EMS
// ---------------------------------------------------------------------------
void test_load_priority_excess() {
    Battery battery(100.0, 0.9, 0.05);
    Grid grid(0.15, 0.08, 20.0);
    EnergyManagementSystem ems(DispatchStrategy::LoadPriority);

    const EnergyFlows f = ems.distributeEnergy(10.0, 3.0, battery, grid, 1.0);
    assert(near(f.solar_to_load, 3.0));
    assert(f.solar_to_battery > 0.0);
    assert(near(f.solar_to_battery, 7.0));
    assert(near(f.solar_to_grid, 0.0));
    assert(near(f.grid_to_load, 0.0));
    assert(near(f.unmet_load, 0.0));
    assert(near(f.curtailed, 0.0));
    std::cout << "[PASS] LOAD_PRIORITY covers load, then charges.\n";
}

void test_load_priority_full_battery_exports() {
    Battery battery(10.0, 1.0, 0.0);   // 5 kWh headroom
    Grid grid(0.15, 0.08, 1.0);
    EnergyManagementSystem ems(DispatchStrategy::LoadPriority);

    const EnergyFlows f = ems.distributeEnergy(10.0, 3.0, battery, grid, 1.0);
    assert(near(f.solar_to_load, 3.0));
    assert(near(f.solar_to_battery, 5.0));
    assert(near(f.solar_to_grid, 1.0));    // export cap
    assert(near(f.curtailed, 1.0));
    std::cout << "[PASS] LOAD_PRIORITY exports battery rejects and curtails past the cap.\n";
}

void test_load_priority_deficit() {
    Battery battery(10.0, 1.0, 0.2);   // 3 kWh above floor
    Grid grid(0.15, 0.08, 20.0);
    EnergyManagementSystem ems("LOAD_PRIORITY");

    const EnergyFlows f = ems.distributeEnergy(2.0, 7.0, battery, grid, 1.0);
    assert(near(f.solar_to_load, 2.0));
    assert(near(f.battery_to_load, 3.0));
    assert(near(f.grid_to_load, 2.0));
    assert(near(f.unmet_load, f.grid_to_load));
    assert(near(grid.getTotalImportedKwh(), 2.0));
    std::cout << "[PASS] LOAD_PRIORITY deficit: solar, battery, then grid.\n";
}

void test_charge_priority() {
    {
        Battery battery(100.0, 0.9, 0.05);
        Grid grid(0.15, 0.08, 20.0);
        EnergyManagementSystem ems(DispatchStrategy::ChargePriority);

        const double before = battery.getStoredKwh();
        const EnergyFlows f = ems.distributeEnergy(10.0, 3.0, battery, grid, 1.0);
        assert(near(f.solar_to_battery, 10.0));
        assert(near(f.solar_to_load, 0.0));
        assert(near(f.grid_to_load, 3.0));
        assert(near(f.battery_to_load, 0.0));   // never drawn in the same step
        assert(battery.getStoredKwh() > before);
    }
    {
        Battery battery(10.0, 1.0, 0.0);
        Grid grid(0.15, 0.08, 20.0);
        EnergyManagementSystem ems(DispatchStrategy::ChargePriority);

        const EnergyFlows f = ems.distributeEnergy(10.0, 3.0, battery, grid, 1.0);
        assert(near(f.solar_to_battery, 5.0));
        assert(near(f.solar_to_load, 3.0));
        assert(near(f.solar_to_grid, 2.0));
        assert(near(f.grid_to_load, 0.0));
    }
    {
        // Deficit branch does not charge
        Battery battery(10.0, 1.0, 0.0);
        Grid grid(0.15, 0.08, 20.0);
        EnergyManagementSystem ems(DispatchStrategy::ChargePriority);

        const EnergyFlows f = ems.distributeEnergy(1.0, 4.0, battery, grid, 1.0);
        assert(near(f.solar_to_battery, 0.0));
        assert(near(f.solar_to_load, 1.0));
        assert(near(f.battery_to_load, 3.0));
    }
    std::cout << "[PASS] CHARGE_PRIORITY charges first and imports for the gap.\n";
}

void test_produce_priority() {
    {
        Battery battery(100.0, 1.0, 0.05);
        Grid grid(0.15, 0.08, 20.0);
        EnergyManagementSystem ems(DispatchStrategy::ProducePriority);

        const EnergyFlows f = ems.distributeEnergy(25.0, 3.0, battery, grid, 1.0);
        assert(f.solar_to_grid == 20.0);
        assert(near(f.solar_to_battery, 5.0));
        assert(near(f.solar_to_load, 0.0));
        assert(near(f.battery_to_load, 3.0));
        assert(near(f.grid_to_load, 0.0));
        assert(near(f.curtailed, 0.0));
    }
    {
        // Full battery: the capped remainder serves the load, the rest is curtailed
        Battery battery(10.0, 1.0, 0.0);
        battery.charge(100.0);
        Grid grid(0.15, 0.08, 20.0);
        EnergyManagementSystem ems(DispatchStrategy::ProducePriority);

        const EnergyFlows f = ems.distributeEnergy(25.0, 3.0, battery, grid, 1.0);
        assert(f.solar_to_grid == 20.0);
        assert(near(f.solar_to_battery, 0.0));
        assert(near(f.solar_to_load, 3.0));
        assert(near(f.curtailed, 2.0));
    }
    {
        // Export and import in the same step
        Battery battery(10.0, 0.9, 0.5);   // starts on its floor
        Grid grid(0.15, 0.08, 20.0);
        EnergyManagementSystem ems(DispatchStrategy::ProducePriority);

        const EnergyFlows f = ems.distributeEnergy(2.0, 5.0, battery, grid, 1.0);
        assert(near(f.solar_to_grid, 2.0));
        assert(near(f.battery_to_load, 0.0));
        assert(near(f.grid_to_load, 5.0));
        assert(near(grid.getTotalExportedKwh(), 2.0));
        assert(near(grid.getTotalImportedKwh(), 5.0));
    }
    std::cout << "[PASS] PRODUCE_PRIORITY exports up to the cap first.\n";
}

void test_dispatch_conservation() {
    RandomSource rng(31337);

    for (auto strategy : {DispatchStrategy::LoadPriority,
                          DispatchStrategy::ChargePriority,
                          DispatchStrategy::ProducePriority}) {
        Battery battery(13.5, 0.9, 0.05);
        Grid grid(0.15, 0.08, 5.0);
        EnergyManagementSystem ems(strategy);
        assert(ems.getStrategy() == strategy);

        for (int i = 0; i < 5000; ++i) {
            const double solar = rng.chance(0.2) ? 0.0 : rng.uniform(0.0, 12.0);
            const double load  = rng.uniform(0.0, 8.0);
            const double dt    = 0.25;

            const EnergyFlows f = ems.distributeEnergy(solar, load, battery, grid, dt);

            for (double v : {f.solar_to_load, f.solar_to_battery, f.solar_to_grid,
                             f.battery_to_load, f.grid_to_load, f.unmet_load, f.curtailed}) {
                assert(v >= 0.0);
            }
            assert(f.unmet_load == f.grid_to_load);
            assert(f.solar_to_grid <= 5.0);
            assert(f.solar_to_load + f.solar_to_battery + f.solar_to_grid + f.curtailed
                   <= solar + 1e-5);
            assert(f.battery_to_load + f.solar_to_load + f.grid_to_load >= load - 1e-5);

            const double e = battery.getStoredKwh();
            assert(e >= battery.getMinEnergyKwh() - 1e-9);
            assert(e <= battery.getCapacityKwh() + 1e-9);
        }
    }
    std::cout << "[PASS] Every strategy conserves solar and fully serves load.\n";
}

void test_strategy_names() {
    assert(parseStrategy("LOAD_PRIORITY") == DispatchStrategy::LoadPriority);
    assert(parseStrategy("charge_priority") == DispatchStrategy::ChargePriority);
    assert(parseStrategy("Produce_Priority") == DispatchStrategy::ProducePriority);
    assert(strategyName(DispatchStrategy::ChargePriority) == "CHARGE_PRIORITY");

    assert(throws_invalid_argument([] { parseStrategy("PEAK_SHAVING"); }));
    assert(throws_invalid_argument([] { EnergyManagementSystem ems("foo"); }));
    std::cout << "[PASS] Unknown strategy names fail fast.\n";
}

// ---------------------------------------------------------------------------
// Config / calendar
// ---------------------------------------------------------------------------
void test_config_overrides_and_validation() {
    SimConfig cfg;
    GreenGridHelpers::apply_override(cfg, "simulation.duration_days=7");
    GreenGridHelpers::apply_override(cfg, "battery.count = 2");
    GreenGridHelpers::apply_override(cfg, "energy_management.strategy=PRODUCE_PRIORITY");
    GreenGridHelpers::apply_override(cfg, "simulation.random_seed=123");

    assert(cfg.simulation.duration_days == 7);
    assert(near(cfg.totalBatteryCapacityKwh(), 27.0));
    assert(cfg.strategy == "PRODUCE_PRIORITY");
    assert(cfg.simulation.random_seed && *cfg.simulation.random_seed == 123);
    GreenGridHelpers::validate_config(cfg);

    assert(throws_invalid_argument([&] { GreenGridHelpers::apply_override(cfg, "battery.colour=red"); }));
    assert(throws_invalid_argument([&] { GreenGridHelpers::apply_override(cfg, "battery.count=two"); }));
    assert(throws_invalid_argument([&] { GreenGridHelpers::apply_override(cfg, "no_equals_sign"); }));

    // Booleans are case-insensitive
    GreenGridHelpers::apply_override(cfg, "simulation.telemetry=OFF");
    assert(!cfg.telemetry);
    GreenGridHelpers::apply_override(cfg, "simulation.telemetry = True");
    assert(cfg.telemetry);
    assert(throws_invalid_argument([&] { GreenGridHelpers::apply_override(cfg, "simulation.telemetry=maybe"); }));

    SimConfig bad_step = cfg;
    bad_step.simulation.time_step_minutes = 7;
    assert(throws_invalid_argument([&] { GreenGridHelpers::validate_config(bad_step); }));

    SimConfig bad_eff = cfg;
    bad_eff.battery.efficiency = 1.5;
    assert(throws_invalid_argument([&] { GreenGridHelpers::validate_config(bad_eff); }));

    SimConfig bad_season = cfg;
    bad_season.simulation.season = "monsoon";
    assert(throws_invalid_argument([&] { SimulationEngine engine(bad_season); }));

    SimConfig bad_strategy = cfg;
    bad_strategy.strategy = "RANDOM";
    assert(throws_invalid_argument([&] { SimulationEngine engine(bad_strategy); }));

    SimConfig bad_fail = cfg;
    bad_fail.inverter.min_failure_duration_hours = 10;
    bad_fail.inverter.max_failure_duration_hours = 5;
    assert(throws_invalid_argument([&] { GreenGridHelpers::validate_config(bad_fail); }));

    SimConfig zero_fail = cfg;
    zero_fail.inverter.min_failure_duration_hours = 0;
    zero_fail.inverter.max_failure_duration_hours = 0;
    assert(throws_invalid_argument([&] { GreenGridHelpers::validate_config(zero_fail); }));
    assert(throws_invalid_argument([&] { SimulationEngine engine(zero_fail); }));
    std::cout << "[PASS] Config overrides apply and validation rejects bad values.\n";
}

void test_config_file() {
    const fs::path path = fs::temp_directory_path() / "greengrid_test.conf";
    {
        std::ofstream out(path);
        out << "# comment line\n"
            << "\n"
            << "simulation.season = winter   # trailing comment\n"
            << "grid.export_limit_kw = 7.5\n"
            << "this line is malformed\n"
            << "load.base_load_kw = abc\n";
    }

    SimConfig cfg;
    int warnings = 0;
    GreenGridHelpers::load_config_file(path.string(), cfg, [&](const std::string& s) {
        if (s.find("[warn]") != std::string::npos) ++warnings;
    });

    assert(cfg.simulation.season == "winter");
    assert(near(cfg.grid.export_limit_kw, 7.5));
    assert(near(cfg.load.base_load_kw, 0.5));   // bad value skipped
    assert(warnings == 2);

    fs::remove(path);

    bool threw = false;
    try {
        GreenGridHelpers::load_config_file("/nonexistent/greengrid.conf", cfg, nullptr);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Config file parsing skips bad lines and reports them.\n";
}

void test_timestamps() {
    using GreenGridHelpers::format_timestamp;
    using GreenGridHelpers::parse_date;

    assert(format_timestamp(parse_date("2024-06-01"), 0) == "2024-06-01 00:00:00");
    assert(format_timestamp(parse_date("2024-02-28"), 24 * 60 + 30) == "2024-02-29 00:30:00");
    assert(format_timestamp(parse_date("2023-02-28"), 24 * 60) == "2023-03-01 00:00:00");
    assert(format_timestamp(parse_date("2023-12-31"), 24 * 60 + 15) == "2024-01-01 00:15:00");
    assert(format_timestamp(parse_date("2024-06-01"), 365L * 24 * 60 - 15) == "2025-05-31 23:45:00");

    assert(throws_invalid_argument([] { parse_date("2023-02-29"); }));
    assert(throws_invalid_argument([] { parse_date("June 1st"); }));
    std::cout << "[PASS] Timestamps come from calendar arithmetic on the step index.\n";
}

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------
void test_engine_step_count_and_time() {
    SimulationEngine engine(small_config(3, 15, 7));
    const RunResult r = engine.run();

    assert(r.steps.size() == 3u * 96u);
    assert(r.days.size() == 3u);
    assert(r.seed == 7u);

    assert(r.steps[0].timestamp == "2024-06-01 00:00:00");
    assert(r.steps[95].timestamp == "2024-06-01 23:45:00");
    assert(r.steps[96].timestamp == "2024-06-02 00:00:00");
    assert(r.steps.back().timestamp == "2024-06-03 23:45:00");
    assert(near(r.steps[96].hour, 0.0));
    assert(near(r.steps.back().hour, 23.75));

    for (std::size_t i = 0; i < r.steps.size(); ++i) {
        assert(r.steps[i].step == static_cast<long>(i));
        // One cloud value per day
        assert(r.steps[i].cloud_coverage == r.steps[(i / 96) * 96].cloud_coverage);
        if (r.steps[i].hour < 6.0 || r.steps[i].hour >= 18.0) {
            assert(r.steps[i].solar_available_kw == 0.0);
        }
    }
    std::cout << "[PASS] Engine runs days*24*60/step steps with drift-free time.\n";
}

void test_engine_day_summaries() {
    SimulationEngine engine(small_config(4, 30, 21));
    const RunResult r = engine.run();

    assert(r.days.size() == 4u);
    const double dt = 0.5;
    double load_total = 0.0;
    double import_total = 0.0;
    for (std::size_t d = 0; d < r.days.size(); ++d) {
        const DaySummary& day = r.days[d];
        assert(day.day == static_cast<int>(d) + 1);

        double load = 0.0, imported = 0.0;
        for (std::size_t i = d * 48; i < (d + 1) * 48; ++i) {
            load     += r.steps[i].load_demand_kw * dt;
            imported += r.steps[i].flows.grid_to_load * dt;
        }
        assert(near(day.load_consumed_kwh, load, 1e-9));
        assert(near(day.grid_imported_kwh, imported, 1e-9));
        assert(near(day.self_sufficiency_percent, (1.0 - imported / load) * 100.0, 1e-9));
        assert(near(day.battery_soc_end, r.steps[(d + 1) * 48 - 1].battery_soc, 1e-9));

        load_total   += load;
        import_total += imported;
    }

    assert(near(r.summary.total_load_consumed_kwh, load_total, 1e-9));
    assert(near(r.summary.total_grid_imported_kwh, import_total, 1e-9));
    assert(near(r.reliability.total_unmet_load_kwh, import_total, 1e-9));
    assert(r.summary.strategy == "LOAD_PRIORITY");
    assert(r.summary.season == "summer");
    assert(r.battery.count == 1);
    assert(r.reliability.unmet_load_percentage >= 0.0 && r.reliability.unmet_load_percentage <= 100.0);

    // Financials are priced from the same recorded energy as the summary
    assert(r.financial.total_import_cost == r.summary.total_grid_imported_kwh * 0.15);
    assert(r.financial.total_export_revenue == r.summary.total_grid_exported_kwh * 0.08);
    assert(near(r.financial.net_cost,
                r.financial.total_import_cost - r.financial.total_export_revenue, 1e-12));
    std::cout << "[PASS] Daily summaries aggregate their steps.\n";
}

void test_engine_inverter_outages() {
    SimConfig cfg = small_config(3, 60, 5);
    cfg.inverter.failure_rate = 1.0;
    cfg.inverter.min_failure_duration_hours = 4;
    cfg.inverter.max_failure_duration_hours = 4;

    SimulationEngine engine(cfg);
    const RunResult r = engine.run();

    // Day 1 has no check; day 2 and day 3 both start with a 4 h outage
    assert(r.reliability.inverter_failures == 2);
    assert(near(r.reliability.inverter_downtime_hours, 8.0));
    for (long s : {24L, 25L, 26L, 27L, 48L, 51L}) {
        assert(!r.steps[s].inverter_operational);
        assert(r.steps[s].solar_generated_kw == 0.0);
    }
    assert(r.steps[23].inverter_operational);
    assert(r.steps[28].inverter_operational);

    assert(r.events.size() == 4u);
    assert(r.events[0].timestamp == "2024-06-02 00:00:00");
    assert(r.events[0].message.find("FAILURE") != std::string::npos);
    assert(r.events[1].timestamp == "2024-06-02 04:00:00");
    assert(r.events[1].message.find("RESTORED") != std::string::npos);
    assert(r.events[0].message == "Inverter FAILURE (duration: 4h)");

    // No check after the last simulated day
    SimConfig one_day = cfg;
    one_day.simulation.duration_days = 1;
    SimulationEngine single(one_day);
    const RunResult r1 = single.run();
    assert(r1.reliability.inverter_failures == 0);
    assert(r1.events.empty());
    assert(single.getInverter().isOperational());
    std::cout << "[PASS] Engine checks the inverter once per day and logs transitions.\n";
}

void test_same_seed_across_strategies() {
    std::vector<RunResult> runs;
    for (const char* s : {"LOAD_PRIORITY", "CHARGE_PRIORITY", "PRODUCE_PRIORITY"}) {
        SimConfig cfg = small_config(10, 15, 4242);
        cfg.strategy = s;
        cfg.inverter.failure_rate = 0.2;
        SimulationEngine engine(cfg);
        runs.push_back(engine.run());
    }

    for (std::size_t k = 1; k < runs.size(); ++k) {
        assert(runs[k].steps.size() == runs[0].steps.size());
        for (std::size_t i = 0; i < runs[0].steps.size(); ++i) {
            const StepRecord& a = runs[0].steps[i];
            const StepRecord& b = runs[k].steps[i];
            assert(a.solar_available_kw == b.solar_available_kw);
            assert(a.cloud_coverage == b.cloud_coverage);
            assert(a.load_demand_kw == b.load_demand_kw);
            assert(a.inverter_operational == b.inverter_operational);
        }
    }

    // Same strategy and seed reproduces the flows too
    SimConfig cfg = small_config(10, 15, 4242);
    cfg.inverter.failure_rate = 0.2;
    SimulationEngine replay(cfg);
    const RunResult r = replay.run();
    for (std::size_t i = 0; i < r.steps.size(); ++i) {
        assert(r.steps[i].flows.grid_to_load == runs[0].steps[i].flows.grid_to_load);
        assert(r.steps[i].battery_soc == runs[0].steps[i].battery_soc);
    }
    std::cout << "[PASS] Same seed gives identical weather and load across strategies.\n";
}

void test_generated_seed_reported() {
    SimConfig cfg = small_config(1, 60, 0);
    cfg.simulation.random_seed.reset();

    SimulationEngine engine(cfg);
    const RunResult r = engine.run();
    assert(r.seed == engine.getSeed());
    assert(r.seed < 2147483647ULL);

    SimulationEngine replay(small_config(1, 60, r.seed));
    const RunResult r2 = replay.run();
    for (std::size_t i = 0; i < r.steps.size(); ++i) {
        assert(r.steps[i].load_demand_kw == r2.steps[i].load_demand_kw);
    }
    std::cout << "[PASS] A generated seed is reported and reproduces the run.\n";
}

// ---------------------------------------------------------------------------
// Logger / export
// ---------------------------------------------------------------------------
static std::vector<std::string> read_lines(const fs::path& p) {
    std::vector<std::string> lines;
    std::ifstream in(p);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

void test_logger_wide_rows() {
    Logger& log = Logger::instance();
    log.setEnabled(true);
    log.setRunId("logger_check");

    log.log_wide("Sample", 1, 0.25, {"a","b"}, {1.0, 2.0});
    log.log_wide("Sample", 2, 0.5, {"a","b"}, {3.0});
    log.log_text("SampleEvents", "2024-06-01 00:00:00", "hello, world");
    const fs::path dir = log.getRunDir();
    log.closeAll();

    const auto wide = read_lines(dir / "Sample.csv");
    assert(wide.size() == 3u);
    assert(wide[0] == "tick,time_h,a,b");
    assert(wide[1] == "1,0.25,1,2");
    assert(wide[2] == "2,0.5,3,0");

    const auto text = read_lines(dir / "SampleEvents.csv");
    assert(text.size() == 2u);
    assert(text[1] == "2024-06-01 00:00:00,\"hello, world\"");

    log.setEnabled(false);
    std::cout << "[PASS] Logger writes headers once and pads short rows.\n";
}

void test_events_csv_quoting() {
    RunResult r;
    r.events.push_back(SimEvent{"2024-06-01 06:00:00", "Inverter RESTORED"});
    r.events.push_back(SimEvent{"2024-06-02 00:00:00", "Operator note: \"reset\", then resumed"});

    const fs::path dir = fs::temp_directory_path() / "greengrid_events_quoting";
    ResultsExporter(r).saveEvents(dir.string());

    const auto lines = read_lines(dir / "Events.csv");
    assert(lines.size() == 3u);
    assert(lines[0] == "timestamp,message");
    assert(lines[1] == "2024-06-01 06:00:00,Inverter RESTORED");
    assert(lines[2] == "2024-06-02 00:00:00,\"Operator note: \"\"reset\"\", then resumed\"");

    assert(Logger::csvField("plain") == "plain");
    assert(Logger::csvField("a,b") == "\"a,b\"");

    fs::remove_all(dir);
    std::cout << "[PASS] Event messages are escaped like Logger text rows.\n";
}

void test_results_export() {
    SimConfig cfg = small_config(2, 60, 77);
    SimulationEngine engine(cfg);
    const RunResult r = engine.run();

    Logger& log = Logger::instance();
    log.setEnabled(true);
    log.setRunId("export_check");
    const auto files = ResultsExporter(r).saveAll(cfg);
    const fs::path dir = log.getRunDir();
    log.closeAll();
    log.setEnabled(false);

    assert(files.size() == 5u);
    assert(read_lines(dir / "StepRecords.csv").size() == r.steps.size() + 1);
    assert(read_lines(dir / "DailySummaries.csv").size() == r.days.size() + 1);
    assert(read_lines(dir / "Events.csv").size() == r.events.size() + 1);

    const auto conf = read_lines(dir / "config.txt");
    bool has_seed = false;
    for (const auto& l : conf) {
        if (l == "simulation.random_seed = 77") has_seed = true;
    }
    assert(has_seed);
    assert(read_lines(dir / "Summary.csv").size() > 20u);
    std::cout << "[PASS] Exporter writes one CSV row per step, day and event.\n";
}

int main() {
    Logger::instance().setEnabled(false);

    test_battery_charge_efficiency();
    test_battery_capacity_rejection();
    test_battery_round_trip();
    test_battery_floor();
    test_battery_bounds();

    test_inverter_clipping();
    test_inverter_failure_cycle();
    test_inverter_forced_failure();
    test_inverter_failure_has_hours();

    test_grid_export_cap();
    test_grid_ledger();

    test_solar_profile();
    test_load_ranges();
    test_cloud_coverage();

    test_load_priority_excess();
    test_load_priority_full_battery_exports();
    test_load_priority_deficit();
    test_charge_priority();
    test_produce_priority();
    test_dispatch_conservation();
    test_strategy_names();

    test_config_overrides_and_validation();
    test_config_file();
    test_timestamps();

    test_engine_step_count_and_time();
    test_engine_day_summaries();
    test_engine_inverter_outages();
    test_same_seed_across_strategies();
    test_generated_seed_reported();

    test_logger_wide_rows();
    test_events_csv_quoting();
    test_results_export();

    std::cout << "All tests passed.\n";
    return 0;
}
