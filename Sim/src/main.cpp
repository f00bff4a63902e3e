// Sim/src/main.cpp
/**
Build (from repo root):
  cmake -S . -B build -DCMAKE_BUILD_TYPE=Release
  cmake --build build -j

Run (from build/):
  ./greengrid                                         // 30 days, summer, LOAD_PRIORITY
  ./greengrid --days 90 --season winter --seed 42
  ./greengrid --config ../input/greengrid.conf --strategy CHARGE_PRIORITY
  ./greengrid --compare strategies --seed 42          // same seed, all three strategies
  ./greengrid --compare seasons --no-telemetry

Per-run CSVs land in $GG_LOG_DIR/<run-id>/ (default data/raw/<run-id>/);
console diagnostics are mirrored to greengrid_debug_<RUN_ID>.log.
*/

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <fstream>
#include <sstream>
#include <vector>

#include "SimulationEngine.hpp"
#include "ResultsExporter.hpp"
#include "Logger.hpp"
#include "helpers.hpp"

using GreenGridHelpers::Args;
using GreenGridHelpers::LogFn;
using GreenGridHelpers::parse_args;
using GreenGridHelpers::print_usage;

static std::string default_run_id(const SimConfig& cfg, std::uint64_t seed) {
  std::ostringstream oss;
  oss << cfg.strategy << "_" << cfg.simulation.season << "_"
      << cfg.simulation.duration_days << "d_seed" << seed;
  return oss.str();
}

// Runs every variant back to back with one shared seed.
static int run_comparison(const Args& args, SimConfig base, LogFn log_msg) {
  if (!base.simulation.random_seed) {
    base.simulation.random_seed = GreenGridHelpers::generate_seed();
    std::ostringstream oss;
    oss << "[warn] No random seed configured; generated " << *base.simulation.random_seed
        << " for this comparison. Pass --seed to reproduce it.\n";
    log_msg(oss.str());
  }

  std::vector<std::string> labels;
  std::vector<SimConfig>   variants;
  if (args.compare == "strategies") {
    for (const char* s : {"LOAD_PRIORITY", "CHARGE_PRIORITY", "PRODUCE_PRIORITY"}) {
      SimConfig c = base;
      c.strategy = s;
      labels.push_back(s);
      variants.push_back(c);
    }
  } else if (args.compare == "seasons") {
    for (const char* s : {"spring", "summer", "fall", "winter"}) {
      SimConfig c = base;
      c.simulation.season = s;
      labels.push_back(s);
      variants.push_back(c);
    }
  } else {
    throw std::invalid_argument("Unknown compare mode '" + args.compare +
                                "'. Expected 'strategies' or 'seasons'.");
  }

  std::vector<RunResult> results;
  for (std::size_t i = 0; i < variants.size(); ++i) {
    std::ostringstream oss;
    oss << "[info] [" << (i + 1) << "/" << variants.size() << "] Running " << labels[i] << "\n";
    log_msg(oss.str());

    Logger::instance().setRunId(args.runId.empty()
        ? default_run_id(variants[i], *base.simulation.random_seed)
        : args.runId + "_" + labels[i]);

    SimulationEngine engine(variants[i]);
    results.push_back(engine.run());

    if (variants[i].telemetry) {
      ResultsExporter(results.back()).saveAll(variants[i]);
    }
  }

  std::cout << "\nComparison (" << args.compare << ", seed "
            << *base.simulation.random_seed << ")\n";
  printComparisonTable(std::cout, labels, results);
  return EXIT_SUCCESS;
}

int main(int argc, char** argv) {
  // ------------------------------------------------------------------------
  // Debug logger: mirrors messages to stderr and a per-run file.
  // Log file name: greengrid_debug_<RUN_ID>.log
  // ------------------------------------------------------------------------
  std::ofstream debugLog;
  LogFn log_msg = [&](const std::string& s) {
    std::cerr << s;
    if (debugLog.is_open()) {
      debugLog << s;
      debugLog.flush();
    }
  };

  {
    const char* env_run_id = std::getenv("RUN_ID");
    std::string run_id     = env_run_id ? env_run_id : "norunid";
    std::string filename   = "greengrid_debug_" + run_id + ".log";
    debugLog.open(filename, std::ios::out | std::ios::app);
    if (!debugLog) {
      std::cerr << "[warn] Failed to open " << filename << " for writing.\n";
    } else {
      debugLog << "============================================================\n";
      debugLog << "New run started (RUN_ID=" << run_id << ")\n";
      debugLog << "============================================================\n";
      debugLog.flush();
    }
  }

  try {
    Args args = parse_args(argc, argv);
    if (args.showHelp) {
      print_usage();
      return EXIT_SUCCESS;
    }

    // --------------------------------------------------------------------
    // Configuration: defaults < config file < CLI overrides
    // --------------------------------------------------------------------
    SimConfig cfg;
    if (!args.configPath.empty()) {
      GreenGridHelpers::load_config_file(args.configPath, cfg, log_msg);
    }
    for (const auto& o : args.overrides) {
      GreenGridHelpers::apply_override(cfg, o);
    }
    if (args.noTelemetry) cfg.telemetry = false;

    GreenGridHelpers::validate_config(cfg);

    {
      std::ostringstream oss;
      oss << "[info] Configuration:\n" << GreenGridHelpers::describe_config(cfg);
      oss << "[info] System: battery " << cfg.totalBatteryCapacityKwh() << " kWh, solar "
          << cfg.totalSolarPeakKw() << " kW peak, inverter "
          << cfg.totalInverterMaxKw() << " kW max\n";
      log_msg(oss.str());
    }

    if (!args.compare.empty()) {
      const int rc = run_comparison(args, cfg, log_msg);
      Logger::instance().closeAll();
      return rc;
    }

    // --------------------------------------------------------------------
    // Single run
    // --------------------------------------------------------------------
    SimulationEngine engine(cfg);
    {
      std::ostringstream oss;
      oss << "[info] Random seed: " << engine.getSeed()
          << (cfg.simulation.random_seed ? " (from config)" : " (auto-generated; add --seed to reproduce)")
          << "\n";
      oss << "[info] Simulating " << engine.getTotalSteps() << " steps of "
          << cfg.simulation.time_step_minutes << " min\n";
      log_msg(oss.str());
    }

    Logger::instance().setRunId(args.runId.empty()
        ? default_run_id(cfg, engine.getSeed())
        : args.runId);

    engine.initialize();
    const long steps_per_day = cfg.stepsPerDay();
    while (engine.tick()) {
      const long step = engine.getCurrentStep();
      if (step % (steps_per_day * 5) == 0) {
        std::ostringstream oss;
        oss << "[info] Day " << step / steps_per_day << "/" << cfg.simulation.duration_days
            << " completed\n";
        log_msg(oss.str());
      }
    }
    engine.shutdown();

    const RunResult result = engine.compileResults();
    for (const auto& e : result.events) {
      log_msg("[event] " + e.timestamp + " " + e.message + "\n");
    }

    ResultsExporter exporter(result);
    exporter.printSummary(std::cout);

    Logger::instance().setEnabled(true);
    const auto files = exporter.saveAll(cfg);
    {
      std::ostringstream oss;
      oss << "[info] Files saved:\n";
      for (const auto& f : files) oss << "  " << f << "\n";
      log_msg(oss.str());
    }

    Logger::instance().closeAll();
    return EXIT_SUCCESS;
  }
  catch (const std::exception& e) {
    std::ostringstream oss;
    oss << "[fatal] " << e.what() << "\n";
    log_msg(oss.str());
    return EXIT_FAILURE;
  }
}
