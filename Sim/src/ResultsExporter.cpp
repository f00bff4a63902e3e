#include "ResultsExporter.hpp"
#include "Logger.hpp"
#include "helpers.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::ofstream open_csv(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("ResultsExporter: cannot create " +
                                 path.parent_path().string() + " : " + ec.message());
    }
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("ResultsExporter: cannot open " + path.string());
    }
    out << std::setprecision(10);
    return out;
}

} // anonymous namespace

ResultsExporter::ResultsExporter(const RunResult& result) : result_(result) {}

std::vector<std::string> ResultsExporter::saveAll(const SimConfig& cfg) const {
    const std::string dir = Logger::instance().getRunDir();

    std::vector<std::string> written;
    written.push_back(saveStepRecords(dir));
    written.push_back(saveDaySummaries(dir));
    written.push_back(saveEvents(dir));
    written.push_back(saveConfig(dir, cfg));
    saveSummary();
    written.push_back((fs::path(dir) / "Summary.csv").string());
    return written;
}

std::string ResultsExporter::saveStepRecords(const std::string& dir) const {
    const fs::path path = fs::path(dir) / "StepRecords.csv";
    std::ofstream out = open_csv(path);

    out << "timestamp,step,hour,solar_generated_kw,solar_available_kw,load_demand_kw,"
           "cloud_coverage,battery_soc,solar_to_load,solar_to_battery,solar_to_grid,"
           "battery_to_load,grid_to_load,unmet_load,curtailed,inverter_operational\n";

    for (const auto& s : result_.steps) {
        const EnergyFlows& f = s.flows;
        out << s.timestamp << ',' << s.step << ',' << s.hour << ','
            << s.solar_generated_kw << ',' << s.solar_available_kw << ','
            << s.load_demand_kw << ',' << s.cloud_coverage << ',' << s.battery_soc << ','
            << f.solar_to_load << ',' << f.solar_to_battery << ',' << f.solar_to_grid << ','
            << f.battery_to_load << ',' << f.grid_to_load << ',' << f.unmet_load << ','
            << f.curtailed << ',' << (s.inverter_operational ? 1 : 0) << '\n';
    }
    return path.string();
}

std::string ResultsExporter::saveDaySummaries(const std::string& dir) const {
    const fs::path path = fs::path(dir) / "DailySummaries.csv";
    std::ofstream out = open_csv(path);

    out << "day,solar_generated_kwh,load_consumed_kwh,grid_imported_kwh,"
           "grid_exported_kwh,curtailed_kwh,battery_soc_end,self_sufficiency_percent\n";

    for (const auto& d : result_.days) {
        out << d.day << ',' << d.solar_generated_kwh << ',' << d.load_consumed_kwh << ','
            << d.grid_imported_kwh << ',' << d.grid_exported_kwh << ','
            << d.curtailed_kwh << ',' << d.battery_soc_end << ','
            << d.self_sufficiency_percent << '\n';
    }
    return path.string();
}

std::string ResultsExporter::saveEvents(const std::string& dir) const {
    const fs::path path = fs::path(dir) / "Events.csv";
    std::ofstream out = open_csv(path);

    out << "timestamp,message\n";
    for (const auto& e : result_.events) {
        out << Logger::csvField(e.timestamp) << ',' << Logger::csvField(e.message) << '\n';
    }
    return path.string();
}

std::string ResultsExporter::saveConfig(const std::string& dir, const SimConfig& cfg) const {
    const fs::path path = fs::path(dir) / "config.txt";
    std::ofstream out = open_csv(path);

    // The seed actually used, so the file can be fed back with --config
    SimConfig used = cfg;
    used.simulation.random_seed = result_.seed;
    out << "# GreenGrid run configuration\n"
        << GreenGridHelpers::describe_config(used);
    return path.string();
}

void ResultsExporter::saveSummary() const {
    const RunResult& r = result_;
    const double days  = static_cast<double>(r.summary.duration_days);

    std::map<std::string, double> values{
        {"summary.duration_days",               days},
        {"summary.total_solar_generated_kwh",   r.summary.total_solar_generated_kwh},
        {"summary.total_load_consumed_kwh",     r.summary.total_load_consumed_kwh},
        {"summary.total_grid_imported_kwh",     r.summary.total_grid_imported_kwh},
        {"summary.total_grid_exported_kwh",     r.summary.total_grid_exported_kwh},
        {"summary.total_curtailed_kwh",         r.summary.total_curtailed_kwh},
        {"summary.self_sufficiency_percent",    r.summary.self_sufficiency_percent},
        {"financial.total_import_cost",         r.financial.total_import_cost},
        {"financial.total_export_revenue",      r.financial.total_export_revenue},
        {"financial.net_cost",                  r.financial.net_cost},
        {"battery.average_soc_percent",         r.battery.average_soc_percent},
        {"battery.final_soc_percent",           r.battery.final_soc_percent},
        {"battery.capacity_kwh",                r.battery.capacity_kwh},
        {"battery.count",                       static_cast<double>(r.battery.count)},
        {"battery.times_full",                  static_cast<double>(r.battery.times_full)},
        {"battery.times_empty",                 static_cast<double>(r.battery.times_empty)},
        {"reliability.inverter_failures",       static_cast<double>(r.reliability.inverter_failures)},
        {"reliability.inverter_downtime_hours", r.reliability.inverter_downtime_hours},
        {"reliability.total_unmet_load_kwh",    r.reliability.total_unmet_load_kwh},
        {"reliability.hours_with_unmet_load",   r.reliability.hours_with_unmet_load},
        {"reliability.unmet_load_percentage",   r.reliability.unmet_load_percentage},
        {"system.battery_count",                static_cast<double>(r.system.battery_count)},
        {"system.solar_panel_count",            static_cast<double>(r.system.solar_panel_count)},
        {"system.inverter_count",               static_cast<double>(r.system.inverter_count)},
        {"seed",                                static_cast<double>(r.seed)},
    };

    Logger::instance().log("Summary",
                           static_cast<int>(r.steps.size()),
                           days * 24.0,
                           values);
}

void ResultsExporter::printSummary(std::ostream& os) const {
    const RunResult& r = result_;
    const auto flags = os.flags();
    os << std::fixed << std::setprecision(2);

    os << "======================================================================\n"
       << " SIMULATION RESULTS (" << r.summary.strategy << ", " << r.summary.season
       << ", " << r.summary.duration_days << " days, seed " << r.seed << ")\n"
       << "======================================================================\n"
       << "\n Energy:\n"
       << "  Solar Generated: " << r.summary.total_solar_generated_kwh << " kWh\n"
       << "  Load Consumed:   " << r.summary.total_load_consumed_kwh << " kWh\n"
       << "  Grid Imported:   " << r.summary.total_grid_imported_kwh << " kWh\n"
       << "  Grid Exported:   " << r.summary.total_grid_exported_kwh << " kWh\n"
       << "  Curtailed:       " << r.summary.total_curtailed_kwh << " kWh\n"
       << "\n Financial:\n"
       << "  Import Cost:     $" << r.financial.total_import_cost << "\n"
       << "  Export Revenue:  $" << r.financial.total_export_revenue << "\n"
       << "  Net Cost:        $" << r.financial.net_cost << "\n"
       << "\n Battery:\n"
       << "  Average SoC:     " << r.battery.average_soc_percent << "%\n"
       << "  Final SoC:       " << r.battery.final_soc_percent << "%\n"
       << "  Steps full/empty: " << r.battery.times_full << " / " << r.battery.times_empty << "\n"
       << "\n Performance:\n"
       << "  Self-Sufficiency:  " << r.summary.self_sufficiency_percent << "%\n"
       << "  Inverter Failures: " << r.reliability.inverter_failures
       << " (" << r.reliability.inverter_downtime_hours << " h down)\n"
       << "  Unmet Load:        " << r.reliability.unmet_load_percentage << "% of hours\n";

    os.flags(flags);
}

void printComparisonTable(std::ostream& os,
                          const std::vector<std::string>& labels,
                          const std::vector<RunResult>& results) {
    struct Row {
        const char* name;
        double (*get)(const RunResult&);
    };
    static const Row rows[] = {
        {"Solar generated (kWh)", [](const RunResult& r) { return r.summary.total_solar_generated_kwh; }},
        {"Load consumed (kWh)",   [](const RunResult& r) { return r.summary.total_load_consumed_kwh; }},
        {"Grid imported (kWh)",   [](const RunResult& r) { return r.summary.total_grid_imported_kwh; }},
        {"Grid exported (kWh)",   [](const RunResult& r) { return r.summary.total_grid_exported_kwh; }},
        {"Curtailed (kWh)",       [](const RunResult& r) { return r.summary.total_curtailed_kwh; }},
        {"Self-sufficiency (%)",  [](const RunResult& r) { return r.summary.self_sufficiency_percent; }},
        {"Import cost ($)",       [](const RunResult& r) { return r.financial.total_import_cost; }},
        {"Export revenue ($)",    [](const RunResult& r) { return r.financial.total_export_revenue; }},
        {"Net cost ($)",          [](const RunResult& r) { return r.financial.net_cost; }},
        {"Average SoC (%)",       [](const RunResult& r) { return r.battery.average_soc_percent; }},
        {"Inverter failures",     [](const RunResult& r) { return static_cast<double>(r.reliability.inverter_failures); }},
        {"Unmet load (% hours)",  [](const RunResult& r) { return r.reliability.unmet_load_percentage; }},
    };

    const auto flags = os.flags();
    os << std::fixed << std::setprecision(2);

    os << std::left << std::setw(24) << "Metric";
    for (const auto& l : labels) os << std::right << std::setw(18) << l;
    os << "\n" << std::string(24 + 18 * labels.size(), '-') << "\n";

    for (const auto& row : rows) {
        os << std::left << std::setw(24) << row.name;
        for (const auto& r : results) os << std::right << std::setw(18) << row.get(r);
        os << "\n";
    }

    os.flags(flags);
}
