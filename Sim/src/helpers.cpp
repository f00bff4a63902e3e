#include "helpers.hpp"
#include "CloudCoverage.hpp"
#include "EnergyManagementSystem.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <limits>
#include <cmath>

namespace GreenGridHelpers {

// ---------------------------
// Tiny CLI helpers (no deps)
// ---------------------------
static bool arg_eq(const char* a, const char* b) {
  return std::strcmp(a, b) == 0;
}

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    if (arg_eq(argv[i], "--config") && i + 1 < argc)          a.configPath = argv[++i];
    else if (arg_eq(argv[i], "--set") && i + 1 < argc)        a.overrides.push_back(argv[++i]);
    else if (arg_eq(argv[i], "--days") && i + 1 < argc)       a.overrides.push_back(std::string("simulation.duration_days=") + argv[++i]);
    else if (arg_eq(argv[i], "--step") && i + 1 < argc)       a.overrides.push_back(std::string("simulation.time_step_minutes=") + argv[++i]);
    else if (arg_eq(argv[i], "--season") && i + 1 < argc)     a.overrides.push_back(std::string("simulation.season=") + argv[++i]);
    else if (arg_eq(argv[i], "--start-date") && i + 1 < argc) a.overrides.push_back(std::string("simulation.start_date=") + argv[++i]);
    else if (arg_eq(argv[i], "--seed") && i + 1 < argc)       a.overrides.push_back(std::string("simulation.random_seed=") + argv[++i]);
    else if (arg_eq(argv[i], "--strategy") && i + 1 < argc)   a.overrides.push_back(std::string("energy_management.strategy=") + argv[++i]);
    else if (arg_eq(argv[i], "--compare") && i + 1 < argc)    a.compare = argv[++i];
    else if (arg_eq(argv[i], "--run-id") && i + 1 < argc)     a.runId = argv[++i];
    else if (arg_eq(argv[i], "--no-telemetry"))               a.noTelemetry = true;
    else if (arg_eq(argv[i], "--help") || arg_eq(argv[i], "-h")) a.showHelp = true;
    else {
      throw std::invalid_argument(std::string("Unknown or incomplete argument: ") + argv[i]);
    }
  }
  return a;
}

void print_usage() {
  std::cout <<
    "Usage: greengrid [--config FILE] [--set section.key=value]...\n"
    "                 [--days N] [--step MINUTES] [--season NAME]\n"
    "                 [--start-date YYYY-MM-DD] [--seed N]\n"
    "                 [--strategy LOAD_PRIORITY|CHARGE_PRIORITY|PRODUCE_PRIORITY]\n"
    "                 [--compare strategies|seasons]\n"
    "                 [--run-id ID] [--no-telemetry]\n"
    "\n"
    "Config file lines are 'section.key = value', e.g.\n"
    "  simulation.duration_days = 30\n"
    "  battery.unit_capacity_kwh = 13.5\n"
    "  energy_management.strategy = CHARGE_PRIORITY\n"
    "\n"
    "Compare modes run every strategy (or every season) back to back with\n"
    "one shared seed and print a side-by-side table.\n"
    "\n"
    "CSV output goes to $GG_LOG_DIR/<run-id>/ (default data/raw/<run-id>/).\n";
}

// ---------------------------
// Value parsing
// ---------------------------
static std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

static double parse_double(const std::string& key, const std::string& text) {
  std::size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(text, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument("Config: '" + key + "' expects a number, got '" + text + "'");
  }
  if (used != text.size() || !std::isfinite(v)) {
    throw std::invalid_argument("Config: '" + key + "' expects a number, got '" + text + "'");
  }
  return v;
}

static long long parse_integer(const std::string& key, const std::string& text) {
  std::size_t used = 0;
  long long v = 0;
  try {
    v = std::stoll(text, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument("Config: '" + key + "' expects an integer, got '" + text + "'");
  }
  if (used != text.size()) {
    throw std::invalid_argument("Config: '" + key + "' expects an integer, got '" + text + "'");
  }
  return v;
}

static int parse_int(const std::string& key, const std::string& text) {
  const long long v = parse_integer(key, text);
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("Config: '" + key + "' out of range: " + text);
  }
  return static_cast<int>(v);
}

static bool parse_bool(const std::string& key, const std::string& text) {
  std::string s = text;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "1" || s == "true" || s == "yes" || s == "on")  return true;
  if (s == "0" || s == "false" || s == "no" || s == "off") return false;
  throw std::invalid_argument("Config: '" + key + "' expects true/false, got '" + text + "'");
}

// ---------------------------
// Configuration
// ---------------------------
void apply_config_value(SimConfig& cfg, const std::string& rawKey, const std::string& rawValue) {
  const std::string key   = trim(rawKey);
  const std::string value = trim(rawValue);

  // simulation.*
  if (key == "simulation.duration_days")          cfg.simulation.duration_days = parse_int(key, value);
  else if (key == "simulation.time_step_minutes") cfg.simulation.time_step_minutes = parse_int(key, value);
  else if (key == "simulation.season")            cfg.simulation.season = value;
  else if (key == "simulation.start_date")        cfg.simulation.start_date = value;
  else if (key == "simulation.random_seed") {
    if (value.empty() || value == "none" || value == "null") {
      cfg.simulation.random_seed.reset();
    } else {
      const long long s = parse_integer(key, value);
      if (s < 0) throw std::invalid_argument("Config: 'simulation.random_seed' must be >= 0");
      cfg.simulation.random_seed = static_cast<std::uint64_t>(s);
    }
  }
  else if (key == "simulation.telemetry")         cfg.telemetry = parse_bool(key, value);
  // battery.*
  else if (key == "battery.unit_capacity_kwh")    cfg.battery.unit_capacity_kwh = parse_double(key, value);
  else if (key == "battery.efficiency")           cfg.battery.efficiency = parse_double(key, value);
  else if (key == "battery.min_soc")              cfg.battery.min_soc = parse_double(key, value);
  else if (key == "battery.count")                cfg.battery.count = parse_int(key, value);
  // solar.*
  else if (key == "solar.unit_peak_power_kw")     cfg.solar.unit_peak_power_kw = parse_double(key, value);
  else if (key == "solar.count")                  cfg.solar.count = parse_int(key, value);
  // inverter.*
  else if (key == "inverter.unit_max_output_kw")  cfg.inverter.unit_max_output_kw = parse_double(key, value);
  else if (key == "inverter.failure_rate")        cfg.inverter.failure_rate = parse_double(key, value);
  else if (key == "inverter.min_failure_duration_hours") cfg.inverter.min_failure_duration_hours = parse_int(key, value);
  else if (key == "inverter.max_failure_duration_hours") cfg.inverter.max_failure_duration_hours = parse_int(key, value);
  else if (key == "inverter.count")               cfg.inverter.count = parse_int(key, value);
  // load.*
  else if (key == "load.base_load_kw")            cfg.load.base_load_kw = parse_double(key, value);
  else if (key == "load.peak_hours_max_kw")       cfg.load.peak_hours_max_kw = parse_double(key, value);
  else if (key == "load.peak_hours_start")        cfg.load.peak_hours_start = parse_int(key, value);
  else if (key == "load.peak_hours_end")          cfg.load.peak_hours_end = parse_int(key, value);
  // grid.*
  else if (key == "grid.import_cost_per_kwh")     cfg.grid.import_cost_per_kwh = parse_double(key, value);
  else if (key == "grid.export_revenue_per_kwh")  cfg.grid.export_revenue_per_kwh = parse_double(key, value);
  else if (key == "grid.export_limit_kw")         cfg.grid.export_limit_kw = parse_double(key, value);
  // energy_management.*
  else if (key == "energy_management.strategy")   cfg.strategy = value;
  else {
    throw std::invalid_argument("Config: unknown key '" + key + "'");
  }
}

void apply_override(SimConfig& cfg, const std::string& assignment) {
  const auto eq = assignment.find('=');
  if (eq == std::string::npos) {
    throw std::invalid_argument("Expected section.key=value, got '" + assignment + "'");
  }
  apply_config_value(cfg, assignment.substr(0, eq), assignment.substr(eq + 1));
}

void load_config_file(const std::string& path, SimConfig& cfg, LogFn log_fn) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open config file " + path);
  }

  std::string line;
  int lineno = 0;
  int applied = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    line = trim(line);
    if (line.empty()) continue;

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      std::ostringstream oss;
      oss << "[warn] " << path << " line " << lineno
          << " malformed, skipping: " << line << "\n";
      if (log_fn) log_fn(oss.str());
      continue;
    }

    try {
      apply_config_value(cfg, line.substr(0, eq), line.substr(eq + 1));
      ++applied;
    } catch (const std::invalid_argument& e) {
      std::ostringstream oss;
      oss << "[warn] " << path << " line " << lineno << ": " << e.what() << ", skipping\n";
      if (log_fn) log_fn(oss.str());
    }
  }

  std::ostringstream oss;
  oss << "[info] Loaded " << applied << " setting(s) from " << path << "\n";
  if (log_fn) log_fn(oss.str());
}

void validate_config(const SimConfig& cfg) {
  auto fail = [](const std::string& msg) {
    throw std::invalid_argument("Invalid configuration: " + msg);
  };

  const auto& s = cfg.simulation;
  if (s.duration_days <= 0) fail("simulation.duration_days must be > 0");
  if (s.time_step_minutes <= 0 || (24 * 60) % s.time_step_minutes != 0) {
    fail("simulation.time_step_minutes must be > 0 and divide 1440");
  }
  parseSeason(s.season);
  parse_date(s.start_date);

  const auto& b = cfg.battery;
  if (b.unit_capacity_kwh <= 0.0) fail("battery.unit_capacity_kwh must be > 0");
  if (b.efficiency <= 0.0 || b.efficiency > 1.0) fail("battery.efficiency must be in (0, 1]");
  if (b.min_soc < 0.0 || b.min_soc > 0.5) fail("battery.min_soc must be in [0, 0.5]");
  if (b.count <= 0) fail("battery.count must be > 0");

  if (cfg.solar.unit_peak_power_kw < 0.0) fail("solar.unit_peak_power_kw must be >= 0");
  if (cfg.solar.count <= 0) fail("solar.count must be > 0");

  const auto& inv = cfg.inverter;
  if (inv.unit_max_output_kw < 0.0) fail("inverter.unit_max_output_kw must be >= 0");
  if (inv.failure_rate < 0.0 || inv.failure_rate > 1.0) fail("inverter.failure_rate must be in [0, 1]");
  if (inv.min_failure_duration_hours < 1 ||
      inv.max_failure_duration_hours < inv.min_failure_duration_hours) {
    fail("inverter failure durations must satisfy 1 <= min <= max");
  }
  if (inv.count <= 0) fail("inverter.count must be > 0");

  const auto& l = cfg.load;
  if (l.base_load_kw < 0.0) fail("load.base_load_kw must be >= 0");
  if (l.peak_hours_max_kw < 1.0) fail("load.peak_hours_max_kw must be >= 1.0");
  if (l.peak_hours_start < 0 || l.peak_hours_end > 24 || l.peak_hours_start > l.peak_hours_end) {
    fail("load peak hours must satisfy 0 <= start <= end <= 24");
  }

  const auto& g = cfg.grid;
  if (g.import_cost_per_kwh < 0.0 || g.export_revenue_per_kwh < 0.0) fail("grid prices must be >= 0");
  if (g.export_limit_kw < 0.0) fail("grid.export_limit_kw must be >= 0");

  parseStrategy(cfg.strategy);
}

std::string describe_config(const SimConfig& cfg) {
  std::ostringstream oss;
  oss << "simulation.duration_days = " << cfg.simulation.duration_days << "\n"
      << "simulation.time_step_minutes = " << cfg.simulation.time_step_minutes << "\n"
      << "simulation.season = " << cfg.simulation.season << "\n"
      << "simulation.start_date = " << cfg.simulation.start_date << "\n"
      << "simulation.random_seed = ";
  if (cfg.simulation.random_seed) oss << *cfg.simulation.random_seed;
  else                            oss << "none";
  oss << "\n"
      << "battery.unit_capacity_kwh = " << cfg.battery.unit_capacity_kwh << "\n"
      << "battery.efficiency = " << cfg.battery.efficiency << "\n"
      << "battery.min_soc = " << cfg.battery.min_soc << "\n"
      << "battery.count = " << cfg.battery.count << "\n"
      << "solar.unit_peak_power_kw = " << cfg.solar.unit_peak_power_kw << "\n"
      << "solar.count = " << cfg.solar.count << "\n"
      << "inverter.unit_max_output_kw = " << cfg.inverter.unit_max_output_kw << "\n"
      << "inverter.failure_rate = " << cfg.inverter.failure_rate << "\n"
      << "inverter.min_failure_duration_hours = " << cfg.inverter.min_failure_duration_hours << "\n"
      << "inverter.max_failure_duration_hours = " << cfg.inverter.max_failure_duration_hours << "\n"
      << "inverter.count = " << cfg.inverter.count << "\n"
      << "load.base_load_kw = " << cfg.load.base_load_kw << "\n"
      << "load.peak_hours_max_kw = " << cfg.load.peak_hours_max_kw << "\n"
      << "load.peak_hours_start = " << cfg.load.peak_hours_start << "\n"
      << "load.peak_hours_end = " << cfg.load.peak_hours_end << "\n"
      << "grid.import_cost_per_kwh = " << cfg.grid.import_cost_per_kwh << "\n"
      << "grid.export_revenue_per_kwh = " << cfg.grid.export_revenue_per_kwh << "\n"
      << "grid.export_limit_kw = " << cfg.grid.export_limit_kw << "\n"
      << "energy_management.strategy = " << cfg.strategy << "\n";
  return oss.str();
}

std::uint64_t generate_seed() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto us  = std::chrono::duration_cast<std::chrono::microseconds>(now).count();
  return static_cast<std::uint64_t>(us) % 2147483647ULL;
}

// ---------------------------
// Calendar (proleptic Gregorian)
// ---------------------------
static bool is_leap(long y) {
  return y % 4 == 0 && (y % 100 != 0 || y % 400 == 0);
}

static int days_in_month(long y, int m) {
  static const int dm[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap(y)) ? 29 : dm[m - 1];
}

static long days_from_civil(long y, int m, int d) {
  y -= m <= 2;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const long yoe = y - era * 400;
  const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

static void civil_from_days(long z, long& y, int& m, int& d) {
  z += 719468;
  const long era = (z >= 0 ? z : z - 146096) / 146097;
  const long doe = z - era * 146097;
  const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const long mp  = (5 * doy + 2) / 153;
  d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  y = yoe + era * 400 + (m <= 2);
}

long parse_date(const std::string& ymd) {
  int y = 0, m = 0, d = 0;
  char tail = 0;
  if (std::sscanf(ymd.c_str(), "%d-%d-%d%c", &y, &m, &d, &tail) != 3) {
    throw std::invalid_argument("Bad date '" + ymd + "', expected YYYY-MM-DD");
  }
  if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
    throw std::invalid_argument("Impossible date '" + ymd + "'");
  }
  return days_from_civil(y, m, d);
}

std::string format_timestamp(long start_day, long minutes) {
  long day_offset = minutes / (24 * 60);
  long minute_of_day = minutes % (24 * 60);
  if (minute_of_day < 0) {
    minute_of_day += 24 * 60;
    day_offset -= 1;
  }

  long y = 0;
  int m = 0, d = 0;
  civil_from_days(start_day + day_offset, y, m, d);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04ld-%02d-%02d %02ld:%02ld:00",
                y, m, d, minute_of_day / 60, minute_of_day % 60);
  return buf;
}

} // namespace GreenGridHelpers
