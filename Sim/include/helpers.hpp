#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <functional>

#include "SimConfig.hpp"

namespace GreenGridHelpers {

// ---------------------------
// CLI arguments
// ---------------------------
struct Args {
  std::string configPath;                  // optional key = value file
  std::vector<std::string> overrides;      // "section.key=value", applied last
  std::string compare;                     // "", "strategies" or "seasons"
  std::string runId;                       // log subdirectory; empty: derived
  bool noTelemetry = false;
  bool showHelp    = false;
};

// Logger function type used by helpers (implemented in main.cpp).
using LogFn = std::function<void(const std::string&)>;

// Argument helpers
Args parse_args(int argc, char** argv);
void print_usage();

// ---------------------------
// Configuration
// ---------------------------

// Set one "section.key" from its text value.
// Throws std::invalid_argument on an unknown key or unparsable value.
void apply_config_value(SimConfig& cfg, const std::string& key, const std::string& value);

// Apply "section.key=value".
void apply_override(SimConfig& cfg, const std::string& assignment);

// Reads "section.key = value" lines; '#' starts a comment.
// Malformed lines are reported through log_fn and skipped.
// Throws std::runtime_error when the file cannot be opened.
void load_config_file(const std::string& path, SimConfig& cfg, LogFn log_fn);

// Throws std::invalid_argument naming the first bad field.
void validate_config(const SimConfig& cfg);

// Every field, one "section.key = value" per line.
std::string describe_config(const SimConfig& cfg);

// Wall-clock seed in [0, 2^31 - 1).
std::uint64_t generate_seed();

// ---------------------------
// Calendar
// ---------------------------

// Days since 1970-01-01 for a "YYYY-MM-DD" date.
// Throws std::invalid_argument on a malformed or impossible date.
long parse_date(const std::string& ymd);

// "YYYY-MM-DD HH:MM:SS" for start_day + minutes.
std::string format_timestamp(long start_day, long minutes);

} // namespace GreenGridHelpers
