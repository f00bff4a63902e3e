// Sim/src/Logger.cpp
#include "Logger.hpp"

#include <iostream>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <system_error>
#include <mutex>
#include <string>
#include <vector>
#include <stdexcept>

namespace {
namespace fs = std::filesystem;

enum class RowShape { Tall, Wide, Text };

// Resolve the base directory for logs.
//
// Priority:
//   1) env GG_LOG_DIR
//   2) <PROJECT_SOURCE_DIR>/data/raw
//   3) ./data/raw
//
// A run id (setRunId() first, env RUN_ID second) is appended as a
// subdirectory so each run gets its own folder, e.g.
// data/raw/LOAD_PRIORITY_summer_42/StepRecords.csv
fs::path resolve_base_dir(const std::string& run_id) {
    fs::path base;
    if (const char* env = std::getenv("GG_LOG_DIR"); env && *env) {
        base = fs::path(env);
    } else {
#ifdef PROJECT_SOURCE_DIR
        base = fs::path(PROJECT_SOURCE_DIR) / "data" / "raw";
#else
        base = fs::current_path() / "data" / "raw";
#endif
    }

    if (!run_id.empty()) {
        base /= run_id;
    } else if (const char* run = std::getenv("RUN_ID"); run && *run) {
        base /= run;
    }
    return base;
}

// Quote a text field if it carries a separator or a quote.
std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// Get or open the per-subsystem CSV file.
// If this is the first time we open it, we also write the header.
//
// Tall:  tick,time_h,key,value
// Wide:  tick,time_h,<columns...>
// Text:  timestamp,message
std::ofstream& get_stream_for_subsystem(
    const std::string& subsystem,
    std::map<std::string, std::ofstream>& per_node,
    const std::string& run_id,
    const std::vector<std::string>* wide_cols,
    RowShape shape
) {
    auto it = per_node.find(subsystem);
    if (it != per_node.end()) {
        return it->second;
    }

    fs::path base_dir = resolve_base_dir(run_id);
    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) {
        throw std::runtime_error(
            "Logger: failed to create log directory " + base_dir.string() +
            " : " + ec.message()
        );
    }

    fs::path csv_path = base_dir / (subsystem + ".csv");
    std::ofstream out(csv_path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error(
            "Logger: failed to open log file " + csv_path.string()
        );
    }

    switch (shape) {
    case RowShape::Wide:
        out << "tick,time_h";
        if (wide_cols) {
            for (const auto& c : *wide_cols) {
                out << ',' << c;
            }
        }
        out << '\n';
        break;
    case RowShape::Text:
        out << "timestamp,message\n";
        break;
    case RowShape::Tall:
        out << "tick,time_h,key,value\n";
        break;
    }
    out.precision(10);

    auto [new_it, _] = per_node.emplace(subsystem, std::move(out));
    return new_it->second;
}

} // anonymous namespace

// ---------------- Logger public API ----------------

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeAllLocked_();
}

void Logger::closeAllLocked_() {
    for (auto& kv : per_node_) {
        if (kv.second.is_open()) {
            kv.second.flush();
            kv.second.close();
        }
    }
    per_node_.clear();
}

void Logger::closeAll() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeAllLocked_();
}

void Logger::setRunId(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (run_id == run_id_) return;
    closeAllLocked_();
    run_id_ = run_id;
}

std::string Logger::getRunDir() {
    std::lock_guard<std::mutex> lock(mtx_);
    return resolve_base_dir(run_id_).string();
}

std::string Logger::csvField(const std::string& text) {
    return csv_field(text);
}

void Logger::setEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mtx_);
    enabled_ = enabled;
}

// Tall/long format: one row per (tick, key, value)
void Logger::log(const std::string& subsystem,
                 int tick, double time,
                 const std::map<std::string, double>& values) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!enabled_) return;

    std::ofstream& out = get_stream_for_subsystem(
        subsystem,
        per_node_,
        run_id_,
        /*wide_cols=*/nullptr,
        RowShape::Tall
    );

    for (const auto& kv : values) {
        out << tick << ',' << time << ','
            << kv.first << ',' << kv.second << '\n';
    }
}

// Wide format: one row per tick with multiple named columns
void Logger::log_wide(const std::string& subsystem,
                      int tick, double time,
                      const std::vector<std::string>& cols,
                      const std::vector<double>& vals) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!enabled_) return;

    std::ofstream& out = get_stream_for_subsystem(
        subsystem,
        per_node_,
        run_id_,
        &cols,
        RowShape::Wide
    );

    out << tick << ',' << time;
    for (std::size_t i = 0; i < cols.size(); ++i) {
        double v = (i < vals.size() ? vals[i] : 0.0);
        out << ',' << v;
    }
    out << '\n';
}

void Logger::log_text(const std::string& subsystem,
                      const std::string& timestamp,
                      const std::string& message) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!enabled_) return;

    std::ofstream& out = get_stream_for_subsystem(
        subsystem,
        per_node_,
        run_id_,
        /*wide_cols=*/nullptr,
        RowShape::Text
    );

    out << csv_field(timestamp) << ',' << csv_field(message) << '\n';
}
