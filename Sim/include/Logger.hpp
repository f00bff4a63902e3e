#pragma once
#include <mutex>
#include <map>
#include <string>
#include <fstream>
#include <vector>

class Logger {
public:
    static Logger& instance();
    ~Logger();

    // Tall/long format: one row per key
    void log(const std::string& subsystem,
             int tick, double time,
             const std::map<std::string, double>& values);

    // Wide format: one row per call with multiple columns
    void log_wide(const std::string& subsystem,
                  int tick, double time,
                  const std::vector<std::string>& columns,
                  const std::vector<double>& values);

    // Free-text rows: timestamp,message
    void log_text(const std::string& subsystem,
                  const std::string& timestamp,
                  const std::string& message);

    // Per-run subdirectory under the log base. Closes open files.
    void setRunId(const std::string& run_id);
    std::string getRunDir();

    void setEnabled(bool enabled);
    bool isEnabled() const { return enabled_; }

    // Flush and close every open file.
    void closeAll();

    // A text field as it appears in a CSV row: quoted and escaped when needed.
    static std::string csvField(const std::string& text);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void closeAllLocked_();

    std::mutex mtx_;
    std::map<std::string, std::ofstream> per_node_;
    std::string run_id_;
    bool enabled_ = true;
};
