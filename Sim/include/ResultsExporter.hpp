#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "SimConfig.hpp"
#include "SimResults.hpp"

// Writes a finished run into the Logger's run directory:
//   StepRecords.csv, DailySummaries.csv, Events.csv, Summary.csv, config.txt
class ResultsExporter {
public:
    explicit ResultsExporter(const RunResult& result);

    // Returns the paths written. Throws std::runtime_error on I/O failure.
    std::vector<std::string> saveAll(const SimConfig& cfg) const;

    std::string saveStepRecords(const std::string& dir) const;
    std::string saveDaySummaries(const std::string& dir) const;
    std::string saveEvents(const std::string& dir) const;
    std::string saveConfig(const std::string& dir, const SimConfig& cfg) const;
    // Tall key/value rows through Logger::log
    void saveSummary() const;

    void printSummary(std::ostream& os) const;

private:
    const RunResult& result_;
};

// Side-by-side table of several runs, one column per run.
void printComparisonTable(std::ostream& os,
                          const std::vector<std::string>& labels,
                          const std::vector<RunResult>& results);
