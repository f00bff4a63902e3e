#pragma once
#include <string>
#include <vector>
#include "TickContext.hpp"
#include "Logger.hpp"

// A stateful piece of household hardware driven by the engine clock.
// Stateless models (SolarPanel, Load) are plain classes instead.
class Subsystem {
public:
    explicit Subsystem(const std::string& name) : name_(name) {}
    virtual ~Subsystem() = default;

    // lifecycle
    virtual void initialize() = 0;
    virtual void tick(const TickContext& ctx) = 0;
    virtual void shutdown() = 0;

    // access
    const std::string& getName() const { return name_; }

protected:
    // One wide telemetry row in <name>.csv
    void logState_(int tick, double time_h,
                   const std::vector<std::string>& columns,
                   const std::vector<double>& values) const {
        Logger::instance().log_wide(name_, tick, time_h, columns, values);
    }

    std::string name_;
};
