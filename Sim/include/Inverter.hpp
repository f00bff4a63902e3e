#pragma once
#include "Subsystem.hpp"

class RandomSource;

// Power clipping plus a daily random failure process.
// States: operational, or failed with a countdown of remaining hours.
class Inverter : public Subsystem {
public:
    // Throws std::invalid_argument unless 1 <= min_failure_hours <= max_failure_hours.
    Inverter(RandomSource& rng,
             double max_output_kw,
             double failure_rate_per_day = 0.005,
             int min_failure_hours = 4,
             int max_failure_hours = 72);

    void initialize() override;
    // Applies update(ctx.dt) and logs the state row.
    void tick(const TickContext& ctx) override;
    void shutdown() override;

    // 0 while failed, else min(raw, max_output).
    double applyLimit(double raw_kw) const;

    // Bernoulli draw; call once per simulated day.
    // Returns true when a new failure starts.
    bool checkFailure();

    // Decrement the failure countdown by hours_passed.
    // Returns true when this call restored the inverter.
    bool update(double hours_passed);

    bool isOperational() const { return !failing_; }
    double getFailureHoursRemaining() const { return hours_remaining_; }
    int getLastFailureDuration() const { return last_failure_hours_; }
    double getMaxOutputKw() const { return max_output_kw_; }

    // Test hook: put the inverter straight into a failure of `hours`.
    void forceFailure(int hours);

private:
    RandomSource& rng_;
    double max_output_kw_;
    double failure_rate_;
    int    min_failure_hours_;
    int    max_failure_hours_;

    bool   failing_ = false;
    double hours_remaining_ = 0.0;
    int    last_failure_hours_ = 0;
};
