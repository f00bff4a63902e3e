#pragma once

// Snapshot handed to every Subsystem::tick().
// Times are simulated hours; dt is the step length in hours.
struct TickContext {
    int    tick_index  = 0;
    double time        = 0.0;
    double dt          = 0.0;
    double hour_of_day = 0.0;
};
