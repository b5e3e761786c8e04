#pragma once

#include "model/shared_state.hpp"
#include "sched/channel.hpp"
#include "sched/virtual_clock.hpp"

/**
 * @brief Everything a simulation task needs; owned by the engine for the
 *        duration of one run.
 */
struct RunContext {
    SharedState& state;
    VirtualClock& clock;
    Channel<int>& admissions;
    bool hasMaxTime;
    double maxTime;
    int activeWindows;      // windows still serving; last one out closes admissions
};
