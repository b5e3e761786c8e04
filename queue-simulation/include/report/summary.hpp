#pragma once

#include <ostream>

#include "model/shared_state.hpp"

struct SimulationSummary {
    int totalCustomers{0};
    int completedCustomers{0};
    int remainingCustomers{0};      // total - completed
    int numWindows{0};
    double simulatedTime{0.0};
    double averageWaitTime{0.0};
    double maxWaitTime{0.0};
    double averageServiceTime{0.0};
    double averageQueueLength{0.0};
    int maxQueueLength{0};
    double averageBusyServers{0.0};
    double utilizationPercent{0.0};
    double throughputPerHour{0.0};
};

/** @brief Derive the final report fields from a state snapshot. */
SimulationSummary buildSummary(const StateSnapshot& snapshot);

/** @brief Human-readable report, durations via formatDuration. */
void writeSummaryText(const SimulationSummary& summary, std::ostream& out);
