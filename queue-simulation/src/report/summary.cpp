#include "report/summary.hpp"

#include "util/duration.hpp"

#include <iomanip>

SimulationSummary buildSummary(const StateSnapshot& snapshot) {
    const Statistics& stats = snapshot.stats;
    SimulationSummary summary;
    summary.totalCustomers = snapshot.totalCustomers;
    summary.completedCustomers = stats.completedCustomers();
    summary.remainingCustomers = snapshot.totalCustomers - stats.completedCustomers();
    summary.numWindows = snapshot.numWindows;
    summary.simulatedTime = snapshot.currentTime;
    summary.averageWaitTime = stats.averageWaitTime();
    summary.maxWaitTime = stats.maxWaitTime();
    summary.averageServiceTime = stats.averageServiceTime();
    summary.averageQueueLength = stats.averageQueueLength(snapshot.currentTime);
    summary.maxQueueLength = stats.maxQueueLength();
    summary.averageBusyServers = stats.averageBusyServers(snapshot.currentTime);
    summary.utilizationPercent = stats.utilization(snapshot.currentTime, snapshot.numWindows) * 100.0;
    summary.throughputPerHour = stats.throughputPerHour(snapshot.currentTime);
    return summary;
}

void writeSummaryText(const SimulationSummary& s, std::ostream& out) {
    std::ios::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();
    out << std::fixed << std::setprecision(2);

    out << "Simulation Statistics\n";
    out << "-----------------------------------------------\n";
    out << "Total customers processed: " << s.totalCustomers << "\n";
    out << "Customers completed: " << s.completedCustomers << "\n";
    if (s.completedCustomers > 0) {
        out << "Average waiting time per customer: " << formatDuration(s.averageWaitTime) << "\n";
        out << "Maximum waiting time: " << formatDuration(s.maxWaitTime) << "\n";
        out << "Average service time per customer: " << formatDuration(s.averageServiceTime) << "\n";
    }
    if (s.simulatedTime > 0.0) {
        out << "Average queue length (time-weighted): " << s.averageQueueLength << " customers\n";
        out << "Maximum queue length: " << s.maxQueueLength << " customers\n";
        out << "Average servers busy (time-weighted): " << s.averageBusyServers
            << " of " << s.numWindows << " windows\n";
        out << "Server utilization: " << s.utilizationPercent << "%\n";
        out << "Throughput: " << s.throughputPerHour << " customers/hour\n";
    }
    if (s.remainingCustomers > 0) {
        out << "\nNote: " << s.remainingCustomers
            << " customers still in system (waiting, being served or not yet arrived)\n";
    }

    out.flags(flags);
    out.precision(precision);
}
