#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "model/shared_state.hpp"
#include "report/summary.hpp"

namespace {
// One window, two customers: the second waits 60s behind the first.
StateSnapshot servedTwo() {
    SharedState state(1);
    int a = state.addCustomer(0.0, 120.0);
    int b = state.addCustomer(60.0, 120.0);
    double duration = 0.0;
    state.recordArrival(a, 0.0);
    state.recordServiceStart(a, 0.0, duration);
    state.recordArrival(b, 60.0);
    state.recordServiceEnd(a, 120.0);
    state.recordServiceStart(b, 120.0, duration);
    state.recordServiceEnd(b, 240.0);
    state.finalize(480.0);
    return state.snapshot();
}
} // namespace

TEST(SummaryTest, DerivesAveragesFromSnapshot) {
    SimulationSummary s = buildSummary(servedTwo());
    EXPECT_EQ(s.totalCustomers, 2);
    EXPECT_EQ(s.completedCustomers, 2);
    EXPECT_EQ(s.remainingCustomers, 0);
    EXPECT_EQ(s.numWindows, 1);
    EXPECT_DOUBLE_EQ(s.simulatedTime, 480.0);
    EXPECT_DOUBLE_EQ(s.averageWaitTime, 30.0);
    EXPECT_DOUBLE_EQ(s.maxWaitTime, 60.0);
    EXPECT_DOUBLE_EQ(s.averageServiceTime, 120.0);
    EXPECT_DOUBLE_EQ(s.averageQueueLength, 60.0 / 480.0);
    EXPECT_EQ(s.maxQueueLength, 1);
    EXPECT_DOUBLE_EQ(s.averageBusyServers, 0.5);
    EXPECT_DOUBLE_EQ(s.utilizationPercent, 50.0);
    EXPECT_NEAR(s.throughputPerHour, 15.0, 1e-9);
}

TEST(SummaryTest, TextReportUsesReadableDurations) {
    std::ostringstream out;
    out.precision(9);
    writeSummaryText(buildSummary(servedTwo()), out);
    std::string text = out.str();

    EXPECT_NE(text.find("Customers completed: 2"), std::string::npos);
    EXPECT_NE(text.find("Average waiting time per customer: 30s"), std::string::npos);
    EXPECT_NE(text.find("Maximum waiting time: 1m"), std::string::npos);
    EXPECT_NE(text.find("Server utilization: 50.00%"), std::string::npos);
    EXPECT_NE(text.find("Throughput: 15.00 customers/hour"), std::string::npos);
    EXPECT_EQ(text.find("still in system"), std::string::npos);
    EXPECT_EQ(out.precision(), 9);
}

TEST(SummaryTest, EmptyRunReportsNothingToAverage) {
    SharedState state(3);
    state.addCustomer(10.0, 5.0);
    SimulationSummary s = buildSummary(state.snapshot());
    EXPECT_EQ(s.completedCustomers, 0);
    EXPECT_EQ(s.remainingCustomers, 1);
    EXPECT_DOUBLE_EQ(s.utilizationPercent, 0.0);

    std::ostringstream out;
    writeSummaryText(s, out);
    EXPECT_EQ(out.str().find("Average waiting time"), std::string::npos);
    EXPECT_NE(out.str().find("1 customers still in system"), std::string::npos);
}
