#include <gtest/gtest.h>

#include <vector>

#include "logging/event_sink.hpp"
#include "model/shared_state.hpp"

namespace {
class RecordingSink : public EventSink {
public:
    void onEvent(const EventRecord& record) override { records.push_back(record); }
    std::vector<EventRecord> records;
};
} // namespace

TEST(SharedStateTest, TransitionsUpdateCountersIntegralsAndSinks) {
    SharedState state(2);
    RecordingSink sink;
    state.addSink(&sink);
    int first = state.addCustomer(0.0, 10.0);
    int second = state.addCustomer(5.0, 10.0);

    double duration = 0.0;
    ASSERT_TRUE(state.recordArrival(first, 0.0));
    ASSERT_TRUE(state.recordServiceStart(first, 0.0, duration));
    EXPECT_DOUBLE_EQ(duration, 10.0);
    ASSERT_TRUE(state.recordArrival(second, 5.0));
    ASSERT_TRUE(state.recordServiceStart(second, 7.0, duration));
    EXPECT_EQ(state.customersInSystem(), 2);
    ASSERT_TRUE(state.recordServiceEnd(first, 10.0));
    ASSERT_TRUE(state.recordServiceEnd(second, 17.0));

    StateSnapshot snap = state.snapshot();
    EXPECT_EQ(snap.waitingQueueLen, 0);
    EXPECT_EQ(snap.busyServers, 0);
    EXPECT_EQ(snap.admittedCustomers, 2);
    EXPECT_DOUBLE_EQ(snap.currentTime, 17.0);
    // Queue held one customer over [5, 7]; busy windows: 1 over [0, 7], 2 over [7, 10], 1 over [10, 17].
    EXPECT_DOUBLE_EQ(snap.stats.queueLengthIntegral(), 2.0);
    EXPECT_DOUBLE_EQ(snap.stats.serverBusyIntegral(), 20.0);
    EXPECT_EQ(snap.stats.completedCustomers(), 2);
    EXPECT_DOUBLE_EQ(snap.stats.totalWaitTime(), 2.0);
    EXPECT_DOUBLE_EQ(snap.stats.maxWaitTime(), 2.0);
    EXPECT_DOUBLE_EQ(snap.stats.totalServiceTime(), 20.0);
    EXPECT_EQ(snap.stats.maxQueueLength(), 1);

    ASSERT_EQ(sink.records.size(), 6u);
    const EventType expectedTypes[] = {EventType::Arrival, EventType::ServiceStart, EventType::Arrival,
                                       EventType::ServiceStart, EventType::ServiceEnd, EventType::ServiceEnd};
    const int expectedQueue[] = {1, 0, 1, 0, 0, 0};
    const int expectedBusy[] = {0, 1, 1, 2, 1, 0};
    for (size_t i = 0; i < sink.records.size(); ++i) {
        EXPECT_EQ(sink.records[i].type, expectedTypes[i]) << "event " << i;
        EXPECT_EQ(sink.records[i].queueLen, expectedQueue[i]) << "event " << i;
        EXPECT_EQ(sink.records[i].busyServers, expectedBusy[i]) << "event " << i;
        EXPECT_EQ(sink.records[i].numWindows, 2);
    }

    std::vector<Customer> customers = state.customers();
    EXPECT_EQ(customers[second].state, CustomerState::Completed);
    EXPECT_DOUBLE_EQ(customers[second].serviceStartTime, 7.0);
    EXPECT_DOUBLE_EQ(customers[second].serviceEndTime, 17.0);
}

TEST(SharedStateTest, ServiceStartNeverDrivesQueueNegative) {
    SharedState state(1);
    int id = state.addCustomer(0.0, 4.0);
    double duration = 0.0;
    ASSERT_TRUE(state.recordServiceStart(id, 0.0, duration));

    StateSnapshot snap = state.snapshot();
    EXPECT_EQ(snap.waitingQueueLen, 0);
    EXPECT_EQ(snap.busyServers, 1);
}

TEST(SharedStateTest, InvalidIdsAreRejected) {
    SharedState state(1);
    state.addCustomer(0.0, 1.0);
    double duration = -1.0;
    EXPECT_FALSE(state.recordArrival(3, 0.0));
    EXPECT_FALSE(state.recordServiceStart(-1, 0.0, duration));
    EXPECT_FALSE(state.recordServiceEnd(1, 0.0));
    EXPECT_DOUBLE_EQ(duration, -1.0);

    double arrival = 0.0;
    EXPECT_FALSE(state.arrivalTime(9, arrival));
    EXPECT_EQ(state.snapshot().admittedCustomers, 0);
}

TEST(SharedStateTest, SortKeepsEqualArrivalsInInsertionOrder) {
    SharedState state(1);
    state.addCustomer(5.0, 1.0);
    state.addCustomer(0.0, 2.0);
    state.addCustomer(5.0, 3.0);
    state.sortCustomersByArrival();

    std::vector<Customer> customers = state.customers();
    ASSERT_EQ(customers.size(), 3u);
    EXPECT_DOUBLE_EQ(customers[0].serviceDuration, 2.0);
    EXPECT_DOUBLE_EQ(customers[1].serviceDuration, 1.0);
    EXPECT_DOUBLE_EQ(customers[2].serviceDuration, 3.0);
}

TEST(SharedStateTest, FinalizeExtendsIntegralsWithLastCounters) {
    SharedState state(1);
    int id = state.addCustomer(0.0, 100.0);
    double duration = 0.0;
    state.recordArrival(id, 0.0);
    state.recordServiceStart(id, 0.0, duration);

    state.finalize(40.0);
    StateSnapshot snap = state.snapshot();
    EXPECT_DOUBLE_EQ(snap.currentTime, 40.0);
    EXPECT_DOUBLE_EQ(snap.stats.serverBusyIntegral(), 40.0);

    // Earlier instants leave everything untouched.
    state.finalize(10.0);
    EXPECT_DOUBLE_EQ(state.snapshot().currentTime, 40.0);
    EXPECT_DOUBLE_EQ(state.snapshot().stats.serverBusyIntegral(), 40.0);
}
