#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sched/scheduler.hpp"
#include "sched/virtual_clock.hpp"

namespace {
// Let every task settle, then wake deadlines one at a time.
void drive(TaskScheduler& scheduler, VirtualClock& clock) {
    scheduler.yield();
    while (clock.advance()) {
        scheduler.yield();
    }
}
} // namespace

TEST(VirtualClockTest, WakesInDeadlineOrderAtExactTimes) {
    TaskScheduler scheduler;
    VirtualClock clock(scheduler);
    std::vector<double> wakeTimes;
    for (double deadline : {30.0, 10.0, 20.0}) {
        scheduler.spawn("sleeper", [&, deadline] {
            ASSERT_TRUE(clock.sleepUntil(deadline));
            wakeTimes.push_back(clock.now());
        });
    }

    drive(scheduler, clock);
    scheduler.joinAll();
    EXPECT_EQ(wakeTimes, (std::vector<double>{10.0, 20.0, 30.0}));
    EXPECT_DOUBLE_EQ(clock.now(), 30.0);
}

TEST(VirtualClockTest, EqualDeadlinesResumeInRegistrationOrder) {
    TaskScheduler scheduler;
    VirtualClock clock(scheduler);
    std::vector<std::string> order;
    for (const char* name : {"a", "b", "c"}) {
        std::string label = name;
        scheduler.spawn(label, [&, label] {
            clock.sleepUntil(5.0);
            order.push_back(label);
        });
    }

    scheduler.yield();
    EXPECT_EQ(clock.pendingCount(), 3u);
    // One advance releases every event due at the same instant.
    ASSERT_TRUE(clock.advance());
    EXPECT_EQ(clock.pendingCount(), 0u);
    scheduler.joinAll();
    EXPECT_EQ(order, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(VirtualClockTest, RelativeSleepAccumulates) {
    TaskScheduler scheduler;
    VirtualClock clock(scheduler);
    std::vector<double> stamps;
    scheduler.spawn("worker", [&] {
        clock.sleep(1.5);
        stamps.push_back(clock.now());
        clock.sleep(2.5);
        stamps.push_back(clock.now());
    });

    drive(scheduler, clock);
    scheduler.joinAll();
    EXPECT_EQ(stamps, (std::vector<double>{1.5, 4.0}));
}

TEST(VirtualClockTest, PastDeadlineOnlyYields) {
    TaskScheduler scheduler;
    VirtualClock clock(scheduler);
    bool result = false;
    scheduler.spawn("late", [&] { result = clock.sleepUntil(0.0); });

    scheduler.yield();
    EXPECT_EQ(clock.pendingCount(), 0u);
    scheduler.joinAll();
    EXPECT_TRUE(result);
    EXPECT_DOUBLE_EQ(clock.now(), 0.0);
}

TEST(VirtualClockTest, ZeroSleepYieldsWithoutEvent) {
    TaskScheduler scheduler;
    VirtualClock clock(scheduler);
    bool result = false;
    scheduler.spawn("zero", [&] { result = clock.sleep(0.0); });
    scheduler.yield();
    EXPECT_EQ(clock.pendingCount(), 0u);
    scheduler.joinAll();
    EXPECT_TRUE(result);
}

TEST(VirtualClockTest, PeekReportsEarliestDeadline) {
    TaskScheduler scheduler;
    VirtualClock clock(scheduler);
    double next = -1.0;
    EXPECT_FALSE(clock.peekNextDeadline(next));
    EXPECT_FALSE(clock.advance());

    scheduler.spawn("a", [&] { clock.sleepUntil(8.0); });
    scheduler.spawn("b", [&] { clock.sleepUntil(3.0); });
    scheduler.yield();
    ASSERT_TRUE(clock.peekNextDeadline(next));
    EXPECT_DOUBLE_EQ(next, 3.0);

    drive(scheduler, clock);
    scheduler.joinAll();
}

TEST(VirtualClockTest, ShutdownCancelsPendingAndRefusesNewSleeps) {
    TaskScheduler scheduler;
    VirtualClock clock(scheduler);
    bool result = true;
    scheduler.spawn("sleeper", [&] { result = clock.sleep(100.0); });
    scheduler.yield();
    EXPECT_EQ(clock.pendingCount(), 1u);

    clock.shutdown();
    scheduler.joinAll();
    EXPECT_FALSE(result);
    EXPECT_TRUE(clock.isShutdown());
    EXPECT_DOUBLE_EQ(clock.now(), 0.0);

    bool late = true;
    scheduler.spawn("after", [&] { late = clock.sleepUntil(5.0); });
    scheduler.joinAll();
    EXPECT_FALSE(late);
}
