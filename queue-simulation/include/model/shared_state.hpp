#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

#include "logging/event_sink.hpp"
#include "model/customer.hpp"
#include "model/statistics.hpp"
#include "model/types.hpp"

/** @brief Copy of the live counters and statistics at one instant. */
struct StateSnapshot {
    int numWindows{0};
    int totalCustomers{0};
    int admittedCustomers{0};
    int waitingQueueLen{0};
    int busyServers{0};
    double currentTime{0.0};
    Statistics stats;
};

/**
 * @brief Exclusive owner of the customer list, live counters and statistics.
 *
 * Every transition (integral snapshot, counter change, event record) runs
 * as one critical section. The integral is always advanced with the
 * counters as they were before the change. No method suspends, so the lock
 * is never held across a scheduling point.
 */
class SharedState {
public:
    explicit SharedState(int numWindows);

    /** @brief Append a customer; returns its id. Only before a run. */
    int addCustomer(double arrivalTime, double serviceDuration);

    /** @brief Stable sort by arrival time (processing order depends on it). */
    void sortCustomersByArrival();

    /** @brief Register an ordered sink; the pointer must outlive the run. */
    void addSink(EventSink* sink);
    void clearSinks();

    /** @brief Arrival admitted: snapshot, ++queue, record Arrival. */
    bool recordArrival(int customerId, double now);

    /**
     * @brief A window picks up a customer: snapshot, ++busy, --queue
     *        (never below zero), set start time, record ServiceStart.
     * @param serviceDuration receives the customer's service duration.
     * @return false (logged) for an out-of-range id.
     */
    bool recordServiceStart(int customerId, double now, double& serviceDuration);

    /** @brief Service finished: snapshot, --busy, set end time, record ServiceEnd. */
    bool recordServiceEnd(int customerId, double now);

    /** @brief Extend integrals to finalTime with the last known counters. */
    void finalize(double finalTime);

    int numWindows() const { return windows; }
    int customerCount() const;

    /** @brief Arrival time of a customer; false for an out-of-range id. */
    bool arrivalTime(int customerId, double& out) const;

    /** @brief Customers still waiting or in service. */
    int customersInSystem() const;

    StateSnapshot snapshot() const;
    std::vector<Customer> customers() const;

private:
    bool validId(int customerId) const;
    void updateIntegral(double now);
    void recordEvent(double now, EventType type, int customerId);

    const int windows;
    mutable std::mutex mutex;
    std::vector<Customer> customerList;
    std::vector<EventSink*> sinks;
    int waitingQueueLen;
    int busyServers;
    int admitted;
    double currentTime;
    Statistics stats;
};
