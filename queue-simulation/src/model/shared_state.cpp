#include "model/shared_state.hpp"

#include "util/error.hpp"

#include <algorithm>
#include <string>

SharedState::SharedState(int numWindows)
    : windows(numWindows), waitingQueueLen(0), busyServers(0), admitted(0), currentTime(0.0) {}

int SharedState::addCustomer(double arrivalTime, double serviceDuration) {
    std::lock_guard<std::mutex> lock(mutex);
    Customer customer;
    customer.arrivalTime = arrivalTime;
    customer.serviceDuration = serviceDuration;
    customerList.push_back(customer);
    return static_cast<int>(customerList.size()) - 1;
}

void SharedState::sortCustomersByArrival() {
    std::lock_guard<std::mutex> lock(mutex);
    std::stable_sort(customerList.begin(), customerList.end(),
                     [](const Customer& a, const Customer& b) { return a.arrivalTime < b.arrivalTime; });
}

void SharedState::addSink(EventSink* sink) {
    if (sink == nullptr) return;
    std::lock_guard<std::mutex> lock(mutex);
    sinks.push_back(sink);
}

void SharedState::clearSinks() {
    std::lock_guard<std::mutex> lock(mutex);
    sinks.clear();
}

bool SharedState::validId(int customerId) const {
    return customerId >= 0 && customerId < static_cast<int>(customerList.size());
}

// Caller holds the mutex. Must run before the counters change.
void SharedState::updateIntegral(double now) {
    stats.updateIntegrals(now, waitingQueueLen, busyServers);
    if (now > currentTime) {
        currentTime = now;
    }
}

// Caller holds the mutex; counters already reflect the transition.
void SharedState::recordEvent(double now, EventType type, int customerId) {
    stats.updateMaxQueue(waitingQueueLen);

    if (type == EventType::ServiceEnd) {
        const Customer& c = customerList[customerId];
        if (c.hasStarted && c.hasEnded) {
            stats.recordCompletion(c.serviceStartTime - c.arrivalTime,
                                   c.serviceEndTime - c.serviceStartTime);
        }
    }

    EventRecord record;
    record.time = now;
    record.type = type;
    record.customerId = customerId;
    record.queueLen = waitingQueueLen;
    record.busyServers = busyServers;
    record.numWindows = windows;
    for (EventSink* sink : sinks) {
        sink->onEvent(record);
    }
}

bool SharedState::recordArrival(int customerId, double now) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!validId(customerId)) {
        logWarning("Invalid customer ID " + std::to_string(customerId) + " at arrival");
        return false;
    }
    updateIntegral(now);
    waitingQueueLen += 1;
    admitted += 1;
    customerList[customerId].state = CustomerState::Waiting;
    recordEvent(now, EventType::Arrival, customerId);
    return true;
}

bool SharedState::recordServiceStart(int customerId, double now, double& serviceDuration) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!validId(customerId)) {
        logWarning("Invalid customer ID " + std::to_string(customerId));
        return false;
    }
    updateIntegral(now);

    busyServers += 1;
    if (waitingQueueLen > 0) {
        waitingQueueLen -= 1;
    } else {
        logWarning("Queue underflow prevented at T=" + std::to_string(now));
    }

    Customer& c = customerList[customerId];
    c.state = CustomerState::InService;
    c.hasStarted = true;
    c.serviceStartTime = now;
    recordEvent(now, EventType::ServiceStart, customerId);
    serviceDuration = c.serviceDuration;
    return true;
}

bool SharedState::recordServiceEnd(int customerId, double now) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!validId(customerId)) {
        logWarning("Invalid customer ID " + std::to_string(customerId) + " at service end");
        return false;
    }
    updateIntegral(now);

    if (busyServers > 0) {
        busyServers -= 1;
    }

    Customer& c = customerList[customerId];
    c.state = CustomerState::Completed;
    c.hasEnded = true;
    c.serviceEndTime = now;
    recordEvent(now, EventType::ServiceEnd, customerId);
    return true;
}

void SharedState::finalize(double finalTime) {
    std::lock_guard<std::mutex> lock(mutex);
    if (currentTime < finalTime) {
        stats.updateIntegrals(finalTime, waitingQueueLen, busyServers);
        currentTime = finalTime;
    }
}

int SharedState::customerCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return static_cast<int>(customerList.size());
}

bool SharedState::arrivalTime(int customerId, double& out) const {
    std::lock_guard<std::mutex> lock(mutex);
    if (!validId(customerId)) {
        return false;
    }
    out = customerList[customerId].arrivalTime;
    return true;
}

int SharedState::customersInSystem() const {
    std::lock_guard<std::mutex> lock(mutex);
    return waitingQueueLen + busyServers;
}

StateSnapshot SharedState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    StateSnapshot snap;
    snap.numWindows = windows;
    snap.totalCustomers = static_cast<int>(customerList.size());
    snap.admittedCustomers = admitted;
    snap.waitingQueueLen = waitingQueueLen;
    snap.busyServers = busyServers;
    snap.currentTime = currentTime;
    snap.stats = stats;
    return snap;
}

std::vector<Customer> SharedState::customers() const {
    std::lock_guard<std::mutex> lock(mutex);
    return customerList;
}
