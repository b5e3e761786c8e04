#pragma once

/**
 * @brief Incremental, time-weighted statistics for one simulation run.
 *
 * Integrals are advanced with the counters as they were *before* a
 * state change; history is never replayed.
 */
class Statistics {
public:
    Statistics() = default;

    /**
     * @brief Add (now - lastEventTime) * counter to both integrals.
     *        No-op when now <= lastEventTime.
     */
    void updateIntegrals(double now, int queueLen, int busyServers);

    /** @brief Account one finished customer. */
    void recordCompletion(double waitTime, double serviceTime);

    /** @brief Monotone maximum of the observed queue length. */
    void updateMaxQueue(int queueLen);

    double totalWaitTime() const { return totalWait; }
    double totalServiceTime() const { return totalService; }
    int completedCustomers() const { return completed; }
    double queueLengthIntegral() const { return queueIntegral; }
    double serverBusyIntegral() const { return busyIntegral; }
    double maxWaitTime() const { return maxWait; }
    int maxQueueLength() const { return maxQueue; }
    double lastEventTime() const { return lastEvent; }

    // Derived values; zero when the denominator is zero.
    double averageWaitTime() const;
    double averageServiceTime() const;
    double averageQueueLength(double currentTime) const;
    double averageBusyServers(double currentTime) const;
    double utilization(double currentTime, int numWindows) const;
    double throughputPerHour(double currentTime) const;

private:
    double totalWait{0.0};
    double totalService{0.0};
    int completed{0};
    double queueIntegral{0.0};
    double busyIntegral{0.0};
    double maxWait{0.0};
    int maxQueue{0};
    double lastEvent{0.0};
};
