#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "logging/event_sink.hpp"
#include "model/customer.hpp"
#include "model/shared_state.hpp"
#include "model/types.hpp"
#include "sched/scheduler.hpp"
#include "sched/virtual_clock.hpp"
#include "util/random.hpp"

struct RunOptions {
    bool hasMaxTime{false};
    double maxTime{0.0};
    std::string historyPath;    // empty: no persisted event log
};

struct RunReport {
    RunOutcome outcome{RunOutcome::Completed};
    int admittedCustomers{0};
    int servedCustomers{0};
    double endTime{0.0};
};

/** @brief Consecutive non-advancing driver polls tolerated before giving up. */
constexpr int kMaxStalledPolls = 100;

/**
 * @brief Driver loop of a run, executed by the driver task.
 *
 * Yields until no task is ready, then checks the stop flag and max time and
 * advances the clock. Gives up after kMaxStalledPolls consecutive polls with
 * nothing to advance: Deadlock if customers remain in the system, otherwise
 * Completed. Never advances past options.maxTime.
 */
RunOutcome driveClock(TaskScheduler& scheduler, VirtualClock& clock, const SharedState& state,
                      const RunOptions& options, const std::atomic<bool>& stopRequested);

/**
 * @brief Multi-window queueing simulation on virtual time.
 *
 * One arrival producer and N service windows run as cooperative tasks;
 * the caller's thread drives the clock until every customer left, max time
 * is reached, a stall is detected or a stop is requested.
 */
class SimulationEngine {
public:
    /** @brief Dies if numWindows <= 0. Random generation seeded from random_device. */
    explicit SimulationEngine(int numWindows);

    /** @brief Same, with a fixed seed for reproducible random runs. */
    SimulationEngine(int numWindows, unsigned int seed);

    /** @brief Dies if arrivalTime < 0 or serviceDuration <= 0. */
    void addCustomer(double arrivalTime, double serviceDuration);

    /**
     * @brief Poisson arrivals (exponential gaps, mean avgArrivalInterval) up
     *        to maxTime, each with a service time uniform in
     *        [minService, maxService]. Dies on invalid bounds.
     */
    void generateRandomCustomers(double maxTime, double avgArrivalInterval,
                                 double minService, double maxService);

    /** @brief Register an ordered event sink; must outlive run(). */
    void addEventSink(EventSink* sink);

    /**
     * @brief Execute the run. Only one run per engine.
     * @param options max time and optional persisted log path.
     * @return how the run ended.
     */
    RunReport run(const RunOptions& options);

    /** @brief Force termination at the next driver poll (async-signal-safe). */
    void requestStop();

    int numWindows() const { return windows; }
    StateSnapshot snapshot() const { return state.snapshot(); }
    std::vector<Customer> customers() const { return state.customers(); }

private:
    const int windows;
    SharedState state;
    RandomGenerator rng;
    std::vector<EventSink*> sinks;
    std::atomic<bool> stopRequested;
    bool hasRun;
};
