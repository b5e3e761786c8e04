#include "simulation_engine.hpp"

#include "logging/logger.hpp"
#include "roles/arrival_generator.hpp"
#include "roles/run_context.hpp"
#include "roles/service_window.hpp"
#include "sched/channel.hpp"
#include "sched/scheduler.hpp"
#include "sched/virtual_clock.hpp"
#include "util/error.hpp"

#include <cmath>
#include <string>

namespace {
int checkedWindows(int numWindows) {
    if (numWindows <= 0) {
        die("Number of windows must be greater than 0");
    }
    return numWindows;
}
} // namespace

RunOutcome driveClock(TaskScheduler& scheduler, VirtualClock& clock, const SharedState& state,
                      const RunOptions& options, const std::atomic<bool>& stopRequested) {
    // Let every runnable task settle, then move virtual time.
    int stalledPolls = 0;
    while (true) {
        scheduler.yield();
        if (scheduler.readyCount() > 0) {
            continue;
        }
        if (stopRequested.load()) {
            return RunOutcome::Stopped;
        }
        if (options.hasMaxTime) {
            double next = 0.0;
            if (clock.now() >= options.maxTime ||
                (clock.peekNextDeadline(next) && next > options.maxTime)) {
                return RunOutcome::ReachedMaxTime;
            }
        }
        if (clock.advance()) {
            stalledPolls = 0;
            continue;
        }
        if (++stalledPolls > kMaxStalledPolls) {
            int inSystem = state.customersInSystem();
            if (inSystem > 0) {
                logWarning("Deadlock detected with " + std::to_string(inSystem) +
                           " customers still in system");
                return RunOutcome::Deadlock;
            }
            return RunOutcome::Completed;
        }
    }
}

SimulationEngine::SimulationEngine(int numWindows)
    : windows(checkedWindows(numWindows)), state(numWindows), stopRequested(false), hasRun(false) {}

SimulationEngine::SimulationEngine(int numWindows, unsigned int seed)
    : windows(checkedWindows(numWindows)), state(numWindows), rng(seed), stopRequested(false), hasRun(false) {}

void SimulationEngine::addCustomer(double arrivalTime, double serviceDuration) {
    if (!(arrivalTime >= 0.0) || !std::isfinite(arrivalTime)) {
        die("Arrival time must be finite and non-negative");
    }
    if (!(serviceDuration > 0.0) || !std::isfinite(serviceDuration)) {
        die("Service duration must be finite and positive");
    }
    state.addCustomer(arrivalTime, serviceDuration);
}

void SimulationEngine::generateRandomCustomers(double maxTime, double avgArrivalInterval,
                                               double minService, double maxService) {
    if (!std::isfinite(maxTime) || !std::isfinite(avgArrivalInterval) ||
        !std::isfinite(minService) || !std::isfinite(maxService)) {
        die("Random generation bounds must be finite");
    }
    if (!(maxTime > 0.0)) die("Max time must be positive");
    if (!(avgArrivalInterval > 0.0)) die("Average arrival interval must be positive");
    if (!(minService > 0.0)) die("Minimum service time must be positive");
    if (!(maxService >= minService)) die("Maximum service time must be >= minimum service time");

    double arrival = 0.0;
    while (true) {
        arrival += rng.exponential(avgArrivalInterval);
        if (arrival > maxTime) {
            break;
        }
        addCustomer(arrival, rng.uniformReal(minService, maxService));
    }
}

void SimulationEngine::addEventSink(EventSink* sink) {
    if (sink != nullptr) {
        sinks.push_back(sink);
    }
}

void SimulationEngine::requestStop() {
    stopRequested.store(true);
}

// Engine entry point (see header for details).
RunReport SimulationEngine::run(const RunOptions& options) {
    if (hasRun) {
        die("SimulationEngine::run may only be called once");
    }
    hasRun = true;
    RunReport report;

    state.sortCustomersByArrival();

    CsvEventLog history;
    if (!options.historyPath.empty()) {
        history.open(options.historyPath);
    }
    state.clearSinks();
    for (EventSink* sink : sinks) {
        state.addSink(sink);
    }
    if (history.isOpen()) {
        state.addSink(&history);
    }

    int served = 0;
    {
        TaskScheduler scheduler;
        VirtualClock clock(scheduler);
        // Unbounded: admission never waits, so each arrival is recorded at its own instant.
        Channel<int> admissions(scheduler, Channel<int>::kUnbounded);
        RunContext ctx{state, clock, admissions, options.hasMaxTime, options.maxTime, windows};

        for (int i = 0; i < windows; ++i) {
            scheduler.spawn("window-" + std::to_string(i + 1), [&ctx, &served] {
                ServiceWindow window;
                served += window.run(ctx);
            });
        }
        scheduler.spawn("arrivals", [&ctx, &report] {
            ArrivalGenerator generator;
            report.admittedCustomers = generator.run(ctx);
        });

        report.outcome = driveClock(scheduler, clock, state, options, stopRequested);

        // Release everything still sleeping or waiting, then let it unwind.
        clock.shutdown();
        admissions.close();
        scheduler.joinAll();
        bool extendToMax = options.hasMaxTime && report.outcome != RunOutcome::Stopped;
        report.endTime = extendToMax ? options.maxTime : clock.now();
    }
    report.servedCustomers = served;

    state.finalize(report.endTime);
    state.clearSinks();
    history.close();
    report.endTime = state.snapshot().currentTime;
    return report;
}
