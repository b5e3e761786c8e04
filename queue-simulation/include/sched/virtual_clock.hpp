#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <vector>

#include "sched/scheduler.hpp"

/**
 * @brief Simulated clock: tasks sleep until a virtual instant and the
 *        driver moves "now" straight to the earliest pending wake event.
 *
 * Equal deadlines are resumed in registration order.
 */
class VirtualClock {
public:
    explicit VirtualClock(TaskScheduler& scheduler);

    VirtualClock(const VirtualClock&) = delete;
    VirtualClock& operator=(const VirtualClock&) = delete;

    /** @brief Current virtual time. */
    double now() const;

    /**
     * @brief Sleep for a virtual duration. A non-positive duration only
     *        yields once.
     * @return true when the deadline was reached, false if the clock was
     *         shut down first.
     */
    bool sleep(double duration);

    /**
     * @brief Sleep until an absolute virtual time. A time at or before now()
     *        only yields once; otherwise exactly one wake event is registered.
     * @return true when the deadline was reached, false if the clock was
     *         shut down first.
     */
    bool sleepUntil(double wakeTime);

    /**
     * @brief Pop the earliest wake event, move now() to its deadline and
     *        resume its task, plus every other event already due.
     * @return false iff no events were pending.
     */
    bool advance();

    /** @brief Earliest pending deadline; false when nothing is pending. */
    bool peekNextDeadline(double& deadline) const;

    std::size_t pendingCount() const;

    /** @brief Cancel all pending sleeps and refuse new ones. */
    void shutdown();

    bool isShutdown() const;

private:
    struct WakeTicket {
        bool fired{false};
        bool cancelled{false};
    };

    struct WakeEvent {
        double deadline;
        std::uint64_t seq;
        TaskId task;
        std::shared_ptr<WakeTicket> ticket;
    };

    struct LaterFirst {
        bool operator()(const WakeEvent& a, const WakeEvent& b) const {
            if (a.deadline != b.deadline) return a.deadline > b.deadline;
            return a.seq > b.seq;
        }
    };

    TaskScheduler& scheduler;
    mutable std::mutex mutex;
    double current;
    std::uint64_t nextSeq;
    bool stopped;
    std::priority_queue<WakeEvent, std::vector<WakeEvent>, LaterFirst> pending;
};
