#include "sched/virtual_clock.hpp"

VirtualClock::VirtualClock(TaskScheduler& scheduler)
    : scheduler(scheduler), current(0.0), nextSeq(0), stopped(false) {}

double VirtualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

bool VirtualClock::sleep(double duration) {
    if (duration <= 0.0) {
        scheduler.yield();
        return !isShutdown();
    }
    return sleepUntil(now() + duration);
}

bool VirtualClock::sleepUntil(double wakeTime) {
    auto ticket = std::make_shared<WakeTicket>();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopped) {
            return false;
        }
        if (wakeTime > current) {
            pending.push(WakeEvent{wakeTime, nextSeq++, scheduler.currentTask(), ticket});
        } else {
            ticket.reset();
        }
    }
    if (!ticket) {
        scheduler.yield();
        return true;
    }

    // Registered once above; a resume without a fired ticket just waits again.
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (ticket->fired) return true;
            if (ticket->cancelled) return false;
        }
        if (!scheduler.suspend()) {
            std::lock_guard<std::mutex> lock(mutex);
            return ticket->fired;
        }
    }
}

bool VirtualClock::advance() {
    std::vector<TaskId> toResume;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (pending.empty()) {
            return false;
        }
        WakeEvent first = pending.top();
        pending.pop();
        if (first.deadline > current) {
            current = first.deadline;
        }
        first.ticket->fired = true;
        toResume.push_back(first.task);
        while (!pending.empty() && pending.top().deadline <= current) {
            WakeEvent due = pending.top();
            pending.pop();
            due.ticket->fired = true;
            toResume.push_back(due.task);
        }
    }
    for (TaskId task : toResume) {
        scheduler.resume(task);
    }
    return true;
}

bool VirtualClock::peekNextDeadline(double& deadline) const {
    std::lock_guard<std::mutex> lock(mutex);
    if (pending.empty()) {
        return false;
    }
    deadline = pending.top().deadline;
    return true;
}

std::size_t VirtualClock::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending.size();
}

void VirtualClock::shutdown() {
    std::vector<TaskId> toResume;
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopped = true;
        while (!pending.empty()) {
            WakeEvent event = pending.top();
            pending.pop();
            event.ticket->cancelled = true;
            toResume.push_back(event.task);
        }
    }
    for (TaskId task : toResume) {
        scheduler.resume(task);
    }
}

bool VirtualClock::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex);
    return stopped;
}
