#pragma once

#include <cstddef>
#include <deque>
#include <mutex>

#include "sched/scheduler.hpp"

/**
 * @brief FIFO channel between cooperative tasks, bounded or unbounded.
 *
 * send() suspends while a bounded channel is full, receive() while it is
 * empty.
 * After close(), send() fails and receive() drains what is left before
 * failing. Waiters are resumed in the order they started waiting.
 */
template <typename T>
class Channel {
public:
    /** @brief Capacity value for a channel whose send() never waits. */
    static constexpr std::size_t kUnbounded = 0;

    Channel(TaskScheduler& scheduler, std::size_t capacity)
        : scheduler(scheduler), capacity(capacity), closedFlag(false) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueue a value, waiting for room if needed.
     * @return false if the channel is (or becomes) closed.
     */
    bool send(const T& value) {
        while (true) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (closedFlag) {
                    return false;
                }
                if (capacity == kUnbounded || items.size() < capacity) {
                    items.push_back(value);
                    wakeOne(receivers);
                    return true;
                }
                senders.push_back(scheduler.currentTask());
            }
            if (!scheduler.suspend()) {
                return false;
            }
        }
    }

    /**
     * @brief Dequeue the oldest value, waiting while empty.
     * @return false once the channel is closed and drained.
     */
    bool receive(T& out) {
        while (true) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (!items.empty()) {
                    out = items.front();
                    items.pop_front();
                    wakeOne(senders);
                    return true;
                }
                if (closedFlag) {
                    return false;
                }
                receivers.push_back(scheduler.currentTask());
            }
            if (!scheduler.suspend()) {
                return false;
            }
        }
    }

    /** @brief Refuse further sends and wake every waiter. */
    void close() {
        std::deque<TaskId> waiters;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closedFlag) {
                return;
            }
            closedFlag = true;
            waiters.swap(receivers);
            waiters.insert(waiters.end(), senders.begin(), senders.end());
            senders.clear();
        }
        for (TaskId id : waiters) {
            scheduler.resume(id);
        }
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closedFlag;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return items.size();
    }

private:
    // Caller holds the mutex; resume() only takes the scheduler lock.
    void wakeOne(std::deque<TaskId>& waiters) {
        if (waiters.empty()) {
            return;
        }
        TaskId id = waiters.front();
        waiters.pop_front();
        scheduler.resume(id);
    }

    TaskScheduler& scheduler;
    std::size_t capacity;
    mutable std::mutex mutex;
    std::deque<T> items;
    std::deque<TaskId> receivers;
    std::deque<TaskId> senders;
    bool closedFlag;
};
