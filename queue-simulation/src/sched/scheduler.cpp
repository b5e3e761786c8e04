#include "sched/scheduler.hpp"

#include "util/error.hpp"

#include <stdexcept>

TaskScheduler::TaskScheduler() : current(kDriverTask), live(0), aborting(false) {
    auto driver = std::make_unique<TaskControl>();
    driver->name = "driver";
    tasks.push_back(std::move(driver));
}

TaskScheduler::~TaskScheduler() {
    joinAll();
}

TaskId TaskScheduler::spawn(const std::string& name, TaskFn fn) {
    std::lock_guard<std::mutex> lock(mutex);
    TaskId id = static_cast<TaskId>(tasks.size());
    auto control = std::make_unique<TaskControl>();
    control->name = name;
    TaskControl* raw = control.get();
    tasks.push_back(std::move(control));
    ready.push_back(id);
    ++live;
    // The new thread blocks on the mutex held here until the baton reaches it.
    raw->thread = std::thread(&TaskScheduler::taskMain, this, id, std::move(fn));
    return id;
}

void TaskScheduler::taskMain(TaskId id, TaskFn fn) {
    std::string name;
    {
        std::unique_lock<std::mutex> lock(mutex);
        waitForTurn(lock, id);
        name = tasks[id]->name;
    }
    try {
        fn();
    } catch (const std::exception& e) {
        logWarning("task '" + name + "' terminated: " + e.what());
    }
    std::unique_lock<std::mutex> lock(mutex);
    tasks[id]->finished = true;
    --live;
    handOff();
}

// Caller holds the mutex.
void TaskScheduler::handOff() {
    if (ready.empty()) {
        current = kNoTask;
        return;
    }
    TaskId next = ready.front();
    ready.pop_front();
    current = next;
    tasks[next]->cv.notify_one();
}

void TaskScheduler::waitForTurn(std::unique_lock<std::mutex>& lock, TaskId id) {
    TaskControl* self = tasks[id].get();
    self->cv.wait(lock, [this, id] { return current == id; });
}

void TaskScheduler::yield() {
    std::unique_lock<std::mutex> lock(mutex);
    if (ready.empty()) {
        return;
    }
    TaskId self = current;
    ready.push_back(self);
    handOff();
    waitForTurn(lock, self);
}

bool TaskScheduler::suspend() {
    std::unique_lock<std::mutex> lock(mutex);
    TaskId self = current;
    if (aborting) {
        return false;
    }
    if (ready.empty()) {
        throw std::logic_error("task '" + tasks[self]->name + "' suspended with no runnable task left");
    }
    tasks[self]->blocked = true;
    handOff();
    waitForTurn(lock, self);
    return !aborting;
}

void TaskScheduler::resume(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex);
    if (id <= kNoTask || id >= static_cast<TaskId>(tasks.size())) {
        return;
    }
    TaskControl* target = tasks[id].get();
    if (!target->blocked || target->finished) {
        return;
    }
    target->blocked = false;
    ready.push_back(id);
}

TaskId TaskScheduler::currentTask() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

std::size_t TaskScheduler::readyCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return ready.size();
}

std::size_t TaskScheduler::liveCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return live;
}

void TaskScheduler::joinAll() {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (live == 0) {
                break;
            }
            if (ready.empty()) {
                // Everything left is blocked for good: wake it with a failed suspend().
                aborting = true;
                for (size_t id = 1; id < tasks.size(); ++id) {
                    TaskControl* task = tasks[id].get();
                    if (task->blocked && !task->finished) {
                        task->blocked = false;
                        ready.push_back(static_cast<TaskId>(id));
                    }
                }
            }
        }
        yield();
    }
    for (size_t id = 1; id < tasks.size(); ++id) {
        if (tasks[id]->thread.joinable()) {
            tasks[id]->thread.join();
        }
    }
}
