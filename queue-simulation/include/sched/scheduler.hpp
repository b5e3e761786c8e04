#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using TaskId = int;

/**
 * @brief Cooperative scheduler multiplexing logical tasks over OS threads.
 *
 * Each task owns a thread, but only the holder of the run baton executes.
 * The baton changes hands only inside yield(), suspend() or when a task
 * returns, so code between two of those calls is never interleaved with
 * another task. The thread that constructs the scheduler becomes the
 * driver task (id 0) and holds the baton initially.
 *
 * All methods except the constructor and destructor must be called by the
 * task that currently holds the baton.
 */
class TaskScheduler {
public:
    using TaskFn = std::function<void()>;
    static constexpr TaskId kDriverTask = 0;
    static constexpr TaskId kNoTask = -1;

    TaskScheduler();

    /** @brief Runs joinAll() if tasks are still alive. Driver thread only. */
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    /**
     * @brief Create a task; it is queued as ready and first runs when the
     *        caller gives up the baton.
     * @param name label used in diagnostics.
     * @param fn task body; an escaping std::exception is logged and ends the task.
     * @return id of the new task.
     */
    TaskId spawn(const std::string& name, TaskFn fn);

    /**
     * @brief Move the caller to the back of the ready queue and let the
     *        tasks ahead of it run. Returns at once if nothing else is ready.
     */
    void yield();

    /**
     * @brief Block the caller until another task calls resume() on it.
     * @return false if the scheduler aborted the wait during teardown.
     * @throws std::logic_error if no other task could ever run.
     */
    bool suspend();

    /** @brief Make a suspended task ready again; ignored for other tasks. */
    void resume(TaskId id);

    TaskId currentTask() const;

    /** @brief Tasks waiting for the baton (excluding the caller). */
    std::size_t readyCount() const;

    /** @brief Spawned tasks that have not finished yet (driver excluded). */
    std::size_t liveCount() const;

    /**
     * @brief Driver only: run until every spawned task has finished, then
     *        join their threads. Tasks still blocked once nothing else can
     *        run are woken with suspend() returning false.
     */
    void joinAll();

private:
    struct TaskControl {
        std::string name;
        std::condition_variable cv;
        std::thread thread;
        bool blocked{false};
        bool finished{false};
    };

    void taskMain(TaskId id, TaskFn fn);
    void handOff();
    void waitForTurn(std::unique_lock<std::mutex>& lock, TaskId id);

    mutable std::mutex mutex;
    std::vector<std::unique_ptr<TaskControl>> tasks;
    std::deque<TaskId> ready;
    TaskId current;
    std::size_t live;
    bool aborting;
};
