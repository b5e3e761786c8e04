#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <ostream>
#include <thread>

#include "logging/event_sink.hpp"

/**
 * @brief Console sink: queues records and prints them from a dedicated
 *        thread so console I/O never runs inside the state lock.
 *
 * start() prints the table header; stop() drains the queue, prints the
 * footer and joins the thread.
 */
class EventPrinter : public EventSink {
public:
    explicit EventPrinter(std::ostream& out);
    ~EventPrinter() override;

    EventPrinter(const EventPrinter&) = delete;
    EventPrinter& operator=(const EventPrinter&) = delete;

    void start();
    void onEvent(const EventRecord& record) override;
    void stop();

private:
    struct Entry {
        bool end{false};
        EventRecord record;
    };

    void printLoop();

    std::ostream& out;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Entry> pending;
    std::thread worker;
};

/** @brief One console row: fixed-width time, event, id, queue, busy/windows. */
std::string formatEventRow(const EventRecord& record);
