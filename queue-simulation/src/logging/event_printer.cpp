#include "logging/event_printer.hpp"

#include "util/duration.hpp"

#include <iomanip>
#include <sstream>

namespace {
const char* const kRule =
    "-------------------------------------------------------------------------------------------";
} // namespace

std::string formatEventRow(const EventRecord& record) {
    std::ostringstream oss;
    oss << formatDurationFixedWidth(record.time) << ' '
        << std::left << std::setw(15) << eventTypeName(record.type) << ' '
        << std::setw(10) << record.customerId << ' '
        << std::setw(10) << record.queueLen << ' '
        << record.busyServers << '/' << record.numWindows;
    return oss.str();
}

EventPrinter::EventPrinter(std::ostream& out) : out(out) {}

EventPrinter::~EventPrinter() {
    stop();
}

void EventPrinter::start() {
    if (worker.joinable()) {
        return;
    }
    out << std::right << std::setw(30) << "Time" << ' '
        << std::left << std::setw(15) << "Event" << ' '
        << std::setw(10) << "CustID" << ' '
        << std::setw(10) << "Queue" << ' '
        << "BusyServers" << '\n'
        << kRule << std::right << std::endl;
    worker = std::thread(&EventPrinter::printLoop, this);
}

void EventPrinter::onEvent(const EventRecord& record) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        pending.push_back(Entry{false, record});
    }
    cv.notify_one();
}

void EventPrinter::stop() {
    if (!worker.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        pending.push_back(Entry{true, EventRecord{}});
    }
    cv.notify_one();
    worker.join();
    out << kRule << std::endl;
}

void EventPrinter::printLoop() {
    while (true) {
        Entry entry;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this] { return !pending.empty(); });
            entry = pending.front();
            pending.pop_front();
        }
        if (entry.end) {
            break;
        }
        out << formatEventRow(entry.record) << '\n';
    }
    out.flush();
}
