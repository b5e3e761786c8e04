#pragma once

#include <string>
#include <vector>

#include "logging/event_sink.hpp"
#include "model/events.hpp"

/**
 * @brief Line writer on a raw file descriptor.
 */
class Logger {
public:
    /** @brief Default constructor leaves fd closed. */
    Logger();

    /**
     * @brief Construct and open a log file immediately.
     * @param path file path to create/truncate.
     */
    explicit Logger(const std::string& path);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Open or create (truncate) the log file.
     * @param path file path.
     * @return true on success, false on failure.
     */
    bool openFile(const std::string& path);

    /**
     * @brief Write one line (newline appended).
     * @return true if the whole line was written.
     */
    bool logLine(const std::string& line);

    /** @brief Close the file descriptor if open. */
    void closeFile();

    bool isOpen() const { return fd != -1; }

private:
    int fd;
};

/** @brief Header row of the persisted event log. */
extern const char* const kEventLogHeader;

/** @brief One persisted row: time with two decimals, event, id, queue, busy. */
std::string formatEventLogLine(const EventRecord& record);

/**
 * @brief Parse one persisted row back into a record (numWindows left 0).
 * @return false for the header, blank or malformed lines.
 */
bool parseEventLogLine(const std::string& line, EventRecord& out);

/**
 * @brief Read every data row of a persisted event log.
 * @param path log file path.
 * @param out destination records (appended).
 * @param err error message on failure.
 * @return true on success, false if the file cannot be read or a row is malformed.
 */
bool loadEventLog(const std::string& path, std::vector<EventRecord>& out, std::string& err);

/**
 * @brief Best-effort persisted event log (CSV).
 *
 * An open failure is reported once; a write failure disables the log
 * without interrupting the simulation.
 */
class CsvEventLog : public EventSink {
public:
    CsvEventLog() = default;

    /** @brief Create the file and write the header row. */
    bool open(const std::string& path);

    void onEvent(const EventRecord& record) override;

    void close();

    bool isOpen() const { return logger.isOpen(); }

private:
    Logger logger;
};
