#include "logging/logger.hpp"

#include "util/error.hpp"

#include <fcntl.h>
#include <cerrno>
#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <string>

#include "logging/log_parser.hpp"

const char* const kEventLogHeader = "Time,Event,CustomerID,QueueLength,BusyServers";

Logger::Logger() : fd(-1) {}

Logger::Logger(const std::string& path) : fd(-1) {
    openFile(path);
}

Logger::~Logger() {
    closeFile();
}

bool Logger::openFile(const std::string& path) {
    if (fd != -1) {
        closeFile();
    }
    fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd == -1) {
        logErrno("open log file failed");
        return false;
    }
    return true;
}

bool Logger::logLine(const std::string& line) {
    if (fd == -1) {
        return false;
    }
    std::string withNewline = line;
    withNewline.push_back('\n');
    const char* data = withNewline.data();
    size_t remaining = withNewline.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written == -1) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    return true;
}

void Logger::closeFile() {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

std::string formatEventLogLine(const EventRecord& record) {
    char timeBuf[64];
    std::snprintf(timeBuf, sizeof(timeBuf), "%.2f", record.time);
    return std::string(timeBuf) + "," + eventTypeName(record.type) + "," +
           std::to_string(record.customerId) + "," +
           std::to_string(record.queueLen) + "," +
           std::to_string(record.busyServers);
}

bool parseEventLogLine(const std::string& line, EventRecord& out) {
    auto parts = split(trimLine(line), ',');
    if (parts.size() != 5) {
        return false;
    }
    EventRecord rec;
    if (!toDouble(parts[0], rec.time)) return false;
    if (!eventTypeFromName(parts[1], rec.type)) return false;
    if (!toInt(parts[2], rec.customerId)) return false;
    if (!toInt(parts[3], rec.queueLen)) return false;
    if (!toInt(parts[4], rec.busyServers)) return false;
    out = rec;
    return true;
}

bool loadEventLog(const std::string& path, std::vector<EventRecord>& out, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "Cannot open event log: " + path;
        return false;
    }
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::string trimmed = trimLine(line);
        if (trimmed.empty() || trimmed == kEventLogHeader) continue;
        EventRecord rec;
        if (!parseEventLogLine(trimmed, rec)) {
            err = "Malformed event log row " + std::to_string(lineNo) + ": " + trimmed;
            return false;
        }
        out.push_back(rec);
    }
    return true;
}

bool CsvEventLog::open(const std::string& path) {
    if (!logger.openFile(path)) {
        logWarning("Failed to create history file " + path);
        return false;
    }
    if (!logger.logLine(kEventLogHeader)) {
        logWarning("Failed to write history header to " + path);
        logger.closeFile();
        return false;
    }
    return true;
}

void CsvEventLog::onEvent(const EventRecord& record) {
    if (!logger.isOpen()) {
        return;
    }
    if (!logger.logLine(formatEventLogLine(record))) {
        logger.closeFile();
    }
}

void CsvEventLog::close() {
    logger.closeFile();
}
