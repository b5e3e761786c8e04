#include "util/duration.hpp"

#include "logging/log_parser.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <vector>

namespace {
constexpr double kMinute = 60.0;
constexpr double kHour = 3600.0;
constexpr double kDay = 86400.0;
constexpr double kWeek = 7.0 * kDay;

/** @brief Seconds per unit suffix, or negative for an unknown suffix. */
double unitScale(const std::string& unit) {
    if (unit == "ms" || unit == "msec" || unit == "millis") return 0.001;
    if (unit == "s" || unit == "sec" || unit == "secs" || unit == "second" || unit == "seconds") return 1.0;
    if (unit == "m" || unit == "min" || unit == "mins" || unit == "minute" || unit == "minutes") return kMinute;
    if (unit == "h" || unit == "hr" || unit == "hrs" || unit == "hour" || unit == "hours") return kHour;
    if (unit == "d" || unit == "day" || unit == "days") return kDay;
    if (unit == "w" || unit == "week" || unit == "weeks") return kWeek;
    return -1.0;
}

bool parseFiniteNumber(const std::string& text, double& out) {
    double value = 0.0;
    if (!toDouble(text, value) || !std::isfinite(value)) return false;
    out = value;
    return true;
}
} // namespace

bool parseDuration(const std::string& text, double& seconds, std::string& err) {
    std::string input = trimLine(text);
    if (input.empty()) {
        err = "Empty duration";
        return false;
    }
    double plain = 0.0;
    if (parseFiniteNumber(input, plain)) {
        seconds = plain;
        return true;
    }

    double total = 0.0;
    size_t pos = 0;
    bool anyPart = false;
    while (pos < input.size()) {
        while (pos < input.size() && std::isspace(static_cast<unsigned char>(input[pos]))) {
            ++pos;
        }
        if (pos >= input.size()) break;

        size_t numStart = pos;
        while (pos < input.size() &&
               (std::isdigit(static_cast<unsigned char>(input[pos])) || input[pos] == '.')) {
            ++pos;
        }
        std::string number = input.substr(numStart, pos - numStart);

        while (pos < input.size() && input[pos] == ' ') {
            ++pos;
        }
        size_t unitStart = pos;
        while (pos < input.size() && std::isalpha(static_cast<unsigned char>(input[pos]))) {
            ++pos;
        }
        std::string unit = input.substr(unitStart, pos - unitStart);

        double value = 0.0;
        if (number.empty() || !parseFiniteNumber(number, value)) {
            err = "Invalid duration: '" + text + "'. Expected e.g. '1m 30s' or a number of seconds";
            return false;
        }
        double scale = unitScale(unit);
        if (scale < 0.0) {
            err = "Unknown duration unit '" + unit + "' in '" + text + "'";
            return false;
        }
        total += value * scale;
        anyPart = true;
    }
    if (!anyPart) {
        err = "Invalid duration: '" + text + "'";
        return false;
    }
    seconds = total;
    return true;
}

std::string formatDuration(double seconds) {
    if (seconds <= 0.0) {
        return "0s";
    }
    long long totalMs = std::llround(seconds * 1000.0);
    long long ms = totalMs % 1000;
    long long totalSec = totalMs / 1000;
    long long days = totalSec / 86400;
    totalSec %= 86400;
    long long hours = totalSec / 3600;
    totalSec %= 3600;
    long long minutes = totalSec / 60;
    long long secs = totalSec % 60;

    std::ostringstream oss;
    bool first = true;
    auto part = [&](long long value, const char* unit) {
        if (value == 0) return;
        if (!first) oss << ' ';
        oss << value << unit;
        first = false;
    };
    part(days, "d");
    part(hours, "h");
    part(minutes, "m");
    part(secs, "s");
    part(ms, "ms");
    if (first) {
        return "0s";
    }
    return oss.str();
}

std::string formatDurationFixedWidth(double seconds) {
    std::ostringstream out;
    if (seconds < 0.0) {
        out << std::setw(30) << "INVALID";
        return out.str();
    }
    long long totalMs = std::llround(seconds * 1000.0);
    long long ms = totalMs % 1000;
    long long totalSec = totalMs / 1000;
    long long secs = totalSec % 60;
    long long totalMin = totalSec / 60;
    long long mins = totalMin % 60;
    long long totalHours = totalMin / 60;
    long long hours = totalHours % 24;
    long long days = totalHours / 24;

    struct Part {
        long long value;
        const char* unit;
        int width;
    };
    const std::vector<Part> parts = {
        {days, "d", 2}, {hours, "h", 2}, {mins, "min", 2}, {secs, "s", 2}, {ms, "ms", 3}};

    std::ostringstream body;
    bool started = false;
    for (size_t i = 0; i < parts.size(); ++i) {
        bool restNonZero = false;
        for (size_t j = i + 1; j < parts.size(); ++j) {
            if (parts[j].value != 0) restNonZero = true;
        }
        const Part& p = parts[i];
        bool isLast = i + 1 == parts.size();
        if (started) {
            if (p.value == 0 && !restNonZero) continue;
            body << ' ' << std::setw(p.width) << std::setfill('0') << p.value << p.unit;
        } else if (p.value != 0 || isLast) {
            body << p.value << p.unit;
            started = true;
        }
    }
    out << std::setw(30) << std::setfill(' ') << body.str();
    return out.str();
}
