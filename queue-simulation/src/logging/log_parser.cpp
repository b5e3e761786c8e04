#include "logging/log_parser.hpp"

#include <limits>
#include <sstream>

std::string trimLine(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, delim)) {
        parts.push_back(trimLine(item));
    }
    return parts;
}

bool toInt(const std::string& s, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool toUnsigned(const std::string& s, unsigned int& out) {
    if (!s.empty() && s[0] == '-') return false;
    try {
        size_t used = 0;
        unsigned long value = std::stoul(s, &used);
        if (used != s.size()) return false;
        if (value > std::numeric_limits<unsigned int>::max()) return false;
        out = static_cast<unsigned int>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool toDouble(const std::string& s, double& out) {
    try {
        size_t used = 0;
        double value = std::stod(s, &used);
        if (used != s.size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}
