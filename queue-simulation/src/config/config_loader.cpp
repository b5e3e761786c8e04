#include "config/config_loader.hpp"

#include "logging/log_parser.hpp"
#include "util/duration.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

const char* const kEnvOverridePrefix = "QUEUESIM_";

namespace {
// Scalar keys that may be overridden from the environment.
const char* const kScalarKeys[] = {
    "fixed.enabled",
    "fixed.numWindows",
    "fixed.historyFile",
    "random.enabled",
    "random.numWindows",
    "random.avgArrivalInterval",
    "random.minServiceTime",
    "random.maxServiceTime",
    "random.maxSimulationTime",
    "random.historyFile",
    "random.seed",
};

bool parseBool(const std::string& val, bool& out) {
    std::string lower = val;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

std::string envNameFor(const std::string& key) {
    std::string name = kEnvOverridePrefix;
    for (char c : key) {
        name.push_back(c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return name;
}
} // namespace

bool applyConfigValue(const std::string& key, const std::string& val, Config& cfg, std::string& err) {
    FixedSimConfig& fixed = cfg.fixedSimulation;
    RandomSimConfig& random = cfg.randomSimulation;
    bool ok = true;
    std::string durationErr;

    if (key == "fixed.enabled") ok = parseBool(val, fixed.enabled);
    else if (key == "fixed.numWindows") ok = toInt(val, fixed.numWindows);
    else if (key == "fixed.historyFile") fixed.historyFile = val;
    else if (key == "fixed.customer") {
        auto parts = split(val, ',');
        FixedCustomerConfig customer{0.0, 0.0};
        if (parts.size() != 2 ||
            !parseDuration(parts[0], customer.arrival, durationErr) ||
            !parseDuration(parts[1], customer.service, durationErr)) {
            err = "Invalid value for key: " + key + " (expected '<arrival>, <service>')";
            return false;
        }
        fixed.customers.push_back(customer);
    }
    else if (key == "random.enabled") ok = parseBool(val, random.enabled);
    else if (key == "random.numWindows") ok = toInt(val, random.numWindows);
    else if (key == "random.avgArrivalInterval") ok = parseDuration(val, random.avgArrivalInterval, durationErr);
    else if (key == "random.minServiceTime") ok = parseDuration(val, random.minServiceTime, durationErr);
    else if (key == "random.maxServiceTime") ok = parseDuration(val, random.maxServiceTime, durationErr);
    else if (key == "random.maxSimulationTime") ok = parseDuration(val, random.maxSimulationTime, durationErr);
    else if (key == "random.historyFile") random.historyFile = val;
    else if (key == "random.seed") ok = toUnsigned(val, random.randomSeed);
    else {
        err = "Unknown config key: " + key;
        return false;
    }

    if (!ok) {
        err = "Invalid value for key: " + key;
        if (!durationErr.empty()) err += " (" + durationErr + ")";
        return false;
    }
    return true;
}

bool parseConfigText(const std::string& text, Config& cfg, std::string& err) {
    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = trimLine(line);
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            err = "Line " + std::to_string(lineNo) + ": expected key = value";
            return false;
        }
        std::string key = trimLine(line.substr(0, pos));
        std::string val = trimLine(line.substr(pos + 1));
        if (!applyConfigValue(key, val, cfg, err)) {
            err = "Line " + std::to_string(lineNo) + ": " + err;
            return false;
        }
    }
    return true;
}

bool applyEnvironmentOverrides(Config& cfg, std::string& err) {
    for (const char* key : kScalarKeys) {
        std::string envName = envNameFor(key);
        const char* env = std::getenv(envName.c_str());
        if (env == nullptr) continue;
        if (!applyConfigValue(key, trimLine(env), cfg, err)) {
            err = envName + ": " + err;
            return false;
        }
    }
    return true;
}

bool validateConfig(Config& cfg, std::string& err) {
    FixedSimConfig& fixed = cfg.fixedSimulation;
    const RandomSimConfig& random = cfg.randomSimulation;
    if (!fixed.enabled && !random.enabled) {
        err = "At least one simulation (fixed or random) must be enabled";
        return false;
    }
    if (fixed.enabled) {
        if (fixed.numWindows <= 0) {
            err = "fixed.numWindows must be > 0";
            return false;
        }
        for (const auto& c : fixed.customers) {
            if (!std::isfinite(c.arrival) || !std::isfinite(c.service) ||
                c.arrival < 0.0 || c.service <= 0.0) {
                err = "fixed.customer needs a finite arrival >= 0 and a finite service > 0";
                return false;
            }
        }
        // Arrivals are admitted in list order, so the list must be sorted.
        std::stable_sort(fixed.customers.begin(), fixed.customers.end(),
                         [](const FixedCustomerConfig& a, const FixedCustomerConfig& b) {
                             return a.arrival < b.arrival;
                         });
    }
    if (random.enabled) {
        if (random.numWindows <= 0) {
            err = "random.numWindows must be > 0";
            return false;
        }
        if (!std::isfinite(random.maxSimulationTime) || !std::isfinite(random.avgArrivalInterval) ||
            !std::isfinite(random.minServiceTime) || !std::isfinite(random.maxServiceTime)) {
            err = "random durations must be finite";
            return false;
        }
        if (random.maxSimulationTime <= 0.0 || random.avgArrivalInterval <= 0.0) {
            err = "random.maxSimulationTime and random.avgArrivalInterval must be > 0";
            return false;
        }
        if (random.minServiceTime <= 0.0 || random.maxServiceTime < random.minServiceTime) {
            err = "random service times must be > 0 and max >= min";
            return false;
        }
    }
    return true;
}

bool loadConfigFile(const std::string& path, Config& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "Cannot open config file: " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (!parseConfigText(buffer.str(), cfg, err)) {
        err = path + ": " + err;
        return false;
    }
    if (!applyEnvironmentOverrides(cfg, err)) {
        return false;
    }
    return validateConfig(cfg, err);
}
