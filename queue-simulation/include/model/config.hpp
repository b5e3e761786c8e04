#pragma once

#include <string>
#include <vector>

struct FixedCustomerConfig {
    double arrival;   // seconds
    double service;   // seconds
};

struct FixedSimConfig {
    bool enabled{false};
    int numWindows{1};
    std::vector<FixedCustomerConfig> customers;
    std::string historyFile;
};

struct RandomSimConfig {
    bool enabled{false};
    int numWindows{1};
    double avgArrivalInterval{60.0};
    double minServiceTime{25.0};
    double maxServiceTime{35.0};
    double maxSimulationTime{3600.0};
    std::string historyFile;
    unsigned int randomSeed{12345};
};

struct Config {
    FixedSimConfig fixedSimulation;
    RandomSimConfig randomSimulation;
};
