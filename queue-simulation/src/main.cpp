#include <atomic>
#include <csignal>
#include <signal.h>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "logging/event_printer.hpp"
#include "logging/logger.hpp"
#include "model/config.hpp"
#include "report/summary.hpp"
#include "simulation_engine.hpp"
#include "util/duration.hpp"

namespace {
std::atomic<SimulationEngine*> activeEngine(nullptr);

void handleSigint(int) {
    SimulationEngine* engine = activeEngine.load();
    if (engine) {
        engine->requestStop();
    }
}

/**
 * @brief Run one configured simulation with console output, optional
 *        history file and a final report.
 */
void runSimulation(SimulationEngine& engine, const RunOptions& options) {
    EventPrinter printer(std::cout);
    engine.addEventSink(&printer);

    std::cout << "Starting simulation with " << engine.numWindows() << " window(s)..." << std::endl;
    printer.start();
    activeEngine.store(&engine);
    RunReport report = engine.run(options);
    activeEngine.store(nullptr);
    printer.stop();

    std::cout << "Simulation finished at T=" << formatDuration(report.endTime)
              << " (" << runOutcomeName(report.outcome) << ")\n\n";
    writeSummaryText(buildSummary(engine.snapshot()), std::cout);
    std::cout << std::flush;
}

/** @brief Print a persisted event log with per-event-type counts. */
int runReplay(const std::string& path) {
    std::vector<EventRecord> records;
    std::string err;
    if (!loadEventLog(path, records, err)) {
        std::cerr << "Replay error: " << err << std::endl;
        return EXIT_FAILURE;
    }
    std::map<std::string, int> counts;
    for (const auto& rec : records) {
        std::cout << formatEventRow(rec) << '\n';
        counts[eventTypeName(rec.type)] += 1;
    }
    std::cout << "\n" << records.size() << " events";
    for (const auto& entry : counts) {
        std::cout << ", " << entry.first << "=" << entry.second;
    }
    std::cout << std::endl;
    return EXIT_SUCCESS;
}

void printUsage(const char* self) {
    std::cerr << "Usage: " << self << " [--config <path>]\n"
              << "       " << self << " replay <history.csv>\n"
              << "Default config lookup: config.cfg, then ../config.cfg\n"
              << "Scalar keys may be overridden with " << kEnvOverridePrefix
              << "<SECTION>_<KEY> environment variables." << std::endl;
}
} // namespace

// Entry point dispatches run modes (simulation or replay of a history file).
int main(int argc, char* argv[]) {
    if (argc >= 2 && std::string(argv[1]) == "replay") {
        if (argc < 3) {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
        return runReplay(argv[2]);
    }

    Config cfg{};
    std::string err;
    bool configOk = false;
    std::string configPath;

    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printUsage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (argc >= 2 && std::string(argv[1]) == "--config") {
        if (argc < 3) {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
        configPath = argv[2];
        configOk = loadConfigFile(configPath, cfg, err);
    } else if (argc >= 2) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    } else {
        // default config file paths: current dir then parent
        configPath = "config.cfg";
        configOk = loadConfigFile(configPath, cfg, err);
        if (!configOk) {
            Config parentCfg{};
            std::string errParent;
            configOk = loadConfigFile("../config.cfg", parentCfg, errParent);
            if (configOk) {
                cfg = parentCfg;
                configPath = "../config.cfg";
            } else {
                err += "; " + errParent;
            }
        }
    }

    if (!configOk) {
        std::cerr << "Config error: " << err << std::endl;
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    struct sigaction saInt {};
    saInt.sa_handler = handleSigint;
    sigemptyset(&saInt.sa_mask);
    saInt.sa_flags = 0;
    sigaction(SIGINT, &saInt, nullptr);

    std::cout << "=== Queue Simulation ===" << "\n"
              << "Using config file: " << configPath << "\n" << std::endl;

    const FixedSimConfig& fixed = cfg.fixedSimulation;
    if (fixed.enabled) {
        std::cout << "=== Fixed simulation (" << fixed.customers.size() << " customers) ===" << std::endl;
        SimulationEngine engine(fixed.numWindows);
        for (const auto& customer : fixed.customers) {
            engine.addCustomer(customer.arrival, customer.service);
        }
        RunOptions options;
        options.historyPath = fixed.historyFile;
        runSimulation(engine, options);
        std::cout << std::endl;
    }

    const RandomSimConfig& random = cfg.randomSimulation;
    if (random.enabled) {
        std::cout << "=== Random simulation (seed " << random.randomSeed << ") ===" << std::endl;
        SimulationEngine engine(random.numWindows, random.randomSeed);
        engine.generateRandomCustomers(random.maxSimulationTime, random.avgArrivalInterval,
                                       random.minServiceTime, random.maxServiceTime);
        RunOptions options;
        options.hasMaxTime = true;
        options.maxTime = random.maxSimulationTime;
        options.historyPath = random.historyFile;
        runSimulation(engine, options);
        std::cout << std::endl;
    }

    std::cout << "Simulation(s) completed." << std::endl;
    return EXIT_SUCCESS;
}
