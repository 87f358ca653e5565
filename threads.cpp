#include <iostream>
#include <stdexcept>

#include "config.h"
#include "event_log.h"
#include "simulation.h"
#include "waiting_room.h"

namespace {

void printConfig(const SimulationConfig& config) {
    std::cout << "Number of student threads: " << config.students << "\n";
    std::cout << "Chairs in the corridor: " << config.chairs << "\n";
    std::cout << "Visits per student: " << config.visitsPerStudent << "\n";
    std::cout << "Programming time: " << config.programming.minMs << "-" << config.programming.maxMs << " ms\n";
    std::cout << "Help time: " << config.help.minMs << "-" << config.help.maxMs << " ms\n";
    std::cout << "Retry time: " << config.retry.minMs << "-" << config.retry.maxMs << " ms\n";
    std::cout << "Monitor grace period: " << config.serverGraceMs << " ms\n";
    std::cout << "Starting simulation...\n";
}

}

int main(int argc, char *argv[]) {
    SimulationConfig config;

    try {
        if (!loadConfigFile("config.json", config)) {
            std::cerr << "No such file as: config.json. Using defaults and command line." << std::endl;
        }
        applyArguments(argc, argv, config);
        validate(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    EventLog log(config.logDirectory);
    log.clearDirectory();
    printConfig(config);

    WaitingRoom room(config.chairs, config.totalServices(), log);
    SimulationResult result = runSimulation(config, room);

    std::cout << "Help sessions received: " << result.received << "/" << config.totalServices()
              << ", delivered by the monitor: " << result.served
              << ", office state: " << toString(room.state()) << "\n";
    if (room.isCancelled()) {
        std::cout << "Office closed early with " << room.queueLength() << " of "
                  << room.capacity() << " chairs still taken.\n";
    }
    std::cout << "Simulation finished." << std::endl;

    return result.exitCode;
}
