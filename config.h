// config.h
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "random_duration.h"

struct SimulationConfig {
    int students = 8;
    int chairs = 3;
    int visitsPerStudent = 3;
    DurationRange programming{400, 1200};
    DurationRange help{300, 900};
    DurationRange retry{200, 600};
    int serverGraceMs = 2000;
    std::string logDirectory = "logs";

    int totalServices() const { return students * visitsPerStudent; }
};

// Values present in the document replace the ones in config.
void applyJson(const nlohmann::json& document, SimulationConfig& config);

// Reads path into config. Returns false when the file does not exist;
// throws std::invalid_argument when it cannot be parsed.
bool loadConfigFile(const std::string& path, SimulationConfig& config);

// Applies "-x value" / "--long-name value" pairs from the command line.
// Throws std::invalid_argument on an unknown option or a bad value.
void applyArguments(int argc, const char* const argv[], SimulationConfig& config);

// Throws std::invalid_argument naming the first parameter out of range.
void validate(const SimulationConfig& config);
