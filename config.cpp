// config.cpp
#include "config.h"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <unordered_map>

using json = nlohmann::json;

namespace {

// json::value() would silently truncate 2.9 to 2, so integer keys are read
// by hand and anything but a whole number in int range is rejected.
int readInt(const json& document, const char* key, int fallback) {
    auto it = document.find(key);
    if (it == document.end()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw std::invalid_argument(std::string("Error reading config: ") + key + " must be an integer. But was given: " + it->dump());
    }
    bool inRange = it->is_number_unsigned()
        ? it->get<json::number_unsigned_t>() <= static_cast<json::number_unsigned_t>(std::numeric_limits<int>::max())
        : it->get<json::number_integer_t>() >= std::numeric_limits<int>::min() &&
          it->get<json::number_integer_t>() <= std::numeric_limits<int>::max();
    if (!inRange) {
        throw std::invalid_argument(std::string("Error reading config: ") + key + " is out of range. But was given: " + it->dump());
    }
    return it->get<int>();
}

}

void applyJson(const json& document, SimulationConfig& config) {
    if (!document.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }

    config.students = readInt(document, "numberOfStudents", config.students);
    config.chairs = readInt(document, "chairs", config.chairs);
    config.visitsPerStudent = readInt(document, "visitsPerStudent", config.visitsPerStudent);
    config.programming.minMs = readInt(document, "programmingMsMin", config.programming.minMs);
    config.programming.maxMs = readInt(document, "programmingMsMax", config.programming.maxMs);
    config.help.minMs = readInt(document, "helpMsMin", config.help.minMs);
    config.help.maxMs = readInt(document, "helpMsMax", config.help.maxMs);
    config.retry.minMs = readInt(document, "retryMsMin", config.retry.minMs);
    config.retry.maxMs = readInt(document, "retryMsMax", config.retry.maxMs);
    config.serverGraceMs = readInt(document, "serverGraceMs", config.serverGraceMs);

    try {
        config.logDirectory = document.value("logDirectory", config.logDirectory);
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("Error reading config: ") + e.what());
    }
}

bool loadConfigFile(const std::string& path, SimulationConfig& config) {
    std::ifstream configFile(path);
    if (!configFile.is_open()) {
        return false;
    }

    json document;
    try {
        configFile >> document;
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("Error parsing " + path + ": " + e.what());
    }
    applyJson(document, config);
    return true;
}

void applyArguments(int argc, const char* const argv[], SimulationConfig& config) {
    std::unordered_map<std::string, int*> argMap = {
        {"-n", &config.students},
        {"--num-students", &config.students},
        {"-c", &config.chairs},
        {"--chairs", &config.chairs},
        {"-v", &config.visitsPerStudent},
        {"--visits", &config.visitsPerStudent},
        {"-p", &config.programming.minMs},
        {"--programming-min", &config.programming.minMs},
        {"-P", &config.programming.maxMs},
        {"--programming-max", &config.programming.maxMs},
        {"-h", &config.help.minMs},
        {"--help-min", &config.help.minMs},
        {"-H", &config.help.maxMs},
        {"--help-max", &config.help.maxMs},
        {"-r", &config.retry.minMs},
        {"--retry-min", &config.retry.minMs},
        {"-R", &config.retry.maxMs},
        {"--retry-max", &config.retry.maxMs},
        {"-g", &config.serverGraceMs},
        {"--grace-ms", &config.serverGraceMs}
    };

    for (int i = 1; i < argc; i += 2) {
        std::string arg = argv[i];
        auto it = argMap.find(arg);
        if (it == argMap.end() || i + 1 >= argc) {
            throw std::invalid_argument("Unknown option or missing argument for " + arg);
        }

        std::string value = argv[i + 1];
        std::size_t consumed = 0;
        try {
            *(it->second) = std::stoi(value, &consumed);
        } catch (const std::logic_error&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != value.size()) {
            throw std::invalid_argument(arg + " expects an integer. But was given: " + value);
        }
    }
}

namespace {

void requirePositive(const char* name, int value) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(name) + " must be a positive integer. But was given: " + std::to_string(value));
    }
}

void requireRange(const char* name, const DurationRange& range) {
    if (range.minMs < 0) {
        throw std::invalid_argument(std::string(name) + " minimum must not be negative. But was given: " + std::to_string(range.minMs));
    }
    if (range.maxMs < range.minMs) {
        throw std::invalid_argument(std::string(name) + " maximum must be greater than or equal to the minimum. But was given: " +
                                    std::to_string(range.maxMs));
    }
}

}

void validate(const SimulationConfig& config) {
    requirePositive("number of students", config.students);
    requirePositive("chairs", config.chairs);
    requirePositive("visits per student", config.visitsPerStudent);
    if (config.students > std::numeric_limits<int>::max() / config.visitsPerStudent) {
        throw std::invalid_argument("number of students times visits per student is too large");
    }
    requireRange("programming time", config.programming);
    requireRange("help time", config.help);
    requireRange("retry time", config.retry);
    if (config.serverGraceMs < 0) {
        throw std::invalid_argument("server grace period must not be negative. But was given: " + std::to_string(config.serverGraceMs));
    }
}
