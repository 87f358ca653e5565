// event_log.cpp
#include "event_log.h"

#include <ctime>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <fstream>
#include <sstream>
#include <utility>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

const char* toString(EventKind kind) {
    switch (kind) {
        case EventKind::Activity: return "ACTIVITY";
        case EventKind::Enqueued: return "ENQUEUED";
        case EventKind::Rejected: return "REJECTED";
        case EventKind::Wake: return "WAKE";
        case EventKind::Idle: return "IDLE";
        case EventKind::Dequeued: return "DEQUEUED";
        case EventKind::ServiceStart: return "SERVICE_START";
        case EventKind::ServiceComplete: return "SERVICE_COMPLETE";
        case EventKind::Served: return "SERVED";
        case EventKind::Retry: return "RETRY";
        case EventKind::ClientFinished: return "CLIENT_FINISHED";
        case EventKind::ServerFinished: return "SERVER_FINISHED";
        case EventKind::Terminated: return "TERMINATED";
        case EventKind::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::string formatTime(std::chrono::system_clock::time_point time) {
    std::time_t timestamp = std::chrono::system_clock::to_time_t(time);
    std::tm localTime{};
    localtime_r(&timestamp, &localTime);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;

    std::ostringstream formattedTime;
    formattedTime << std::put_time(&localTime, "%T") << "."
                  << std::setw(3) << std::setfill('0') << millis;

    return formattedTime.str();
}

std::string formatEvent(const Event& event) {
    return "ID: " + event.actor + "; Time stamp: " + formatTime(event.time) + "; Message: " + event.message;
}

std::string monitorActor() {
    return "monitor";
}

std::string studentActor(int studentId) {
    return "student_" + std::to_string(studentId);
}

EventLog::EventLog(std::string directory) : directory_(std::move(directory)) {}

void EventLog::record(const Event& event) {
    std::string line = formatEvent(event);

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << line << std::endl;
    if (directory_.empty()) {
        return;
    }

    std::string filename = directory_ + "/" + event.actor + "_log.txt";
    std::ofstream logfile(filename, std::ios_base::app);
    if (logfile.is_open()) {
        logfile << line << std::endl;
    } else {
        std::cerr << "Error opening file: " << filename << std::endl;
    }
}

void EventLog::clearDirectory() {
    if (directory_.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (mkdir(directory_.c_str(), 0755) == -1 && errno != EEXIST) {
        std::cerr << "Error creating directory " << directory_ << ": " << std::strerror(errno) << std::endl;
        return;
    }

    DIR* dir = opendir(directory_.c_str());
    if (dir == nullptr) {
        std::cerr << "Error opening directory: " << directory_ << std::endl;
        return;
    }
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        const std::string suffix = "_log.txt";
        if (entry->d_type == DT_REG && name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            std::string filename = directory_ + "/" + name;
            if (std::remove(filename.c_str()) != 0) {
                std::cerr << "Error removing file: " << filename << std::endl;
            }
        }
    }
    closedir(dir);
}
