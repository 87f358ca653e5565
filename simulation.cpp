// simulation.cpp
#include "simulation.h"

#include <cerrno>
#include <ctime>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "cancelled.h"
#include "client_loop.h"
#include "server_loop.h"

namespace {

struct StudentTask {
    WaitingRoom* room;
    ClientPlan plan;
    int received = 0;
};

struct MonitorTask {
    WaitingRoom* room;
    DurationRange help;
    int served = 0;
    bool cancelled = false;
};

void* studentThread(void* arg) {
    auto* task = reinterpret_cast<StudentTask*>(arg);
    try {
        task->received = runClientLoop(*task->room, task->plan);
    } catch (const Cancelled& e) {
        task->room->report(studentActor(task->plan.studentId), EventKind::Cancelled, task->plan.studentId,
            std::string("interrupted: ") + e.what());
    }
    pthread_exit(nullptr);
}

void* monitorThread(void* arg) {
    auto* task = reinterpret_cast<MonitorTask*>(arg);
    try {
        task->served = runServerLoop(*task->room, task->help);
    } catch (const Cancelled& e) {
        task->cancelled = true;
        task->room->report(monitorActor(), EventKind::Cancelled, 0, std::string("interrupted: ") + e.what());
    }
    pthread_exit(nullptr);
}

void startThread(ThreadStarter start, pthread_t& thread, void* (*body)(void*), void* arg) {
    int rc = start(&thread, nullptr, body, arg);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_create");
    }
}

void joinThread(pthread_t thread) {
    int rc = pthread_join(thread, nullptr);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_join");
    }
}

// Returns false if the thread is still running after graceMs.
bool joinThreadWithin(pthread_t thread, int graceMs) {
    struct timespec deadline;
    clock_gettime(CLOCK_REALTIME, &deadline);
    deadline.tv_sec += graceMs / 1000;
    deadline.tv_nsec += static_cast<long>(graceMs % 1000) * 1000000L;
    if (deadline.tv_nsec >= 1000000000L) {
        deadline.tv_sec += 1;
        deadline.tv_nsec -= 1000000000L;
    }

    int rc = pthread_timedjoin_np(thread, nullptr, &deadline);
    if (rc == ETIMEDOUT) {
        return false;
    }
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_timedjoin_np");
    }
    return true;
}

}

SimulationResult runSimulation(const SimulationConfig& config, WaitingRoom& room, ThreadStarter start) {
    SimulationResult result;

    MonitorTask monitor{&room, config.help};
    std::vector<StudentTask> students;
    students.reserve(config.students);
    for (int i = 0; i < config.students; ++i) {
        students.push_back(StudentTask{&room, ClientPlan{i + 1, config.visitsPerStudent, config.programming, config.retry}});
    }

    pthread_t monitorId;
    try {
        startThread(start, monitorId, monitorThread, &monitor);
    } catch (const std::system_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        result.exitCode = EXIT_THREAD_ERROR;
        return result;
    }

    std::vector<pthread_t> studentIds;
    studentIds.reserve(config.students);
    bool startFailed = false;
    try {
        for (StudentTask& student : students) {
            pthread_t id;
            startThread(start, id, studentThread, &student);
            studentIds.push_back(id);
        }
    } catch (const std::system_error& e) {
        std::cerr << "Error: " << e.what() << ". Closing the office." << std::endl;
        startFailed = true;
        room.cancel();
    }

    // Wait for student threads to finish
    for (pthread_t id : studentIds) {
        joinThread(id);
    }

    if (startFailed) {
        joinThread(monitorId);
    } else if (!joinThreadWithin(monitorId, config.serverGraceMs)) {
        std::cerr << "Monitor did not finish within " << config.serverGraceMs << " ms. Cancelling." << std::endl;
        room.cancel();
        joinThread(monitorId);
    }

    for (const StudentTask& student : students) {
        result.received += student.received;
    }
    result.served = monitor.served;
    result.monitorCancelled = monitor.cancelled;
    if (startFailed) {
        result.exitCode = EXIT_THREAD_ERROR;
    } else if (monitor.cancelled) {
        result.exitCode = EXIT_MONITOR_CANCELLED;
    }
    return result;
}
