// simulation.h
#pragma once

#include <pthread.h>

#include "config.h"
#include "waiting_room.h"

const int EXIT_CONFIG_ERROR = 1;
const int EXIT_MONITOR_CANCELLED = 2;
const int EXIT_THREAD_ERROR = 3;

struct SimulationResult {
    int exitCode = 0;
    int received = 0;
    int served = 0;
    bool monitorCancelled = false;
};

// Same shape as pthread_create, so thread creation can be replaced.
using ThreadStarter = int (*)(pthread_t*, const pthread_attr_t*, void* (*)(void*), void*);

// Runs one session of office hours against room. Starts the monitor and one
// thread per student, joins the students, then gives the monitor
// config.serverGraceMs to notice termination before cancelling the room.
//
// exitCode is EXIT_MONITOR_CANCELLED only when the monitor really had to be
// interrupted, and EXIT_THREAD_ERROR when a thread could not be started; in
// that case the room is cancelled and every started thread is joined.
SimulationResult runSimulation(const SimulationConfig& config, WaitingRoom& room,
                               ThreadStarter start = pthread_create);
