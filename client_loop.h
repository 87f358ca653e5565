// client_loop.h
#pragma once

#include "random_duration.h"
#include "waiting_room.h"

struct ClientPlan {
    int studentId;
    int requiredVisits;
    DurationRange programming;
    DurationRange retry;
};

// Programs, asks for help, and backs off when the corridor is full, until
// the student has been helped plan.requiredVisits times. Returns the number
// of help sessions received. Cancelled propagates to the caller.
int runClientLoop(WaitingRoom& room, const ClientPlan& plan);
