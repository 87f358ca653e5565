// server_loop.h
#pragma once

#include "random_duration.h"
#include "waiting_room.h"

// Serves students until the room reports that every help session owed has
// been delivered. Returns the number of sessions this loop performed.
// Cancelled propagates to the caller.
int runServerLoop(WaitingRoom& room, const DurationRange& help);
