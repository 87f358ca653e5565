// server_loop.cpp
#include "server_loop.h"

int runServerLoop(WaitingRoom& room, const DurationRange& help) {
    int served = 0;
    while (room.isActive()) {
        room.serveNext(randomDuration(help));
        ++served;
    }
    room.report(monitorActor(), EventKind::ServerFinished, 0, "office hours are over. Done!");
    return served;
}
