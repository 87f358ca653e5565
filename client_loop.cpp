// client_loop.cpp
#include "client_loop.h"

#include <string>

int runClientLoop(WaitingRoom& room, const ClientPlan& plan) {
    const std::string actor = studentActor(plan.studentId);
    const std::string required = std::to_string(plan.requiredVisits);
    int received = 0;

    while (received < plan.requiredVisits) {
        auto programming = randomDuration(plan.programming);
        room.report(actor, EventKind::Activity, plan.studentId,
            "programming for " + std::to_string(programming.count()) + " ms.");
        room.stopSignal().sleepFor(programming);

        if (room.requestService(plan.studentId) == ServiceOutcome::Served) {
            ++received;
            room.report(actor, EventKind::Served, plan.studentId,
                "received help (" + std::to_string(received) + "/" + required + ").");
        } else {
            auto retry = randomDuration(plan.retry);
            room.report(actor, EventKind::Retry, plan.studentId,
                "will try again after " + std::to_string(retry.count()) + " ms.");
            room.stopSignal().sleepFor(retry);
        }
    }

    room.report(actor, EventKind::ClientFinished, plan.studentId, "COMPLETED all visits.");
    return received;
}
