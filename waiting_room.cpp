// waiting_room.cpp
#include "waiting_room.h"
#include "cancelled.h"

#include <stdexcept>
#include <vector>

const char* toString(RoomState state) {
    return state == RoomState::Active ? "ACTIVE" : "TERMINATED";
}

WaitingRoom::WaitingRoom(int capacity, int totalServices, EventSink& sink)
    : capacity_(capacity), sink_(sink), arrivals_(0), remaining_(totalServices), active_(totalServices > 0) {
    if (capacity < 1) {
        throw std::invalid_argument("capacity must be a positive integer. But was given: " + std::to_string(capacity));
    }
    if (totalServices < 0) {
        throw std::invalid_argument("total services must not be negative. But was given: " + std::to_string(totalServices));
    }
}

ServiceOutcome WaitingRoom::requestService(int requesterId) {
    const std::string actor = studentActor(requesterId);
    auto ticket = std::make_shared<Ticket>(requesterId);
    std::vector<Event> events;
    bool rejected = false;

    {
        FairLock::Scope scope(lock_);
        if (cancelled_) {
            throw Cancelled("waiting room was cancelled before student " + std::to_string(requesterId) + " arrived");
        }

        const std::size_t seated = queue_.size();
        if (seated >= static_cast<std::size_t>(capacity_)) {
            rejected = true;
            events.push_back(makeEvent(actor, EventKind::Rejected, requesterId, seated,
                "corridor full (" + std::to_string(seated) + "/" + std::to_string(capacity_) +
                "). Goes back to programming and will return."));
        } else {
            const bool wasEmpty = queue_.empty();
            queue_.push_back(ticket);
            events.push_back(makeEvent(actor, EventKind::Enqueued, requesterId, queue_.size(),
                "sits down in the corridor. In queue now: " + std::to_string(queue_.size()) + "."));

            if (wasEmpty) {
                signalArrival();
                events.push_back(makeEvent(actor, EventKind::Wake, requesterId, queue_.size(), "wakes up the monitor."));
            }
        }
    }

    for (const Event& event : events) {
        sink_.record(event);
    }
    if (rejected) {
        return ServiceOutcome::Rejected;
    }

    ticket->await();
    return ServiceOutcome::Served;
}

void WaitingRoom::serveNext(std::chrono::milliseconds serviceTime) {
    const std::string actor = monitorActor();

    bool idle;
    {
        FairLock::Scope scope(lock_);
        idle = queue_.empty();
    }
    if (idle) {
        report(actor, EventKind::Idle, 0, "no students in the office. Zzz...");
    }

    arrivals_.acquire();

    std::shared_ptr<Ticket> ticket;
    std::size_t left;
    {
        FairLock::Scope scope(lock_);
        wakePending_ = false;
        if (queue_.empty()) {
            throw std::logic_error("monitor woken with an empty corridor");
        }
        ticket = queue_.front();
        queue_.pop_front();
        left = queue_.size();
    }

    const int studentId = ticket->requesterId();
    sink_.record(makeEvent(actor, EventKind::Dequeued, studentId, left,
        "calls student " + std::to_string(studentId) + " (" + std::to_string(left) + " left in the corridor)."));
    sink_.record(makeEvent(actor, EventKind::ServiceStart, studentId, left,
        "helping student " + std::to_string(studentId) + " for " + std::to_string(serviceTime.count()) + " ms."));

    try {
        stop_.sleepFor(serviceTime);
    } catch (const Cancelled&) {
        ticket->cancel();
        throw;
    }

    ticket->complete();
    report(actor, EventKind::ServiceComplete, studentId, "finished helping student " + std::to_string(studentId) + ".");

    int current = remaining_.load();
    while (current > 0 && !remaining_.compare_exchange_weak(current, current - 1)) {
    }
    if (current == 1) {
        active_.store(false);
        report(actor, EventKind::Terminated, studentId, "all help sessions delivered.");
    }

    bool drained;
    {
        FairLock::Scope scope(lock_);
        drained = queue_.empty();
        if (!drained) {
            signalArrival();
        }
    }
    if (drained) {
        report(actor, EventKind::Idle, studentId,
            "corridor empty after helping student " + std::to_string(studentId) + ". Can go back to sleep.");
    }
}

void WaitingRoom::cancel() {
    std::vector<std::shared_ptr<Ticket>> waiting;
    {
        FairLock::Scope scope(lock_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        waiting.assign(queue_.begin(), queue_.end());
    }

    stop_.request();
    arrivals_.cancel();
    for (const auto& ticket : waiting) {
        ticket->cancel();
    }
    report(monitorActor(), EventKind::Cancelled, 0,
        "office closed with " + std::to_string(waiting.size()) + " students still waiting.");
}

std::size_t WaitingRoom::queueLength() {
    FairLock::Scope scope(lock_);
    return queue_.size();
}

void WaitingRoom::report(const std::string& actor, EventKind kind, int requesterId, const std::string& message) {
    sink_.record(makeEvent(actor, kind, requesterId, queueLength(), message));
}

Event WaitingRoom::makeEvent(const std::string& actor, EventKind kind, int requesterId,
                             std::size_t queueLength, const std::string& message) const {
    return Event{std::chrono::system_clock::now(), actor, kind, requesterId, queueLength, message};
}

void WaitingRoom::signalArrival() {
    if (!wakePending_) {
        wakePending_ = true;
        arrivals_.release();
    }
}
