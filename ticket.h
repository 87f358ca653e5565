// ticket.h
#pragma once

#include <atomic>

#include "semaphore.h"

// A student's place in the waiting room. The student blocks in await()
// until the monitor calls complete().
class Ticket {
public:
    explicit Ticket(int requesterId);

    Ticket(const Ticket&) = delete;
    Ticket& operator=(const Ticket&) = delete;

    int requesterId() const { return requesterId_; }

    // Opens the gate. Throws std::logic_error on a second call.
    void complete();
    void await();
    void cancel();

    bool isCompleted() const { return completed_.load(); }

private:
    const int requesterId_;
    Semaphore done_;
    std::atomic<bool> completed_{false};
};
