// ticket.cpp
#include "ticket.h"

#include <stdexcept>
#include <string>

Ticket::Ticket(int requesterId) : requesterId_(requesterId), done_(0) {}

void Ticket::complete() {
    bool expected = false;
    if (!completed_.compare_exchange_strong(expected, true)) {
        throw std::logic_error("ticket of student " + std::to_string(requesterId_) + " completed twice");
    }
    done_.release();
}

void Ticket::await() {
    done_.acquire();
}

void Ticket::cancel() {
    done_.cancel();
}
