// fair_lock.cpp
#include "fair_lock.h"

void FairLock::enter() {
    std::unique_lock<std::mutex> lock(mutex_);
    const unsigned long ticket = nextTicket_++;
    while (ticket != nowServing_) {
        condition_.wait(lock);
    }
}

void FairLock::leave() {
    std::unique_lock<std::mutex> lock(mutex_);
    ++nowServing_;
    // every waiter checks its own number, so all of them must see the change
    condition_.notify_all();
}
