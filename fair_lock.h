// fair_lock.h
#pragma once

#include <mutex>
#include <condition_variable>

// Mutual exclusion that admits blocked threads in the order they arrived.
// Each caller of enter() draws a number and waits until it is called.
class FairLock {
public:
    void enter();
    void leave();

    // Holds the lock for the lifetime of the scope.
    class Scope {
    public:
        explicit Scope(FairLock& lock) : lock_(lock) { lock_.enter(); }
        ~Scope() { lock_.leave(); }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        FairLock& lock_;
    };

private:
    std::mutex mutex_;
    std::condition_variable condition_;
    unsigned long nextTicket_ = 0;
    unsigned long nowServing_ = 0;
};
