// stop_signal.h
#pragma once

#include <chrono>
#include <mutex>
#include <condition_variable>

// Sleep that ends early, with Cancelled, once request() has been called.
class StopSignal {
public:
    void request();
    bool requested() const;

    // Throws Cancelled if a stop was requested before or during the sleep.
    void sleepFor(std::chrono::milliseconds duration);

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool requested_ = false;
};
