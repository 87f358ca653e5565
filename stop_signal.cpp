// stop_signal.cpp
#include "stop_signal.h"
#include "cancelled.h"

void StopSignal::request() {
    std::unique_lock<std::mutex> lock(mutex_);
    requested_ = true;
    condition_.notify_all();
}

bool StopSignal::requested() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return requested_;
}

void StopSignal::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (condition_.wait_for(lock, duration, [this] { return requested_; })) {
        throw Cancelled("sleep was cancelled");
    }
}
