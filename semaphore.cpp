// semaphore.cpp
#include "semaphore.h"
#include "cancelled.h"

Semaphore::Semaphore(int count) : count_(count) {}

void Semaphore::release() {
    std::unique_lock<std::mutex> lock(mutex_);
    ++count_;
    condition_.notify_one();
}

void Semaphore::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (count_ == 0 && !cancelled_) {
        condition_.wait(lock);
    }
    if (cancelled_) {
        throw Cancelled("wait on semaphore was cancelled");
    }
    --count_;
}

bool Semaphore::tryAcquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cancelled_) {
        throw Cancelled("wait on semaphore was cancelled");
    }
    if (count_ == 0) {
        return false;
    }
    --count_;
    return true;
}

void Semaphore::cancel() {
    std::unique_lock<std::mutex> lock(mutex_);
    cancelled_ = true;
    condition_.notify_all();
}

int Semaphore::available() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return count_;
}

bool Semaphore::isCancelled() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cancelled_;
}
