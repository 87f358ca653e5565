// semaphore.h
#pragma once

#include <mutex>
#include <condition_variable>

// Counting semaphore whose waiters can be released with cancel().
// After cancel() every acquire() throws Cancelled, including the ones
// already blocked.
class Semaphore {
public:
    explicit Semaphore(int count = 0);

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    void release();
    void acquire();
    bool tryAcquire();
    void cancel();

    int available() const;
    bool isCancelled() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    int count_;
    bool cancelled_ = false;
};
