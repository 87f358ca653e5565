// event_log.h
#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

enum class EventKind {
    Activity,
    Enqueued,
    Rejected,
    Wake,
    Idle,
    Dequeued,
    ServiceStart,
    ServiceComplete,
    Served,
    Retry,
    ClientFinished,
    ServerFinished,
    Terminated,
    Cancelled
};

const char* toString(EventKind kind);

struct Event {
    std::chrono::system_clock::time_point time;
    std::string actor;
    EventKind kind;
    int requesterId;
    std::size_t queueLength;
    std::string message;
};

// Write-only consumer of simulation events. Implementations are called
// concurrently from every actor and must not block for long.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void record(const Event& event) = 0;
};

// Discards everything.
class NullSink : public EventSink {
public:
    void record(const Event&) override {}
};

// Prints every event to stdout and appends it to <directory>/<actor>_log.txt.
// An empty directory disables the files.
class EventLog : public EventSink {
public:
    explicit EventLog(std::string directory);

    void record(const Event& event) override;

    // Removes the log files left by a previous run and makes sure the
    // directory exists.
    void clearDirectory();

    const std::string& directory() const { return directory_; }

private:
    std::mutex mutex_;
    std::string directory_;
};

std::string formatTime(std::chrono::system_clock::time_point time);
std::string formatEvent(const Event& event);

// Actor names used in the log.
std::string monitorActor();
std::string studentActor(int studentId);
