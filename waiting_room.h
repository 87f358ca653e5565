// waiting_room.h
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>

#include "event_log.h"
#include "fair_lock.h"
#include "semaphore.h"
#include "stop_signal.h"
#include "ticket.h"

enum class ServiceOutcome { Served, Rejected };
enum class RoomState { Active, Terminated };

const char* toString(RoomState state);

// The corridor outside the monitor's office: a bounded FIFO queue of
// tickets, the signal that wakes the monitor and the count of help
// sessions still owed for the whole run.
//
// Students call requestService(), the monitor calls serveNext(). The room
// becomes Terminated once totalServices sessions have been completed and
// stays that way. cancel() releases every blocked caller with Cancelled.
class WaitingRoom {
public:
    WaitingRoom(int capacity, int totalServices, EventSink& sink);

    WaitingRoom(const WaitingRoom&) = delete;
    WaitingRoom& operator=(const WaitingRoom&) = delete;

    // Returns Rejected at once when every chair is taken. Otherwise takes
    // a chair and blocks until the monitor has finished helping.
    ServiceOutcome requestService(int requesterId);

    // One service cycle: sleeps while the corridor is empty, then helps the
    // student at the head of the queue for serviceTime.
    void serveNext(std::chrono::milliseconds serviceTime);

    void cancel();

    int capacity() const { return capacity_; }
    std::size_t queueLength();
    int remainingServices() const { return remaining_.load(); }
    RoomState state() const { return active_.load() ? RoomState::Active : RoomState::Terminated; }
    bool isActive() const { return active_.load(); }
    bool isCancelled() const { return stop_.requested(); }

    // Sleeps that end with Cancelled when the room is cancelled.
    StopSignal& stopSignal() { return stop_; }

    void report(const std::string& actor, EventKind kind, int requesterId, const std::string& message);

private:
    Event makeEvent(const std::string& actor, EventKind kind, int requesterId,
                    std::size_t queueLength, const std::string& message) const;

    // Hands out the next wake permit unless one is already outstanding.
    // Caller holds lock_.
    void signalArrival();

    const int capacity_;
    EventSink& sink_;

    FairLock lock_;
    std::deque<std::shared_ptr<Ticket>> queue_;
    bool wakePending_ = false;
    bool cancelled_ = false;

    Semaphore arrivals_;
    StopSignal stop_;
    std::atomic<int> remaining_;
    std::atomic<bool> active_;
};
