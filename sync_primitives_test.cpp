/*
 * Tests for the building blocks of the waiting room: FairLock, Semaphore,
 * StopSignal and Ticket.
 */

#include <atomic>
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "cancelled.h"
#include "fair_lock.h"
#include "semaphore.h"
#include "stop_signal.h"
#include "test_helpers.h"
#include "ticket.h"

using namespace std;

// Threads that block on the lock one after another get it in that order.
void fair_lock_admits_in_arrival_order(void)
{
    FairLock lock;
    mutex orderMutex;
    vector<int> order;
    atomic<int> started(0);

    lock.enter();
    vector<thread> waiters;
    for (int i = 0; i < 5; i++) {
        waiters.emplace_back([&, i] {
            started++;
            FairLock::Scope scope(lock);
            lock_guard<mutex> guard(orderMutex);
            order.push_back(i);
        });
        expect(wait_for(started, i + 1, 1000), "waiter " + to_string(i) + " did not start");
        // give the waiter time to draw its number before the next one starts
        sleep_ms(50);
    }
    lock.leave();

    for (auto& t : waiters) {
        t.join();
    }
    expect(order.size() == 5, "not every waiter got the lock");
    for (int i = 0; i < 5; i++) {
        expect(order[i] == i, "lock admitted waiters out of arrival order");
    }
}

// Contending threads never overlap inside the lock.
void fair_lock_excludes(void)
{
    FairLock lock;
    atomic<int> inside(0);
    atomic<int> overlaps(0);
    int counter = 0;

    vector<thread> workers;
    for (int i = 0; i < 8; i++) {
        workers.emplace_back([&] {
            for (int n = 0; n < 1000; n++) {
                FairLock::Scope scope(lock);
                if (++inside != 1) {
                    overlaps++;
                }
                counter++;
                inside--;
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }
    expect(overlaps.load() == 0, "two threads were inside the lock at once");
    expect(counter == 8000, "lost updates under the lock");
}

void semaphore_counts(void)
{
    Semaphore semaphore(2);
    expect(semaphore.tryAcquire(), "first permit missing");
    expect(semaphore.tryAcquire(), "second permit missing");
    expect(!semaphore.tryAcquire(), "semaphore handed out a third permit");

    semaphore.release();
    semaphore.release();
    expect(semaphore.available() == 2, "releases were lost");
    semaphore.acquire();
    semaphore.acquire();
    expect(semaphore.available() == 0, "acquire did not take a permit");
}

// A blocked acquire returns as soon as a permit is released.
void semaphore_blocks_until_release(void)
{
    Semaphore semaphore(0);
    atomic<int> acquired(0);
    thread waiter([&] {
        semaphore.acquire();
        acquired++;
    });

    if (wait_for(acquired, 1, 100)) {
        cout << "Error: acquire returned without a permit" << endl;
        exit(1);
    }
    semaphore.release();
    expect(wait_for(acquired, 1, 1000), "acquire did not return after release");
    waiter.join();
}

void semaphore_cancel_releases_waiters(void)
{
    Semaphore semaphore(0);
    atomic<int> cancelled(0);
    vector<thread> waiters;
    for (int i = 0; i < 3; i++) {
        waiters.emplace_back([&] {
            try {
                semaphore.acquire();
            } catch (const Cancelled&) {
                cancelled++;
            }
        });
    }

    sleep_ms(50);
    semaphore.cancel();
    expect(wait_for(cancelled, 3, 1000), "cancel did not release every waiter");
    for (auto& t : waiters) {
        t.join();
    }
    expect(semaphore.isCancelled(), "semaphore should report cancellation");

    bool threw = false;
    try {
        semaphore.acquire();
    } catch (const Cancelled&) {
        threw = true;
    }
    expect(threw, "acquire on a cancelled semaphore did not throw");
}

void stop_signal_sleeps(void)
{
    StopSignal stop;
    auto started = chrono::steady_clock::now();
    stop.sleepFor(chrono::milliseconds(20));
    expect(chrono::steady_clock::now() - started >= chrono::milliseconds(20), "sleep ended early");
    expect(!stop.requested(), "stop requested by itself");
}

void stop_signal_interrupts_sleep(void)
{
    StopSignal stop;
    atomic<int> cancelled(0);
    thread sleeper([&] {
        try {
            stop.sleepFor(chrono::milliseconds(60000));
        } catch (const Cancelled&) {
            cancelled++;
        }
    });

    sleep_ms(20);
    stop.request();
    expect(wait_for(cancelled, 1, 1000), "request did not interrupt the sleep");
    sleeper.join();

    bool threw = false;
    try {
        stop.sleepFor(chrono::milliseconds(0));
    } catch (const Cancelled&) {
        threw = true;
    }
    expect(threw, "sleep after a stop request did not throw");
}

void ticket_completes_once(void)
{
    Ticket ticket(4);
    expect(ticket.requesterId() == 4, "ticket lost its requester id");
    expect(!ticket.isCompleted(), "new ticket is already completed");

    atomic<int> resumed(0);
    thread waiter([&] {
        ticket.await();
        resumed++;
    });
    if (wait_for(resumed, 1, 100)) {
        cout << "Error: student resumed before the ticket was completed" << endl;
        exit(1);
    }

    ticket.complete();
    expect(wait_for(resumed, 1, 1000), "student not resumed by complete");
    waiter.join();

    bool threw = false;
    try {
        ticket.complete();
    } catch (const logic_error&) {
        threw = true;
    }
    expect(threw, "ticket accepted a second completion");
}

void ticket_cancel_releases_student(void)
{
    Ticket ticket(1);
    atomic<int> cancelled(0);
    thread waiter([&] {
        try {
            ticket.await();
        } catch (const Cancelled&) {
            cancelled++;
        }
    });

    sleep_ms(20);
    ticket.cancel();
    expect(wait_for(cancelled, 1, 1000), "cancelled ticket did not release the student");
    waiter.join();
}

int main(int argc, char *argv[])
{
    map<string, function<void(void)>> testFns;
    testFns["fair_lock_admits_in_arrival_order"] = fair_lock_admits_in_arrival_order;
    testFns["fair_lock_excludes"] = fair_lock_excludes;
    testFns["semaphore_counts"] = semaphore_counts;
    testFns["semaphore_blocks_until_release"] = semaphore_blocks_until_release;
    testFns["semaphore_cancel_releases_waiters"] = semaphore_cancel_releases_waiters;
    testFns["stop_signal_sleeps"] = stop_signal_sleeps;
    testFns["stop_signal_interrupts_sleep"] = stop_signal_interrupts_sleep;
    testFns["ticket_completes_once"] = ticket_completes_once;
    testFns["ticket_cancel_releases_student"] = ticket_cancel_releases_student;

    return run_tests(argc, argv, testFns);
}
