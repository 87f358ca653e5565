/*
 * Tests for the log sink in event_log.cpp.
 */

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

#include "event_log.h"
#include "test_helpers.h"

using namespace std;

namespace {

string tempDirectory(const string& name)
{
    return "/tmp/office_hours_" + to_string(getpid()) + "_" + name;
}

bool exists(const string& path)
{
    struct stat info;
    return stat(path.c_str(), &info) == 0;
}

Event sampleEvent(const string& actor, const string& message)
{
    return Event{chrono::system_clock::now(), actor, EventKind::Enqueued, 3, 1, message};
}

}

void line_format(void)
{
    Event event = sampleEvent(studentActor(3), "sits down in the corridor. In queue now: 1.");
    string line = formatEvent(event);

    expect(line.rfind("ID: student_3; Time stamp: ", 0) == 0, "unexpected line prefix: " + line);
    expect(line.find("; Message: sits down in the corridor. In queue now: 1.") != string::npos,
           "message missing from line: " + line);

    // HH:MM:SS.mmm
    string stamp = formatTime(event.time);
    expect(stamp.size() == 12 && stamp[2] == ':' && stamp[5] == ':' && stamp[8] == '.',
           "unexpected time stamp: " + stamp);
    expect(string(toString(EventKind::ServiceComplete)) == "SERVICE_COMPLETE", "unexpected kind name");
    expect(monitorActor() == "monitor", "unexpected monitor actor name");
}

// Each actor gets its own file; clearDirectory wipes the previous run.
void per_actor_files(void)
{
    string directory = tempDirectory("logs");
    EventLog log(directory);
    log.clearDirectory();
    expect(exists(directory), "clearDirectory did not create the directory");

    log.record(sampleEvent(studentActor(1), "first"));
    log.record(sampleEvent(studentActor(1), "second"));
    log.record(sampleEvent(monitorActor(), "third"));

    string studentFile = directory + "/student_1_log.txt";
    string monitorFile = directory + "/monitor_log.txt";
    expect(exists(studentFile) && exists(monitorFile), "per-actor log files were not written");

    ifstream in(studentFile);
    string line;
    int lines = 0;
    while (getline(in, line)) {
        lines++;
    }
    expect(lines == 2, "student log should hold two lines, found " + to_string(lines));

    log.clearDirectory();
    expect(!exists(studentFile) && !exists(monitorFile), "clearDirectory left old log files");
    rmdir(directory.c_str());
}

void empty_directory_disables_files(void)
{
    EventLog log("");
    log.clearDirectory();
    log.record(sampleEvent(monitorActor(), "console only"));
    expect(log.directory().empty(), "directory should stay empty");
}

int main(int argc, char *argv[])
{
    map<string, function<void(void)>> testFns;
    testFns["line_format"] = line_format;
    testFns["per_actor_files"] = per_actor_files;
    testFns["empty_directory_disables_files"] = empty_directory_disables_files;

    return run_tests(argc, argv, testFns);
}
