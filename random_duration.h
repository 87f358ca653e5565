// random_duration.h
#pragma once

#include <chrono>

// Inclusive range of milliseconds.
struct DurationRange {
    int minMs;
    int maxMs;
};

int generateRandomNumber(int min, int max);
std::chrono::milliseconds randomDuration(const DurationRange& range);
