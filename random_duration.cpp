// random_duration.cpp
#include "random_duration.h"

#include <random>

int generateRandomNumber(int min, int max) {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> distribution(min, max);
    return distribution(gen);
}

std::chrono::milliseconds randomDuration(const DurationRange& range) {
    return std::chrono::milliseconds(generateRandomNumber(range.minMs, range.maxMs));
}
