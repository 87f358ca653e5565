// cancelled.h
#pragma once

#include <stdexcept>
#include <string>

// Raised out of a blocking wait that was interrupted by cancel().
class Cancelled : public std::runtime_error {
public:
    explicit Cancelled(const std::string& what) : std::runtime_error(what) {}
};
