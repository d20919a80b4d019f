#pragma once
#include <chrono>

// time source for elapsed time / rate / eta calculations
class Clock {
    public:
    using duration   = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

// monotonic wall clock
class SteadyClock : public Clock {
    public:
    time_point now() const override { return std::chrono::steady_clock::now(); }

    static const SteadyClock& instance() {
        static const SteadyClock clock;
        return clock;
    }
};
