#pragma once
#include <cstdint>

namespace aiu {

// Time source for rate limiting and retry backoff.
// Injected so tests can drive time without sleeping.
class Clock {
public:
    virtual ~Clock() = default;

    // Milliseconds on a monotonic timeline (origin unspecified)
    virtual double now_ms() const = 0;

    // Block the calling thread for the given duration
    virtual void sleep_for_ms(double ms) = 0;
};

// Wall-clock implementation backed by std::chrono::steady_clock
class SteadyClock : public Clock {
public:
    double now_ms() const override;
    void sleep_for_ms(double ms) override;
};

// Process-wide SteadyClock used when no clock is supplied
Clock& default_clock();

} // namespace aiu
