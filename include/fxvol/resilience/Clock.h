#ifndef FXVOL_CLOCK_H
#define FXVOL_CLOCK_H

#include <chrono>

// Monotonic time source for the circuit breaker cooldown
class Clock
{
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual time_point now() const = 0;
    virtual ~Clock() = default;
};

class SystemClock : public Clock
{
public:
    time_point now() const override;
};

#endif //FXVOL_CLOCK_H
