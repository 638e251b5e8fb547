#include <fxvol/resilience/Clock.h>

Clock::time_point SystemClock::now() const
{
    return std::chrono::steady_clock::now();
}
