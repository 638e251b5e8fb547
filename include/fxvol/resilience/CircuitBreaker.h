#ifndef FXVOL_CIRCUITBREAKER_H
#define FXVOL_CIRCUITBREAKER_H

#include <fxvol/resilience/Clock.h>
#include <fxvol/resilience/Outcome.h>
#include <fxvol/resilience/RetryPolicy.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>

/**
 * @class CircuitBreaker
 * @brief Guards the quote provider against hammering while it is down
 *
 *   Closed --(threshold consecutive failures)--> Open --(cooldown elapsed)--> HalfOpen
 *   HalfOpen --(success)--> Closed,   HalfOpen --(failure)--> Open (cooldown restarts)
 *
 * While Open and inside the cooldown, execute() returns a permanent failure without
 * calling the operation. HalfOpen admits exactly one trial call; concurrent callers are
 * failed fast until the trial reports back. Owned by the host and shared by pointer; the
 * mutex guards the state transitions only and is never held while the operation runs.
 */
class CircuitBreaker
{
public:
    enum class State { Closed, Open, HalfOpen };

    struct Snapshot {
        State state = State::Closed;
        int failures = 0;
        std::optional<Clock::time_point> lastFailure;
    };

    static constexpr const char* OPEN_MESSAGE = "Circuit breaker is open - service unavailable";

    explicit CircuitBreaker(CircuitBreakerConfig config = {},
                            std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // operation: () -> Outcome<T>
    template <typename Operation>
    std::invoke_result_t<Operation&> execute(Operation&& operation)
    {
        using Result = std::invoke_result_t<Operation&>;
        if (!tryAcquire()) {
            return Result(ProviderFailure::permanent(OPEN_MESSAGE));
        }

        Result outcome = [&]() -> Result {
            try {
                return operation();
            } catch (...) {
                abandonTrial(); // not a provider verdict; free the half-open slot and rethrow
                throw;
            }
        }();
        if (std::holds_alternative<ProviderFailure>(outcome))
            recordFailure();
        else
            recordSuccess();
        return outcome;
    }

    // Open -> HalfOpen once the cooldown has elapsed and the caller becomes the trial;
    // false means fail fast
    bool tryAcquire();
    void recordSuccess();
    void recordFailure();
    // Trial ended without an outcome (exception); the next caller may take the slot
    void abandonTrial();

    Snapshot state() const;
    const CircuitBreakerConfig& config() const { return _config; }

    static std::string stateToString(State state);

private:
    CircuitBreakerConfig _config;
    std::shared_ptr<const Clock> _clock;

    mutable std::mutex _mutex;
    State _state = State::Closed;
    int _failures = 0;
    bool _trialInFlight = false;
    std::optional<Clock::time_point> _lastFailure;
};

#endif //FXVOL_CIRCUITBREAKER_H
