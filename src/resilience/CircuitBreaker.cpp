#include <fxvol/resilience/CircuitBreaker.h>
#include <fxvol/utils/Log.h>

#include <stdexcept>

namespace {
    const char* SOURCE = "CircuitBreaker";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, std::shared_ptr<const Clock> clock)
    : _config(config), _clock(std::move(clock))
{
    if (_config.failureThreshold < 1)
        throw std::invalid_argument("CircuitBreaker: failure threshold must be at least 1");
    if (_config.cooldownMs < 0)
        throw std::invalid_argument("CircuitBreaker: cooldown must be non-negative");
    if (!_clock)
        throw std::invalid_argument("CircuitBreaker: clock must not be null");
}

bool CircuitBreaker::tryAcquire()
{
    std::lock_guard<std::mutex> lock(_mutex);
    switch (_state) {
        case State::Closed:
            return true;
        case State::HalfOpen:
            if (_trialInFlight) {
                return false;
            }
            _trialInFlight = true;
            return true;
        case State::Open:
            break;
    }

    const auto elapsed = _clock->now() - _lastFailure.value_or(Clock::time_point{});
    if (elapsed < std::chrono::milliseconds(_config.cooldownMs)) {
        return false;
    }
    _state = State::HalfOpen;
    _trialInFlight = true;
    Log::info(SOURCE, "Cooldown elapsed, half-open: allowing a trial call");
    return true;
}

void CircuitBreaker::recordSuccess()
{
    std::lock_guard<std::mutex> lock(_mutex);
    switch (_state) {
        case State::Closed:
            _failures = 0;
            break;
        case State::HalfOpen:
            _state = State::Closed;
            _trialInFlight = false;
            _failures = 0;
            _lastFailure.reset();
            Log::info(SOURCE, "Circuit breaker reset");
            break;
        case State::Open:
            // late answer from a call admitted before the breaker opened
            break;
    }
}

void CircuitBreaker::recordFailure()
{
    std::lock_guard<std::mutex> lock(_mutex);
    switch (_state) {
        case State::Closed:
            ++_failures;
            _lastFailure = _clock->now();
            if (_failures >= _config.failureThreshold) {
                _state = State::Open;
                Log::warning(SOURCE, "Circuit breaker opened after " + std::to_string(_failures) + " failures");
            }
            break;
        case State::HalfOpen:
            ++_failures;
            _lastFailure = _clock->now();
            _state = State::Open;
            _trialInFlight = false;
            Log::warning(SOURCE, "Trial call failed, circuit breaker re-opened");
            break;
        case State::Open:
            // late answer; the cooldown keeps running from the failure that opened it
            break;
    }
}

void CircuitBreaker::abandonTrial()
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state == State::HalfOpen) {
        _trialInFlight = false;
    }
}

CircuitBreaker::Snapshot CircuitBreaker::state() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return Snapshot{_state, _failures, _lastFailure};
}

std::string CircuitBreaker::stateToString(State state)
{
    switch (state) {
        case State::Closed:   return "closed";
        case State::Open:     return "open";
        case State::HalfOpen: return "half-open";
    }
    return "unknown";
}
