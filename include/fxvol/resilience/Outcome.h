#ifndef FXVOL_OUTCOME_H
#define FXVOL_OUTCOME_H

#include <fxvol/utils/Errors.h>

#include <string>
#include <utility>
#include <variant>

/**
 * Failure of a provider call, carried as a value.
 * Transient failures are retried by the resilience layer, permanent ones are not.
 */
struct ProviderFailure {
    enum class Kind { Transient, Permanent };

    Kind kind = Kind::Permanent;
    std::string message;

    static ProviderFailure transient(std::string message) { return {Kind::Transient, std::move(message)}; }
    static ProviderFailure permanent(std::string message) { return {Kind::Permanent, std::move(message)}; }

    // Kind from the message text (connection refused/reset, timeouts, DNS, "temporarily unavailable")
    static ProviderFailure classify(std::string message);

    bool retryable() const { return kind == Kind::Transient; }

    // Throw as TransientProviderError / PermanentDataError
    [[noreturn]] void raise() const
    {
        if (retryable())
            throw TransientProviderError(message);
        throw PermanentDataError(message);
    }
};

/**
 * Result of one provider call: the value, or the failure.
 * DomainError and other programming errors are never folded into an Outcome, they propagate.
 */
template <typename T>
using Outcome = std::variant<T, ProviderFailure>;

template <typename T>
bool succeeded(const Outcome<T>& outcome) { return std::holds_alternative<T>(outcome); }

template <typename T>
const ProviderFailure& failureOf(const Outcome<T>& outcome) { return std::get<ProviderFailure>(outcome); }

#endif //FXVOL_OUTCOME_H
