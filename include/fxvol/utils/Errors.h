#ifndef FXVOL_ERRORS_H
#define FXVOL_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * Error taxonomy
 *
 *   DomainError             invalid pricing / interpolation inputs (programming error)
 *   TransientProviderError  retryable provider failure (timeout, connection, busy)
 *   PermanentDataError      non-retryable provider failure (bad ticker, malformed data)
 *
 * Provider failures normally travel as ProviderFailure values (see resilience/Outcome.h);
 * the exception types exist for hosts that want to surface a terminal failure by throwing.
 * Data-quality problems are never thrown, they are warnings on the ValidatedQuote.
 */

class DomainError : public std::invalid_argument
{
public:
    explicit DomainError(const std::string& message) : std::invalid_argument(message) {}
};

class ProviderError : public std::runtime_error
{
public:
    ProviderError(const std::string& message, bool retryable)
        : std::runtime_error(message), _retryable(retryable) {}

    bool retryable() const { return _retryable; }

private:
    bool _retryable;
};

class TransientProviderError : public ProviderError
{
public:
    explicit TransientProviderError(const std::string& message) : ProviderError(message, true) {}
};

class PermanentDataError : public ProviderError
{
public:
    explicit PermanentDataError(const std::string& message) : ProviderError(message, false) {}
};

#endif //FXVOL_ERRORS_H
