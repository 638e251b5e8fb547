#include <fxvol/resilience/ErrorRecovery.h>

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace {
    // Matched case-insensitively against the failure message
    const std::array<const char*, 11> RETRYABLE_ERRORS = {
        "ECONNREFUSED",
        "ECONNRESET",
        "ETIMEDOUT",
        "ENOTFOUND",
        "NetworkError",
        "Request timeout",
        "timed out",
        "temporarily unavailable",
        "Connection refused",
        "Connection reset",
        "DNS",
    };
}

ProviderFailure ProviderFailure::classify(std::string message)
{
    const bool transient = ErrorRecovery::isRetryableMessage(message);
    return {transient ? Kind::Transient : Kind::Permanent, std::move(message)};
}

bool ErrorRecovery::isRetryableMessage(const std::string& message)
{
    return std::any_of(RETRYABLE_ERRORS.begin(), RETRYABLE_ERRORS.end(),
                       [&message](const char* keyword) { return boost::algorithm::icontains(message, keyword); });
}

long long ErrorRecovery::backoffDelayMs(const RetryPolicy& policy, int attempt)
{
    const double delay = static_cast<double>(policy.initialDelayMs)
                         * std::pow(policy.backoffMultiplier, std::max(0, attempt - 1));
    // cap before converting: the uncapped product overflows long long after ~60 doublings
    const double capped = std::min(delay, static_cast<double>(policy.maxDelayMs));
    return std::max(0LL, static_cast<long long>(capped));
}

std::string ErrorRecovery::getErrorMessage(const ProviderFailure& failure)
{
    const std::string& message = failure.message;
    if (message.empty())
        return "Unknown error";

    if (boost::algorithm::contains(message, "ECONNREFUSED"))
        return "Market data service is unavailable. Please try again later.";
    if (boost::algorithm::contains(message, "timeout"))
        return "Request timed out. The market data service may be busy.";
    if (boost::algorithm::contains(message, "Network"))
        return "Network error. Please check your connection.";

    return message;
}

ErrorSummary ErrorRecovery::createErrorSummary(const std::vector<ProviderFailure>& failures)
{
    ErrorSummary summary;
    if (failures.empty()) {
        summary.summary = "No errors";
        return summary;
    }

    std::size_t retryableCount = 0;
    for (const auto& failure : failures) {
        if (isRetryableError(failure))
            ++retryableCount;

        std::string message = getErrorMessage(failure);
        if (std::find(summary.details.begin(), summary.details.end(), message) == summary.details.end())
            summary.details.push_back(std::move(message));
    }

    if (retryableCount == failures.size())
        summary.summary = "Temporary connection issues with market data service";
    else if (retryableCount == 0)
        summary.summary = "Data validation or configuration errors";
    else
        summary.summary = "Multiple errors occurred";

    summary.isRecoverable = retryableCount > 0;
    return summary;
}

VolatilityQuote ErrorRecovery::createFallbackData(const std::string& tenorLabel, int tenorDays)
{
    VolatilityQuote quote;   // optionals default to empty
    quote.tenorLabel = tenorLabel;
    quote.tenorDays = tenorDays;
    return quote;
}
