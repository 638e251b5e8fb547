#ifndef FXVOL_ERRORRECOVERY_H
#define FXVOL_ERRORRECOVERY_H

#include <fxvol/market/VolatilityQuote.h>
#include <fxvol/resilience/CircuitBreaker.h>
#include <fxvol/resilience/Outcome.h>
#include <fxvol/resilience/RetryPolicy.h>
#include <fxvol/utils/Log.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

template <typename T>
struct RetryResult {
    bool success = false;
    std::optional<T> data;
    std::optional<ProviderFailure> error;   // last failure when !success
    int attempts = 0;
    std::chrono::milliseconds duration {0};
};

template <typename Item, typename Value>
struct BatchResult {
    std::vector<Item> successful;
    std::vector<Item> failed;                     // disjoint from successful
    std::map<std::size_t, ProviderFailure> errors; // batch index -> batch-level failure
    std::vector<Value> results;                   // processor outputs, in completion order
};

struct ErrorSummary {
    std::string summary;
    std::vector<std::string> details; // unique user-facing messages, first-seen order
    bool isRecoverable = false;
};

/**
 * @class ErrorRecovery
 * @brief Retry with exponential backoff, batch processing with per-item recovery,
 *        fallback data and error summaries for provider calls
 *
 * Operations return Outcome<T>. Each attempt runs on its own worker thread and is
 * raced against RetryPolicy::timeoutMs; a timed-out attempt is abandoned (it keeps
 * running in the background), so operations must own what they capture.
 * Exceptions other than ProviderError (e.g. DomainError) propagate out of withRetry.
 */
class ErrorRecovery
{
public:
    static constexpr const char* TIMEOUT_MESSAGE = "Request timeout";

    // min(initialDelay * multiplier^(attempt-1), maxDelay)
    static long long backoffDelayMs(const RetryPolicy& policy, int attempt);

    static bool isRetryableMessage(const std::string& message);
    static bool isRetryableError(const ProviderFailure& failure) { return failure.retryable(); }

    static std::string getErrorMessage(const ProviderFailure& failure);
    static ErrorSummary createErrorSummary(const std::vector<ProviderFailure>& failures);

    // Explicit "no data" for a tenor: every quote field empty
    static VolatilityQuote createFallbackData(const std::string& tenorLabel, int tenorDays = 0);

    template <typename Operation>
    using ValueOf = std::variant_alternative_t<0, std::invoke_result_t<Operation&>>;

    template <typename Operation>
    static RetryResult<ValueOf<Operation>> withRetry(Operation operation, const RetryPolicy& policy = {})
    {
        return withRetry(std::move(operation), policy, nullptr);
    }

    // With a breaker each attempt is admitted by it and its raced outcome, timeout
    // included, is recorded there. An open breaker ends the loop (permanent failure).
    template <typename Operation>
    static RetryResult<ValueOf<Operation>> withRetry(Operation operation, const RetryPolicy& policy,
                                                     CircuitBreaker* breaker)
    {
        using T = ValueOf<Operation>;
        if (policy.maxRetries < 1)
            throw std::invalid_argument("withRetry: maxRetries must be at least 1");

        const auto start = std::chrono::steady_clock::now();
        RetryResult<T> result;

        for (int attempt = 1; attempt <= policy.maxRetries; ++attempt) {
            result.attempts = attempt;
            Outcome<T> outcome = breaker
                ? breaker->execute([&]() { return runAttempt(operation, policy.timeoutMs); })
                : runAttempt(operation, policy.timeoutMs);

            if (succeeded(outcome)) {
                result.success = true;
                result.data = std::move(std::get<T>(outcome));
                result.error.reset();
                break;
            }

            const ProviderFailure& failure = failureOf(outcome);
            result.error = failure;
            Log::warning(SOURCE, "Attempt " + std::to_string(attempt) + " failed: " + failure.message);

            if (!isRetryableError(failure) || attempt == policy.maxRetries) {
                break;
            }

            const long long delay = backoffDelayMs(policy, attempt);
            Log::info(SOURCE, "Retrying in " + std::to_string(delay) + "ms...");
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }

        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    }

    /**
     * Process items in batches of batchSize. A batch that fails after its retries is
     * recorded in errors and its members are retried one by one; only the members that
     * still fail end up in failed.
     * processor: (const std::vector<Item>&) -> Outcome<Value>
     */
    template <typename Item, typename Processor>
    static auto batchWithRecovery(const std::vector<Item>& items, std::size_t batchSize, Processor processor,
                                  const BatchRecoveryOptions& options = {},
                                  const std::function<void(const std::vector<std::type_identity_t<Item>>&, const ProviderFailure&)>& onBatchError = {})
    {
        using Value = std::variant_alternative_t<0, std::invoke_result_t<Processor&, const std::vector<Item>&>>;
        if (batchSize == 0)
            throw std::invalid_argument("batchWithRecovery: batch size must be positive");

        BatchResult<Item, Value> result;
        for (std::size_t begin = 0, batchIndex = 0; begin < items.size(); begin += batchSize, ++batchIndex) {
            const std::size_t end = std::min(items.size(), begin + batchSize);
            const std::vector<Item> batch(items.begin() + begin, items.begin() + end);

            auto batchResult = withRetry([processor, batch]() { return processor(batch); }, options.batchPolicy);
            if (batchResult.success) {
                result.successful.insert(result.successful.end(), batch.begin(), batch.end());
                result.results.push_back(std::move(*batchResult.data));
                continue;
            }

            const ProviderFailure failure = batchResult.error.value_or(ProviderFailure::permanent("Unknown error"));
            result.errors.emplace(batchIndex, failure);
            Log::warning(SOURCE, "Batch " + std::to_string(batchIndex) + " failed (" + failure.message
                                 + "), retrying " + std::to_string(batch.size()) + " items individually");
            if (onBatchError)
                onBatchError(batch, failure);

            for (const Item& item : batch) {
                const std::vector<Item> single {item};
                auto itemResult = withRetry([processor, single]() { return processor(single); }, options.itemPolicy);
                if (itemResult.success) {
                    result.successful.push_back(item);
                    result.results.push_back(std::move(*itemResult.data));
                } else {
                    result.failed.push_back(item);
                }
            }
        }
        return result;
    }

    /**
     * Run a health check with retries; when it keeps failing run the recovery action
     * and check once more. check: () -> Outcome<X>, recover: () -> Outcome<Y>
     */
    template <typename Check, typename Recover>
    static bool healthCheckWithRecovery(Check check, Recover recover, const HealthCheckOptions& options = {})
    {
        if (withRetry(check, options.checkPolicy).success) {
            return true;
        }

        Log::warning(SOURCE, "Health check failed, attempting recovery...");
        const auto recovered = recover();
        if (std::holds_alternative<ProviderFailure>(recovered)) {
            Log::error(SOURCE, "Recovery failed: " + std::get<ProviderFailure>(recovered).message);
            return false;
        }
        return withRetry(check, options.recheckPolicy).success;
    }

private:
    ErrorRecovery() = delete;

    static constexpr const char* SOURCE = "ErrorRecovery";

    template <typename Operation>
    static Outcome<ValueOf<Operation>> runAttempt(const Operation& operation, long long timeoutMs)
    {
        using T = ValueOf<Operation>;
        auto promise = std::make_shared<std::promise<Outcome<T>>>();
        std::future<Outcome<T>> future = promise->get_future();

        std::thread([promise, operation]() mutable {
            try {
                promise->set_value(operation());
            } catch (const ProviderError& e) {
                promise->set_value(Outcome<T>(e.retryable() ? ProviderFailure::transient(e.what())
                                                            : ProviderFailure::permanent(e.what())));
            } catch (...) {
                promise->set_exception(std::current_exception()); // rethrown by future.get()
            }
        }).detach();

        if (future.wait_for(std::chrono::milliseconds(timeoutMs)) == std::future_status::timeout) {
            return Outcome<T>(ProviderFailure::transient(TIMEOUT_MESSAGE));
        }
        return future.get();
    }
};

#endif //FXVOL_ERRORRECOVERY_H
