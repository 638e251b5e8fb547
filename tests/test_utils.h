//
// Shared test utilities: tolerances, quote builders, a manual clock and a scripted provider
//

#ifndef FXVOL_TEST_UTILS_H
#define FXVOL_TEST_UTILS_H

#include <gtest/gtest.h>
#include <fxvol/market/QuoteProvider.h>
#include <fxvol/market/VolatilityQuote.h>
#include <fxvol/resilience/Clock.h>
#include <fxvol/resilience/RetryPolicy.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace test_utils {

    constexpr double PRICE_TOL = 1e-8;
    constexpr double GREEK_TOL = 1e-6;
    constexpr double NUMERICAL_TOL = 1e-4;   // finite differences
    constexpr double VOL_TOL = 1e-9;

    // Retry settings fast enough for unit tests
    inline RetryPolicy fastPolicy(int maxRetries = 3, long long timeoutMs = 2000)
    {
        return RetryPolicy{maxRetries, 1, 5, 2.0, timeoutMs};
    }

    inline BatchRecoveryOptions fastBatchOptions()
    {
        BatchRecoveryOptions options;
        options.batchPolicy = fastPolicy(2);
        options.itemPolicy = fastPolicy(1);
        return options;
    }

    // Every field two-sided: ATM around atm, RR/BF a few tenths wide
    inline VolatilityQuote makeFullQuote(const std::string& tenor, int days, double atm = 7.0)
    {
        VolatilityQuote quote;
        quote.tenorLabel = tenor;
        quote.tenorDays = days;
        quote.atm = BidAsk{atm - 0.1, atm + 0.1};
        for (DeltaBucket bucket : ALL_DELTA_BUCKETS) {
            quote.riskReversal(bucket) = BidAsk{-0.4, -0.2};
            quote.butterfly(bucket) = BidAsk{0.1, 0.3};
        }
        return quote;
    }

    // Clock advanced by hand; safe to read from worker threads
    class ManualClock : public Clock
    {
    public:
        time_point now() const override
        {
            std::lock_guard<std::mutex> lock(_mutex);
            return _now;
        }

        void advance(std::chrono::milliseconds dt)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _now += dt;
        }

    private:
        mutable std::mutex _mutex;
        time_point _now {std::chrono::seconds(1000)};
    };

    /**
     * Provider serving a fixed quote table. Failures can be queued: each call pops the
     * next queued failure (if any) instead of answering.
     */
    class ScriptedQuoteProvider : public QuoteProvider
    {
    public:
        void setQuote(const std::string& securityId, std::optional<double> bid, std::optional<double> ask)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _quotes[securityId] = {bid, ask};
        }

        void queueFailure(ProviderFailure failure, int times = 1)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            for (int i = 0; i < times; ++i)
                _failures.push_back(failure);
        }

        void failAlways(ProviderFailure failure)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _alwaysFail = std::move(failure);
        }

        // Each call sleeps this long before answering, outside the lock
        void setDelay(std::chrono::milliseconds delay) { _delayMs = delay.count(); }

        int calls() const { return _calls.load(); }

        Outcome<std::vector<SecurityData>> fetchQuotes(const std::vector<std::string>& securityIds,
                                                       const std::vector<std::string>&) override
        {
            ++_calls;
            if (const long long delay = _delayMs.load(); delay > 0)
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            std::lock_guard<std::mutex> lock(_mutex);
            if (_alwaysFail)
                return *_alwaysFail;
            if (!_failures.empty()) {
                ProviderFailure failure = _failures.front();
                _failures.pop_front();
                return failure;
            }

            std::vector<SecurityData> records;
            for (const auto& id : securityIds) {
                SecurityData record;
                record.securityId = id;
                const auto it = _quotes.find(id);
                if (it == _quotes.end()) {
                    record.error = "Invalid security";
                } else {
                    record.success = true;
                    record.fields["PX_BID"] = it->second.first;
                    record.fields["PX_ASK"] = it->second.second;
                }
                records.push_back(std::move(record));
            }
            return records;
        }

    private:
        mutable std::mutex _mutex;
        std::map<std::string, std::pair<std::optional<double>, std::optional<double>>> _quotes;
        std::deque<ProviderFailure> _failures;
        std::optional<ProviderFailure> _alwaysFail;
        std::atomic<int> _calls {0};
        std::atomic<long long> _delayMs {0};
    };

} // namespace test_utils

#endif // FXVOL_TEST_UTILS_H
