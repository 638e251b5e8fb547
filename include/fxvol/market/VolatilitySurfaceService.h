#ifndef FXVOL_VOLATILITYSURFACESERVICE_H
#define FXVOL_VOLATILITYSURFACESERVICE_H

#include <fxvol/market/Calendar.h>
#include <fxvol/market/QuoteProvider.h>
#include <fxvol/market/QuoteValidator.h>
#include <fxvol/resilience/CircuitBreaker.h>
#include <fxvol/resilience/ErrorRecovery.h>
#include <fxvol/resilience/RetryPolicy.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct SurfaceServiceConfig {
    std::string currencyPair = "EURUSD";
    std::vector<std::string> tenors = {"ON", "1W", "2W", "3W", "1M", "2M", "3M",
                                       "4M", "6M", "9M", "1Y", "18M", "2Y"};
    std::size_t chunkSize = 50;   // securities per provider request
    std::vector<std::string> fields = {"PX_LAST", "PX_BID", "PX_ASK"};
    RetryPolicy retryPolicy;
    ValidationOptions validation;
};

struct SurfaceSnapshot {
    std::string currencyPair;
    boost::gregorian::date valuationDate;
    Timestamp timestamp{};
    std::vector<ValidatedQuote> quotes;       // sorted by tenor, interior ATM gaps filled
    QualitySummary quality;
    SecurityBatchSummary securities;
    std::optional<ErrorSummary> errors;       // set when at least one request failed
    CircuitBreaker::Snapshot breaker;

    std::vector<SurfacePoint> surfacePoints() const { return QuoteValidator::toSurfacePoints(quotes); }
};

/**
 * @class VolatilitySurfaceService
 * @brief Fetches the ATM / risk-reversal / butterfly quote set of a currency pair and
 *        assembles it into validated per-tenor quotes
 *
 * Tickers are split into chunks that are requested concurrently under withRetry; the
 * circuit breaker admits each attempt and records its raced outcome, timeouts included. Tenors whose data never arrived keep the
 * all-empty fallback quote, so a provider outage degrades to "no data", not an exception.
 */
class VolatilitySurfaceService
{
public:
    VolatilitySurfaceService(std::shared_ptr<QuoteProvider> provider,
                             std::shared_ptr<CircuitBreaker> breaker,
                             SurfaceServiceConfig config = {},
                             Calendar calendar = Calendar());

    SurfaceSnapshot fetchSurface(const boost::gregorian::date& valuationDate) const;

    // Every security id requested for one tenor (1 ATM + 5 RR + 5 BF)
    std::vector<std::string> tickersFor(const std::string& tenor) const;

    static std::string atmTicker(const std::string& currencyPair, const std::string& tenor);
    static std::string riskReversalTicker(const std::string& currencyPair, DeltaBucket bucket, const std::string& tenor);
    static std::string butterflyTicker(const std::string& currencyPair, DeltaBucket bucket, const std::string& tenor);

    const SurfaceServiceConfig& config() const { return _config; }

private:
    enum class QuoteKind { Atm, RiskReversal, Butterfly };

    struct TickerTarget {
        std::size_t tenorIndex = 0;
        QuoteKind kind = QuoteKind::Atm;
        DeltaBucket bucket = DeltaBucket::D25;
    };

    std::map<std::string, TickerTarget> tickerMap() const;
    static void applyRecord(const SecurityData& record, const TickerTarget& target, VolatilityQuote& quote);

    std::shared_ptr<QuoteProvider> _provider;
    std::shared_ptr<CircuitBreaker> _breaker;
    SurfaceServiceConfig _config;
    Calendar _calendar;
};

#endif //FXVOL_VOLATILITYSURFACESERVICE_H
