#include <fxvol/market/VolatilitySurfaceService.h>
#include <fxvol/utils/Log.h>

#include <algorithm>
#include <future>
#include <stdexcept>

namespace {
    const char* SOURCE = "SurfaceService";

    // chunk of security ids -> one provider request
    using Chunk = std::vector<std::string>;
    using ChunkResult = RetryResult<std::vector<SecurityData>>;
}

VolatilitySurfaceService::VolatilitySurfaceService(std::shared_ptr<QuoteProvider> provider,
                                                   std::shared_ptr<CircuitBreaker> breaker,
                                                   SurfaceServiceConfig config,
                                                   Calendar calendar)
    : _provider(std::move(provider)), _breaker(std::move(breaker)),
      _config(std::move(config)), _calendar(std::move(calendar))
{
    if (!_provider)
        throw std::invalid_argument("VolatilitySurfaceService: provider must not be null");
    if (!_breaker)
        throw std::invalid_argument("VolatilitySurfaceService: circuit breaker must not be null");
    if (_config.currencyPair.empty())
        throw std::invalid_argument("VolatilitySurfaceService: currency pair must not be empty");
    if (_config.chunkSize == 0)
        throw std::invalid_argument("VolatilitySurfaceService: chunk size must be positive");
    for (const auto& tenor : _config.tenors)
        Calendar::tenorToDays(tenor); // throws on a malformed label
}

// ============================================================================
// Tickers
// ============================================================================

std::string VolatilitySurfaceService::atmTicker(const std::string& currencyPair, const std::string& tenor)
{
    if (tenor == "ON")
        return currencyPair + "VON Curncy";
    return currencyPair + "V" + tenor + " BGN Curncy";
}

std::string VolatilitySurfaceService::riskReversalTicker(const std::string& currencyPair, DeltaBucket bucket,
                                                         const std::string& tenor)
{
    return currencyPair + std::to_string(deltaValue(bucket)) + "R" + tenor + " BGN Curncy";
}

std::string VolatilitySurfaceService::butterflyTicker(const std::string& currencyPair, DeltaBucket bucket,
                                                      const std::string& tenor)
{
    return currencyPair + std::to_string(deltaValue(bucket)) + "B" + tenor + " BGN Curncy";
}

std::vector<std::string> VolatilitySurfaceService::tickersFor(const std::string& tenor) const
{
    std::vector<std::string> tickers {atmTicker(_config.currencyPair, tenor)};
    for (DeltaBucket bucket : ALL_DELTA_BUCKETS) {
        tickers.push_back(riskReversalTicker(_config.currencyPair, bucket, tenor));
        tickers.push_back(butterflyTicker(_config.currencyPair, bucket, tenor));
    }
    return tickers;
}

std::map<std::string, VolatilitySurfaceService::TickerTarget> VolatilitySurfaceService::tickerMap() const
{
    std::map<std::string, TickerTarget> targets;
    for (std::size_t i = 0; i < _config.tenors.size(); ++i) {
        const std::string& tenor = _config.tenors[i];
        targets[atmTicker(_config.currencyPair, tenor)] = TickerTarget{i, QuoteKind::Atm, DeltaBucket::D25};
        for (DeltaBucket bucket : ALL_DELTA_BUCKETS) {
            targets[riskReversalTicker(_config.currencyPair, bucket, tenor)] = TickerTarget{i, QuoteKind::RiskReversal, bucket};
            targets[butterflyTicker(_config.currencyPair, bucket, tenor)] = TickerTarget{i, QuoteKind::Butterfly, bucket};
        }
    }
    return targets;
}

void VolatilitySurfaceService::applyRecord(const SecurityData& record, const TickerTarget& target, VolatilityQuote& quote)
{
    BidAsk* side = nullptr;
    switch (target.kind) {
        case QuoteKind::Atm:          side = &quote.atm; break;
        case QuoteKind::RiskReversal: side = &quote.riskReversal(target.bucket); break;
        case QuoteKind::Butterfly:    side = &quote.butterfly(target.bucket); break;
    }
    side->bid = record.field("PX_BID");
    side->ask = record.field("PX_ASK");
}

// ============================================================================
// Fetch
// ============================================================================

SurfaceSnapshot VolatilitySurfaceService::fetchSurface(const boost::gregorian::date& valuationDate) const
{
    SurfaceSnapshot snapshot;
    snapshot.currencyPair = _config.currencyPair;
    snapshot.valuationDate = valuationDate;
    snapshot.timestamp = std::chrono::system_clock::now();

    // 1. Fallback quote per tenor; filled in as records arrive
    std::vector<VolatilityQuote> quotes;
    quotes.reserve(_config.tenors.size());
    for (const auto& tenor : _config.tenors) {
        const int days = Calendar::dayCount(valuationDate, _calendar.expiryDate(valuationDate, tenor));
        quotes.push_back(ErrorRecovery::createFallbackData(tenor, days));
    }

    // 2. Chunk the ticker set and fan out
    std::vector<std::string> securities;
    for (const auto& tenor : _config.tenors) {
        const auto tickers = tickersFor(tenor);
        securities.insert(securities.end(), tickers.begin(), tickers.end());
    }

    std::vector<Chunk> chunks;
    for (std::size_t begin = 0; begin < securities.size(); begin += _config.chunkSize) {
        const std::size_t end = std::min(securities.size(), begin + _config.chunkSize);
        chunks.emplace_back(securities.begin() + begin, securities.begin() + end);
    }
    Log::info(SOURCE, "Fetching " + std::to_string(securities.size()) + " securities for "
                      + _config.currencyPair + " in " + std::to_string(chunks.size()) + " chunks");

    std::vector<std::future<ChunkResult>> pending;
    pending.reserve(chunks.size());
    for (const Chunk& chunk : chunks) {
        auto fetch = [provider = _provider, chunk, fields = _config.fields]() {
            return provider->fetchQuotes(chunk, fields);
        };
        const RetryPolicy policy = _config.retryPolicy;
        // the breaker sits outside the timeout race so a hung provider counts against it
        pending.push_back(std::async(std::launch::async, [fetch, policy, breaker = _breaker]() {
            return ErrorRecovery::withRetry(fetch, policy, breaker.get());
        }));
    }

    // 3. Join, collecting records and request failures
    std::vector<SecurityData> records;
    std::vector<ProviderFailure> failures;
    for (auto& future : pending) {
        ChunkResult result = future.get();
        if (result.success) {
            records.insert(records.end(), result.data->begin(), result.data->end());
        } else {
            failures.push_back(result.error.value_or(ProviderFailure::permanent("Unknown error")));
        }
    }

    SecurityBatchValidation batch = QuoteValidator::validateBatch(records);
    snapshot.securities = batch.summary;
    if (batch.summary.failed > 0) {
        Log::warning(SOURCE, "Failed to fetch " + std::to_string(batch.summary.failed) + " securities out of "
                             + std::to_string(batch.summary.totalRequested));
    }

    const auto targets = tickerMap();
    for (const SecurityData& record : batch.valid) {
        const auto it = targets.find(record.securityId);
        if (it == targets.end()) {
            Log::debug(SOURCE, "Ignoring unrequested security " + record.securityId);
            continue;
        }
        applyRecord(record, it->second, quotes[it->second.tenorIndex]);
    }

    // 4. Validate, fill interior ATM gaps, summarise
    std::vector<ValidatedQuote> validated;
    validated.reserve(quotes.size());
    for (const auto& quote : quotes) {
        validated.push_back(QuoteValidator::validate(quote, snapshot.timestamp, _config.validation));
    }
    snapshot.quotes = QuoteValidator::fillMissingAtm(std::move(validated));
    snapshot.quality = QuoteValidator::qualitySummary(snapshot.quotes);

    Log::info(SOURCE, "Data quality: " + std::to_string(snapshot.quality.overallScore) + "% ("
                      + std::to_string(snapshot.quality.completeRecords) + "/"
                      + std::to_string(snapshot.quality.totalRecords) + " complete)");
    for (const auto& warning : snapshot.quality.criticalWarnings) {
        Log::warning(SOURCE, "Critical warning: " + warning);
    }

    if (!failures.empty()) {
        snapshot.errors = ErrorRecovery::createErrorSummary(failures);
        Log::error(SOURCE, snapshot.errors->summary + " (" + std::to_string(failures.size()) + " of "
                           + std::to_string(chunks.size()) + " requests failed)");
    }

    snapshot.breaker = _breaker->state();
    return snapshot;
}
