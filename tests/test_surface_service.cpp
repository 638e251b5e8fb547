#include <gtest/gtest.h>
#include <fxvol/market/VolatilitySurfaceService.h>
#include "test_utils.h"

#include <memory>
#include <stdexcept>

using namespace test_utils;
using boost::gregorian::date;

// ============================================================================
// Tickers
// ============================================================================

TEST(SurfaceTickerTest, Formats) {
    EXPECT_EQ(VolatilitySurfaceService::atmTicker("EURUSD", "ON"), "EURUSDVON Curncy");
    EXPECT_EQ(VolatilitySurfaceService::atmTicker("EURUSD", "1M"), "EURUSDV1M BGN Curncy");
    EXPECT_EQ(VolatilitySurfaceService::riskReversalTicker("EURUSD", DeltaBucket::D25, "1M"), "EURUSD25R1M BGN Curncy");
    EXPECT_EQ(VolatilitySurfaceService::butterflyTicker("EURUSD", DeltaBucket::D10, "1M"), "EURUSD10B1M BGN Curncy");
    EXPECT_EQ(VolatilitySurfaceService::riskReversalTicker("USDJPY", DeltaBucket::D5, "2Y"), "USDJPY5R2Y BGN Curncy");
}

// ============================================================================
// Fetch
// ============================================================================

class SurfaceServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.currencyPair = "EURUSD";
        config.tenors = {"3M", "1W", "1M"};   // deliberately unordered
        config.chunkSize = 5;
        config.retryPolicy = fastPolicy(2);

        provider = std::make_shared<ScriptedQuoteProvider>();
        breaker = std::make_shared<CircuitBreaker>(CircuitBreakerConfig{1000, 60000}, clock);
    }

    // Every ticker of every tenor quoted; ATM 7.0/7.2, RR -0.4/-0.2, BF 0.1/0.3
    void quoteEverything(const VolatilitySurfaceService& service) {
        for (const auto& tenor : config.tenors) {
            for (const auto& ticker : service.tickersFor(tenor)) {
                if (ticker.find("R" + tenor) != std::string::npos)
                    provider->setQuote(ticker, -0.4, -0.2);
                else if (ticker.find("B" + tenor) != std::string::npos)
                    provider->setQuote(ticker, 0.1, 0.3);
                else
                    provider->setQuote(ticker, 7.0, 7.2);
            }
        }
    }

    const date valuation {2025, 1, 15};
    SurfaceServiceConfig config;
    std::shared_ptr<ScriptedQuoteProvider> provider;
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<CircuitBreaker> breaker;
};

TEST_F(SurfaceServiceTest, ElevenTickersPerTenor) {
    const VolatilitySurfaceService service(provider, breaker, config);
    const auto tickers = service.tickersFor("1M");
    ASSERT_EQ(tickers.size(), 11u);
    EXPECT_EQ(tickers.front(), "EURUSDV1M BGN Curncy");
}

TEST_F(SurfaceServiceTest, FullFetchBuildsOrderedQuotes) {
    const VolatilitySurfaceService service(provider, breaker, config);
    quoteEverything(service);

    const SurfaceSnapshot snapshot = service.fetchSurface(valuation);
    EXPECT_EQ(snapshot.currencyPair, "EURUSD");
    EXPECT_EQ(snapshot.valuationDate, valuation);
    EXPECT_FALSE(snapshot.errors.has_value());
    EXPECT_EQ(snapshot.securities.totalRequested, 33);
    EXPECT_EQ(snapshot.securities.failed, 0);
    EXPECT_EQ(provider->calls(), 7) << "33 tickers in chunks of 5";

    ASSERT_EQ(snapshot.quotes.size(), 3u);
    EXPECT_EQ(snapshot.quotes[0].quote.tenorLabel, "1W");
    EXPECT_EQ(snapshot.quotes[0].quote.tenorDays, 7);
    EXPECT_EQ(snapshot.quotes[1].quote.tenorLabel, "1M");
    EXPECT_EQ(snapshot.quotes[1].quote.tenorDays, 33);   // 2025-02-15 is a Saturday
    EXPECT_EQ(snapshot.quotes[2].quote.tenorLabel, "3M");
    EXPECT_EQ(snapshot.quotes[2].quote.tenorDays, 90);

    for (const auto& q : snapshot.quotes) {
        EXPECT_TRUE(q.isComplete) << q.quote.tenorLabel;
        EXPECT_EQ(q.quality.completenessScore, 100);
        EXPECT_DOUBLE_EQ(*q.quote.atm.bid, 7.0);
        EXPECT_DOUBLE_EQ(*q.quote.riskReversal(DeltaBucket::D25).ask, -0.2);
        EXPECT_DOUBLE_EQ(*q.quote.butterfly(DeltaBucket::D35).bid, 0.1);
    }
    EXPECT_EQ(snapshot.quality.completeRecords, 3);
    EXPECT_EQ(snapshot.quality.overallScore, 100);

    const auto points = snapshot.surfacePoints();
    ASSERT_EQ(points.size(), 3u);
    EXPECT_NEAR(points[0].atm, 7.1, 1e-12);
    EXPECT_NEAR(*points[0].rr25d, -0.3, 1e-12);
    EXPECT_EQ(snapshot.breaker.state, CircuitBreaker::State::Closed);
}

TEST_F(SurfaceServiceTest, MissingSecuritiesAreCounted) {
    const VolatilitySurfaceService service(provider, breaker, config);
    // the 1M ATM ticker is unknown to the provider and answered with a per-security error
    auto sparse = std::make_shared<ScriptedQuoteProvider>();
    for (const auto& tenor : config.tenors) {
        for (const auto& ticker : service.tickersFor(tenor)) {
            if (ticker != VolatilitySurfaceService::atmTicker("EURUSD", "1M"))
                sparse->setQuote(ticker, 0.1, 0.3);
        }
    }

    const VolatilitySurfaceService sparseService(sparse, breaker, config);
    const SurfaceSnapshot snapshot = sparseService.fetchSurface(valuation);
    EXPECT_EQ(snapshot.securities.failed, 1);
    EXPECT_FALSE(snapshot.errors.has_value()) << "per-security errors are not request failures";

    // 1M sits between 1W and 3M, so its ATM is filled from the neighbours
    ASSERT_EQ(snapshot.quotes.size(), 3u);
    EXPECT_TRUE(snapshot.quotes[1].quote.atm.bid.has_value());
}

TEST_F(SurfaceServiceTest, TransientFailureIsRetried) {
    const VolatilitySurfaceService service(provider, breaker, config);
    quoteEverything(service);
    provider->queueFailure(ProviderFailure::transient("ECONNRESET"));

    const SurfaceSnapshot snapshot = service.fetchSurface(valuation);
    EXPECT_FALSE(snapshot.errors.has_value());
    EXPECT_EQ(provider->calls(), 8);
    EXPECT_EQ(snapshot.quality.completeRecords, 3);
}

TEST_F(SurfaceServiceTest, ProviderOutageDegradesToFallback) {
    const VolatilitySurfaceService service(provider, breaker, config);
    provider->failAlways(ProviderFailure::transient("connect ECONNREFUSED"));

    SurfaceSnapshot snapshot;
    ASSERT_NO_THROW(snapshot = service.fetchSurface(valuation));

    ASSERT_EQ(snapshot.quotes.size(), 3u);
    for (const auto& q : snapshot.quotes) {
        EXPECT_FALSE(q.isComplete);
        EXPECT_FALSE(q.quote.atm.bid.has_value());
        EXPECT_EQ(q.quality.completenessScore, 0);
    }
    EXPECT_EQ(snapshot.quality.completeRecords, 0);
    EXPECT_TRUE(snapshot.surfacePoints().empty());

    ASSERT_TRUE(snapshot.errors.has_value());
    EXPECT_EQ(snapshot.errors->summary, "Temporary connection issues with market data service");
    EXPECT_TRUE(snapshot.errors->isRecoverable);
    EXPECT_EQ(provider->calls(), 14) << "7 chunks x 2 attempts";
}

TEST_F(SurfaceServiceTest, OpenBreakerSkipsTheProvider) {
    auto fragile = std::make_shared<CircuitBreaker>(CircuitBreakerConfig{1, 60000}, clock);
    fragile->recordFailure();
    ASSERT_EQ(fragile->state().state, CircuitBreaker::State::Open);

    const VolatilitySurfaceService service(provider, fragile, config);
    quoteEverything(service);
    const SurfaceSnapshot snapshot = service.fetchSurface(valuation);

    EXPECT_EQ(provider->calls(), 0);
    ASSERT_TRUE(snapshot.errors.has_value());
    EXPECT_EQ(snapshot.errors->summary, "Data validation or configuration errors");
    EXPECT_FALSE(snapshot.errors->isRecoverable);
    EXPECT_EQ(snapshot.breaker.state, CircuitBreaker::State::Open);

    // after the cooldown one chunk is the trial; chunks racing it may still be turned away
    clock->advance(std::chrono::milliseconds(60000));
    const SurfaceSnapshot trial = service.fetchSurface(valuation);
    EXPECT_GE(provider->calls(), 1);
    EXPECT_EQ(trial.breaker.state, CircuitBreaker::State::Closed);

    const int before = provider->calls();
    const SurfaceSnapshot recovered = service.fetchSurface(valuation);
    EXPECT_FALSE(recovered.errors.has_value());
    EXPECT_EQ(provider->calls() - before, 7);
    EXPECT_EQ(recovered.quality.completeRecords, 3);
}

TEST_F(SurfaceServiceTest, HangingProviderOpensTheBreaker) {
    provider->setDelay(std::chrono::milliseconds(300));
    config.tenors = {"1M"};
    config.chunkSize = 11;                 // one chunk, so attempts are sequential
    config.retryPolicy = fastPolicy(2, 20);
    auto guard = std::make_shared<CircuitBreaker>(CircuitBreakerConfig{2, 60000}, clock);

    const VolatilitySurfaceService service(provider, guard, config);
    quoteEverything(service);
    const SurfaceSnapshot snapshot = service.fetchSurface(valuation);

    ASSERT_TRUE(snapshot.errors.has_value());
    EXPECT_TRUE(snapshot.errors->isRecoverable);
    EXPECT_EQ(snapshot.breaker.state, CircuitBreaker::State::Open);
    EXPECT_EQ(snapshot.breaker.failures, 2);
    EXPECT_EQ(provider->calls(), 2);

    // the next fetch is refused before the provider is reached
    const int before = provider->calls();
    const SurfaceSnapshot refused = service.fetchSurface(valuation);
    EXPECT_EQ(provider->calls(), before);
    ASSERT_TRUE(refused.errors.has_value());
    EXPECT_FALSE(refused.errors->isRecoverable);
}

TEST_F(SurfaceServiceTest, ConstructorValidation) {
    EXPECT_THROW(VolatilitySurfaceService(nullptr, breaker, config), std::invalid_argument);
    EXPECT_THROW(VolatilitySurfaceService(provider, nullptr, config), std::invalid_argument);

    SurfaceServiceConfig bad = config;
    bad.chunkSize = 0;
    EXPECT_THROW(VolatilitySurfaceService(provider, breaker, bad), std::invalid_argument);

    bad = config;
    bad.currencyPair.clear();
    EXPECT_THROW(VolatilitySurfaceService(provider, breaker, bad), std::invalid_argument);

    bad = config;
    bad.tenors = {"1M", "3Q"};
    EXPECT_THROW(VolatilitySurfaceService(provider, breaker, bad), std::invalid_argument);
}
