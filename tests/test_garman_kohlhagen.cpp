#include <gtest/gtest.h>
#include <fxvol/pricers/GarmanKohlhagen.h>
#include <fxvol/market/FinancialInstrument.h>
#include <fxvol/utils/Errors.h>
#include "test_utils.h"

#include <algorithm>
#include <cmath>
#include <functional>

/*
═══════════════════════════════════════════════════════════════════════════════
                    GARMAN-KOHLHAGEN: FX vanilla premium and Greeks
═══════════════════════════════════════════════════════════════════════════════
  Premium   C = S e^{-rf T} Φ(d1) - K e^{-rd T} Φ(d2)
  Delta     premium-included spot delta, in %
  Gamma     100 × ∂Δ/∂S
  Vega      ∂V/∂σ per vol point
  Theta     ∂V/∂t per calendar day
  Rho       ∂V/∂rd (and ∂V/∂rf) per 1pp

TEST COVERAGE:
  - put-call parity, forward, intrinsic / time value
  - EURUSD 1M reference trade
  - every Greek against a central finite difference of the premium
  - notional scaling, invalid inputs, strike from delta
═══════════════════════════════════════════════════════════════════════════════
*/

using namespace test_utils;

namespace {
    // EURUSD 1M reference trade
    OptionRequest eurusd1M(Option::Type type = Option::Type::Call)
    {
        return OptionRequest{1.1742, 1.1000, 0.0833, 4.96, 1.90, 7.34, type, 1.0};
    }

    // Near-the-money 3M trade for the finite-difference checks
    OptionRequest eurusd3M(Option::Type type)
    {
        return OptionRequest{1.1742, 1.1800, 0.25, 4.96, 1.90, 7.34, type, 1.0};
    }

    double premium(OptionRequest request) { return GarmanKohlhagen::price(request).premium; }

    double centralDifference(const std::function<double(double)>& f, double x, double h)
    {
        return (f(x + h) - f(x - h)) / (2.0 * h);
    }

    double relTol(double value) { return 1e-3 * std::abs(value) + 1e-9; }
}

// ═══════════════════════════════════════════════════════════════════════════════
//                          PREMIUM
// ═══════════════════════════════════════════════════════════════════════════════

TEST(GarmanKohlhagenTest, PutCallParity) {
    // C - P = S e^{-rf T} - K e^{-rd T}
    for (double strike : {0.95, 1.10, 1.1742, 1.25, 1.40}) {
        for (double T : {0.0027, 0.0833, 0.5, 2.0}) {
            OptionRequest call {1.1742, strike, T, 4.96, 1.90, 7.34, Option::Type::Call, 1.0};
            OptionRequest put = call;
            put.optionType = Option::Type::Put;

            const double lhs = premium(call) - premium(put);
            const double rhs = 1.1742 * std::exp(-0.019 * T) - strike * std::exp(-0.0496 * T);
            EXPECT_NEAR(lhs, rhs, PRICE_TOL) << "K=" << strike << " T=" << T;
        }
    }
}

TEST(GarmanKohlhagenTest, Eurusd1MDeepInTheMoneyCall) {
    const OptionResult result = GarmanKohlhagen::price(eurusd1M());

    // d1 = [ln(1.1742/1.1) + (0.0496 - 0.019 + 0.0734²/2) 0.0833] / (0.0734 √0.0833) ≈ 3.21
    EXPECT_NEAR(result.d1, 3.2122, 1e-3);
    EXPECT_NEAR(result.d2, result.d1 - 0.0734 * std::sqrt(0.0833), 1e-12);

    EXPECT_GT(result.premium, 0.0);
    EXPECT_NEAR(result.premium, 0.07688, 1e-4);
    EXPECT_GT(result.deltaPercent, 90.0) << "deep ITM call should carry almost full delta";
    EXPECT_LT(result.deltaPercent, 100.0);

    // intrinsic 0.0742, time value is what remains
    EXPECT_NEAR(result.intrinsicValue, 0.0742, 1e-12);
    EXPECT_NEAR(result.timeValue, result.premium - result.intrinsicValue, 1e-12);
    EXPECT_NEAR(result.premiumPercentOfSpot, result.premium / 1.1742 * 100.0, 1e-12);
}

TEST(GarmanKohlhagenTest, ForwardFromInterestParity) {
    const double forward = GarmanKohlhagen::forwardRate(1.1742, 0.0833, 4.96, 1.90);
    EXPECT_NEAR(forward, 1.1742 * std::exp((0.0496 - 0.019) * 0.0833), 1e-14);
    EXPECT_GT(forward, 1.1742) << "rd > rf puts the forward above spot";
    EXPECT_NEAR(GarmanKohlhagen::price(eurusd1M()).forward, forward, 1e-14);
}

TEST(GarmanKohlhagenTest, OtmPutHasNoIntrinsicValue) {
    const OptionResult result = GarmanKohlhagen::price(eurusd1M(Option::Type::Put));
    EXPECT_GE(result.premium, 0.0);
    EXPECT_DOUBLE_EQ(result.intrinsicValue, 0.0);
    EXPECT_NEAR(result.timeValue, result.premium, 1e-15);
}

TEST(GarmanKohlhagenTest, PremiumIncreasesWithVolatility) {
    OptionRequest request = eurusd3M(Option::Type::Call);
    double previous = 0.0;
    for (double vol : {2.0, 5.0, 7.34, 10.0, 20.0}) {
        request.volatilityPct = vol;
        const double value = premium(request);
        EXPECT_GT(value, previous) << "vol=" << vol;
        previous = value;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
//                          GREEKS vs FINITE DIFFERENCES
// ═══════════════════════════════════════════════════════════════════════════════

class GarmanKohlhagenGreeksTest : public ::testing::TestWithParam<Option::Type> {};

TEST_P(GarmanKohlhagenGreeksTest, DeltaMatchesSpotBump) {
    const OptionRequest base = eurusd3M(GetParam());
    const double fd = centralDifference([&](double s) { auto r = base; r.spot = s; return premium(r); }, base.spot, 1e-5);
    const double delta = GarmanKohlhagen::price(base).deltaPercent / 100.0;
    EXPECT_NEAR(delta, fd, relTol(delta));
}

TEST_P(GarmanKohlhagenGreeksTest, GammaMatchesDeltaBump) {
    const OptionRequest base = eurusd3M(GetParam());
    const double fd = centralDifference([&](double s) {
        auto r = base; r.spot = s; return GarmanKohlhagen::price(r).deltaPercent / 100.0;
    }, base.spot, 1e-5);
    const double gamma = GarmanKohlhagen::price(base).gammaPer1PctSpot / 100.0;
    EXPECT_GT(gamma, 0.0);
    EXPECT_NEAR(gamma, fd, relTol(gamma));
}

TEST_P(GarmanKohlhagenGreeksTest, VegaMatchesVolBump) {
    const OptionRequest base = eurusd3M(GetParam());
    const double fd = centralDifference([&](double v) { auto r = base; r.volatilityPct = v; return premium(r); },
                                        base.volatilityPct, 1e-3);
    const double vega = GarmanKohlhagen::price(base).vegaPer1PctVol;
    EXPECT_GT(vega, 0.0);
    EXPECT_NEAR(vega, fd, relTol(vega));
}

TEST_P(GarmanKohlhagenGreeksTest, ThetaMatchesTimeDecay) {
    const OptionRequest base = eurusd3M(GetParam());
    // Θ = -∂V/∂T, per calendar day
    const double fd = -centralDifference([&](double t) { auto r = base; r.timeToExpiryYears = t; return premium(r); },
                                         base.timeToExpiryYears, 1e-5) / 365.0;
    const double theta = GarmanKohlhagen::price(base).thetaPerDay;
    EXPECT_NEAR(theta, fd, relTol(theta));
}

TEST_P(GarmanKohlhagenGreeksTest, DomesticRhoMatchesRateBump) {
    const OptionRequest base = eurusd3M(GetParam());
    const double fd = centralDifference([&](double rd) { auto r = base; r.domesticRatePct = rd; return premium(r); },
                                        base.domesticRatePct, 1e-3);
    const double rho = GarmanKohlhagen::price(base).rhoPer1PctRate;
    EXPECT_NEAR(rho, fd, relTol(rho));
    if (GetParam() == Option::Type::Call)
        EXPECT_GT(rho, 0.0);
    else
        EXPECT_LT(rho, 0.0);
}

TEST_P(GarmanKohlhagenGreeksTest, ForeignRhoMatchesRateBump) {
    const OptionRequest base = eurusd3M(GetParam());
    const double fd = centralDifference([&](double rf) { auto r = base; r.foreignRatePct = rf; return premium(r); },
                                        base.foreignRatePct, 1e-3);
    const double rho = GarmanKohlhagen::price(base).rhoForeignPer1PctRate;
    EXPECT_NEAR(rho, fd, relTol(rho));
}

INSTANTIATE_TEST_SUITE_P(CallAndPut, GarmanKohlhagenGreeksTest,
                         ::testing::Values(Option::Type::Call, Option::Type::Put));

TEST(GarmanKohlhagenTest, DeltaParity) {
    // Δcall - Δput = e^{-rf T}
    const double callDelta = GarmanKohlhagen::price(eurusd3M(Option::Type::Call)).deltaPercent;
    const double putDelta = GarmanKohlhagen::price(eurusd3M(Option::Type::Put)).deltaPercent;
    EXPECT_NEAR(callDelta - putDelta, 100.0 * std::exp(-0.019 * 0.25), 1e-10);
}

TEST(GarmanKohlhagenTest, NotionalScalesPremiumAndGreeks) {
    OptionRequest unit = eurusd3M(Option::Type::Put);
    OptionRequest scaled = unit;
    scaled.notional = 5000000.0;

    const OptionResult a = GarmanKohlhagen::price(unit);
    const OptionResult b = GarmanKohlhagen::price(scaled);

    EXPECT_NEAR(b.premium, a.premium * 5e6, 1e-6);
    EXPECT_NEAR(b.deltaNotional, a.deltaPercent / 100.0 * 5e6, 1e-6);
    EXPECT_NEAR(b.gammaNotional, a.gammaPer1PctSpot / 100.0 * 5e6, 1e-4);
    EXPECT_NEAR(b.vegaNotional, a.vegaPer1PctVol * 5e6, 1e-6);
    EXPECT_NEAR(b.thetaNotional, a.thetaPerDay * 5e6, 1e-6);
    EXPECT_NEAR(b.rhoNotional, a.rhoPer1PctRate * 5e6, 1e-6);
    EXPECT_NEAR(b.rhoForeignNotional, a.rhoForeignPer1PctRate * 5e6, 1e-6);

    // per-unit quotes do not depend on notional
    EXPECT_DOUBLE_EQ(b.deltaPercent, a.deltaPercent);
    EXPECT_DOUBLE_EQ(b.premiumPercentOfSpot, a.premiumPercentOfSpot);
}

// ═══════════════════════════════════════════════════════════════════════════════
//                          INVALID INPUTS
// ═══════════════════════════════════════════════════════════════════════════════

TEST(GarmanKohlhagenTest, RejectsDegenerateInputs) {
    OptionRequest request = eurusd1M();

    request.timeToExpiryYears = 0.0;
    EXPECT_THROW(GarmanKohlhagen::price(request), DomainError) << "T = 0 is not special-cased";
    request.timeToExpiryYears = -0.1;
    EXPECT_THROW(GarmanKohlhagen::price(request), DomainError);

    request = eurusd1M();
    request.volatilityPct = 0.0;
    EXPECT_THROW(GarmanKohlhagen::price(request), DomainError);

    request = eurusd1M();
    request.spot = -1.0;
    EXPECT_THROW(GarmanKohlhagen::price(request), DomainError);

    request = eurusd1M();
    request.strike = 0.0;
    EXPECT_THROW(GarmanKohlhagen::price(request), DomainError);

    request = eurusd1M();
    request.spot = std::nan("");
    EXPECT_THROW(GarmanKohlhagen::price(request), DomainError);
}

TEST(GarmanKohlhagenTest, DomainErrorIsAnInvalidArgument) {
    OptionRequest request = eurusd1M();
    request.volatilityPct = -5.0;
    EXPECT_THROW(GarmanKohlhagen::price(request), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════════
//                          STRIKE FROM DELTA
// ═══════════════════════════════════════════════════════════════════════════════

TEST(GarmanKohlhagenTest, StrikeFromDeltaRoundTrip) {
    for (double target : {0.10, 0.25, 0.50, 0.75}) {
        const double strike = GarmanKohlhagen::strikeFromDelta(target, 1.1742, 0.25, 4.96, 1.90, 7.34,
                                                               Option::Type::Call);
        OptionRequest request = eurusd3M(Option::Type::Call);
        request.strike = strike;
        EXPECT_NEAR(GarmanKohlhagen::price(request).deltaPercent / 100.0, target, 1e-8) << "target " << target;
    }

    for (double target : {-0.10, -0.25, -0.50}) {
        const double strike = GarmanKohlhagen::strikeFromDelta(target, 1.1742, 0.25, 4.96, 1.90, 7.34,
                                                               Option::Type::Put);
        OptionRequest request = eurusd3M(Option::Type::Put);
        request.strike = strike;
        EXPECT_NEAR(GarmanKohlhagen::price(request).deltaPercent / 100.0, target, 1e-8) << "target " << target;
    }
}

TEST(GarmanKohlhagenTest, TwentyFiveDeltaStrikesBracketTheForward) {
    const double forward = GarmanKohlhagen::forwardRate(1.1742, 0.25, 4.96, 1.90);
    const double callStrike = GarmanKohlhagen::strikeFromDelta(0.25, 1.1742, 0.25, 4.96, 1.90, 7.34, Option::Type::Call);
    const double putStrike = GarmanKohlhagen::strikeFromDelta(-0.25, 1.1742, 0.25, 4.96, 1.90, 7.34, Option::Type::Put);
    EXPECT_GT(callStrike, forward);
    EXPECT_LT(putStrike, forward);
}

TEST(GarmanKohlhagenTest, StrikeFromDeltaRejectsUnreachableTargets) {
    // call delta is capped at e^{-rf T} < 1
    EXPECT_THROW(GarmanKohlhagen::strikeFromDelta(0.9999, 1.1742, 0.25, 4.96, 1.90, 7.34, Option::Type::Call),
                 DomainError);
    EXPECT_THROW(GarmanKohlhagen::strikeFromDelta(-0.25, 1.1742, 0.25, 4.96, 1.90, 7.34, Option::Type::Call),
                 DomainError);
    EXPECT_THROW(GarmanKohlhagen::strikeFromDelta(0.25, 1.1742, 0.25, 4.96, 1.90, 7.34, Option::Type::Put),
                 DomainError);
    EXPECT_THROW(GarmanKohlhagen::strikeFromDelta(0.25, 1.1742, 0.0, 4.96, 1.90, 7.34, Option::Type::Call),
                 DomainError);
}

// ═══════════════════════════════════════════════════════════════════════════════
//                          VANILLA CONTRACT
// ═══════════════════════════════════════════════════════════════════════════════

TEST(GarmanKohlhagenTest, VanillaContractUsesActual365) {
    using boost::gregorian::date;
    const date valuation(2025, 1, 15);
    const FxVanillaOption option(Option::Type::Call, "EURUSD", 1.18, date(2025, 4, 15), 1000000.0);
    const FxMarketData market {1.1742, 4.96, 1.90, 7.34};

    const OptionRequest request = GarmanKohlhagen::makeRequest(option, market, valuation);
    EXPECT_NEAR(request.timeToExpiryYears, 90.0 / 365.0, 1e-15);
    EXPECT_DOUBLE_EQ(request.strike, 1.18);
    EXPECT_DOUBLE_EQ(request.notional, 1000000.0);

    const OptionResult fromContract = GarmanKohlhagen::price(option, market, valuation);
    EXPECT_NEAR(fromContract.premium, GarmanKohlhagen::price(request).premium, 1e-12);
}

TEST(GarmanKohlhagenTest, ExpiredContractIsADomainError) {
    using boost::gregorian::date;
    const FxVanillaOption option(Option::Type::Put, "EURUSD", 1.18, date(2025, 1, 15));
    EXPECT_THROW(GarmanKohlhagen::price(option, FxMarketData{1.1742, 4.96, 1.90, 7.34}, date(2025, 1, 15)),
                 DomainError);
}

TEST(GarmanKohlhagenTest, VanillaContractValidationAndClone) {
    using boost::gregorian::date;
    EXPECT_THROW(FxVanillaOption(Option::Type::Call, "EURUSD", 0.0, date(2025, 4, 15)), std::invalid_argument);
    EXPECT_THROW(FxVanillaOption(Option::Type::Call, "EURUSD", 1.18, date(2025, 4, 15), -1.0), std::invalid_argument);
    EXPECT_THROW(FxVanillaOption(Option::Type::Call, "EURUSD", 1.18, date(boost::date_time::not_a_date_time)),
                 std::invalid_argument);

    const FxVanillaOption option(Option::Type::Put, "USDJPY", 150.0, date(2025, 7, 15), 5.0);
    const auto copy = option.clone();
    const auto* vanilla = dynamic_cast<const FxVanillaOption*>(copy.get());
    ASSERT_NE(vanilla, nullptr);
    EXPECT_EQ(vanilla->type(), Option::Type::Put);
    EXPECT_EQ(vanilla->currencyPair(), "USDJPY");
    EXPECT_DOUBLE_EQ(vanilla->strike(), 150.0);
    EXPECT_EQ(vanilla->expiry(), date(2025, 7, 15));
    EXPECT_DOUBLE_EQ(vanilla->notional(), 5.0);
}
