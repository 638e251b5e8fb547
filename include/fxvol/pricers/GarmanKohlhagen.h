#ifndef FXVOL_GARMANKOHLHAGEN_H
#define FXVOL_GARMANKOHLHAGEN_H

#include <fxvol/market/FinancialInstrument.h>

/**
 * Inputs in FX quoting convention: rates and volatility in percent,
 * time in years, notional in base-currency units.
 */
struct OptionRequest {
    double spot = 0.0;
    double strike = 0.0;
    double timeToExpiryYears = 0.0;
    double domesticRatePct = 0.0;   // quote currency (e.g. USD in EURUSD)
    double foreignRatePct = 0.0;    // base currency (e.g. EUR in EURUSD)
    double volatilityPct = 0.0;
    Option::Type optionType = Option::Type::Call;
    double notional = 1.0;
};

/**
 * Premium and premium-included Greeks.
 * Per-unit Greeks are quoted per 1 unit of base currency; *Notional fields are per-unit × notional.
 */
struct OptionResult {
    double premium = 0.0;                // quote ccy, × notional
    double premiumPercentOfSpot = 0.0;   // per-unit premium / spot × 100
    double deltaPercent = 0.0;           // e^{-rf T}Φ(d1) (call) × 100
    double deltaNotional = 0.0;          // base ccy
    double gammaPer1PctSpot = 0.0;       // 100 × Γ
    double gammaNotional = 0.0;
    double vegaPer1PctVol = 0.0;
    double vegaNotional = 0.0;
    double thetaPerDay = 0.0;            // calendar day (annual / 365)
    double thetaNotional = 0.0;
    double rhoPer1PctRate = 0.0;         // domestic rate
    double rhoNotional = 0.0;
    double rhoForeignPer1PctRate = 0.0;
    double rhoForeignNotional = 0.0;

    double forward = 0.0;
    double intrinsicValue = 0.0;         // × notional
    double timeValue = 0.0;              // × notional
    double d1 = 0.0;
    double d2 = 0.0;
};

struct FxMarketData {
    double spot = 0.0;
    double domesticRatePct = 0.0;
    double foreignRatePct = 0.0;
    double volatilityPct = 0.0;
};

/**
 * @class GarmanKohlhagen
 * @brief Garman-Kohlhagen (Black-Scholes with a continuous foreign yield) for European FX vanillas
 *
 *   d1 = [ln(S/K) + (rd - rf + σ²/2)T] / (σ√T),   d2 = d1 - σ√T
 *   C  = S e^{-rf T} Φ(d1) - K e^{-rd T} Φ(d2)
 *   P  = K e^{-rd T} Φ(-d2) - S e^{-rf T} Φ(-d1)
 *
 * Rates and vol in the formulas are decimals; the public API takes percent.
 * Invalid inputs (T, σ, S, K not strictly positive) throw DomainError; T = 0 is not special-cased.
 */
class GarmanKohlhagen
{
public:
    static OptionResult price(const OptionRequest& request);

    // Vanilla contract priced off market data at a valuation date (ACT/365 time to expiry)
    static OptionResult price(const FxVanillaOption& option, const FxMarketData& market,
                              const boost::gregorian::date& valuationDate);

    static OptionRequest makeRequest(const FxVanillaOption& option, const FxMarketData& market,
                                     const boost::gregorian::date& valuationDate);

    // Outright forward F = S e^{(rd - rf) T}
    static double forwardRate(double spot, double timeToExpiryYears, double domesticRatePct, double foreignRatePct);

    static double d1(double spot, double strike, double timeToExpiryYears,
                     double domesticRatePct, double foreignRatePct, double volatilityPct);
    static double d2(double spot, double strike, double timeToExpiryYears,
                     double domesticRatePct, double foreignRatePct, double volatilityPct);

    /**
     * Strike whose premium-included spot delta equals targetDelta (decimal, e.g. 0.25 or -0.25)
     * Newton iteration on K with ∂Δ/∂K = -e^{-rf T} φ(d1) / (K σ √T)
     */
    static double strikeFromDelta(double targetDelta, double spot, double timeToExpiryYears,
                                  double domesticRatePct, double foreignRatePct, double volatilityPct,
                                  Option::Type optionType, double tol = 1e-10, int maxIter = 100);

private:
    GarmanKohlhagen() = delete;
    static void validate(double spot, double strike, double timeToExpiryYears, double volatilityPct);
};

#endif //FXVOL_GARMANKOHLHAGEN_H
