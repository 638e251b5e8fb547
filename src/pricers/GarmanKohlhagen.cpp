#include <fxvol/pricers/GarmanKohlhagen.h>
#include <fxvol/market/DiscountCurve.h>
#include <fxvol/utils/Errors.h>
#include <fxvol/utils/Utils.h>

#include <algorithm>
#include <cmath>

namespace {
    double normCdf(double x) { return Utils::stdNormCdf(x); }
    double normPdf(double x) { return Utils::stdNormPdf(x); }

    bool positiveFinite(double x) { return std::isfinite(x) && x > 0.0; }
}

void GarmanKohlhagen::validate(double spot, double strike, double timeToExpiryYears, double volatilityPct)
{
    if (!positiveFinite(spot))
        throw DomainError("GarmanKohlhagen: spot must be positive");
    if (!positiveFinite(strike))
        throw DomainError("GarmanKohlhagen: strike must be positive");
    if (!positiveFinite(timeToExpiryYears))
        throw DomainError("GarmanKohlhagen: time to expiry must be positive");
    if (!positiveFinite(volatilityPct))
        throw DomainError("GarmanKohlhagen: volatility must be positive");
}

// ============================================================================
// d1/d2 Helpers
// ============================================================================

double GarmanKohlhagen::d1(double spot, double strike, double timeToExpiryYears,
                           double domesticRatePct, double foreignRatePct, double volatilityPct)
{
    validate(spot, strike, timeToExpiryYears, volatilityPct);
    const double rd = domesticRatePct / 100.0;
    const double rf = foreignRatePct / 100.0;
    const double sigma = volatilityPct / 100.0;
    const double T = timeToExpiryYears;

    return (std::log(spot / strike) + (rd - rf + 0.5 * sigma * sigma) * T) / (sigma * std::sqrt(T));
}

double GarmanKohlhagen::d2(double spot, double strike, double timeToExpiryYears,
                           double domesticRatePct, double foreignRatePct, double volatilityPct)
{
    return d1(spot, strike, timeToExpiryYears, domesticRatePct, foreignRatePct, volatilityPct)
           - volatilityPct / 100.0 * std::sqrt(timeToExpiryYears);
}

double GarmanKohlhagen::forwardRate(double spot, double timeToExpiryYears, double domesticRatePct, double foreignRatePct)
{
    // F = S e^{(rd - rf) T}
    return fxForward(spot, FlatDiscountCurve::fromPercent(domesticRatePct),
                     FlatDiscountCurve::fromPercent(foreignRatePct), timeToExpiryYears);
}

// ============================================================================
// Pricing
// ============================================================================

OptionResult GarmanKohlhagen::price(const OptionRequest& request)
{
    validate(request.spot, request.strike, request.timeToExpiryYears, request.volatilityPct);
    if (!std::isfinite(request.notional)) {
        throw DomainError("GarmanKohlhagen: notional must be finite");
    }

    const double S = request.spot;
    const double K = request.strike;
    const double T = request.timeToExpiryYears;
    const double sigma = request.volatilityPct / 100.0;
    const double notional = request.notional;
    const bool isCall = request.optionType == Option::Type::Call;

    const FlatDiscountCurve domestic = FlatDiscountCurve::fromPercent(request.domesticRatePct);
    const FlatDiscountCurve foreign = FlatDiscountCurve::fromPercent(request.foreignRatePct);
    const double dfDomestic = domestic.discount(T);   // e^{-rd T}
    const double dfForeign = foreign.discount(T);     // e^{-rf T}
    const double rd = domestic.rate();
    const double rf = foreign.rate();

    const double sqrtT = std::sqrt(T);
    const double d1Val = d1(S, K, T, request.domesticRatePct, request.foreignRatePct, request.volatilityPct);
    const double d2Val = d1Val - sigma * sqrtT;
    const double nd1 = normCdf(d1Val);
    const double nd2 = normCdf(d2Val);
    const double nMinusD1 = normCdf(-d1Val);
    const double nMinusD2 = normCdf(-d2Val);
    const double pdfD1 = normPdf(d1Val);

    // Per unit of base currency
    const double premium = isCall
        ? S * dfForeign * nd1 - K * dfDomestic * nd2
        : K * dfDomestic * nMinusD2 - S * dfForeign * nMinusD1;

    const double delta = isCall ? dfForeign * nd1 : dfForeign * (nd1 - 1.0);
    const double gamma = dfForeign * pdfD1 / (S * sigma * sqrtT);
    const double vega = S * dfForeign * pdfD1 * sqrtT / 100.0;

    // Θ = ∂V/∂t per calendar day; the decay term is shared, the carry terms differ
    const double decay = -S * dfForeign * pdfD1 * sigma / (2.0 * sqrtT);
    const double thetaAnnual = isCall
        ? decay - rd * K * dfDomestic * nd2 + rf * S * dfForeign * nd1
        : decay + rd * K * dfDomestic * nMinusD2 - rf * S * dfForeign * nMinusD1;
    const double theta = thetaAnnual / 365.0;

    // ρ per 1pp of the domestic rate, and of the foreign rate
    const double rho = isCall
        ? K * T * dfDomestic * nd2 / 100.0
        : -K * T * dfDomestic * nMinusD2 / 100.0;
    const double rhoForeign = isCall
        ? -S * T * dfForeign * nd1 / 100.0
        : S * T * dfForeign * nMinusD1 / 100.0;

    const double intrinsic = std::max(0.0, isCall ? S - K : K - S);

    OptionResult result;
    result.premium = premium * notional;
    result.premiumPercentOfSpot = premium / S * 100.0;
    result.deltaPercent = delta * 100.0;
    result.deltaNotional = delta * notional;
    result.gammaPer1PctSpot = gamma * 100.0;
    result.gammaNotional = gamma * notional;
    result.vegaPer1PctVol = vega;
    result.vegaNotional = vega * notional;
    result.thetaPerDay = theta;
    result.thetaNotional = theta * notional;
    result.rhoPer1PctRate = rho;
    result.rhoNotional = rho * notional;
    result.rhoForeignPer1PctRate = rhoForeign;
    result.rhoForeignNotional = rhoForeign * notional;
    result.forward = fxForward(S, domestic, foreign, T);
    result.intrinsicValue = intrinsic * notional;
    result.timeValue = (premium - intrinsic) * notional;
    result.d1 = d1Val;
    result.d2 = d2Val;
    return result;
}

OptionRequest GarmanKohlhagen::makeRequest(const FxVanillaOption& option, const FxMarketData& market,
                                           const boost::gregorian::date& valuationDate)
{
    OptionRequest request;
    request.spot = market.spot;
    request.strike = option.strike();
    request.timeToExpiryYears = option.timeToExpiry(valuationDate);
    request.domesticRatePct = market.domesticRatePct;
    request.foreignRatePct = market.foreignRatePct;
    request.volatilityPct = market.volatilityPct;
    request.optionType = option.type();
    request.notional = option.notional();
    return request;
}

OptionResult GarmanKohlhagen::price(const FxVanillaOption& option, const FxMarketData& market,
                                    const boost::gregorian::date& valuationDate)
{
    return price(makeRequest(option, market, valuationDate));
}

// ============================================================================
// Strike from delta
// ============================================================================

double GarmanKohlhagen::strikeFromDelta(double targetDelta, double spot, double timeToExpiryYears,
                                        double domesticRatePct, double foreignRatePct, double volatilityPct,
                                        Option::Type optionType, double tol, int maxIter)
{
    validate(spot, spot, timeToExpiryYears, volatilityPct);

    const double T = timeToExpiryYears;
    const double sigma = volatilityPct / 100.0;
    const double dfForeign = std::exp(-foreignRatePct / 100.0 * T);
    const bool isCall = optionType == Option::Type::Call;

    // premium-included spot delta lives in (0, e^{-rf T}) for calls, (-e^{-rf T}, 0) for puts
    const bool reachable = isCall ? (targetDelta > 0.0 && targetDelta < dfForeign)
                                  : (targetDelta < 0.0 && targetDelta > -dfForeign);
    if (!reachable) {
        throw DomainError("GarmanKohlhagen: target delta outside the attainable range");
    }

    double strike = forwardRate(spot, T, domesticRatePct, foreignRatePct); // ATM forward as initial guess
    for (int iter = 0; iter < maxIter; ++iter) {
        const double d1Val = d1(spot, strike, T, domesticRatePct, foreignRatePct, volatilityPct);
        const double delta = isCall ? dfForeign * normCdf(d1Val) : dfForeign * (normCdf(d1Val) - 1.0);
        const double diff = delta - targetDelta;
        if (std::abs(diff) < tol) {
            return strike;
        }

        const double dDeltaDStrike = -dfForeign * normPdf(d1Val) / (strike * sigma * std::sqrt(T));
        double next = strike - diff / dDeltaDStrike;

        // keep the iterate positive
        if (!(next > 0.0)) {
            next = 0.5 * strike;
        }
        strike = next;
    }
    throw DomainError("GarmanKohlhagen: strike from delta did not converge");
}
