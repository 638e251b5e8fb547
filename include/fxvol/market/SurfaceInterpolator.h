#ifndef FXVOL_SURFACEINTERPOLATOR_H
#define FXVOL_SURFACEINTERPOLATOR_H

#include <fxvol/market/VolatilityQuote.h>
#include <fxvol/utils/InterpolationSchemes.h>
#include <memory>
#include <vector>

/**
 * SurfaceInterpolator - implied volatility at arbitrary (strike, time to expiry)
 * from a tenor-indexed set of SurfacePoints (ATM, 25d RR, 25d BF mids, in %).
 *
 * 1. Term structure: linear interpolation of total variance w(T) = σ²(T)·T/365 between the
 *    bracketing tenors, σ(t) = sqrt(w(t)·365/t). Outside the quoted range the nearest
 *    pillar's ATM is returned (no extrapolation).
 * 2. Smile: market-convention 25d wings from the nearest tenor
 *      σ25C = σATM + BF + RR/2,   σ25P = σATM + BF - RR/2
 *    blended with σATM by an approximate delta Δ ≈ 1 - Φ(-m / (σATM·sqrt(t/365))), m = ln(K/S).
 *    The weight |Δ - 0.5| / 0.25 is clipped to [0,1], so the wing vol is reached at the
 *    25-delta point and held flat beyond it. The delta is not solved self-consistently;
 *    treat the smile as indicative.
 */
class SurfaceInterpolator
{
public:
    explicit SurfaceInterpolator(std::vector<SurfacePoint> surface);
    SurfaceInterpolator(const SurfaceInterpolator& other);
    SurfaceInterpolator& operator=(const SurfaceInterpolator& other);

    // ATM volatility (%) at t days, variance-space term-structure interpolation
    double atmVolatility(double timeToExpiryDays) const;

    // Smile-adjusted volatility (%) at strike for t days
    double volatilityAt(double strike, double spot, double timeToExpiryDays) const;

    // One-shot form of the above
    static double volatilityAt(double strike, double spot, double timeToExpiryDays,
                               const std::vector<SurfacePoint>& surface);

    // Approximate delta used by the smile blend
    static double approximateDelta(double strike, double spot, double atmVolPct, double timeToExpiryDays);

    const std::vector<SurfacePoint>& points() const { return _points; }

private:
    std::vector<SurfacePoint> _points;                       // sorted by tenorDays
    std::unique_ptr<InterpolationScheme> _varianceInterpolator; // total variance vs tenorDays; null for a single point

    void validateInputData() const;
    void initializeInterpolator();
    const SurfacePoint& nearestPoint(double timeToExpiryDays) const;
};

#endif //FXVOL_SURFACEINTERPOLATOR_H
