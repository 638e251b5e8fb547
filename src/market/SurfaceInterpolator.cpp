#include <fxvol/market/SurfaceInterpolator.h>
#include <fxvol/utils/Errors.h>
#include <fxvol/utils/Utils.h>

#include <algorithm>
#include <cmath>

namespace {
    constexpr double DAYS_PER_YEAR = 365.0;
    constexpr double WING_DELTA_DISTANCE = 0.25; // |Δ - 0.5| at the 25-delta point

    double totalVariance(double volPct, double tenorDays)
    {
        const double sigma = volPct / 100.0;
        return sigma * sigma * tenorDays / DAYS_PER_YEAR;
    }
}

SurfaceInterpolator::SurfaceInterpolator(std::vector<SurfacePoint> surface)
    : _points(std::move(surface))
{
    std::stable_sort(_points.begin(), _points.end(), [](const SurfacePoint& a, const SurfacePoint& b) {
        return a.tenorDays < b.tenorDays;
    });
    validateInputData();
    initializeInterpolator();
}

SurfaceInterpolator::SurfaceInterpolator(const SurfaceInterpolator& other)
    : _points(other._points),
      _varianceInterpolator(other._varianceInterpolator ? other._varianceInterpolator->clone() : nullptr)
{
}

SurfaceInterpolator& SurfaceInterpolator::operator=(const SurfaceInterpolator& other)
{
    if (this != &other) {
        _points = other._points;
        _varianceInterpolator = other._varianceInterpolator ? other._varianceInterpolator->clone() : nullptr;
    }
    return *this;
}

void SurfaceInterpolator::validateInputData() const
{
    if (_points.empty()) {
        throw DomainError("SurfaceInterpolator: empty surface, cannot interpolate");
    }

    for (size_t i = 0; i < _points.size(); ++i) {
        if (_points[i].tenorDays <= 0) {
            throw DomainError("SurfaceInterpolator: tenor days must be positive");
        }
        if (!(_points[i].atm > 0.0)) {
            throw DomainError("SurfaceInterpolator: ATM volatilities must be positive");
        }
        if (i > 0 && _points[i].tenorDays == _points[i - 1].tenorDays) {
            throw DomainError("SurfaceInterpolator: duplicate tenor " + std::to_string(_points[i].tenorDays) + "d");
        }
    }
}

void SurfaceInterpolator::initializeInterpolator()
{
    if (_points.size() < 2) {
        return;
    }

    std::vector<double> tenors;
    std::vector<double> variances;
    tenors.reserve(_points.size());
    variances.reserve(_points.size());
    for (const auto& p : _points) {
        tenors.push_back(static_cast<double>(p.tenorDays));
        variances.push_back(totalVariance(p.atm, p.tenorDays));
    }
    _varianceInterpolator = std::make_unique<LinearInterpolation>(tenors, variances);
}

double SurfaceInterpolator::atmVolatility(double timeToExpiryDays) const
{
    if (!_varianceInterpolator) {
        return _points.front().atm;
    }

    // clamp to the quoted range
    if (timeToExpiryDays <= _points.front().tenorDays) {
        return _points.front().atm;
    }
    if (timeToExpiryDays >= _points.back().tenorDays) {
        return _points.back().atm;
    }

    const double variance = (*_varianceInterpolator)(timeToExpiryDays);
    return std::sqrt(variance * DAYS_PER_YEAR / timeToExpiryDays) * 100.0;
}

const SurfacePoint& SurfaceInterpolator::nearestPoint(double timeToExpiryDays) const
{
    // ties go to the shorter tenor
    return *std::min_element(_points.begin(), _points.end(), [&](const SurfacePoint& a, const SurfacePoint& b) {
        return std::abs(a.tenorDays - timeToExpiryDays) < std::abs(b.tenorDays - timeToExpiryDays);
    });
}

double SurfaceInterpolator::approximateDelta(double strike, double spot, double atmVolPct, double timeToExpiryDays)
{
    const double m = std::log(strike / spot);
    const double stdDev = atmVolPct / 100.0 * std::sqrt(timeToExpiryDays / DAYS_PER_YEAR);
    return 1.0 - Utils::stdNormCdf(-m / stdDev);
}

double SurfaceInterpolator::volatilityAt(double strike, double spot, double timeToExpiryDays) const
{
    if (!(strike > 0.0) || !(spot > 0.0)) {
        throw DomainError("SurfaceInterpolator: strike and spot must be positive");
    }
    if (!(timeToExpiryDays > 0.0)) {
        throw DomainError("SurfaceInterpolator: time to expiry must be positive");
    }

    const double atm = atmVolatility(timeToExpiryDays);
    if (_points.size() == 1) {
        return atm; // no smile context
    }

    const SurfacePoint& nearest = nearestPoint(timeToExpiryDays);
    if (!nearest.rr25d || !nearest.bf25d) {
        return atm;
    }

    const double rr = *nearest.rr25d;
    const double bf = *nearest.bf25d;
    const double vol25Call = atm + bf + 0.5 * rr;
    const double vol25Put = atm + bf - 0.5 * rr;

    const double delta = approximateDelta(strike, spot, atm, timeToExpiryDays);
    const double wingVol = (delta >= 0.5) ? vol25Call : vol25Put;
    const double weight = std::clamp(std::abs(delta - 0.5) / WING_DELTA_DISTANCE, 0.0, 1.0);

    return atm + weight * (wingVol - atm);
}

double SurfaceInterpolator::volatilityAt(double strike, double spot, double timeToExpiryDays,
                                         const std::vector<SurfacePoint>& surface)
{
    return SurfaceInterpolator(surface).volatilityAt(strike, spot, timeToExpiryDays);
}
