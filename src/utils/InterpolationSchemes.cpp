#include <fxvol/utils/InterpolationSchemes.h>
#include <algorithm>
#include <stdexcept>
#include <cmath>


// ============================================================================
// InterpolationScheme Base Class Implementation
// ============================================================================
InterpolationScheme::InterpolationScheme(const std::vector<double>& xData, const std::vector<double>& yData)
    : _xData(xData), _yData(yData)
{
    validateData();
}

void InterpolationScheme::validateData() const
{
    if (_xData.size() != _yData.size()) {
        throw std::invalid_argument("InterpolationScheme: xData and yData must have same size");
    }

    if (_xData.size() < 2) {
        throw std::invalid_argument("InterpolationScheme: At least 2 data points required");
    }

    // strictly increasing, a repeated node would give a zero-width interval
    for (size_t i = 1; i < _xData.size(); ++i) {
        if (!(_xData[i] > _xData[i - 1])) {
            throw std::invalid_argument("InterpolationScheme: xData must be strictly increasing");
        }
    }
}

std::pair<double, double> InterpolationScheme::getRange() const
{
    return {_xData.front(), _xData.back()};
}

size_t InterpolationScheme::findInterval(double x) const
{
    auto it = std::upper_bound(_xData.begin(), _xData.end(), x);

    if (it == _xData.begin()) {
        return 0;
    }

    size_t idx = std::distance(_xData.begin(), it) - 1;
    // Clamp to valid range
    if (idx >= _xData.size() - 1) {
        idx = _xData.size() - 2;
    }
    return idx;
}

double InterpolationScheme::operator()(double x) const
{
    auto [xMin, xMax] = getRange();
    if (x <= xMin) {
        return _yData.front();
    }
    if (x >= xMax) {
        return _yData.back();
    }
    return interpolate(x);
}

// ============================================================================
// LinearInterpolation Implementation
// ============================================================================

LinearInterpolation::LinearInterpolation(const std::vector<double>& xData, const std::vector<double>& yData)
    : InterpolationScheme(xData, yData)
{
}

double LinearInterpolation::interpolate(double x) const
{
    size_t idx = findInterval(x);

    double x0 = _xData[idx];
    double x1 = _xData[idx + 1];
    double y0 = _yData[idx];
    double y1 = _yData[idx + 1];

    return y0 + (y1 - y0) * (x - x0) / (x1 - x0);
}

std::unique_ptr<InterpolationScheme> LinearInterpolation::clone() const
{
    return std::make_unique<LinearInterpolation>(_xData, _yData);
}
