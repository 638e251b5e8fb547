#ifndef FXVOL_INTERPOLATIONSCHEMES_H
#define FXVOL_INTERPOLATIONSCHEMES_H

#include <vector>
#include <memory>
#include <utility>


/**
 * Abstract base class for 1D interpolation schemes
 *
 * DESIGN:
 * - interpolate() provides the analytical form within the data range
 * - operator() routes points outside the range to flat extrapolation (boundary value);
 *   the kernel never extrapolates market data beyond the quoted pillars
 */

// ============================================================================
// BASE CLASS: InterpolationScheme
// ============================================================================
class InterpolationScheme
{
public:
    InterpolationScheme(const std::vector<double>& xData, const std::vector<double>& yData);
    virtual ~InterpolationScheme() = default;

    // Core interface
    virtual double interpolate(double x) const = 0;
    virtual std::unique_ptr<InterpolationScheme> clone() const = 0;

    double operator()(double x) const; // routes to interpolate or flat extrapolation
    std::pair<double, double> getRange() const;

    const std::vector<double>& xData() const { return _xData; }
    const std::vector<double>& yData() const { return _yData; }

protected:
    std::vector<double> _xData;
    std::vector<double> _yData;

    void validateData() const;

    // Index i such that x is in [xData[i], xData[i+1]) - binary search
    size_t findInterval(double x) const;
};


/**
 * Linear interpolation: y = y0 + (y1-y0) * (x-x0) / (x1-x0)
 * Used on total implied variance along the tenor axis.
 */
class LinearInterpolation : public InterpolationScheme
{
public:
    LinearInterpolation(const std::vector<double>& xData, const std::vector<double>& yData);

    double interpolate(double x) const override;
    std::unique_ptr<InterpolationScheme> clone() const override;
};

#endif //FXVOL_INTERPOLATIONSCHEMES_H
