#include <fxvol/utils/Utils.h>
#include <cmath>
#include <numbers>

// ============================================================================
// * Statistics
// ============================================================================

constexpr double PI = std::numbers::pi; // C++ 20 pi

// Standard normal CDF
double Utils::stdNormCdf(double x)
{
    /**
     * Abramowitz & Stegun (1964), formula 7.1.26
     *
     *   erf(z) ≈ 1 - (a1 t + a2 t² + a3 t³ + a4 t⁴ + a5 t⁵) e^{-z²},  t = 1/(1 + p z)
     *   Φ(x)   = 0.5 * (1 + sign(x) * erf(|x|/√2))
     *
     * Accuracy: |ε(z)| ≤ 1.5×10⁻⁷
     */
    constexpr double a1 =  0.254829592;
    constexpr double a2 = -0.284496736;
    constexpr double a3 =  1.421413741;
    constexpr double a4 = -1.453152027;
    constexpr double a5 =  1.061405429;
    constexpr double p  =  0.3275911;

    const double sign = (x >= 0.0) ? 1.0 : -1.0;
    const double z = std::abs(x) / std::sqrt(2.0);

    const double t = 1.0 / (1.0 + p * z);
    const double poly = ((((a5 * t + a4) * t + a3) * t + a2) * t + a1) * t; // Horner
    const double erf = 1.0 - poly * std::exp(-z * z);

    return 0.5 * (1.0 + sign * erf);
}

double Utils::stdNormPdf(double x)
{
    // PDF of standard normal distribution: φ(x) = (1/√(2π)) * exp(-x²/2)
    return (1.0 / std::sqrt(2.0 * PI)) * std::exp(-0.5 * x * x);
}

std::optional<double> Utils::mid(const std::optional<double>& bid, const std::optional<double>& ask)
{
    if (!bid || !ask) {
        return std::nullopt;
    }
    return 0.5 * (*bid + *ask);
}
