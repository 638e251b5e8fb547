#ifndef FXVOL_UTILS_H
#define FXVOL_UTILS_H

#include <optional>


/**
 *  NOTES:
 *  (1) stdNormCdf uses the Abramowitz & Stegun 7.1.26 rational approximation of erf,
 *      |error| <= 1.5e-7. Pricing and the smile blend share it so that both see the
 *      same Φ.
 *  (2) Boost.Math's normal distribution is used in the tests as the reference.
 */


class Utils
{
public:
    // Standard normal CDF Φ(x) - Abramowitz & Stegun
    static double stdNormCdf(double x);

    // Standard normal PDF φ(x) = (1/√(2π)) * exp(-x²/2)
    static double stdNormPdf(double x);

    // Mid of a two-sided quote; empty unless both sides are present
    static std::optional<double> mid(const std::optional<double>& bid, const std::optional<double>& ask);

private:
    Utils() = delete; // everything is static
};

#endif //FXVOL_UTILS_H
