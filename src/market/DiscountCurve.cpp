#include <fxvol/market/DiscountCurve.h>
#include <fxvol/utils/Errors.h>
#include <cmath>


FlatDiscountCurve::FlatDiscountCurve(double rate)
    : _rate(rate)
{
    if (!std::isfinite(rate)) {
        throw DomainError("FlatDiscountCurve: rate must be finite");
    }
}

FlatDiscountCurve FlatDiscountCurve::fromPercent(double ratePct)
{
    return FlatDiscountCurve(ratePct / 100.0);
}

double FlatDiscountCurve::discount(double time) const
{
    if (time < 0.0) {
        throw DomainError("FlatDiscountCurve: cannot discount from the past");
    }
    return std::exp(-_rate * time);
}

double FlatDiscountCurve::rate() const
{
    return _rate;
}

double fxForward(double spot, const DiscountCurve& domestic, const DiscountCurve& foreign, double time)
{
    return spot * foreign.discount(time) / domestic.discount(time);
}
