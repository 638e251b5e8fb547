#ifndef FXVOL_DISCOUNTCURVE_H
#define FXVOL_DISCOUNTCURVE_H

// Deterministic, continuously-compounded discounting for one currency
class DiscountCurve
{
public:
    virtual double discount(double time) const = 0;
    virtual double rate() const = 0;     // continuously-compounded rate, decimal

    virtual ~DiscountCurve() = default;
};

class FlatDiscountCurve : public DiscountCurve
{
public:
    explicit FlatDiscountCurve(double rate);

    // FX quotes money-market rates in percent: 4.96 -> 0.0496
    static FlatDiscountCurve fromPercent(double ratePct);

    double discount(double time) const override;
    double rate() const override;

private:
    double _rate;
};

/**
 * Outright forward of a currency pair by covered interest parity:
 *   F = S * P_foreign(T) / P_domestic(T)
 * domestic = quote currency (USD in EURUSD), foreign = base currency.
 */
double fxForward(double spot, const DiscountCurve& domestic, const DiscountCurve& foreign, double time);

#endif //FXVOL_DISCOUNTCURVE_H
