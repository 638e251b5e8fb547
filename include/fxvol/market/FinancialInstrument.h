#ifndef FXVOL_FINANCIALINSTRUMENT_H
#define FXVOL_FINANCIALINSTRUMENT_H

#include <boost/date_time/gregorian/gregorian.hpp>
#include <memory>
#include <string>


class FinancialInstrument // Abstract class - base class
{
public:
    virtual std::unique_ptr<FinancialInstrument> clone() const = 0;
    virtual ~FinancialInstrument() = default;
};

class Option : public FinancialInstrument
{
public:
    enum class Type { Call, Put };

    explicit Option(Option::Type type) : _type(type) {}
    Option(const Option&) = default;
    Option& operator=(const Option&) = default;
    ~Option() override = default;

    Type type() const { return _type; }

protected:
    Type _type;
};

/**
 * European vanilla FX option on a currency pair (base/quote, e.g. "EURUSD").
 * Notional is in base-currency units; the premium is in quote-currency units.
 */
class FxVanillaOption : public Option
{
public:
    using Date = boost::gregorian::date;

    FxVanillaOption(Type type, std::string currencyPair, double strike, Date expiry, double notional = 1.0);
    FxVanillaOption(const FxVanillaOption&) = default;
    FxVanillaOption& operator=(const FxVanillaOption&) = default;
    ~FxVanillaOption() override = default;

    std::unique_ptr<FinancialInstrument> clone() const override;

    const std::string& currencyPair() const { return _currencyPair; }
    double strike() const { return _strike; }
    const Date& expiry() const { return _expiry; }
    double notional() const { return _notional; }

    // ACT/365 year fraction from valuation date to expiry (<= 0 once expired)
    double timeToExpiry(const Date& valuationDate) const;

private:
    std::string _currencyPair;
    double _strike {0.0};
    Date _expiry;
    double _notional {1.0};
};

#endif //FXVOL_FINANCIALINSTRUMENT_H
