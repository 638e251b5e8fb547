#include <fxvol/market/FinancialInstrument.h>
#include <fxvol/market/Calendar.h>
#include <stdexcept>
#include <utility>

FxVanillaOption::FxVanillaOption(Type type, std::string currencyPair, double strike, Date expiry, double notional)
    : Option(type), _currencyPair(std::move(currencyPair)), _strike(strike), _expiry(expiry), _notional(notional)
{
    if (strike <= 0.0)
        throw std::invalid_argument("Strike must be positive");
    if (notional <= 0.0)
        throw std::invalid_argument("Notional must be positive");
    if (_expiry.is_not_a_date())
        throw std::invalid_argument("Expiry must be a valid date");
}

std::unique_ptr<FinancialInstrument> FxVanillaOption::clone() const
{
    return std::make_unique<FxVanillaOption>(*this);
}

double FxVanillaOption::timeToExpiry(const Date& valuationDate) const
{
    return Calendar::yearFraction(valuationDate, _expiry);
}
