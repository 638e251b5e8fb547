#ifndef FXVOL_QUOTEPROVIDER_H
#define FXVOL_QUOTEPROVIDER_H

#include <fxvol/market/VolatilityQuote.h>
#include <fxvol/resilience/Outcome.h>

#include <string>
#include <vector>

/**
 * Source of raw reference data for a list of securities (the market-data gateway).
 * One SecurityData per requested id; per-security problems are reported on the record,
 * a failure of the whole request as a ProviderFailure.
 * Implementations are called from worker threads and must be thread-safe.
 */
class QuoteProvider
{
public:
    virtual Outcome<std::vector<SecurityData>> fetchQuotes(const std::vector<std::string>& securityIds,
                                                           const std::vector<std::string>& fields) = 0;
    virtual ~QuoteProvider() = default;
};

#endif //FXVOL_QUOTEPROVIDER_H
