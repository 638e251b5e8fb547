#include <fxvol/market/Calendar.h>
#include <fxvol/market/FinancialInstrument.h>
#include <fxvol/market/QuoteValidator.h>
#include <fxvol/market/SurfaceInterpolator.h>
#include <fxvol/market/VolatilitySurfaceService.h>
#include <fxvol/pricers/GarmanKohlhagen.h>
#include <fxvol/resilience/CircuitBreaker.h>
#include <fxvol/utils/Log.h>
#include <fxvol/utils/Utils.h>

#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

// Synthetic EURUSD quote set standing in for the market-data gateway
class SyntheticQuoteProvider : public QuoteProvider
{
public:
    explicit SyntheticQuoteProvider(const SurfaceServiceConfig& config)
    {
        const auto& pair = config.currencyPair;
        for (const auto& tenor : config.tenors) {
            const double years = Calendar::tenorToDays(tenor) / 365.0;
            const double atm = 6.8 + 0.9 * years;   // upward sloping term structure
            _quotes[VolatilitySurfaceService::atmTicker(pair, tenor)] = {atm - 0.10, atm + 0.10};

            for (DeltaBucket bucket : ALL_DELTA_BUCKETS) {
                const double wing = (50.0 - deltaValue(bucket)) / 25.0;
                const double rr = -0.25 * wing;
                const double bf = 0.12 * wing * wing;
                _quotes[VolatilitySurfaceService::riskReversalTicker(pair, bucket, tenor)] = {rr - 0.08, rr + 0.08};
                _quotes[VolatilitySurfaceService::butterflyTicker(pair, bucket, tenor)] = {bf - 0.05, bf + 0.05};
            }
        }
        // the 3W ATM bid is not published
        _quotes[VolatilitySurfaceService::atmTicker(pair, "3W")].first.reset();
    }

    Outcome<std::vector<SecurityData>> fetchQuotes(const std::vector<std::string>& securityIds,
                                                   const std::vector<std::string>&) override
    {
        std::vector<SecurityData> records;
        for (const auto& id : securityIds) {
            SecurityData record;
            record.securityId = id;
            const auto it = _quotes.find(id);
            if (it == _quotes.end()) {
                record.error = "Unknown security";
            } else {
                record.success = true;
                record.fields["PX_BID"] = it->second.first;
                record.fields["PX_ASK"] = it->second.second;
                record.fields["PX_LAST"] = Utils::mid(it->second.first, it->second.second);
            }
            records.push_back(std::move(record));
        }
        return records;
    }

private:
    std::map<std::string, std::pair<std::optional<double>, std::optional<double>>> _quotes;
};

void printResult(const std::string& label, const OptionResult& result)
{
    std::cout << label << std::endl;
    std::cout << "  Premium:        " << result.premium << " (" << result.premiumPercentOfSpot << "% of spot)" << std::endl;
    std::cout << "  Delta:          " << result.deltaPercent << "%" << std::endl;
    std::cout << "  Gamma (1%):     " << result.gammaPer1PctSpot << std::endl;
    std::cout << "  Vega (1 vol):   " << result.vegaPer1PctVol << std::endl;
    std::cout << "  Theta (1 day):  " << result.thetaPerDay << std::endl;
    std::cout << "  Rho dom (1%):   " << result.rhoPer1PctRate << std::endl;
    std::cout << "  Rho for (1%):   " << result.rhoForeignPer1PctRate << std::endl;
    std::cout << "  Forward:        " << result.forward << std::endl;
}

} // namespace

int main()
{
    Log::setLevel(LogLevel::Warning);
    std::cout << std::fixed << std::setprecision(6);

    // ============================================================================
    // Garman-Kohlhagen: EURUSD 1M
    // ============================================================================
    OptionRequest request;
    request.spot = 1.1742;
    request.strike = 1.1000;
    request.timeToExpiryYears = 0.0833;
    request.domesticRatePct = 4.96;
    request.foreignRatePct = 1.90;
    request.volatilityPct = 7.34;

    request.optionType = Option::Type::Call;
    printResult("EURUSD 1M 1.1000 call", GarmanKohlhagen::price(request));
    request.optionType = Option::Type::Put;
    printResult("EURUSD 1M 1.1000 put", GarmanKohlhagen::price(request));

    const double strike25 = GarmanKohlhagen::strikeFromDelta(0.25, request.spot, request.timeToExpiryYears,
                                                              request.domesticRatePct, request.foreignRatePct,
                                                              request.volatilityPct, Option::Type::Call);
    std::cout << "25-delta call strike: " << strike25 << std::endl;

    // ============================================================================
    // Surface fetch through the resilience layer
    // ============================================================================
    const boost::gregorian::date today(2025, boost::gregorian::Jan, 15);
    auto breaker = std::make_shared<CircuitBreaker>();

    SurfaceServiceConfig config;
    config.retryPolicy.initialDelayMs = 100;
    config.retryPolicy.timeoutMs = 5000;

    auto provider = std::make_shared<SyntheticQuoteProvider>(config);
    const VolatilitySurfaceService service(provider, breaker, config);
    const SurfaceSnapshot snapshot = service.fetchSurface(today);

    std::cout << "\n" << snapshot.currencyPair << " surface as of " << boost::gregorian::to_simple_string(today) << std::endl;
    for (const auto& quote : snapshot.quotes) {
        std::cout << "  " << std::setw(4) << quote.quote.tenorLabel << " (" << std::setw(3) << quote.quote.tenorDays
                  << "d)  " << QuoteValidator::formatQuality(quote.quality) << std::endl;
    }
    std::cout << "Overall quality: " << snapshot.quality.overallScore << "% ("
              << snapshot.quality.completeRecords << "/" << snapshot.quality.totalRecords << " complete)" << std::endl;
    std::cout << "Circuit breaker: " << CircuitBreaker::stateToString(snapshot.breaker.state) << std::endl;

    // ============================================================================
    // Interpolated smile at 45 days, priced off the surface
    // ============================================================================
    const SurfaceInterpolator interpolator(snapshot.surfacePoints());
    const double days = 45.0;
    std::cout << "\nATM vol at " << days << "d: " << interpolator.atmVolatility(days) << "%" << std::endl;
    for (double strike : {1.12, 1.15, 1.1742, 1.20, 1.23}) {
        const double vol = interpolator.volatilityAt(strike, request.spot, days);
        OptionRequest smileRequest = request;
        smileRequest.strike = strike;
        smileRequest.timeToExpiryYears = days / 365.0;
        smileRequest.volatilityPct = vol;
        smileRequest.optionType = Option::Type::Call;
        smileRequest.notional = 1000000.0;
        const OptionResult result = GarmanKohlhagen::price(smileRequest);
        std::cout << "  K=" << strike << "  vol=" << vol << "%  premium=" << result.premium
                  << " USD  delta=" << result.deltaPercent << "%" << std::endl;
    }

    // 3M vanilla contract off the interpolated ATM
    const Calendar calendar;
    const FxVanillaOption vanilla(Option::Type::Put, "EURUSD", 1.16, calendar.expiryDate(today, "3M"), 1000000.0);
    const double vanillaDays = Calendar::dayCount(today, vanilla.expiry());
    const FxMarketData market {request.spot, request.domesticRatePct, request.foreignRatePct,
                               interpolator.volatilityAt(vanilla.strike(), request.spot, vanillaDays)};
    printResult("\n" + vanilla.currencyPair() + " " + boost::gregorian::to_simple_string(vanilla.expiry())
                + " 1.1600 put, 1M notional", GarmanKohlhagen::price(vanilla, market, today));

    return 0;
}
