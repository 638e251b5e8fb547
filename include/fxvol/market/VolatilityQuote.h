#ifndef FXVOL_VOLATILITYQUOTE_H
#define FXVOL_VOLATILITYQUOTE_H

#include <array>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * Market data model for one tenor of an FX implied-volatility surface.
 * All quotes are in volatility points (%). An empty optional means the provider
 * returned nothing for the field; it is never the same thing as 0.
 */

// Market-convention delta buckets for risk reversals and butterflies
enum class DeltaBucket { D5, D10, D15, D25, D35 };

inline constexpr std::array<DeltaBucket, 5> ALL_DELTA_BUCKETS = {
    DeltaBucket::D5, DeltaBucket::D10, DeltaBucket::D15, DeltaBucket::D25, DeltaBucket::D35};

int deltaValue(DeltaBucket bucket);                       // D25 -> 25

struct BidAsk {
    std::optional<double> bid;
    std::optional<double> ask;

    bool complete() const { return bid && ask; }
    std::optional<double> mid() const;
};

struct VolatilityQuote {
    std::string tenorLabel;   // "1M", "ON", ...
    int tenorDays = 0;
    BidAsk atm;
    std::array<BidAsk, 5> riskReversals; // indexed by DeltaBucket
    std::array<BidAsk, 5> butterflies;   // indexed by DeltaBucket

    BidAsk& riskReversal(DeltaBucket bucket) { return riskReversals[static_cast<size_t>(bucket)]; }
    const BidAsk& riskReversal(DeltaBucket bucket) const { return riskReversals[static_cast<size_t>(bucket)]; }
    BidAsk& butterfly(DeltaBucket bucket) { return butterflies[static_cast<size_t>(bucket)]; }
    const BidAsk& butterfly(DeltaBucket bucket) const { return butterflies[static_cast<size_t>(bucket)]; }

    /**
     * Visit every quote value field with its canonical name
     * ("atm_bid", "atm_ask", "rr_5d_bid", ..., "bf_35d_ask") - 22 fields in total.
     */
    void forEachField(const std::function<void(const std::string&, const std::optional<double>&)>& visitor) const;

    static constexpr int FIELD_COUNT = 2 + 5 * 4;
};

/**
 * Reduced per-tenor view used by the surface interpolator (mid quotes, %).
 * rr25d / bf25d are empty when the tenor has no two-sided 25-delta quote.
 */
struct SurfacePoint {
    int tenorDays = 0;
    double atm = 0.0;
    std::optional<double> rr25d;
    std::optional<double> bf25d;
};

/**
 * Raw record as returned by the quote provider for one security
 * (fields keyed by provider field name, e.g. "PX_BID", "PX_ASK", "PX_LAST").
 */
struct SecurityData {
    std::string securityId;
    std::map<std::string, std::optional<double>> fields;
    bool success = false;
    std::optional<std::string> error;

    std::optional<double> field(const std::string& name) const;
    bool hasField(const std::string& name) const;
};

#endif //FXVOL_VOLATILITYQUOTE_H
