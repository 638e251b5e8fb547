#ifndef FXVOL_QUOTEVALIDATOR_H
#define FXVOL_QUOTEVALIDATOR_H

#include <fxvol/market/VolatilityQuote.h>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

using Timestamp = std::chrono::system_clock::time_point;

struct QualityMetrics {
    int totalFields = 0;
    int validFields = 0;
    int nullFields = 0;
    int completenessScore = 0;          // round(100 * validFields / totalFields)
    std::vector<std::string> warnings;
    bool isStale = false;
    Timestamp timestamp{};
    Timestamp lastUpdate{};
};

struct ValidatedQuote {
    VolatilityQuote quote;
    QualityMetrics quality;
    bool isComplete = false;            // completeness >= minimum AND both ATM sides present
    std::vector<std::string> missingFields;
};

// ---- options ----

struct ValidationOptions {
    std::chrono::milliseconds staleAfter{5 * 60 * 1000};
    int minCompletenessScore = 70;
    double wideSpreadPercent = 10.0;     // spread / mid, in %
    double minAtmVolPct = 0.1;           // ATM mids outside [min, max] are flagged
    double maxAtmVolPct = 200.0;
    std::optional<Timestamp> lastUpdate; // provider update time; defaults to the snapshot timestamp
};

// ---- result structs ----

struct SecurityBatchSummary {
    int totalRequested = 0;
    int successful = 0;
    int failed = 0;
    int partialData = 0;   // successful but without PX_LAST or a full PX_BID/PX_ASK pair
};

struct SecurityBatchValidation {
    std::vector<SecurityData> valid;     // includes partially-filled records
    std::vector<SecurityData> invalid;
    SecurityBatchSummary summary;
};

struct QualitySummary {
    int overallScore = 0;
    int completeRecords = 0;
    int totalRecords = 0;
    double averageCompleteness = 0.0;
    int staleRecords = 0;
    std::vector<std::string> criticalWarnings;
};

enum class QualityBand { Good, Fair, Poor, Bad };

/**
 * QuoteValidator - completeness and consistency scoring of raw volatility quotes
 * Pure functions; warnings are data, nothing here throws on bad market data.
 */
class QuoteValidator
{
public:
    static ValidatedQuote validate(const VolatilityQuote& quote,
                                   Timestamp timestamp = std::chrono::system_clock::now(),
                                   const ValidationOptions& opts = {});

    // Successful / failed / partially-filled classification of provider records (reporting only)
    static SecurityBatchValidation validateBatch(const std::vector<SecurityData>& records);

    /**
     * Sort by tenor and fill a missing ATM bid/ask on interior points with the average of
     * the two neighbours (both must be quoted). Endpoints are never filled.
     */
    static std::vector<ValidatedQuote> fillMissingAtm(std::vector<ValidatedQuote> quotes);

    static QualitySummary qualitySummary(const std::vector<ValidatedQuote>& quotes);

    // Mid-priced ATM / 25d RR / 25d BF, sorted by tenor; quotes without an ATM mid are skipped
    static std::vector<SurfacePoint> toSurfacePoints(const std::vector<ValidatedQuote>& quotes);

    // "85% complete • STALE • 2 warnings"
    static std::string formatQuality(const QualityMetrics& quality);
    static QualityBand qualityBand(int score);

private:
    QuoteValidator() = delete;
};

#endif //FXVOL_QUOTEVALIDATOR_H
