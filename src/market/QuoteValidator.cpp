#include <fxvol/market/QuoteValidator.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace {
    const std::vector<std::string> CRITICAL_FIELDS = {"atm_bid", "atm_ask"};

    std::string formatPercent(double value)
    {
        std::ostringstream os;
        os << std::fixed << std::setprecision(2) << value;
        return os.str();
    }

    void checkCrossed(const BidAsk& quote, const std::string& label, std::vector<std::string>& warnings)
    {
        if (quote.complete() && *quote.bid > *quote.ask) {
            warnings.push_back(label + " bid > ask (crossed quote)");
        }
    }
}

ValidatedQuote QuoteValidator::validate(const VolatilityQuote& quote, Timestamp timestamp, const ValidationOptions& opts)
{
    ValidatedQuote result;
    result.quote = quote;
    QualityMetrics& quality = result.quality;

    std::vector<std::string> nullNames;
    quote.forEachField([&](const std::string& name, const std::optional<double>& value) {
        ++quality.totalFields;
        if (!value) {
            ++quality.nullFields;
            nullNames.push_back(name);
        }
    });
    quality.validFields = quality.totalFields - quality.nullFields;
    quality.completenessScore = static_cast<int>(
        std::lround(100.0 * quality.validFields / quality.totalFields));

    // Critical fields - the only ones gating completeness
    for (const auto& field : CRITICAL_FIELDS) {
        if (std::find(nullNames.begin(), nullNames.end(), field) != nullNames.end()) {
            quality.warnings.push_back("Critical field '" + field + "' is missing");
            result.missingFields.push_back(field);
        }
    }

    // Consistency of the ATM market
    if (quote.atm.complete()) {
        const double bid = *quote.atm.bid;
        const double ask = *quote.atm.ask;
        if (bid > ask) {
            quality.warnings.push_back("ATM bid > ask - possible data error");
        }

        const double midpoint = 0.5 * (bid + ask);
        if (midpoint < opts.minAtmVolPct || midpoint > opts.maxAtmVolPct) {
            quality.warnings.push_back("ATM volatility " + formatPercent(midpoint) + "% outside normal range");
        }
        if (midpoint > 0.0) {
            const double spreadPercentage = (ask - bid) / midpoint * 100.0;
            if (spreadPercentage > opts.wideSpreadPercent) {
                quality.warnings.push_back("Wide bid-ask spread: " + formatPercent(spreadPercentage) + "%");
            }
        }
    }

    for (DeltaBucket bucket : ALL_DELTA_BUCKETS) {
        const std::string d = std::to_string(deltaValue(bucket)) + "d";
        checkCrossed(quote.riskReversal(bucket), "RR " + d, quality.warnings);
        checkCrossed(quote.butterfly(bucket), "BF " + d, quality.warnings);
    }

    quality.timestamp = timestamp;
    quality.lastUpdate = opts.lastUpdate.value_or(timestamp);
    quality.isStale = (timestamp - quality.lastUpdate) > opts.staleAfter;

    result.isComplete = quality.completenessScore >= opts.minCompletenessScore && quote.atm.complete();
    return result;
}

SecurityBatchValidation QuoteValidator::validateBatch(const std::vector<SecurityData>& records)
{
    SecurityBatchValidation result;

    for (const auto& record : records) {
        if (!record.success || record.error) {
            result.invalid.push_back(record);
        } else if (!record.fields.empty()) {
            const bool hasAllFields = record.hasField("PX_LAST") ||
                                      (record.hasField("PX_BID") && record.hasField("PX_ASK"));
            if (!hasAllFields) {
                ++result.summary.partialData; // kept, but tracked
            }
            result.valid.push_back(record);
        } else {
            result.invalid.push_back(record);
        }
    }

    result.summary.totalRequested = static_cast<int>(records.size());
    result.summary.successful = static_cast<int>(result.valid.size());
    result.summary.failed = static_cast<int>(result.invalid.size());
    return result;
}

std::vector<ValidatedQuote> QuoteValidator::fillMissingAtm(std::vector<ValidatedQuote> quotes)
{
    std::stable_sort(quotes.begin(), quotes.end(), [](const ValidatedQuote& a, const ValidatedQuote& b) {
        return a.quote.tenorDays < b.quote.tenorDays;
    });

    for (size_t i = 1; i + 1 < quotes.size(); ++i) {
        BidAsk& current = quotes[i].quote.atm;
        if (current.complete()) {
            continue;
        }
        const BidAsk& prev = quotes[i - 1].quote.atm;
        const BidAsk& next = quotes[i + 1].quote.atm;

        if (!current.bid && prev.bid && next.bid) {
            current.bid = 0.5 * (*prev.bid + *next.bid);
            quotes[i].quality.warnings.push_back("ATM bid interpolated");
        }
        if (!current.ask && prev.ask && next.ask) {
            current.ask = 0.5 * (*prev.ask + *next.ask);
            quotes[i].quality.warnings.push_back("ATM ask interpolated");
        }
    }
    return quotes;
}

QualitySummary QuoteValidator::qualitySummary(const std::vector<ValidatedQuote>& quotes)
{
    QualitySummary summary;
    summary.totalRecords = static_cast<int>(quotes.size());
    if (quotes.empty()) {
        return summary;
    }

    double completenessSum = 0.0;
    std::set<std::string> seen;
    for (const auto& q : quotes) {
        if (q.isComplete) ++summary.completeRecords;
        if (q.quality.isStale) ++summary.staleRecords;
        completenessSum += q.quality.completenessScore;

        for (const auto& warning : q.quality.warnings) {
            const bool critical = warning.find("Critical") != std::string::npos ||
                                  warning.find("error") != std::string::npos;
            if (critical && seen.insert(warning).second) {
                summary.criticalWarnings.push_back(warning);
            }
        }
    }

    const double total = static_cast<double>(summary.totalRecords);
    summary.averageCompleteness = completenessSum / total;

    // weighted: completeness 40%, freshness 30%, accuracy 30%
    const double completeScore = summary.completeRecords / total * 100.0;
    const double freshnessScore = (summary.totalRecords - summary.staleRecords) / total * 100.0;
    const double accuracyScore = std::max(0.0, 100.0 - 20.0 * static_cast<double>(summary.criticalWarnings.size()));

    summary.overallScore = static_cast<int>(std::lround(
        completeScore * 0.4 + freshnessScore * 0.3 + accuracyScore * 0.3));
    return summary;
}

std::vector<SurfacePoint> QuoteValidator::toSurfacePoints(const std::vector<ValidatedQuote>& quotes)
{
    std::vector<SurfacePoint> points;
    points.reserve(quotes.size());
    for (const auto& q : quotes) {
        const auto atm = q.quote.atm.mid();
        if (!atm) {
            continue;
        }
        SurfacePoint point;
        point.tenorDays = q.quote.tenorDays;
        point.atm = *atm;
        point.rr25d = q.quote.riskReversal(DeltaBucket::D25).mid();
        point.bf25d = q.quote.butterfly(DeltaBucket::D25).mid();
        points.push_back(point);
    }
    std::stable_sort(points.begin(), points.end(), [](const SurfacePoint& a, const SurfacePoint& b) {
        return a.tenorDays < b.tenorDays;
    });
    return points;
}

std::string QuoteValidator::formatQuality(const QualityMetrics& quality)
{
    std::string text = std::to_string(quality.completenessScore) + "% complete";
    if (quality.isStale) {
        text += " • STALE";
    }
    if (!quality.warnings.empty()) {
        text += " • " + std::to_string(quality.warnings.size()) + " warnings";
    }
    return text;
}

QualityBand QuoteValidator::qualityBand(int score)
{
    if (score >= 90) return QualityBand::Good;
    if (score >= 70) return QualityBand::Fair;
    if (score >= 50) return QualityBand::Poor;
    return QualityBand::Bad;
}
