// bindings for quotes, QuoteValidator, SurfaceInterpolator, Calendar
#include "bindings_common.h"
#include <pybind11/chrono.h>
#include <fxvol/market/Calendar.h>
#include <fxvol/market/QuoteValidator.h>
#include <fxvol/market/SurfaceInterpolator.h>
#include <fxvol/market/VolatilityQuote.h>

namespace {
    // dates cross the boundary as (year, month, day)
    boost::gregorian::date toDate(int year, int month, int day)
    {
        return boost::gregorian::date(year, month, day);
    }
}

void bind_market(py::module_ &m)
{
    py::enum_<DeltaBucket>(m, "DeltaBucket", "Market-convention delta buckets")
        .value("D5", DeltaBucket::D5)
        .value("D10", DeltaBucket::D10)
        .value("D15", DeltaBucket::D15)
        .value("D25", DeltaBucket::D25)
        .value("D35", DeltaBucket::D35)
        .export_values();

    py::class_<BidAsk>(m, "BidAsk", "Two-sided quote; None means not quoted")
        .def(py::init<>())
        .def(py::init([](std::optional<double> bid, std::optional<double> ask) { return BidAsk{bid, ask}; }),
             py::arg("bid"), py::arg("ask"))
        .def_readwrite("bid", &BidAsk::bid)
        .def_readwrite("ask", &BidAsk::ask)
        .def("complete", &BidAsk::complete)
        .def("mid", &BidAsk::mid);

    py::class_<VolatilityQuote>(m, "VolatilityQuote", "ATM / risk-reversal / butterfly quotes of one tenor")
        .def(py::init<>())
        .def_readwrite("tenor_label", &VolatilityQuote::tenorLabel)
        .def_readwrite("tenor_days", &VolatilityQuote::tenorDays)
        .def_readwrite("atm", &VolatilityQuote::atm)
        .def("risk_reversal", [](const VolatilityQuote &q, DeltaBucket b) { return q.riskReversal(b); }, py::arg("bucket"))
        .def("set_risk_reversal", [](VolatilityQuote &q, DeltaBucket b, const BidAsk &v) { q.riskReversal(b) = v; },
             py::arg("bucket"), py::arg("quote"))
        .def("butterfly", [](const VolatilityQuote &q, DeltaBucket b) { return q.butterfly(b); }, py::arg("bucket"))
        .def("set_butterfly", [](VolatilityQuote &q, DeltaBucket b, const BidAsk &v) { q.butterfly(b) = v; },
             py::arg("bucket"), py::arg("quote"));

    py::class_<QualityMetrics>(m, "QualityMetrics")
        .def_readonly("total_fields", &QualityMetrics::totalFields)
        .def_readonly("valid_fields", &QualityMetrics::validFields)
        .def_readonly("null_fields", &QualityMetrics::nullFields)
        .def_readonly("completeness_score", &QualityMetrics::completenessScore)
        .def_readonly("warnings", &QualityMetrics::warnings)
        .def_readonly("is_stale", &QualityMetrics::isStale)
        .def("__repr__", &QuoteValidator::formatQuality);

    py::class_<ValidatedQuote>(m, "ValidatedQuote")
        .def_readonly("quote", &ValidatedQuote::quote)
        .def_readonly("quality", &ValidatedQuote::quality)
        .def_readonly("is_complete", &ValidatedQuote::isComplete)
        .def_readonly("missing_fields", &ValidatedQuote::missingFields);

    py::class_<ValidationOptions>(m, "ValidationOptions")
        .def(py::init<>())
        .def_readwrite("stale_after", &ValidationOptions::staleAfter)
        .def_readwrite("min_completeness_score", &ValidationOptions::minCompletenessScore)
        .def_readwrite("wide_spread_percent", &ValidationOptions::wideSpreadPercent)
        .def_readwrite("min_atm_vol_pct", &ValidationOptions::minAtmVolPct)
        .def_readwrite("max_atm_vol_pct", &ValidationOptions::maxAtmVolPct)
        .def_readwrite("last_update", &ValidationOptions::lastUpdate);

    py::class_<QualitySummary>(m, "QualitySummary")
        .def_readonly("overall_score", &QualitySummary::overallScore)
        .def_readonly("complete_records", &QualitySummary::completeRecords)
        .def_readonly("total_records", &QualitySummary::totalRecords)
        .def_readonly("average_completeness", &QualitySummary::averageCompleteness)
        .def_readonly("stale_records", &QualitySummary::staleRecords)
        .def_readonly("critical_warnings", &QualitySummary::criticalWarnings);

    py::class_<QuoteValidator>(m, "QuoteValidator", "Completeness and consistency scoring of volatility quotes")
        .def_static("validate", &QuoteValidator::validate,
                    py::arg("quote"), py::arg("timestamp"), py::arg("options") = ValidationOptions{})
        .def_static("fill_missing_atm", &QuoteValidator::fillMissingAtm, py::arg("quotes"))
        .def_static("quality_summary", &QuoteValidator::qualitySummary, py::arg("quotes"))
        .def_static("to_surface_points", &QuoteValidator::toSurfacePoints, py::arg("quotes"));

    py::class_<SurfacePoint>(m, "SurfacePoint", "Mid ATM / 25d RR / 25d BF of one tenor (vol points)")
        .def(py::init([](int days, double atm, std::optional<double> rr, std::optional<double> bf) {
                 return SurfacePoint{days, atm, rr, bf};
             }),
             py::arg("tenor_days"), py::arg("atm"), py::arg("rr25d") = py::none(), py::arg("bf25d") = py::none())
        .def_readwrite("tenor_days", &SurfacePoint::tenorDays)
        .def_readwrite("atm", &SurfacePoint::atm)
        .def_readwrite("rr25d", &SurfacePoint::rr25d)
        .def_readwrite("bf25d", &SurfacePoint::bf25d);

    py::class_<SurfaceInterpolator>(m, "SurfaceInterpolator",
                                    "Variance-linear term structure with a 25-delta smile blend")
        .def(py::init<std::vector<SurfacePoint>>(), py::arg("surface"))
        .def("atm_volatility", &SurfaceInterpolator::atmVolatility, py::arg("days"))
        .def("volatility_at",
             static_cast<double (SurfaceInterpolator::*)(double, double, double) const>(&SurfaceInterpolator::volatilityAt),
             py::arg("strike"), py::arg("spot"), py::arg("days"))
        .def_static("approximate_delta", &SurfaceInterpolator::approximateDelta,
                    py::arg("strike"), py::arg("spot"), py::arg("atm_vol_pct"), py::arg("days"));

    // Calendar (weekends + 1 Jan / 25 Dec); dates as (year, month, day)
    m.def("tenor_to_days", &Calendar::tenorToDays, py::arg("tenor"), "Nominal day count of a tenor label");
    m.def("is_business_day", [](int y, int mo, int d) { return Calendar().isBusinessDay(toDate(y, mo, d)); },
          py::arg("year"), py::arg("month"), py::arg("day"));
    m.def("expiry_days", [](int y, int mo, int d, const std::string &tenor) {
              const auto trade = toDate(y, mo, d);
              return Calendar::dayCount(trade, Calendar().expiryDate(trade, tenor));
          },
          py::arg("year"), py::arg("month"), py::arg("day"), py::arg("tenor"),
          "Actual days from the trade date to the adjusted expiry of a tenor");
}
