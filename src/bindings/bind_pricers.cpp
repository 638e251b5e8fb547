// bindings for GarmanKohlhagen and the normal CDF
#include "bindings_common.h"
#include <fxvol/pricers/GarmanKohlhagen.h>
#include <fxvol/market/FinancialInstrument.h>
#include <fxvol/utils/Utils.h>

void bind_pricers(py::module_ &m)
{
    // Option type enum
    py::enum_<Option::Type>(m, "OptionType", "Option type enumeration")
        .value("Call", Option::Type::Call)
        .value("Put", Option::Type::Put)
        .export_values();

    py::class_<OptionRequest>(m, "OptionRequest", "Garman-Kohlhagen inputs (rates and vol in percent)")
        .def(py::init([](double spot, double strike, double t, double rd, double rf, double vol,
                         Option::Type type, double notional) {
                 return OptionRequest{spot, strike, t, rd, rf, vol, type, notional};
             }),
             py::arg("spot"), py::arg("strike"), py::arg("time_to_expiry_years"),
             py::arg("domestic_rate_pct"), py::arg("foreign_rate_pct"), py::arg("volatility_pct"),
             py::arg("option_type") = Option::Type::Call, py::arg("notional") = 1.0)
        .def_readwrite("spot", &OptionRequest::spot)
        .def_readwrite("strike", &OptionRequest::strike)
        .def_readwrite("time_to_expiry_years", &OptionRequest::timeToExpiryYears)
        .def_readwrite("domestic_rate_pct", &OptionRequest::domesticRatePct)
        .def_readwrite("foreign_rate_pct", &OptionRequest::foreignRatePct)
        .def_readwrite("volatility_pct", &OptionRequest::volatilityPct)
        .def_readwrite("option_type", &OptionRequest::optionType)
        .def_readwrite("notional", &OptionRequest::notional);

    py::class_<OptionResult>(m, "OptionResult", "Premium and Greeks")
        .def_readonly("premium", &OptionResult::premium)
        .def_readonly("premium_percent_of_spot", &OptionResult::premiumPercentOfSpot)
        .def_readonly("delta_percent", &OptionResult::deltaPercent)
        .def_readonly("delta_notional", &OptionResult::deltaNotional)
        .def_readonly("gamma_per_1pct_spot", &OptionResult::gammaPer1PctSpot)
        .def_readonly("gamma_notional", &OptionResult::gammaNotional)
        .def_readonly("vega_per_1pct_vol", &OptionResult::vegaPer1PctVol)
        .def_readonly("vega_notional", &OptionResult::vegaNotional)
        .def_readonly("theta_per_day", &OptionResult::thetaPerDay)
        .def_readonly("theta_notional", &OptionResult::thetaNotional)
        .def_readonly("rho_per_1pct_rate", &OptionResult::rhoPer1PctRate)
        .def_readonly("rho_notional", &OptionResult::rhoNotional)
        .def_readonly("rho_foreign_per_1pct_rate", &OptionResult::rhoForeignPer1PctRate)
        .def_readonly("rho_foreign_notional", &OptionResult::rhoForeignNotional)
        .def_readonly("forward", &OptionResult::forward)
        .def_readonly("intrinsic_value", &OptionResult::intrinsicValue)
        .def_readonly("time_value", &OptionResult::timeValue)
        .def_readonly("d1", &OptionResult::d1)
        .def_readonly("d2", &OptionResult::d2);

    // explicit function pointer cast for the overloaded price()
    py::class_<GarmanKohlhagen>(m, "GarmanKohlhagen")
        .def_static("price",
                    static_cast<OptionResult (*)(const OptionRequest&)>(&GarmanKohlhagen::price),
                    py::arg("request"), "Premium and Greeks of a European FX vanilla")
        .def_static("forward_rate", &GarmanKohlhagen::forwardRate,
                    py::arg("spot"), py::arg("time_to_expiry_years"),
                    py::arg("domestic_rate_pct"), py::arg("foreign_rate_pct"))
        .def_static("strike_from_delta", &GarmanKohlhagen::strikeFromDelta,
                    py::arg("target_delta"), py::arg("spot"), py::arg("time_to_expiry_years"),
                    py::arg("domestic_rate_pct"), py::arg("foreign_rate_pct"), py::arg("volatility_pct"),
                    py::arg("option_type"), py::arg("tol") = 1e-10, py::arg("max_iter") = 100);

    m.def("norm_cdf", &Utils::stdNormCdf, py::arg("x"), "Standard normal CDF (Abramowitz-Stegun)");
}
