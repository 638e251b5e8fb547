// pybind11 module entry point
#include "bindings_common.h"

PYBIND11_MODULE(_core, m)
{
    m.doc() = R"pbdoc(
        fxvol Python Bindings
        ---------------------

        Python interface to the fxvol FX-options analytics library.
        Provides access to:
        - Garman-Kohlhagen pricing and Greeks
        - Volatility quote validation and quality scoring
        - Volatility surface interpolation (term structure + 25-delta smile)
        - FX business-day calendar

        Example:
            import fxvol

            req = fxvol.OptionRequest(spot=1.1742, strike=1.10, time_to_expiry_years=0.0833,
                                      domestic_rate_pct=4.96, foreign_rate_pct=1.90,
                                      volatility_pct=7.34, option_type=fxvol.OptionType.Call)
            res = fxvol.GarmanKohlhagen.price(req)

            interp = fxvol.SurfaceInterpolator([fxvol.SurfacePoint(30, 7.0), fxvol.SurfacePoint(90, 7.5)])
            vol = interp.volatility_at(strike=1.20, spot=1.1742, days=60)
    )pbdoc";

    bind_market(m);
    bind_pricers(m);

    m.attr("__version__") = "0.1.0";
}
