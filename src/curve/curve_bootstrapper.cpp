/// @file src/curve/curve_bootstrapper.cpp
/// @brief Government bond par curve → zero curve.

#include "rvcurve/curve.hpp"

#include "bootstrap_kernel.hpp"
#include "discounting.hpp"

#include <cctype>

namespace rvcurve::curve {

// ─── CurveBootstrapper::bootstrap ─────────────────────────────────────────────

Outcome<YieldCurve>
CurveBootstrapper::bootstrap(const YieldCurve& par_curve,
                             const BootstrapConfig& config) {
    if (par_curve.kind() != CurveKind::Par) {
        return Outcome<YieldCurve>::fail(Omission{
            .kind    = ErrorKind::InvalidInput,
            .subject = par_curve.identifier(),
            .reason  = "bootstrap input is already a zero curve",
        });
    }

    const auto par_decimal = par_curve.decimal_rates();
    const auto kernel = detail::bootstrap_par_rates(
        par_curve.tenors(), par_decimal, config.frequency, config.compounding,
        config.alignment, constants::PAR_VALUE);

    if (kernel.failure) {
        return Outcome<YieldCurve>::fail(Omission{
            .kind    = ErrorKind::CurveBootstrapFailure,
            .subject = par_curve.identifier(),
            .tenor   = kernel.failure->tenor,
            .reason  = kernel.failure->reason,
        });
    }

    CurveDefinition def = par_curve.definition();
    def.kind        = CurveKind::Zero;
    def.compounding = config.compounding;
    def.frequency   = config.frequency;
    for (std::size_t i = 0; i < def.rates.size(); ++i) {
        def.rates[i] = convert_rate(kernel.zeros[i], RateUnit::Decimal, def.unit);
    }

    auto zero = YieldCurve::make(std::move(def));
    if (!zero) {
        return Outcome<YieldCurve>::fail(Omission{
            .kind    = ErrorKind::CurveBootstrapFailure,
            .subject = par_curve.identifier(),
            .reason  = "bootstrapped zero rates are not finite",
        });
    }
    return Outcome<YieldCurve>::success(std::move(*zero));
}

// ─── CurveBootstrapper::instrument_schedule ───────────────────────────────────

std::optional<CashflowSchedule>
CurveBootstrapper::instrument_schedule(const YieldCurve& par_curve,
                                       std::size_t index,
                                       const BootstrapConfig& config) {
    if (index >= par_curve.size()) {
        return std::nullopt;
    }
    const double par = convert_rate(par_curve.rates()[index], par_curve.unit(),
                                    RateUnit::Decimal);
    return detail::par_schedule(par_curve.tenors()[index], par, config.frequency,
                                config.compounding, constants::PAR_VALUE, index == 0);
}

// ─── SwapConventions ──────────────────────────────────────────────────────────

SwapConventions SwapConventions::g10_defaults() {
    SwapConventions conventions;
    for (const char* ccy : {"EUR", "SEK"}) {
        conventions.set(ccy, SwapLegConvention{
            .fixed_frequency = Frequency::Annual,
            .compounding     = Compounding::Continuous,
        });
    }
    for (const char* ccy : {"USD", "GBP", "AUD", "CAD", "JPY", "NZD"}) {
        conventions.set(ccy, SwapLegConvention{
            .fixed_frequency = Frequency::Semiannual,
            .compounding     = Compounding::Continuous,
        });
    }
    return conventions;
}

void SwapConventions::set(std::string currency, SwapLegConvention convention) {
    for (char& c : currency) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    table_[std::move(currency)] = convention;
}

std::optional<SwapLegConvention>
SwapConventions::find(std::string_view currency) const noexcept {
    const auto it = table_.find(currency);
    if (it == table_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace rvcurve::curve
