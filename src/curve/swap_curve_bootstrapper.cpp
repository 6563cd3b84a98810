/// @file src/curve/swap_curve_bootstrapper.cpp
/// @brief Swap par curve → zero curve with per-currency fixed-leg conventions.

#include "rvcurve/curve.hpp"

#include "bootstrap_kernel.hpp"
#include "discounting.hpp"

#include <fmt/format.h>

namespace rvcurve::curve {

namespace {

/// Swaps are bootstrapped per unit notional.
constexpr double SWAP_NOTIONAL = 1.0;

} // anonymous namespace

// ─── SwapCurveBootstrapper::bootstrap ─────────────────────────────────────────

Outcome<YieldCurve>
SwapCurveBootstrapper::bootstrap(const YieldCurve& par_curve,
                                 const SwapConventions& conventions,
                                 Alignment alignment) {
    const auto convention = conventions.find(par_curve.identifier());
    if (!convention) {
        return Outcome<YieldCurve>::fail(Omission{
            .kind    = ErrorKind::CurveBootstrapFailure,
            .subject = par_curve.identifier(),
            .reason  = fmt::format("no fixed-leg convention configured for {}",
                                   par_curve.identifier()),
        });
    }
    if (par_curve.kind() != CurveKind::Par) {
        return Outcome<YieldCurve>::fail(Omission{
            .kind    = ErrorKind::InvalidInput,
            .subject = par_curve.identifier(),
            .reason  = "bootstrap input is already a zero curve",
        });
    }

    const auto par_decimal = par_curve.decimal_rates();
    const auto kernel = detail::bootstrap_par_rates(
        par_curve.tenors(), par_decimal, convention->fixed_frequency,
        convention->compounding, alignment, SWAP_NOTIONAL);

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
    def.compounding = convention->compounding;
    def.frequency   = convention->fixed_frequency;
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

// ─── SwapCurveBootstrapper::fixed_leg_schedule ────────────────────────────────

std::optional<CashflowSchedule>
SwapCurveBootstrapper::fixed_leg_schedule(const YieldCurve& par_curve,
                                          std::size_t index,
                                          const SwapLegConvention& convention) {
    if (index >= par_curve.size()) {
        return std::nullopt;
    }
    const double par = convert_rate(par_curve.rates()[index], par_curve.unit(),
                                    RateUnit::Decimal);
    return detail::par_schedule(par_curve.tenors()[index], par,
                                convention.fixed_frequency, convention.compounding,
                                SWAP_NOTIONAL, index == 0);
}

} // namespace rvcurve::curve
