/// @file src/hedge/dv01.cpp
/// @brief Bump-and-reprice DV01 for bonds and par swaps.

#include "rvcurve/hedge.hpp"
#include "rvcurve/constants.hpp"

#include <cmath>

namespace rvcurve::hedge {

namespace {

/// One basis point expressed in `unit`.
[[nodiscard]] double one_bp(RateUnit unit) noexcept {
    return convert_rate(constants::ONE_BP, RateUnit::Decimal, unit);
}

[[nodiscard]] curve::CashflowSchedule bond_schedule(const FixedRateBond& bond) {
    return curve::coupon_schedule(bond.maturity,
                                  convert_rate(bond.coupon_rate, bond.unit, RateUnit::Decimal),
                                  bond.frequency, bond.face);
}

struct SwapLegs {
    double annuity;   ///< Σ α_k · DF(t_k)
    double terminal;  ///< DF(T)
};

/// Fixed-leg annuity and terminal discount factor of a `tenor` swap.
[[nodiscard]] std::optional<SwapLegs>
swap_legs(const curve::YieldCurve& zero_curve, double tenor, Frequency frequency) {
    const auto unit_coupon = curve::coupon_schedule(tenor, 1.0, frequency, 1.0);
    curve::CashflowSchedule bullet{
        .times   = Eigen::VectorXd::Constant(1, tenor),
        .amounts = Eigen::VectorXd::Constant(1, 1.0),
    };

    const auto with_notional = curve::present_value(zero_curve, unit_coupon);
    const auto terminal      = curve::present_value(zero_curve, bullet);
    if (!with_notional || !terminal) {
        return std::nullopt;
    }
    return SwapLegs{.annuity = *with_notional - *terminal, .terminal = *terminal};
}

} // anonymous namespace

// ─── Zero-curve pricing ───────────────────────────────────────────────────────

std::optional<double>
Dv01Calculator::price(const curve::YieldCurve& zero_curve, const FixedRateBond& bond) {
    if (!std::isfinite(bond.maturity) || bond.maturity <= 0.0) {
        return std::nullopt;
    }
    return curve::present_value(zero_curve, bond_schedule(bond));
}

std::optional<double>
Dv01Calculator::bond_dv01(const curve::YieldCurve& zero_curve, const FixedRateBond& bond) {
    const auto base = price(zero_curve, bond);
    if (!base) return std::nullopt;

    const auto bumped = price(zero_curve.shifted(one_bp(zero_curve.unit())), bond);
    if (!bumped) return std::nullopt;

    return std::abs(*bumped - *base);
}

std::optional<Eigen::VectorXd>
Dv01Calculator::key_rate_dv01(const curve::YieldCurve& zero_curve,
                              const FixedRateBond& bond) {
    const auto base = price(zero_curve, bond);
    if (!base) return std::nullopt;

    const double bump = one_bp(zero_curve.unit());
    Eigen::VectorXd out(static_cast<Eigen::Index>(zero_curve.size()));

    for (std::size_t i = 0; i < zero_curve.size(); ++i) {
        const auto bumped_curve = zero_curve.shifted_at(i, bump);
        if (!bumped_curve) return std::nullopt;
        const auto bumped = price(*bumped_curve, bond);
        if (!bumped) return std::nullopt;
        out(static_cast<Eigen::Index>(i)) = *base - *bumped;
    }
    return out;
}

// ─── Flat-yield pricing ───────────────────────────────────────────────────────

double Dv01Calculator::yield_price(const FixedRateBond& bond, double yield) noexcept {
    const double f = static_cast<double>(periods_per_year(bond.frequency));
    const double y = convert_rate(yield, bond.unit, RateUnit::Decimal) / f;
    const double c = convert_rate(bond.coupon_rate, bond.unit, RateUnit::Decimal) * bond.face / f;
    const int    n = static_cast<int>(std::lround(bond.maturity * f));

    if (n <= 0) {
        return bond.face;
    }

    double pv = 0.0;
    for (int k = 1; k <= n; ++k) {
        pv += c / std::pow(1.0 + y, k);
    }
    pv += bond.face / std::pow(1.0 + y, n);
    return pv;
}

double Dv01Calculator::yield_dv01(const FixedRateBond& bond, double yield) noexcept {
    const double p0 = yield_price(bond, yield);
    const double p1 = yield_price(bond, yield + one_bp(bond.unit));
    return std::abs(p1 - p0);
}

// ─── Swaps ────────────────────────────────────────────────────────────────────

std::optional<double>
Dv01Calculator::swap_dv01(const curve::YieldCurve& swap_zero_curve,
                          double tenor,
                          Frequency fixed_frequency) {
    if (!std::isfinite(tenor) || tenor <= 0.0) {
        return std::nullopt;
    }

    const auto base = swap_legs(swap_zero_curve, tenor, fixed_frequency);
    if (!base || base->annuity <= 0.0) {
        return std::nullopt;
    }
    const double par_rate = (1.0 - base->terminal) / base->annuity;

    const auto bumped = swap_legs(swap_zero_curve.shifted(one_bp(swap_zero_curve.unit())),
                                  tenor, fixed_frequency);
    if (!bumped) {
        return std::nullopt;
    }

    // Receiver value: fixed leg plus notional, less the floating leg at par.
    const double v0 = par_rate * base->annuity + base->terminal - 1.0;
    const double v1 = par_rate * bumped->annuity + bumped->terminal - 1.0;
    return std::abs(v1 - v0) * constants::PAR_VALUE;
}

} // namespace rvcurve::hedge
