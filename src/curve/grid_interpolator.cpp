/// @file src/curve/grid_interpolator.cpp
/// @brief Linear-in-tenor rate interpolation with strict/nearest alignment.

#include "rvcurve/curve.hpp"
#include "discounting.hpp"

#include <algorithm>
#include <cmath>

namespace rvcurve::curve {

// ─── find_exact ───────────────────────────────────────────────────────────────

std::optional<std::size_t>
GridInterpolator::find_exact(std::span<const double> tenors, double tenor) noexcept {
    if (!std::isfinite(tenor)) {
        return std::nullopt;
    }
    const auto it = std::lower_bound(tenors.begin(), tenors.end(),
                                     tenor - constants::TENOR_MATCH_TOLERANCE);
    if (it != tenors.end() && std::abs(*it - tenor) <= constants::TENOR_MATCH_TOLERANCE) {
        return static_cast<std::size_t>(it - tenors.begin());
    }
    return std::nullopt;
}

// ─── rate ─────────────────────────────────────────────────────────────────────

std::optional<double>
GridInterpolator::rate(std::span<const double> tenors,
                       std::span<const double> rates,
                       double tenor,
                       Alignment alignment) noexcept {
    if (tenors.empty() || tenors.size() != rates.size() || !std::isfinite(tenor)) {
        return std::nullopt;
    }

    // Grid hit: return the stored value untouched.
    if (const auto idx = find_exact(tenors, tenor)) {
        return rates[*idx];
    }

    if (tenor < tenors.front()) {
        if (alignment == Alignment::Strict) return std::nullopt;
        return rates.front();
    }
    if (tenor > tenors.back()) {
        if (alignment == Alignment::Strict) return std::nullopt;
        return rates.back();
    }

    // tenors.front() < tenor < tenors.back(), so both neighbours exist.
    const auto upper = std::upper_bound(tenors.begin(), tenors.end(), tenor);
    const auto hi    = static_cast<std::size_t>(upper - tenors.begin());
    const auto lo    = hi - 1;

    const double w = (tenor - tenors[lo]) / (tenors[hi] - tenors[lo]);
    return rates[lo] + w * (rates[hi] - rates[lo]);
}

std::optional<double>
GridInterpolator::rate(const YieldCurve& curve, double tenor,
                       Alignment alignment) noexcept {
    return rate(curve.tenors(), curve.rates(), tenor, alignment);
}

// ─── nearest_tenor ────────────────────────────────────────────────────────────

std::optional<double>
GridInterpolator::nearest_tenor(const YieldCurve& curve, double tenor) noexcept {
    if (!std::isfinite(tenor)) {
        return std::nullopt;
    }
    const auto grid = curve.tenors();
    const auto it   = std::lower_bound(grid.begin(), grid.end(), tenor);
    if (it == grid.begin()) return grid.front();
    if (it == grid.end())   return grid.back();

    const double above = *it;
    const double below = *(it - 1);
    return (tenor - below) <= (above - tenor) ? below : above;
}

// ─── present_value ────────────────────────────────────────────────────────────

std::optional<double>
present_value(const YieldCurve& zero_curve,
              const CashflowSchedule& schedule,
              Alignment alignment) {
    const auto compounding = zero_curve.compounding();
    if (zero_curve.kind() != CurveKind::Zero || !compounding) {
        return std::nullopt;
    }
    if (schedule.times.size() != schedule.amounts.size()) {
        return std::nullopt;
    }

    const auto zeros = zero_curve.decimal_rates();
    Eigen::VectorXd dfs(schedule.times.size());
    for (Eigen::Index k = 0; k < schedule.times.size(); ++k) {
        const auto z = GridInterpolator::rate(zero_curve.tenors(), zeros,
                                              schedule.times(k), alignment);
        if (!z) return std::nullopt;
        dfs(k) = detail::discount_factor(*z, schedule.times(k), *compounding);
    }

    const double pv = schedule.amounts.dot(dfs);
    if (!std::isfinite(pv)) {
        return std::nullopt;
    }
    return pv;
}

} // namespace rvcurve::curve
