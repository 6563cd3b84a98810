#pragma once

/// @file src/curve/discounting.hpp
/// @brief Compounding conversions and par-instrument schedules (internal).
///
/// All rates here are decimal. Public callers go through curve.hpp.

#include "rvcurve/curve.hpp"

#include <optional>

namespace rvcurve::curve::detail {

/// DF(t) for a zero rate under `compounding`.
/// Returns NaN when the compounding base is non-positive (e.g. z ≤ −1 annual).
[[nodiscard]] double discount_factor(double zero, double t,
                                     Compounding compounding) noexcept;

/// Inverse of `discount_factor`. `nullopt` unless df > 0 and t > 0.
[[nodiscard]] std::optional<double>
zero_from_discount(double df, double t, Compounding compounding) noexcept;

/// Cash flows of a par instrument of tenor `tenor` quoting `par_rate`.
///
/// Payment dates run backwards from `tenor` in steps of 1/f while positive,
/// so a tenor that is not a multiple of the period gets a short front stub.
/// Coupons are `notional · par_rate · accrual`; the last flow adds the
/// notional. If `zero_coupon` is set, or only one date exists, the instrument
/// is a single flow of `notional / DF(par_rate, tenor)` so that its zero rate
/// equals its par rate.
[[nodiscard]] CashflowSchedule
par_schedule(double tenor, double par_rate, Frequency frequency,
             Compounding compounding, double notional, bool zero_coupon);

} // namespace rvcurve::curve::detail
