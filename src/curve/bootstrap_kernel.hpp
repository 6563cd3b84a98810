#pragma once

/// @file src/curve/bootstrap_kernel.hpp
/// @brief Par → zero recursion shared by the bond and swap bootstrappers.
///
/// Works entirely in decimal rates. The caller converts the curve's unit on
/// the way in and out, and turns a `KernelFailure` into an `Omission`.

#include "rvcurve/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace rvcurve::curve::detail {

struct KernelFailure {
    double      tenor;
    std::string reason;
};

struct KernelResult {
    std::vector<double>          zeros;    ///< Decimal, one per solved tenor
    std::optional<KernelFailure> failure;  ///< Set on the first unsolvable tenor
};

/// Bootstrap decimal par rates on `tenors` into decimal zero rates.
///
/// Each instrument is priced at `notional`. The first instrument is always
/// treated as a single zero-coupon flow; later ones use the coupon schedule
/// from `par_schedule`. Coupon dates before the already-solved grid are
/// looked up under `alignment`.
[[nodiscard]] KernelResult
bootstrap_par_rates(std::span<const double> tenors,
                    std::span<const double> par_rates,
                    Frequency frequency,
                    Compounding compounding,
                    Alignment alignment,
                    double notional);

} // namespace rvcurve::curve::detail
