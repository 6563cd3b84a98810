#pragma once

/// @file src/curve/solver1d.hpp
/// @brief Bracketed secant root-finder used by the bootstrap fallback path.

#include <cmath>
#include <cstddef>
#include <optional>

namespace rvcurve::curve::detail {

/// Solve f(x) = 0 for x ∈ [a, b] by secant steps kept inside a shrinking
/// bracket; a step leaving the bracket is replaced by bisection.
///
/// # Returns
/// The root, or `nullopt` if f(a) and f(b) share a sign, f is non-finite
/// anywhere it is evaluated, or `max_iterations` is exhausted.
template <typename F>
[[nodiscard]] std::optional<double>
solve_bracketed(F&& f, double a, double b, double x_tolerance,
                std::size_t max_iterations) noexcept {
    double fa = f(a);
    double fb = f(b);
    if (!std::isfinite(fa) || !std::isfinite(fb)) return std::nullopt;
    if (fa == 0.0) return a;
    if (fb == 0.0) return b;
    if (fa * fb > 0.0) return std::nullopt;

    double x1 = a;
    double y1 = fa;
    double s  = -y1 * (b - a) / (fb - fa);

    for (std::size_t iter = 0; iter < max_iterations; ++iter) {
        if (std::abs(s) <= x_tolerance) {
            return x1;
        }

        const double x0 = x1;
        const double y0 = y1;

        x1 = x0 + s;
        if (x1 <= a || x1 >= b) {
            x1 = 0.5 * (a + b);
        }
        y1 = f(x1);
        if (!std::isfinite(y1)) return std::nullopt;
        if (y1 == 0.0) return x1;

        // Shrink the bracket around the sign change.
        if (fa * y1 > 0.0) {
            a  = x1;
            fa = y1;
        } else {
            b  = x1;
            fb = y1;
        }

        const double slope = (y1 - y0) / (x1 - x0);
        if (!std::isfinite(slope) || slope == 0.0) {
            s = 0.5 * (a + b) - x1;
        } else {
            s = -y1 / slope;
        }

        if (b - a <= x_tolerance) {
            return x1;
        }
    }
    return std::nullopt;
}

} // namespace rvcurve::curve::detail
