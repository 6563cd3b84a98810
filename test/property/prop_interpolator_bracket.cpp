/**
 * @file  prop_interpolator_bracket.cpp
 * @brief Property: an interpolated rate lies between its two neighbours, and a
 *        grid tenor returns the stored rate unchanged.
 *
 *   RC_PARAMS="max_success=10000" ./prop_interpolator_bracket
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>
#include <vector>

#include "rvcurve/curve.hpp"

using namespace rvcurve;
using namespace rvcurve::curve;

namespace {

YieldCurve random_curve() {
    const std::vector<double> tenors{1.0, 2.0, 5.0, 10.0, 30.0};
    std::vector<double> rates;
    for (std::size_t i = 0; i < tenors.size(); ++i) {
        rates.push_back(*rc::gen::inRange(-100, 1001) / 100.0);
    }
    return *YieldCurve::make(CurveDefinition{
        .identifier = "Prop", .tenors = tenors, .rates = rates});
}

} // namespace

int main() {
    // ── Property 1: interior rates are bracketed ─────────────────────────────
    rc::check(
        "interpolator_bracket: min(r_lo, r_hi) <= r(t) <= max(r_lo, r_hi)",
        []() {
            const auto curve = random_curve();
            const int    step = *rc::gen::inRange(0, 2901);
            const double t    = 1.0 + step / 100.0;

            const auto r = GridInterpolator::rate(curve, t, Alignment::Strict);
            RC_ASSERT(r.has_value());

            const auto tenors = curve.tenors();
            const auto rates  = curve.rates();
            const auto hi = static_cast<std::size_t>(
                std::lower_bound(tenors.begin(), tenors.end(), t) - tenors.begin());
            const std::size_t lo = hi == 0 ? 0 : hi - 1;
            const std::size_t up = std::min(hi, tenors.size() - 1);

            const double r_min = std::min(rates[lo], rates[up]);
            const double r_max = std::max(rates[lo], rates[up]);
            RC_ASSERT(*r >= r_min - 1e-12);
            RC_ASSERT(*r <= r_max + 1e-12);
        }
    );

    // ── Property 2: grid tenors are returned exactly ─────────────────────────
    rc::check(
        "interpolator_bracket: rate(grid tenor) == stored rate",
        []() {
            const auto curve = random_curve();
            const auto i = static_cast<std::size_t>(*rc::gen::inRange(0, 5));
            const auto alignment = *rc::gen::element(Alignment::Strict, Alignment::Nearest);
            const auto r = GridInterpolator::rate(curve, curve.tenors()[i], alignment);
            RC_ASSERT(r.has_value());
            RC_ASSERT(*r == curve.rates()[i]);
        }
    );

    // ── Property 3: nearest clamps, strict refuses ───────────────────────────
    rc::check(
        "interpolator_bracket: out-of-range tenors clamp or fail by policy",
        []() {
            const auto curve = random_curve();
            const double beyond = 30.0 + *rc::gen::inRange(1, 1000) / 10.0;
            RC_ASSERT(!GridInterpolator::rate(curve, beyond, Alignment::Strict).has_value());
            RC_ASSERT(*GridInterpolator::rate(curve, beyond, Alignment::Nearest) ==
                      curve.rates().back());
        }
    );

    return 0;
}
