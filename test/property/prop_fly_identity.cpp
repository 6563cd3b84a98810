/**
 * @file  prop_fly_identity.cpp
 * @brief Property: a butterfly equals the short-to-mid slope minus the
 *        mid-to-long slope, and vanishes on any straight line.
 *
 *   RC_PARAMS="max_success=10000" ./prop_fly_identity
 *
 *   fly = (2·r₂ − r₁ − r₃)·bp = (r₂ − r₁)·bp − (r₃ − r₂)·bp
 */

#include <rapidcheck.h>
#include <cmath>
#include <vector>

#include "rvcurve/shape.hpp"

using namespace rvcurve;
using namespace rvcurve::curve;
using namespace rvcurve::shape;

int main() {
    // ── Property 1: fly = slope(short, mid) − slope(mid, long) ──────────────
    rc::check(
        "fly_identity: fly == 2s5s - 5s10s",
        []() {
            const double r2  = *rc::gen::inRange(-100, 1001) / 100.0;
            const double r5  = *rc::gen::inRange(-100, 1001) / 100.0;
            const double r10 = *rc::gen::inRange(-100, 1001) / 100.0;
            auto curve = YieldCurve::make(CurveDefinition{
                .identifier = "Prop", .tenors = {2.0, 5.0, 10.0}, .rates = {r2, r5, r10}});
            RC_ASSERT(curve.has_value());

            const std::vector<TenorPair> pairs{{"2s5s", 2.0, 5.0}, {"5s10s", 5.0, 10.0}};
            const auto slopes = TwoLegSpreadAnalyzer::analyze(*curve, pairs);
            RC_ASSERT(slopes.metrics.size() == 2u);

            auto fly = FlyCalculator::fly(*curve, FlyTriple{"2s5s10s", 2.0, 5.0, 10.0});
            RC_ASSERT(fly.ok());

            const double expected = slopes.metrics[0].value_bp - slopes.metrics[1].value_bp;
            RC_ASSERT(std::abs(fly.value->value_bp - expected) < 1e-9);
        }
    );

    // ── Property 2: straight line ⇒ zero fly ────────────────────────────────
    rc::check(
        "fly_identity: equally spaced linear rates give a zero fly",
        []() {
            const double base  = *rc::gen::inRange(-100, 801) / 100.0;
            const double slope = *rc::gen::inRange(-50, 51) / 100.0;
            const double fly = FlyCalculator::fly_bp(base, base + slope, base + 2.0 * slope,
                                                     RateUnit::Percent);
            RC_ASSERT(std::abs(fly) < 1e-9);
        }
    );

    return 0;
}
