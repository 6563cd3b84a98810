/// @file src/shape/fly_calculator.cpp
/// @brief Butterfly metrics: 2·mid − short − long.

#include "rvcurve/shape.hpp"

#include <fmt/format.h>

namespace rvcurve::shape {

std::vector<FlyTriple> default_fly_triples() {
    return {
        {"2s5s10s", 2.0, 5.0, 10.0},
    };
}

// ─── FlyCalculator::fly ───────────────────────────────────────────────────────

Outcome<ShapeMetric> FlyCalculator::fly(const curve::YieldCurve& curve,
                                        const FlyTriple& triple,
                                        Alignment alignment) {
    const double legs[3] = {triple.short_tenor, triple.mid_tenor, triple.long_tenor};
    double rates[3] = {};

    for (int k = 0; k < 3; ++k) {
        const auto r = curve::GridInterpolator::rate(curve, legs[k], alignment);
        if (!r) {
            return Outcome<ShapeMetric>::fail(Omission{
                .kind    = ErrorKind::OutOfRangeInterpolation,
                .subject = curve.identifier(),
                .tenor   = legs[k],
                .reason  = fmt::format("{}: {} not on the {} curve", triple.name,
                                       format_tenor(legs[k]), curve.identifier()),
            });
        }
        rates[k] = *r;
    }

    return Outcome<ShapeMetric>::success(ShapeMetric{
        .name     = triple.name,
        .curve    = curve.identifier(),
        .tenors   = {legs[0], legs[1], legs[2]},
        .value_bp = fly_bp(rates[0], rates[1], rates[2], curve.unit()),
    });
}

// ─── FlyCalculator::analyze ───────────────────────────────────────────────────

ShapeReport FlyCalculator::analyze(const curve::YieldCurve& curve,
                                   std::span<const FlyTriple> triples,
                                   Alignment alignment) {
    ShapeReport report;
    for (const auto& triple : triples) {
        auto outcome = fly(curve, triple, alignment);
        if (outcome.ok()) {
            report.metrics.push_back(std::move(*outcome.value));
        } else {
            report.omissions.push_back(std::move(*outcome.failure));
        }
    }
    return report;
}

} // namespace rvcurve::shape
