/// @file src/shape/two_leg_spread.cpp
/// @brief Two-leg slope metrics (2s5s, 2s10s, 5s30s, ...).

#include "rvcurve/shape.hpp"

#include <fmt/format.h>

namespace rvcurve::shape {

std::vector<TenorPair> default_tenor_pairs() {
    return {
        {"2s5s", 2.0, 5.0},
        {"2s10s", 2.0, 10.0},
        {"5s30s", 5.0, 30.0},
    };
}

std::string ShapeMetric::to_string() const {
    return fmt::format("{} {}: {:+.2f} bp", curve, name, value_bp);
}

// ─── TwoLegSpreadAnalyzer::analyze ────────────────────────────────────────────

ShapeReport TwoLegSpreadAnalyzer::analyze(const curve::YieldCurve& curve,
                                          std::span<const TenorPair> pairs,
                                          Alignment alignment) {
    ShapeReport report;
    report.metrics.reserve(pairs.size());

    for (const auto& pair : pairs) {
        const auto r_short = curve::GridInterpolator::rate(curve, pair.short_tenor, alignment);
        const auto r_long  = curve::GridInterpolator::rate(curve, pair.long_tenor, alignment);

        if (!r_short || !r_long) {
            const double missing = r_short ? pair.long_tenor : pair.short_tenor;
            report.omissions.push_back(Omission{
                .kind    = ErrorKind::OutOfRangeInterpolation,
                .subject = curve.identifier(),
                .tenor   = missing,
                .reason  = fmt::format("{}: {} not on the {} curve", pair.name,
                                       format_tenor(missing), curve.identifier()),
            });
            continue;
        }

        report.metrics.push_back(ShapeMetric{
            .name     = pair.name,
            .curve    = curve.identifier(),
            .tenors   = {pair.short_tenor, pair.long_tenor},
            .value_bp = (*r_long - *r_short) * bp_factor(curve.unit()),
        });
    }
    return report;
}

} // namespace rvcurve::shape
