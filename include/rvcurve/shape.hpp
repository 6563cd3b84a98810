#pragma once

/// @file include/rvcurve/shape.hpp
/// @brief Curve-shape metrics: two-leg slopes and butterflies.
///
/// # Module: Shape
///
/// ## Responsibility
/// Summarise the slope and curvature of a single curve in basis points.
///
/// ## Sign Conventions
/// - Slope (`2s10s` etc.): rate(long) − rate(short). Positive for an
///   upward-sloping curve.
/// - Fly: 2·rate(mid) − rate(short) − rate(long). Positive means the belly
///   yields more than the average of the wings, i.e. the belly is cheap.
///
/// ## Guarantees
/// - A metric whose tenors cannot be priced under the active alignment is
///   omitted with a reason, never reported as zero
/// - `fly_bp(r1, r2, r3)` is exactly `(2·r2 − r1 − r3) · bp_factor`

#include "rvcurve/curve.hpp"
#include "rvcurve/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace rvcurve::shape {

// ─── Definitions ──────────────────────────────────────────────────────────────

struct TenorPair {
    std::string name;         ///< e.g. "2s10s"
    double      short_tenor;  ///< Years
    double      long_tenor;   ///< Years
};

struct FlyTriple {
    std::string name;         ///< e.g. "2s5s10s"
    double      short_tenor;
    double      mid_tenor;
    double      long_tenor;
};

/// 2s5s, 2s10s, 5s30s.
[[nodiscard]] std::vector<TenorPair> default_tenor_pairs();

/// 2s5s10s.
[[nodiscard]] std::vector<FlyTriple> default_fly_triples();

// ─── ShapeMetric ──────────────────────────────────────────────────────────────

/// Named slope or fly with its constituent tenors.
struct ShapeMetric {
    std::string         name;
    std::string         curve;     ///< Identifier of the source curve
    std::vector<double> tenors;    ///< Constituent tenors, ascending
    double              value_bp;

    [[nodiscard]] std::string to_string() const;
};

struct ShapeReport {
    std::vector<ShapeMetric> metrics;
    std::vector<Omission>    omissions;
};

// ─── TwoLegSpreadAnalyzer ─────────────────────────────────────────────────────

class TwoLegSpreadAnalyzer {
public:
    TwoLegSpreadAnalyzer() = delete;

    /// One metric per pair: rate(long) − rate(short) in bp.
    /// Pairs with an unrecoverable tenor are omitted with a reason.
    [[nodiscard]] static ShapeReport
    analyze(const curve::YieldCurve& curve,
            std::span<const TenorPair> pairs,
            Alignment alignment = Alignment::Strict);
};

// ─── FlyCalculator ────────────────────────────────────────────────────────────

class FlyCalculator {
public:
    FlyCalculator() = delete;

    /// Butterfly from three literal rates quoted in `unit`.
    [[nodiscard]] static double
    fly_bp(double r_short, double r_mid, double r_long, RateUnit unit) noexcept {
        return (2.0 * r_mid - r_short - r_long) * bp_factor(unit);
    }

    /// Butterfly over `triple` on `curve`.
    [[nodiscard]] static Outcome<ShapeMetric>
    fly(const curve::YieldCurve& curve,
        const FlyTriple& triple,
        Alignment alignment = Alignment::Strict);

    /// Every triple; unpriceable ones are omitted with a reason.
    [[nodiscard]] static ShapeReport
    analyze(const curve::YieldCurve& curve,
            std::span<const FlyTriple> triples,
            Alignment alignment = Alignment::Strict);
};

} // namespace rvcurve::shape
