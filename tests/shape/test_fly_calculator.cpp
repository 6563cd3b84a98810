#include <gtest/gtest.h>
#include "rvcurve/shape.hpp"
#include <vector>

using namespace rvcurve;
using namespace rvcurve::curve;
using namespace rvcurve::shape;

namespace {

YieldCurve make_curve(std::vector<double> tenors, std::vector<double> rates,
                      RateUnit unit = RateUnit::Percent) {
    return *YieldCurve::make(CurveDefinition{
        .identifier = "Italy",
        .unit       = unit,
        .tenors     = std::move(tenors),
        .rates      = std::move(rates),
    });
}

const FlyTriple k2s5s10s{"2s5s10s", 2.0, 5.0, 10.0};

} // namespace

// ─── fly_bp ───────────────────────────────────────────────────────────────────

TEST(Fly_Literal, RichBelly_IsNegative) {
    EXPECT_NEAR(FlyCalculator::fly_bp(2.10, 2.40, 2.80, RateUnit::Percent), -10.0, 1e-9);
}

TEST(Fly_Literal, DecimalUnit_SameBasisPoints) {
    EXPECT_NEAR(FlyCalculator::fly_bp(0.0210, 0.0240, 0.0280, RateUnit::Decimal), -10.0, 1e-9);
}

TEST(Fly_Literal, StraightLine_IsZero) {
    EXPECT_NEAR(FlyCalculator::fly_bp(2.0, 2.5, 3.0, RateUnit::Percent), 0.0, 1e-12);
}

// ─── fly on a curve ───────────────────────────────────────────────────────────

TEST(Fly_Curve, CheapBelly_IsPositive) {
    const auto c = make_curve({2.0, 5.0, 10.0}, {2.0, 2.6, 2.8});
    auto m = FlyCalculator::fly(c, k2s5s10s);
    ASSERT_TRUE(m.ok());
    EXPECT_NEAR(m.value->value_bp, 40.0, 1e-9);
    EXPECT_EQ(m.value->name, "2s5s10s");
    EXPECT_EQ(m.value->curve, "Italy");
    ASSERT_EQ(m.value->tenors.size(), 3u);
    EXPECT_DOUBLE_EQ(m.value->tenors[1], 5.0);
}

TEST(Fly_Curve, MatchesLiteralFormula) {
    const auto c = make_curve({2.0, 5.0, 10.0, 30.0}, {2.10, 2.40, 2.80, 3.10});
    auto m = FlyCalculator::fly(c, k2s5s10s);
    ASSERT_TRUE(m.ok());
    EXPECT_NEAR(m.value->value_bp, -10.0, 1e-9);
}

TEST(Fly_Curve, StrictMissingWing_IsOmittedWithTenor) {
    const auto c = make_curve({2.0, 5.0, 7.0}, {2.10, 2.40, 2.60});
    auto m = FlyCalculator::fly(c, k2s5s10s, Alignment::Strict);
    ASSERT_FALSE(m.ok());
    EXPECT_EQ(m.failure->kind, ErrorKind::OutOfRangeInterpolation);
    EXPECT_DOUBLE_EQ(*m.failure->tenor, 10.0);
}

TEST(Fly_Curve, NearestMissingWing_UsesEndpoint) {
    const auto c = make_curve({2.0, 5.0, 7.0}, {2.10, 2.40, 2.60});
    auto m = FlyCalculator::fly(c, k2s5s10s, Alignment::Nearest);
    ASSERT_TRUE(m.ok());
    EXPECT_NEAR(m.value->value_bp, (2 * 2.40 - 2.10 - 2.60) * 100.0, 1e-9);
}

TEST(Fly_Curve, InteriorTenor_IsInterpolatedUnderStrict) {
    const auto c = make_curve({2.0, 4.0, 6.0, 10.0}, {2.0, 2.4, 2.6, 2.8});
    auto m = FlyCalculator::fly(c, k2s5s10s, Alignment::Strict);
    ASSERT_TRUE(m.ok());
    // 5Y = 2.5
    EXPECT_NEAR(m.value->value_bp, 20.0, 1e-9);
}

// ─── analyze ──────────────────────────────────────────────────────────────────

TEST(Fly_Analyze, SplitsMetricsAndOmissions) {
    const auto c = make_curve({2.0, 5.0, 10.0}, {2.10, 2.40, 2.80});
    const std::vector<FlyTriple> triples{
        k2s5s10s,
        {"5s10s30s", 5.0, 10.0, 30.0},
    };
    const auto report = FlyCalculator::analyze(c, triples);
    ASSERT_EQ(report.metrics.size(), 1u);
    ASSERT_EQ(report.omissions.size(), 1u);
    EXPECT_DOUBLE_EQ(*report.omissions[0].tenor, 30.0);
}

TEST(Fly_Analyze, DefaultTriple_Is2s5s10s) {
    const auto triples = default_fly_triples();
    ASSERT_EQ(triples.size(), 1u);
    EXPECT_EQ(triples[0].name, "2s5s10s");
}
