#include <gtest/gtest.h>
#include "rvcurve/carry.hpp"
#include "rvcurve/constants.hpp"
#include <vector>

using namespace rvcurve;
using namespace rvcurve::curve;
using namespace rvcurve::carry;
using namespace rvcurve::constants;

namespace {

YieldCurve make_curve(std::vector<double> rates, std::int64_t as_of = 0,
                      std::vector<double> tenors = {1.0, 2.0, 5.0, 10.0}) {
    return *YieldCurve::make(CurveDefinition{
        .identifier = "United Kingdom",
        .kind       = CurveKind::Zero,
        .tenors     = std::move(tenors),
        .rates      = std::move(rates),
        .as_of      = as_of,
    });
}

const CarryRollEntry* entry_for(const CarryRollReport& r, double tenor, const std::string& h) {
    for (const auto& e : r.entries) {
        if (e.tenor == tenor && e.horizon == h) return &e;
    }
    return nullptr;
}

const std::vector<Horizon> k3M{{"3M", HORIZON_3M}};

} // namespace

// ─── compute ──────────────────────────────────────────────────────────────────

TEST(CarryRoll_Compute, FlatCurve_NoCarryNoRoll) {
    const auto c = make_curve({3.0, 3.0, 3.0, 3.0});
    const auto report = CarryRollCalculator::compute(c, default_horizons());
    EXPECT_EQ(report.entries.size(), 8u);
    for (const auto& e : report.entries) {
        EXPECT_NEAR(e.roll_bp, 0.0, 1e-9);
        ASSERT_TRUE(e.carry_bp.has_value());
        EXPECT_NEAR(*e.carry_bp, 0.0, 1e-9);
    }
}

TEST(CarryRoll_Compute, UpwardCurve_RollDownIsNegativeYieldChange) {
    const auto c = make_curve({2.0, 2.5, 3.0, 3.5});
    const auto report = CarryRollCalculator::compute(c, k3M);
    const auto* e = entry_for(report, 2.0, "3M");
    ASSERT_NE(e, nullptr);
    // 1.75Y on the curve = 2.375
    EXPECT_NEAR(e->roll_bp, -12.5, 1e-9);
}

TEST(CarryRoll_Compute, DefaultFunding_IsRateAtHorizon) {
    const auto c = make_curve({2.0, 2.5, 3.0, 3.5});
    const auto report = CarryRollCalculator::compute(c, k3M);
    const auto* e = entry_for(report, 2.0, "3M");
    ASSERT_NE(e, nullptr);
    EXPECT_NEAR(*e->carry_bp, (2.5 - 2.0) * 0.25 / 1.75 * 100.0, 1e-9);
}

TEST(CarryRoll_Compute, ExplicitFunding_IsUsed) {
    const auto c = make_curve({2.0, 2.5, 3.0, 3.5});
    const auto report = CarryRollCalculator::compute(c, k3M, CarryConfig{.funding_rate = 1.0});
    const auto* e = entry_for(report, 2.0, "3M");
    ASSERT_NE(e, nullptr);
    EXPECT_NEAR(*e->carry_bp, 1.5 * 0.25 / 1.75 * 100.0, 1e-9);
}

TEST(CarryRoll_Compute, AgedTenorBelowFront_UsesFrontRate) {
    const auto c = make_curve({2.0, 2.5, 3.0, 3.5});
    const auto report = CarryRollCalculator::compute(c, k3M);
    const auto* e = entry_for(report, 1.0, "3M");
    ASSERT_NE(e, nullptr);
    EXPECT_NEAR(e->roll_bp, 0.0, 1e-12);
}

TEST(CarryRoll_Compute, HorizonReachingTenor_KeepsRollDropsCarry) {
    const auto c = make_curve({3.9, 3.7, 3.5}, 0, {0.25, 1.0, 2.0});
    const auto report = CarryRollCalculator::compute(c, default_horizons());
    EXPECT_EQ(report.entries.size(), 6u);

    const auto* bill = entry_for(report, 0.25, "3M");
    ASSERT_NE(bill, nullptr);
    EXPECT_FALSE(bill->carry_bp.has_value());
    // 0Y clamps to the 3M point.
    EXPECT_NEAR(bill->roll_bp, 0.0, 1e-12);

    ASSERT_EQ(report.omissions.size(), 1u);
    EXPECT_EQ(report.omissions[0].kind, ErrorKind::HorizonExceedsTenor);
    EXPECT_DOUBLE_EQ(*report.omissions[0].tenor, 0.25);
}

TEST(CarryRoll_Compute, BillCurve_EveryTenorHasRoll) {
    const std::vector<double> tenors{1.0 / 12.0, 0.25, 0.5, 1.0, 2.0};
    const auto c = make_curve({5.0, 4.9, 4.7, 4.5, 4.2}, 0, tenors);
    const auto report = CarryRollCalculator::compute(c, default_horizons());
    EXPECT_EQ(report.entries.size(), 10u);

    // 1M/1M, 1M/3M and 3M/3M have no carry.
    EXPECT_EQ(report.omissions.size(), 3u);
    for (const auto& o : report.omissions) {
        EXPECT_EQ(o.kind, ErrorKind::HorizonExceedsTenor);
    }

    // 3M aged by 3M clamps to the 1M point: 5.0 - 4.9.
    const auto* e = entry_for(report, 0.25, "3M");
    ASSERT_NE(e, nullptr);
    EXPECT_NEAR(e->roll_bp, 10.0, 1e-9);
    EXPECT_FALSE(e->carry_bp.has_value());

    // 6M aged by 3M lands on the 3M point.
    const auto* six = entry_for(report, 0.5, "3M");
    ASSERT_NE(six, nullptr);
    EXPECT_NEAR(six->roll_bp, 20.0, 1e-9);
    EXPECT_TRUE(six->carry_bp.has_value());

    EXPECT_NE(report.to_string().find("n/a"), std::string::npos);
}

TEST(CarryRoll_Compute, NonPositiveHorizon_IsInvalidInput) {
    const auto c = make_curve({2.0, 2.5, 3.0, 3.5});
    const std::vector<Horizon> bad{{"0M", 0.0}};
    const auto report = CarryRollCalculator::compute(c, bad);
    EXPECT_TRUE(report.entries.empty());
    ASSERT_EQ(report.omissions.size(), 1u);
    EXPECT_EQ(report.omissions[0].kind, ErrorKind::InvalidInput);
}

TEST(CarryRoll_Compute, ToStringNamesCurve) {
    const auto c = make_curve({2.0, 2.5, 3.0, 3.5});
    const auto text = CarryRollCalculator::compute(c, k3M).to_string();
    EXPECT_NE(text.find("United Kingdom"), std::string::npos);
}

// ─── compare_realised ─────────────────────────────────────────────────────────

TEST(CarryRoll_Realised, ParallelMove_ShowsAsSurprise) {
    const std::int64_t quarter = static_cast<std::int64_t>(SECONDS_PER_YEAR / 4.0);
    const auto prev = make_curve({2.0, 2.5, 3.0, 3.5}, 0);
    const auto curr = make_curve({2.1, 2.6, 3.1, 3.6}, quarter);

    auto r = CarryRollCalculator::compare_realised(prev, curr);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value->size(), 4u);

    const auto& e = (*r.value)[1];
    EXPECT_DOUBLE_EQ(e.tenor, 2.0);
    EXPECT_NEAR(e.elapsed_years, 0.25, 1e-12);
    EXPECT_NEAR(e.predicted_roll_bp, -12.5, 1e-9);
    EXPECT_NEAR(e.realised_change_bp, -2.5, 1e-9);
    EXPECT_NEAR(e.surprise_bp(), 10.0, 1e-9);
}

TEST(CarryRoll_Realised, UnchangedCurve_RealisedEqualsLevelDifference) {
    const auto prev = make_curve({2.0, 2.5, 3.0, 3.5}, 100);
    const auto curr = make_curve({2.0, 2.5, 3.0, 3.5}, 200);
    auto r = CarryRollCalculator::compare_realised(prev, curr);
    ASSERT_TRUE(r.ok());
    for (const auto& e : *r.value) {
        EXPECT_NEAR(e.surprise_bp(), 0.0, 1e-9);
    }
}

TEST(CarryRoll_Realised, ElapsedBeyondFrontTenor_StillCompared) {
    const std::int64_t half = static_cast<std::int64_t>(SECONDS_PER_YEAR / 2.0);
    const auto prev = make_curve({4.0, 3.5}, 0, {0.25, 1.0});
    const auto curr = make_curve({4.2, 3.6}, half, {0.25, 1.0});
    auto r = CarryRollCalculator::compare_realised(prev, curr);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value->size(), 2u);
    // 3M aged past zero clamps to the front point on both curves.
    EXPECT_NEAR((*r.value)[0].predicted_roll_bp, 0.0, 1e-9);
    EXPECT_NEAR((*r.value)[0].realised_change_bp, 20.0, 1e-9);
}

TEST(CarryRoll_Realised, IdentifierCaseIsIgnored) {
    const auto prev = make_curve({2.0, 2.5, 3.0, 3.5}, 0);
    auto upper = *YieldCurve::make(CurveDefinition{
        .identifier = "UNITED KINGDOM",
        .kind       = CurveKind::Zero,
        .tenors     = {1.0, 2.0, 5.0, 10.0},
        .rates      = {2.0, 2.5, 3.0, 3.5},
        .as_of      = 10,
    });
    EXPECT_TRUE(CarryRollCalculator::compare_realised(prev, upper).ok());
}

TEST(CarryRoll_Realised, DifferentIdentifiers_IsInvalidInput) {
    const auto prev = make_curve({2.0, 2.5, 3.0, 3.5}, 0);
    auto other = *YieldCurve::make(CurveDefinition{
        .identifier = "Canada", .tenors = {1.0}, .rates = {3.0}, .as_of = 10});
    auto r = CarryRollCalculator::compare_realised(prev, other);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.failure->kind, ErrorKind::InvalidInput);
}

TEST(CarryRoll_Realised, NotLater_IsInvalidInput) {
    const auto prev = make_curve({2.0, 2.5, 3.0, 3.5}, 100);
    const auto curr = make_curve({2.0, 2.5, 3.0, 3.5}, 100);
    auto r = CarryRollCalculator::compare_realised(prev, curr);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.failure->kind, ErrorKind::InvalidInput);
}
