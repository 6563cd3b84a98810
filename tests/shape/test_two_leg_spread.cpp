#include <gtest/gtest.h>
#include "rvcurve/shape.hpp"
#include <vector>

using namespace rvcurve;
using namespace rvcurve::curve;
using namespace rvcurve::shape;

namespace {

YieldCurve make_curve(std::vector<double> tenors, std::vector<double> rates) {
    return *YieldCurve::make(CurveDefinition{
        .identifier = "United States",
        .tenors     = std::move(tenors),
        .rates      = std::move(rates),
    });
}

} // namespace

TEST(TwoLeg_Defaults, ThreeStandardPairs) {
    const auto pairs = default_tenor_pairs();
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0].name, "2s5s");
    EXPECT_EQ(pairs[1].name, "2s10s");
    EXPECT_EQ(pairs[2].name, "5s30s");
}

TEST(TwoLeg_Analyze, LongMinusShortInBp) {
    const auto c = make_curve({2.0, 5.0, 10.0, 30.0}, {2.1, 2.4, 2.8, 3.1});
    const auto pairs = default_tenor_pairs();
    const auto report = TwoLegSpreadAnalyzer::analyze(c, pairs);
    ASSERT_EQ(report.metrics.size(), 3u);
    EXPECT_TRUE(report.omissions.empty());
    EXPECT_NEAR(report.metrics[0].value_bp, 30.0, 1e-9);
    EXPECT_NEAR(report.metrics[1].value_bp, 70.0, 1e-9);
    EXPECT_NEAR(report.metrics[2].value_bp, 70.0, 1e-9);
    EXPECT_EQ(report.metrics[1].curve, "United States");
}

TEST(TwoLeg_Analyze, InvertedCurve_IsNegative) {
    const auto c = make_curve({2.0, 10.0}, {4.8, 4.2});
    const std::vector<TenorPair> pairs{{"2s10s", 2.0, 10.0}};
    const auto report = TwoLegSpreadAnalyzer::analyze(c, pairs);
    ASSERT_EQ(report.metrics.size(), 1u);
    EXPECT_NEAR(report.metrics[0].value_bp, -60.0, 1e-9);
}

TEST(TwoLeg_Analyze, StrictMissingLongLeg_IsOmitted) {
    const auto c = make_curve({2.0, 5.0, 10.0}, {2.1, 2.4, 2.8});
    const auto pairs = default_tenor_pairs();
    const auto report = TwoLegSpreadAnalyzer::analyze(c, pairs);
    EXPECT_EQ(report.metrics.size(), 2u);
    ASSERT_EQ(report.omissions.size(), 1u);
    EXPECT_EQ(report.omissions[0].kind, ErrorKind::OutOfRangeInterpolation);
    EXPECT_DOUBLE_EQ(*report.omissions[0].tenor, 30.0);
    EXPECT_NE(report.omissions[0].reason.find("5s30s"), std::string::npos);
}

TEST(TwoLeg_Analyze, NearestMissingLongLeg_ClampsToBack) {
    const auto c = make_curve({2.0, 5.0, 10.0}, {2.1, 2.4, 2.8});
    const std::vector<TenorPair> pairs{{"5s30s", 5.0, 30.0}};
    const auto report = TwoLegSpreadAnalyzer::analyze(c, pairs, Alignment::Nearest);
    ASSERT_EQ(report.metrics.size(), 1u);
    EXPECT_NEAR(report.metrics[0].value_bp, 40.0, 1e-9);
}

TEST(TwoLeg_Metric, ToStringNamesCurveAndMetric) {
    const auto c = make_curve({2.0, 10.0}, {2.1, 2.8});
    const std::vector<TenorPair> pairs{{"2s10s", 2.0, 10.0}};
    const auto text = TwoLegSpreadAnalyzer::analyze(c, pairs).metrics[0].to_string();
    EXPECT_NE(text.find("2s10s"), std::string::npos);
    EXPECT_NE(text.find("+70.00"), std::string::npos);
}
