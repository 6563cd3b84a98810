#include <gtest/gtest.h>
#include "rvcurve/spread.hpp"
#include <vector>

using namespace rvcurve;
using namespace rvcurve::spread;

namespace {

SpreadSeries series(std::string source, SpreadModeKind mode,
                    std::vector<std::pair<double, double>> points) {
    SpreadSeries s{.source = std::move(source), .reference = "Germany", .mode = mode};
    for (const auto& [t, bp] : points) {
        s.points.push_back(SpreadPoint{.tenor = t, .label = format_tenor(t), .spread_bp = bp});
    }
    return s;
}

} // namespace

TEST(MatrixBuilder_Defaults, FourDisplayTenors) {
    const auto tenors = default_matrix_tenors();
    ASSERT_EQ(tenors.size(), 4u);
    EXPECT_EQ(tenors[0].label, "2Y");
    EXPECT_DOUBLE_EQ(tenors[3].years, 30.0);
}

TEST(MatrixBuilder_Build, RowsInInputOrder_CellsFromSeries) {
    const std::vector<SpreadSeries> input{
        series("France", SpreadModeKind::GovVsBund, {{2.0, 50}, {5.0, 50}, {10.0, 50}, {30.0, 60}}),
        series("Italy", SpreadModeKind::GovVsBund, {{2.0, 100}, {5.0, 120}, {10.0, 150}}),
    };
    const auto tenors = default_matrix_tenors();
    const auto m = MatrixBuilder::build(input, tenors);

    ASSERT_EQ(m.rows.size(), 2u);
    EXPECT_EQ(m.rows[0], "France");
    EXPECT_EQ(m.rows[1], "Italy");
    EXPECT_DOUBLE_EQ(*m.at(0, 3), 60.0);
    EXPECT_DOUBLE_EQ(*m.at(1, 2), 150.0);
    EXPECT_TRUE(m.skipped.empty());
}

TEST(MatrixBuilder_Build, MissingTenor_IsAbsentNotZero) {
    const std::vector<SpreadSeries> input{
        series("Italy", SpreadModeKind::GovVsBund, {{2.0, 100}, {5.0, 120}, {10.0, 150}}),
    };
    const auto tenors = default_matrix_tenors();
    const auto m = MatrixBuilder::build(input, tenors);
    EXPECT_FALSE(m.at(0, 3).has_value());
    EXPECT_NE(m.to_string().find('-'), std::string::npos);
}

TEST(MatrixBuilder_Build, OtherModes_AreSkippedWithReason) {
    const std::vector<SpreadSeries> input{
        series("France", SpreadModeKind::GovVsBund, {{2.0, 50}}),
        series("France", SpreadModeKind::AssetSwap, {{2.0, -30}}),
    };
    const auto tenors = default_matrix_tenors();
    const auto m = MatrixBuilder::build(input, tenors);
    EXPECT_EQ(m.rows.size(), 1u);
    ASSERT_EQ(m.skipped.size(), 1u);
    EXPECT_EQ(m.skipped[0].kind, ErrorKind::InvalidInput);
    EXPECT_EQ(m.skipped[0].mode, SpreadModeKind::AssetSwap);
}

TEST(MatrixBuilder_Lookup, RowOfAndOutOfRange) {
    const std::vector<SpreadSeries> input{
        series("France", SpreadModeKind::GovVsBund, {{2.0, 50}}),
    };
    const auto tenors = default_matrix_tenors();
    const auto m = MatrixBuilder::build(input, tenors);
    EXPECT_EQ(m.row_of("France"), std::optional<std::size_t>(0));
    EXPECT_EQ(m.row_of("FRANCE"), std::optional<std::size_t>(0));
    EXPECT_FALSE(m.row_of("Spain").has_value());
    EXPECT_FALSE(m.at(1, 0).has_value());
    EXPECT_FALSE(m.at(0, 4).has_value());
}

TEST(MatrixBuilder_Render, HeaderCarriesTenorLabels) {
    const std::vector<SpreadSeries> input{
        series("France", SpreadModeKind::GovVsBund, {{2.0, 50}, {30.0, 60}}),
    };
    const auto tenors = default_matrix_tenors();
    const auto text = MatrixBuilder::build(input, tenors).to_string();
    EXPECT_NE(text.find("10Y"), std::string::npos);
    EXPECT_NE(text.find("France"), std::string::npos);
    EXPECT_NE(text.find("+60.0"), std::string::npos);
}
