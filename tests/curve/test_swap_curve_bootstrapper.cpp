#include <gtest/gtest.h>
#include "rvcurve/curve.hpp"
#include <vector>

using namespace rvcurve;
using namespace rvcurve::curve;

namespace {

YieldCurve swap_par(std::string ccy) {
    auto c = YieldCurve::make(CurveDefinition{
        .identifier = std::move(ccy),
        .tenors     = {1.0, 2.0, 3.0, 5.0, 7.0, 10.0, 20.0, 30.0},
        .rates      = {3.40, 3.10, 2.90, 2.70, 2.60, 2.55, 2.50, 2.45},
    });
    return *c;
}

} // namespace

// ─── Conventions ──────────────────────────────────────────────────────────────

TEST(SwapConventions_G10, EurAnnualUsdSemiannual) {
    const auto conv = SwapConventions::g10_defaults();
    EXPECT_EQ(conv.size(), 8u);
    ASSERT_TRUE(conv.find("EUR").has_value());
    EXPECT_EQ(conv.find("EUR")->fixed_frequency, Frequency::Annual);
    EXPECT_EQ(conv.find("SEK")->fixed_frequency, Frequency::Annual);
    EXPECT_EQ(conv.find("USD")->fixed_frequency, Frequency::Semiannual);
    EXPECT_EQ(conv.find("JPY")->fixed_frequency, Frequency::Semiannual);
}

TEST(SwapConventions_G10, LookupIsCaseInsensitive) {
    const auto conv = SwapConventions::g10_defaults();
    EXPECT_TRUE(conv.find("gbp").has_value());
    EXPECT_FALSE(conv.find("CHF").has_value());
}

TEST(SwapConventions_G10, SetReplacesExisting) {
    auto conv = SwapConventions::g10_defaults();
    conv.set("usd", SwapLegConvention{.fixed_frequency = Frequency::Quarterly});
    EXPECT_EQ(conv.find("USD")->fixed_frequency, Frequency::Quarterly);
    EXPECT_EQ(conv.size(), 8u);
}

// ─── Bootstrap ────────────────────────────────────────────────────────────────

TEST(SwapBootstrap_Output, TaggedWithCurrencyConvention) {
    const auto conv = SwapConventions::g10_defaults();
    auto eur = SwapCurveBootstrapper::bootstrap(swap_par("EUR"), conv);
    auto usd = SwapCurveBootstrapper::bootstrap(swap_par("USD"), conv);
    ASSERT_TRUE(eur.ok());
    ASSERT_TRUE(usd.ok());
    EXPECT_EQ(eur.value->frequency(), Frequency::Annual);
    EXPECT_EQ(usd.value->frequency(), Frequency::Semiannual);
    EXPECT_EQ(eur.value->compounding(), Compounding::Continuous);
    EXPECT_EQ(eur.value->kind(), CurveKind::Zero);
}

TEST(SwapBootstrap_Reprice, FixedLegPlusNotionalPricesToOne) {
    const auto conv = SwapConventions::g10_defaults();
    const auto par  = swap_par("EUR");
    auto zero = SwapCurveBootstrapper::bootstrap(par, conv);
    ASSERT_TRUE(zero.ok());

    for (std::size_t i = 0; i < par.size(); ++i) {
        auto leg = SwapCurveBootstrapper::fixed_leg_schedule(par, i, *conv.find("EUR"));
        ASSERT_TRUE(leg.has_value());
        auto pv = present_value(*zero.value, *leg);
        ASSERT_TRUE(pv.has_value());
        EXPECT_NEAR(*pv, 1.0, 1e-10) << "tenor " << par.tenors()[i];
    }
}

TEST(SwapBootstrap_Output, FirstTenorZeroEqualsPar) {
    auto zero = SwapCurveBootstrapper::bootstrap(swap_par("EUR"),
                                                 SwapConventions::g10_defaults());
    ASSERT_TRUE(zero.ok());
    EXPECT_NEAR(zero.value->rates()[0], 3.40, 1e-12);
}

TEST(SwapBootstrap_Failure, UnknownCurrency_IsBootstrapFailure) {
    auto zero = SwapCurveBootstrapper::bootstrap(swap_par("XYZ"),
                                                 SwapConventions::g10_defaults());
    ASSERT_FALSE(zero.ok());
    EXPECT_EQ(zero.failure->kind, ErrorKind::CurveBootstrapFailure);
    EXPECT_EQ(zero.failure->subject, "XYZ");
    EXPECT_NE(zero.failure->reason.find("XYZ"), std::string::npos);
}

TEST(SwapBootstrap_Failure, EmptyConventions_IsBootstrapFailure) {
    auto zero = SwapCurveBootstrapper::bootstrap(swap_par("EUR"), SwapConventions{});
    ASSERT_FALSE(zero.ok());
    EXPECT_EQ(zero.failure->kind, ErrorKind::CurveBootstrapFailure);
}
