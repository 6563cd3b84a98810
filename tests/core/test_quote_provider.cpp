#include <gtest/gtest.h>
#include "rvcurve/curve.hpp"
#include "rvcurve/data_loader.hpp"
#include <vector>

using namespace rvcurve;
using namespace rvcurve::core;

// ─── InMemoryQuoteProvider ────────────────────────────────────────────────────

TEST(InMemoryProvider, GroupsQuotesByIdentifier) {
    const InMemoryQuoteProvider provider(QuoteLoader::parse_csv_string(
        "country,tenor,yield\nFrance,2Y,2.6\nGermany,2Y,2.1\nFrance,5Y,2.9\n"));
    const auto ids = provider.identifiers();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], "France");
    EXPECT_EQ(provider.quotes("France").size(), 2u);
    EXPECT_EQ(provider.quotes("france").size(), 2u);
    EXPECT_TRUE(provider.quotes("Spain").empty());
}

TEST(InMemoryProvider, UsableThroughBaseInterface) {
    const InMemoryQuoteProvider concrete(QuoteLoader::parse_csv_string(
        "country,tenor,yield\nItaly,2Y,3.1\n"));
    const QuoteProvider& provider = concrete;
    EXPECT_EQ(provider.identifiers().size(), 1u);
}

// ─── StaticSwapQuoteProvider ──────────────────────────────────────────────────

TEST(StaticSwapProvider, EightG10Currencies) {
    const StaticSwapQuoteProvider provider;
    const auto ids = provider.identifiers();
    EXPECT_EQ(ids.size(), 8u);
    for (const char* ccy : {"EUR", "USD", "CAD", "GBP", "JPY", "AUD", "NZD", "SEK"}) {
        EXPECT_EQ(provider.quotes(ccy).size(), 9u) << ccy;
    }
}

TEST(StaticSwapProvider, UnknownCurrency_HasNoQuotes) {
    const StaticSwapQuoteProvider provider;
    EXPECT_TRUE(provider.quotes("CHF").empty());
}

TEST(StaticSwapProvider, CaseInsensitiveLookup) {
    const StaticSwapQuoteProvider provider;
    const auto quotes = provider.quotes("eur");
    ASSERT_EQ(quotes.size(), 9u);
    EXPECT_EQ(quotes.front().tenor_label, "1Y");
    EXPECT_DOUBLE_EQ(quotes.back().years, 30.0);
    EXPECT_EQ(quotes.front().unit, RateUnit::Percent);
}

TEST(StaticSwapProvider, EveryCurrencyBootstraps) {
    const StaticSwapQuoteProvider provider;
    const auto conventions = curve::SwapConventions::g10_defaults();
    for (const auto& ccy : provider.identifiers()) {
        const auto quotes = provider.quotes(ccy);
        auto par = curve::YieldCurve::from_quotes(ccy, quotes);
        ASSERT_TRUE(par.has_value()) << ccy;
        auto zero = curve::SwapCurveBootstrapper::bootstrap(*par, conventions);
        EXPECT_TRUE(zero.ok()) << ccy;
    }
}
