/// @file src/core/quote_provider.cpp
/// @brief In-memory and static G10 swap quote providers.

#include "rvcurve/data_loader.hpp"

#include <utility>

namespace rvcurve::core {

namespace {

struct SwapRow {
    const char* currency;
    double      rates[9];  ///< 1Y 2Y 3Y 5Y 7Y 10Y 15Y 20Y 30Y, percent
};

constexpr const char* SWAP_TENORS[9] = {"1Y", "2Y", "3Y", "5Y", "7Y", "10Y", "15Y", "20Y", "30Y"};

constexpr SwapRow G10_SWAPS[] = {
    {"EUR", {3.40, 3.10, 2.90, 2.70, 2.60, 2.55, 2.50, 2.50, 2.45}},
    {"USD", {4.80, 4.30, 4.10, 3.90, 3.80, 3.75, 3.70, 3.65, 3.60}},
    {"CAD", {4.30, 3.90, 3.75, 3.55, 3.45, 3.40, 3.35, 3.30, 3.25}},
    {"GBP", {5.10, 4.60, 4.30, 4.05, 3.95, 3.85, 3.80, 3.75, 3.70}},
    {"JPY", {0.35, 0.40, 0.45, 0.55, 0.65, 0.75, 0.90, 1.00, 1.10}},
    {"AUD", {4.10, 3.95, 3.90, 3.85, 3.90, 3.95, 4.00, 4.00, 4.05}},
    {"NZD", {4.50, 4.10, 3.95, 3.80, 3.80, 3.80, 3.85, 3.85, 3.90}},
    {"SEK", {3.70, 3.35, 3.20, 3.05, 2.95, 2.90, 2.85, 2.85, 2.80}},
};

} // anonymous namespace

// ─── InMemoryQuoteProvider ────────────────────────────────────────────────────

InMemoryQuoteProvider::InMemoryQuoteProvider(std::vector<Quote> quotes)
    : quotes_(std::move(quotes)) {}

std::vector<std::string> InMemoryQuoteProvider::identifiers() const {
    return QuoteLoader::identifiers(quotes_);
}

std::vector<Quote> InMemoryQuoteProvider::quotes(std::string_view identifier) const {
    std::vector<Quote> out;
    for (const auto& q : quotes_) {
        if (identifiers_match(q.identifier, identifier)) {
            out.push_back(q);
        }
    }
    return out;
}

// ─── StaticSwapQuoteProvider ──────────────────────────────────────────────────

StaticSwapQuoteProvider::StaticSwapQuoteProvider() {
    for (const auto& row : G10_SWAPS) {
        auto& quotes = table_[row.currency];
        for (std::size_t i = 0; i < 9; ++i) {
            quotes.push_back(Quote{
                .identifier  = row.currency,
                .tenor_label = SWAP_TENORS[i],
                .years       = *tenor_to_years(SWAP_TENORS[i]),
                .rate        = row.rates[i],
                .unit        = RateUnit::Percent,
            });
        }
    }
}

std::vector<std::string> StaticSwapQuoteProvider::identifiers() const {
    std::vector<std::string> ids;
    ids.reserve(table_.size());
    for (const auto& [ccy, quotes] : table_) {
        ids.push_back(ccy);
    }
    return ids;
}

std::vector<Quote> StaticSwapQuoteProvider::quotes(std::string_view identifier) const {
    for (const auto& [ccy, quotes] : table_) {
        if (identifiers_match(ccy, identifier)) {
            return quotes;
        }
    }
    return {};
}

} // namespace rvcurve::core
