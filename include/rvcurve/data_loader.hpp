#pragma once

/// @file include/rvcurve/data_loader.hpp
/// @brief CSV quote loader and the quote-provider capability.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Turn an already-captured market snapshot (CSV file or string) into
/// `Quote` records, and expose quote sources through one small interface so
/// the bootstrapping code does not care where quotes come from.
///
/// ## Expected CSV Format
/// ```
/// country,tenor,yield,prev.,high,low,chg.,time
/// Germany,2Y,2.10,2.08,2.12,2.07,+0.02,1718000000
/// France,10Y,3.05,3.01,3.07,3.00,+0.04,1718000000
/// ```
/// Columns are located by header name, case-insensitively:
/// `country|issuer|currency`, `tenor`, optional `years`, `yield|rate`,
/// optional `unit` (`percent`, `%`, `decimal`), optional `prev.|prev`,
/// `high`, `low`, `chg.|chg`, `time|timestamp`.
/// Numbers may carry `,` thousands separators, a leading `+` or a trailing `%`.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only if a file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Never guesses a rate unit from the magnitude of the value

#include "rvcurve/types.hpp"

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rvcurve::core {

// ─── QuoteLoader ──────────────────────────────────────────────────────────────

class QuoteLoader {
public:
    QuoteLoader() = delete;

    /// Load quotes from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - the parsed quotes otherwise (possibly empty)
    [[nodiscard]] static std::optional<std::vector<Quote>>
    load_csv(const std::string& filepath,
             RateUnit default_unit = RateUnit::Percent);

    /// Parse quotes from CSV text. Rows without a `unit` column value use
    /// `default_unit`.
    [[nodiscard]] static std::vector<Quote>
    parse_csv_string(const std::string& csv_content,
                     RateUnit default_unit = RateUnit::Percent);

    /// "1,234.5" → 1234.5, "+0.08" → 0.08, "3.50%" → 3.5.
    [[nodiscard]] static std::optional<double> parse_number(std::string_view field);

    /// "percent" / "%" / "pct" → Percent, "decimal" / "dec" → Decimal.
    [[nodiscard]] static std::optional<RateUnit> parse_unit(std::string_view field);

    /// Distinct identifiers in first-seen order.
    [[nodiscard]] static std::vector<std::string> identifiers(std::span<const Quote> quotes);
};

// ─── QuoteProvider ────────────────────────────────────────────────────────────

/// Source of per-identifier quote snapshots (static table, file, live feed).
class QuoteProvider {
public:
    virtual ~QuoteProvider() = default;

    /// Identifiers this provider can quote.
    [[nodiscard]] virtual std::vector<std::string> identifiers() const = 0;

    /// Quotes for `identifier`; empty if the identifier is unknown.
    [[nodiscard]] virtual std::vector<Quote> quotes(std::string_view identifier) const = 0;
};

/// Provider over a fixed set of quotes, e.g. the output of `QuoteLoader`.
class InMemoryQuoteProvider final : public QuoteProvider {
public:
    explicit InMemoryQuoteProvider(std::vector<Quote> quotes);

    [[nodiscard]] std::vector<std::string> identifiers() const override;
    [[nodiscard]] std::vector<Quote> quotes(std::string_view identifier) const override;

private:
    std::vector<Quote> quotes_;
};

/// Built-in G10 par swap curves (EUR, USD, CAD, GBP, JPY, AUD, NZD, SEK;
/// 1Y to 30Y, percent). An unknown currency yields no quotes.
class StaticSwapQuoteProvider final : public QuoteProvider {
public:
    StaticSwapQuoteProvider();

    [[nodiscard]] std::vector<std::string> identifiers() const override;
    [[nodiscard]] std::vector<Quote> quotes(std::string_view identifier) const override;

private:
    std::map<std::string, std::vector<Quote>, std::less<>> table_;
};

} // namespace rvcurve::core
