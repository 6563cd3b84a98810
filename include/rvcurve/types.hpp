#pragma once

/// @file include/rvcurve/types.hpp
/// @brief Shared value types for the rvcurve relative-value engine.
///
/// Every module includes this file. It defines the quote record, the tagged
/// enumerations that travel with curves (unit, kind, compounding, frequency,
/// alignment) and the omission/outcome pair used to report skipped work.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rvcurve {

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Unit a rate is quoted in. Never inferred from the magnitude of the value.
enum class RateUnit {
    Percent,  ///< 2.45 means 2.45 %
    Decimal,  ///< 0.0245 means 2.45 %
};

/// Whether a curve holds market par rates or bootstrapped zero rates.
enum class CurveKind {
    Par,
    Zero,
};

/// Compounding convention used to turn a zero rate into a discount factor.
enum class Compounding {
    Annual,      ///< DF = (1 + z)^−t
    Semiannual,  ///< DF = (1 + z/2)^−2t
    Continuous,  ///< DF = exp(−z·t)
};

/// Coupon / fixed-leg payment frequency. The value is payments per year.
enum class Frequency : int {
    Annual     = 1,
    Semiannual = 2,
    Quarterly  = 4,
};

/// Rule for a requested tenor that lies outside a curve's grid.
enum class Alignment {
    Strict,   ///< out-of-range is a failure
    Nearest,  ///< clamp to the closest endpoint
};

/// The three relative-value spread modes.
enum class SpreadModeKind {
    GovVsBund,
    AssetSwap,
    IrsVsEurIrs,
};

/// Why a unit of work (a tenor point, a curve, a series, a proposal) was skipped.
enum class ErrorKind {
    CurveBootstrapFailure,    ///< unsolvable or out-of-range discount factor
    MissingReferenceCurve,    ///< a spread mode's reference curve is absent
    OutOfRangeInterpolation,  ///< one tenor excluded under strict alignment
    InsufficientHedgeData,    ///< non-positive or missing DV01
    HorizonExceedsTenor,      ///< carry horizon at or beyond the tenor
    InvalidInput,             ///< malformed quotes or inconsistent arguments
};

[[nodiscard]] const char* to_string(RateUnit u) noexcept;
[[nodiscard]] const char* to_string(CurveKind k) noexcept;
[[nodiscard]] const char* to_string(Compounding c) noexcept;
[[nodiscard]] const char* to_string(Frequency f) noexcept;
[[nodiscard]] const char* to_string(Alignment a) noexcept;
[[nodiscard]] const char* to_string(SpreadModeKind m) noexcept;
[[nodiscard]] const char* to_string(ErrorKind e) noexcept;

/// Payments per year for a frequency.
[[nodiscard]] constexpr int periods_per_year(Frequency f) noexcept {
    return static_cast<int>(f);
}

// ─── Unit Helpers ─────────────────────────────────────────────────────────────

/// Basis points per unit of rate in `unit` (100 for percent, 10 000 for decimal).
[[nodiscard]] double bp_factor(RateUnit unit) noexcept;

/// Convert a rate between units.
[[nodiscard]] double convert_rate(double rate, RateUnit from, RateUnit to) noexcept;

// ─── Tenor Labels ─────────────────────────────────────────────────────────────

/// Parse a tenor label: "10Y" → 10.0, "6M" → 0.5, "3m" → 0.25.
/// Returns `nullopt` for anything else (including non-positive tenors).
[[nodiscard]] std::optional<double> tenor_to_years(std::string_view label) noexcept;

/// Format a tenor in years as a label: 10.0 → "10Y", 0.5 → "6M".
/// Non-integral month counts fall back to a decimal-years label ("2.3Y").
[[nodiscard]] std::string format_tenor(double years);

// ─── Identifiers ──────────────────────────────────────────────────────────────

/// Issuer and currency identifiers compare without regard to ASCII case:
/// "germany", "GERMANY" and "Germany" name the same curve.
[[nodiscard]] bool identifiers_match(std::string_view a, std::string_view b) noexcept;

/// Case-folding strict weak order for identifier-keyed maps.
struct IdentifierLess {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept;
};

// ─── Quote ────────────────────────────────────────────────────────────────────

/// One market quote for one instrument in one snapshot.
struct Quote {
    std::string identifier;        ///< Issuer ("France") or currency ("EUR")
    std::string tenor_label;       ///< As quoted, e.g. "10Y"
    double      years;             ///< Tenor in years, > 0
    double      rate;              ///< Par rate / yield in `unit`
    RateUnit    unit = RateUnit::Percent;

    std::optional<double>       previous;   ///< Previous close
    std::optional<double>       high;       ///< Session high
    std::optional<double>       low;        ///< Session low
    std::optional<double>       change;     ///< Change vs previous
    std::optional<std::int64_t> timestamp;  ///< Epoch seconds of the quote
};

// ─── Omission ─────────────────────────────────────────────────────────────────

/// A skipped unit of work with enough context for a consumer to surface it.
struct Omission {
    ErrorKind                     kind;
    std::string                   subject;  ///< Issuer / currency / position
    std::optional<double>         tenor;    ///< Offending tenor, if any
    std::optional<SpreadModeKind> mode;     ///< Spread mode, if any
    std::string                   reason;

    /// "[OutOfRangeInterpolation] France 30Y (AssetSwap): ..."
    [[nodiscard]] std::string to_string() const;
};

// ─── Outcome ──────────────────────────────────────────────────────────────────

/// Either a value or the omission explaining why there is none.
template <typename T>
struct Outcome {
    std::optional<T>        value;
    std::optional<Omission> failure;

    [[nodiscard]] static Outcome success(T v) {
        return Outcome{std::move(v), std::nullopt};
    }

    [[nodiscard]] static Outcome fail(Omission o) {
        return Outcome{std::nullopt, std::move(o)};
    }

    [[nodiscard]] bool ok() const noexcept { return value.has_value(); }
};

} // namespace rvcurve
