#pragma once

/// @file include/rvcurve/spread.hpp
/// @brief Relative-value spread modes and the country × tenor spread matrix.
///
/// # Module: Spread
///
/// ## Responsibility
/// Compare a target curve against a reference curve tenor by tenor, in basis
/// points, under one of three modes:
///   - Gov-vs-Bund   : issuer par curve − reference issuer (Bund) par curve
///   - Asset swap    : issuer zero curve − matching-currency swap zero curve
///   - IRS-vs-EUR-IRS: currency swap zero curve − EUR swap zero curve
///
/// Then lay Gov-vs-Bund series out as a wide issuer × tenor table.
///
/// ## Guarantees
/// - Every point is `target(t) − reference(t)`, where the reference is
///   interpolated on the target's tenor grid and converted to the target's
///   rate unit before differencing
/// - A missing reference curve fails the whole series (MissingReferenceCurve);
///   a tenor outside the reference grid under `Alignment::Strict` is dropped
///   from that series only and listed in `SpreadSeries::excluded`
/// - IRS-vs-EUR-IRS for the reference currency itself is exactly 0.0 at
///   every tenor
/// - Matrix cells with no data are `std::nullopt`, never 0.0
///
/// ## NOT Responsible For
/// - Bootstrapping the curves it compares (see curve.hpp)
/// - Rendering, colour scales or centring

#include "rvcurve/constants.hpp"
#include "rvcurve/curve.hpp"
#include "rvcurve/types.hpp"

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rvcurve::spread {

// ─── Spread modes ─────────────────────────────────────────────────────────────

/// Government curve against the reference issuer's government curve.
struct GovVsBund {
    std::string reference_issuer = constants::DEFAULT_REFERENCE_ISSUER;
    Alignment   alignment        = Alignment::Nearest;
};

/// Government zero curve against the swap zero curve of `currency`.
struct AssetSwap {
    std::string currency;
    Alignment   alignment = Alignment::Nearest;
};

/// Swap zero curve against the reference currency's swap zero curve.
struct IrsVsEurIrs {
    std::string reference_currency = constants::DEFAULT_REFERENCE_CURRENCY;
    Alignment   alignment          = Alignment::Nearest;
};

using SpreadMode = std::variant<GovVsBund, AssetSwap, IrsVsEurIrs>;

[[nodiscard]] SpreadModeKind kind_of(const SpreadMode& mode) noexcept;

/// Identifier of the curve `mode` compares against.
[[nodiscard]] const std::string& reference_of(const SpreadMode& mode) noexcept;

// ─── SpreadSeries ─────────────────────────────────────────────────────────────

struct SpreadPoint {
    double      tenor;      ///< Years
    std::string label;      ///< Target curve's tenor label
    double      spread_bp;
};

/// One spread mode evaluated over one target curve.
struct SpreadSeries {
    std::string              source;     ///< Target issuer / currency
    std::string              reference;  ///< Reference issuer / currency
    SpreadModeKind           mode;
    std::vector<SpreadPoint> points;     ///< Ascending in tenor
    std::vector<Omission>    excluded;   ///< Tenors dropped under strict alignment

    /// Spread at `tenor` (tolerance match), or `nullopt` if not in the series.
    [[nodiscard]] std::optional<double> at(double tenor) const noexcept;

    [[nodiscard]] std::string to_string() const;
};

// ─── CurveSet ─────────────────────────────────────────────────────────────────

/// Curves keyed by identifier, used to resolve spread references.
/// Identifiers compare without regard to case.
class CurveSet {
public:
    /// Add `curve`, replacing any curve with the same identifier in any case.
    void insert(curve::YieldCurve curve);

    /// Curve with this identifier in any case, or nullptr.
    [[nodiscard]] const curve::YieldCurve* find(std::string_view identifier) const noexcept;

    [[nodiscard]] bool contains(std::string_view identifier) const noexcept {
        return find(identifier) != nullptr;
    }
    [[nodiscard]] std::size_t size() const noexcept { return curves_.size(); }
    [[nodiscard]] bool empty() const noexcept { return curves_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return curves_.begin(); }
    [[nodiscard]] auto end() const noexcept { return curves_.end(); }

private:
    std::map<std::string, curve::YieldCurve, IdentifierLess> curves_;
};

// ─── SpreadCalculator ─────────────────────────────────────────────────────────

class SpreadCalculator {
public:
    SpreadCalculator() = delete;

    /// Evaluate `mode` for `target` against the matching curve in `references`.
    ///
    /// # Returns
    /// - the series (possibly with excluded tenors), or
    /// - `MissingReferenceCurve` if the reference curve is not in `references`
    /// - `InvalidInput` if an asset-swap or IRS mode is given a curve that is
    ///   not a zero curve
    [[nodiscard]] static Outcome<SpreadSeries>
    compute(const curve::YieldCurve& target,
            const SpreadMode& mode,
            const CurveSet& references);

    /// Spread in bp between two rates quoted in `unit`.
    [[nodiscard]] static double
    spread_bp(double target_rate, double reference_rate, RateUnit unit) noexcept {
        return (target_rate - reference_rate) * bp_factor(unit);
    }
};

// ─── Spread matrix ────────────────────────────────────────────────────────────

struct DisplayTenor {
    std::string label;
    double      years;
};

/// 2Y, 5Y, 10Y, 30Y.
[[nodiscard]] std::vector<DisplayTenor> default_matrix_tenors();

/// Issuer × tenor table of Gov-vs-Bund spreads in bp.
struct SpreadMatrix {
    std::vector<std::string>                        rows;
    std::vector<DisplayTenor>                       columns;
    std::vector<std::vector<std::optional<double>>> cells;    ///< rows × columns
    std::vector<Omission>                           skipped;  ///< Series not accepted

    /// Cell value; `nullopt` for an absent cell or out-of-range indices.
    [[nodiscard]] std::optional<double> at(std::size_t row, std::size_t col) const noexcept;

    /// Row index of `issuer`.
    [[nodiscard]] std::optional<std::size_t> row_of(std::string_view issuer) const noexcept;

    /// Fixed-width table; absent cells print as "-".
    [[nodiscard]] std::string to_string() const;
};

class MatrixBuilder {
public:
    MatrixBuilder() = delete;

    /// One row per GovVsBund series, in input order. Series of any other mode
    /// are left out and listed in `SpreadMatrix::skipped`.
    [[nodiscard]] static SpreadMatrix
    build(std::span<const SpreadSeries> series,
          std::span<const DisplayTenor> tenors);
};

} // namespace rvcurve::spread
