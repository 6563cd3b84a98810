#pragma once

/// @file include/rvcurve/curve.hpp
/// @brief Yield curves, grid interpolation and par → zero bootstrapping.
///
/// # Module: Curve
///
/// ## Responsibility
/// Hold one issuer's (or currency's) curve as an immutable value, look rates
/// up at arbitrary tenors, and convert market par quotes into zero-coupon
/// curves for government bonds and for interest-rate swaps.
///
/// ## Bootstrap Recursion
/// Tenors are processed in ascending order. The first instrument (and any
/// instrument with a single cash flow) is a zero-coupon quote in the curve's
/// compounding convention, so its zero rate equals its par rate. Every later
/// instrument is a coupon bond priced at par:
///
///     Σ c_k · DF(t_k) + (100 + c_N) · DF(T) = 100
///
/// Coupons dated at or before the last solved tenor are discounted with
/// interpolated zero rates that are already known, and DF(T) is isolated in
/// closed form. Coupons falling between the last solved tenor and T depend on
/// the unknown z(T) through linear interpolation; z(T) is then solved with a
/// bracketed secant iteration.
///
/// ## Guarantees
/// - A `YieldCurve` always has ≥ 1 point, strictly increasing positive tenors
///   and finite rates; it cannot be modified after construction
/// - Failure is reported through `std::nullopt` or an `Outcome` carrying the
///   offending tenor. Interpolation is `noexcept`; anything that builds a
///   curve or a schedule may only throw `std::bad_alloc`
/// - Discount factors are never clamped: an unsolvable instrument fails
///
/// ## NOT Responsible For
/// - Spread arithmetic between curves (see spread.hpp)
/// - Quote acquisition (see data_loader.hpp)

#include "rvcurve/constants.hpp"
#include "rvcurve/types.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rvcurve::curve {

// ─── CurveDefinition ──────────────────────────────────────────────────────────

/// Raw ingredients of a curve, validated by `YieldCurve::make`.
struct CurveDefinition {
    std::string              identifier;
    CurveKind                kind = CurveKind::Par;
    RateUnit                 unit = RateUnit::Percent;
    std::vector<double>      tenors;    ///< Years, strictly increasing
    std::vector<double>      rates;     ///< Same length as tenors
    std::vector<std::string> labels;    ///< Empty, or same length as tenors
    std::int64_t             as_of = 0; ///< Snapshot time, epoch seconds
    std::optional<Compounding> compounding;  ///< Zero curves only
    std::optional<Frequency>   frequency;    ///< Zero curves only
};

// ─── YieldCurve ───────────────────────────────────────────────────────────────

/// Immutable tenor → rate mapping for one issuer or currency.
class YieldCurve {
public:
    /// Validate and build a curve.
    ///
    /// # Returns
    /// `nullopt` if the grid is empty, sizes disagree, any tenor is
    /// non-positive / non-finite / not strictly increasing, or any rate is
    /// non-finite. Missing labels are generated from the tenors.
    [[nodiscard]] static std::optional<YieldCurve>
    make(CurveDefinition def);

    /// Build a par curve from one identifier's quotes.
    ///
    /// Quotes are sorted by tenor; rates are converted to the unit of the
    /// first quote; quotes sharing a tenor are averaged. Quotes for other
    /// identifiers and non-finite quotes are ignored. `as_of` is the latest
    /// quote timestamp, or 0 if none carries one.
    [[nodiscard]] static std::optional<YieldCurve>
    from_quotes(std::string_view identifier,
                std::span<const Quote> quotes);

    [[nodiscard]] const std::string& identifier() const noexcept { return def_.identifier; }
    [[nodiscard]] CurveKind kind() const noexcept { return def_.kind; }
    [[nodiscard]] RateUnit unit() const noexcept { return def_.unit; }
    [[nodiscard]] std::int64_t as_of() const noexcept { return def_.as_of; }
    [[nodiscard]] std::optional<Compounding> compounding() const noexcept { return def_.compounding; }
    [[nodiscard]] std::optional<Frequency> frequency() const noexcept { return def_.frequency; }

    [[nodiscard]] std::span<const double> tenors() const noexcept { return def_.tenors; }
    [[nodiscard]] std::span<const double> rates() const noexcept { return def_.rates; }
    [[nodiscard]] std::span<const std::string> labels() const noexcept { return def_.labels; }
    [[nodiscard]] std::size_t size() const noexcept { return def_.tenors.size(); }

    [[nodiscard]] double front_tenor() const noexcept { return def_.tenors.front(); }
    [[nodiscard]] double back_tenor() const noexcept { return def_.tenors.back(); }

    /// Rates converted to decimal (for discounting).
    [[nodiscard]] std::vector<double> decimal_rates() const;

    /// Index of the grid point within TENOR_MATCH_TOLERANCE of `tenor`.
    [[nodiscard]] std::optional<std::size_t> find(double tenor) const noexcept;

    /// Copy of this curve with every rate moved by `shift` (in curve units).
    [[nodiscard]] YieldCurve shifted(double shift) const;

    /// Copy of this curve with only point `index` moved by `shift`.
    /// Returns `nullopt` if `index` is out of range.
    [[nodiscard]] std::optional<YieldCurve>
    shifted_at(std::size_t index, double shift) const;

    /// Definition this curve was built from (already validated).
    [[nodiscard]] const CurveDefinition& definition() const noexcept { return def_; }

    /// One line per point, formatted with fmt.
    [[nodiscard]] std::string to_string() const;

private:
    explicit YieldCurve(CurveDefinition def) noexcept;

    CurveDefinition def_;
};

// ─── GridInterpolator ─────────────────────────────────────────────────────────

/// Linear-in-tenor rate look-up with an explicit out-of-range policy.
///
/// All methods are static pure functions.
class GridInterpolator {
public:
    GridInterpolator() = delete;

    /// Rate at `tenor` on `curve`, in the curve's unit.
    ///
    /// # Returns
    /// - the stored rate, exactly, if `tenor` matches a grid point
    /// - the linear interpolant between the bracketing points otherwise
    /// - under `Nearest`, the closest endpoint's rate when out of range
    /// - `nullopt` under `Strict` when out of range, or for a non-finite tenor
    [[nodiscard]] static std::optional<double>
    rate(const YieldCurve& curve, double tenor, Alignment alignment) noexcept;

    /// Same contract over raw parallel arrays (tenors strictly increasing).
    /// Returns `nullopt` for empty or mismatched inputs.
    [[nodiscard]] static std::optional<double>
    rate(std::span<const double> tenors,
         std::span<const double> rates,
         double tenor,
         Alignment alignment) noexcept;

    /// Index of the grid point within TENOR_MATCH_TOLERANCE of `tenor`.
    [[nodiscard]] static std::optional<std::size_t>
    find_exact(std::span<const double> tenors, double tenor) noexcept;

    /// Closest grid tenor to `tenor` (ties resolve to the shorter one).
    [[nodiscard]] static std::optional<double>
    nearest_tenor(const YieldCurve& curve, double tenor) noexcept;
};

// ─── Cash-flow schedules ──────────────────────────────────────────────────────

/// Dated cash flows of one instrument, ascending in time.
struct CashflowSchedule {
    Eigen::VectorXd times;    ///< Years from the snapshot
    Eigen::VectorXd amounts;  ///< Currency units per `notional`
};

/// Fixed-coupon schedule: dates run back from `maturity` in steps of 1/f
/// while positive (short front stub); each coupon is
/// `face · coupon_rate · accrual` and the last flow adds `face`.
/// `coupon_rate` is decimal.
[[nodiscard]] CashflowSchedule
coupon_schedule(double maturity, double coupon_rate, Frequency frequency, double face);

/// Present value of `schedule` discounted on a zero curve.
///
/// The curve must carry a compounding tag. Rates at cash-flow dates come from
/// GridInterpolator under `alignment`.
///
/// # Returns
/// `nullopt` if the curve is not a zero curve, or any date cannot be priced.
[[nodiscard]] std::optional<double>
present_value(const YieldCurve& zero_curve,
              const CashflowSchedule& schedule,
              Alignment alignment = Alignment::Nearest);

// ─── Bootstrap configuration ──────────────────────────────────────────────────

/// Per-issuer bootstrap settings, passed explicitly into every call.
struct BootstrapConfig {
    Compounding compounding = Compounding::Continuous;
    Frequency   frequency   = Frequency::Semiannual;
    /// Policy for coupon dates outside the already-solved grid.
    Alignment   alignment   = Alignment::Nearest;
};

/// Fixed-leg convention for one swap currency.
struct SwapLegConvention {
    Frequency   fixed_frequency = Frequency::Annual;
    Compounding compounding     = Compounding::Continuous;
};

/// Currency-keyed fixed-leg conventions, injected into the swap bootstrapper.
class SwapConventions {
public:
    /// EUR and SEK annual; USD, GBP, AUD, CAD, JPY, NZD semiannual.
    [[nodiscard]] static SwapConventions g10_defaults();

    /// Add or replace the convention for `currency` (upper-cased).
    void set(std::string currency, SwapLegConvention convention);

    [[nodiscard]] std::optional<SwapLegConvention>
    find(std::string_view currency) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return table_.size(); }

private:
    std::map<std::string, SwapLegConvention, IdentifierLess> table_;
};

// ─── CurveBootstrapper ────────────────────────────────────────────────────────

/// Government bond par curve → zero curve.
class CurveBootstrapper {
public:
    CurveBootstrapper() = delete;

    /// Bootstrap a par curve into a zero curve on the identical grid.
    ///
    /// # Returns
    /// The zero curve (same identifier, unit and labels; tagged with the
    /// config's compounding and frequency), or a `CurveBootstrapFailure`
    /// naming the first tenor that could not be solved.
    [[nodiscard]] static Outcome<YieldCurve>
    bootstrap(const YieldCurve& par_curve,
              const BootstrapConfig& config = BootstrapConfig{});

    /// Cash flows (per 100 face) of the instrument quoted at `index`.
    /// Returns `nullopt` if `index` is out of range.
    [[nodiscard]] static std::optional<CashflowSchedule>
    instrument_schedule(const YieldCurve& par_curve,
                        std::size_t index,
                        const BootstrapConfig& config = BootstrapConfig{});
};

// ─── SwapCurveBootstrapper ────────────────────────────────────────────────────

/// Swap par curve → zero curve, with the fixed-leg convention looked up by
/// currency. The floating leg is assumed to price at par.
class SwapCurveBootstrapper {
public:
    SwapCurveBootstrapper() = delete;

    /// Bootstrap a par swap curve whose identifier is its currency code.
    ///
    /// # Returns
    /// The zero curve, or `CurveBootstrapFailure` if the currency has no
    /// configured convention or any tenor cannot be solved.
    [[nodiscard]] static Outcome<YieldCurve>
    bootstrap(const YieldCurve& par_curve,
              const SwapConventions& conventions,
              Alignment alignment = Alignment::Nearest);

    /// Fixed-leg cash flows (notional 1, final notional exchange included)
    /// of the swap quoted at `index`.
    [[nodiscard]] static std::optional<CashflowSchedule>
    fixed_leg_schedule(const YieldCurve& par_curve,
                       std::size_t index,
                       const SwapLegConvention& convention);
};

} // namespace rvcurve::curve
