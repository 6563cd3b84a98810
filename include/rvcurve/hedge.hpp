#pragma once

/// @file include/rvcurve/hedge.hpp
/// @brief DV01 by bump-and-reprice and DV01-matched hedge sizing.
///
/// # Module: Hedge
///
/// ## Responsibility
/// Measure how much a position's value moves for a 1 bp rate shift, and
/// propose the integral number of hedge units (futures contracts, swap
/// notional lots) that best offsets it.
///
/// ## DV01 Convention
/// DV01 is reported as a positive amount: |P(curve + 1 bp) − P(curve)| in
/// the position's currency. It is a first difference, not a derivative.
///
/// ## Guarantees
/// - Non-positive, non-finite or missing DV01 inputs produce
///   `InsufficientHedgeData`, never a proposal
/// - `residual_dv01 = position_dv01 − units · dv01_per_unit` exactly
///
/// ## NOT Responsible For
/// - Cheapest-to-deliver or conversion-factor modelling of futures

#include "rvcurve/curve.hpp"
#include "rvcurve/types.hpp"

#include <Eigen/Dense>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rvcurve::hedge {

// ─── Instruments ──────────────────────────────────────────────────────────────

/// Plain fixed-coupon bullet bond.
struct FixedRateBond {
    double    face        = 100.0;
    double    coupon_rate = 0.0;                ///< In `unit`
    RateUnit  unit        = RateUnit::Percent;
    double    maturity    = 0.0;                ///< Years
    Frequency frequency   = Frequency::Semiannual;
};

/// A bond holding to be hedged.
struct BondPosition {
    std::string                description;     ///< e.g. "France 10Y 3.0%"
    std::string                issuer;          ///< Curve identifier
    FixedRateBond              bond;
    std::optional<std::string> futures_symbol;  ///< e.g. "FGBL"
};

/// Something that can be bought or sold to offset DV01.
struct HedgeInstrument {
    std::string id;
    double      dv01_per_unit = 0.0;  ///< Per contract / per unit notional
    double      lot_size      = 1.0;  ///< Units are rounded to multiples of this
};

// ─── Dv01Calculator ───────────────────────────────────────────────────────────

class Dv01Calculator {
public:
    Dv01Calculator() = delete;

    /// Dirty price of `bond` off a zero curve. `nullopt` if it cannot be priced.
    [[nodiscard]] static std::optional<double>
    price(const curve::YieldCurve& zero_curve, const FixedRateBond& bond);

    /// Parallel DV01: every zero rate moved up by 1 bp.
    [[nodiscard]] static std::optional<double>
    bond_dv01(const curve::YieldCurve& zero_curve, const FixedRateBond& bond);

    /// Key-rate DV01s: entry i is P(curve) − P(curve with node i + 1 bp).
    /// With linear interpolation the entries sum to the parallel DV01 to
    /// first order.
    [[nodiscard]] static std::optional<Eigen::VectorXd>
    key_rate_dv01(const curve::YieldCurve& zero_curve, const FixedRateBond& bond);

    /// Price off a single flat yield, compounded at the coupon frequency.
    [[nodiscard]] static double
    yield_price(const FixedRateBond& bond, double yield) noexcept;

    /// DV01 of `bond` from a flat-yield bump.
    [[nodiscard]] static double
    yield_dv01(const FixedRateBond& bond, double yield) noexcept;

    /// DV01 per 100 notional of a par receiver swap of `tenor` on a swap
    /// zero curve, with the floating leg held at par.
    [[nodiscard]] static std::optional<double>
    swap_dv01(const curve::YieldCurve& swap_zero_curve,
              double tenor,
              Frequency fixed_frequency);
};

// ─── FuturesDv01Table ─────────────────────────────────────────────────────────

/// Average DV01 per contract, keyed by futures symbol.
class FuturesDv01Table {
public:
    /// FGBL 85, ZN 80, ZB 120, FGBM 55, FGBS 30.
    [[nodiscard]] static FuturesDv01Table defaults();

    void set(std::string symbol, double dv01_per_contract);

    /// Case-insensitive look-up.
    [[nodiscard]] std::optional<double> find(std::string_view symbol) const noexcept;

    /// The symbol as a one-contract-lot hedge instrument.
    [[nodiscard]] std::optional<HedgeInstrument> instrument(std::string_view symbol) const;

private:
    std::map<std::string, double, IdentifierLess> table_;
};

// ─── HedgeSizer ───────────────────────────────────────────────────────────────

struct HedgeProposal {
    std::string position;
    std::string instrument;
    double      position_dv01;
    double      instrument_dv01_per_unit;
    double      hedge_ratio;    ///< Unrounded units
    double      units;          ///< Rounded to the instrument's lot size
    double      residual_dv01;

    [[nodiscard]] std::string to_string() const;
};

class HedgeSizer {
public:
    HedgeSizer() = delete;

    /// Size a hedge for `position_dv01` with `instrument`.
    ///
    /// # Returns
    /// `InsufficientHedgeData` if either DV01 is absent, non-finite or
    /// non-positive; `InvalidInput` for a non-positive lot size.
    [[nodiscard]] static Outcome<HedgeProposal>
    size(std::string_view description,
         std::optional<double> position_dv01,
         const HedgeInstrument& instrument);
};

/// Liquidity score in [0, 1]: 0.4 for on-the-run, up to 0.3 for a tight
/// bid/ask and up to 0.3 for daily volume (200mm or more scores full).
[[nodiscard]] double liquidity_score(bool on_the_run,
                                     std::optional<double> bid_ask_bp,
                                     std::optional<double> daily_volume_mm) noexcept;

} // namespace rvcurve::hedge
