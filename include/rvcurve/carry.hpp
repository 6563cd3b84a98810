#pragma once

/// @file include/rvcurve/carry.hpp
/// @brief First-order carry and roll-down, plus a caller-owned curve cache.
///
/// # Module: Carry
///
/// ## Responsibility
/// Approximate, for every tenor T of one curve and every horizon h:
///
///     roll  = rate(T − h) − rate(T)                      (bp)
///     carry = (rate(T) − r_f) · h / (T − h)              (bp)
///
/// where r_f is the configured funding rate, or the curve's own rate at h.
/// Roll is the yield change from ageing down an unchanged curve; carry is the
/// forward-breakeven yield pickup from earning rate(T) while funding at r_f.
///
/// Also compares a previous snapshot's predicted roll with the change that
/// actually happened between two snapshots of the same curve.
///
/// ## Guarantees
/// - rate(T − h) below the curve's shortest tenor clamps to the front point,
///   so every tenor gets a roll for every valid horizon
/// - carry is left empty when T ≤ h and reported as `HorizonExceedsTenor`
/// - `CurveSnapshotCache` is plain data owned by the caller; nothing here
///   keeps state between calls
///
/// ## NOT Responsible For
/// - Coupon accrual or repo term structure (first-order approximation only)

#include "rvcurve/constants.hpp"
#include "rvcurve/curve.hpp"
#include "rvcurve/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rvcurve::carry {

// ─── Configuration ────────────────────────────────────────────────────────────

struct Horizon {
    std::string label;  ///< "1M", "3M"
    double      years;
};

/// 1M and 3M.
[[nodiscard]] std::vector<Horizon> default_horizons();

struct CarryConfig {
    /// Funding (repo) rate in the curve's unit. Unset: use rate(h).
    std::optional<double> funding_rate;
};

// ─── Results ──────────────────────────────────────────────────────────────────

struct CarryRollEntry {
    double                tenor;
    std::string           label;
    std::string           horizon;
    double                horizon_years;
    std::optional<double> carry_bp;  ///< Empty when the horizon reaches the tenor
    double                roll_bp;
};

struct CarryRollReport {
    std::string                 curve;
    std::vector<CarryRollEntry> entries;
    std::vector<Omission>       omissions;

    [[nodiscard]] std::string to_string() const;
};

/// Predicted vs realised yield change of one tenor between two snapshots.
struct RealisedRollEntry {
    double tenor;               ///< Tenor on the previous curve
    double elapsed_years;
    double predicted_roll_bp;   ///< prev(T − τ) − prev(T)
    double realised_change_bp;  ///< curr(T − τ) − prev(T)

    [[nodiscard]] double surprise_bp() const noexcept {
        return realised_change_bp - predicted_roll_bp;
    }
};

// ─── CarryRollCalculator ──────────────────────────────────────────────────────

class CarryRollCalculator {
public:
    CarryRollCalculator() = delete;

    [[nodiscard]] static CarryRollReport
    compute(const curve::YieldCurve& curve,
            std::span<const Horizon> horizons,
            const CarryConfig& config = CarryConfig{});

    /// Roll predicted by `previous` over the time elapsed until `current`,
    /// against what `current` shows.
    ///
    /// # Returns
    /// `InvalidInput` if the identifiers differ or `current` is not strictly
    /// later than `previous`.
    [[nodiscard]] static Outcome<std::vector<RealisedRollEntry>>
    compare_realised(const curve::YieldCurve& previous,
                     const curve::YieldCurve& current);
};

// ─── CurveSnapshotCache ───────────────────────────────────────────────────────

/// Snapshots keyed by (identifier, as_of). Owned and serialised by the caller.
class CurveSnapshotCache {
public:
    /// Store `curve`, replacing a snapshot with the same key.
    void store(curve::YieldCurve curve);

    /// Most recent snapshot of `identifier`, or nullptr.
    [[nodiscard]] const curve::YieldCurve* latest(std::string_view identifier) const noexcept;

    /// Most recent snapshot strictly older than `as_of`, or nullptr.
    [[nodiscard]] const curve::YieldCurve*
    latest_before(std::string_view identifier, std::int64_t as_of) const noexcept;

    /// Snapshot with exactly this key, or nullptr.
    [[nodiscard]] const curve::YieldCurve*
    find(std::string_view identifier, std::int64_t as_of) const noexcept;

    /// Drop every snapshot older than `as_of`. Returns the number removed.
    std::size_t evict_before(std::int64_t as_of);

    [[nodiscard]] std::size_t size() const noexcept;

private:
    std::map<std::string, std::map<std::int64_t, curve::YieldCurve>, IdentifierLess> snapshots_;
};

} // namespace rvcurve::carry
