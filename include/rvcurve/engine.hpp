#pragma once

/// @file include/rvcurve/engine.hpp
/// @brief One refresh cycle of the relative-value pipeline.
///
/// # Module: Engine
///
/// ## Responsibility
/// Run every analytic over one quote snapshot:
///   bond quotes → par curves → zero curves ─┐
///   swap quotes → swap par → swap zeros ────┼→ spreads (3 modes) → matrix
///                                           ├→ slopes, flies, carry / roll
///                                           └→ DV01 hedges for positions
///
/// ## Usage
/// ```cpp
/// auto quotes = QuoteLoader::load_csv("bonds.csv");
/// if (quotes) {
///     InMemoryQuoteProvider bonds(std::move(*quotes));
///     StaticSwapQuoteProvider swaps;
///     Engine engine;
///     const auto result = engine.run(bonds, swaps);
///     fmt::print("{}", result.matrix.to_string());
/// }
/// ```
///
/// ## Guarantees
/// - One failing issuer, currency, mode or position never blanks the rest;
///   every skipped unit appears in `RefreshResult::omissions`
/// - `run` is const: the engine holds configuration only. The optional
///   snapshot cache is owned and serialised by the caller

#include "rvcurve/carry.hpp"
#include "rvcurve/constants.hpp"
#include "rvcurve/curve.hpp"
#include "rvcurve/data_loader.hpp"
#include "rvcurve/hedge.hpp"
#include "rvcurve/shape.hpp"
#include "rvcurve/spread.hpp"
#include "rvcurve/types.hpp"

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rvcurve::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// United States → USD, Canada → CAD, United Kingdom → GBP, Germany / France /
/// Italy → EUR, Japan → JPY, Australia → AUD, New Zealand → NZD, Sweden → SEK.
[[nodiscard]] std::map<std::string, std::string, std::less<>> g10_issuer_currencies();

struct EngineConfig {
    /// Reference issuer for Gov-vs-Bund and the matrix.
    std::string reference_issuer = constants::DEFAULT_REFERENCE_ISSUER;

    /// Reference currency for IRS-vs-EUR-IRS.
    std::string reference_currency = constants::DEFAULT_REFERENCE_CURRENCY;

    /// Issuer → swap currency, for asset swaps and IRS hedges.
    std::map<std::string, std::string, std::less<>> issuer_currency = g10_issuer_currencies();

    /// Government bonds: semiannual coupons, continuous compounding.
    curve::BootstrapConfig bond_bootstrap{};

    curve::SwapConventions swap_conventions = curve::SwapConventions::g10_defaults();

    /// Reference look-ups in all three spread modes.
    Alignment spread_alignment = Alignment::Nearest;

    std::vector<spread::DisplayTenor> matrix_tenors = spread::default_matrix_tenors();

    std::vector<shape::TenorPair> tenor_pairs = shape::default_tenor_pairs();
    std::vector<shape::FlyTriple> fly_triples = shape::default_fly_triples();
    Alignment                     shape_alignment = Alignment::Strict;

    std::vector<carry::Horizon> horizons = carry::default_horizons();
    carry::CarryConfig          carry{};

    hedge::FuturesDv01Table futures = hedge::FuturesDv01Table::defaults();

    /// IRS hedge notionals are rounded to multiples of this.
    double irs_notional_lot = 1.0;
};

// ─── RefreshResult ────────────────────────────────────────────────────────────

struct RefreshResult {
    spread::CurveSet par_curves;        ///< Per issuer
    spread::CurveSet zero_curves;       ///< Per issuer
    spread::CurveSet swap_par_curves;   ///< Per currency
    spread::CurveSet swap_zero_curves;  ///< Per currency

    std::vector<spread::SpreadSeries> gov_vs_bund;
    std::vector<spread::SpreadSeries> asset_swap;
    std::vector<spread::SpreadSeries> irs_vs_eur;
    spread::SpreadMatrix              matrix;

    std::vector<shape::ShapeMetric>     shape_metrics;  ///< Slopes then flies, per issuer
    std::vector<carry::CarryRollReport> carry_roll;

    /// Predicted vs realised roll per issuer, when a previous snapshot exists.
    std::map<std::string, std::vector<carry::RealisedRollEntry>> realised_roll;

    std::vector<hedge::HedgeProposal> hedges;

    std::vector<Omission> omissions;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Run one refresh cycle.
    [[nodiscard]] RefreshResult
    run(const QuoteProvider& bonds,
        const QuoteProvider& swaps,
        std::span<const hedge::BondPosition> positions = {}) const;

    /// Same, then compare each issuer's zero curve with its latest older
    /// snapshot in `cache` and store the new curves there.
    [[nodiscard]] RefreshResult
    run(const QuoteProvider& bonds,
        const QuoteProvider& swaps,
        std::span<const hedge::BondPosition> positions,
        carry::CurveSnapshotCache& cache) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    void build_curves(const QuoteProvider& bonds, const QuoteProvider& swaps,
                      RefreshResult& out) const;
    void compute_spreads(RefreshResult& out) const;
    void compute_shape_and_carry(RefreshResult& out) const;
    void size_hedges(std::span<const hedge::BondPosition> positions,
                     RefreshResult& out) const;

    [[nodiscard]] std::optional<std::string>
    currency_of(std::string_view issuer) const;

    EngineConfig config_;
};

} // namespace rvcurve::core
