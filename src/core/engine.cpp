/// @file src/core/engine.cpp
/// @brief One refresh cycle: curves → spreads → shape / carry → hedges.

#include "rvcurve/engine.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>
#include <utility>

namespace rvcurve::core {

namespace {

template <typename T>
void collect(Outcome<T>&& outcome, std::vector<T>& values, std::vector<Omission>& omissions) {
    if (outcome.ok()) {
        values.push_back(std::move(*outcome.value));
    } else {
        omissions.push_back(std::move(*outcome.failure));
    }
}

void append(std::vector<Omission>& into, const std::vector<Omission>& from) {
    into.insert(into.end(), from.begin(), from.end());
}

} // anonymous namespace

std::map<std::string, std::string, std::less<>> g10_issuer_currencies() {
    return {
        {"United States", "USD"},
        {"Canada", "CAD"},
        {"United Kingdom", "GBP"},
        {"Germany", "EUR"},
        {"France", "EUR"},
        {"Italy", "EUR"},
        {"Japan", "JPY"},
        {"Australia", "AUD"},
        {"New Zealand", "NZD"},
        {"Sweden", "SEK"},
    };
}

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

std::optional<std::string> Engine::currency_of(std::string_view issuer) const {
    for (const auto& [name, ccy] : config_.issuer_currency) {
        if (identifiers_match(name, issuer)) return ccy;
    }
    return std::nullopt;
}

// ─── Engine::run ──────────────────────────────────────────────────────────────

RefreshResult Engine::run(const QuoteProvider& bonds,
                          const QuoteProvider& swaps,
                          std::span<const hedge::BondPosition> positions) const {
    RefreshResult out;

    // ── Step 1: Par and zero curves ───────────────────────────────────────────
    build_curves(bonds, swaps, out);

    // ── Step 2: Spread modes and the Gov-vs-Bund matrix ──────────────────────
    compute_spreads(out);

    // ── Step 3: Slopes, flies and carry / roll on issuer zero curves ─────────
    compute_shape_and_carry(out);

    // ── Step 4: DV01 hedges ───────────────────────────────────────────────────
    size_hedges(positions, out);

    return out;
}

RefreshResult Engine::run(const QuoteProvider& bonds,
                          const QuoteProvider& swaps,
                          std::span<const hedge::BondPosition> positions,
                          carry::CurveSnapshotCache& cache) const {
    RefreshResult out = run(bonds, swaps, positions);

    for (const auto& [issuer, zero] : out.zero_curves) {
        if (const auto* previous = cache.latest_before(issuer, zero.as_of())) {
            auto realised = carry::CarryRollCalculator::compare_realised(*previous, zero);
            if (realised.ok()) {
                out.realised_roll.emplace(issuer, std::move(*realised.value));
            } else {
                out.omissions.push_back(std::move(*realised.failure));
            }
        }
        cache.store(zero);
    }
    return out;
}

// ─── Engine::build_curves ─────────────────────────────────────────────────────

void Engine::build_curves(const QuoteProvider& bonds, const QuoteProvider& swaps,
                          RefreshResult& out) const {
    for (const auto& issuer : bonds.identifiers()) {
        const auto quotes = bonds.quotes(issuer);
        auto par = curve::YieldCurve::from_quotes(issuer, quotes);
        if (!par) {
            out.omissions.push_back(Omission{
                .kind    = ErrorKind::InvalidInput,
                .subject = issuer,
                .reason  = "no usable bond quotes",
            });
            continue;
        }

        auto zero = curve::CurveBootstrapper::bootstrap(*par, config_.bond_bootstrap);
        out.par_curves.insert(std::move(*par));
        if (zero.ok()) {
            out.zero_curves.insert(std::move(*zero.value));
        } else {
            out.omissions.push_back(std::move(*zero.failure));
        }
    }

    for (const auto& currency : swaps.identifiers()) {
        const auto quotes = swaps.quotes(currency);
        auto par = curve::YieldCurve::from_quotes(currency, quotes);
        if (!par) {
            out.omissions.push_back(Omission{
                .kind    = ErrorKind::InvalidInput,
                .subject = currency,
                .reason  = "no usable swap quotes",
            });
            continue;
        }

        auto zero = curve::SwapCurveBootstrapper::bootstrap(
            *par, config_.swap_conventions, config_.bond_bootstrap.alignment);
        out.swap_par_curves.insert(std::move(*par));
        if (zero.ok()) {
            out.swap_zero_curves.insert(std::move(*zero.value));
        } else {
            out.omissions.push_back(std::move(*zero.failure));
        }
    }
}

// ─── Engine::compute_spreads ──────────────────────────────────────────────────

void Engine::compute_spreads(RefreshResult& out) const {
    using spread::SpreadCalculator;

    const spread::GovVsBund gov{
        .reference_issuer = config_.reference_issuer,
        .alignment        = config_.spread_alignment,
    };
    for (const auto& [issuer, par] : out.par_curves) {
        collect(SpreadCalculator::compute(par, gov, out.par_curves),
                out.gov_vs_bund, out.omissions);
    }

    for (const auto& [issuer, zero] : out.zero_curves) {
        const auto currency = currency_of(issuer);
        if (!currency) {
            out.omissions.push_back(Omission{
                .kind    = ErrorKind::MissingReferenceCurve,
                .subject = issuer,
                .mode    = SpreadModeKind::AssetSwap,
                .reason  = "no swap currency configured for issuer",
            });
            continue;
        }
        const spread::AssetSwap asw{.currency = *currency, .alignment = config_.spread_alignment};
        collect(SpreadCalculator::compute(zero, asw, out.swap_zero_curves),
                out.asset_swap, out.omissions);
    }

    const spread::IrsVsEurIrs irs{
        .reference_currency = config_.reference_currency,
        .alignment          = config_.spread_alignment,
    };
    for (const auto& [currency, zero] : out.swap_zero_curves) {
        collect(SpreadCalculator::compute(zero, irs, out.swap_zero_curves),
                out.irs_vs_eur, out.omissions);
    }

    for (const auto* series : {&out.gov_vs_bund, &out.asset_swap, &out.irs_vs_eur}) {
        for (const auto& s : *series) {
            append(out.omissions, s.excluded);
        }
    }

    out.matrix = spread::MatrixBuilder::build(out.gov_vs_bund, config_.matrix_tenors);
    append(out.omissions, out.matrix.skipped);
}

// ─── Engine::compute_shape_and_carry ──────────────────────────────────────────

void Engine::compute_shape_and_carry(RefreshResult& out) const {
    for (const auto& [issuer, zero] : out.zero_curves) {
        auto slopes = shape::TwoLegSpreadAnalyzer::analyze(zero, config_.tenor_pairs,
                                                           config_.shape_alignment);
        auto flies  = shape::FlyCalculator::analyze(zero, config_.fly_triples,
                                                    config_.shape_alignment);
        for (auto* report : {&slopes, &flies}) {
            out.shape_metrics.insert(out.shape_metrics.end(),
                                     std::make_move_iterator(report->metrics.begin()),
                                     std::make_move_iterator(report->metrics.end()));
            append(out.omissions, report->omissions);
        }

        auto carry = carry::CarryRollCalculator::compute(zero, config_.horizons, config_.carry);
        append(out.omissions, carry.omissions);
        out.carry_roll.push_back(std::move(carry));
    }
}

// ─── Engine::size_hedges ──────────────────────────────────────────────────────

void Engine::size_hedges(std::span<const hedge::BondPosition> positions,
                         RefreshResult& out) const {
    using hedge::Dv01Calculator;
    using hedge::HedgeSizer;

    for (const auto& pos : positions) {
        const auto* zero = out.zero_curves.find(pos.issuer);
        if (zero == nullptr) {
            out.omissions.push_back(Omission{
                .kind    = ErrorKind::InsufficientHedgeData,
                .subject = pos.description,
                .reason  = fmt::format("no zero curve for {}", pos.issuer),
            });
            continue;
        }
        const auto position_dv01 = Dv01Calculator::bond_dv01(*zero, pos.bond);

        // Futures hedge; an unknown symbol carries no DV01.
        if (pos.futures_symbol) {
            const auto instrument = config_.futures.instrument(*pos.futures_symbol)
                .value_or(hedge::HedgeInstrument{
                    .id            = *pos.futures_symbol,
                    .dv01_per_unit = std::numeric_limits<double>::quiet_NaN(),
                });
            collect(HedgeSizer::size(pos.description, position_dv01, instrument),
                    out.hedges, out.omissions);
        }

        // Receiver-swap hedge at the nearest quoted swap tenor.
        const auto currency = currency_of(pos.issuer);
        const auto* swap_zero = currency ? out.swap_zero_curves.find(*currency) : nullptr;
        const auto convention = currency ? config_.swap_conventions.find(*currency)
                                         : std::nullopt;
        if (swap_zero == nullptr || !convention) {
            out.omissions.push_back(Omission{
                .kind    = ErrorKind::InsufficientHedgeData,
                .subject = pos.description,
                .reason  = "no swap curve for an IRS hedge",
            });
            continue;
        }

        const auto tenor = curve::GridInterpolator::nearest_tenor(*swap_zero, pos.bond.maturity);
        const auto swap_dv01 = tenor
            ? Dv01Calculator::swap_dv01(*swap_zero, *tenor, convention->fixed_frequency)
            : std::nullopt;

        const hedge::HedgeInstrument irs{
            .id            = fmt::format("{} {} IRS", *currency,
                                         tenor ? format_tenor(*tenor) : std::string("?")),
            .dv01_per_unit = swap_dv01 ? *swap_dv01 / constants::PAR_VALUE
                                       : std::numeric_limits<double>::quiet_NaN(),
            .lot_size      = config_.irs_notional_lot,
        };
        collect(HedgeSizer::size(pos.description, position_dv01, irs),
                out.hedges, out.omissions);
    }
}

} // namespace rvcurve::core
