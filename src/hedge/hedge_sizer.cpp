/// @file src/hedge/hedge_sizer.cpp
/// @brief DV01-matched hedge proposals, futures DV01 table, liquidity score.

#include "rvcurve/hedge.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace rvcurve::hedge {

namespace {

[[nodiscard]] std::string upper(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

[[nodiscard]] bool usable_dv01(std::optional<double> dv01) noexcept {
    return dv01 && std::isfinite(*dv01) && *dv01 > 0.0;
}

} // anonymous namespace

// ─── FuturesDv01Table ─────────────────────────────────────────────────────────

FuturesDv01Table FuturesDv01Table::defaults() {
    FuturesDv01Table table;
    table.set("FGBL", 85.0);   // Bund 10Y
    table.set("ZN", 80.0);     // UST 10Y note
    table.set("ZB", 120.0);    // UST bond
    table.set("FGBM", 55.0);   // Bobl 5Y
    table.set("FGBS", 30.0);   // Schatz 2Y
    return table;
}

void FuturesDv01Table::set(std::string symbol, double dv01_per_contract) {
    table_[upper(symbol)] = dv01_per_contract;
}

std::optional<double> FuturesDv01Table::find(std::string_view symbol) const noexcept {
    const auto it = table_.find(symbol);
    if (it == table_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<HedgeInstrument> FuturesDv01Table::instrument(std::string_view symbol) const {
    const auto dv01 = find(symbol);
    if (!dv01) {
        return std::nullopt;
    }
    return HedgeInstrument{.id = upper(symbol), .dv01_per_unit = *dv01, .lot_size = 1.0};
}

// ─── HedgeProposal ────────────────────────────────────────────────────────────

std::string HedgeProposal::to_string() const {
    return fmt::format("{}: {:+.4g} x {} (ratio {:.4f}, DV01 {:.2f} vs {:.4g}/unit, residual {:+.4f})",
                       position, units, instrument, hedge_ratio,
                       position_dv01, instrument_dv01_per_unit, residual_dv01);
}

// ─── HedgeSizer::size ─────────────────────────────────────────────────────────

Outcome<HedgeProposal>
HedgeSizer::size(std::string_view description,
                 std::optional<double> position_dv01,
                 const HedgeInstrument& instrument) {
    if (!usable_dv01(position_dv01)) {
        return Outcome<HedgeProposal>::fail(Omission{
            .kind    = ErrorKind::InsufficientHedgeData,
            .subject = std::string(description),
            .reason  = "position DV01 is missing or not positive",
        });
    }
    if (!usable_dv01(instrument.dv01_per_unit)) {
        return Outcome<HedgeProposal>::fail(Omission{
            .kind    = ErrorKind::InsufficientHedgeData,
            .subject = std::string(description),
            .reason  = fmt::format("{} DV01 per unit is missing or not positive",
                                   instrument.id),
        });
    }
    if (!std::isfinite(instrument.lot_size) || instrument.lot_size <= 0.0) {
        return Outcome<HedgeProposal>::fail(Omission{
            .kind    = ErrorKind::InvalidInput,
            .subject = std::string(description),
            .reason  = fmt::format("{} lot size must be positive", instrument.id),
        });
    }

    const double ratio = *position_dv01 / instrument.dv01_per_unit;
    const double units = std::round(ratio / instrument.lot_size) * instrument.lot_size;

    return Outcome<HedgeProposal>::success(HedgeProposal{
        .position                 = std::string(description),
        .instrument               = instrument.id,
        .position_dv01            = *position_dv01,
        .instrument_dv01_per_unit = instrument.dv01_per_unit,
        .hedge_ratio              = ratio,
        .units                    = units,
        .residual_dv01            = *position_dv01 - units * instrument.dv01_per_unit,
    });
}

// ─── liquidity_score ──────────────────────────────────────────────────────────

double liquidity_score(bool on_the_run,
                       std::optional<double> bid_ask_bp,
                       std::optional<double> daily_volume_mm) noexcept {
    double score = on_the_run ? 0.4 : 0.0;
    if (bid_ask_bp && std::isfinite(*bid_ask_bp)) {
        score += std::clamp(0.3 * (2.0 / std::max(0.5, *bid_ask_bp)), 0.0, 0.3);
    }
    if (daily_volume_mm && std::isfinite(*daily_volume_mm)) {
        score += std::clamp(0.3 * (*daily_volume_mm / 200.0), 0.0, 0.3);
    }
    return std::min(1.0, score);
}

} // namespace rvcurve::hedge
