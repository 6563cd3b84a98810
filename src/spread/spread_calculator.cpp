/// @file src/spread/spread_calculator.cpp
/// @brief Gov-vs-Bund, asset-swap and IRS-vs-EUR-IRS spread series.

#include "rvcurve/spread.hpp"

#include <fmt/format.h>

#include <cmath>

namespace rvcurve::spread {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

[[nodiscard]] Alignment alignment_of(const SpreadMode& mode) noexcept {
    return std::visit([](const auto& m) { return m.alignment; }, mode);
}

/// target(t) − reference(t) for every t on the target grid.
SpreadSeries difference_series(const curve::YieldCurve& target,
                               const curve::YieldCurve& reference,
                               SpreadModeKind kind,
                               Alignment alignment) {
    SpreadSeries series{
        .source    = target.identifier(),
        .reference = reference.identifier(),
        .mode      = kind,
    };
    series.points.reserve(target.size());

    const auto tenors = target.tenors();
    const auto rates  = target.rates();
    const auto labels = target.labels();

    for (std::size_t i = 0; i < tenors.size(); ++i) {
        const auto ref = curve::GridInterpolator::rate(reference, tenors[i], alignment);
        if (!ref) {
            series.excluded.push_back(Omission{
                .kind    = ErrorKind::OutOfRangeInterpolation,
                .subject = target.identifier(),
                .tenor   = tenors[i],
                .mode    = kind,
                .reason  = fmt::format("outside {} grid [{}, {}]",
                                       reference.identifier(),
                                       format_tenor(reference.front_tenor()),
                                       format_tenor(reference.back_tenor())),
            });
            continue;
        }
        const double ref_rate = convert_rate(*ref, reference.unit(), target.unit());
        series.points.push_back(SpreadPoint{
            .tenor     = tenors[i],
            .label     = labels[i],
            .spread_bp = SpreadCalculator::spread_bp(rates[i], ref_rate, target.unit()),
        });
    }
    return series;
}

/// Exact zeros on the target grid.
SpreadSeries self_series(const curve::YieldCurve& target, SpreadModeKind kind) {
    SpreadSeries series{
        .source    = target.identifier(),
        .reference = target.identifier(),
        .mode      = kind,
    };
    series.points.reserve(target.size());
    for (std::size_t i = 0; i < target.size(); ++i) {
        series.points.push_back(SpreadPoint{
            .tenor     = target.tenors()[i],
            .label     = target.labels()[i],
            .spread_bp = 0.0,
        });
    }
    return series;
}

} // anonymous namespace

// ─── Mode helpers ─────────────────────────────────────────────────────────────

SpreadModeKind kind_of(const SpreadMode& mode) noexcept {
    return std::visit(overloaded{
        [](const GovVsBund&)   { return SpreadModeKind::GovVsBund; },
        [](const AssetSwap&)   { return SpreadModeKind::AssetSwap; },
        [](const IrsVsEurIrs&) { return SpreadModeKind::IrsVsEurIrs; },
    }, mode);
}

const std::string& reference_of(const SpreadMode& mode) noexcept {
    return std::visit(overloaded{
        [](const GovVsBund& m) -> const std::string& { return m.reference_issuer; },
        [](const AssetSwap& m) -> const std::string& { return m.currency; },
        [](const IrsVsEurIrs& m) -> const std::string& { return m.reference_currency; },
    }, mode);
}

// ─── SpreadSeries ─────────────────────────────────────────────────────────────

std::optional<double> SpreadSeries::at(double tenor) const noexcept {
    for (const auto& p : points) {
        if (std::abs(p.tenor - tenor) <= constants::TENOR_MATCH_TOLERANCE) {
            return p.spread_bp;
        }
    }
    return std::nullopt;
}

std::string SpreadSeries::to_string() const {
    std::string out = fmt::format("{} vs {} ({})\n", source, reference,
                                  rvcurve::to_string(mode));
    for (const auto& p : points) {
        out += fmt::format("  {:>5}  {:>+9.2f} bp\n", p.label, p.spread_bp);
    }
    for (const auto& e : excluded) {
        out += fmt::format("  excluded {}\n", e.to_string());
    }
    return out;
}

// ─── CurveSet ─────────────────────────────────────────────────────────────────

void CurveSet::insert(curve::YieldCurve curve) {
    // Replace the whole entry so the key keeps the newest spelling.
    curves_.erase(curve.identifier());
    std::string id = curve.identifier();
    curves_.emplace(std::move(id), std::move(curve));
}

const curve::YieldCurve* CurveSet::find(std::string_view identifier) const noexcept {
    const auto it = curves_.find(identifier);
    return it == curves_.end() ? nullptr : &it->second;
}

// ─── SpreadCalculator::compute ────────────────────────────────────────────────

Outcome<SpreadSeries>
SpreadCalculator::compute(const curve::YieldCurve& target,
                          const SpreadMode& mode,
                          const CurveSet& references) {
    const SpreadModeKind kind      = kind_of(mode);
    const std::string&   reference = reference_of(mode);

    // Asset-swap and IRS spreads compare zero curves only.
    const bool needs_zero = kind != SpreadModeKind::GovVsBund;
    if (needs_zero && target.kind() != CurveKind::Zero) {
        return Outcome<SpreadSeries>::fail(Omission{
            .kind    = ErrorKind::InvalidInput,
            .subject = target.identifier(),
            .mode    = kind,
            .reason  = fmt::format("{} needs a zero curve, got a {} curve",
                                   rvcurve::to_string(kind), rvcurve::to_string(target.kind())),
        });
    }

    // The reference currency against itself is zero by definition.
    const bool self_irs = std::visit(overloaded{
        [&](const IrsVsEurIrs& m) {
            return identifiers_match(target.identifier(), m.reference_currency);
        },
        [](const auto&) { return false; },
    }, mode);
    if (self_irs) {
        return Outcome<SpreadSeries>::success(self_series(target, kind));
    }

    const curve::YieldCurve* ref_curve = references.find(reference);
    if (ref_curve == nullptr) {
        return Outcome<SpreadSeries>::fail(Omission{
            .kind    = ErrorKind::MissingReferenceCurve,
            .subject = target.identifier(),
            .mode    = kind,
            .reason  = fmt::format("reference curve '{}' not available", reference),
        });
    }

    if (needs_zero && ref_curve->kind() != CurveKind::Zero) {
        return Outcome<SpreadSeries>::fail(Omission{
            .kind    = ErrorKind::InvalidInput,
            .subject = target.identifier(),
            .mode    = kind,
            .reason  = fmt::format("reference curve '{}' is a {} curve, not a zero curve",
                                   ref_curve->identifier(), rvcurve::to_string(ref_curve->kind())),
        });
    }

    return Outcome<SpreadSeries>::success(
        difference_series(target, *ref_curve, kind, alignment_of(mode)));
}

} // namespace rvcurve::spread
