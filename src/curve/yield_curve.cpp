/// @file src/curve/yield_curve.cpp
/// @brief YieldCurve construction, validation and bumping.

#include "rvcurve/curve.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace rvcurve::curve {

// ─── Construction ─────────────────────────────────────────────────────────────

YieldCurve::YieldCurve(CurveDefinition def) noexcept
    : def_(std::move(def)) {}

std::optional<YieldCurve> YieldCurve::make(CurveDefinition def) {
    if (def.tenors.empty() || def.tenors.size() != def.rates.size()) {
        return std::nullopt;
    }
    if (!def.labels.empty() && def.labels.size() != def.tenors.size()) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i < def.tenors.size(); ++i) {
        const double t = def.tenors[i];
        if (!std::isfinite(t) || t <= 0.0)       return std::nullopt;
        if (!std::isfinite(def.rates[i]))        return std::nullopt;
        if (i > 0 && t - def.tenors[i - 1] <= constants::TENOR_MATCH_TOLERANCE) {
            return std::nullopt;  // not strictly increasing
        }
    }

    if (def.labels.empty()) {
        def.labels.reserve(def.tenors.size());
        for (double t : def.tenors) {
            def.labels.push_back(format_tenor(t));
        }
    }

    return YieldCurve(std::move(def));
}

std::optional<YieldCurve>
YieldCurve::from_quotes(std::string_view identifier,
                        std::span<const Quote> quotes) {
    std::vector<const Quote*> usable;
    for (const auto& q : quotes) {
        if (!identifiers_match(q.identifier, identifier)) continue;
        if (!std::isfinite(q.years) || q.years <= 0.0) continue;
        if (!std::isfinite(q.rate)) continue;
        usable.push_back(&q);
    }
    if (usable.empty()) {
        return std::nullopt;
    }

    const RateUnit unit = usable.front()->unit;

    std::stable_sort(usable.begin(), usable.end(),
                     [](const Quote* a, const Quote* b) { return a->years < b->years; });

    CurveDefinition def{
        .identifier = std::string(identifier),
        .kind       = CurveKind::Par,
        .unit       = unit,
    };

    // Collapse quotes sharing a tenor into their average.
    std::size_t i = 0;
    while (i < usable.size()) {
        const double t = usable[i]->years;
        double sum = 0.0;
        std::size_t count = 0;
        std::size_t j = i;
        while (j < usable.size() &&
               usable[j]->years - t <= constants::TENOR_MATCH_TOLERANCE) {
            sum += convert_rate(usable[j]->rate, usable[j]->unit, unit);
            ++count;
            if (usable[j]->timestamp && *usable[j]->timestamp > def.as_of) {
                def.as_of = *usable[j]->timestamp;
            }
            ++j;
        }
        def.tenors.push_back(t);
        def.rates.push_back(sum / static_cast<double>(count));
        def.labels.push_back(usable[i]->tenor_label.empty()
                                 ? format_tenor(t)
                                 : usable[i]->tenor_label);
        i = j;
    }

    return make(std::move(def));
}

// ─── Accessors ────────────────────────────────────────────────────────────────

std::vector<double> YieldCurve::decimal_rates() const {
    std::vector<double> out;
    out.reserve(def_.rates.size());
    for (double r : def_.rates) {
        out.push_back(convert_rate(r, def_.unit, RateUnit::Decimal));
    }
    return out;
}

std::optional<std::size_t> YieldCurve::find(double tenor) const noexcept {
    return GridInterpolator::find_exact(def_.tenors, tenor);
}

// ─── Bumping ──────────────────────────────────────────────────────────────────

YieldCurve YieldCurve::shifted(double shift) const {
    CurveDefinition def = def_;
    for (double& r : def.rates) {
        r += shift;
    }
    return YieldCurve(std::move(def));
}

std::optional<YieldCurve>
YieldCurve::shifted_at(std::size_t index, double shift) const {
    if (index >= def_.rates.size()) {
        return std::nullopt;
    }
    CurveDefinition def = def_;
    def.rates[index] += shift;
    return YieldCurve(std::move(def));
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string YieldCurve::to_string() const {
    std::string out = fmt::format("{} {} curve ({})", def_.identifier,
                                  rvcurve::to_string(def_.kind),
                                  rvcurve::to_string(def_.unit));
    if (def_.compounding && def_.frequency) {
        out += fmt::format(" [{} compounding, {} coupons]",
                           rvcurve::to_string(*def_.compounding),
                           rvcurve::to_string(*def_.frequency));
    }
    out += '\n';
    for (std::size_t i = 0; i < def_.tenors.size(); ++i) {
        out += fmt::format("  {:>5}  {:>9.4f}\n", def_.labels[i], def_.rates[i]);
    }
    return out;
}

} // namespace rvcurve::curve
