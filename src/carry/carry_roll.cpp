/// @file src/carry/carry_roll.cpp
/// @brief Carry / roll-down approximation and realised-roll comparison.

#include "rvcurve/carry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace rvcurve::carry {

std::vector<Horizon> default_horizons() {
    return {
        {"1M", constants::HORIZON_1M},
        {"3M", constants::HORIZON_3M},
    };
}

std::string CarryRollReport::to_string() const {
    std::string out = fmt::format("{} carry / roll\n", curve);
    for (const auto& e : entries) {
        const std::string carry = e.carry_bp ? fmt::format("{:>+8.2f} bp", *e.carry_bp)
                                             : fmt::format("{:>8} bp", "n/a");
        out += fmt::format("  {:>5} {:>3}  carry {}  roll {:>+8.2f} bp\n",
                           e.label, e.horizon, carry, e.roll_bp);
    }
    for (const auto& o : omissions) {
        out += fmt::format("  skipped {}\n", o.to_string());
    }
    return out;
}

// ─── CarryRollCalculator::compute ─────────────────────────────────────────────

CarryRollReport CarryRollCalculator::compute(const curve::YieldCurve& curve,
                                             std::span<const Horizon> horizons,
                                             const CarryConfig& config) {
    using curve::GridInterpolator;

    CarryRollReport report{.curve = curve.identifier()};
    const double bp = bp_factor(curve.unit());

    const auto tenors = curve.tenors();
    const auto rates  = curve.rates();
    const auto labels = curve.labels();

    for (const auto& h : horizons) {
        if (!std::isfinite(h.years) || h.years <= 0.0) {
            report.omissions.push_back(Omission{
                .kind    = ErrorKind::InvalidInput,
                .subject = curve.identifier(),
                .reason  = fmt::format("horizon {} is not a positive tenor", h.label),
            });
            continue;
        }

        // Funding defaults to the curve's own rate at the horizon.
        const double funding = config.funding_rate
            ? *config.funding_rate
            : *GridInterpolator::rate(curve, h.years, Alignment::Nearest);

        for (std::size_t i = 0; i < tenors.size(); ++i) {
            const double T    = tenors[i];
            const double aged = *GridInterpolator::rate(curve, std::max(T - h.years, 0.0),
                                                        Alignment::Nearest);

            CarryRollEntry entry{
                .tenor         = T,
                .label         = labels[i],
                .horizon       = h.label,
                .horizon_years = h.years,
                .roll_bp       = (aged - rates[i]) * bp,
            };

            // Carry divides by T − h; roll alone survives at the short end.
            if (T - h.years > constants::TENOR_MATCH_TOLERANCE) {
                entry.carry_bp = (rates[i] - funding) * h.years / (T - h.years) * bp;
            } else {
                report.omissions.push_back(Omission{
                    .kind    = ErrorKind::HorizonExceedsTenor,
                    .subject = curve.identifier(),
                    .tenor   = T,
                    .reason  = fmt::format("no carry: {} horizon reaches the {} maturity",
                                           h.label, labels[i]),
                });
            }
            report.entries.push_back(std::move(entry));
        }
    }
    return report;
}

// ─── CarryRollCalculator::compare_realised ────────────────────────────────────

Outcome<std::vector<RealisedRollEntry>>
CarryRollCalculator::compare_realised(const curve::YieldCurve& previous,
                                      const curve::YieldCurve& current) {
    using curve::GridInterpolator;
    using Result = Outcome<std::vector<RealisedRollEntry>>;

    if (!identifiers_match(previous.identifier(), current.identifier())) {
        return Result::fail(Omission{
            .kind    = ErrorKind::InvalidInput,
            .subject = current.identifier(),
            .reason  = fmt::format("cannot compare snapshots of {} and {}",
                                   previous.identifier(), current.identifier()),
        });
    }
    if (current.as_of() <= previous.as_of()) {
        return Result::fail(Omission{
            .kind    = ErrorKind::InvalidInput,
            .subject = current.identifier(),
            .reason  = fmt::format("snapshot {} is not later than {}",
                                   current.as_of(), previous.as_of()),
        });
    }

    const double tau = static_cast<double>(current.as_of() - previous.as_of())
                     / constants::SECONDS_PER_YEAR;
    const double bp  = bp_factor(previous.unit());

    std::vector<RealisedRollEntry> entries;
    const auto tenors = previous.tenors();
    const auto rates  = previous.rates();

    for (std::size_t i = 0; i < tenors.size(); ++i) {
        const double T    = tenors[i];
        const double aged = std::max(T - tau, 0.0);
        const double prev_aged = *GridInterpolator::rate(previous, aged, Alignment::Nearest);
        const double curr_aged = convert_rate(
            *GridInterpolator::rate(current, aged, Alignment::Nearest),
            current.unit(), previous.unit());

        entries.push_back(RealisedRollEntry{
            .tenor              = T,
            .elapsed_years      = tau,
            .predicted_roll_bp  = (prev_aged - rates[i]) * bp,
            .realised_change_bp = (curr_aged - rates[i]) * bp,
        });
    }
    return Result::success(std::move(entries));
}

} // namespace rvcurve::carry
