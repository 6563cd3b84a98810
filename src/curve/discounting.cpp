/// @file src/curve/discounting.cpp
/// @brief Compounding conversions and instrument cash-flow schedules.

#include "discounting.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace rvcurve::curve {

namespace {

/// Payment dates walking back from maturity; multiplying avoids accumulated drift.
std::vector<double> payment_dates(double maturity, Frequency frequency) {
    const double step = 1.0 / static_cast<double>(periods_per_year(frequency));
    std::vector<double> dates;
    for (int j = 0;; ++j) {
        const double d = maturity - static_cast<double>(j) * step;
        if (d <= constants::TENOR_MATCH_TOLERANCE) break;
        dates.push_back(d);
    }
    std::reverse(dates.begin(), dates.end());
    return dates;
}

CashflowSchedule schedule_on(const std::vector<double>& dates, double coupon_rate,
                             double face) {
    const auto n = static_cast<Eigen::Index>(dates.size());
    CashflowSchedule schedule;
    schedule.times.resize(n);
    schedule.amounts.resize(n);

    double previous = 0.0;
    for (Eigen::Index k = 0; k < n; ++k) {
        const double d      = dates[static_cast<std::size_t>(k)];
        schedule.times(k)   = d;
        schedule.amounts(k) = face * coupon_rate * (d - previous);
        previous = d;
    }
    if (n > 0) {
        schedule.amounts(n - 1) += face;
    }
    return schedule;
}

} // anonymous namespace

// ─── coupon_schedule ──────────────────────────────────────────────────────────

CashflowSchedule coupon_schedule(double maturity, double coupon_rate,
                                 Frequency frequency, double face) {
    if (!std::isfinite(maturity) || maturity <= 0.0) {
        return CashflowSchedule{};
    }
    return schedule_on(payment_dates(maturity, frequency), coupon_rate, face);
}

namespace detail {

// ─── discount_factor ──────────────────────────────────────────────────────────

double discount_factor(double zero, double t, Compounding compounding) noexcept {
    switch (compounding) {
        case Compounding::Annual: {
            const double base = 1.0 + zero;
            if (base <= 0.0) return std::numeric_limits<double>::quiet_NaN();
            return std::pow(base, -t);
        }
        case Compounding::Semiannual: {
            const double base = 1.0 + zero / 2.0;
            if (base <= 0.0) return std::numeric_limits<double>::quiet_NaN();
            return std::pow(base, -2.0 * t);
        }
        case Compounding::Continuous:
            return std::exp(-zero * t);
    }
    return std::numeric_limits<double>::quiet_NaN();
}

// ─── zero_from_discount ───────────────────────────────────────────────────────

std::optional<double>
zero_from_discount(double df, double t, Compounding compounding) noexcept {
    if (!std::isfinite(df) || df <= 0.0 || !std::isfinite(t) || t <= 0.0) {
        return std::nullopt;
    }
    switch (compounding) {
        case Compounding::Annual:
            return std::pow(df, -1.0 / t) - 1.0;
        case Compounding::Semiannual:
            return 2.0 * (std::pow(df, -1.0 / (2.0 * t)) - 1.0);
        case Compounding::Continuous:
            return -std::log(df) / t;
    }
    return std::nullopt;
}

// ─── par_schedule ─────────────────────────────────────────────────────────────

CashflowSchedule par_schedule(double tenor, double par_rate, Frequency frequency,
                              Compounding compounding, double notional,
                              bool zero_coupon) {
    const auto dates = payment_dates(tenor, frequency);

    if (zero_coupon || dates.size() <= 1) {
        CashflowSchedule schedule;
        schedule.times   = Eigen::VectorXd::Constant(1, tenor);
        schedule.amounts = Eigen::VectorXd::Constant(
            1, notional / discount_factor(par_rate, tenor, compounding));
        return schedule;
    }
    return schedule_on(dates, par_rate, notional);
}

} // namespace detail

} // namespace rvcurve::curve
