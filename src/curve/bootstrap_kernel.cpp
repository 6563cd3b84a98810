/// @file src/curve/bootstrap_kernel.cpp
/// @brief Par → zero recursion: closed-form isolation with a secant fallback.

#include "bootstrap_kernel.hpp"

#include "discounting.hpp"
#include "solver1d.hpp"
#include "rvcurve/constants.hpp"
#include "rvcurve/curve.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>

namespace rvcurve::curve::detail {

namespace {

/// Sum of amount · DF over flows [begin, end) priced off the solved points.
/// Returns `nullopt` if a date cannot be interpolated under `alignment`.
std::optional<double>
known_leg_value(const CashflowSchedule& schedule,
                Eigen::Index begin, Eigen::Index end,
                std::span<const double> solved_tenors,
                std::span<const double> solved_zeros,
                Compounding compounding,
                Alignment alignment,
                double& failed_at) noexcept {
    double pv = 0.0;
    for (Eigen::Index k = begin; k < end; ++k) {
        const double t = schedule.times(k);
        const auto z = GridInterpolator::rate(solved_tenors, solved_zeros, t, alignment);
        if (!z) {
            failed_at = t;
            return std::nullopt;
        }
        pv += schedule.amounts(k) * discount_factor(*z, t, compounding);
    }
    return pv;
}

} // anonymous namespace

KernelResult
bootstrap_par_rates(std::span<const double> tenors,
                    std::span<const double> par_rates,
                    Frequency frequency,
                    Compounding compounding,
                    Alignment alignment,
                    double notional) {
    KernelResult result;
    result.zeros.reserve(tenors.size());

    std::vector<double> solved_tenors;
    solved_tenors.reserve(tenors.size());

    for (std::size_t i = 0; i < tenors.size(); ++i) {
        const double T   = tenors[i];
        const double par = par_rates[i];

        const CashflowSchedule schedule =
            par_schedule(T, par, frequency, compounding, notional, i == 0);
        const Eigen::Index n = schedule.times.size();

        auto fail = [&](std::string reason) {
            result.failure = KernelFailure{T, std::move(reason)};
            return result;
        };

        // Single flow: money-market instrument, zero equals par.
        if (n == 1) {
            if (!std::isfinite(schedule.amounts(0))) {
                return fail(fmt::format("par rate {:.6f} has no valid discount factor", par));
            }
            result.zeros.push_back(par);
            solved_tenors.push_back(T);
            continue;
        }

        const double last_solved = solved_tenors.back();

        // Flows [0, n_known) sit on the solved grid; [n_known, n-1) are in the gap.
        Eigen::Index n_known = 0;
        while (n_known < n - 1 &&
               schedule.times(n_known) <= last_solved + constants::TENOR_MATCH_TOLERANCE) {
            ++n_known;
        }

        double failed_at = 0.0;
        const auto known = known_leg_value(schedule, 0, n_known, solved_tenors,
                                           result.zeros, compounding, alignment,
                                           failed_at);
        if (!known) {
            return fail(fmt::format("coupon at {:.4f}y lies outside the bootstrapped grid",
                                    failed_at));
        }

        const double final_amount = schedule.amounts(n - 1);

        if (n_known == n - 1) {
            // Closed form: only DF(T) is unknown.
            const double df = (notional - *known) / final_amount;
            const auto z = zero_from_discount(df, T, compounding);
            if (!z) {
                return fail(fmt::format("implied discount factor {:.6g} is not positive", df));
            }
            result.zeros.push_back(*z);
            solved_tenors.push_back(T);
            continue;
        }

        // Gap coupons interpolate between the last solved point and (T, z).
        std::vector<double> trial_tenors = solved_tenors;
        std::vector<double> trial_zeros  = result.zeros;
        trial_tenors.push_back(T);
        trial_zeros.push_back(0.0);

        auto residual = [&](double z) {
            trial_zeros.back() = z;
            double pv = *known;
            for (Eigen::Index k = n_known; k < n; ++k) {
                const double t  = schedule.times(k);
                const auto   zk = GridInterpolator::rate(trial_tenors, trial_zeros, t,
                                                         Alignment::Nearest);
                if (!zk) return std::numeric_limits<double>::quiet_NaN();
                pv += schedule.amounts(k) * discount_factor(*zk, t, compounding);
            }
            return pv - notional;
        };

        const auto root = solve_bracketed(residual,
                                          constants::ZERO_RATE_LOWER_BOUND,
                                          constants::ZERO_RATE_UPPER_BOUND,
                                          constants::ROOT_TOLERANCE,
                                          constants::ROOT_MAX_ITERATIONS);
        if (!root) {
            return fail("no zero rate in the search bracket reprices the instrument to par");
        }
        result.zeros.push_back(*root);
        solved_tenors.push_back(T);
    }

    return result;
}

} // namespace rvcurve::curve::detail
