#pragma once

#include <cstddef>

/// @file include/rvcurve/constants.hpp
/// @brief Numerical and market-convention constants for the rvcurve engine.

namespace rvcurve::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Two tenors closer than this (in years) are the same grid point.
static constexpr double TENOR_MATCH_TOLERANCE = 1e-9;

/// Absolute tolerance on the zero rate (decimal) for the bootstrap root-find.
static constexpr double ROOT_TOLERANCE = 1e-14;

/// Iteration cap for the bootstrap root-find.
static constexpr std::size_t ROOT_MAX_ITERATIONS = 200;

/// Search bracket for a zero rate in decimal (−50 % … +100 %).
static constexpr double ZERO_RATE_LOWER_BOUND = -0.5;
static constexpr double ZERO_RATE_UPPER_BOUND = 1.0;

/// Re-pricing tolerance used by the par round-trip check (price per 100).
static constexpr double REPRICE_TOLERANCE = 1e-8;

// ─── Market Conventions ───────────────────────────────────────────────────────

/// Face value of a bootstrapping instrument priced at par.
static constexpr double PAR_VALUE = 100.0;

/// Basis points per unit of rate difference.
static constexpr double BP_PER_PERCENT = 100.0;
static constexpr double BP_PER_DECIMAL = 10000.0;

/// One basis point expressed in decimal rate units.
static constexpr double ONE_BP = 1e-4;

/// Carry/roll horizons in years.
static constexpr double HORIZON_1M = 1.0 / 12.0;
static constexpr double HORIZON_3M = 0.25;

/// Seconds in an average (Julian) year, for snapshot timestamp differences.
static constexpr double SECONDS_PER_YEAR = 365.25 * 86400.0;

/// Reference issuer for the Gov-vs-Bund mode and the spread matrix.
static constexpr const char* DEFAULT_REFERENCE_ISSUER = "Germany";

/// Reference currency for the IRS-vs-EUR-IRS mode.
static constexpr const char* DEFAULT_REFERENCE_CURRENCY = "EUR";

} // namespace rvcurve::constants
