/// @file src/core/types.cpp
/// @brief Enum names, unit conversion and tenor-label helpers.

#include "rvcurve/types.hpp"
#include "rvcurve/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace rvcurve {

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(RateUnit u) noexcept {
    switch (u) {
        case RateUnit::Percent: return "percent";
        case RateUnit::Decimal: return "decimal";
    }
    return "unknown";
}

const char* to_string(CurveKind k) noexcept {
    switch (k) {
        case CurveKind::Par:  return "par";
        case CurveKind::Zero: return "zero";
    }
    return "unknown";
}

const char* to_string(Compounding c) noexcept {
    switch (c) {
        case Compounding::Annual:     return "annual";
        case Compounding::Semiannual: return "semiannual";
        case Compounding::Continuous: return "continuous";
    }
    return "unknown";
}

const char* to_string(Frequency f) noexcept {
    switch (f) {
        case Frequency::Annual:     return "annual";
        case Frequency::Semiannual: return "semiannual";
        case Frequency::Quarterly:  return "quarterly";
    }
    return "unknown";
}

const char* to_string(Alignment a) noexcept {
    switch (a) {
        case Alignment::Strict:  return "strict";
        case Alignment::Nearest: return "nearest";
    }
    return "unknown";
}

const char* to_string(SpreadModeKind m) noexcept {
    switch (m) {
        case SpreadModeKind::GovVsBund:   return "GovVsBund";
        case SpreadModeKind::AssetSwap:   return "AssetSwap";
        case SpreadModeKind::IrsVsEurIrs: return "IrsVsEurIrs";
    }
    return "unknown";
}

const char* to_string(ErrorKind e) noexcept {
    switch (e) {
        case ErrorKind::CurveBootstrapFailure:   return "CurveBootstrapFailure";
        case ErrorKind::MissingReferenceCurve:   return "MissingReferenceCurve";
        case ErrorKind::OutOfRangeInterpolation: return "OutOfRangeInterpolation";
        case ErrorKind::InsufficientHedgeData:   return "InsufficientHedgeData";
        case ErrorKind::HorizonExceedsTenor:     return "HorizonExceedsTenor";
        case ErrorKind::InvalidInput:            return "InvalidInput";
    }
    return "unknown";
}

// ─── Units ────────────────────────────────────────────────────────────────────

double bp_factor(RateUnit unit) noexcept {
    return unit == RateUnit::Percent ? constants::BP_PER_PERCENT
                                     : constants::BP_PER_DECIMAL;
}

double convert_rate(double rate, RateUnit from, RateUnit to) noexcept {
    if (from == to) {
        return rate;
    }
    return from == RateUnit::Percent ? rate / 100.0 : rate * 100.0;
}

// ─── Tenor labels ─────────────────────────────────────────────────────────────

std::optional<double> tenor_to_years(std::string_view label) noexcept {
    // Trim surrounding whitespace.
    while (!label.empty() && std::isspace(static_cast<unsigned char>(label.front()))) {
        label.remove_prefix(1);
    }
    while (!label.empty() && std::isspace(static_cast<unsigned char>(label.back()))) {
        label.remove_suffix(1);
    }
    if (label.size() < 2) {
        return std::nullopt;
    }

    const char unit = static_cast<char>(
        std::toupper(static_cast<unsigned char>(label.back())));
    if (unit != 'Y' && unit != 'M') {
        return std::nullopt;
    }

    std::string_view digits = label.substr(0, label.size() - 1);
    while (!digits.empty() && std::isspace(static_cast<unsigned char>(digits.back()))) {
        digits.remove_suffix(1);
    }

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(digits.data(),
                                           digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    if (!std::isfinite(value) || value <= 0.0) {
        return std::nullopt;
    }

    return unit == 'Y' ? value : value / 12.0;
}

std::string format_tenor(double years) {
    const double whole_years = std::round(years);
    if (years >= 1.0 && std::abs(years - whole_years) < 1e-9) {
        return fmt::format("{}Y", static_cast<long long>(whole_years));
    }
    const double months = std::round(years * 12.0);
    if (std::abs(years * 12.0 - months) < 1e-6) {
        return fmt::format("{}M", static_cast<long long>(months));
    }
    return fmt::format("{:.4g}Y", years);
}

// ─── Identifiers ──────────────────────────────────────────────────────────────

namespace {

[[nodiscard]] int fold(char c) noexcept {
    return std::toupper(static_cast<unsigned char>(c));
}

} // anonymous namespace

bool identifiers_match(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (fold(a[i]) != fold(b[i])) return false;
    }
    return true;
}

bool IdentifierLess::operator()(std::string_view a, std::string_view b) const noexcept {
    const std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        const int ca = fold(a[i]);
        const int cb = fold(b[i]);
        if (ca != cb) return ca < cb;
    }
    return a.size() < b.size();
}

// ─── Omission ─────────────────────────────────────────────────────────────────

std::string Omission::to_string() const {
    std::string where = subject;
    if (tenor) {
        where += ' ';
        where += format_tenor(*tenor);
    }
    if (mode) {
        where += fmt::format(" ({})", rvcurve::to_string(*mode));
    }
    return fmt::format("[{}] {}: {}", rvcurve::to_string(kind), where, reason);
}

} // namespace rvcurve
