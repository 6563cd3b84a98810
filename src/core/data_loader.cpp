/// @file src/core/data_loader.cpp
/// @brief Header-driven CSV quote loader.

#include "rvcurve/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace rvcurve::core {

namespace {

struct ColumnMap {
    std::optional<std::size_t> identifier;
    std::optional<std::size_t> tenor;
    std::optional<std::size_t> years;
    std::optional<std::size_t> rate;
    std::optional<std::size_t> unit;
    std::optional<std::size_t> previous;
    std::optional<std::size_t> high;
    std::optional<std::size_t> low;
    std::optional<std::size_t> change;
    std::optional<std::size_t> timestamp;
};

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] std::string lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

/// Split one CSV line; double-quoted fields may contain commas.
[[nodiscard]] std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
        } else if (c == ',' && !quoted) {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

[[nodiscard]] ColumnMap map_columns(const std::vector<std::string>& header) {
    ColumnMap cols;
    for (std::size_t i = 0; i < header.size(); ++i) {
        const std::string name = lower(trim(header[i]));
        if (name == "country" || name == "issuer" || name == "currency") {
            if (!cols.identifier) cols.identifier = i;
        } else if (name == "tenor") {
            cols.tenor = i;
        } else if (name == "years") {
            cols.years = i;
        } else if (name == "yield" || name == "rate") {
            if (!cols.rate) cols.rate = i;
        } else if (name == "unit") {
            cols.unit = i;
        } else if (name == "prev." || name == "prev") {
            cols.previous = i;
        } else if (name == "high") {
            cols.high = i;
        } else if (name == "low") {
            cols.low = i;
        } else if (name == "chg." || name == "chg") {
            cols.change = i;
        } else if (name == "time" || name == "timestamp") {
            cols.timestamp = i;
        }
    }
    return cols;
}

[[nodiscard]] std::optional<std::string_view>
field_at(const std::vector<std::string>& fields, std::optional<std::size_t> col) noexcept {
    if (!col || *col >= fields.size()) return std::nullopt;
    const auto v = trim(fields[*col]);
    if (v.empty()) return std::nullopt;
    return v;
}

[[nodiscard]] std::optional<double>
number_at(const std::vector<std::string>& fields, std::optional<std::size_t> col) {
    const auto v = field_at(fields, col);
    if (!v) return std::nullopt;
    return QuoteLoader::parse_number(*v);
}

/// Parse one data row. Returns `nullopt` if a required field is missing or malformed.
[[nodiscard]] std::optional<Quote>
parse_row(const std::vector<std::string>& fields, const ColumnMap& cols,
          RateUnit default_unit) {
    const auto id = field_at(fields, cols.identifier);
    if (!id) return std::nullopt;

    const auto rate = number_at(fields, cols.rate);
    if (!rate) return std::nullopt;

    std::string label;
    if (const auto t = field_at(fields, cols.tenor)) {
        label = std::string(*t);
        for (char& c : label) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }

    std::optional<double> years = number_at(fields, cols.years);
    if (!years && !label.empty()) {
        years = tenor_to_years(label);
    }
    if (!years || !std::isfinite(*years) || *years <= 0.0) {
        return std::nullopt;
    }
    if (label.empty()) {
        label = format_tenor(*years);
    }

    RateUnit unit = default_unit;
    if (const auto u = field_at(fields, cols.unit)) {
        const auto parsed = QuoteLoader::parse_unit(*u);
        if (!parsed) return std::nullopt;
        unit = *parsed;
    }

    Quote q{
        .identifier  = std::string(*id),
        .tenor_label = std::move(label),
        .years       = *years,
        .rate        = *rate,
        .unit        = unit,
        .previous    = number_at(fields, cols.previous),
        .high        = number_at(fields, cols.high),
        .low         = number_at(fields, cols.low),
        .change      = number_at(fields, cols.change),
    };
    if (const auto ts = number_at(fields, cols.timestamp)) {
        q.timestamp = static_cast<std::int64_t>(std::llround(*ts));
    }
    return q;
}

} // anonymous namespace

// ─── QuoteLoader::parse_number ────────────────────────────────────────────────

std::optional<double> QuoteLoader::parse_number(std::string_view field) {
    std::string cleaned;
    cleaned.reserve(field.size());
    for (char c : trim(field)) {
        if (c == ',' || c == '+') continue;
        cleaned += c;
    }
    if (!cleaned.empty() && cleaned.back() == '%') {
        cleaned.pop_back();
    }
    if (cleaned.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* begin = cleaned.data();
    const char* end   = cleaned.data() + cleaned.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) {
        return std::nullopt;  // trailing garbage or overflow
    }
    return value;
}

// ─── QuoteLoader::parse_unit ──────────────────────────────────────────────────

std::optional<RateUnit> QuoteLoader::parse_unit(std::string_view field) {
    const std::string u = lower(trim(field));
    if (u == "percent" || u == "%" || u == "pct") return RateUnit::Percent;
    if (u == "decimal" || u == "dec")             return RateUnit::Decimal;
    return std::nullopt;
}

// ─── QuoteLoader::parse_csv_string ────────────────────────────────────────────

std::vector<Quote>
QuoteLoader::parse_csv_string(const std::string& csv_content,
                              RateUnit default_unit) {
    std::vector<Quote> quotes;
    std::istringstream stream(csv_content);
    std::string line;
    std::optional<ColumnMap> cols;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty() || line[0] == '#') {
            continue;
        }

        // First non-empty, non-comment line is the header.
        if (!cols) {
            cols = map_columns(split_fields(line));
            if (!cols->identifier || !cols->rate || (!cols->tenor && !cols->years)) {
                return quotes;
            }
            continue;
        }

        if (auto q = parse_row(split_fields(line), *cols, default_unit)) {
            quotes.push_back(std::move(*q));
        }
    }
    return quotes;
}

// ─── QuoteLoader::load_csv ────────────────────────────────────────────────────

std::optional<std::vector<Quote>>
QuoteLoader::load_csv(const std::string& filepath, RateUnit default_unit) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str(), default_unit);
}

// ─── QuoteLoader::identifiers ─────────────────────────────────────────────────

std::vector<std::string> QuoteLoader::identifiers(std::span<const Quote> quotes) {
    std::vector<std::string> ids;
    for (const auto& q : quotes) {
        if (std::find(ids.begin(), ids.end(), q.identifier) == ids.end()) {
            ids.push_back(q.identifier);
        }
    }
    return ids;
}

} // namespace rvcurve::core
