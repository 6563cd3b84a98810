/// @file src/spread/matrix_builder.cpp
/// @brief Wide issuer × tenor table from Gov-vs-Bund spread series.

#include "rvcurve/spread.hpp"

#include <fmt/format.h>

namespace rvcurve::spread {

std::vector<DisplayTenor> default_matrix_tenors() {
    return {
        {"2Y", 2.0},
        {"5Y", 5.0},
        {"10Y", 10.0},
        {"30Y", 30.0},
    };
}

// ─── SpreadMatrix ─────────────────────────────────────────────────────────────

std::optional<double>
SpreadMatrix::at(std::size_t row, std::size_t col) const noexcept {
    if (row >= cells.size() || col >= cells[row].size()) {
        return std::nullopt;
    }
    return cells[row][col];
}

std::optional<std::size_t>
SpreadMatrix::row_of(std::string_view issuer) const noexcept {
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (identifiers_match(rows[r], issuer)) return r;
    }
    return std::nullopt;
}

std::string SpreadMatrix::to_string() const {
    std::string out = fmt::format("{:<16}", "issuer");
    for (const auto& c : columns) {
        out += fmt::format("{:>10}", c.label);
    }
    out += '\n';

    for (std::size_t r = 0; r < rows.size(); ++r) {
        out += fmt::format("{:<16}", rows[r]);
        for (const auto& cell : cells[r]) {
            if (cell) {
                out += fmt::format("{:>+10.1f}", *cell);
            } else {
                out += fmt::format("{:>10}", "-");
            }
        }
        out += '\n';
    }
    return out;
}

// ─── MatrixBuilder::build ─────────────────────────────────────────────────────

SpreadMatrix MatrixBuilder::build(std::span<const SpreadSeries> series,
                                  std::span<const DisplayTenor> tenors) {
    SpreadMatrix matrix;
    matrix.columns.assign(tenors.begin(), tenors.end());

    for (const auto& s : series) {
        if (s.mode != SpreadModeKind::GovVsBund) {
            matrix.skipped.push_back(Omission{
                .kind    = ErrorKind::InvalidInput,
                .subject = s.source,
                .mode    = s.mode,
                .reason  = "spread matrix only accepts GovVsBund series",
            });
            continue;
        }

        std::vector<std::optional<double>> row;
        row.reserve(tenors.size());
        for (const auto& t : tenors) {
            row.push_back(s.at(t.years));
        }
        matrix.rows.push_back(s.source);
        matrix.cells.push_back(std::move(row));
    }
    return matrix;
}

} // namespace rvcurve::spread
