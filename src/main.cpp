/// @file src/main.cpp
/// @brief rvcurve CLI entry point.
///
/// Usage:
///   rvcurve --bonds <csv> [--swaps <csv>] [--unit percent|decimal]
///           [--align strict|nearest] [--hedge <position>]...
///   rvcurve --help
///
/// A hedge position is "issuer,maturity,coupon,face[,futures]", e.g.
/// "France,10,3.0,10000000,FGBL".

#include "rvcurve/data_loader.hpp"
#include "rvcurve/engine.hpp"

#include <fmt/core.h>

#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  rvcurve --bonds <csv> [options]   Bootstrap curves and print RV analytics\n"
        "  rvcurve --help                    Show this help\n"
        "\n"
        "Options:\n"
        "  --swaps <csv>              Swap par quotes (default: built-in G10 table)\n"
        "  --unit percent|decimal     Unit of rates without a 'unit' column (default percent)\n"
        "  --align strict|nearest     Spread reference alignment (default nearest)\n"
        "  --hedge <position>         issuer,maturity,coupon,face[,futures]; repeatable\n"
        "\n"
        "CSV format (header required):\n"
        "  country,tenor,yield[,unit,prev.,high,low,chg.,time]\n"
    );
}

struct CliOptions {
    std::string                        bonds_path;
    std::optional<std::string>         swaps_path;
    rvcurve::RateUnit                  unit      = rvcurve::RateUnit::Percent;
    rvcurve::Alignment                 alignment = rvcurve::Alignment::Nearest;
    std::vector<rvcurve::hedge::BondPosition> positions;
};

/// "France,10,3.0,10000000,FGBL" → position. Returns `nullopt` if malformed.
std::optional<rvcurve::hedge::BondPosition> parse_hedge_position(const std::string& text) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == ',') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    if (parts.size() < 4 || parts.size() > 5 || parts[0].empty()) {
        return std::nullopt;
    }

    using rvcurve::core::QuoteLoader;
    const auto maturity = QuoteLoader::parse_number(parts[1]);
    const auto coupon   = QuoteLoader::parse_number(parts[2]);
    const auto face     = QuoteLoader::parse_number(parts[3]);
    if (!maturity || !coupon || !face || *maturity <= 0.0 || *face <= 0.0) {
        return std::nullopt;
    }

    rvcurve::hedge::BondPosition pos{
        .description = fmt::format("{} {}Y {:.3f}%", parts[0], *maturity, *coupon),
        .issuer      = parts[0],
        .bond        = rvcurve::hedge::FixedRateBond{
            .face        = *face,
            .coupon_rate = *coupon,
            .unit        = rvcurve::RateUnit::Percent,
            .maturity    = *maturity,
        },
    };
    if (parts.size() == 5 && !parts[4].empty()) {
        pos.futures_symbol = parts[4];
    }
    return pos;
}

/// Parse argv. Returns `nullopt` (after printing the reason) on bad input.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        const bool has_value = i + 1 < argc;

        if (arg == "--bonds" && has_value) {
            opts.bonds_path = argv[++i];
        } else if (arg == "--swaps" && has_value) {
            opts.swaps_path = std::string(argv[++i]);
        } else if (arg == "--unit" && has_value) {
            const auto unit = rvcurve::core::QuoteLoader::parse_unit(argv[++i]);
            if (!unit) {
                fmt::print(stderr, "Error: unknown unit '{}'\n", argv[i]);
                return std::nullopt;
            }
            opts.unit = *unit;
        } else if (arg == "--align" && has_value) {
            const std::string a(argv[++i]);
            if (a == "strict") {
                opts.alignment = rvcurve::Alignment::Strict;
            } else if (a == "nearest") {
                opts.alignment = rvcurve::Alignment::Nearest;
            } else {
                fmt::print(stderr, "Error: unknown alignment '{}'\n", a);
                return std::nullopt;
            }
        } else if (arg == "--hedge" && has_value) {
            auto pos = parse_hedge_position(argv[++i]);
            if (!pos) {
                fmt::print(stderr, "Error: malformed hedge position '{}'\n", argv[i]);
                return std::nullopt;
            }
            opts.positions.push_back(std::move(*pos));
        } else {
            fmt::print(stderr, "Unknown or incomplete option: {}\n", arg);
            return std::nullopt;
        }
    }

    if (opts.bonds_path.empty()) {
        fmt::print(stderr, "Error: --bonds is required\n");
        return std::nullopt;
    }
    return opts;
}

void print_result(const rvcurve::core::RefreshResult& result) {
    fmt::print("=== Zero curves ===\n");
    for (const auto& [id, zero] : result.zero_curves) {
        fmt::print("{}", zero.to_string());
    }

    fmt::print("\n=== Gov vs Bund ===\n");
    for (const auto& s : result.gov_vs_bund) fmt::print("{}", s.to_string());

    fmt::print("\n=== Asset swap spreads ===\n");
    for (const auto& s : result.asset_swap) fmt::print("{}", s.to_string());

    fmt::print("\n=== IRS vs EUR IRS ===\n");
    for (const auto& s : result.irs_vs_eur) fmt::print("{}", s.to_string());

    fmt::print("\n=== Spread matrix (bp) ===\n{}", result.matrix.to_string());

    fmt::print("\n=== Curve shape ===\n");
    for (const auto& m : result.shape_metrics) fmt::print("{}\n", m.to_string());

    fmt::print("\n=== Carry / roll ===\n");
    for (const auto& c : result.carry_roll) fmt::print("{}", c.to_string());

    if (!result.hedges.empty()) {
        fmt::print("\n=== Hedges ===\n");
        for (const auto& h : result.hedges) fmt::print("{}\n", h.to_string());
    }

    if (!result.omissions.empty()) {
        fmt::print("\n=== Omissions ({}) ===\n", result.omissions.size());
        for (const auto& o : result.omissions) fmt::print("{}\n", o.to_string());
    }
}

/// Returns 0 on success, 1 on error.
int run(const CliOptions& opts) {
    using namespace rvcurve::core;

    auto bond_quotes = QuoteLoader::load_csv(opts.bonds_path, opts.unit);
    if (!bond_quotes) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.bonds_path);
        return 1;
    }
    if (bond_quotes->empty()) {
        fmt::print(stderr, "Error: no valid quotes loaded from '{}'\n", opts.bonds_path);
        return 1;
    }
    fmt::print("Loaded {} bond quotes from '{}'\n", bond_quotes->size(), opts.bonds_path);
    const InMemoryQuoteProvider bonds(std::move(*bond_quotes));

    EngineConfig config;
    config.spread_alignment = opts.alignment;
    const Engine engine(std::move(config));

    if (opts.swaps_path) {
        auto swap_quotes = QuoteLoader::load_csv(*opts.swaps_path, opts.unit);
        if (!swap_quotes) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", *opts.swaps_path);
            return 1;
        }
        const InMemoryQuoteProvider swaps(std::move(*swap_quotes));
        print_result(engine.run(bonds, swaps, opts.positions));
    } else {
        const StaticSwapQuoteProvider swaps;
        print_result(engine.run(bonds, swaps, opts.positions));
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string first(argv[1]);
    if (first == "--help" || first == "-h") {
        print_usage();
        return 0;
    }

    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }
    return run(*opts);
}
