/**
 * @file  fuzz_quote_loader.cpp
 * @brief libFuzzer target for QuoteLoader::parse_csv_string and the curve
 *        construction that consumes its output.
 *
 * Build:
 *   cmake -DRVCURVE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_quote_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_quote_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every returned quote has a non-empty identifier, a finite positive
 *      tenor and a finite rate.
 *   3. A curve built from the quotes has strictly increasing tenors.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "rvcurve/curve.hpp"
#include "rvcurve/data_loader.hpp"

using namespace rvcurve;
using namespace rvcurve::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto quotes = QuoteLoader::parse_csv_string(input);
    for (const auto& q : quotes) {
        assert(!q.identifier.empty());
        assert(std::isfinite(q.years) && q.years > 0.0);
        assert(std::isfinite(q.rate));
    }

    for (const auto& id : QuoteLoader::identifiers(quotes)) {
        const auto curve = curve::YieldCurve::from_quotes(id, quotes);
        if (!curve) continue;
        const auto tenors = curve->tenors();
        for (std::size_t i = 1; i < tenors.size(); ++i) {
            assert(tenors[i] > tenors[i - 1]);
        }
        assert(curve->labels().size() == tenors.size());
    }
    return 0;
}
