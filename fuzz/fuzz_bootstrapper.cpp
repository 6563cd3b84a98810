/**
 * @file  fuzz_bootstrapper.cpp
 * @brief libFuzzer target for CurveBootstrapper over arbitrary par grids.
 *
 * Build:
 *   cmake -DRVCURVE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_bootstrapper
 *
 * Input layout: consecutive pairs of doubles (tenor, par rate in percent),
 * plus one trailing byte selecting compounding / frequency / alignment.
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. A successful bootstrap keeps the grid and yields finite zero rates.
 *   3. A failure is a CurveBootstrapFailure naming a tenor on the grid.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "rvcurve/curve.hpp"

using namespace rvcurve;
using namespace rvcurve::curve;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) return 0;

    const uint8_t selector = data[size - 1];
    const std::size_t n_doubles = (size - 1) / sizeof(double);

    std::vector<double> tenors;
    std::vector<double> rates;
    for (std::size_t k = 0; k + 1 < n_doubles && tenors.size() < 40; k += 2) {
        double t = 0.0;
        double r = 0.0;
        std::memcpy(&t, data + k * sizeof(double), sizeof(double));
        std::memcpy(&r, data + (k + 1) * sizeof(double), sizeof(double));
        tenors.push_back(t);
        rates.push_back(r);
    }

    auto par = YieldCurve::make(CurveDefinition{
        .identifier = "Fuzz", .tenors = tenors, .rates = rates});
    if (!par) return 0;

    const Compounding comps[] = {Compounding::Annual, Compounding::Semiannual,
                                 Compounding::Continuous};
    const Frequency freqs[] = {Frequency::Annual, Frequency::Semiannual,
                               Frequency::Quarterly};
    const BootstrapConfig cfg{
        .compounding = comps[selector % 3],
        .frequency   = freqs[(selector / 3) % 3],
        .alignment   = (selector & 0x80) ? Alignment::Strict : Alignment::Nearest,
    };

    // Very long maturities produce very long schedules; keep runs bounded.
    if (par->back_tenor() > 100.0) return 0;

    const auto zero = CurveBootstrapper::bootstrap(*par, cfg);
    if (zero.ok()) {
        assert(zero.value->size() == par->size());
        for (double z : zero.value->rates()) {
            assert(std::isfinite(z));
        }
    } else {
        assert(zero.failure->kind == ErrorKind::CurveBootstrapFailure);
        if (zero.failure->tenor) {
            assert(par->find(*zero.failure->tenor).has_value());
        }
    }
    return 0;
}
