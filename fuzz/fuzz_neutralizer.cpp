/**
 * @file  fuzz_neutralizer.cpp
 * @brief libFuzzer target for Neutralizer::neutralize_era
 *
 * Build:
 *   cmake -DERASTAT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_neutralizer
 *
 * Run for 60 seconds:
 *   ./fuzz_neutralizer -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. Output shape equals the score shape.
 *   3. With normalization on, the output is finite for any finite exposures
 *      (rank transforms absorb extreme or non-finite scores).
 *   4. Every output column has population std 1 or is all zeros.
 *
 * Fuzzer strategy:
 *   Byte 0 picks the neutralizer count k ∈ [0, 7], byte 1 the proportion.
 *   The remaining bytes are read as raw doubles and laid out row-major as
 *   [score, exposure_1 .. exposure_k] per row. This exercises all IEEE 754
 *   bit patterns in the scores, while exposures are clamped to finite values.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>

#include "erastat/neutralizer.hpp"
#include "erastat/stats.hpp"

using namespace erastat;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) return 0;

    const auto   k          = static_cast<Eigen::Index>(data[0] % 8);
    const double proportion = static_cast<double>(data[1]) / 255.0;
    data += 2;
    size -= 2;

    const std::size_t n_doubles = size / sizeof(double);
    const auto        width     = static_cast<std::size_t>(k + 1);
    const auto        rows      = static_cast<Eigen::Index>(n_doubles / width);
    if (rows == 0) return 0;

    Matrix scores(rows, 1);
    Matrix exposures(rows, k);
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < width; ++c) {
            double val{};
            __builtin_memcpy(&val, data + (static_cast<std::size_t>(r) * width + c) * sizeof(double),
                             sizeof(double));
            if (c == 0) {
                scores(r, 0) = val;
            } else {
                // Keep exposures finite and bounded; the engine fills NaN
                // features before neutralizing.
                if (!std::isfinite(val)) val = 0.5;
                exposures(r, static_cast<Eigen::Index>(c - 1)) = std::clamp(val, -1e6, 1e6);
            }
        }
    }

    const Neutralizer neutralizer(NeutralizeOptions{.proportion = proportion, .normalize = true});
    const Matrix out = neutralizer.neutralize_era(scores, exposures, "fuzz");

    // Invariant 2: shape
    assert(out.rows() == rows);
    assert(out.cols() == 1);

    // Invariant 3: finite
    assert(out.allFinite());

    // Invariant 4: unit std or zero-filled
    const double sd = stats::column_stddev(out.col(0));
    assert(out.isZero() || std::abs(sd - 1.0) < 1e-6);

    return 0;
}
