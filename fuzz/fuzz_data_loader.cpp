/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader::parse_csv_string and the era pipeline
 *
 * Build:
 *   cmake -DERASTAT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every numeric column of the parsed dataset has row_count() entries.
 *   3. If an era column was parsed, the partition covers every row exactly once.
 *   4. The fast pipeline either throws an erastat::Error or returns a
 *      selection that names one of the evaluated columns.
 *
 * Fuzzer strategy:
 *   Input is passed directly as CSV text. The parser must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • Ragged rows, empty cells, quoted cells, CRLF line endings
 *     • "nan", "inf", exponent notation in numeric columns
 *     • Header-only and comment-only files
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "erastat/data_loader.hpp"
#include "erastat/era_partition.hpp"
#include "erastat/errors.hpp"
#include "erastat/pipeline.hpp"

using namespace erastat;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    TabularDataset ds = DataLoader::parse_csv_string(input);

    // Invariant 2: consistent column lengths
    assert(ds.features().rows() == ds.row_count() || ds.feature_names().empty());
    if (ds.has_target()) {
        assert(ds.target().size() == ds.row_count());
    }
    for (const auto& name : ds.prediction_names()) {
        assert(ds.prediction(name).size() == ds.row_count());
    }

    if (ds.empty() || !ds.has_labels("era")) {
        return 0;
    }

    try {
        // Invariant 3: partition covers every row exactly once
        const auto eras = EraPartition::build(ds, "era");
        std::size_t covered = 0;
        for (const auto& era : eras.eras()) covered += era.rows.size();
        assert(static_cast<RowIndex>(covered) == ds.row_count());

        if (!ds.has_target() || ds.prediction_names().empty()) {
            return 0;
        }

        // Invariant 4: pipeline result is self-consistent
        PipelineConfig cfg;
        cfg.risky_feature_count  = 5;
        cfg.validation.fast_mode = true;
        const auto columns = ds.prediction_names();
        const auto result  = Pipeline(cfg).run(ds, ds, columns);

        assert(result.stats.find(result.selection.column) != nullptr);
        assert(result.selection.prediction.size() == ds.row_count());
        for (const auto& row : result.stats.rows()) {
            assert(std::isfinite(row.sharpe));
        }
    } catch (const Error&) {
        // Structural rejections (null era labels, a single era) are expected.
    }

    return 0;
}
