#pragma once

/// @file include/erastat/model_selector.hpp
/// @brief ModelSelector: pick the best column and rank it for submission.
///
/// Selection rule: highest `mean` per-era score; equal means resolve to the
/// lexicographically smallest column name so the choice is deterministic.
/// The chosen column is then percentile-ranked over the whole dataset
/// (rank / n with ordinal ties), which is the submission format. Missing
/// predictions stay NaN and are not counted in n.

#include "erastat/dataset.hpp"
#include "erastat/types.hpp"
#include "erastat/validation_metrics.hpp"

#include <string>

namespace erastat {

/// The winning column and its submission-ready values.
struct Selection {
    std::string column;
    double      mean = 0.0;
    Column      prediction;  ///< percentile ranks in (0, 1] or NaN, original row order
};

class ModelSelector {
public:
    ModelSelector() = delete;

    /// Name of the row with the maximum mean.
    ///
    /// # Errors
    /// `DegenerateInputError` if the table is empty.
    [[nodiscard]] static std::string best_column(const ValidationStatsTable& table);

    /// Choose the best column and percentile-rank its values from `dataset`.
    [[nodiscard]] static Selection select(const ValidationStatsTable& table,
                                          const TabularDataset&       dataset);
};

}  // namespace erastat
