#pragma once

/// @file include/erastat/pipeline.hpp
/// @brief Pipeline: end-to-end orchestration of the per-era engine.
///
/// # Module: Pipeline
///
/// ## Responsibility
/// Run the full evaluation flow over already-materialized data:
///   training data → EraPartition → FeatureRiskRanker (riskiest features)
///   validation data → EraPartition → Neutralizer (per prediction column)
///     → ValidationMetricsEngine (stats table) → ModelSelector (winner)
///
/// ## Usage
/// ```cpp
/// PipelineConfig cfg;
/// cfg.validation.fast_mode = true;
/// Pipeline pipeline(cfg);
/// auto result = pipeline.run(validation, training, {"preds_model_target"});
/// fmt::print("{}", result.stats.to_markdown({"mean", "sharpe"}));
/// ```
///
/// ## Side Effects
/// `run` fills NaN feature cells of both datasets with MISSING_FEATURE_FILL
/// and attaches one neutralized column per prediction column to the
/// validation dataset, named `<column>_neutral_riskiest_<k>`.

#include "erastat/constants.hpp"
#include "erastat/dataset.hpp"
#include "erastat/model_selector.hpp"
#include "erastat/neutralizer.hpp"
#include "erastat/validation_metrics.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace erastat {

struct PipelineConfig {
    std::string       era_column          = "era";
    std::size_t       risky_feature_count = constants::DEFAULT_RISKY_FEATURES;
    NeutralizeOptions neutralize{};
    ValidationConfig  validation{};
    bool              verbose             = false;  ///< progress lines on stderr
};

struct PipelineResult {
    std::vector<std::string> risky_features;     ///< riskiest first
    std::vector<std::string> evaluated_columns;  ///< originals then neutralized
    ValidationStatsTable     stats;
    Selection                selection;
};

class Pipeline {
public:
    explicit Pipeline(PipelineConfig config = PipelineConfig{});

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

    /// Run the flow. `training` supplies the risky-feature ranking; pass the
    /// validation set itself when no separate training split is available.
    [[nodiscard]] PipelineResult run(TabularDataset&                 validation,
                                     TabularDataset&                 training,
                                     const std::vector<std::string>& prediction_columns) const;

    /// Name given to the neutralized version of `column`.
    [[nodiscard]] static std::string neutral_column_name(const std::string& column,
                                                         std::size_t        k);

private:
    PipelineConfig config_;
};

}  // namespace erastat
