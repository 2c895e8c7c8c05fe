/// @file src/core/pipeline.cpp
/// @brief Pipeline::run: risky features, neutralization, metrics, selection.

#include "erastat/pipeline.hpp"
#include "erastat/era_partition.hpp"
#include "erastat/feature_risk.hpp"
#include "erastat/prediction_source.hpp"

#include <fmt/format.h>

#include <string_view>
#include <utility>

namespace erastat {

namespace {

void report_fills(const std::vector<std::pair<std::string, std::size_t>>& filled,
                  std::string_view split) {
    if (filled.empty()) {
        fmt::print(stderr, "No nans in the {} features.\n", split);
        return;
    }
    std::size_t total = 0;
    for (const auto& [name, count] : filled) {
        fmt::print(stderr, "  {}: {} nan(s)\n", name, count);
        total += count;
    }
    fmt::print(stderr, "Filled {} nan feature cell(s) in {} with {}\n",
               total, split, constants::MISSING_FEATURE_FILL);
}

}  // namespace

Pipeline::Pipeline(PipelineConfig config) : config_(std::move(config)) {}

std::string Pipeline::neutral_column_name(const std::string& column, std::size_t k) {
    return fmt::format("{}_neutral_riskiest_{}", column, k);
}

PipelineResult Pipeline::run(TabularDataset&                 validation,
                             TabularDataset&                 training,
                             const std::vector<std::string>& prediction_columns) const {
    // Construct both engines first so bad options fail before any work.
    const Neutralizer             neutralizer(config_.neutralize);
    const ValidationMetricsEngine metrics(config_.validation);

    const auto val_filled = fill_missing_features(validation);
    if (config_.verbose) report_fills(val_filled, "validation");
    if (&training != &validation) {
        const auto train_filled = fill_missing_features(training);
        if (config_.verbose) report_fills(train_filled, "training");
    }

    const EraPartition train_eras = EraPartition::build(training, config_.era_column);
    const EraPartition val_eras   = EraPartition::build(validation, config_.era_column);
    if (config_.verbose) {
        fmt::print(stderr, "Partitioned {} training eras, {} validation eras\n",
                   train_eras.size(), val_eras.size());
    }

    PipelineResult result;
    result.risky_features =
        FeatureRiskRanker::riskiest(training, train_eras, config_.risky_feature_count);
    if (config_.verbose) {
        fmt::print(stderr, "Selected {} riskiest features\n", result.risky_features.size());
    }

    result.evaluated_columns = prediction_columns;
    for (const auto& column : prediction_columns) {
        const std::string name = neutral_column_name(column, config_.risky_feature_count);
        const Matrix neutral =
            neutralizer.neutralize(validation, {column}, result.risky_features, val_eras);
        validation.set_prediction(name, neutral.col(0));
        result.evaluated_columns.push_back(name);
        if (config_.verbose) {
            fmt::print(stderr, "Neutralized {} -> {}\n", column, name);
        }
    }

    result.stats     = metrics.evaluate(validation, result.evaluated_columns, val_eras);
    result.selection = ModelSelector::select(result.stats, validation);
    if (config_.verbose) {
        fmt::print(stderr, "Selected {} (mean {:.6f})\n",
                   result.selection.column, result.selection.mean);
    }
    return result;
}

}  // namespace erastat
