/// @file src/model/prediction_source.cpp
/// @brief Feature alignment, model input assembly and NaN filling.

#include "erastat/prediction_source.hpp"
#include "erastat/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <unordered_set>

namespace erastat {

// ─── check_feature_alignment ──────────────────────────────────────────────────

FeatureAlignment check_feature_alignment(const std::vector<std::string>& expected,
                                         const std::vector<std::string>& available) {
    const std::unordered_set<std::string> have(available.begin(), available.end());
    const std::unordered_set<std::string> want(expected.begin(), expected.end());

    FeatureAlignment out;
    for (const auto& name : expected) {
        if (have.count(name) == 0) out.missing.push_back(name);
    }
    for (const auto& name : available) {
        if (want.count(name) == 0) out.unexpected.push_back(name);
    }
    return out;
}

// ─── predict_column ───────────────────────────────────────────────────────────

Column predict_column(const TabularDataset&  dataset,
                      const PredictionModel& model,
                      std::string_view       model_name) {
    const auto expected  = model.expected_features();
    const auto alignment = check_feature_alignment(expected, dataset.feature_names());

    if (!alignment.matches()) {
        fmt::print(stderr,
                   "warning: feature set drift for model '{}': {} missing, {} new. "
                   "Might want to retrain.\n",
                   model_name, alignment.missing.size(), alignment.unexpected.size());
    }

    // Assemble in the model's training order; absent features take the fill value.
    Matrix input(dataset.row_count(), static_cast<Eigen::Index>(expected.size()));
    for (std::size_t j = 0; j < expected.size(); ++j) {
        const auto col = static_cast<Eigen::Index>(j);
        if (const auto idx = dataset.feature_index(expected[j])) {
            input.col(col) = dataset.features().col(*idx);
        } else {
            input.col(col).setConstant(constants::MISSING_FEATURE_FILL);
        }
    }

    Column scores = model.predict(input);
    if (scores.size() != dataset.row_count()) {
        throw ShapeMismatchError(fmt::format(
            "model '{}' returned {} scores for {} rows",
            model_name, scores.size(), dataset.row_count()));
    }
    return scores;
}

// ─── fill_missing_features ────────────────────────────────────────────────────

std::vector<std::pair<std::string, std::size_t>>
fill_missing_features(TabularDataset& dataset, double value) {
    std::vector<std::pair<std::string, std::size_t>> filled;
    Matrix& features = dataset.mutable_features();

    for (Eigen::Index f = 0; f < features.cols(); ++f) {
        std::size_t count = 0;
        for (Eigen::Index r = 0; r < features.rows(); ++r) {
            if (std::isnan(features(r, f))) {
                features(r, f) = value;
                ++count;
            }
        }
        if (count > 0) {
            filled.emplace_back(dataset.feature_names()[static_cast<std::size_t>(f)], count);
        }
    }
    return filled;
}

}  // namespace erastat
