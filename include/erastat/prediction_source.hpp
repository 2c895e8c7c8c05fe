#pragma once

/// @file include/erastat/prediction_source.hpp
/// @brief Contract for trained models and the feature-hygiene checks around it.
///
/// # Module: Prediction Source
///
/// ## Responsibility
/// Bridge a trained model (a black box owned by the caller) and a dataset:
///   - compare the features the model was trained on with the features the
///     dataset offers, and report drift without failing
///   - build the model's input matrix in its own training feature order
///   - fill missing feature cells before anything downstream sees them
///
/// ## Feature Drift
/// A mismatch is the non-fatal FeatureMismatchWarning: it is returned as a
/// `FeatureAlignment`, logged to stderr, and prediction continues with the
/// model's own training feature list. Features the dataset lacks are fed as
/// MISSING_FEATURE_FILL (0.5, the midpoint of the binned feature range).
///
/// ## NOT Responsible For
/// - Training or loading models

#include "erastat/constants.hpp"
#include "erastat/dataset.hpp"
#include "erastat/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace erastat {

/// A trained model as seen by the engine.
class PredictionModel {
public:
    virtual ~PredictionModel() = default;

    /// Feature names the model was trained on, in training column order.
    [[nodiscard]] virtual std::vector<std::string> expected_features() const = 0;

    /// One score per row of `features` (rows × expected_features().size()).
    [[nodiscard]] virtual Column predict(const Matrix& features) const = 0;
};

/// Difference between a model's features and a dataset's features.
struct FeatureAlignment {
    std::vector<std::string> missing;     ///< expected by the model, absent in the data
    std::vector<std::string> unexpected;  ///< present in the data, unknown to the model

    [[nodiscard]] bool matches() const noexcept {
        return missing.empty() && unexpected.empty();
    }
};

/// Compare two feature sets. Order is irrelevant; output lists keep the
/// order of their source list.
[[nodiscard]] FeatureAlignment
check_feature_alignment(const std::vector<std::string>& expected,
                        const std::vector<std::string>& available);

/// Run `model` over `dataset`, logging a warning on feature drift.
///
/// # Errors
/// `ShapeMismatchError` if the model returns the wrong number of scores.
[[nodiscard]] Column predict_column(const TabularDataset&  dataset,
                                    const PredictionModel& model,
                                    std::string_view       model_name);

/// Replace NaN feature cells with `value`.
///
/// # Returns
/// (feature name, cells filled) for every feature that had missing cells.
std::vector<std::pair<std::string, std::size_t>>
fill_missing_features(TabularDataset& dataset,
                      double value = constants::MISSING_FEATURE_FILL);

}  // namespace erastat
