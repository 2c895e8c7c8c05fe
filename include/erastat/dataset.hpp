#pragma once

/// @file include/erastat/dataset.hpp
/// @brief TabularDataset: column store for one tournament data split.
///
/// # Module: Tabular Dataset
///
/// ## Responsibility
/// Hold the materialized columns every other module reads:
///   - feature columns: a rows × features matrix with ordered names
///   - target column:   one numeric value per row (NaN for unlabeled rows)
///   - label columns:   categorical, e.g. "era" and "data_type"
///   - prediction columns: named numeric columns, in insertion order
///   - row ids (optional)
///
/// ## Guarantees
/// - Every numeric column has exactly `row_count()` entries; a setter that
///   would break this throws `ShapeMismatchError`.
/// - Derived columns are attached with `set_prediction`, never written into
///   an existing column's storage.
/// - Lookups by an unknown name throw `UnknownColumnError`.
///
/// ## NOT Responsible For
/// - Parsing files (see data_loader.hpp)
/// - Grouping rows by era (see era_partition.hpp)

#include "erastat/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace erastat {

class TabularDataset {
public:
    TabularDataset() = default;

    // ── Shape ────────────────────────────────────────────────────────────────

    /// Number of rows. Fixed by the first column that is set.
    [[nodiscard]] RowIndex row_count() const noexcept { return rows_; }

    [[nodiscard]] bool empty() const noexcept { return rows_ == 0; }

    // ── Features ─────────────────────────────────────────────────────────────

    /// Replace the feature block. `names.size()` must equal `values.cols()`.
    void set_features(std::vector<std::string> names, Matrix values);

    [[nodiscard]] const std::vector<std::string>& feature_names() const noexcept {
        return feature_names_;
    }

    /// rows × features matrix, columns in `feature_names()` order.
    [[nodiscard]] const Matrix& features() const noexcept { return features_; }

    /// Mutable access for in-place hygiene (NaN filling).
    [[nodiscard]] Matrix& mutable_features() noexcept { return features_; }

    /// Column position of a feature, or nullopt.
    [[nodiscard]] std::optional<Eigen::Index>
    feature_index(std::string_view name) const;

    /// One feature column by name. Throws UnknownColumnError.
    [[nodiscard]] Column feature(std::string_view name) const;

    /// Feature sub-matrix for the given names, in the given order.
    [[nodiscard]] Matrix feature_block(const std::vector<std::string>& names) const;

    // ── Target ───────────────────────────────────────────────────────────────

    void set_target(std::string name, Column values);

    [[nodiscard]] const std::string& target_name() const noexcept { return target_name_; }
    [[nodiscard]] const Column& target() const noexcept { return target_; }
    [[nodiscard]] bool has_target() const noexcept { return !target_name_.empty(); }

    // ── Labels ───────────────────────────────────────────────────────────────

    void set_labels(std::string name, LabelColumn values);

    [[nodiscard]] bool has_labels(std::string_view name) const;

    /// Categorical column by name. Throws UnknownColumnError.
    [[nodiscard]] const LabelColumn& labels(std::string_view name) const;

    // ── Predictions ──────────────────────────────────────────────────────────

    /// Insert a new prediction column or replace an existing one.
    void set_prediction(const std::string& name, Column values);

    [[nodiscard]] bool has_prediction(std::string_view name) const;

    /// Prediction column by name. Throws UnknownColumnError.
    [[nodiscard]] const Column& prediction(std::string_view name) const;

    /// Prediction column names in insertion order.
    [[nodiscard]] const std::vector<std::string>& prediction_names() const noexcept {
        return prediction_order_;
    }

    // ── Generic numeric access ───────────────────────────────────────────────

    /// True if `name` is a feature, prediction, or the target.
    [[nodiscard]] bool has_column(std::string_view name) const;

    /// Resolve a numeric column by name: prediction first, then feature, then
    /// target. Throws UnknownColumnError.
    [[nodiscard]] Column numeric_column(std::string_view name) const;

    /// Stack several numeric columns into a rows × names.size() matrix.
    [[nodiscard]] Matrix numeric_block(const std::vector<std::string>& names) const;

    // ── Row ids ──────────────────────────────────────────────────────────────

    void set_row_ids(std::vector<std::string> ids);

    [[nodiscard]] const std::vector<std::string>& row_ids() const noexcept { return row_ids_; }

private:
    /// Fix the row count on first use; throw on any later disagreement.
    void check_rows(RowIndex n, std::string_view what);

    RowIndex                                     rows_ = 0;
    bool                                         shaped_ = false;
    std::vector<std::string>                     feature_names_;
    std::unordered_map<std::string, Eigen::Index> feature_lookup_;
    Matrix                                       features_;
    std::string                                  target_name_;
    Column                                       target_;
    std::unordered_map<std::string, LabelColumn> labels_;
    std::unordered_map<std::string, Column>      predictions_;
    std::vector<std::string>                     prediction_order_;
    std::vector<std::string>                     row_ids_;
};

}  // namespace erastat
