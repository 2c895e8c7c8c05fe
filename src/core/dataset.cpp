/// @file src/core/dataset.cpp
/// @brief TabularDataset column bookkeeping.

#include "erastat/dataset.hpp"
#include "erastat/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace erastat {

// ─── check_rows ───────────────────────────────────────────────────────────────

void TabularDataset::check_rows(RowIndex n, std::string_view what) {
    if (!shaped_) {
        rows_   = n;
        shaped_ = true;
        return;
    }
    if (n != rows_) {
        throw ShapeMismatchError(fmt::format(
            "column '{}' has {} rows, dataset has {}", what, n, rows_));
    }
}

// ─── Features ─────────────────────────────────────────────────────────────────

void TabularDataset::set_features(std::vector<std::string> names, Matrix values) {
    if (static_cast<Eigen::Index>(names.size()) != values.cols()) {
        throw ShapeMismatchError(fmt::format(
            "{} feature names for a matrix with {} columns",
            names.size(), values.cols()));
    }
    check_rows(values.rows(), "features");

    feature_lookup_.clear();
    for (std::size_t i = 0; i < names.size(); ++i) {
        feature_lookup_.emplace(names[i], static_cast<Eigen::Index>(i));
    }
    feature_names_ = std::move(names);
    features_      = std::move(values);
}

std::optional<Eigen::Index>
TabularDataset::feature_index(std::string_view name) const {
    const auto it = feature_lookup_.find(std::string(name));
    if (it == feature_lookup_.end()) return std::nullopt;
    return it->second;
}

Column TabularDataset::feature(std::string_view name) const {
    const auto idx = feature_index(name);
    if (!idx) {
        throw UnknownColumnError(fmt::format("unknown feature '{}'", name));
    }
    return features_.col(*idx);
}

Matrix TabularDataset::feature_block(const std::vector<std::string>& names) const {
    Matrix out(rows_, static_cast<Eigen::Index>(names.size()));
    for (std::size_t j = 0; j < names.size(); ++j) {
        const auto idx = feature_index(names[j]);
        if (!idx) {
            throw UnknownColumnError(fmt::format("unknown feature '{}'", names[j]));
        }
        out.col(static_cast<Eigen::Index>(j)) = features_.col(*idx);
    }
    return out;
}

// ─── Target ───────────────────────────────────────────────────────────────────

void TabularDataset::set_target(std::string name, Column values) {
    check_rows(values.size(), name);
    target_name_ = std::move(name);
    target_      = std::move(values);
}

// ─── Labels ───────────────────────────────────────────────────────────────────

void TabularDataset::set_labels(std::string name, LabelColumn values) {
    check_rows(static_cast<RowIndex>(values.size()), name);
    labels_[std::move(name)] = std::move(values);
}

bool TabularDataset::has_labels(std::string_view name) const {
    return labels_.find(std::string(name)) != labels_.end();
}

const LabelColumn& TabularDataset::labels(std::string_view name) const {
    const auto it = labels_.find(std::string(name));
    if (it == labels_.end()) {
        throw UnknownColumnError(fmt::format("unknown label column '{}'", name));
    }
    return it->second;
}

// ─── Predictions ──────────────────────────────────────────────────────────────

void TabularDataset::set_prediction(const std::string& name, Column values) {
    check_rows(values.size(), name);
    const auto [it, inserted] = predictions_.insert_or_assign(name, std::move(values));
    if (inserted) {
        prediction_order_.push_back(name);
    }
}

bool TabularDataset::has_prediction(std::string_view name) const {
    return predictions_.find(std::string(name)) != predictions_.end();
}

const Column& TabularDataset::prediction(std::string_view name) const {
    const auto it = predictions_.find(std::string(name));
    if (it == predictions_.end()) {
        throw UnknownColumnError(fmt::format("unknown prediction column '{}'", name));
    }
    return it->second;
}

// ─── Generic numeric access ───────────────────────────────────────────────────

bool TabularDataset::has_column(std::string_view name) const {
    return has_prediction(name)
        || feature_index(name).has_value()
        || (has_target() && name == target_name_);
}

Column TabularDataset::numeric_column(std::string_view name) const {
    if (has_prediction(name)) return prediction(name);
    if (const auto idx = feature_index(name)) return features_.col(*idx);
    if (has_target() && name == target_name_) return target_;
    throw UnknownColumnError(fmt::format("unknown column '{}'", name));
}

Matrix TabularDataset::numeric_block(const std::vector<std::string>& names) const {
    Matrix out(rows_, static_cast<Eigen::Index>(names.size()));
    for (std::size_t j = 0; j < names.size(); ++j) {
        out.col(static_cast<Eigen::Index>(j)) = numeric_column(names[j]);
    }
    return out;
}

// ─── Row ids ──────────────────────────────────────────────────────────────────

void TabularDataset::set_row_ids(std::vector<std::string> ids) {
    check_rows(static_cast<RowIndex>(ids.size()), "id");
    row_ids_ = std::move(ids);
}

}  // namespace erastat
