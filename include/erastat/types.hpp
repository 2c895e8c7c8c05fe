#pragma once

/// @file include/erastat/types.hpp
/// @brief Shared primitive types for the erastat per-era statistics engine.
///
/// Every module includes this file. It defines the Eigen-based column and
/// matrix aliases and the small value types used to address rows and eras.

#include <Eigen/Dense>

#include <optional>
#include <string>
#include <vector>

namespace erastat {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// One numeric column of a dataset (feature, target or prediction).
using Column = Eigen::VectorXd;

/// A rows × columns block of numeric data (features, or several predictions).
using Matrix = Eigen::MatrixXd;

/// Row position inside a TabularDataset. Signed to match Eigen::Index.
using RowIndex = Eigen::Index;

/// Ordered list of row positions (one era's slice of the dataset).
using RowIndices = std::vector<RowIndex>;

// ─── Labels ───────────────────────────────────────────────────────────────────

/// Value of a categorical cell. `nullopt` is a null label.
using Label = std::optional<std::string>;

/// A categorical column.
using LabelColumn = std::vector<Label>;

/// Name of an era, e.g. "era121".
using EraLabel = std::string;

}  // namespace erastat
