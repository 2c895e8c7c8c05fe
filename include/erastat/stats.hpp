#pragma once

/// @file include/erastat/stats.hpp
/// @brief Moment and correlation helpers shared by the ranking and metric modules.
///
/// All functions are pure and noexcept. Fallible ones return `std::optional`.

#include "erastat/types.hpp"

#include <optional>
#include <span>

namespace erastat::stats {

/// Arithmetic mean. Returns 0.0 for an empty span.
[[nodiscard]] double mean(std::span<const double> v) noexcept;

/// Population standard deviation (ddof = 0). Returns 0.0 for an empty span.
[[nodiscard]] double pop_stddev(std::span<const double> v) noexcept;

/// Population standard deviation of an Eigen column (ddof = 0).
[[nodiscard]] double column_stddev(const Eigen::Ref<const Column>& v) noexcept;

/// Mean over the finite entries only. nullopt if none are finite.
[[nodiscard]] std::optional<double> nan_mean(std::span<const double> v) noexcept;

/// Pearson correlation of `a` and `b` over the rows where both are finite.
///
/// # Returns
/// - `Some(ρ)` in [-1, 1]
/// - `None` if lengths differ, fewer than two complete pairs remain, or
///   either side has (near) zero variance
[[nodiscard]] std::optional<double>
pearson(const Eigen::Ref<const Column>& a, const Eigen::Ref<const Column>& b) noexcept;

/// Sample covariance (ddof = 1) over complete pairs. nullopt as for pearson,
/// except zero variance is allowed.
[[nodiscard]] std::optional<double>
covariance(const Eigen::Ref<const Column>& a, const Eigen::Ref<const Column>& b) noexcept;

/// Gather `v[rows]` into a new column.
[[nodiscard]] Column gather(const Eigen::Ref<const Column>& v, const RowIndices& rows);

/// The subset of `rows` at which `v` is finite, order preserved.
[[nodiscard]] RowIndices finite_rows(const Eigen::Ref<const Column>& v, const RowIndices& rows);

/// Gather `m[rows, :]` into a new matrix.
[[nodiscard]] Matrix gather_rows(const Eigen::Ref<const Matrix>& m, const RowIndices& rows);

}  // namespace erastat::stats
