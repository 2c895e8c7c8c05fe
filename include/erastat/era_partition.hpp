#pragma once

/// @file include/erastat/era_partition.hpp
/// @brief EraPartition: era label → row indices, in chronological order.
///
/// # Module: Era Partitioner
///
/// ## Responsibility
/// Group the rows of a dataset by their era label and fix the chronological
/// order of the eras. Every per-era computation in the engine iterates this
/// partition: slice by `Era::rows`, apply the same pure function to each
/// slice, scatter results back to the same row positions.
///
/// ## Chronological Order
/// Eras sort by the *natural order* of their label: the label is split into
/// runs of digits and runs of non-digits; digit runs compare numerically,
/// other runs lexically. So "era2" < "era10" and "e1" < "e2" < "e3".
/// Every first-half/second-half computation depends on this order.
///
/// ## Guarantees
/// - Each row appears in exactly one era
/// - Row indices inside an era are ascending
/// - Building from the same labels always yields the same order
///
/// ## Errors
/// - `InvalidEraColumn`: column missing, empty, or containing a null label
/// - `InsufficientErasError`: `split_halves()` with fewer than two eras

#include "erastat/dataset.hpp"
#include "erastat/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace erastat {

/// One era: its label and the dataset rows that carry it.
struct Era {
    EraLabel   label;
    RowIndices rows;
};

/// True if `a` precedes `b` in natural (digit-aware) order.
[[nodiscard]] bool natural_less(std::string_view a, std::string_view b) noexcept;

class EraPartition {
public:
    /// Partition `dataset` by the label column `era_column`.
    [[nodiscard]] static EraPartition
    build(const TabularDataset& dataset, std::string_view era_column);

    /// Partition a raw label column.
    [[nodiscard]] static EraPartition from_labels(const LabelColumn& labels);

    /// Eras in chronological order.
    [[nodiscard]] const std::vector<Era>& eras() const noexcept { return eras_; }

    /// Number of eras (m).
    [[nodiscard]] std::size_t size() const noexcept { return eras_.size(); }

    /// Total number of rows covered.
    [[nodiscard]] RowIndex row_count() const noexcept { return rows_; }

    [[nodiscard]] const Era& operator[](std::size_t i) const noexcept { return eras_[i]; }

    /// Chronological position of an era label, or nullopt.
    [[nodiscard]] std::optional<std::size_t> find(std::string_view label) const noexcept;

    /// Era position for every row.
    [[nodiscard]] std::vector<std::size_t> era_of_row() const;

    /// Split into the first ⌈m/2⌉ eras and the remaining eras.
    /// With an odd era count the extra era goes to the first half.
    ///
    /// # Errors
    /// `InsufficientErasError` if m < 2.
    [[nodiscard]] std::pair<std::span<const Era>, std::span<const Era>>
    split_halves() const;

private:
    EraPartition(std::vector<Era> eras, RowIndex rows) noexcept
        : eras_(std::move(eras)), rows_(rows) {}

    std::vector<Era> eras_;
    RowIndex         rows_ = 0;
};

}  // namespace erastat
