/// @file src/core/era_partition.cpp
/// @brief EraPartition construction and natural-order sorting.

#include "erastat/era_partition.hpp"
#include "erastat/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

namespace erastat {

namespace {

[[nodiscard]] bool is_digit(char c) noexcept {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/// Order-preserving key for std::map that compares labels naturally.
struct NaturalLess {
    bool operator()(const std::string& a, const std::string& b) const noexcept {
        return natural_less(a, b);
    }
};

}  // namespace

// ─── natural_less ─────────────────────────────────────────────────────────────

bool natural_less(std::string_view a, std::string_view b) noexcept {
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (is_digit(a[i]) && is_digit(b[j])) {
            // Compare digit runs by value: strip leading zeros, then length,
            // then lexically.
            std::size_t ei = i;
            std::size_t ej = j;
            while (ei < a.size() && is_digit(a[ei])) ++ei;
            while (ej < b.size() && is_digit(b[ej])) ++ej;

            std::size_t zi = i;
            std::size_t zj = j;
            while (zi + 1 < ei && a[zi] == '0') ++zi;
            while (zj + 1 < ej && b[zj] == '0') ++zj;

            const std::string_view da = a.substr(zi, ei - zi);
            const std::string_view db = b.substr(zj, ej - zj);
            if (da.size() != db.size()) return da.size() < db.size();
            if (da != db) return da < db;
            // Equal value: fewer leading zeros first keeps the order total.
            if ((ei - i) != (ej - j)) return (ei - i) < (ej - j);
            i = ei;
            j = ej;
            continue;
        }
        if (a[i] != b[j]) return a[i] < b[j];
        ++i;
        ++j;
    }
    return (a.size() - i) < (b.size() - j);
}

// ─── build / from_labels ──────────────────────────────────────────────────────

EraPartition EraPartition::build(const TabularDataset& dataset,
                                 std::string_view era_column) {
    if (!dataset.has_labels(era_column)) {
        throw InvalidEraColumn(fmt::format("era column '{}' not found", era_column));
    }
    return from_labels(dataset.labels(era_column));
}

EraPartition EraPartition::from_labels(const LabelColumn& labels) {
    if (labels.empty()) {
        throw InvalidEraColumn("era column is empty");
    }

    std::map<std::string, RowIndices, NaturalLess> grouped;
    for (std::size_t r = 0; r < labels.size(); ++r) {
        if (!labels[r].has_value()) {
            throw InvalidEraColumn(fmt::format("null era label at row {}", r));
        }
        grouped[*labels[r]].push_back(static_cast<RowIndex>(r));
    }

    std::vector<Era> eras;
    eras.reserve(grouped.size());
    for (auto& [label, rows] : grouped) {
        eras.push_back(Era{.label = label, .rows = std::move(rows)});
    }
    return EraPartition(std::move(eras), static_cast<RowIndex>(labels.size()));
}

// ─── Lookups ──────────────────────────────────────────────────────────────────

std::optional<std::size_t> EraPartition::find(std::string_view label) const noexcept {
    for (std::size_t i = 0; i < eras_.size(); ++i) {
        if (eras_[i].label == label) return i;
    }
    return std::nullopt;
}

std::vector<std::size_t> EraPartition::era_of_row() const {
    std::vector<std::size_t> out(static_cast<std::size_t>(rows_), 0);
    for (std::size_t e = 0; e < eras_.size(); ++e) {
        for (RowIndex r : eras_[e].rows) {
            out[static_cast<std::size_t>(r)] = e;
        }
    }
    return out;
}

// ─── split_halves ─────────────────────────────────────────────────────────────

std::pair<std::span<const Era>, std::span<const Era>>
EraPartition::split_halves() const {
    const std::size_t m = eras_.size();
    if (m < 2) {
        throw InsufficientErasError(fmt::format(
            "need at least 2 eras to split into halves, have {}", m));
    }
    const std::size_t first = (m + 1) / 2;  // ⌈m/2⌉
    const std::span<const Era> all(eras_);
    return {all.first(first), all.subspan(first)};
}

}  // namespace erastat
