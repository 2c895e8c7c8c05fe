#pragma once

/// @file include/erastat/feature_risk.hpp
/// @brief CorrelationMatrix and FeatureRiskRanker: which features drift over time.
///
/// # Module: Feature Risk Ranker
///
/// ## Responsibility
/// A feature is "risky" when its correlation with the target in early eras
/// differs from its correlation in late eras. Predictions that lean on such a
/// feature are fragile, so the riskiest features become the neutralizer set.
///
/// ## Algorithm
/// 1. CorrelationMatrix(e, f) = Pearson(feature f, target) within era e,
///    eras in chronological order. NaN where undefined.
/// 2. Split eras into the first ⌈m/2⌉ and the rest.
/// 3. change(f) = |mean₂(f) − mean₁(f)|, means over the defined entries of
///    each half. A half with no defined entry gives change 0.
/// 4. Stable sort descending by change; ties keep feature column order.
///
/// ## Guarantees
/// - `riskiest(k)` returns min(k, feature count) distinct feature names
/// - Deterministic for the same dataset and k
///
/// ## Errors
/// - `InsufficientErasError` if fewer than two eras
/// - `ShapeMismatchError` if the partition does not cover the dataset
/// - `UnknownColumnError` if the dataset has no target column

#include "erastat/dataset.hpp"
#include "erastat/era_partition.hpp"
#include "erastat/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace erastat {

// ─── CorrelationMatrix ────────────────────────────────────────────────────────

/// Per-era feature/target correlations. Immutable once built.
class CorrelationMatrix {
public:
    /// Correlate every feature of `dataset` with its target, era by era.
    [[nodiscard]] static CorrelationMatrix
    build(const TabularDataset& dataset, const EraPartition& eras);

    /// Assemble from precomputed values (eras × features).
    CorrelationMatrix(std::vector<EraLabel> eras,
                      std::vector<std::string> features,
                      Matrix values);

    [[nodiscard]] const std::vector<EraLabel>& eras() const noexcept { return eras_; }
    [[nodiscard]] const std::vector<std::string>& features() const noexcept { return features_; }

    /// eras × features, NaN where the correlation is undefined.
    [[nodiscard]] const Matrix& values() const noexcept { return values_; }

    /// Correlation of feature `f` in era `e` (positions), or nullopt if undefined.
    [[nodiscard]] std::optional<double> at(std::size_t e, std::size_t f) const noexcept;

    /// Mean over the defined correlations of feature `f` in eras [begin, end).
    [[nodiscard]] std::optional<double>
    mean_over(std::size_t f, std::size_t begin, std::size_t end) const noexcept;

private:
    std::vector<EraLabel>    eras_;
    std::vector<std::string> features_;
    Matrix                   values_;
};

// ─── FeatureRisk ──────────────────────────────────────────────────────────────

/// Ranking detail for one feature.
struct FeatureRisk {
    std::string feature;
    double      first_half_mean;   ///< NaN if undefined in every first-half era
    double      second_half_mean;  ///< NaN if undefined in every second-half era
    double      change;            ///< |second − first|, 0 when either is NaN
};

// ─── FeatureRiskRanker ────────────────────────────────────────────────────────

class FeatureRiskRanker {
public:
    FeatureRiskRanker() = delete;

    /// Every feature with its half means and change, riskiest first.
    [[nodiscard]] static std::vector<FeatureRisk> rank(const CorrelationMatrix& corrs);

    /// Names of the `k` riskiest features.
    [[nodiscard]] static std::vector<std::string>
    riskiest(const CorrelationMatrix& corrs, std::size_t k);

    /// Build the correlation matrix and return the `k` riskiest features.
    [[nodiscard]] static std::vector<std::string>
    riskiest(const TabularDataset& dataset, const EraPartition& eras, std::size_t k);
};

}  // namespace erastat
