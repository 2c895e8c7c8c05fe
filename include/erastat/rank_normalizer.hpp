#pragma once

/// @file include/erastat/rank_normalizer.hpp
/// @brief RankNormalizer: ordinal rank, uniform-rank and Gaussian-rank transforms.
///
/// # Module: Rank Normalizer
///
/// ## Responsibility
/// Replace each value of a column by a function of its rank among the n
/// values of that column. Used for per-era scoring (uniform), before
/// neutralization (Gaussian), and for the final submission (percentile).
///
/// ## Formulas
///   rank_i     = 1-based ascending position, ties broken by original row
///                order ("ordinal": no two rows share a rank)
///   uniform_i  = (rank_i − 0.5) / n          ∈ (0, 1)
///   gaussian_i = Φ⁻¹(uniform_i)              (standard normal quantile)
///   percent_i  = rank_i / n                  ∈ (0, 1]
///
/// The half-unit offset keeps uniform ranks strictly inside (0, 1), so Φ⁻¹ is
/// defined even for n = 1 (uniform 0.5 → Gaussian 0.0).
///
/// ## Edge Cases
/// - n = 0: throws `DegenerateInputError`
/// - NaN entries rank after every finite value (in row order among themselves)
///
/// ## Guarantees
/// - Output length equals input length
/// - Every transform is strictly increasing in rank, so sorting the output
///   recovers the original rank order exactly

#include "erastat/types.hpp"

#include <vector>

namespace erastat {

class RankNormalizer {
public:
    RankNormalizer() = delete;

    /// 1-based ordinal ranks.
    [[nodiscard]] static std::vector<RowIndex>
    ordinal_ranks(const Eigen::Ref<const Column>& x);

    /// (rank − 0.5) / n.
    [[nodiscard]] static Column uniform(const Eigen::Ref<const Column>& x);

    /// Φ⁻¹((rank − 0.5) / n).
    [[nodiscard]] static Column gaussian(const Eigen::Ref<const Column>& x);

    /// rank / n.
    [[nodiscard]] static Column percentile(const Eigen::Ref<const Column>& x);

    /// `gaussian` applied independently to every column of `m`.
    [[nodiscard]] static Matrix gaussian_columns(const Eigen::Ref<const Matrix>& m);
};

}  // namespace erastat
