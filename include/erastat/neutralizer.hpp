#pragma once

/// @file include/erastat/neutralizer.hpp
/// @brief Neutralizer: remove a prediction's linear exposure to chosen features.
///
/// # Module: Neutralizer
///
/// ## Responsibility
/// For each era independently, orthogonalize one or more prediction columns
/// against a neutralizer feature set by least-squares projection, blend by a
/// proportion, and rescale to unit variance.
///
/// ## Per-Era Algorithm
/// ```
/// S = scores[era rows, columns]              (rows × c)
/// X = exposures[era rows, neutralizers]      (rows × k)
/// if normalize: S = Φ⁻¹(uniform_rank(S))     column-wise
/// S = S − p · X · pinv(X) · S                pinv via SVD, cutoff rcond·σ_max
/// S[:, j] /= std(S[:, j])                    population std (ddof = 0)
/// ```
/// Results are written back to the era's original row positions, so the
/// output preserves the input row order exactly.
///
/// ## Degenerate Eras
/// When a result column's std falls below DEGENERATE_STD_EPSILON (e.g. the
/// column was fully explained by the neutralizers), the policy decides:
///   - `ZeroStdPolicy::kZeroFill` (default): write zeros for that era
///   - `ZeroStdPolicy::kThrow`: raise `DegenerateEraError`
///
/// ## Guarantees
/// - p = 0 leaves the (optionally normalized) scores unchanged up to rescaling
/// - An empty neutralizer set projects to zero
/// - No data from one era influences another era's output
/// - Inputs are never modified
///
/// ## NOT Responsible For
/// - Choosing the neutralizer set (see feature_risk.hpp)

#include "erastat/constants.hpp"
#include "erastat/dataset.hpp"
#include "erastat/era_partition.hpp"
#include "erastat/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace erastat {

/// What to do with an era whose neutralized scores have no variance.
enum class ZeroStdPolicy {
    kZeroFill,
    kThrow,
};

/// Configuration for a Neutralizer.
struct NeutralizeOptions {
    double        proportion = 1.0;   ///< p ∈ [0, 1]: 0 = raw, 1 = fully orthogonal
    bool          normalize  = true;  ///< Gaussian-rank the scores first
    ZeroStdPolicy zero_std   = ZeroStdPolicy::kZeroFill;
    double        rcond      = constants::PINV_RCOND;
};

class Neutralizer {
public:
    /// # Errors
    /// `InvalidParameterError` if proportion ∉ [0, 1] or rcond is negative.
    explicit Neutralizer(NeutralizeOptions options = NeutralizeOptions{});

    [[nodiscard]] const NeutralizeOptions& options() const noexcept { return options_; }

    /// Neutralize the named prediction columns of `dataset` against the named
    /// neutralizer columns (features or predictions).
    ///
    /// # Returns
    /// rows × columns.size() matrix, column j derived from `columns[j]`.
    [[nodiscard]] Matrix neutralize(const TabularDataset&           dataset,
                                    const std::vector<std::string>& columns,
                                    const std::vector<std::string>& neutralizers,
                                    const EraPartition&             eras) const;

    /// Matrix form: `scores` (rows × c) against `exposures` (rows × k).
    [[nodiscard]] Matrix neutralize(const Eigen::Ref<const Matrix>& scores,
                                    const Eigen::Ref<const Matrix>& exposures,
                                    const EraPartition&             eras) const;

    /// Single-era kernel. `era` only labels a DegenerateEraError.
    [[nodiscard]] Matrix neutralize_era(Matrix                          scores,
                                        const Eigen::Ref<const Matrix>& exposures,
                                        std::string_view                era = {}) const;

    /// Remove the least-squares fit of `series` on [by, 1] scaled by
    /// `proportion`. No rank transform, no rescaling. Used for meta-model
    /// contribution against a baseline column.
    [[nodiscard]] static Column neutralize_series(const Eigen::Ref<const Column>& series,
                                                  const Eigen::Ref<const Column>& by,
                                                  double proportion = 1.0);

    /// X · pinv(X) · S with singular values below rcond · σ_max dropped.
    [[nodiscard]] static Matrix project(const Eigen::Ref<const Matrix>& exposures,
                                        const Eigen::Ref<const Matrix>& scores,
                                        double rcond = constants::PINV_RCOND);

private:
    NeutralizeOptions options_;
};

}  // namespace erastat
