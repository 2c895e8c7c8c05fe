#pragma once

/// @file include/erastat/validation_metrics.hpp
/// @brief ValidationMetricsEngine: per-era scoring and summary statistics.
///
/// # Module: Validation Metrics Engine
///
/// ## Responsibility
/// Score each prediction column era by era against the target and summarize
/// the per-era scores into one ValidationStatsRow per column.
///
/// ## Per-Era Score
///   score_e = Pearson(uniform_rank(pred[e]), target[e])
/// Rows with a missing (non-finite) prediction are left out of the era before
/// ranking. An undefined correlation (constant target in an era) scores 0.0.
///
/// ## Always Computed
///   - mean, std (population) of per-era scores
///   - sharpe = mean / std; 0.0 when std ≤ SHARPE_STD_FLOOR (never raises)
///   - max_drawdown of the compounded score curve Π(1 + score_e), ≤ 0
///   - apy = ((Π(1 + clip(score_e, ±0.25)))^(1/m))^49 − 1, in percent
///
/// ## Non-Fast Mode Adds
///   - max_feature_exposure: mean over eras of max_f |corr(feature_f, pred)|
///   - feature_neutral_mean: mean score after neutralizing against all features
///   - tb_mean / tb_std / tb_sharpe: scores over the top and bottom N
///     predictions of each era only
///   - mmc_mean: meta-model contribution over the example column
///   - corr_plus_mmc_sharpe: sharpe of per-era (score + mmc)
///   - corr_with_example: mean per-era rank correlation with the example column
///
/// ## Guarantees
/// - Every sharpe is finite
/// - mean ∈ [-1, 1]
/// - Eras are scored independently

#include "erastat/constants.hpp"
#include "erastat/dataset.hpp"
#include "erastat/era_partition.hpp"
#include "erastat/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace erastat {

// ─── Configuration ────────────────────────────────────────────────────────────

struct ValidationConfig {
    std::string example_column = "example_preds";  ///< Baseline column (non-fast only)
    bool        fast_mode      = false;            ///< Skip exposure and baseline metrics
    std::size_t top_bottom     = constants::DEFAULT_TOP_BOTTOM;
    double      payout_clip    = constants::PAYOUT_CLIP;
    int         apy_periods    = constants::APY_PERIODS;
    double      mmc_scale      = constants::MMC_SCALE;
};

// ─── ValidationStatsRow ───────────────────────────────────────────────────────

/// Summary statistics for one prediction column.
struct ValidationStatsRow {
    std::string column;

    double mean         = 0.0;
    double stddev       = 0.0;
    double sharpe       = 0.0;
    double max_drawdown = 0.0;
    double apy          = 0.0;

    std::optional<double> max_feature_exposure;
    std::optional<double> feature_neutral_mean;
    std::optional<double> tb_mean;
    std::optional<double> tb_std;
    std::optional<double> tb_sharpe;
    std::optional<double> mmc_mean;
    std::optional<double> corr_plus_mmc_sharpe;
    std::optional<double> corr_with_example;

    /// Statistic by its column name in the table ("mean", "sharpe", ...).
    /// nullopt for unknown names or metrics not computed in fast mode.
    [[nodiscard]] std::optional<double> get(std::string_view metric) const noexcept;

    /// Names accepted by `get`, in display order.
    [[nodiscard]] static const std::vector<std::string>& metric_names();
};

// ─── ValidationStatsTable ─────────────────────────────────────────────────────

/// Stats rows keyed by column name. Append-only; unordered until sorted.
class ValidationStatsTable {
public:
    /// Add a row. Throws InvalidParameterError if the column is already present.
    void append(ValidationStatsRow row);

    [[nodiscard]] const std::vector<ValidationStatsRow>& rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    /// Row for `column`, or nullptr.
    [[nodiscard]] const ValidationStatsRow* find(std::string_view column) const noexcept;

    /// Copy of the rows, highest mean first; ties by column name.
    [[nodiscard]] std::vector<ValidationStatsRow> sorted_by_mean() const;

    /// Markdown table of the requested metrics, one row per column.
    /// Metrics missing from a row print as "nan".
    [[nodiscard]] std::string to_markdown(const std::vector<std::string>& metrics) const;

private:
    std::vector<ValidationStatsRow> rows_;
};

// ─── ValidationMetricsEngine ──────────────────────────────────────────────────

class ValidationMetricsEngine {
public:
    /// # Errors
    /// `InvalidParameterError` for a non-positive mmc_scale or apy_periods.
    explicit ValidationMetricsEngine(ValidationConfig config = ValidationConfig{});

    [[nodiscard]] const ValidationConfig& config() const noexcept { return config_; }

    /// Per-era Pearson(uniform_rank(pred), target), eras in chronological order.
    [[nodiscard]] std::vector<double>
    per_era_scores(const Eigen::Ref<const Column>& prediction,
                   const Eigen::Ref<const Column>& target,
                   const EraPartition&             eras) const;

    /// Stats for one prediction column.
    ///
    /// # Errors
    /// - `UnknownColumnError` for a missing column, a missing target, or (in
    ///   non-fast mode) a missing example column
    /// - `ShapeMismatchError` if the partition does not cover the dataset
    [[nodiscard]] ValidationStatsRow evaluate(const TabularDataset& dataset,
                                              const std::string&    column,
                                              const EraPartition&   eras) const;

    /// Stats for several columns, in the given order.
    [[nodiscard]] ValidationStatsTable evaluate(const TabularDataset&           dataset,
                                                const std::vector<std::string>& columns,
                                                const EraPartition&             eras) const;

    // ── Aggregates ───────────────────────────────────────────────────────────

    /// mean / population std; 0.0 when std ≤ SHARPE_STD_FLOOR or input empty.
    [[nodiscard]] static double sharpe(std::span<const double> scores) noexcept;

    /// Most negative (value − running peak) / running peak of Π(1 + score).
    /// 0.0 for an empty or never-declining series.
    [[nodiscard]] static double max_drawdown(std::span<const double> scores) noexcept;

    /// Annualized payout growth in percent from clipped per-era scores.
    [[nodiscard]] static double apy(std::span<const double> scores,
                                    double clip    = constants::PAYOUT_CLIP,
                                    int    periods = constants::APY_PERIODS) noexcept;

private:
    [[nodiscard]] double max_feature_exposure(const TabularDataset&           dataset,
                                              const Eigen::Ref<const Column>& prediction,
                                              const EraPartition&             eras) const;

    [[nodiscard]] double feature_neutral_mean(const TabularDataset&           dataset,
                                              const Eigen::Ref<const Column>& prediction,
                                              const EraPartition&             eras) const;

    [[nodiscard]] std::vector<double>
    top_bottom_scores(const Eigen::Ref<const Column>& prediction,
                      const Eigen::Ref<const Column>& target,
                      const EraPartition&             eras) const;

    ValidationConfig config_;
};

}  // namespace erastat
