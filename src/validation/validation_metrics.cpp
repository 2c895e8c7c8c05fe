/// @file src/validation/validation_metrics.cpp
/// @brief Per-era scoring and the summary statistics of ValidationStatsRow.
///
/// Degenerate paths never throw: an undefined per-era correlation scores 0.0
/// and every sharpe-style ratio falls back to 0.0 on zero spread. Rows whose
/// prediction is missing (NaN) are dropped before ranking.

#include "erastat/validation_metrics.hpp"
#include "erastat/errors.hpp"
#include "erastat/neutralizer.hpp"
#include "erastat/rank_normalizer.hpp"
#include "erastat/stats.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace erastat {

// ─── ValidationStatsRow ───────────────────────────────────────────────────────

const std::vector<std::string>& ValidationStatsRow::metric_names() {
    static const std::vector<std::string> names = {
        "mean",
        "std",
        "sharpe",
        "max_drawdown",
        "apy",
        "max_feature_exposure",
        "feature_neutral_mean",
        "tb_mean",
        "tb_std",
        "tb_sharpe",
        "mmc_mean",
        "corr_plus_mmc_sharpe",
        "corr_with_example",
    };
    return names;
}

std::optional<double> ValidationStatsRow::get(std::string_view metric) const noexcept {
    if (metric == "mean")                 return mean;
    if (metric == "std")                  return stddev;
    if (metric == "sharpe")               return sharpe;
    if (metric == "max_drawdown")         return max_drawdown;
    if (metric == "apy")                  return apy;
    if (metric == "max_feature_exposure") return max_feature_exposure;
    if (metric == "feature_neutral_mean") return feature_neutral_mean;
    if (metric == "tb_mean")              return tb_mean;
    if (metric == "tb_std")               return tb_std;
    if (metric == "tb_sharpe")            return tb_sharpe;
    if (metric == "mmc_mean")             return mmc_mean;
    if (metric == "corr_plus_mmc_sharpe") return corr_plus_mmc_sharpe;
    if (metric == "corr_with_example")    return corr_with_example;
    return std::nullopt;
}

// ─── ValidationStatsTable ─────────────────────────────────────────────────────

void ValidationStatsTable::append(ValidationStatsRow row) {
    if (find(row.column) != nullptr) {
        throw InvalidParameterError(fmt::format(
            "stats table already has a row for '{}'", row.column));
    }
    rows_.push_back(std::move(row));
}

const ValidationStatsRow* ValidationStatsTable::find(std::string_view column) const noexcept {
    for (const auto& row : rows_) {
        if (row.column == column) return &row;
    }
    return nullptr;
}

std::vector<ValidationStatsRow> ValidationStatsTable::sorted_by_mean() const {
    std::vector<ValidationStatsRow> out = rows_;
    std::sort(out.begin(), out.end(),
              [](const ValidationStatsRow& a, const ValidationStatsRow& b) {
                  if (a.mean != b.mean) return a.mean > b.mean;
                  return a.column < b.column;
              });
    return out;
}

std::string ValidationStatsTable::to_markdown(const std::vector<std::string>& metrics) const {
    std::size_t name_width = 0;
    for (const auto& row : rows_) {
        name_width = std::max(name_width, row.column.size());
    }
    std::vector<std::size_t> widths;
    widths.reserve(metrics.size());
    for (const auto& m : metrics) {
        widths.push_back(std::max<std::size_t>(m.size(), 10));
    }

    std::string out = fmt::format("| {:<{}} |", "", name_width);
    for (std::size_t i = 0; i < metrics.size(); ++i) {
        out += fmt::format(" {:>{}} |", metrics[i], widths[i]);
    }
    out += fmt::format("\n|:{:-<{}}-|", "", name_width);
    for (std::size_t w : widths) {
        out += fmt::format("{:-<{}}:|", "", w + 1);
    }
    out += '\n';

    for (const auto& row : rows_) {
        out += fmt::format("| {:<{}} |", row.column, name_width);
        for (std::size_t i = 0; i < metrics.size(); ++i) {
            const auto v = row.get(metrics[i]);
            if (v) {
                out += fmt::format(" {:>{}.6f} |", *v, widths[i]);
            } else {
                out += fmt::format(" {:>{}} |", "nan", widths[i]);
            }
        }
        out += '\n';
    }
    return out;
}

// ─── Aggregates ───────────────────────────────────────────────────────────────

double ValidationMetricsEngine::sharpe(std::span<const double> scores) noexcept {
    if (scores.empty()) return 0.0;
    const double sd = stats::pop_stddev(scores);
    if (!std::isfinite(sd) || sd <= constants::SHARPE_STD_FLOOR) return 0.0;
    return stats::mean(scores) / sd;
}

double ValidationMetricsEngine::max_drawdown(std::span<const double> scores) noexcept {
    double value = 1.0;
    double peak  = 0.0;
    double worst = 0.0;
    bool   first = true;

    for (double s : scores) {
        value *= (1.0 + s);
        // The running peak is taken over the compounded curve itself.
        if (first || value > peak) {
            peak  = value;
            first = false;
        }
        if (peak > 0.0) {
            worst = std::max(worst, (peak - value) / peak);
        }
    }
    return -worst;
}

double ValidationMetricsEngine::apy(std::span<const double> scores,
                                    double clip,
                                    int periods) noexcept {
    if (scores.empty()) return 0.0;

    double growth = 1.0;
    for (double s : scores) {
        growth *= 1.0 + std::clamp(s, -clip, clip);
    }
    const double per_period = std::pow(growth, 1.0 / static_cast<double>(scores.size()));
    return (std::pow(per_period, static_cast<double>(periods)) - 1.0) * 100.0;
}

// ─── Construction ─────────────────────────────────────────────────────────────

ValidationMetricsEngine::ValidationMetricsEngine(ValidationConfig config)
    : config_(std::move(config)) {
    if (!(config_.mmc_scale > 0.0)) {
        throw InvalidParameterError(fmt::format(
            "mmc_scale must be positive, got {}", config_.mmc_scale));
    }
    if (config_.apy_periods <= 0) {
        throw InvalidParameterError(fmt::format(
            "apy_periods must be positive, got {}", config_.apy_periods));
    }
    if (!(config_.payout_clip > 0.0)) {
        throw InvalidParameterError(fmt::format(
            "payout_clip must be positive, got {}", config_.payout_clip));
    }
}

// ─── per_era_scores ───────────────────────────────────────────────────────────

std::vector<double>
ValidationMetricsEngine::per_era_scores(const Eigen::Ref<const Column>& prediction,
                                        const Eigen::Ref<const Column>& target,
                                        const EraPartition&             eras) const {
    if (prediction.size() != eras.row_count() || target.size() != eras.row_count()) {
        throw ShapeMismatchError(fmt::format(
            "prediction ({} rows) and target ({} rows) must match the era partition ({} rows)",
            prediction.size(), target.size(), eras.row_count()));
    }

    std::vector<double> scores;
    scores.reserve(eras.size());
    for (const Era& era : eras.eras()) {
        const RowIndices rows = stats::finite_rows(prediction, era.rows);
        if (rows.empty()) {
            scores.push_back(0.0);
            continue;
        }
        const Column ranked = RankNormalizer::uniform(stats::gather(prediction, rows));
        const Column truth  = stats::gather(target, rows);
        scores.push_back(stats::pearson(ranked, truth).value_or(0.0));
    }
    return scores;
}

// ─── Non-fast helpers ─────────────────────────────────────────────────────────

double ValidationMetricsEngine::max_feature_exposure(const TabularDataset&           dataset,
                                                     const Eigen::Ref<const Column>& prediction,
                                                     const EraPartition&             eras) const {
    const Matrix& features = dataset.features();
    std::vector<double> per_era;
    per_era.reserve(eras.size());

    for (const Era& era : eras.eras()) {
        const Column pred     = stats::gather(prediction, era.rows);
        const Matrix exposure = stats::gather_rows(features, era.rows);
        double worst = 0.0;
        for (Eigen::Index f = 0; f < exposure.cols(); ++f) {
            if (const auto rho = stats::pearson(exposure.col(f), pred)) {
                worst = std::max(worst, std::abs(*rho));
            }
        }
        per_era.push_back(worst);
    }
    return stats::mean(per_era);
}

double ValidationMetricsEngine::feature_neutral_mean(const TabularDataset&           dataset,
                                                     const Eigen::Ref<const Column>& prediction,
                                                     const EraPartition&             eras) const {
    const Neutralizer neutralizer(NeutralizeOptions{
        .proportion = 1.0,
        .normalize  = true,
        .zero_std   = ZeroStdPolicy::kZeroFill,
    });
    const Matrix& features = dataset.features();
    const Column& target   = dataset.target();

    std::vector<double> scores;
    scores.reserve(eras.size());
    for (const Era& era : eras.eras()) {
        const RowIndices rows = stats::finite_rows(prediction, era.rows);
        if (rows.empty()) {
            scores.push_back(0.0);
            continue;
        }
        const Matrix neutral = neutralizer.neutralize_era(Matrix(stats::gather(prediction, rows)),
                                                          stats::gather_rows(features, rows),
                                                          era.label);
        const Column ranked = RankNormalizer::uniform(neutral.col(0));
        scores.push_back(stats::pearson(ranked, stats::gather(target, rows)).value_or(0.0));
    }
    return stats::mean(scores);
}

std::vector<double>
ValidationMetricsEngine::top_bottom_scores(const Eigen::Ref<const Column>& prediction,
                                           const Eigen::Ref<const Column>& target,
                                           const EraPartition&             eras) const {
    const std::size_t tb = config_.top_bottom;
    std::vector<double> scores;
    scores.reserve(eras.size());

    for (const Era& era : eras.eras()) {
        const RowIndices rows  = stats::finite_rows(prediction, era.rows);
        const Column     pred  = stats::gather(prediction, rows);
        const Column     truth = stats::gather(target, rows);
        const auto       n     = static_cast<std::size_t>(pred.size());

        if (tb == 0 || 2 * tb >= n) {
            scores.push_back(stats::pearson(pred, truth).value_or(0.0));
            continue;
        }

        std::vector<Eigen::Index> order(n);
        std::iota(order.begin(), order.end(), Eigen::Index{0});
        std::stable_sort(order.begin(), order.end(),
                         [&pred](Eigen::Index a, Eigen::Index b) { return pred[a] < pred[b]; });

        Column sel_pred(static_cast<Eigen::Index>(2 * tb));
        Column sel_truth(static_cast<Eigen::Index>(2 * tb));
        for (std::size_t i = 0; i < tb; ++i) {
            const Eigen::Index lo = order[i];
            const Eigen::Index hi = order[n - tb + i];
            sel_pred[static_cast<Eigen::Index>(i)]       = pred[lo];
            sel_truth[static_cast<Eigen::Index>(i)]      = truth[lo];
            sel_pred[static_cast<Eigen::Index>(tb + i)]  = pred[hi];
            sel_truth[static_cast<Eigen::Index>(tb + i)] = truth[hi];
        }
        scores.push_back(stats::pearson(sel_pred, sel_truth).value_or(0.0));
    }
    return scores;
}

// ─── evaluate ─────────────────────────────────────────────────────────────────

ValidationStatsRow ValidationMetricsEngine::evaluate(const TabularDataset& dataset,
                                                     const std::string&    column,
                                                     const EraPartition&   eras) const {
    if (!dataset.has_target()) {
        throw UnknownColumnError("dataset has no target column");
    }
    if (eras.row_count() != dataset.row_count()) {
        throw ShapeMismatchError(fmt::format(
            "era partition covers {} rows, dataset has {}",
            eras.row_count(), dataset.row_count()));
    }

    const Column  prediction = dataset.numeric_column(column);
    const Column& target     = dataset.target();
    const auto    scores     = per_era_scores(prediction, target, eras);

    ValidationStatsRow row;
    row.column       = column;
    row.mean         = stats::mean(scores);
    row.stddev       = stats::pop_stddev(scores);
    row.sharpe       = sharpe(scores);
    row.max_drawdown = max_drawdown(scores);
    row.apy          = apy(scores, config_.payout_clip, config_.apy_periods);

    if (config_.fast_mode) {
        return row;
    }

    const Column example = dataset.numeric_column(config_.example_column);

    row.max_feature_exposure = max_feature_exposure(dataset, prediction, eras);
    row.feature_neutral_mean = feature_neutral_mean(dataset, prediction, eras);

    const auto tb_scores = top_bottom_scores(prediction, target, eras);
    row.tb_mean   = stats::mean(tb_scores);
    row.tb_std    = stats::pop_stddev(tb_scores);
    row.tb_sharpe = sharpe(tb_scores);

    // Meta-model contribution: the part of the ranked prediction not
    // explained by the example column, scored by covariance with the target.
    const double mmc_norm = config_.mmc_scale * config_.mmc_scale;
    std::vector<double> mmc_scores;
    std::vector<double> corr_plus_mmc;
    std::vector<double> example_corrs;
    mmc_scores.reserve(eras.size());
    corr_plus_mmc.reserve(eras.size());
    example_corrs.reserve(eras.size());

    for (std::size_t e = 0; e < eras.size(); ++e) {
        // Both the prediction and the example must be present on a row.
        const RowIndices rows =
            stats::finite_rows(example, stats::finite_rows(prediction, eras[e].rows));
        if (rows.empty()) {
            mmc_scores.push_back(0.0);
            corr_plus_mmc.push_back(scores[e]);
            example_corrs.push_back(0.0);
            continue;
        }
        const Column ranked = RankNormalizer::uniform(stats::gather(prediction, rows));
        const Column base   = stats::gather(example, rows);
        const Column truth  = stats::gather(target, rows);

        const Column residual = Neutralizer::neutralize_series(ranked, base);
        const double mmc      = stats::covariance(residual, truth).value_or(0.0) / mmc_norm;
        mmc_scores.push_back(mmc);
        corr_plus_mmc.push_back(scores[e] + mmc);

        const Column base_ranked = RankNormalizer::uniform(base);
        example_corrs.push_back(stats::pearson(ranked, base_ranked).value_or(0.0));
    }

    row.mmc_mean             = stats::mean(mmc_scores);
    row.corr_plus_mmc_sharpe = sharpe(corr_plus_mmc);
    row.corr_with_example    = stats::mean(example_corrs);
    return row;
}

ValidationStatsTable ValidationMetricsEngine::evaluate(const TabularDataset&           dataset,
                                                       const std::vector<std::string>& columns,
                                                       const EraPartition&             eras) const {
    ValidationStatsTable table;
    for (const auto& column : columns) {
        table.append(evaluate(dataset, column, eras));
    }
    return table;
}

}  // namespace erastat
