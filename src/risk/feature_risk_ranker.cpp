/// @file src/risk/feature_risk_ranker.cpp
/// @brief Per-era correlation matrix and first-half/second-half drift ranking.

#include "erastat/feature_risk.hpp"
#include "erastat/errors.hpp"
#include "erastat/stats.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace erastat {

// ─── CorrelationMatrix ────────────────────────────────────────────────────────

CorrelationMatrix::CorrelationMatrix(std::vector<EraLabel> eras,
                                     std::vector<std::string> features,
                                     Matrix values)
    : eras_(std::move(eras)), features_(std::move(features)), values_(std::move(values)) {
    if (values_.rows() != static_cast<Eigen::Index>(eras_.size()) ||
        values_.cols() != static_cast<Eigen::Index>(features_.size())) {
        throw ShapeMismatchError(fmt::format(
            "correlation matrix is {}x{} for {} eras and {} features",
            values_.rows(), values_.cols(), eras_.size(), features_.size()));
    }
}

CorrelationMatrix CorrelationMatrix::build(const TabularDataset& dataset,
                                           const EraPartition& eras) {
    if (!dataset.has_target()) {
        throw UnknownColumnError("dataset has no target column");
    }
    if (eras.row_count() != dataset.row_count()) {
        throw ShapeMismatchError(fmt::format(
            "era partition covers {} rows, dataset has {}",
            eras.row_count(), dataset.row_count()));
    }

    const Matrix& features = dataset.features();
    const Column& target   = dataset.target();
    const auto n_features  = features.cols();

    std::vector<EraLabel> labels;
    labels.reserve(eras.size());
    Matrix values(static_cast<Eigen::Index>(eras.size()), n_features);

    for (std::size_t e = 0; e < eras.size(); ++e) {
        const Era& era = eras[e];
        labels.push_back(era.label);

        const Column era_target   = stats::gather(target, era.rows);
        const Matrix era_features = stats::gather_rows(features, era.rows);
        for (Eigen::Index f = 0; f < n_features; ++f) {
            const auto rho = stats::pearson(era_features.col(f), era_target);
            values(static_cast<Eigen::Index>(e), f) =
                rho.value_or(std::numeric_limits<double>::quiet_NaN());
        }
    }
    return CorrelationMatrix(std::move(labels), dataset.feature_names(), std::move(values));
}

std::optional<double> CorrelationMatrix::at(std::size_t e, std::size_t f) const noexcept {
    const double v = values_(static_cast<Eigen::Index>(e), static_cast<Eigen::Index>(f));
    if (std::isnan(v)) return std::nullopt;
    return v;
}

std::optional<double> CorrelationMatrix::mean_over(std::size_t f,
                                                   std::size_t begin,
                                                   std::size_t end) const noexcept {
    double sum = 0.0;
    std::size_t n = 0;
    for (std::size_t e = begin; e < end; ++e) {
        if (const auto v = at(e, f)) {
            sum += *v;
            ++n;
        }
    }
    if (n == 0) return std::nullopt;
    return sum / static_cast<double>(n);
}

// ─── FeatureRiskRanker ────────────────────────────────────────────────────────

std::vector<FeatureRisk> FeatureRiskRanker::rank(const CorrelationMatrix& corrs) {
    const std::size_t m = corrs.eras().size();
    if (m < 2) {
        throw InsufficientErasError(fmt::format(
            "need at least 2 eras to rank feature risk, have {}", m));
    }
    const std::size_t split = (m + 1) / 2;  // extra era goes to the first half
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();

    std::vector<FeatureRisk> out;
    out.reserve(corrs.features().size());
    for (std::size_t f = 0; f < corrs.features().size(); ++f) {
        const auto h1 = corrs.mean_over(f, 0, split);
        const auto h2 = corrs.mean_over(f, split, m);
        out.push_back(FeatureRisk{
            .feature          = corrs.features()[f],
            .first_half_mean  = h1.value_or(nan),
            .second_half_mean = h2.value_or(nan),
            .change           = (h1 && h2) ? std::abs(*h2 - *h1) : 0.0,
        });
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const FeatureRisk& a, const FeatureRisk& b) {
                         return a.change > b.change;
                     });
    return out;
}

std::vector<std::string> FeatureRiskRanker::riskiest(const CorrelationMatrix& corrs,
                                                     std::size_t k) {
    const auto ranked = rank(corrs);
    const std::size_t n = std::min(k, ranked.size());

    std::vector<std::string> names;
    names.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        names.push_back(ranked[i].feature);
    }
    return names;
}

std::vector<std::string> FeatureRiskRanker::riskiest(const TabularDataset& dataset,
                                                     const EraPartition& eras,
                                                     std::size_t k) {
    // Check the era count before the O(features × rows) correlation pass.
    if (eras.size() < 2) {
        throw InsufficientErasError(fmt::format(
            "need at least 2 eras to rank feature risk, have {}", eras.size()));
    }
    return riskiest(CorrelationMatrix::build(dataset, eras), k);
}

}  // namespace erastat
