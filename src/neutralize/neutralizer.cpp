/// @file src/neutralize/neutralizer.cpp
/// @brief Per-era least-squares neutralization.
///
/// The projection X · pinv(X) · S is computed as X · (least-squares solution
/// of X·B = S). Eigen's SVD solve returns the minimum-norm solution with
/// singular values below the threshold treated as zero, which is exactly
/// pinv(X) · S. Collinear or rank-deficient neutralizers stay stable.

#include "erastat/neutralizer.hpp"
#include "erastat/errors.hpp"
#include "erastat/rank_normalizer.hpp"
#include "erastat/stats.hpp"

#include <Eigen/SVD>
#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace erastat {

// ─── Construction ─────────────────────────────────────────────────────────────

Neutralizer::Neutralizer(NeutralizeOptions options) : options_(options) {
    if (!std::isfinite(options_.proportion) ||
        options_.proportion < 0.0 || options_.proportion > 1.0) {
        throw InvalidParameterError(fmt::format(
            "neutralization proportion must be in [0, 1], got {}", options_.proportion));
    }
    if (!std::isfinite(options_.rcond) || options_.rcond < 0.0) {
        throw InvalidParameterError(fmt::format(
            "pseudoinverse cutoff must be non-negative, got {}", options_.rcond));
    }
}

// ─── project ──────────────────────────────────────────────────────────────────

Matrix Neutralizer::project(const Eigen::Ref<const Matrix>& exposures,
                            const Eigen::Ref<const Matrix>& scores,
                            double rcond) {
    if (exposures.rows() != scores.rows()) {
        throw ShapeMismatchError(fmt::format(
            "exposures have {} rows, scores have {}", exposures.rows(), scores.rows()));
    }
    if (exposures.cols() == 0 || exposures.rows() == 0) {
        return Matrix::Zero(scores.rows(), scores.cols());
    }

    Eigen::BDCSVD<Matrix> svd(exposures, Eigen::ComputeThinU | Eigen::ComputeThinV);
    svd.setThreshold(rcond);
    const Matrix coefficients = svd.solve(scores);  // pinv(X) · S
    return exposures * coefficients;
}

// ─── neutralize_era ───────────────────────────────────────────────────────────

Matrix Neutralizer::neutralize_era(Matrix                          scores,
                                   const Eigen::Ref<const Matrix>& exposures,
                                   std::string_view                era) const {
    if (options_.normalize && scores.rows() > 0) {
        scores = RankNormalizer::gaussian_columns(scores);
    }

    if (options_.proportion != 0.0) {
        scores -= options_.proportion * project(exposures, scores, options_.rcond);
    }

    for (Eigen::Index j = 0; j < scores.cols(); ++j) {
        const double sd = stats::column_stddev(scores.col(j));
        if (std::isfinite(sd) && sd >= constants::DEGENERATE_STD_EPSILON) {
            scores.col(j) /= sd;
            continue;
        }
        if (options_.zero_std == ZeroStdPolicy::kThrow) {
            throw DegenerateEraError(std::string(era), fmt::format(
                "era '{}': neutralized column {} has zero standard deviation", era, j));
        }
        scores.col(j).setZero();
    }
    return scores;
}

// ─── neutralize (matrix form) ─────────────────────────────────────────────────

Matrix Neutralizer::neutralize(const Eigen::Ref<const Matrix>& scores,
                               const Eigen::Ref<const Matrix>& exposures,
                               const EraPartition&             eras) const {
    if (scores.rows() != eras.row_count() || exposures.rows() != eras.row_count()) {
        throw ShapeMismatchError(fmt::format(
            "scores ({} rows) and exposures ({} rows) must match the era partition ({} rows)",
            scores.rows(), exposures.rows(), eras.row_count()));
    }

    Matrix out(scores.rows(), scores.cols());
    for (const Era& era : eras.eras()) {
        const Matrix result = neutralize_era(stats::gather_rows(scores, era.rows),
                                             stats::gather_rows(exposures, era.rows),
                                             era.label);
        for (std::size_t i = 0; i < era.rows.size(); ++i) {
            out.row(era.rows[i]) = result.row(static_cast<Eigen::Index>(i));
        }
    }
    return out;
}

// ─── neutralize (dataset form) ────────────────────────────────────────────────

Matrix Neutralizer::neutralize(const TabularDataset&           dataset,
                               const std::vector<std::string>& columns,
                               const std::vector<std::string>& neutralizers,
                               const EraPartition&             eras) const {
    return neutralize(dataset.numeric_block(columns),
                      dataset.numeric_block(neutralizers),
                      eras);
}

// ─── neutralize_series ────────────────────────────────────────────────────────

Column Neutralizer::neutralize_series(const Eigen::Ref<const Column>& series,
                                      const Eigen::Ref<const Column>& by,
                                      double proportion) {
    if (series.size() != by.size()) {
        throw ShapeMismatchError(fmt::format(
            "series has {} rows, reference has {}", series.size(), by.size()));
    }

    // Regress on [by, 1] so the fit carries an intercept.
    Matrix exposures(series.size(), 2);
    exposures.col(0) = by;
    exposures.col(1).setOnes();

    const Matrix correction = project(exposures, series);
    return series - proportion * correction.col(0);
}

}  // namespace erastat
