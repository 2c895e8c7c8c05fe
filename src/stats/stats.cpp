/// @file src/stats/stats.cpp
/// @brief Moments, Pearson correlation and row gathering.

#include "erastat/stats.hpp"
#include "erastat/constants.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace erastat::stats {

namespace {

/// Means of the complete (both finite) pairs, with the pair count.
struct PairMoments {
    double      mean_a = 0.0;
    double      mean_b = 0.0;
    double      sxx    = 0.0;
    double      syy    = 0.0;
    double      sxy    = 0.0;
    Eigen::Index n     = 0;
};

[[nodiscard]] PairMoments pair_moments(const Eigen::Ref<const Column>& a,
                                       const Eigen::Ref<const Column>& b) noexcept {
    PairMoments pm;
    for (Eigen::Index i = 0; i < a.size(); ++i) {
        if (!std::isfinite(a[i]) || !std::isfinite(b[i])) continue;
        pm.mean_a += a[i];
        pm.mean_b += b[i];
        ++pm.n;
    }
    if (pm.n == 0) return pm;
    pm.mean_a /= static_cast<double>(pm.n);
    pm.mean_b /= static_cast<double>(pm.n);

    // Second pass on centred values for numerical stability.
    for (Eigen::Index i = 0; i < a.size(); ++i) {
        if (!std::isfinite(a[i]) || !std::isfinite(b[i])) continue;
        const double da = a[i] - pm.mean_a;
        const double db = b[i] - pm.mean_b;
        pm.sxx += da * da;
        pm.syy += db * db;
        pm.sxy += da * db;
    }
    return pm;
}

}  // namespace

// ─── Moments ──────────────────────────────────────────────────────────────────

double mean(std::span<const double> v) noexcept {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double pop_stddev(std::span<const double> v) noexcept {
    if (v.empty()) return 0.0;
    const double mu = mean(v);
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mu;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / static_cast<double>(v.size()));
}

double column_stddev(const Eigen::Ref<const Column>& v) noexcept {
    if (v.size() == 0) return 0.0;
    const double mu = v.mean();
    return std::sqrt((v.array() - mu).square().sum() / static_cast<double>(v.size()));
}

std::optional<double> nan_mean(std::span<const double> v) noexcept {
    double sum = 0.0;
    std::size_t n = 0;
    for (double x : v) {
        if (!std::isfinite(x)) continue;
        sum += x;
        ++n;
    }
    if (n == 0) return std::nullopt;
    return sum / static_cast<double>(n);
}

// ─── Correlation ──────────────────────────────────────────────────────────────

std::optional<double> pearson(const Eigen::Ref<const Column>& a,
                              const Eigen::Ref<const Column>& b) noexcept {
    if (a.size() != b.size()) return std::nullopt;

    const PairMoments pm = pair_moments(a, b);
    if (pm.n < 2) return std::nullopt;

    const double var_floor = constants::CORRELATION_VARIANCE_FLOOR * static_cast<double>(pm.n);
    if (pm.sxx <= var_floor || pm.syy <= var_floor) return std::nullopt;

    const double rho = pm.sxy / std::sqrt(pm.sxx * pm.syy);
    // Rounding can push |ρ| a hair past 1.
    return std::clamp(rho, -1.0, 1.0);
}

std::optional<double> covariance(const Eigen::Ref<const Column>& a,
                                 const Eigen::Ref<const Column>& b) noexcept {
    if (a.size() != b.size()) return std::nullopt;

    const PairMoments pm = pair_moments(a, b);
    if (pm.n < 2) return std::nullopt;
    return pm.sxy / static_cast<double>(pm.n - 1);
}

// ─── Gathering ────────────────────────────────────────────────────────────────

Column gather(const Eigen::Ref<const Column>& v, const RowIndices& rows) {
    Column out(static_cast<Eigen::Index>(rows.size()));
    for (std::size_t i = 0; i < rows.size(); ++i) {
        out[static_cast<Eigen::Index>(i)] = v[rows[i]];
    }
    return out;
}

RowIndices finite_rows(const Eigen::Ref<const Column>& v, const RowIndices& rows) {
    RowIndices out;
    out.reserve(rows.size());
    for (RowIndex r : rows) {
        if (std::isfinite(v[r])) out.push_back(r);
    }
    return out;
}

Matrix gather_rows(const Eigen::Ref<const Matrix>& m, const RowIndices& rows) {
    Matrix out(static_cast<Eigen::Index>(rows.size()), m.cols());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) = m.row(rows[i]);
    }
    return out;
}

}  // namespace erastat::stats
