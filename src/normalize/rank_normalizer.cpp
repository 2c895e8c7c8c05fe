/// @file src/normalize/rank_normalizer.cpp
/// @brief Ordinal ranking and the uniform / Gaussian / percentile transforms.

#include "erastat/rank_normalizer.hpp"
#include "erastat/constants.hpp"
#include "erastat/errors.hpp"

#include <boost/math/distributions/normal.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace erastat {

namespace {

void require_non_empty(const Eigen::Ref<const Column>& x) {
    if (x.size() == 0) {
        throw DegenerateInputError("rank transform of an empty column");
    }
}

}  // namespace

// ─── ordinal_ranks ────────────────────────────────────────────────────────────

std::vector<RowIndex> RankNormalizer::ordinal_ranks(const Eigen::Ref<const Column>& x) {
    require_non_empty(x);

    const auto n = static_cast<std::size_t>(x.size());
    std::vector<RowIndex> order(n);
    std::iota(order.begin(), order.end(), RowIndex{0});

    // Stable sort keeps equal values in row order; NaN sorts last.
    std::stable_sort(order.begin(), order.end(), [&x](RowIndex a, RowIndex b) {
        const bool a_nan = std::isnan(x[a]);
        const bool b_nan = std::isnan(x[b]);
        if (a_nan || b_nan) return !a_nan && b_nan;
        return x[a] < x[b];
    });

    std::vector<RowIndex> ranks(n);
    for (std::size_t pos = 0; pos < n; ++pos) {
        ranks[static_cast<std::size_t>(order[pos])] = static_cast<RowIndex>(pos + 1);
    }
    return ranks;
}

// ─── Transforms ───────────────────────────────────────────────────────────────

Column RankNormalizer::uniform(const Eigen::Ref<const Column>& x) {
    const auto ranks = ordinal_ranks(x);
    const double n   = static_cast<double>(x.size());

    Column out(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        out[i] = (static_cast<double>(ranks[static_cast<std::size_t>(i)])
                  - constants::RANK_OFFSET) / n;
    }
    return out;
}

Column RankNormalizer::gaussian(const Eigen::Ref<const Column>& x) {
    static const boost::math::normal standard_normal(0.0, 1.0);

    Column out = uniform(x);
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        out[i] = boost::math::quantile(standard_normal, out[i]);
    }
    return out;
}

Column RankNormalizer::percentile(const Eigen::Ref<const Column>& x) {
    const auto ranks = ordinal_ranks(x);
    const double n   = static_cast<double>(x.size());

    Column out(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        out[i] = static_cast<double>(ranks[static_cast<std::size_t>(i)]) / n;
    }
    return out;
}

Matrix RankNormalizer::gaussian_columns(const Eigen::Ref<const Matrix>& m) {
    Matrix out(m.rows(), m.cols());
    for (Eigen::Index j = 0; j < m.cols(); ++j) {
        out.col(j) = gaussian(m.col(j));
    }
    return out;
}

}  // namespace erastat
