#pragma once

#include <cstddef>

/// @file include/erastat/constants.hpp
/// @brief Numeric constants and fallback thresholds for the erastat engine.

namespace erastat::constants {

// ─── Rank Transforms ──────────────────────────────────────────────────────────

/// Half-unit offset in (rank − 0.5) / n. Keeps uniform ranks inside the open
/// interval (0, 1) so the inverse normal CDF is always defined.
static constexpr double RANK_OFFSET = 0.5;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Relative singular-value cutoff for the neutralizer pseudoinverse.
/// Singular values below PINV_RCOND · σ_max are treated as zero.
static constexpr double PINV_RCOND = 1e-6;

/// An era whose neutralized score std falls below this is degenerate.
/// Projection residuals of a fully explained column are ~1e-16, never exactly 0.
static constexpr double DEGENERATE_STD_EPSILON = 1e-12;

/// Sharpe is reported as 0.0 when the std of per-era scores is at or below this.
static constexpr double SHARPE_STD_FLOOR = 1e-12;

/// Variance below this makes a Pearson correlation undefined.
static constexpr double CORRELATION_VARIANCE_FLOOR = 1e-15;

// ─── Tournament Scoring ───────────────────────────────────────────────────────

/// Per-era scores are clipped to ±PAYOUT_CLIP before compounding into APY.
static constexpr double PAYOUT_CLIP = 0.25;

/// Compounding periods per year used for APY (52 weeks minus stake lag).
static constexpr int APY_PERIODS = 49;

/// Std of a uniform rank column (≈ 1/√12). MMC covariance is scaled by its square.
static constexpr double MMC_SCALE = 0.29;

/// Number of extreme predictions on each side used by top/bottom scoring.
static constexpr std::size_t DEFAULT_TOP_BOTTOM = 200;

/// Number of riskiest features neutralized against by default.
static constexpr std::size_t DEFAULT_RISKY_FEATURES = 50;

// ─── Data Hygiene ─────────────────────────────────────────────────────────────

/// Features are binned into [0, 1]; the midpoint stands in for a missing value.
static constexpr double MISSING_FEATURE_FILL = 0.5;

}  // namespace erastat::constants
