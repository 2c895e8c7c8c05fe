/// @file tests/validation/test_validation_metrics.cpp
/// @brief Tests for per-era scoring, the aggregate statistics and the stats table.

#include "erastat/validation_metrics.hpp"
#include "erastat/errors.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace erastat;

namespace {

// ─── Fixtures ─────────────────────────────────────────────────────────────────

/// Three eras of five rows with target (0, 0.25, 0.5, 0.75, 1) in each.
///   perfect       = target
///   reversed      = 1 − target
///   example_preds = target (evenly spaced, so its uniform rank is affine in it)
///   feature_a     = target, feature_b = a fixed non-monotone pattern
TabularDataset make_scored_dataset() {
    const std::vector<double> t{0.0, 0.25, 0.5, 0.75, 1.0};
    const std::vector<double> pattern{0.5, 0.0, 1.0, 0.25, 0.75};
    constexpr std::size_t n_eras = 3;

    const auto rows = static_cast<Eigen::Index>(n_eras * t.size());
    Column target(rows);
    Column reversed(rows);
    Matrix features(rows, 2);
    LabelColumn eras;
    for (std::size_t e = 0; e < n_eras; ++e) {
        for (std::size_t i = 0; i < t.size(); ++i) {
            const auto r = static_cast<Eigen::Index>(e * t.size() + i);
            target[r]      = t[i];
            reversed[r]    = 1.0 - t[i];
            features(r, 0) = t[i];
            features(r, 1) = pattern[i];
            eras.emplace_back("era" + std::to_string(e + 1));
        }
    }

    TabularDataset ds;
    ds.set_features({"feature_a", "feature_b"}, features);
    ds.set_target("target", target);
    ds.set_labels("era", eras);
    ds.set_prediction("perfect", target);
    ds.set_prediction("reversed", reversed);
    ds.set_prediction("example_preds", target);
    return ds;
}

/// Two eras of four rows where the prediction, the example column and the
/// single feature all disagree, so every non-fast metric has a non-trivial
/// value. `with_gaps` appends one row per era whose prediction is missing.
///
///   e1: pred (0.1, 0.2, 0.3, 0.4)  example (0.2, 0.1, 0.4, 0.3)
///       target (0, 0.5, 0.25, 1)    feature (0, 0, 1, 1)
///   e2: pred (0.4, 0.3, 0.2, 0.1)  example (0.4, 0.1, 0.3, 0.2)
///       target (0, 0.25, 0.75, 1)   feature (1, 0, 0, 0)
TabularDataset make_contribution_dataset(bool with_gaps) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<std::vector<double>> pred{{0.1, 0.2, 0.3, 0.4}, {0.4, 0.3, 0.2, 0.1}};
    const std::vector<std::vector<double>> example{{0.2, 0.1, 0.4, 0.3}, {0.4, 0.1, 0.3, 0.2}};
    const std::vector<std::vector<double>> target{{0.0, 0.5, 0.25, 1.0}, {0.0, 0.25, 0.75, 1.0}};
    const std::vector<std::vector<double>> feature{{0.0, 0.0, 1.0, 1.0}, {1.0, 0.0, 0.0, 0.0}};

    std::vector<double> p, x, t, f;
    LabelColumn eras;
    for (std::size_t e = 0; e < 2; ++e) {
        for (std::size_t i = 0; i < 4; ++i) {
            p.push_back(pred[e][i]);
            x.push_back(example[e][i]);
            t.push_back(target[e][i]);
            f.push_back(feature[e][i]);
            eras.emplace_back("era" + std::to_string(e + 1));
        }
        if (with_gaps) {
            p.push_back(nan);
            x.push_back(0.5);
            t.push_back(0.5);
            f.push_back(0.5);
            eras.emplace_back("era" + std::to_string(e + 1));
        }
    }

    const auto rows = static_cast<Eigen::Index>(p.size());
    TabularDataset ds;
    ds.set_features({"feature_a"}, Matrix(Eigen::Map<const Column>(f.data(), rows)));
    ds.set_target("target", Column(Eigen::Map<const Column>(t.data(), rows)));
    ds.set_labels("era", eras);
    ds.set_prediction("model", Column(Eigen::Map<const Column>(p.data(), rows)));
    ds.set_prediction("example_preds", Column(Eigen::Map<const Column>(x.data(), rows)));
    return ds;
}

ValidationConfig fast_config() {
    ValidationConfig cfg;
    cfg.fast_mode = true;
    return cfg;
}

}  // anonymous namespace

// ─── sharpe ───────────────────────────────────────────────────────────────────

TEST(ValidationSharpe, MeanOverPopulationStd) {
    const std::vector<double> s{0.1, 0.3};
    EXPECT_NEAR(ValidationMetricsEngine::sharpe(s), 2.0, 1e-12);
}

TEST(ValidationSharpe, ZeroSpreadIsZero) {
    const std::vector<double> constant{0.05, 0.05, 0.05};
    EXPECT_DOUBLE_EQ(ValidationMetricsEngine::sharpe(constant), 0.0);
    EXPECT_DOUBLE_EQ(ValidationMetricsEngine::sharpe(std::vector<double>{}), 0.0);
    EXPECT_DOUBLE_EQ(ValidationMetricsEngine::sharpe(std::vector<double>{0.7}), 0.0);
}

// ─── max_drawdown ─────────────────────────────────────────────────────────────

TEST(ValidationDrawdown, WorstDropFromRunningPeak) {
    // Curve 1.1, 0.88, 0.924: peak 1.1, trough 0.88 → −20%
    const std::vector<double> s{0.1, -0.2, 0.05};
    EXPECT_NEAR(ValidationMetricsEngine::max_drawdown(s), -0.2, 1e-12);
}

TEST(ValidationDrawdown, NeverDecliningIsZero) {
    const std::vector<double> s{0.01, 0.02, 0.0, 0.03};
    EXPECT_DOUBLE_EQ(ValidationMetricsEngine::max_drawdown(s), 0.0);
    EXPECT_DOUBLE_EQ(ValidationMetricsEngine::max_drawdown(std::vector<double>{}), 0.0);
}

// ─── apy ──────────────────────────────────────────────────────────────────────

TEST(ValidationApy, ConstantScoreCompounds) {
    const std::vector<double> s(10, 0.01);
    EXPECT_NEAR(ValidationMetricsEngine::apy(s), (std::pow(1.01, 49.0) - 1.0) * 100.0, 1e-9);
}

TEST(ValidationApy, ScoresAreClipped) {
    const std::vector<double> s{0.5, -0.5};
    const double expected = (std::pow(std::sqrt(1.25 * 0.75), 49.0) - 1.0) * 100.0;
    EXPECT_NEAR(ValidationMetricsEngine::apy(s), expected, 1e-9);
}

TEST(ValidationApy, EmptyIsZero) {
    EXPECT_DOUBLE_EQ(ValidationMetricsEngine::apy(std::vector<double>{}), 0.0);
}

// ─── Construction ─────────────────────────────────────────────────────────────

TEST(ValidationEngineConfig, RejectsNonPositiveScales) {
    ValidationConfig cfg;
    cfg.mmc_scale = 0.0;
    EXPECT_THROW(ValidationMetricsEngine{cfg}, InvalidParameterError);

    cfg = ValidationConfig{};
    cfg.apy_periods = 0;
    EXPECT_THROW(ValidationMetricsEngine{cfg}, InvalidParameterError);

    cfg = ValidationConfig{};
    cfg.payout_clip = -0.25;
    EXPECT_THROW(ValidationMetricsEngine{cfg}, InvalidParameterError);
}

// ─── per_era_scores ───────────────────────────────────────────────────────────

TEST(ValidationPerEra, PerfectAndReversedPredictions) {
    const auto ds   = make_scored_dataset();
    const auto eras = EraPartition::build(ds, "era");
    const ValidationMetricsEngine engine(fast_config());

    const auto up   = engine.per_era_scores(ds.prediction("perfect"), ds.target(), eras);
    const auto down = engine.per_era_scores(ds.prediction("reversed"), ds.target(), eras);
    ASSERT_EQ(up.size(), 3u);
    for (std::size_t e = 0; e < 3; ++e) {
        EXPECT_NEAR(up[e], 1.0, 1e-12);
        EXPECT_NEAR(down[e], -1.0, 1e-12);
    }
}

TEST(ValidationPerEra, ConstantTargetEraScoresZero) {
    LabelColumn labels;
    for (int i = 0; i < 6; ++i) labels.emplace_back(i < 3 ? "e1" : "e2");
    const auto eras = EraPartition::from_labels(labels);

    Column pred(6);
    pred << 0.1, 0.2, 0.3, 0.1, 0.2, 0.3;
    Column target(6);
    target << 0.5, 0.5, 0.5, 0.0, 0.5, 1.0;

    const ValidationMetricsEngine engine(fast_config());
    const auto scores = engine.per_era_scores(pred, target, eras);
    EXPECT_DOUBLE_EQ(scores[0], 0.0);
    EXPECT_NEAR(scores[1], 1.0, 1e-12);
}

TEST(ValidationPerEra, MissingPredictionsAreDropped) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    const auto eras = EraPartition::from_labels(LabelColumn(4, std::string("e1")));

    Column pred(4);
    pred << 0.1, 0.2, 0.3, nan;
    Column target(4);
    target << 0.0, 0.5, 1.0, 0.0;

    // Ranked last, the NaN row would pair the top rank with target 0.
    const ValidationMetricsEngine engine(fast_config());
    const auto scores = engine.per_era_scores(pred, target, eras);
    ASSERT_EQ(scores.size(), 1u);
    EXPECT_NEAR(scores[0], 1.0, 1e-12);
}

TEST(ValidationPerEra, EraWithoutPredictionsScoresZero) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    LabelColumn labels;
    for (int i = 0; i < 4; ++i) labels.emplace_back(i < 2 ? "e1" : "e2");
    const auto eras = EraPartition::from_labels(labels);

    Column pred(4);
    pred << nan, nan, 0.1, 0.2;
    Column target(4);
    target << 0.0, 1.0, 0.0, 1.0;

    const ValidationMetricsEngine engine(fast_config());
    const auto scores = engine.per_era_scores(pred, target, eras);
    EXPECT_DOUBLE_EQ(scores[0], 0.0);
    EXPECT_NEAR(scores[1], 1.0, 1e-12);
}

TEST(ValidationPerEra, LengthMismatchThrows) {
    const auto ds   = make_scored_dataset();
    const auto eras = EraPartition::build(ds, "era");
    const ValidationMetricsEngine engine(fast_config());
    EXPECT_THROW(static_cast<void>(engine.per_era_scores(Column::Zero(3), ds.target(), eras)),
                 ShapeMismatchError);
}

// ─── evaluate (fast) ──────────────────────────────────────────────────────────

TEST(ValidationEvaluateFast, CoreStatsOnly) {
    const auto ds   = make_scored_dataset();
    const auto eras = EraPartition::build(ds, "era");
    const ValidationMetricsEngine engine(fast_config());

    const auto row = engine.evaluate(ds, "reversed", eras);
    EXPECT_EQ(row.column, "reversed");
    EXPECT_NEAR(row.mean, -1.0, 1e-12);
    EXPECT_NEAR(row.stddev, 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(row.sharpe, 0.0);
    EXPECT_LE(row.max_drawdown, 0.0);
    EXPECT_TRUE(std::isfinite(row.apy));

    EXPECT_FALSE(row.max_feature_exposure.has_value());
    EXPECT_FALSE(row.mmc_mean.has_value());
    EXPECT_FALSE(row.get("tb_mean").has_value());
}

TEST(ValidationEvaluateFast, MissingColumnOrTargetThrows) {
    const auto ds   = make_scored_dataset();
    const auto eras = EraPartition::build(ds, "era");
    const ValidationMetricsEngine engine(fast_config());
    EXPECT_THROW(static_cast<void>(engine.evaluate(ds, "ghost", eras)), UnknownColumnError);

    TabularDataset no_target;
    no_target.set_prediction("p", Column::Zero(15));
    EXPECT_THROW(static_cast<void>(engine.evaluate(no_target, "p", eras)), UnknownColumnError);
}

// ─── evaluate (full) ──────────────────────────────────────────────────────────

TEST(ValidationEvaluateFull, ComputesEveryMetric) {
    const auto ds   = make_scored_dataset();
    const auto eras = EraPartition::build(ds, "era");
    const ValidationMetricsEngine engine;

    const auto row = engine.evaluate(ds, "perfect", eras);
    for (const auto& metric : ValidationStatsRow::metric_names()) {
        const auto v = row.get(metric);
        ASSERT_TRUE(v.has_value()) << metric;
        EXPECT_TRUE(std::isfinite(*v)) << metric;
    }

    // feature_a equals the prediction in every era.
    EXPECT_NEAR(*row.max_feature_exposure, 1.0, 1e-12);
    // Identical to the example column: nothing left for meta-model contribution.
    EXPECT_NEAR(*row.mmc_mean, 0.0, 1e-10);
    EXPECT_NEAR(*row.corr_with_example, 1.0, 1e-12);
    EXPECT_GE(*row.feature_neutral_mean, -1.0);
    EXPECT_LE(*row.feature_neutral_mean, 1.0);
}

TEST(ValidationEvaluateFull, ContributionAndNeutralScoresByHand) {
    const auto ds   = make_contribution_dataset(false);
    const auto eras = EraPartition::build(ds, "era");
    const ValidationMetricsEngine engine;
    const auto row = engine.evaluate(ds, "model", eras);

    // MMC, era 1: uniform ranks u = (1, 3, 5, 7) / 8 regressed on the example
    // with an intercept gives slope 1.5 and residual (-0.3, 0.1, -0.1, 0.3).
    // Sample covariance with the target is 0.325 / 3, over 0.29^2.
    const double mmc1 = (0.325 / 3.0) / (0.29 * 0.29);
    // Era 2: u = (7, 5, 3, 1) / 8, slope 1, residual (0.225, 0.275, -0.175, -0.325),
    // covariance -0.3875 / 3.
    const double mmc2 = (-0.3875 / 3.0) / (0.29 * 0.29);
    ASSERT_TRUE(row.mmc_mean.has_value());
    EXPECT_NEAR(*row.mmc_mean, 0.5 * (mmc1 + mmc2), 1e-10);
    EXPECT_NEAR(*row.mmc_mean, -0.12386048355132773, 1e-10);

    const auto scores = engine.per_era_scores(ds.prediction("model"), ds.target(), eras);
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_NEAR(scores[0], 0.8315218406202999, 1e-12);
    EXPECT_NEAR(scores[1], -0.9899494936611665, 1e-12);
    const std::vector<double> combined{scores[0] + mmc1, scores[1] + mmc2};
    ASSERT_TRUE(row.corr_plus_mmc_sharpe.has_value());
    EXPECT_NEAR(*row.corr_plus_mmc_sharpe, ValidationMetricsEngine::sharpe(combined), 1e-10);
    EXPECT_NEAR(*row.corr_plus_mmc_sharpe, -0.08742857884413759, 1e-10);

    // Neutralizing against the feature reorders both eras. Era 1 residual
    // ranks (1, 3, 2, 4), era 2 residual ranks (3, 4, 2, 1); scored against
    // the target that is 0.9827076298239908 and -0.6·√2.
    ASSERT_TRUE(row.feature_neutral_mean.has_value());
    EXPECT_NEAR(*row.feature_neutral_mean,
                0.5 * (0.9827076298239908 - 0.6 * std::sqrt(2.0)), 1e-10);
}

TEST(ValidationEvaluateFull, MissingPredictionsLeaveMetricsUnchanged) {
    const auto complete = make_contribution_dataset(false);
    const auto gapped   = make_contribution_dataset(true);
    const ValidationMetricsEngine engine;

    const auto want = engine.evaluate(complete, "model", EraPartition::build(complete, "era"));
    const auto got  = engine.evaluate(gapped, "model", EraPartition::build(gapped, "era"));

    EXPECT_NEAR(got.mean, want.mean, 1e-12);
    EXPECT_NEAR(got.sharpe, want.sharpe, 1e-12);
    for (const char* metric : {"feature_neutral_mean", "tb_mean", "mmc_mean",
                               "corr_plus_mmc_sharpe", "corr_with_example"}) {
        const auto g = got.get(metric);
        const auto w = want.get(metric);
        ASSERT_TRUE(g.has_value() && w.has_value()) << metric;
        EXPECT_NEAR(*g, *w, 1e-10) << metric;
    }
}

TEST(ValidationEvaluateFull, MissingExampleColumnThrows) {
    const auto ds   = make_scored_dataset();
    const auto eras = EraPartition::build(ds, "era");
    ValidationConfig cfg;
    cfg.example_column = "no_such_baseline";
    const ValidationMetricsEngine engine(cfg);
    EXPECT_THROW(static_cast<void>(engine.evaluate(ds, "perfect", eras)), UnknownColumnError);
}

TEST(ValidationEvaluateFull, TopBottomUsesExtremesOnly) {
    // One era: the lowest prediction has the highest target and vice versa,
    // while the middle rows agree with the prediction.
    LabelColumn labels(6, std::string("e1"));
    labels.emplace_back(std::string("e2"));
    labels.emplace_back(std::string("e2"));
    labels.emplace_back(std::string("e2"));
    labels.emplace_back(std::string("e2"));
    labels.emplace_back(std::string("e2"));
    labels.emplace_back(std::string("e2"));

    Column pred(12);
    pred << 0.1, 0.2, 0.3, 0.4, 0.5, 0.6,
            0.1, 0.2, 0.3, 0.4, 0.5, 0.6;
    Column target(12);
    target << 1.0, 0.2, 0.3, 0.4, 0.5, 0.0,
              1.0, 0.2, 0.3, 0.4, 0.5, 0.0;

    TabularDataset ds;
    ds.set_features({"feature_a"}, Matrix::Constant(12, 1, 0.5));
    ds.set_target("target", target);
    ds.set_labels("era", labels);
    ds.set_prediction("model", pred);
    ds.set_prediction("example_preds", pred);

    ValidationConfig cfg;
    cfg.top_bottom = 1;
    const ValidationMetricsEngine engine(cfg);
    const auto row = engine.evaluate(ds, "model", EraPartition::build(ds, "era"));

    ASSERT_TRUE(row.tb_mean.has_value());
    EXPECT_NEAR(*row.tb_mean, -1.0, 1e-12);
    EXPECT_DOUBLE_EQ(*row.tb_sharpe, 0.0);
    // A constant feature has no exposure.
    EXPECT_DOUBLE_EQ(*row.max_feature_exposure, 0.0);
}

// ─── ValidationStatsTable ─────────────────────────────────────────────────────

TEST(ValidationStatsTableTest, AppendRejectsDuplicates) {
    ValidationStatsTable table;
    table.append(ValidationStatsRow{.column = "a", .mean = 0.1});
    EXPECT_THROW(table.append(ValidationStatsRow{.column = "a"}), InvalidParameterError);
    EXPECT_EQ(table.size(), 1u);
    ASSERT_NE(table.find("a"), nullptr);
    EXPECT_EQ(table.find("b"), nullptr);
}

TEST(ValidationStatsTableTest, SortedByMeanDescending) {
    ValidationStatsTable table;
    table.append(ValidationStatsRow{.column = "low", .mean = -0.01});
    table.append(ValidationStatsRow{.column = "zeta", .mean = 0.03});
    table.append(ValidationStatsRow{.column = "alpha", .mean = 0.03});

    const auto sorted = table.sorted_by_mean();
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0].column, "alpha");
    EXPECT_EQ(sorted[1].column, "zeta");
    EXPECT_EQ(sorted[2].column, "low");
    // The table itself keeps insertion order.
    EXPECT_EQ(table.rows().front().column, "low");
}

TEST(ValidationStatsTableTest, MarkdownLayout) {
    ValidationStatsTable table;
    table.append(ValidationStatsRow{.column = "model_a", .mean = 0.0125, .sharpe = 1.5});

    const std::string md = table.to_markdown({"mean", "sharpe", "mmc_mean"});
    EXPECT_NE(md.find("|  "), std::string::npos);
    EXPECT_NE(md.find("mean"), std::string::npos);
    EXPECT_NE(md.find("model_a"), std::string::npos);
    EXPECT_NE(md.find("0.012500"), std::string::npos);
    EXPECT_NE(md.find("1.500000"), std::string::npos);
    EXPECT_NE(md.find("nan"), std::string::npos);
    EXPECT_NE(md.find(":|"), std::string::npos);

    // Header, alignment row, one data row.
    EXPECT_EQ(std::count(md.begin(), md.end(), '\n'), 3);
}
