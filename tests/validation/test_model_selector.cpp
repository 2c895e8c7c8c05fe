/// @file tests/validation/test_model_selector.cpp
/// @brief Tests for ModelSelector.

#include "erastat/model_selector.hpp"
#include "erastat/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace erastat;

namespace {

ValidationStatsTable make_table() {
    ValidationStatsTable table;
    table.append(ValidationStatsRow{.column = "model_b", .mean = 0.021});
    table.append(ValidationStatsRow{.column = "model_a", .mean = 0.034});
    table.append(ValidationStatsRow{.column = "model_c", .mean = -0.004});
    return table;
}

}  // anonymous namespace

// ─── best_column ──────────────────────────────────────────────────────────────

TEST(ModelSelectorBest, HighestMeanWins) {
    EXPECT_EQ(ModelSelector::best_column(make_table()), "model_a");
}

TEST(ModelSelectorBest, WinnerMeanIsMaximal) {
    const auto table = make_table();
    const auto best  = ModelSelector::best_column(table);
    const auto* row  = table.find(best);
    ASSERT_NE(row, nullptr);
    for (const auto& other : table.rows()) {
        EXPECT_GE(row->mean, other.mean) << other.column;
    }
}

TEST(ModelSelectorBest, TieGoesToSmallerName) {
    ValidationStatsTable table;
    table.append(ValidationStatsRow{.column = "zeta", .mean = 0.02});
    table.append(ValidationStatsRow{.column = "beta", .mean = 0.02});
    table.append(ValidationStatsRow{.column = "gamma", .mean = 0.01});
    EXPECT_EQ(ModelSelector::best_column(table), "beta");
}

TEST(ModelSelectorBest, EmptyTableThrows) {
    EXPECT_THROW(static_cast<void>(ModelSelector::best_column(ValidationStatsTable{})),
                 DegenerateInputError);
}

// ─── select ───────────────────────────────────────────────────────────────────

TEST(ModelSelectorSelect, PercentileRanksChosenColumn) {
    TabularDataset ds;
    Column a(4);
    a << 0.9, 0.1, 0.5, 0.3;
    ds.set_prediction("model_a", a);
    ds.set_prediction("model_b", Column::Zero(4));
    ds.set_prediction("model_c", Column::Zero(4));

    const auto sel = ModelSelector::select(make_table(), ds);
    EXPECT_EQ(sel.column, "model_a");
    EXPECT_DOUBLE_EQ(sel.mean, 0.034);
    ASSERT_EQ(sel.prediction.size(), 4);
    EXPECT_DOUBLE_EQ(sel.prediction[0], 1.0);
    EXPECT_DOUBLE_EQ(sel.prediction[1], 0.25);
    EXPECT_DOUBLE_EQ(sel.prediction[2], 0.75);
    EXPECT_DOUBLE_EQ(sel.prediction[3], 0.5);
}

TEST(ModelSelectorSelect, MissingPredictionsStayNaN) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    TabularDataset ds;
    Column a(4);
    a << 0.3, nan, 0.1, 0.2;
    ds.set_prediction("model_a", a);

    const auto sel = ModelSelector::select(make_table(), ds);
    ASSERT_EQ(sel.prediction.size(), 4);
    // Three present values share the (0, 1] range; the gap is not ranked.
    EXPECT_DOUBLE_EQ(sel.prediction[0], 1.0);
    EXPECT_TRUE(std::isnan(sel.prediction[1]));
    EXPECT_DOUBLE_EQ(sel.prediction[2], 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(sel.prediction[3], 2.0 / 3.0);
}

TEST(ModelSelectorSelect, WinnerMissingFromDatasetThrows) {
    TabularDataset ds;
    ds.set_prediction("model_b", Column::Zero(2));
    EXPECT_THROW(static_cast<void>(ModelSelector::select(make_table(), ds)), UnknownColumnError);
}
