/// @file src/validation/model_selector.cpp
/// @brief Best-mean selection and percentile ranking.

#include "erastat/model_selector.hpp"
#include "erastat/errors.hpp"
#include "erastat/rank_normalizer.hpp"
#include "erastat/stats.hpp"

#include <limits>
#include <numeric>
#include <utility>

namespace erastat {

std::string ModelSelector::best_column(const ValidationStatsTable& table) {
    if (table.empty()) {
        throw DegenerateInputError("cannot select a model from an empty stats table");
    }

    const ValidationStatsRow* best = &table.rows().front();
    for (const auto& row : table.rows()) {
        if (row.mean > best->mean ||
            (row.mean == best->mean && row.column < best->column)) {
            best = &row;
        }
    }
    return best->column;
}

Selection ModelSelector::select(const ValidationStatsTable& table,
                                const TabularDataset&       dataset) {
    const std::string column = best_column(table);
    const ValidationStatsRow* row = table.find(column);

    const Column values = dataset.numeric_column(column);
    RowIndices all(static_cast<std::size_t>(values.size()));
    std::iota(all.begin(), all.end(), RowIndex{0});
    const RowIndices present = stats::finite_rows(values, all);

    Column prediction = Column::Constant(values.size(), std::numeric_limits<double>::quiet_NaN());
    if (!present.empty()) {
        const Column ranked = RankNormalizer::percentile(stats::gather(values, present));
        for (std::size_t i = 0; i < present.size(); ++i) {
            prediction[present[i]] = ranked[static_cast<Eigen::Index>(i)];
        }
    }

    return Selection{
        .column     = column,
        .mean       = row->mean,
        .prediction = std::move(prediction),
    };
}

}  // namespace erastat
