/// @file src/core/data_loader.cpp
/// @brief CSV → TabularDataset.

#include "erastat/data_loader.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>

namespace erastat {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    s = s.substr(first, last - first + 1);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

[[nodiscard]] bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return !prefix.empty() && s.substr(0, prefix.size()) == prefix;
}

}  // namespace

// ─── split_row / parse_number / parse_count ──────────────────────────────────

std::vector<std::string> DataLoader::split_row(std::string_view line) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        const auto end   = (comma == std::string_view::npos) ? line.size() : comma;
        fields.emplace_back(trim(line.substr(start, end - start)));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return fields;
}

std::optional<double> DataLoader::parse_number(std::string_view cell) noexcept {
    if (cell.empty()) return std::nullopt;
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
    if (ec != std::errc{} || ptr != cell.data() + cell.size()) {
        return std::nullopt;  // malformed or trailing garbage
    }
    return value;
}

std::optional<std::size_t> DataLoader::parse_count(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;
    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;  // malformed, out of range or trailing garbage
    }
    return value;
}

// ─── parse_csv_string ─────────────────────────────────────────────────────────

TabularDataset DataLoader::parse_csv_string(const std::string& csv_content,
                                            const LoaderConfig& config) {
    std::istringstream stream(csv_content);
    std::string line;

    std::vector<std::string>              header;
    std::vector<std::vector<std::string>> cells;  // cells[column][row]
    std::size_t skipped = 0;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto fields = split_row(line);
        if (header.empty()) {
            header = std::move(fields);
            cells.resize(header.size());
            continue;
        }
        if (fields.size() != header.size()) {
            ++skipped;
            continue;
        }
        for (std::size_t c = 0; c < fields.size(); ++c) {
            cells[c].push_back(std::move(fields[c]));
        }
    }

    if (skipped > 0) {
        fmt::print(stderr, "warning: skipped {} malformed CSV row(s)\n", skipped);
    }

    TabularDataset dataset;
    if (header.empty()) {
        return dataset;
    }

    const std::size_t n_rows = cells.front().size();
    const auto rows = static_cast<Eigen::Index>(n_rows);

    std::vector<std::string> feature_names;
    std::vector<std::size_t> feature_cols;
    for (std::size_t c = 0; c < header.size(); ++c) {
        if (starts_with(header[c], config.feature_prefix)) {
            feature_names.push_back(header[c]);
            feature_cols.push_back(c);
        }
    }

    Matrix features(rows, static_cast<Eigen::Index>(feature_cols.size()));
    for (std::size_t f = 0; f < feature_cols.size(); ++f) {
        const auto& column = cells[feature_cols[f]];
        for (std::size_t r = 0; r < n_rows; ++r) {
            features(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(f)) =
                parse_number(column[r]).value_or(kNaN);
        }
    }
    dataset.set_features(std::move(feature_names), std::move(features));

    for (std::size_t c = 0; c < header.size(); ++c) {
        const std::string& name   = header[c];
        auto&              column = cells[c];
        if (starts_with(name, config.feature_prefix)) {
            continue;
        }

        if (name == config.id_column) {
            dataset.set_row_ids(std::move(column));
            continue;
        }

        if (name == config.target_column) {
            Column target(rows);
            for (std::size_t r = 0; r < n_rows; ++r) {
                target[static_cast<Eigen::Index>(r)] = parse_number(column[r]).value_or(kNaN);
            }
            dataset.set_target(name, std::move(target));
            continue;
        }

        // Numeric unless some non-empty cell fails to parse. The era column is
        // always categorical, even when its labels are plain integers.
        bool numeric = (name != config.era_column);
        Column values(rows);
        for (std::size_t r = 0; numeric && r < n_rows; ++r) {
            if (column[r].empty()) {
                values[static_cast<Eigen::Index>(r)] = kNaN;
            } else if (const auto v = parse_number(column[r])) {
                values[static_cast<Eigen::Index>(r)] = *v;
            } else {
                numeric = false;
            }
        }

        if (numeric) {
            dataset.set_prediction(name, std::move(values));
            continue;
        }

        LabelColumn labels;
        labels.reserve(n_rows);
        for (auto& cell : column) {
            if (cell.empty()) {
                labels.emplace_back(std::nullopt);
            } else {
                labels.emplace_back(std::move(cell));
            }
        }
        dataset.set_labels(name, std::move(labels));
    }

    return dataset;
}

// ─── load_csv ─────────────────────────────────────────────────────────────────

std::optional<TabularDataset> DataLoader::load_csv(const std::string& filepath,
                                                   const LoaderConfig& config) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str(), config);
}

}  // namespace erastat
