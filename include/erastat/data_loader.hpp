#pragma once

/// @file include/erastat/data_loader.hpp
/// @brief CSV loader that materializes a TabularDataset.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse a CSV file (or string) with a header row into a TabularDataset.
/// Column roles come from their names (see LoaderConfig):
///   - `feature_prefix*` → feature columns (unparseable or empty cell → NaN)
///   - `target_column`   → target (empty cell → NaN)
///   - `id_column`       → row ids
///   - `era_column`      → era labels (always categorical)
///   - any other column whose non-empty cells all parse as numbers becomes a
///     prediction column; everything else is a label column (empty → null)
///
/// ## Expected CSV Format
/// ```
/// id,era,data_type,feature_a,feature_b,target,example_preds
/// n0,era1,validation,0.25,0.75,0.5,0.49
/// ```
///
/// ## Guarantees
/// - Rows with the wrong number of fields are skipped with a warning
/// - Blank lines and lines starting with '#' are ignored
/// - Does not modify any file or external state

#include "erastat/dataset.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace erastat {

/// Column-role configuration for the loader.
struct LoaderConfig {
    std::string era_column     = "era";
    std::string target_column  = "target";
    std::string id_column      = "id";
    std::string feature_prefix = "feature_";
};

class DataLoader {
public:
    /// Load a dataset from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - the parsed dataset otherwise (empty if the file has no data rows)
    [[nodiscard]] static std::optional<TabularDataset>
    load_csv(const std::string& filepath, const LoaderConfig& config = LoaderConfig{});

    /// Parse a dataset from CSV text (useful for testing).
    [[nodiscard]] static TabularDataset
    parse_csv_string(const std::string& csv_content, const LoaderConfig& config = LoaderConfig{});

    /// Split one CSV line on commas; trims whitespace and surrounding quotes.
    [[nodiscard]] static std::vector<std::string> split_row(std::string_view line);

    /// Parse a numeric cell. nullopt for empty or malformed text.
    [[nodiscard]] static std::optional<double> parse_number(std::string_view cell) noexcept;

    /// Parse a non-negative decimal integer (digits only). nullopt for signs,
    /// fractions, exponents, non-finite text or values beyond `std::size_t`.
    [[nodiscard]] static std::optional<std::size_t> parse_count(std::string_view text) noexcept;
};

}  // namespace erastat
