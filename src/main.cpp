/// @file src/main.cpp
/// @brief erastat CLI entry point.
///
/// Usage:
///   erastat --validate <csv> [options]   Rank, neutralize, score and select
///   erastat --help                       Print usage

#include "erastat/data_loader.hpp"
#include "erastat/errors.hpp"
#include "erastat/pipeline.hpp"

#include <fmt/core.h>

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  erastat --validate <validation.csv> [options]\n"
        "  erastat --help\n"
        "\n"
        "Options:\n"
        "  --train <csv>        Rank risky features on this split (default: validation)\n"
        "  --risky <n>          Number of riskiest features to neutralize against (50)\n"
        "  --proportion <p>     Neutralization proportion in [0, 1] (1.0)\n"
        "  --no-normalize       Skip the Gaussian rank transform before projection\n"
        "  --fast               Skip feature-exposure and example-comparison metrics\n"
        "  --example <column>   Baseline prediction column (example_preds)\n"
        "  --era <column>       Era column (era)\n"
        "  --verbose            Progress output on stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  id,era,feature_*,...,target,<prediction columns>\n"
    );
}

struct CliOptions {
    std::string                 validation_path;
    std::optional<std::string>  training_path;
    erastat::PipelineConfig     pipeline;
};

/// Returns nullopt (after printing the reason) on bad arguments.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        const bool has_value = (i + 1 < argc);

        if (arg == "--validate" && has_value) {
            opts.validation_path = argv[++i];
        } else if (arg == "--train" && has_value) {
            opts.training_path = argv[++i];
        } else if (arg == "--risky" && has_value) {
            const auto k = erastat::DataLoader::parse_count(argv[++i]);
            if (!k) {
                fmt::print(stderr, "Error: --risky expects a non-negative integer\n");
                return std::nullopt;
            }
            opts.pipeline.risky_feature_count = *k;
        } else if (arg == "--proportion" && has_value) {
            const auto p = erastat::DataLoader::parse_number(argv[++i]);
            if (!p) {
                fmt::print(stderr, "Error: --proportion expects a number\n");
                return std::nullopt;
            }
            opts.pipeline.neutralize.proportion = *p;
        } else if (arg == "--no-normalize") {
            opts.pipeline.neutralize.normalize = false;
        } else if (arg == "--fast") {
            opts.pipeline.validation.fast_mode = true;
        } else if (arg == "--example" && has_value) {
            opts.pipeline.validation.example_column = argv[++i];
        } else if (arg == "--era" && has_value) {
            opts.pipeline.era_column = argv[++i];
        } else if (arg == "--verbose") {
            opts.pipeline.verbose = true;
        } else {
            fmt::print(stderr, "Unknown or incomplete option: {}\n", arg);
            return std::nullopt;
        }
    }
    if (opts.validation_path.empty()) {
        fmt::print(stderr, "Error: --validate requires a CSV file path\n");
        return std::nullopt;
    }
    return opts;
}

/// Load a CSV split. Returns nullopt (after printing the reason) on failure.
std::optional<erastat::TabularDataset> load(const std::string& path,
                                            const erastat::PipelineConfig& cfg) {
    erastat::LoaderConfig loader;
    loader.era_column = cfg.era_column;

    auto data = erastat::DataLoader::load_csv(path, loader);
    if (!data) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", path);
        return std::nullopt;
    }
    if (data->empty()) {
        fmt::print(stderr, "Error: no data rows loaded from '{}'\n", path);
        return std::nullopt;
    }
    fmt::print("Loaded {} rows, {} features from '{}'\n",
               data->row_count(), data->feature_names().size(), path);
    return data;
}

/// Returns 0 on success, 1 on error.
int run_validate(const CliOptions& opts) {
    auto validation = load(opts.validation_path, opts.pipeline);
    if (!validation) return 1;

    std::optional<erastat::TabularDataset> training;
    if (opts.training_path) {
        training = load(*opts.training_path, opts.pipeline);
        if (!training) return 1;
    }

    // Every numeric non-feature column except the baseline is a candidate.
    std::vector<std::string> candidates;
    for (const auto& name : validation->prediction_names()) {
        if (name != opts.pipeline.validation.example_column) {
            candidates.push_back(name);
        }
    }
    if (candidates.empty()) {
        fmt::print(stderr, "Error: no prediction columns found in '{}'\n", opts.validation_path);
        return 1;
    }

    const erastat::Pipeline pipeline(opts.pipeline);
    const auto result = pipeline.run(*validation,
                                     training ? *training : *validation,
                                     candidates);

    const std::vector<std::string> shown =
        opts.pipeline.validation.fast_mode
            ? std::vector<std::string>{"mean", "sharpe"}
            : erastat::ValidationStatsRow::metric_names();
    fmt::print("{}\n", result.stats.to_markdown(shown));
    fmt::print("selecting model {} as our highest mean model in validation (mean {:.6f})\n",
               result.selection.column, result.selection.mean);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    try {
        return run_validate(*opts);
    } catch (const erastat::Error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "Fatal: {}\n", e.what());
        return 1;
    }
}
