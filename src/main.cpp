/// @file src/main.cpp
/// @brief strp_demo: full pipeline over a synthetic city.
///
/// Usage:
///   strp_demo [--listings N] [--seed S] [--search-weights] [--cv] [--tune] [--verbose]
///   strp_demo --help

#include "strp/pipeline.hpp"
#include "strp/sample_data.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  strp_demo [options]\n"
        "\n"
        "Options:\n"
        "  --listings N       Number of synthetic listings (default 300)\n"
        "  --seed S           Seed for data generation and training (default 42)\n"
        "  --search-weights   Tune ensemble weights on a validation slice\n"
        "  --cv               Also cross-validate each regressor\n"
        "  --tune             Grid-search each regressor by cross-validated MAE\n"
        "  --verbose          Diagnostic output on stderr\n"
        "  --help             Show this help\n"
    );
}

template <class T>
bool parse_number(std::string_view text, T& out) {
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

/// Print the top features of a trained model.
void print_importance(const strp::models::TrainedModel& model, std::size_t top) {
    fmt::print("Top features ({}):\n", model.name());
    const auto ranked = model.feature_importance();
    for (std::size_t i = 0; i < ranked.size() && i < top; ++i) {
        fmt::print("  {:<28} {:.4f}\n", ranked[i].first, ranked[i].second);
    }
}

/// Small per-kind grid for the demo run.
strp::evaluation::HyperparameterGrid demo_grid(strp::RegressorKind kind) {
    switch (kind) {
        case strp::RegressorKind::Ridge:
            return {.alpha = {0.1, 1.0, 10.0}};
        case strp::RegressorKind::RandomForest:
            return {.max_depth = {6, 12}, .min_samples_leaf = {1, 5}};
        case strp::RegressorKind::GradientBoosting:
            return {.max_depth = {3, 5}, .learning_rate = {0.05, 0.1}};
    }
    return {};
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    strp::core::SampleCityConfig city_cfg;
    strp::PipelineConfig config;
    config.features.temporal.reference_date = city_cfg.as_of;
    bool run_cv = false;
    bool run_tune = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--listings" || arg == "--seed") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", arg);
                return 1;
            }
            const std::string_view value(argv[++i]);
            bool ok = false;
            if (arg == "--listings") {
                ok = parse_number(value, city_cfg.listings);
            } else {
                std::uint64_t seed = 0;
                ok = parse_number(value, seed);
                city_cfg.seed      = seed;
                config.models.seed = seed;
            }
            if (!ok) {
                fmt::print(stderr, "Error: invalid value '{}' for {}\n", value, arg);
                return 1;
            }
        } else if (arg == "--search-weights") {
            config.models.weighting = strp::WeightingStrategy::RandomSearch;
        } else if (arg == "--cv") {
            run_cv = true;
        } else if (arg == "--tune") {
            run_tune = true;
        } else if (arg == "--verbose") {
            config.features.verbose = true;
            config.models.verbose   = true;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            print_usage();
            return 1;
        }
    }

    const auto city = strp::core::SampleCityGenerator(city_cfg).generate();
    fmt::print("Generated {} listings and {} POIs (seed {})\n",
               city.listings.size(), city.pois.size(), city_cfg.seed);

    const strp::core::Pipeline pipeline(config);
    auto run = pipeline.run(city.listings, city.pois);
    if (!run) {
        fmt::print(stderr, "Error: {}\n", run.error().to_string());
        return 1;
    }

    fmt::print("{}\n", run->features.diagnostics().to_string());
    fmt::print("{}\n", run->report.to_string());

    if (const auto best = run->report.best()) {
        fmt::print("Best: {}\n\n", best->name);
        if (const auto model = run->outcome.find(best->name)) print_importance(*model, 10);
    }

    // Price one held-out listing with the ensemble.
    const auto& outcome = run->outcome;
    if (outcome.ensemble && outcome.test_features.rows() > 0) {
        const auto row = outcome.test_features.row(0);
        if (const auto price = strp::predict(*outcome.ensemble, row)) {
            fmt::print("\nListing {}: actual {:.2f}, ensemble {:.2f}\n",
                       outcome.test_features.listing_ids()[0], outcome.test_target(0), *price);
        }
    }

    if (run_cv) {
        const strp::evaluation::Evaluator evaluator(config.evaluation);
        for (const auto& spec : config.models.regressors) {
            auto cv = evaluator.cross_validate(spec, run->features, config.target_column,
                                               outcome.feature_columns, config.models.seed);
            if (cv) {
                fmt::print("\n{}", cv->to_string());
            } else {
                fmt::print(stderr, "Cross-validation of '{}' failed: {}\n", spec.name,
                           cv.error().to_string());
            }
        }
    }
    if (run_tune) {
        const strp::evaluation::Evaluator evaluator(config.evaluation);
        for (const auto& spec : config.models.regressors) {
            auto tuned = evaluator.tune(spec, demo_grid(spec.kind), run->features, config.target_column,
                                        outcome.feature_columns, config.models.seed);
            if (tuned) {
                fmt::print("\n{}", tuned->to_string());
            } else {
                fmt::print(stderr, "Tuning of '{}' failed: {}\n", spec.name, tuned.error().to_string());
            }
        }
    }
    return 0;
}
