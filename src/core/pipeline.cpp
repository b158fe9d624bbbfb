/// @file src/core/pipeline.cpp
/// @brief Stage functions and the Pipeline façade.

#include "strp/pipeline.hpp"
#include "strp/assembler.hpp"

#include <fmt/format.h>

namespace strp {

Result<FeatureMatrix> assemble_features(std::span<const Listing> listings,
                                        std::span<const Poi> pois,
                                        const FeatureConfig& config) {
    auto assembler = features::FeatureAssembler::from_config(pois, config);
    if (!assembler) return assembler.error();
    return assembler->assemble(listings);
}

Result<models::TrainingOutcome> train(const FeatureMatrix& features,
                                      const std::string& target_column,
                                      const ModelConfig& config) {
    return models::ModelOrchestrator(config).train(features, target_column);
}

evaluation::EvaluationReport evaluate(std::span<const models::TrainedModel> models,
                                      const Result<models::Ensemble>& ensemble,
                                      const FeatureMatrix& test_features,
                                      const Eigen::VectorXd& test_target,
                                      std::span<const models::ModelStatus> statuses,
                                      const EvaluationConfig& config) {
    return evaluation::Evaluator(config).evaluate(models, ensemble, test_features, test_target,
                                                  statuses);
}

evaluation::EvaluationReport evaluate(const models::TrainingOutcome& outcome,
                                      const EvaluationConfig& config) {
    return evaluation::Evaluator(config).evaluate(outcome);
}

std::optional<double> predict(const models::Ensemble& ensemble, const FeatureVector& features) {
    return ensemble.predict(features);
}

std::optional<double> predict(const models::TrainedModel& model, const FeatureVector& features) {
    return model.predict(features);
}

}  // namespace strp

namespace strp::core {

Pipeline::Pipeline(PipelineConfig config) : config_(std::move(config)) {}

Result<FeatureMatrix> Pipeline::assemble(std::span<const Listing> listings,
                                         std::span<const Poi> pois) const {
    return assemble_features(listings, pois, config_.features);
}

Result<models::TrainingOutcome> Pipeline::train(const FeatureMatrix& features) const {
    return strp::train(features, config_.target_column, config_.models);
}

evaluation::EvaluationReport Pipeline::evaluate(const models::TrainingOutcome& outcome) const {
    return strp::evaluate(outcome, config_.evaluation);
}

Result<PipelineRun> Pipeline::run(std::span<const Listing> listings,
                                  std::span<const Poi> pois) const {
    // Fail on any configuration problem before spending time on features.
    if (auto err = config_.validate()) return *err;

    auto features = assemble(listings, pois);
    if (!features) return features.error();
    if (config_.features.verbose) {
        fmt::print(stderr, "{}\n", features->diagnostics().to_string());
    }

    auto outcome = train(*features);
    if (!outcome) return outcome.error();

    auto report = evaluate(*outcome);
    return PipelineRun{
        .features = std::move(features).value(),
        .outcome  = std::move(outcome).value(),
        .report   = std::move(report),
    };
}

}  // namespace strp::core
