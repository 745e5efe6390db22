// /////////////////////////////////////////////////////////////////////////////
/// @file RiskEngine.cpp
/// @brief RiskEngine implementation.
// /////////////////////////////////////////////////////////////////////////////

#include "injsense/engine/RiskEngine.hpp"

#include "injsense/model/RiskClassifier.hpp"
#include "injsense/model/SyntheticCohort.hpp"

#include "injsense/core/Log.hpp"

#include <format>

namespace injsense::engine {

namespace {

constexpr const char* kTag = "RiskEngine";

} // namespace

RiskEngine::RiskEngine(Config config, dsp::SignalFilter filter, std::shared_ptr<const model::TrainedModel> model)
    : _config(std::move(config))
    , _filter(std::move(filter))
    , _spectral(_config.spectral())
    , _imbalance(_config.rmsWindowSize())
    , _temperature(_config.temperatureThresholds())
    , _model(std::move(model))
{
}

core::Expected<RiskEngine> RiskEngine::create(Config config)
{
    auto filter = INJSENSE_TRY(dsp::SignalFilter::create(config.filter()));
    INJSENSE_TRY_VOID(config.spectral().mapping.validate());
    auto model = INJSENSE_TRY(loadOrTrain(config));
    return RiskEngine(std::move(config), std::move(filter), std::move(model));
}

core::Expected<RiskEngine> RiskEngine::withModel(Config config, std::shared_ptr<const model::TrainedModel> model)
{
    if (!model)
        return core::makeError(core::ErrorCode::kInvalidArgument, "null model");
    if (model->schema() != model::FeatureSchema::injuryRisk())
        return core::makeError(core::ErrorCode::kSchemaMismatch, "model was trained on another schema");

    auto filter = INJSENSE_TRY(dsp::SignalFilter::create(config.filter()));
    INJSENSE_TRY_VOID(config.spectral().mapping.validate());
    return RiskEngine(std::move(config), std::move(filter), std::move(model));
}

core::Expected<std::shared_ptr<const model::TrainedModel>> RiskEngine::loadOrTrain(const Config& config)
{
    const model::FeatureSchema& schema = model::FeatureSchema::injuryRisk();

    auto loaded = model::TrainedModel::load(config.modelPath(), schema);
    if (loaded)
        return loaded;

    if (loaded.error().code() != core::ErrorCode::kModelNotFound) {
        core::Log::error(kTag, std::format("cannot use model artifact: {}", loaded.error().format()));
        return std::unexpected(std::move(loaded.error()));
    }

    core::Log::warn(kTag, std::format("{}; training on the synthetic cohort", loaded.error().message()));

    const model::SyntheticCohort cohort(config.cohort());
    const model::CohortSplit split = INJSENSE_TRY(cohort.generateSplit());

    model::RiskClassifier classifier(schema, config.forest());
    auto trained = INJSENSE_TRY(classifier.train(split.training));

    const model::ClassificationReport report = INJSENSE_TRY(classifier.evaluate(split.holdout));
    core::Log::info(kTag, std::format("hold-out accuracy {:.3f} on {} samples\n{}",
                                      report.accuracy, report.sampleCount, report.format()));

    if (config.saveTrainedModel()) {
        if (auto saved = trained->save(config.modelPath()); !saved)
            core::Log::error(kTag, std::format("model kept in memory only: {}", saved.error().format()));
    }

    return trained;
}

core::Expected<std::vector<core::f64>> RiskEngine::filterChannel(const std::vector<core::f64>& raw) const
{
    const dsp::SignalWindow window = dsp::SignalWindow::fromSamples(raw, _config.filter().sampleRate);
    const dsp::SignalWindow filtered = INJSENSE_TRY(_filter.apply(window));
    return filtered.channel(0);
}

core::Expected<DerivedSignalFeatures> RiskEngine::deriveSignalFeatures(const SignalBundle& signals) const
{
    DerivedSignalFeatures derived;

    if (!signals.leftEmg.empty() || !signals.rightEmg.empty()) {
        const std::vector<core::f64> left = INJSENSE_TRY(filterChannel(signals.leftEmg));
        const std::vector<core::f64> right = INJSENSE_TRY(filterChannel(signals.rightEmg));
        const core::f64 rate = _config.filter().sampleRate;

        derived.semgImbalance = INJSENSE_TRY(_imbalance.imbalance(left, right));

        const core::f64 leftFatigue = INJSENSE_TRY(_spectral.fatigueIndex(left, rate));
        const core::f64 rightFatigue = INJSENSE_TRY(_spectral.fatigueIndex(right, rate));
        derived.muscleFatigue = 0.5 * (leftFatigue + rightFatigue);
    }

    if (!signals.temperature.empty())
        derived.temperature = INJSENSE_TRY(_temperature.analyze(signals.temperature));

    return derived;
}

core::Expected<model::RiskAssessment> RiskEngine::assess(
    const model::AthleteRecord& record,
    const std::optional<SignalBundle>& signals) const
{
    model::AthleteRecord merged = record;

    if (signals) {
        const DerivedSignalFeatures derived = INJSENSE_TRY(deriveSignalFeatures(*signals));
        if (derived.semgImbalance)
            merged.features.insert_or_assign("semg_imbalance", *derived.semgImbalance);
        if (derived.muscleFatigue)
            merged.features.insert_or_assign("muscle_fatigue", *derived.muscleFatigue);
        if (derived.temperature) {
            merged.features.insert_or_assign("temperature_variation", derived.temperature->stdDeviation);
            if (derived.temperature->abnormal)
                core::Log::warn(kTag, std::format("athlete {}: abnormal skin temperature (max {:.2f})",
                                                  record.athleteId, derived.temperature->maximum));
        }
    }

    std::vector<std::string> imputed;
    const model::RiskFeatureVector features =
        INJSENSE_TRY(_config.imputation().assemble(_model->schema(), merged, &imputed));

    if (!imputed.empty()) {
        std::string names;
        for (const std::string& name : imputed)
            names += names.empty() ? name : ", " + name;
        core::Log::debug(kTag, std::format("athlete {}: imputed {}", record.athleteId, names));
    }

    auto assessment = INJSENSE_TRY(model::RiskClassifier::predict(*_model, features));
    core::Log::debug(kTag, std::format("athlete {}: risk {} ({})", record.athleteId, assessment.riskScore,
                                       model::riskLabelName(assessment.riskLabel)));
    return assessment;
}

core::Expected<features::SignalFeatureVector> RiskEngine::extractSignalFeatures(const SignalBundle& signals) const
{
    const std::vector<core::f64> left = INJSENSE_TRY(filterChannel(signals.leftEmg));
    const std::vector<core::f64> right = INJSENSE_TRY(filterChannel(signals.rightEmg));

    const dsp::SignalWindow emg = INJSENSE_TRY(dsp::SignalWindow::fromChannels({left, right}, _config.filter().sampleRate));
    return _extractor.extract(emg, signals.heartRate, signals.temperature);
}

} // namespace injsense::engine
