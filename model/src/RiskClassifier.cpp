/**
 * @file RiskClassifier.cpp
 * @brief RiskClassifier implementation.
 */

#include "injsense/model/RiskClassifier.hpp"

#include "injsense/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace injsense::model {

namespace {

constexpr const char *kTag = "RiskClassifier";

} // namespace

RiskClassifier::RiskClassifier(FeatureSchema schema, const ForestConfig &forestConfig)
    : _schema(std::move(schema)), _forestConfig(forestConfig)
{
}

core::ExpectedVoid RiskClassifier::requireTrained() const
{
    if (_state != ClassifierState::kTrained || !_model)
        return core::makeError(core::ErrorCode::kInvalidState, "risk classifier is not trained");
    return {};
}

core::Expected<std::shared_ptr<const TrainedModel>> RiskClassifier::train(const TrainingSet &set)
{
    if (set.empty())
        return core::makeError(core::ErrorCode::kInsufficientSamples, "training set is empty");
    if (set.schema != _schema || static_cast<core::usize>(set.features.cols()) != _schema.size()) {
        return core::makeError(core::ErrorCode::kSchemaMismatch,
            std::format("training set has {} columns, classifier schema has {}", set.features.cols(), _schema.size()));
    }
    if (static_cast<core::usize>(set.features.rows()) != set.size()) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("{} rows but {} labels", set.features.rows(), set.size()));
    }
    if (!set.features.allFinite())
        return core::makeError(core::ErrorCode::kNonFiniteSample, "training set has a non-finite value");

    StandardScaler scaler;
    INJSENSE_TRY_VOID(scaler.fit(set.features));

    RandomForest forest(_forestConfig);
    INJSENSE_TRY_VOID(forest.fit(scaler.transform(set.features), set.labels));

    _model = std::make_shared<TrainedModel>(_schema, std::move(scaler), std::move(forest));
    _state = ClassifierState::kTrained;

    const auto positives = static_cast<core::usize>(std::count(set.labels.begin(), set.labels.end(), core::u8{1}));
    core::Log::info(kTag, std::format("trained {} trees on {} samples ({} positive)",
                                      _forestConfig.treeCount, set.size(), positives));
    return _model;
}

RiskAssessment RiskClassifier::assessmentFor(core::f64 probability, std::vector<RiskFactor> factors)
{
    const auto score = static_cast<core::i32>(std::lround(probability * 100.0));

    return RiskAssessment{
        .riskScore   = score,
        .riskLabel   = riskLabelForScore(score),
        .riskFactors = std::move(factors),
        .confidence  = static_cast<core::i32>(std::lround(2.0 * std::abs(probability - 0.5) * 100.0)),
        .probability = probability,
    };
}

core::Expected<RiskAssessment> RiskClassifier::predict(
    const TrainedModel &model,
    const RiskFeatureVector &features)
{
    const core::f64 probability = INJSENSE_TRY(model.probability(features));
    return assessmentFor(probability, model.riskFactors());
}

core::Expected<RiskAssessment> RiskClassifier::predict(const RiskFeatureVector &features) const
{
    INJSENSE_TRY_VOID(requireTrained());
    return predict(*_model, features);
}

core::Expected<std::vector<RiskFactor>> RiskClassifier::featureImportance() const
{
    INJSENSE_TRY_VOID(requireTrained());
    return _model->riskFactors();
}

core::Expected<ClassificationReport> RiskClassifier::evaluate(const TrainingSet &set) const
{
    INJSENSE_TRY_VOID(requireTrained());
    if (set.empty())
        return core::makeError(core::ErrorCode::kInsufficientSamples, "evaluation set is empty");
    if (set.schema != _schema)
        return core::makeError(core::ErrorCode::kSchemaMismatch, "evaluation set was built for another schema");
    if (!set.features.allFinite())
        return core::makeError(core::ErrorCode::kNonFiniteSample, "evaluation set has a non-finite value");

    const std::vector<core::f64> probabilities = _model->probabilities(set.features);

    std::vector<core::u8> predicted;
    predicted.reserve(probabilities.size());
    for (const core::f64 p : probabilities)
        predicted.push_back(p > 0.5 ? 1 : 0);

    return ClassificationReport::compute(set.labels, predicted);
}

core::ExpectedVoid RiskClassifier::save(const std::filesystem::path &path) const
{
    INJSENSE_TRY_VOID(requireTrained());
    return _model->save(path);
}

core::ExpectedVoid RiskClassifier::load(const std::filesystem::path &path)
{
    auto model = INJSENSE_TRY(TrainedModel::load(path, _schema));
    return adopt(std::move(model));
}

core::ExpectedVoid RiskClassifier::adopt(std::shared_ptr<const TrainedModel> model)
{
    if (!model)
        return core::makeError(core::ErrorCode::kInvalidArgument, "null model");
    if (model->schema() != _schema)
        return core::makeError(core::ErrorCode::kSchemaMismatch, "model was trained on another schema");

    _model = std::move(model);
    _state = ClassifierState::kTrained;
    return {};
}

} // namespace injsense::model
