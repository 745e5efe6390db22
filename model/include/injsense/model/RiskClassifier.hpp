/**
 * @file RiskClassifier.hpp
 * @brief Injury-risk classifier: standard scaler + random forest.
 *
 * State machine (Untrained -> Trained). There is no way back to Untrained;
 * train() or load() on a trained classifier replaces the model wholesale.
 *
 * Scoring of a class-1 probability p:
 *   - riskScore  = round(p * 100)
 *   - riskLabel  = High if riskScore >= 60, Medium if >= 30, else Low
 *   - confidence = round(2 * |p - 0.5| * 100)
 *
 * @see TrainedModel
 */

#pragma once

#include "injsense/model/ClassificationReport.hpp"
#include "injsense/model/FeatureSchema.hpp"
#include "injsense/model/RandomForest.hpp"
#include "injsense/model/RiskAssessment.hpp"
#include "injsense/model/RiskFeatureVector.hpp"
#include "injsense/model/TrainedModel.hpp"
#include "injsense/model/TrainingSet.hpp"

#include "injsense/core/Expected.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace injsense::model {

enum class ClassifierState : core::u8 {
    kUntrained,
    kTrained,
};

class RiskClassifier {
public:
    explicit RiskClassifier(FeatureSchema schema = FeatureSchema::injuryRisk(),
                            const ForestConfig &forestConfig = {});

    /**
     * @brief Fits the scaler on @p set, then the forest on the scaled rows.
     *
     * A single-class set is accepted and yields a constant model.
     *
     * @return The new model, kInsufficientSamples for an empty set or
     *         kSchemaMismatch when the set was built for another schema,
     *         kNonFiniteSample when a value is NaN or infinite.
     */
    [[nodiscard]] core::Expected<std::shared_ptr<const TrainedModel>> train(const TrainingSet &set);

    /**
     * @brief Scores @p features with the current model.
     * @return kInvalidState when untrained, kSchemaMismatch for a vector
     *         built on another schema.
     */
    [[nodiscard]] core::Expected<RiskAssessment> predict(const RiskFeatureVector &features) const;

    /// @brief Scores @p features with an explicit model.
    [[nodiscard]] static core::Expected<RiskAssessment> predict(
        const TrainedModel &model,
        const RiskFeatureVector &features);

    /// @brief Builds the assessment for a class-1 probability.
    [[nodiscard]] static RiskAssessment assessmentFor(core::f64 probability, std::vector<RiskFactor> factors);

    /// @brief Normalised importances, descending (kInvalidState when untrained).
    [[nodiscard]] core::Expected<std::vector<RiskFactor>> featureImportance() const;

    /**
     * @brief Accuracy and per-class metrics on a hold-out set (threshold 0.5).
     */
    [[nodiscard]] core::Expected<ClassificationReport> evaluate(const TrainingSet &set) const;

    [[nodiscard]] core::ExpectedVoid save(const std::filesystem::path &path) const;

    /**
     * @brief Replaces the model with the artifact at @p path.
     * @return kModelNotFound when the file does not exist; see TrainedModel::load.
     */
    [[nodiscard]] core::ExpectedVoid load(const std::filesystem::path &path);

    /**
     * @brief Installs an already trained model.
     * @return kSchemaMismatch when its schema differs from schema().
     */
    [[nodiscard]] core::ExpectedVoid adopt(std::shared_ptr<const TrainedModel> model);

    [[nodiscard]] ClassifierState state() const noexcept { return _state; }
    [[nodiscard]] const FeatureSchema &schema() const noexcept { return _schema; }
    [[nodiscard]] const ForestConfig &forestConfig() const noexcept { return _forestConfig; }
    [[nodiscard]] std::shared_ptr<const TrainedModel> model() const noexcept { return _model; }

private:
    [[nodiscard]] core::ExpectedVoid requireTrained() const;

    FeatureSchema _schema;
    ForestConfig _forestConfig;
    ClassifierState _state = ClassifierState::kUntrained;
    std::shared_ptr<const TrainedModel> _model;
};

} // namespace injsense::model
