/**
 * @file TestRiskClassifier.cpp
 * @brief Unit tests for RiskClassifier, TrainedModel persistence and the
 *        synthetic cohort.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "injsense/model/RiskClassifier.hpp"
#include "injsense/model/SyntheticCohort.hpp"

#include <algorithm>
#include <filesystem>
#include <limits>
#include <numeric>

using namespace injsense;
using namespace injsense::model;
using Catch::Matchers::WithinAbs;

namespace {

std::filesystem::path scratchPath(const char *name)
{
    return std::filesystem::temp_directory_path() / name;
}

CohortSplit smallCohort()
{
    SyntheticCohort cohort({ .sampleCount = 300 });
    return cohort.generateSplit().value();
}

RiskFeatureVector vectorOf(std::vector<double> values)
{
    return RiskFeatureVector::create(FeatureSchema::injuryRisk(), std::move(values)).value();
}

} // namespace

TEST_CASE("SyntheticCohort is reproducible", "[model][cohort]")
{
    SyntheticCohort cohort;
    auto first = cohort.generate();
    auto second = cohort.generate();
    REQUIRE(first.has_value());
    REQUIRE(first->size() == 1000);
    REQUIRE(first->features == second->features);
    REQUIRE(first->labels == second->labels);

    SECTION("features stay inside their ranges")
    {
        const Eigen::MatrixXd &x = first->features;
        REQUIRE(x.col(0).minCoeff() >= 0.0);
        REQUIRE(x.col(0).maxCoeff() <= 50.0);
        REQUIRE(x.col(3).maxCoeff() <= 72.0);
        REQUIRE(x.col(4).maxCoeff() <= 5.0);
        REQUIRE(x.col(6).minCoeff() >= 18.0);
        REQUIRE(x.col(6).maxCoeff() <= 35.0);
        REQUIRE(x.col(7).maxCoeff() <= 15.0);
    }

    SECTION("both classes are present")
    {
        const auto positives = std::count(first->labels.begin(), first->labels.end(), core::u8{1});
        REQUIRE(positives > 0);
        REQUIRE(positives < 1000);
    }

    SECTION("80/20 split")
    {
        auto split = cohort.split(*first);
        REQUIRE(split.has_value());
        REQUIRE(split->training.size() == 800);
        REQUIRE(split->holdout.size() == 200);
    }

    SECTION("risk formula extremes")
    {
        const std::vector<double> lowest  = {0, 0, 0, 72, 0, 0, 18, 0};
        const std::vector<double> highest = {50, 100, 100, 0, 5, 3, 35, 15};
        REQUIRE_THAT(SyntheticCohort::riskFormula(lowest), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(SyntheticCohort::riskFormula(highest), WithinAbs(1.0, 1e-12));
    }

    SECTION("imbalance contributes at most its weight")
    {
        const std::vector<double> balanced   = {0, 50, 50, 36, 2, 1.5, 26, 7};
        const std::vector<double> imbalanced = {50, 50, 50, 36, 2, 1.5, 26, 7};
        REQUIRE_THAT(SyntheticCohort::riskFormula(imbalanced) - SyntheticCohort::riskFormula(balanced),
                     WithinAbs(0.3, 1e-12));
    }

    SECTION("the end-to-end profile sits above the label threshold")
    {
        const std::vector<double> overloaded = {0, 0, 100, 0, 5, 0, 0, 0};
        REQUIRE_THAT(SyntheticCohort::riskFormula(overloaded), WithinAbs(0.3735294, 1e-6));
        REQUIRE(cohort.config().labelThreshold == 0.35);
        REQUIRE(SyntheticCohort::riskFormula(overloaded) > cohort.config().labelThreshold);
    }
}

TEST_CASE("RiskClassifier state machine", "[model][classifier]")
{
    RiskClassifier classifier;
    REQUIRE(classifier.state() == ClassifierState::kUntrained);

    const auto features = vectorOf({10, 50, 60, 30, 1, 0.8, 26, 5});
    REQUIRE(classifier.predict(features).error().code() == core::ErrorCode::kInvalidState);
    REQUIRE(classifier.featureImportance().error().code() == core::ErrorCode::kInvalidState);
    REQUIRE(classifier.save(scratchPath("injsense_untrained.bin")).error().code() == core::ErrorCode::kInvalidState);

    const CohortSplit data = smallCohort();
    auto model = classifier.train(data.training);
    REQUIRE(model.has_value());
    REQUIRE(classifier.state() == ClassifierState::kTrained);
    REQUIRE(classifier.model() == *model);

    SECTION("retraining replaces the model")
    {
        auto again = classifier.train(data.training);
        REQUIRE(again.has_value());
        REQUIRE(classifier.model() == *again);
        REQUIRE(classifier.state() == ClassifierState::kTrained);
    }
}

TEST_CASE("RiskClassifier rejects mismatched input", "[model][classifier]")
{
    RiskClassifier classifier(FeatureSchema::injuryRisk(), { .treeCount = 10 });

    SECTION("empty training set")
    {
        TrainingSet empty{ .schema = FeatureSchema::injuryRisk(), .features = Eigen::MatrixXd(0, 8), .labels = {} };
        REQUIRE(classifier.train(empty).error().code() == core::ErrorCode::kInsufficientSamples);
    }

    SECTION("training set of another schema")
    {
        auto other = TrainingSet::fromRows(FeatureSchema({"a", "b"}), {{1.0, 2.0}, {2.0, 1.0}}, {0, 1});
        REQUIRE(classifier.train(*other).error().code() == core::ErrorCode::kSchemaMismatch);
    }

    SECTION("non-finite training values")
    {
        TrainingSet poisoned = smallCohort().training;
        poisoned.features(0, 0) = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(classifier.train(poisoned).error().code() == core::ErrorCode::kNonFiniteSample);
        REQUIRE(classifier.state() == ClassifierState::kUntrained);

        poisoned.features(0, 0) = std::numeric_limits<double>::infinity();
        REQUIRE(classifier.train(poisoned).error().code() == core::ErrorCode::kNonFiniteSample);
    }

    SECTION("non-finite evaluation values")
    {
        const CohortSplit data = smallCohort();
        REQUIRE(classifier.train(data.training).has_value());
        TrainingSet poisoned = data.holdout;
        poisoned.features(1, 3) = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(classifier.evaluate(poisoned).error().code() == core::ErrorCode::kNonFiniteSample);
    }

    SECTION("vector of another schema")
    {
        REQUIRE(classifier.train(smallCohort().training).has_value());
        const FeatureSchema reordered({"muscle_fatigue", "semg_imbalance", "training_load", "recovery_time",
                                       "previous_injuries", "temperature_variation", "age", "consecutive_games"});
        auto v = RiskFeatureVector::create(reordered, {1, 2, 3, 4, 5, 6, 7, 8});
        REQUIRE(classifier.predict(*v).error().code() == core::ErrorCode::kSchemaMismatch);
    }
}

TEST_CASE("RiskClassifier scoring rules", "[model][classifier]")
{
    SECTION("label thresholds")
    {
        REQUIRE(RiskClassifier::assessmentFor(0.75, {}).riskLabel == RiskLabel::kHigh);
        REQUIRE(RiskClassifier::assessmentFor(0.60, {}).riskLabel == RiskLabel::kHigh);
        REQUIRE(RiskClassifier::assessmentFor(0.59, {}).riskLabel == RiskLabel::kMedium);
        REQUIRE(RiskClassifier::assessmentFor(0.30, {}).riskLabel == RiskLabel::kMedium);
        REQUIRE(RiskClassifier::assessmentFor(0.29, {}).riskLabel == RiskLabel::kLow);
    }

    SECTION("score and confidence")
    {
        const RiskAssessment a = RiskClassifier::assessmentFor(0.75, {});
        REQUIRE(a.riskScore == 75);
        REQUIRE(a.confidence == 50);

        REQUIRE(RiskClassifier::assessmentFor(0.5, {}).confidence == 0);
        REQUIRE(RiskClassifier::assessmentFor(0.0, {}).confidence == 100);
        REQUIRE(RiskClassifier::assessmentFor(1.0, {}).confidence == 100);
        REQUIRE(RiskClassifier::assessmentFor(1.0, {}).riskScore == 100);
    }

    SECTION("label names")
    {
        REQUIRE(riskLabelName(RiskLabel::kLow) == "Low");
        REQUIRE(riskLabelName(RiskLabel::kMedium) == "Medium");
        REQUIRE(riskLabelName(RiskLabel::kHigh) == "High");
    }
}

TEST_CASE("RiskClassifier predictions are idempotent and well-formed", "[model][classifier]")
{
    RiskClassifier classifier(FeatureSchema::injuryRisk(), { .treeCount = 30 });
    REQUIRE(classifier.train(smallCohort().training).has_value());

    const auto features = vectorOf({35, 80, 90, 10, 3, 1.5, 29, 9});
    auto first = classifier.predict(features);
    auto second = classifier.predict(features);
    REQUIRE(first.has_value());
    REQUIRE(*first == *second);

    REQUIRE(first->riskScore >= 0);
    REQUIRE(first->riskScore <= 100);
    REQUIRE(first->confidence >= 0);
    REQUIRE(first->confidence <= 100);

    const auto &factors = first->riskFactors;
    REQUIRE(factors.size() == 8);
    REQUIRE(std::is_sorted(factors.begin(), factors.end(),
        [](const RiskFactor &a, const RiskFactor &b) { return a.importance > b.importance; }));
    const double total = std::accumulate(factors.begin(), factors.end(), 0.0,
        [](double acc, const RiskFactor &f) { return acc + f.importance; });
    REQUIRE(total <= 1.0 + 1e-9);
    REQUIRE(factors == classifier.featureImportance().value());
}

TEST_CASE("TrainedModel save/load round trip", "[model][persistence]")
{
    RiskClassifier classifier(FeatureSchema::injuryRisk(), { .treeCount = 20 });
    const CohortSplit data = smallCohort();
    REQUIRE(classifier.train(data.training).has_value());

    const auto path = scratchPath("injsense_roundtrip.bin");
    REQUIRE(classifier.save(path).has_value());

    RiskClassifier restored;
    REQUIRE(restored.load(path).has_value());
    REQUIRE(restored.state() == ClassifierState::kTrained);

    const auto before = classifier.model()->probabilities(data.holdout.features);
    const auto after = restored.model()->probabilities(data.holdout.features);
    REQUIRE(before == after);

    const auto features = vectorOf({20, 40, 70, 24, 2, 0.5, 24, 4});
    REQUIRE(classifier.predict(features).value() == restored.predict(features).value());

    std::filesystem::remove(path);
}

TEST_CASE("TrainedModel artifact errors", "[model][persistence]")
{
    RiskClassifier classifier(FeatureSchema::injuryRisk(), { .treeCount = 5 });
    REQUIRE(classifier.train(smallCohort().training).has_value());

    auto bytes = classifier.model()->toBytes();
    REQUIRE(bytes.has_value());
    const FeatureSchema &schema = FeatureSchema::injuryRisk();

    SECTION("missing file")
    {
        auto r = TrainedModel::load(scratchPath("injsense_does_not_exist.bin"), schema);
        REQUIRE(r.error().code() == core::ErrorCode::kModelNotFound);

        RiskClassifier fresh;
        REQUIRE(fresh.load(scratchPath("injsense_does_not_exist.bin")).error().code()
                == core::ErrorCode::kModelNotFound);
        REQUIRE(fresh.state() == ClassifierState::kUntrained);
    }

    SECTION("intact bytes")
    {
        REQUIRE(TrainedModel::fromBytes(*bytes, schema).has_value());
    }

    SECTION("flipped payload byte")
    {
        (*bytes)[bytes->size() / 2] ^= core::byte{0x5A};
        REQUIRE(TrainedModel::fromBytes(*bytes, schema).error().code() == core::ErrorCode::kCorruptedData);
    }

    SECTION("bad magic")
    {
        (*bytes)[0] = core::byte{0x00};
        REQUIRE(TrainedModel::fromBytes(*bytes, schema).error().code() == core::ErrorCode::kCorruptedData);
    }

    SECTION("other format version")
    {
        (*bytes)[4] = core::byte{0x02};
        REQUIRE(TrainedModel::fromBytes(*bytes, schema).error().code() == core::ErrorCode::kVersionMismatch);
    }

    SECTION("truncated")
    {
        bytes->resize(bytes->size() - 20);
        REQUIRE(TrainedModel::fromBytes(*bytes, schema).error().code() == core::ErrorCode::kCorruptedData);
        bytes->resize(6);
        REQUIRE(TrainedModel::fromBytes(*bytes, schema).error().code() == core::ErrorCode::kCorruptedData);
    }

    SECTION("schema change")
    {
        const FeatureSchema shorter({"semg_imbalance", "muscle_fatigue"});
        REQUIRE(TrainedModel::fromBytes(*bytes, shorter).error().code() == core::ErrorCode::kSchemaMismatch);
    }
}

TEST_CASE("Overloaded, under-recovered athletes are not low risk", "[model][endtoend]")
{
    SyntheticCohort cohort;
    auto data = cohort.generateSplit();
    REQUIRE(data.has_value());

    RiskClassifier classifier;
    REQUIRE(classifier.train(data->training).has_value());

    auto report = classifier.evaluate(data->holdout);
    REQUIRE(report.has_value());
    REQUIRE(report->sampleCount == 200);
    REQUIRE(report->accuracy > 0.7);

    // All zeros except previous_injuries = 5, training_load = 100, recovery_time = 0.
    const auto features = vectorOf({0, 0, 100, 0, 5, 0, 0, 0});
    auto assessment = classifier.predict(features);
    REQUIRE(assessment.has_value());
    REQUIRE(assessment->riskLabel != RiskLabel::kLow);
}
