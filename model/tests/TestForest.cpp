/**
 * @file TestForest.cpp
 * @brief Unit tests for schema, imputation, scaler, tree and forest.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "injsense/model/ClassificationReport.hpp"
#include "injsense/model/DecisionTree.hpp"
#include "injsense/model/ImputationTable.hpp"
#include "injsense/model/RandomForest.hpp"
#include "injsense/model/StandardScaler.hpp"
#include "injsense/model/TrainingSet.hpp"

#include "injsense/serial/ByteStream.hpp"

#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <vector>

using namespace injsense;
using namespace injsense::model;
using Catch::Matchers::WithinAbs;

namespace {

/// Label depends only on feature 0; feature 1 is unrelated.
void makeSeparable(Eigen::MatrixXd &x, std::vector<core::u8> &labels, std::size_t n = 200)
{
    x.resize(static_cast<Eigen::Index>(n), 2);
    labels.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double a = static_cast<double>(i) / static_cast<double>(n);
        const double b = static_cast<double>((i * 37) % n) / static_cast<double>(n);
        x(static_cast<Eigen::Index>(i), 0) = a;
        x(static_cast<Eigen::Index>(i), 1) = b;
        labels[i] = a > 0.5 ? 1 : 0;
    }
}

} // namespace

TEST_CASE("FeatureSchema canonical order", "[model][schema]")
{
    const FeatureSchema &schema = FeatureSchema::injuryRisk();
    REQUIRE(schema.size() == 8);
    REQUIRE(schema.name(0) == "semg_imbalance");
    REQUIRE(schema.name(7) == "consecutive_games");
    REQUIRE(schema.indexOf("previous_injuries") == 4u);
    REQUIRE_FALSE(schema.indexOf("heart_rate").has_value());
}

TEST_CASE("RiskFeatureVector enforces its schema", "[model][vector]")
{
    const FeatureSchema &schema = FeatureSchema::injuryRisk();

    SECTION("wrong length")
    {
        auto v = RiskFeatureVector::create(schema, {1.0, 2.0});
        REQUIRE_FALSE(v.has_value());
        REQUIRE(v.error().code() == core::ErrorCode::kSchemaMismatch);
    }

    SECTION("non-finite value")
    {
        std::vector<double> values(8, 0.0);
        values[3] = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(RiskFeatureVector::create(schema, values).error().code() == core::ErrorCode::kNonFiniteSample);
    }

    SECTION("lookup and update by name")
    {
        auto v = RiskFeatureVector::create(schema, {1, 2, 3, 4, 5, 6, 7, 8});
        REQUIRE(v.has_value());
        REQUIRE(v->value("recovery_time").value() == 4.0);
        REQUIRE(v->set("recovery_time", 12.0).has_value());
        REQUIRE(v->values()[3] == 12.0);
        REQUIRE(v->value("unknown").error().code() == core::ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("ImputationTable fills gaps deterministically", "[model][imputation]")
{
    const FeatureSchema &schema = FeatureSchema::injuryRisk();
    const ImputationTable table = ImputationTable::defaults();

    AthleteRecord record;
    record.athleteId = "A-17";
    record.features = { {"training_load", 85.0}, {"muscle_fatigue", 12.0} };
    record.age = 31.0;
    record.injuryHistory = {"hamstring", "ankle", "knee"};

    std::vector<std::string> imputed;
    auto v = table.assemble(schema, record, &imputed);
    REQUIRE(v.has_value());

    SECTION("record values win")
    {
        REQUIRE(v->value("training_load").value() == 85.0);
        REQUIRE(v->value("muscle_fatigue").value() == 12.0);
    }

    SECTION("metadata and table defaults")
    {
        REQUIRE(v->value("age").value() == 31.0);
        REQUIRE(v->value("previous_injuries").value() == 3.0);
        REQUIRE(v->value("semg_imbalance").value() == 17.5);
        REQUIRE(v->value("recovery_time").value() == 30.0);
        REQUIRE(v->value("temperature_variation").value() == 0.8);
        REQUIRE(v->value("consecutive_games").value() == 5.0);
        REQUIRE(imputed.size() == 6);
    }

    SECTION("repeated assembly is identical")
    {
        auto again = table.assemble(schema, record);
        REQUIRE(std::equal(v->values().begin(), v->values().end(), again->values().begin()));
    }

    SECTION("age falls back to the table without a record age")
    {
        AthleteRecord anonymous;
        REQUIRE(table.assemble(schema, anonymous)->value("age").value() == 26.0);
        REQUIRE(table.assemble(schema, anonymous)->value("previous_injuries").value() == 0.0);
    }

    SECTION("a feature without value or default")
    {
        const FeatureSchema extended({"semg_imbalance", "sleep_hours"});
        REQUIRE(table.assemble(extended, record).error().code() == core::ErrorCode::kSchemaMismatch);
    }
}

TEST_CASE("TrainingSet validation", "[model][trainingset]")
{
    const FeatureSchema schema({"a", "b"});

    REQUIRE(TrainingSet::fromRows(schema, {}, {}).error().code() == core::ErrorCode::kInsufficientSamples);
    REQUIRE(TrainingSet::fromRows(schema, {{1.0, 2.0, 3.0}}, {0}).error().code() == core::ErrorCode::kSchemaMismatch);
    REQUIRE(TrainingSet::fromRows(schema, {{1.0, 2.0}}, {0, 1}).error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(TrainingSet::fromRows(schema, {{1.0, 2.0}}, {2}).error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(TrainingSet::fromRows(schema, {{1.0, 2.0}, {std::numeric_limits<double>::quiet_NaN(), 4.0}}, {0, 1})
                .error().code() == core::ErrorCode::kNonFiniteSample);
    REQUIRE(TrainingSet::fromRows(schema, {{1.0, std::numeric_limits<double>::infinity()}}, {0})
                .error().code() == core::ErrorCode::kNonFiniteSample);

    auto set = TrainingSet::fromRows(schema, {{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}}, {0, 1, 1});
    REQUIRE(set.has_value());
    const TrainingSet subset = set->select({2, 0});
    REQUIRE(subset.size() == 2);
    REQUIRE(subset.features(0, 1) == 6.0);
    REQUIRE(subset.labels[1] == 0);
}

TEST_CASE("StandardScaler uses population statistics", "[model][scaler]")
{
    Eigen::MatrixXd x(4, 2);
    x << 1.0, 10.0,
         3.0, 10.0,
         5.0, 10.0,
         7.0, 10.0;

    StandardScaler scaler;
    REQUIRE_FALSE(scaler.fitted());
    REQUIRE(scaler.fit(x).has_value());

    REQUIRE_THAT(scaler.mean()[0], WithinAbs(4.0, 1e-12));
    REQUIRE_THAT(scaler.scale()[0], WithinAbs(std::sqrt(5.0), 1e-12));
    // Constant column keeps unit scale.
    REQUIRE(scaler.scale()[1] == 1.0);

    const std::vector<double> row = {4.0 + std::sqrt(5.0), 12.0};
    const auto scaled = scaler.transform(row);
    REQUIRE_THAT(scaled[0], WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(scaled[1], WithinAbs(2.0, 1e-12));

    const Eigen::MatrixXd all = scaler.transform(x);
    REQUIRE_THAT(all.col(0).mean(), WithinAbs(0.0, 1e-12));

    REQUIRE(StandardScaler{}.fit(Eigen::MatrixXd(0, 2)).error().code() == core::ErrorCode::kInsufficientSamples);
}

TEST_CASE("DecisionTree separates a threshold concept", "[model][tree]")
{
    Eigen::MatrixXd x(4, 1);
    x << 0.0, 1.0, 2.0, 3.0;
    const std::vector<core::u8> labels = {0, 0, 1, 1};

    std::mt19937_64 rng(7);
    DecisionTree tree;
    tree.fit(x, labels, {0, 1, 2, 3}, TreeConfig{}, rng);

    REQUIRE(tree.nodes().size() == 3);
    REQUIRE(tree.nodes()[0].feature == 0);
    REQUIRE_THAT(tree.nodes()[0].threshold, WithinAbs(1.5, 1e-12));
    REQUIRE(tree.depth() == 1);

    const std::vector<double> low = {0.5};
    const std::vector<double> high = {2.5};
    REQUIRE(tree.predictProbability(low) == 0.0);
    REQUIRE(tree.predictProbability(high) == 1.0);

    REQUIRE_THAT(tree.impurityDecrease()[0], WithinAbs(0.5, 1e-12));
}

TEST_CASE("DecisionTree honours max depth", "[model][tree]")
{
    Eigen::MatrixXd x;
    std::vector<core::u8> labels;
    makeSeparable(x, labels);
    for (std::size_t i = 0; i < labels.size(); i += 3)
        labels[i] = 1 - labels[i];

    std::vector<std::size_t> rows(labels.size());
    std::iota(rows.begin(), rows.end(), std::size_t{0});

    std::mt19937_64 rng(1);
    DecisionTree tree;
    tree.fit(x, labels, rows, { .maxDepth = 3, .maxFeatures = 0, .minSamplesSplit = 2, .minSamplesLeaf = 1 }, rng);
    REQUIRE(tree.depth() <= 3);
}

TEST_CASE("DecisionTree::fromNodes rejects broken structure", "[model][tree]")
{
    std::vector<TreeNode> cyclic = {
        { .feature = 0, .threshold = 0.0, .left = 0, .right = 1, .probability = 0.5 },
        { .feature = -1, .threshold = 0.0, .left = -1, .right = -1, .probability = 1.0 },
    };
    REQUIRE(DecisionTree::fromNodes(cyclic, 1).error().code() == core::ErrorCode::kCorruptedData);

    std::vector<TreeNode> badFeature = {
        { .feature = 3, .threshold = 0.0, .left = 1, .right = 2, .probability = 0.5 },
        { .feature = -1, .threshold = 0.0, .left = -1, .right = -1, .probability = 0.0 },
        { .feature = -1, .threshold = 0.0, .left = -1, .right = -1, .probability = 1.0 },
    };
    REQUIRE(DecisionTree::fromNodes(badFeature, 2).error().code() == core::ErrorCode::kCorruptedData);
    REQUIRE(DecisionTree::fromNodes(badFeature, 4).has_value());
}

TEST_CASE("RandomForest is deterministic for a seed", "[model][forest]")
{
    Eigen::MatrixXd x;
    std::vector<core::u8> labels;
    makeSeparable(x, labels);

    const ForestConfig config{ .treeCount = 25, .maxDepth = 6 };
    RandomForest a(config);
    RandomForest b(config);
    REQUIRE(a.fit(x, labels).has_value());
    REQUIRE(b.fit(x, labels).has_value());

    REQUIRE(a.featureImportances() == b.featureImportances());
    for (double v = 0.0; v <= 1.0; v += 0.05) {
        const std::vector<double> row = {v, 1.0 - v};
        REQUIRE(a.predictProbability(row) == b.predictProbability(row));
    }
}

TEST_CASE("RandomForest learns the informative feature", "[model][forest]")
{
    Eigen::MatrixXd x;
    std::vector<core::u8> labels;
    makeSeparable(x, labels);

    RandomForest forest({ .treeCount = 50 });
    REQUIRE(forest.fit(x, labels).has_value());
    REQUIRE(forest.trees().size() == 50);

    const auto &importances = forest.featureImportances();
    REQUIRE_THAT(importances[0] + importances[1], WithinAbs(1.0, 1e-9));
    REQUIRE(importances[0] > importances[1]);

    const std::vector<double> negative = {0.1, 0.5};
    const std::vector<double> positive = {0.9, 0.5};
    REQUIRE(forest.predictProbability(negative) < 0.5);
    REQUIRE(forest.predictProbability(positive) > 0.5);
}

TEST_CASE("RandomForest accepts a single-class set", "[model][forest]")
{
    Eigen::MatrixXd x(10, 2);
    x.setRandom();
    const std::vector<core::u8> labels(10, 0);

    RandomForest forest({ .treeCount = 5 });
    REQUIRE(forest.fit(x, labels).has_value());

    const std::vector<double> row = {0.0, 0.0};
    REQUIRE(forest.predictProbability(row) == 0.0);
    for (const double v : forest.featureImportances())
        REQUIRE(v == 0.0);
}

TEST_CASE("RandomForest rejects unusable input", "[model][forest]")
{
    RandomForest forest;
    const std::vector<core::u8> none;
    REQUIRE(forest.fit(Eigen::MatrixXd(0, 3), none).error().code() == core::ErrorCode::kInsufficientSamples);

    Eigen::MatrixXd x(2, 1);
    x << 0.0, 1.0;
    const std::vector<core::u8> one = {1};
    REQUIRE(forest.fit(x, one).error().code() == core::ErrorCode::kInvalidArgument);

    RandomForest empty({ .treeCount = 0 });
    const std::vector<core::u8> two = {0, 1};
    REQUIRE(empty.fit(x, two).error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("RandomForest::deserialize bounds the tree count", "[model][forest]")
{
    serial::ByteStream writer;
    writer.writeU32(0xFFFFFFFFu); // declared trees
    writer.writeU32(10);          // max depth
    writer.writeU64(0);           // max features
    writer.writeU64(2);           // min samples split
    writer.writeU64(1);           // min samples leaf
    writer.writeU8(1);            // bootstrap
    writer.writeU64(42);          // seed
    writer.writeU32(2);           // features
    writer.writeU32(0xFFFFFFFFu); // stored trees
    writer.writeU32(1);           // a single node follows
    writer.writeU32(static_cast<core::u32>(-1));
    writer.writeF64(0.0);
    writer.writeU32(static_cast<core::u32>(-1));
    writer.writeU32(static_cast<core::u32>(-1));
    writer.writeF64(0.5);

    serial::ByteStream reader(writer.data());
    RandomForest forest;
    auto result = forest.deserialize(reader);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kCorruptedData);
    REQUIRE_FALSE(forest.fitted());
}

TEST_CASE("ClassificationReport metrics", "[model][report]")
{
    const std::vector<core::u8> truth     = {1, 1, 0, 0};
    const std::vector<core::u8> predicted = {1, 0, 0, 0};

    auto report = ClassificationReport::compute(truth, predicted);
    REQUIRE(report.has_value());
    REQUIRE_THAT(report->accuracy, WithinAbs(0.75, 1e-12));

    const ClassMetrics &positive = report->classes[1];
    REQUIRE_THAT(positive.precision, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(positive.recall, WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(positive.f1, WithinAbs(2.0 / 3.0, 1e-12));
    REQUIRE(positive.support == 2);

    const ClassMetrics &negative = report->classes[0];
    REQUIRE_THAT(negative.precision, WithinAbs(2.0 / 3.0, 1e-12));
    REQUIRE_THAT(negative.recall, WithinAbs(1.0, 1e-12));

    REQUIRE_FALSE(report->format().empty());

    const std::vector<core::u8> shorter = {1};
    REQUIRE(ClassificationReport::compute(truth, shorter).error().code() == core::ErrorCode::kInvalidArgument);
}
