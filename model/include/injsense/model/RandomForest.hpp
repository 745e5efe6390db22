/**
 * @file RandomForest.hpp
 * @brief Bagged ensemble of CART trees for binary classification.
 *
 * Each tree is grown on a bootstrap sample and examines a random subset of
 * features at every split. The class-1 probability is the mean of the
 * leaf probabilities of all trees. Training is deterministic for a given
 * ForestConfig::seed on a given standard library implementation.
 */

#pragma once

#include "injsense/model/DecisionTree.hpp"

#include "injsense/serial/ISerializable.hpp"

#include "injsense/core/Constants.hpp"
#include "injsense/core/Expected.hpp"

#include <Eigen/Dense>

#include <span>
#include <vector>

namespace injsense::model {

struct ForestConfig {
    core::u32 treeCount = core::kForestTreeCount;
    core::u32 maxDepth  = core::kForestMaxDepth;
    /// Features examined per split; 0 selects max(1, floor(sqrt(featureCount))).
    core::usize maxFeatures     = 0;
    core::usize minSamplesSplit = 2;
    core::usize minSamplesLeaf  = 1;
    bool bootstrap              = true;
    core::u64 seed              = core::kDefaultSeed;
};

class RandomForest final : public serial::ISerializable {
public:
    explicit RandomForest(const ForestConfig &config = {});

    /**
     * @brief Grows config().treeCount trees on @p x.
     *
     * @return kInsufficientSamples for an empty matrix, kInvalidArgument
     *         when labels and rows disagree or the config is unusable.
     */
    [[nodiscard]] core::ExpectedVoid fit(const Eigen::MatrixXd &x, std::span<const core::u8> labels);

    /// @brief Mean class-1 probability over all trees.
    [[nodiscard]] core::f64 predictProbability(std::span<const core::f64> row) const noexcept;

    /**
     * @brief Mean-decrease-in-impurity importance per feature, summing to 1
     *        (all zeros when no tree ever split).
     */
    [[nodiscard]] const std::vector<core::f64> &featureImportances() const noexcept { return _importances; }

    [[nodiscard]] bool fitted() const noexcept { return !_trees.empty(); }
    [[nodiscard]] core::usize featureCount() const noexcept { return _featureCount; }
    [[nodiscard]] const ForestConfig &config() const noexcept { return _config; }
    [[nodiscard]] const std::vector<DecisionTree> &trees() const noexcept { return _trees; }

    [[nodiscard]] core::ExpectedVoid serialize(serial::ByteStream &stream) const override;
    [[nodiscard]] core::ExpectedVoid deserialize(serial::ByteStream &stream) override;

private:
    void computeImportances();

    ForestConfig _config;
    core::usize _featureCount = 0;
    std::vector<DecisionTree> _trees;
    std::vector<core::f64> _importances;
};

} // namespace injsense::model
