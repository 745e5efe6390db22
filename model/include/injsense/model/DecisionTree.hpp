/**
 * @file DecisionTree.hpp
 * @brief CART classification tree with Gini impurity, stored as flat nodes.
 *
 * Nodes are laid out in pre-order: a parent always precedes its children,
 * which is what makes the flat array safe to traverse after deserialisation.
 */

#pragma once

#include "injsense/core/Constants.hpp"
#include "injsense/core/Expected.hpp"
#include "injsense/core/Types.hpp"

#include <Eigen/Dense>

#include <random>
#include <span>
#include <vector>

namespace injsense::model {

struct TreeNode {
    core::i32 feature   = -1;
    core::f64 threshold = 0.0;
    core::i32 left      = -1;
    core::i32 right     = -1;
    /// Fraction of class-1 training samples that reached this node.
    core::f64 probability = 0.0;

    [[nodiscard]] bool isLeaf() const noexcept { return feature < 0; }
};

struct TreeConfig {
    core::u32 maxDepth = core::kForestMaxDepth;
    /// Features examined per split; 0 examines all of them.
    core::usize maxFeatures     = 0;
    core::usize minSamplesSplit = 2;
    core::usize minSamplesLeaf  = 1;
};

class DecisionTree {
public:
    DecisionTree() = default;

    /**
     * @brief Rebuilds a tree from its flat node array.
     * @return kCorruptedData when a child index, feature index or leaf
     *         probability is out of range.
     */
    [[nodiscard]] static core::Expected<DecisionTree> fromNodes(std::vector<TreeNode> nodes, core::usize featureCount);

    /**
     * @brief Grows the tree on the rows listed in @p samples.
     *
     * @param x       Design matrix (rows = samples).
     * @param labels  0/1 label per row of @p x.
     * @param samples Row indices to train on; repeats act as weights.
     * @param rng     Source of the per-split feature subsets.
     */
    void fit(const Eigen::MatrixXd &x,
             std::span<const core::u8> labels,
             std::vector<core::usize> samples,
             const TreeConfig &config,
             std::mt19937_64 &rng);

    /// @brief Class-1 probability stored in the leaf reached by @p row.
    [[nodiscard]] core::f64 predictProbability(std::span<const core::f64> row) const noexcept;

    [[nodiscard]] const std::vector<TreeNode> &nodes() const noexcept { return _nodes; }

    /**
     * @brief Weighted Gini decrease accumulated per feature during fit().
     *
     * Each split contributes (n * G - nL * GL - nR * GR) / nRoot. Empty for
     * a tree rebuilt with fromNodes().
     */
    [[nodiscard]] const std::vector<core::f64> &impurityDecrease() const noexcept { return _impurityDecrease; }

    [[nodiscard]] core::u32 depth() const noexcept;

private:
    struct Split {
        core::i32 feature   = -1;
        core::f64 threshold = 0.0;
        core::f64 decrease  = -1.0;
    };

    core::i32 grow(core::usize first, core::usize last, core::u32 depth);
    [[nodiscard]] Split bestSplit(core::usize first, core::usize last, core::f64 impurity);

    std::vector<TreeNode> _nodes;
    std::vector<core::f64> _impurityDecrease;

    // Training-only state, released once fit() returns.
    const Eigen::MatrixXd *_x = nullptr;
    std::span<const core::u8> _labels;
    std::vector<core::usize> _samples;
    TreeConfig _config;
    std::mt19937_64 *_rng = nullptr;
    core::usize _rootCount = 0;
};

} // namespace injsense::model
