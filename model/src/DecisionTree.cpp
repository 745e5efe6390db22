/**
 * @file DecisionTree.cpp
 * @brief CART tree growth and inference.
 */

#include "injsense/model/DecisionTree.hpp"

#include "injsense/core/Assert.hpp"

#include <algorithm>
#include <format>
#include <numeric>
#include <utility>

namespace injsense::model {

namespace {

core::f64 gini(core::usize positives, core::usize count) noexcept
{
    if (count == 0)
        return 0.0;
    const core::f64 p = static_cast<core::f64>(positives) / static_cast<core::f64>(count);
    return 1.0 - p * p - (1.0 - p) * (1.0 - p);
}

} // namespace

core::Expected<DecisionTree> DecisionTree::fromNodes(std::vector<TreeNode> nodes, core::usize featureCount)
{
    if (nodes.empty())
        return core::makeError(core::ErrorCode::kCorruptedData, "tree has no node");

    const auto count = static_cast<core::i32>(nodes.size());
    for (core::i32 i = 0; i < count; ++i) {
        const TreeNode &node = nodes[static_cast<core::usize>(i)];

        if (!(node.probability >= 0.0 && node.probability <= 1.0))
            return core::makeError(core::ErrorCode::kCorruptedData, std::format("node {} has probability out of range", i));
        if (node.isLeaf())
            continue;

        if (static_cast<core::usize>(node.feature) >= featureCount)
            return core::makeError(core::ErrorCode::kCorruptedData, std::format("node {} splits on feature {}", i, node.feature));
        if (node.left <= i || node.left >= count || node.right <= i || node.right >= count)
            return core::makeError(core::ErrorCode::kCorruptedData, std::format("node {} has invalid children", i));
    }

    DecisionTree tree;
    tree._nodes = std::move(nodes);
    return tree;
}

void DecisionTree::fit(const Eigen::MatrixXd &x,
                       std::span<const core::u8> labels,
                       std::vector<core::usize> samples,
                       const TreeConfig &config,
                       std::mt19937_64 &rng)
{
    INJSENSE_ASSERT(!samples.empty());
    INJSENSE_ASSERT(static_cast<core::usize>(x.rows()) == labels.size());

    _x = &x;
    _labels = labels;
    _samples = std::move(samples);
    _config = config;
    _rng = &rng;
    _rootCount = _samples.size();

    _nodes.clear();
    _impurityDecrease.assign(static_cast<core::usize>(x.cols()), 0.0);

    grow(0, _samples.size(), 0);

    _x = nullptr;
    _labels = {};
    _samples.clear();
    _samples.shrink_to_fit();
    _rng = nullptr;
}

core::i32 DecisionTree::grow(core::usize first, core::usize last, core::u32 depth)
{
    const core::usize count = last - first;
    core::usize positives = 0;
    for (core::usize i = first; i < last; ++i)
        positives += _labels[_samples[i]];

    const auto index = static_cast<core::i32>(_nodes.size());
    _nodes.push_back({ .feature = -1,
                       .threshold = 0.0,
                       .left = -1,
                       .right = -1,
                       .probability = static_cast<core::f64>(positives) / static_cast<core::f64>(count) });

    const core::f64 impurity = gini(positives, count);
    if (depth >= _config.maxDepth || count < _config.minSamplesSplit ||
        count < 2 * _config.minSamplesLeaf || impurity <= 0.0)
        return index;

    const Split split = bestSplit(first, last, impurity);
    if (split.feature < 0)
        return index;

    const auto column = static_cast<Eigen::Index>(split.feature);
    const auto middle = std::partition(
        _samples.begin() + static_cast<core::isize>(first),
        _samples.begin() + static_cast<core::isize>(last),
        [&](core::usize row) { return (*_x)(static_cast<Eigen::Index>(row), column) <= split.threshold; });
    const auto mid = static_cast<core::usize>(middle - _samples.begin());

    _impurityDecrease[static_cast<core::usize>(split.feature)] += split.decrease / static_cast<core::f64>(_rootCount);

    const core::i32 left = grow(first, mid, depth + 1);
    const core::i32 right = grow(mid, last, depth + 1);

    TreeNode &node = _nodes[static_cast<core::usize>(index)];
    node.feature = split.feature;
    node.threshold = split.threshold;
    node.left = left;
    node.right = right;
    return index;
}

DecisionTree::Split DecisionTree::bestSplit(core::usize first, core::usize last, core::f64 impurity)
{
    const auto featureCount = static_cast<core::usize>(_x->cols());
    const core::usize budget = (_config.maxFeatures == 0) ? featureCount : std::min(_config.maxFeatures, featureCount);

    std::vector<core::usize> order(featureCount);
    std::iota(order.begin(), order.end(), core::usize{0});

    const core::usize count = last - first;
    const auto n = static_cast<core::f64>(count);
    std::vector<std::pair<core::f64, core::u8>> column(count);

    Split best;
    core::usize examined = 0;

    // Partial Fisher-Yates: draw features until `budget` non-constant ones
    // have been examined or all features are exhausted.
    for (core::usize k = 0; k < featureCount && examined < budget; ++k) {
        std::uniform_int_distribution<core::usize> pick(k, featureCount - 1);
        std::swap(order[k], order[pick(*_rng)]);
        const auto feature = static_cast<Eigen::Index>(order[k]);

        for (core::usize i = 0; i < count; ++i) {
            const core::usize row = _samples[first + i];
            column[i] = { (*_x)(static_cast<Eigen::Index>(row), feature), _labels[row] };
        }
        std::sort(column.begin(), column.end());

        if (column.front().first == column.back().first)
            continue;
        ++examined;

        core::usize totalPositives = 0;
        for (const auto &[value, label] : column)
            totalPositives += label;

        core::usize leftPositives = 0;
        for (core::usize i = 0; i + 1 < count; ++i) {
            leftPositives += column[i].second;
            if (column[i].first == column[i + 1].first)
                continue;

            const core::usize leftCount = i + 1;
            const core::usize rightCount = count - leftCount;
            if (leftCount < _config.minSamplesLeaf || rightCount < _config.minSamplesLeaf)
                continue;

            const core::f64 decrease = n * impurity
                - static_cast<core::f64>(leftCount) * gini(leftPositives, leftCount)
                - static_cast<core::f64>(rightCount) * gini(totalPositives - leftPositives, rightCount);

            if (decrease > best.decrease) {
                core::f64 threshold = 0.5 * (column[i].first + column[i + 1].first);
                if (threshold == column[i + 1].first)
                    threshold = column[i].first;

                best = { .feature = static_cast<core::i32>(feature), .threshold = threshold, .decrease = decrease };
            }
        }
    }

    return best;
}

core::f64 DecisionTree::predictProbability(std::span<const core::f64> row) const noexcept
{
    if (_nodes.empty())
        return 0.0;

    core::usize i = 0;
    while (!_nodes[i].isLeaf()) {
        const TreeNode &node = _nodes[i];
        i = static_cast<core::usize>(row[static_cast<core::usize>(node.feature)] <= node.threshold ? node.left : node.right);
    }
    return _nodes[i].probability;
}

core::u32 DecisionTree::depth() const noexcept
{
    if (_nodes.empty())
        return 0;

    std::vector<core::u32> level(_nodes.size(), 0);
    core::u32 deepest = 0;
    for (core::usize i = 0; i < _nodes.size(); ++i) {
        const TreeNode &node = _nodes[i];
        deepest = std::max(deepest, level[i]);
        if (!node.isLeaf()) {
            level[static_cast<core::usize>(node.left)] = level[i] + 1;
            level[static_cast<core::usize>(node.right)] = level[i] + 1;
        }
    }
    return deepest;
}

} // namespace injsense::model
