/**
 * @file RandomForest.cpp
 * @brief RandomForest training, inference and serialisation.
 */

#include "injsense/model/RandomForest.hpp"

#include "injsense/serial/ByteStream.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

namespace injsense::model {

RandomForest::RandomForest(const ForestConfig &config)
    : _config(config)
{
}

core::ExpectedVoid RandomForest::fit(const Eigen::MatrixXd &x, std::span<const core::u8> labels)
{
    if (x.rows() == 0 || x.cols() == 0)
        return core::makeError(core::ErrorCode::kInsufficientSamples, "cannot fit a forest on an empty matrix");
    if (static_cast<core::usize>(x.rows()) != labels.size()) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("{} rows but {} labels", x.rows(), labels.size()));
    }
    if (_config.treeCount == 0 || _config.minSamplesSplit < 2 || _config.minSamplesLeaf == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "forest config must grow at least one splittable tree");

    const auto rows = static_cast<core::usize>(x.rows());
    _featureCount = static_cast<core::usize>(x.cols());

    const TreeConfig treeConfig{
        .maxDepth        = _config.maxDepth,
        .maxFeatures     = _config.maxFeatures != 0
                               ? _config.maxFeatures
                               : std::max<core::usize>(1, static_cast<core::usize>(std::sqrt(static_cast<core::f64>(_featureCount)))),
        .minSamplesSplit = _config.minSamplesSplit,
        .minSamplesLeaf  = _config.minSamplesLeaf,
    };

    std::mt19937_64 rng(_config.seed);
    std::uniform_int_distribution<core::usize> draw(0, rows - 1);

    _trees.assign(_config.treeCount, DecisionTree{});
    for (DecisionTree &tree : _trees) {
        std::vector<core::usize> samples(rows);
        if (_config.bootstrap) {
            for (core::usize &s : samples)
                s = draw(rng);
        } else {
            std::iota(samples.begin(), samples.end(), core::usize{0});
        }
        tree.fit(x, labels, std::move(samples), treeConfig, rng);
    }

    computeImportances();
    return {};
}

void RandomForest::computeImportances()
{
    _importances.assign(_featureCount, 0.0);

    for (const DecisionTree &tree : _trees) {
        const std::vector<core::f64> &decrease = tree.impurityDecrease();
        const core::f64 total = std::accumulate(decrease.begin(), decrease.end(), 0.0);
        if (total <= 0.0)
            continue;
        for (core::usize f = 0; f < _featureCount; ++f)
            _importances[f] += decrease[f] / total;
    }

    const core::f64 total = std::accumulate(_importances.begin(), _importances.end(), 0.0);
    if (total > 0.0) {
        for (core::f64 &v : _importances)
            v /= total;
    }
}

core::f64 RandomForest::predictProbability(std::span<const core::f64> row) const noexcept
{
    if (_trees.empty())
        return 0.0;

    core::f64 sum = 0.0;
    for (const DecisionTree &tree : _trees)
        sum += tree.predictProbability(row);
    return sum / static_cast<core::f64>(_trees.size());
}

core::ExpectedVoid RandomForest::serialize(serial::ByteStream &stream) const
{
    if (!fitted())
        return core::makeError(core::ErrorCode::kInvalidState, "forest is not fitted");

    stream.writeU32(_config.treeCount);
    stream.writeU32(_config.maxDepth);
    stream.writeU64(_config.maxFeatures);
    stream.writeU64(_config.minSamplesSplit);
    stream.writeU64(_config.minSamplesLeaf);
    stream.writeU8(_config.bootstrap ? 1 : 0);
    stream.writeU64(_config.seed);
    stream.writeU32(static_cast<core::u32>(_featureCount));

    stream.writeU32(static_cast<core::u32>(_trees.size()));
    for (const DecisionTree &tree : _trees) {
        stream.writeU32(static_cast<core::u32>(tree.nodes().size()));
        for (const TreeNode &node : tree.nodes()) {
            stream.writeU32(static_cast<core::u32>(node.feature));
            stream.writeF64(node.threshold);
            stream.writeU32(static_cast<core::u32>(node.left));
            stream.writeU32(static_cast<core::u32>(node.right));
            stream.writeF64(node.probability);
        }
    }

    stream.writeF64Array(_importances);
    return {};
}

core::ExpectedVoid RandomForest::deserialize(serial::ByteStream &stream)
{
    ForestConfig config;
    config.treeCount       = INJSENSE_TRY(stream.readU32());
    config.maxDepth        = INJSENSE_TRY(stream.readU32());
    config.maxFeatures     = INJSENSE_TRY(stream.readU64());
    config.minSamplesSplit = INJSENSE_TRY(stream.readU64());
    config.minSamplesLeaf  = INJSENSE_TRY(stream.readU64());
    config.bootstrap       = INJSENSE_TRY(stream.readU8()) != 0;
    config.seed            = INJSENSE_TRY(stream.readU64());
    const core::usize featureCount = INJSENSE_TRY(stream.readU32());

    const core::u32 treeCount = INJSENSE_TRY(stream.readU32());
    if (treeCount == 0 || treeCount != config.treeCount) {
        return core::makeError(core::ErrorCode::kCorruptedData,
            std::format("forest declares {} trees but stores {}", config.treeCount, treeCount));
    }

    // 28 bytes per node; reject counts the remaining bytes cannot hold.
    constexpr core::usize kNodeBytes = 4 + 8 + 4 + 4 + 8;
    constexpr core::usize kMinTreeBytes = 4 + kNodeBytes;

    if (static_cast<core::usize>(treeCount) > stream.bytesRemaining() / kMinTreeBytes) {
        return core::makeError(core::ErrorCode::kCorruptedData,
            std::format("{} trees cannot fit in {} bytes", treeCount, stream.bytesRemaining()));
    }

    std::vector<DecisionTree> trees;
    trees.reserve(treeCount);
    for (core::u32 t = 0; t < treeCount; ++t) {
        const core::u32 nodeCount = INJSENSE_TRY(stream.readU32());
        if (static_cast<core::usize>(nodeCount) * kNodeBytes > stream.bytesRemaining())
            return core::makeError(core::ErrorCode::kCorruptedData, std::format("tree {} is truncated", t));

        std::vector<TreeNode> nodes(nodeCount);
        for (TreeNode &node : nodes) {
            node.feature     = static_cast<core::i32>(INJSENSE_TRY(stream.readU32()));
            node.threshold   = INJSENSE_TRY(stream.readF64());
            node.left        = static_cast<core::i32>(INJSENSE_TRY(stream.readU32()));
            node.right       = static_cast<core::i32>(INJSENSE_TRY(stream.readU32()));
            node.probability = INJSENSE_TRY(stream.readF64());
        }
        trees.push_back(INJSENSE_TRY(DecisionTree::fromNodes(std::move(nodes), featureCount)));
    }

    std::vector<core::f64> importances = INJSENSE_TRY(stream.readF64Array());
    if (importances.size() != featureCount) {
        return core::makeError(core::ErrorCode::kCorruptedData,
            std::format("forest has {} features but {} importances", featureCount, importances.size()));
    }

    _config = config;
    _featureCount = featureCount;
    _trees = std::move(trees);
    _importances = std::move(importances);
    return {};
}

} // namespace injsense::model
