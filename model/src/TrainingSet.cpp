/**
 * @file TrainingSet.cpp
 * @brief TrainingSet implementation.
 */

#include "injsense/model/TrainingSet.hpp"

#include "injsense/math/Statistics.hpp"

#include <format>

namespace injsense::model {

core::Expected<TrainingSet> TrainingSet::fromRows(
    FeatureSchema schema,
    const std::vector<std::vector<core::f64>> &rows,
    std::vector<core::u8> labels)
{
    if (rows.empty())
        return core::makeError(core::ErrorCode::kInsufficientSamples, "training set is empty");
    if (rows.size() != labels.size()) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("{} rows but {} labels", rows.size(), labels.size()));
    }

    const auto cols = static_cast<Eigen::Index>(schema.size());
    Eigen::MatrixXd features(static_cast<Eigen::Index>(rows.size()), cols);

    for (core::usize r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != schema.size()) {
            return core::makeError(core::ErrorCode::kSchemaMismatch,
                std::format("row {} has {} values, schema has {}", r, rows[r].size(), schema.size()));
        }
        if (!math::Statistics::allFinite(rows[r]))
            return core::makeError(core::ErrorCode::kNonFiniteSample, std::format("row {} has a non-finite value", r));
        if (labels[r] > 1)
            return core::makeError(core::ErrorCode::kInvalidArgument, std::format("row {} has label {}", r, labels[r]));

        features.row(static_cast<Eigen::Index>(r)) =
            Eigen::Map<const Eigen::RowVectorXd>(rows[r].data(), cols);
    }

    return TrainingSet{ .schema = std::move(schema), .features = std::move(features), .labels = std::move(labels) };
}

TrainingSet TrainingSet::select(const std::vector<core::usize> &rows) const
{
    TrainingSet subset{ .schema = schema, .features = Eigen::MatrixXd(static_cast<Eigen::Index>(rows.size()), features.cols()), .labels = {} };
    subset.labels.reserve(rows.size());

    for (core::usize i = 0; i < rows.size(); ++i) {
        subset.features.row(static_cast<Eigen::Index>(i)) = features.row(static_cast<Eigen::Index>(rows[i]));
        subset.labels.push_back(labels[rows[i]]);
    }
    return subset;
}

} // namespace injsense::model
