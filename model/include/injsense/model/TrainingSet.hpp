/**
 * @file TrainingSet.hpp
 * @brief Labelled design matrix for fitting and evaluating a risk model.
 */

#pragma once

#include "injsense/model/FeatureSchema.hpp"

#include "injsense/core/Expected.hpp"

#include <Eigen/Dense>

#include <vector>

namespace injsense::model {

/**
 * @brief Rows are samples, columns follow @ref schema; labels are 0 or 1.
 */
struct TrainingSet {
    FeatureSchema schema;
    Eigen::MatrixXd features;
    std::vector<core::u8> labels;

    /**
     * @brief Builds a set from row-major values.
     *
     * @return kInsufficientSamples for an empty set, kSchemaMismatch when
     *         a row's width differs from the schema, kNonFiniteSample for
     *         NaN or infinite values, kInvalidArgument when
     *         labels and rows disagree in count or a label is not 0/1.
     */
    [[nodiscard]] static core::Expected<TrainingSet> fromRows(
        FeatureSchema schema,
        const std::vector<std::vector<core::f64>> &rows,
        std::vector<core::u8> labels);

    [[nodiscard]] core::usize size() const noexcept { return labels.size(); }
    [[nodiscard]] bool empty() const noexcept { return labels.empty(); }

    /// @brief Subset made of the given rows, in the given order.
    [[nodiscard]] TrainingSet select(const std::vector<core::usize> &rows) const;
};

} // namespace injsense::model
