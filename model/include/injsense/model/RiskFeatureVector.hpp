/**
 * @file RiskFeatureVector.hpp
 * @brief Classifier input, positionally aligned with a FeatureSchema.
 *
 * Distinct from features::SignalFeatureVector: the two live in different
 * vector spaces and cannot be converted into one another.
 */

#pragma once

#include "injsense/model/FeatureSchema.hpp"

#include "injsense/core/Expected.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace injsense::model {

class RiskFeatureVector {
public:
    /**
     * @brief Builds a vector from values listed in schema order.
     * @return kSchemaMismatch when values.size() != schema.size(),
     *         kNonFiniteSample when a value is NaN or infinite.
     */
    [[nodiscard]] static core::Expected<RiskFeatureVector> create(
        FeatureSchema schema,
        std::vector<core::f64> values);

    [[nodiscard]] const FeatureSchema &schema() const noexcept { return _schema; }
    [[nodiscard]] std::span<const core::f64> values() const noexcept { return _values; }
    [[nodiscard]] core::usize size() const noexcept { return _values.size(); }

    /// @brief Value of the feature called @p name (kInvalidArgument if unknown).
    [[nodiscard]] core::Expected<core::f64> value(std::string_view name) const;

    /// @brief Overwrites the feature called @p name (kInvalidArgument if unknown).
    [[nodiscard]] core::ExpectedVoid set(std::string_view name, core::f64 value);

private:
    RiskFeatureVector(FeatureSchema schema, std::vector<core::f64> values);

    FeatureSchema _schema;
    std::vector<core::f64> _values;
};

} // namespace injsense::model
