/**
 * @file RiskFeatureVector.cpp
 * @brief RiskFeatureVector implementation.
 */

#include "injsense/model/RiskFeatureVector.hpp"

#include <cmath>
#include <format>

namespace injsense::model {

RiskFeatureVector::RiskFeatureVector(FeatureSchema schema, std::vector<core::f64> values)
    : _schema(std::move(schema)), _values(std::move(values))
{
}

core::Expected<RiskFeatureVector> RiskFeatureVector::create(
    FeatureSchema schema,
    std::vector<core::f64> values)
{
    if (values.size() != schema.size()) {
        return core::makeError(core::ErrorCode::kSchemaMismatch,
            std::format("expected {} feature values, got {}", schema.size(), values.size()));
    }
    for (core::usize i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            return core::makeError(core::ErrorCode::kNonFiniteSample,
                std::format("feature '{}' is not finite", schema.name(i)));
        }
    }
    return RiskFeatureVector(std::move(schema), std::move(values));
}

core::Expected<core::f64> RiskFeatureVector::value(std::string_view name) const
{
    const auto index = _schema.indexOf(name);
    if (!index)
        return core::makeError(core::ErrorCode::kInvalidArgument, std::format("unknown feature '{}'", name));
    return _values[*index];
}

core::ExpectedVoid RiskFeatureVector::set(std::string_view name, core::f64 value)
{
    const auto index = _schema.indexOf(name);
    if (!index)
        return core::makeError(core::ErrorCode::kInvalidArgument, std::format("unknown feature '{}'", name));
    if (!std::isfinite(value))
        return core::makeError(core::ErrorCode::kNonFiniteSample, std::format("feature '{}' is not finite", name));

    _values[*index] = value;
    return {};
}

} // namespace injsense::model
