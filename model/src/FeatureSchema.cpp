/**
 * @file FeatureSchema.cpp
 * @brief FeatureSchema implementation.
 */

#include "injsense/model/FeatureSchema.hpp"

#include <algorithm>

namespace injsense::model {

FeatureSchema::FeatureSchema(std::vector<std::string> names)
    : _names(std::move(names))
{
}

const FeatureSchema &FeatureSchema::injuryRisk()
{
    static const FeatureSchema schema({
        "semg_imbalance",
        "muscle_fatigue",
        "training_load",
        "recovery_time",
        "previous_injuries",
        "temperature_variation",
        "age",
        "consecutive_games",
    });
    return schema;
}

std::optional<core::usize> FeatureSchema::indexOf(std::string_view name) const
{
    const auto it = std::find(_names.begin(), _names.end(), name);
    if (it == _names.end())
        return std::nullopt;
    return static_cast<core::usize>(it - _names.begin());
}

} // namespace injsense::model
