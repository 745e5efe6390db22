/**
 * @file AthleteRecord.hpp
 * @brief Athlete payload supplied by the upstream data provider.
 */

#pragma once

#include "injsense/core/Types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace injsense::model {

/**
 * @brief Partial feature values plus the metadata used for imputation.
 *
 * Sensor dropout is expected, so any feature may be missing from
 * @ref features.
 */
struct AthleteRecord {
    std::string athleteId;
    std::map<std::string, core::f64, std::less<>> features;
    std::optional<core::f64> age;
    std::vector<std::string> injuryHistory;
};

} // namespace injsense::model
