/**
 * @file ImputationTable.hpp
 * @brief Deterministic defaults for features missing from an AthleteRecord.
 *
 * Resolution order for each schema feature:
 *   1. the value supplied in AthleteRecord::features;
 *   2. for "age", AthleteRecord::age;
 *   3. for "previous_injuries", the length of AthleteRecord::injuryHistory;
 *   4. the table default.
 */

#pragma once

#include "injsense/model/AthleteRecord.hpp"
#include "injsense/model/RiskFeatureVector.hpp"

#include "injsense/core/Expected.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace injsense::model {

class ImputationTable {
public:
    ImputationTable() = default;

    /**
     * @brief Table covering FeatureSchema::injuryRisk():
     *        semg_imbalance 17.5, muscle_fatigue 50, training_load 60,
     *        recovery_time 30, previous_injuries 0, temperature_variation 0.8,
     *        age 26, consecutive_games 5.
     */
    [[nodiscard]] static ImputationTable defaults();

    ImputationTable &set(std::string name, core::f64 value);

    [[nodiscard]] std::optional<core::f64> defaultFor(std::string_view name) const;

    /**
     * @brief Builds a complete vector for @p schema from a partial record.
     *
     * @param imputed Receives the names of the features that were not
     *                supplied by the record, when non-null.
     * @return kSchemaMismatch when a feature has neither a record value
     *         nor a default, kNonFiniteSample for a NaN/Inf record value.
     */
    [[nodiscard]] core::Expected<RiskFeatureVector> assemble(
        const FeatureSchema &schema,
        const AthleteRecord &record,
        std::vector<std::string> *imputed = nullptr) const;

    [[nodiscard]] const std::map<std::string, core::f64, std::less<>> &entries() const noexcept { return _defaults; }

private:
    std::map<std::string, core::f64, std::less<>> _defaults;
};

} // namespace injsense::model
