/**
 * @file FeatureSchema.hpp
 * @brief Ordered feature names a risk model is trained on.
 *
 * The classifier is positional: a RiskFeatureVector is only meaningful
 * against the schema it was built for, and a TrainedModel refuses vectors
 * built for any other schema.
 */

#pragma once

#include "injsense/core/Types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace injsense::model {

class FeatureSchema {
public:
    FeatureSchema() = default;
    explicit FeatureSchema(std::vector<std::string> names);

    /**
     * @brief Canonical injury-risk schema:
     *        semg_imbalance, muscle_fatigue, training_load, recovery_time,
     *        previous_injuries, temperature_variation, age, consecutive_games.
     */
    [[nodiscard]] static const FeatureSchema &injuryRisk();

    [[nodiscard]] core::usize size() const noexcept { return _names.size(); }
    [[nodiscard]] bool empty() const noexcept { return _names.empty(); }
    [[nodiscard]] const std::vector<std::string> &names() const noexcept { return _names; }
    [[nodiscard]] const std::string &name(core::usize index) const { return _names.at(index); }

    /// @brief Position of @p name, or std::nullopt when absent.
    [[nodiscard]] std::optional<core::usize> indexOf(std::string_view name) const;

    [[nodiscard]] bool operator==(const FeatureSchema &) const = default;

private:
    std::vector<std::string> _names;
};

} // namespace injsense::model
