/**
 * @file SignalFeatureVector.hpp
 * @brief Named, ordered vector of low-level signal features.
 *
 * Produced by WindowFeatureExtractor for exploratory feature engineering.
 * It lives in a different vector space from model::RiskFeatureVector and
 * is never handed to the classifier.
 */

#pragma once

#include "injsense/core/Types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace injsense::features {

class SignalFeatureVector {
public:
    /// @brief Appends a feature at the end of the vector.
    void append(std::string name, core::f64 value);

    [[nodiscard]] core::usize size() const noexcept { return _values.size(); }
    [[nodiscard]] bool empty() const noexcept { return _values.empty(); }

    [[nodiscard]] const std::vector<std::string> &names() const noexcept { return _names; }
    [[nodiscard]] const std::vector<core::f64> &values() const noexcept { return _values; }

    /**
     * @brief Looks a feature up by name.
     * @return The value, or std::nullopt if no feature has that name.
     */
    [[nodiscard]] std::optional<core::f64> value(std::string_view name) const;

    [[nodiscard]] bool operator==(const SignalFeatureVector &) const = default;

private:
    std::vector<std::string> _names;
    std::vector<core::f64> _values;
};

} // namespace injsense::features
