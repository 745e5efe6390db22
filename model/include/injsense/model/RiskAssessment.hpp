/**
 * @file RiskAssessment.hpp
 * @brief Result of one injury-risk prediction.
 */

#pragma once

#include "injsense/core/Constants.hpp"
#include "injsense/core/Types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace injsense::model {

enum class RiskLabel : core::u8 {
    kLow,
    kMedium,
    kHigh,
};

[[nodiscard]] constexpr std::string_view riskLabelName(RiskLabel label) noexcept
{
    switch (label) {
        case RiskLabel::kLow:    return "Low";
        case RiskLabel::kMedium: return "Medium";
        case RiskLabel::kHigh:   return "High";
    }
    return "Unknown";
}

/// @brief High at or above 60, Medium at or above 30, Low otherwise.
[[nodiscard]] constexpr RiskLabel riskLabelForScore(core::i32 score) noexcept
{
    if (score >= core::kHighRiskScore)
        return RiskLabel::kHigh;
    if (score >= core::kMediumRiskScore)
        return RiskLabel::kMedium;
    return RiskLabel::kLow;
}

struct RiskFactor {
    std::string name;
    core::f64 importance = 0.0;

    [[nodiscard]] bool operator==(const RiskFactor &) const = default;
};

/**
 * @brief Immutable prediction result.
 *
 * riskFactors is ordered by descending importance and sums to at most 1.
 * confidence grows with the distance of probability from 0.5.
 */
struct RiskAssessment {
    core::i32 riskScore = 0;
    RiskLabel riskLabel = RiskLabel::kLow;
    std::vector<RiskFactor> riskFactors;
    core::i32 confidence = 0;
    core::f64 probability = 0.0;

    [[nodiscard]] bool operator==(const RiskAssessment &) const = default;
};

} // namespace injsense::model
