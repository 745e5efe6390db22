/**
 * @file TemperatureAnalyzer.cpp
 * @brief TemperatureAnalyzer implementation.
 */

#include "injsense/features/TemperatureAnalyzer.hpp"
#include "injsense/math/Statistics.hpp"

#include <algorithm>

namespace injsense::features {

TemperatureAnalyzer::TemperatureAnalyzer(const TemperatureThresholds &thresholds)
    : _thresholds(thresholds)
{
}

core::Expected<TemperatureReport> TemperatureAnalyzer::analyze(std::span<const core::f64> temp) const
{
    if (temp.empty())
        return core::makeError(core::ErrorCode::kInsufficientSamples, "temperature window is empty");
    if (!math::Statistics::allFinite(temp))
        return core::makeError(core::ErrorCode::kNonFiniteSample, "temperature window holds a non-finite sample");

    const auto [minIt, maxIt] = std::minmax_element(temp.begin(), temp.end());
    const math::Baseline stats = math::Statistics::computeBaseline(temp);

    TemperatureReport report{
        .average      = stats.mean,
        .maximum      = *maxIt,
        .minimum      = *minIt,
        .stdDeviation = stats.stdDev,
        .abnormal     = false,
    };
    report.abnormal = report.stdDeviation > _thresholds.maxStdDev || report.maximum > _thresholds.maxTemperature;
    return report;
}

} // namespace injsense::features
