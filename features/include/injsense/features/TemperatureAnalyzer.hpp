/**
 * @file TemperatureAnalyzer.hpp
 * @brief Skin-temperature summary and abnormality flag.
 */

#pragma once

#include "injsense/core/Constants.hpp"
#include "injsense/core/Expected.hpp"

#include <span>

namespace injsense::features {

/**
 * @brief Limits above which a temperature window is flagged abnormal.
 */
struct TemperatureThresholds {
    core::f64 maxStdDev      = core::kTempStdAbnormal;
    core::f64 maxTemperature = core::kTempMaxAbnormal;
};

struct TemperatureReport {
    core::f64 average      = 0.0;
    core::f64 maximum      = 0.0;
    core::f64 minimum      = 0.0;
    core::f64 stdDeviation = 0.0;
    bool abnormal          = false;
};

class TemperatureAnalyzer {
public:
    explicit TemperatureAnalyzer(const TemperatureThresholds &thresholds = {});

    /**
     * @brief Summarises a temperature window (degrees Celsius).
     *
     * abnormal = stdDeviation > maxStdDev || maximum > maxTemperature.
     *
     * @return The report, kInsufficientSamples for an empty window or
     *         kNonFiniteSample for NaN/Inf input.
     */
    [[nodiscard]] core::Expected<TemperatureReport> analyze(std::span<const core::f64> temp) const;

private:
    TemperatureThresholds _thresholds;
};

} // namespace injsense::features
