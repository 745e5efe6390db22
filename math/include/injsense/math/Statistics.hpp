/**
 * @file Statistics.hpp
 * @brief Time-domain statistics for biosignal windows.
 *
 * Provides the building blocks used by the feature extractors: mean,
 * population standard deviation, RMS, mean absolute value, integrated
 * absolute value, waveform length, zero-crossing count and the sliding
 * RMS envelope.
 *
 * All functions are pure and reentrant. Empty input yields 0 for the
 * scalar statistics; callers that must reject empty windows validate
 * before calling.
 *
 * @see features::WindowFeatureExtractor, features::ImbalanceAnalyzer
 */

#pragma once

#include "injsense/core/Types.hpp"

#include <span>
#include <vector>

namespace injsense::math {

/**
 * @brief Mean and population standard deviation of a sample set.
 */
struct Baseline {
    core::f64 mean   = 0.0;
    core::f64 stdDev = 0.0;
};

/**
 * @brief Pure-function statistical utilities for temporal signals.
 */
class Statistics {
public:
    Statistics() = delete;

    /// @brief Arithmetic mean.
    [[nodiscard]] static core::f64 mean(std::span<const core::f64> data) noexcept;

    /**
     * @brief Computes the mean and population (ddof = 0) standard deviation.
     */
    [[nodiscard]] static Baseline computeBaseline(std::span<const core::f64> data) noexcept;

    /// @brief Root mean square: sqrt(mean(x^2)).
    [[nodiscard]] static core::f64 rms(std::span<const core::f64> data) noexcept;

    /// @brief Mean absolute value.
    [[nodiscard]] static core::f64 meanAbsolute(std::span<const core::f64> data) noexcept;

    /// @brief Integrated absolute value (sum of |x|).
    [[nodiscard]] static core::f64 integratedAbsolute(std::span<const core::f64> data) noexcept;

    /// @brief Sum of absolute first differences.
    [[nodiscard]] static core::f64 waveformLength(std::span<const core::f64> data) noexcept;

    /**
     * @brief Counts positions where sign(x[i]) != sign(x[i+1]).
     *
     * sign() maps to {-1, 0, 1}, so a transition into or out of an exact
     * zero counts, while a value held at zero does not.
     */
    [[nodiscard]] static core::usize zeroCrossings(std::span<const core::f64> data) noexcept;

    /**
     * @brief RMS of every full window of @p windowSize samples (stride 1).
     *
     * @return data.size() - windowSize + 1 values, or an empty vector when
     *         the window is zero or longer than the data.
     */
    [[nodiscard]] static std::vector<core::f64> slidingWindowRms(
        std::span<const core::f64> data,
        core::usize windowSize);

    /// @brief Last sample minus first sample, or 0 with fewer than 2 samples.
    [[nodiscard]] static core::f64 delta(std::span<const core::f64> data) noexcept;

    /// @brief Returns true if every value is finite.
    [[nodiscard]] static bool allFinite(std::span<const core::f64> data) noexcept;
};

} // namespace injsense::math
