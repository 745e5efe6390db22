/**
 * @file Welch.hpp
 * @brief Power spectral density estimation by Welch's averaged periodograms.
 *
 * Parameters are fixed:
 * periodic Hann window, 50 % overlap, constant (mean) detrend per segment,
 * one-sided spectrum with density scaling (units^2 / Hz).
 *
 * @see features::SpectralAnalyzer
 */

#pragma once

#include "injsense/core/Constants.hpp"
#include "injsense/core/Expected.hpp"
#include "injsense/core/Types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace injsense::dsp {

/**
 * @brief One-sided spectrum: power[k] is the density at frequencies[k].
 */
struct PowerSpectrum {
    std::vector<core::f64> frequencies;
    std::vector<core::f64> power;

    [[nodiscard]] core::usize binCount() const noexcept { return power.size(); }
};

struct WelchConfig {
    core::usize segmentLength = core::kWelchSegmentLength;
    /// Samples shared by consecutive segments; unset selects segmentLength / 2.
    std::optional<core::usize> overlap;
};

class Welch {
public:
    Welch() = delete;

    /**
     * @brief Estimates the PSD of a single-channel signal.
     *
     * A signal shorter than the segment length is analysed as one segment
     * of its own length.
     *
     * @return The spectrum, kInsufficientSamples for fewer than 2 samples,
     *         or kInvalidArgument for a non-positive sample rate, a zero
     *         segment length or an overlap not below the segment length
     */
    [[nodiscard]] static core::Expected<PowerSpectrum> estimate(
        std::span<const core::f64> samples,
        core::f64 sampleRate,
        const WelchConfig &config = {});
};

} // namespace injsense::dsp
