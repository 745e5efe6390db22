/**
 * @file SpectralAnalyzer.hpp
 * @brief Muscle fatigue index from the sEMG median-frequency shift.
 *
 * A fatiguing muscle compresses its EMG spectrum towards low frequencies.
 * The analyzer estimates the PSD with Welch's method, takes the median
 * frequency and maps it linearly onto a 0-100 fatigue score:
 *
 *   fatigue = clamp(100 * (1 - (median - floorHz) / spanHz), 0, 100)
 *
 * The mapping is an empirical choice and is exposed as FatigueMapping.
 *
 * @see dsp::Welch
 */

#pragma once

#include "injsense/dsp/SignalWindow.hpp"
#include "injsense/dsp/Welch.hpp"

#include "injsense/core/Constants.hpp"
#include "injsense/core/Expected.hpp"

#include <span>

namespace injsense::features {

/**
 * @brief Linear median-frequency to fatigue mapping.
 */
struct FatigueMapping {
    core::f64 floorHz = core::kFatigueFloorHz;
    core::f64 spanHz  = core::kFatigueSpanHz;

    /// @brief kInvalidArgument unless floorHz is finite and spanHz finite and positive.
    [[nodiscard]] core::ExpectedVoid validate() const;
};

struct SpectralAnalyzerConfig {
    core::usize segmentLength = core::kWelchSegmentLength;
    FatigueMapping mapping{};
};

class SpectralAnalyzer {
public:
    explicit SpectralAnalyzer(const SpectralAnalyzerConfig &config = {});

    /**
     * @brief Welch PSD with a periodic Hann window and 50 % overlap.
     *
     * @return The one-sided density spectrum, kInsufficientSamples with
     *         fewer than 2 samples, kNonFiniteSample for NaN/Inf input.
     */
    [[nodiscard]] core::Expected<dsp::PowerSpectrum> psd(
        std::span<const core::f64> samples,
        core::f64 sampleRate) const;

    /**
     * @brief First frequency whose cumulative power reaches half the total.
     *
     * A spectrum with zero total power yields its first bin (0 Hz).
     */
    [[nodiscard]] static core::f64 medianFrequency(const dsp::PowerSpectrum &spectrum) noexcept;

    [[nodiscard]] core::Expected<core::f64> medianFrequency(
        std::span<const core::f64> samples,
        core::f64 sampleRate) const;

    /// @brief Applies the fatigue mapping to a median frequency.
    [[nodiscard]] core::f64 fatigueFromMedian(core::f64 medianHz) const noexcept;

    /**
     * @brief Fatigue index in [0, 100] of a single filtered EMG channel.
     *
     * @return kInvalidArgument for an unusable FatigueMapping, otherwise
     *         the errors of psd().
     */
    [[nodiscard]] core::Expected<core::f64> fatigueIndex(
        std::span<const core::f64> filteredEmg,
        core::f64 sampleRate) const;

    /**
     * @brief Fatigue index of a filtered EMG window, averaged over channels.
     */
    [[nodiscard]] core::Expected<core::f64> fatigueIndex(const dsp::SignalWindow &filteredEmg) const;

    [[nodiscard]] const SpectralAnalyzerConfig &config() const noexcept { return _config; }

private:
    SpectralAnalyzerConfig _config;
};

} // namespace injsense::features
