/**
 * @file WindowFeatureExtractor.hpp
 * @brief Time-domain features of EMG, heart-rate and temperature windows.
 *
 * Output layout, in this exact order:
 *   - per EMG channel c: emg<c>_rms, emg<c>_mav, emg<c>_iemg, emg<c>_wl, emg<c>_zc
 *   - hr_mean, hr_std, hr_delta
 *   - temp_mean, temp_rate
 *
 * @see math::Statistics
 */

#pragma once

#include "injsense/features/SignalFeatureVector.hpp"

#include "injsense/dsp/SignalWindow.hpp"
#include "injsense/core/Expected.hpp"

#include <span>
#include <string_view>

namespace injsense::features {

/**
 * @brief Stateless, deterministic extractor of the low-level feature vector.
 */
class WindowFeatureExtractor {
public:
    static constexpr core::usize kEmgFeaturesPerChannel = 5;
    static constexpr core::usize kHeartRateFeatures     = 3;
    static constexpr core::usize kTemperatureFeatures   = 2;

    /**
     * @brief Extracts the feature vector from one acquisition interval.
     *
     * @param emg  EMG window [samples x channels], filtered or raw.
     * @param hr   Heart-rate samples.
     * @param temp Skin-temperature samples.
     * @return The feature vector, kInsufficientSamples if any window is
     *         empty, or kNonFiniteSample if any sample is NaN or infinite.
     */
    [[nodiscard]] core::Expected<SignalFeatureVector> extract(
        const dsp::SignalWindow &emg,
        std::span<const core::f64> hr,
        std::span<const core::f64> temp) const;

    /// @brief Length of the vector produced for @p channelCount EMG channels.
    [[nodiscard]] static constexpr core::usize featureCount(core::usize channelCount) noexcept
    {
        return channelCount * kEmgFeaturesPerChannel + kHeartRateFeatures + kTemperatureFeatures;
    }

private:
    [[nodiscard]] static core::ExpectedVoid checkSeries(std::span<const core::f64> samples, std::string_view label);
};

} // namespace injsense::features
