/**
 * @file SignalWindow.hpp
 * @brief Fixed-duration block of uniformly sampled, multi-channel samples.
 *
 * SignalWindow is the unit handed from acquisition to filtering and
 * feature extraction. It is created per acquisition interval and consumed
 * immediately; nothing downstream retains it.
 *
 * Memory layout: data[sampleIndex][channelIndex].
 *
 * @see SignalFilter, features::WindowFeatureExtractor
 */

#pragma once

#include "injsense/core/Expected.hpp"
#include "injsense/core/Types.hpp"

#include <span>
#include <vector>

namespace injsense::dsp {

struct SignalWindow {
    std::vector<std::vector<core::f64>> data;
    core::f64 sampleRate = 0.0;
    core::usize channelCount = 0;

    /**
     * @brief Builds a single-channel window from a sample sequence.
     */
    [[nodiscard]] static SignalWindow fromSamples(std::span<const core::f64> samples, core::f64 sampleRate);

    /**
     * @brief Builds a window from channel-major input (one vector per channel).
     *
     * @return Error (kInvalidArgument) when channels differ in length or
     *         no channel is given.
     */
    [[nodiscard]] static core::Expected<SignalWindow> fromChannels(
        const std::vector<std::vector<core::f64>> &channels,
        core::f64 sampleRate);

    /// @brief Number of samples (time points) in this window.
    [[nodiscard]] core::usize sampleCount() const noexcept { return data.size(); }

    /// @brief True if the window holds no samples.
    [[nodiscard]] bool empty() const noexcept { return data.empty(); }

    /**
     * @brief Copies one channel into a contiguous vector.
     */
    [[nodiscard]] std::vector<core::f64> channel(core::usize index) const;

    /**
     * @brief Overwrites one channel; @p values must hold sampleCount() entries.
     */
    void setChannel(core::usize index, std::span<const core::f64> values);

    /**
     * @brief Checks the window invariants.
     *
     * @return kInsufficientSamples if the window is empty or has no channel,
     *         kInvalidArgument if a row's width differs from channelCount,
     *         kNonFiniteSample if any sample is NaN or infinite.
     */
    [[nodiscard]] core::ExpectedVoid validate() const;
};

} // namespace injsense::dsp
