/**
 * @file ImbalanceAnalyzer.hpp
 * @brief Left/right muscle activation asymmetry from RMS envelopes.
 *
 * Each side is reduced to the mean of its sliding RMS envelope (every full
 * window, stride 1). The imbalance is the relative difference
 * 100 * |L - R| / (L + R), 0 when both sides are silent.
 */

#pragma once

#include "injsense/dsp/SignalWindow.hpp"

#include "injsense/core/Constants.hpp"
#include "injsense/core/Expected.hpp"

#include <span>

namespace injsense::features {

class ImbalanceAnalyzer {
public:
    explicit ImbalanceAnalyzer(core::usize rmsWindowSize = core::kRmsWindowSize);

    /**
     * @brief Mean of the sliding RMS envelope of one side.
     *
     * @return kInvalidArgument for a zero window size, kInsufficientSamples
     *         when fewer samples than the window are given,
     *         kNonFiniteSample for NaN/Inf input.
     */
    [[nodiscard]] core::Expected<core::f64> envelopeMean(std::span<const core::f64> samples) const;

    /**
     * @brief Activation asymmetry in [0, 100].
     */
    [[nodiscard]] core::Expected<core::f64> imbalance(
        std::span<const core::f64> left,
        std::span<const core::f64> right) const;

    /**
     * @brief Window overload; each side must be a single-channel window.
     */
    [[nodiscard]] core::Expected<core::f64> imbalance(
        const dsp::SignalWindow &left,
        const dsp::SignalWindow &right) const;

    [[nodiscard]] core::usize rmsWindowSize() const noexcept { return _rmsWindowSize; }

private:
    core::usize _rmsWindowSize;
};

} // namespace injsense::features
