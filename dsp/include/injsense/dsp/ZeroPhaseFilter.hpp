/**
 * @file ZeroPhaseFilter.hpp
 * @brief Direct-form IIR filtering and forward-backward (zero-phase) filtering.
 *
 * filtfilt() runs the filter forward, then backward over the reversed
 * output, which cancels the phase response and squares the magnitude
 * response. The input is extended at both ends by odd reflection and both
 * passes start from the filter's steady-state initial conditions scaled to
 * the first sample, which keeps the start-up transient small.
 *
 * Transients at the window edges are still present and are accepted as a
 * known limitation.
 *
 * @see Butterworth, SignalFilter
 */

#pragma once

#include "injsense/dsp/Butterworth.hpp"

#include "injsense/core/Expected.hpp"
#include "injsense/core/Types.hpp"

#include <span>
#include <vector>

namespace injsense::dsp {

class ZeroPhaseFilter {
public:
    ZeroPhaseFilter() = delete;

    /**
     * @brief Causal filtering (direct form II transposed).
     *
     * @param tf      Transfer function (a[0] must be non-zero)
     * @param input   Input samples
     * @param state   Initial delay-line state of size length()-1, or empty
     *                for zero initial conditions
     * @return Filtered samples, same length as @p input
     */
    [[nodiscard]] static std::vector<core::f64> lfilter(
        const TransferFunction &tf,
        std::span<const core::f64> input,
        std::span<const core::f64> state = {});

    /**
     * @brief Steady-state delay-line values for a unit step input.
     *
     * Solves (I - A^T) zi = b[1:] - a[1:] * b[0], where A is the companion
     * matrix of the denominator.
     *
     * @return kInvalidArgument for a zero leading denominator coefficient,
     *         kInvalidFilterSpec if the system is singular
     */
    [[nodiscard]] static core::Expected<std::vector<core::f64>> steadyState(const TransferFunction &tf);

    /**
     * @brief Number of samples reflected at each edge: 3 * length().
     */
    [[nodiscard]] static core::usize padLength(const TransferFunction &tf) noexcept;

    /**
     * @brief Zero-phase forward-backward filtering.
     *
     * @return Filtered samples of the same length, or kInsufficientSamples
     *         when the input is not longer than padLength()
     */
    [[nodiscard]] static core::Expected<std::vector<core::f64>> filtfilt(
        const TransferFunction &tf,
        std::span<const core::f64> input);
};

} // namespace injsense::dsp
