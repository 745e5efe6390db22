/**
 * @file SignalFilter.hpp
 * @brief Zero-phase Butterworth band-pass filtering of raw sEMG windows.
 *
 * Restricts raw sEMG to the physiological band (20-450 Hz by default)
 * without phase lag, so that waveform timing used by the zero-crossing
 * and waveform-length features is preserved. Forward-backward filtering
 * doubles the effective order.
 *
 * The transfer function is designed once at construction; apply() is
 * const and reentrant.
 *
 * @code
 *   auto filter = SignalFilter::create({ .lowHz = 20.0, .highHz = 450.0,
 *                                        .sampleRate = 1000.0, .order = 4 });
 *   if (filter)
 *       auto clean = filter->apply(rawWindow);
 * @endcode
 *
 * @see Butterworth, ZeroPhaseFilter
 */

#pragma once

#include "injsense/dsp/Butterworth.hpp"
#include "injsense/dsp/SignalWindow.hpp"

#include "injsense/core/Constants.hpp"
#include "injsense/core/Expected.hpp"

namespace injsense::dsp {

/**
 * @brief Band edges, sampling rate and prototype order of a band-pass.
 */
struct FilterSpec {
    core::f64 lowHz      = core::kEmgLowCutHz;
    core::f64 highHz     = core::kEmgHighCutHz;
    core::f64 sampleRate = core::kDefaultSampleRate;
    core::u32 order      = core::kButterworthOrder;

    /**
     * @brief Checks 0 < lowHz < highHz < sampleRate / 2 and order >= 1.
     * @return kInvalidFilterSpec on violation
     */
    [[nodiscard]] core::ExpectedVoid validate() const;
};

class SignalFilter {
public:
    /**
     * @brief Validates the spec and designs the filter.
     */
    [[nodiscard]] static core::Expected<SignalFilter> create(const FilterSpec &spec);

    /**
     * @brief One-shot design and application.
     */
    [[nodiscard]] static core::Expected<SignalWindow> filter(const SignalWindow &raw, const FilterSpec &spec);

    /**
     * @brief Filters every channel of @p raw.
     *
     * @return Window of identical shape; kInvalidFilterSpec if the window's
     *         sample rate differs from the spec, window validation errors,
     *         or kInsufficientSamples for windows too short to pad
     */
    [[nodiscard]] core::Expected<SignalWindow> apply(const SignalWindow &raw) const;

    [[nodiscard]] const FilterSpec &spec() const noexcept { return _spec; }
    [[nodiscard]] const TransferFunction &transferFunction() const noexcept { return _tf; }

    /// @brief Minimum number of samples apply() accepts.
    [[nodiscard]] core::usize minimumSamples() const noexcept;

private:
    SignalFilter(FilterSpec spec, TransferFunction tf);

    FilterSpec _spec;
    TransferFunction _tf;
};

} // namespace injsense::dsp
