/**
 * @file SignalFilter.cpp
 * @brief SignalFilter implementation.
 */

#include "injsense/dsp/SignalFilter.hpp"
#include "injsense/dsp/ZeroPhaseFilter.hpp"

#include <cmath>
#include <format>

namespace injsense::dsp {

core::ExpectedVoid FilterSpec::validate() const
{
    if (order < 1)
        return core::makeError(core::ErrorCode::kInvalidFilterSpec, "filter order must be at least 1");

    if (!(sampleRate > 0.0) || !std::isfinite(sampleRate)) {
        return core::makeError(core::ErrorCode::kInvalidFilterSpec,
            std::format("sample rate must be positive, got {}", sampleRate));
    }

    const core::f64 nyquist = 0.5 * sampleRate;
    if (!(lowHz > 0.0 && lowHz < highHz && highHz < nyquist)) {
        return core::makeError(core::ErrorCode::kInvalidFilterSpec,
            std::format("band [{}, {}] Hz must satisfy 0 < low < high < {} Hz", lowHz, highHz, nyquist));
    }

    return {};
}

SignalFilter::SignalFilter(FilterSpec spec, TransferFunction tf)
    : _spec(spec), _tf(std::move(tf))
{
}

core::Expected<SignalFilter> SignalFilter::create(const FilterSpec &spec)
{
    INJSENSE_TRY_VOID(spec.validate());

    const core::f64 nyquist = 0.5 * spec.sampleRate;
    TransferFunction tf = INJSENSE_TRY(Butterworth::bandpass(spec.order, spec.lowHz / nyquist, spec.highHz / nyquist));

    return SignalFilter(spec, std::move(tf));
}

core::Expected<SignalWindow> SignalFilter::filter(const SignalWindow &raw, const FilterSpec &spec)
{
    const SignalFilter designed = INJSENSE_TRY(create(spec));
    return designed.apply(raw);
}

core::usize SignalFilter::minimumSamples() const noexcept
{
    return ZeroPhaseFilter::padLength(_tf) + 1;
}

core::Expected<SignalWindow> SignalFilter::apply(const SignalWindow &raw) const
{
    INJSENSE_TRY_VOID(raw.validate());

    if (raw.sampleRate != _spec.sampleRate) {
        return core::makeError(core::ErrorCode::kInvalidFilterSpec,
            std::format("window sampled at {} Hz, filter designed for {} Hz", raw.sampleRate, _spec.sampleRate));
    }

    SignalWindow out = raw;
    for (core::usize ch = 0; ch < raw.channelCount; ++ch) {
        const std::vector<core::f64> samples = raw.channel(ch);
        const std::vector<core::f64> filtered = INJSENSE_TRY(ZeroPhaseFilter::filtfilt(_tf, samples));
        out.setChannel(ch, filtered);
    }

    return out;
}

} // namespace injsense::dsp
