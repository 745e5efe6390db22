/**
 * @file SpectralAnalyzer.cpp
 * @brief SpectralAnalyzer implementation.
 */

#include "injsense/features/SpectralAnalyzer.hpp"
#include "injsense/math/Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

namespace injsense::features {

core::ExpectedVoid FatigueMapping::validate() const
{
    if (!std::isfinite(floorHz) || !std::isfinite(spanHz) || spanHz <= 0.0) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("fatigue mapping needs a positive span, got floor {} Hz span {} Hz", floorHz, spanHz));
    }
    return {};
}

SpectralAnalyzer::SpectralAnalyzer(const SpectralAnalyzerConfig &config)
    : _config(config)
{
}

core::Expected<dsp::PowerSpectrum> SpectralAnalyzer::psd(
    std::span<const core::f64> samples,
    core::f64 sampleRate) const
{
    if (!math::Statistics::allFinite(samples))
        return core::makeError(core::ErrorCode::kNonFiniteSample, "EMG window holds a non-finite sample");

    return dsp::Welch::estimate(samples, sampleRate, { .segmentLength = _config.segmentLength });
}

core::f64 SpectralAnalyzer::medianFrequency(const dsp::PowerSpectrum &spectrum) noexcept
{
    if (spectrum.power.empty())
        return 0.0;

    const core::f64 half = std::accumulate(spectrum.power.begin(), spectrum.power.end(), 0.0) / 2.0;

    core::f64 cumulative = 0.0;
    for (core::usize k = 0; k < spectrum.power.size(); ++k) {
        cumulative += spectrum.power[k];
        if (cumulative >= half)
            return spectrum.frequencies[k];
    }
    return spectrum.frequencies.back();
}

core::Expected<core::f64> SpectralAnalyzer::medianFrequency(
    std::span<const core::f64> samples,
    core::f64 sampleRate) const
{
    const dsp::PowerSpectrum spectrum = INJSENSE_TRY(psd(samples, sampleRate));
    return medianFrequency(spectrum);
}

core::f64 SpectralAnalyzer::fatigueFromMedian(core::f64 medianHz) const noexcept
{
    const FatigueMapping &m = _config.mapping;
    const core::f64 index = 100.0 * (1.0 - (medianHz - m.floorHz) / m.spanHz);
    return std::clamp(index, 0.0, 100.0);
}

core::Expected<core::f64> SpectralAnalyzer::fatigueIndex(
    std::span<const core::f64> filteredEmg,
    core::f64 sampleRate) const
{
    INJSENSE_TRY_VOID(_config.mapping.validate());
    const core::f64 median = INJSENSE_TRY(medianFrequency(filteredEmg, sampleRate));
    return fatigueFromMedian(median);
}

core::Expected<core::f64> SpectralAnalyzer::fatigueIndex(const dsp::SignalWindow &filteredEmg) const
{
    INJSENSE_TRY_VOID(filteredEmg.validate());

    core::f64 sum = 0.0;
    for (core::usize ch = 0; ch < filteredEmg.channelCount; ++ch)
        sum += INJSENSE_TRY(fatigueIndex(filteredEmg.channel(ch), filteredEmg.sampleRate));

    return sum / static_cast<core::f64>(filteredEmg.channelCount);
}

} // namespace injsense::features
