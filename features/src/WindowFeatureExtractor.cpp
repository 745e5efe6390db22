/**
 * @file WindowFeatureExtractor.cpp
 * @brief WindowFeatureExtractor implementation.
 */

#include "injsense/features/WindowFeatureExtractor.hpp"
#include "injsense/math/Statistics.hpp"

#include <format>

namespace injsense::features {

core::ExpectedVoid WindowFeatureExtractor::checkSeries(std::span<const core::f64> samples, std::string_view label)
{
    if (samples.empty())
        return core::makeError(core::ErrorCode::kInsufficientSamples, std::format("{} window is empty", label));
    if (!math::Statistics::allFinite(samples))
        return core::makeError(core::ErrorCode::kNonFiniteSample, std::format("{} window holds a non-finite sample", label));
    return {};
}

core::Expected<SignalFeatureVector> WindowFeatureExtractor::extract(
    const dsp::SignalWindow &emg,
    std::span<const core::f64> hr,
    std::span<const core::f64> temp) const
{
    INJSENSE_TRY_VOID(emg.validate());
    INJSENSE_TRY_VOID(checkSeries(hr, "heart-rate"));
    INJSENSE_TRY_VOID(checkSeries(temp, "temperature"));

    SignalFeatureVector features;

    for (core::usize ch = 0; ch < emg.channelCount; ++ch) {
        const std::vector<core::f64> x = emg.channel(ch);

        features.append(std::format("emg{}_rms", ch),  math::Statistics::rms(x));
        features.append(std::format("emg{}_mav", ch),  math::Statistics::meanAbsolute(x));
        features.append(std::format("emg{}_iemg", ch), math::Statistics::integratedAbsolute(x));
        features.append(std::format("emg{}_wl", ch),   math::Statistics::waveformLength(x));
        features.append(std::format("emg{}_zc", ch),
                        static_cast<core::f64>(math::Statistics::zeroCrossings(x)));
    }

    const math::Baseline hrStats = math::Statistics::computeBaseline(hr);
    features.append("hr_mean", hrStats.mean);
    features.append("hr_std", hrStats.stdDev);
    features.append("hr_delta", math::Statistics::delta(hr));

    features.append("temp_mean", math::Statistics::mean(temp));
    features.append("temp_rate", math::Statistics::delta(temp));

    return features;
}

} // namespace injsense::features
