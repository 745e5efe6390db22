/**
 * @file Welch.cpp
 * @brief Welch PSD estimator.
 */

#include "injsense/dsp/Welch.hpp"
#include "injsense/dsp/Fft.hpp"
#include "injsense/dsp/Windowing.hpp"

#include <format>
#include <numeric>

namespace injsense::dsp {

core::Expected<PowerSpectrum> Welch::estimate(
    std::span<const core::f64> samples,
    core::f64 sampleRate,
    const WelchConfig &config)
{
    if (samples.size() < 2) {
        return core::makeError(core::ErrorCode::kInsufficientSamples,
            std::format("Welch needs at least 2 samples, got {}", samples.size()));
    }
    if (!(sampleRate > 0.0))
        return core::makeError(core::ErrorCode::kInvalidArgument, "sample rate must be positive");
    if (config.segmentLength == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "segment length must be positive");

    core::usize segment = config.segmentLength;
    core::usize overlap = config.overlap.value_or(segment / 2);
    if (overlap >= segment) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("overlap {} must be smaller than segment length {}", overlap, segment));
    }

    if (samples.size() < segment) {
        segment = samples.size();
        overlap = segment / 2;
    }

    const std::vector<core::f64> window = hannWindow(segment, true);
    const core::f64 windowPower = std::inner_product(window.begin(), window.end(), window.begin(), 0.0);
    const core::f64 scale = 1.0 / (sampleRate * windowPower);

    const core::usize step = segment - overlap;
    const core::usize segmentCount = (samples.size() - overlap) / step;
    const core::usize bins = segment / 2 + 1;

    PowerSpectrum spectrum;
    spectrum.power.assign(bins, 0.0);
    spectrum.frequencies.resize(bins);
    for (core::usize k = 0; k < bins; ++k)
        spectrum.frequencies[k] = static_cast<core::f64>(k) * sampleRate / static_cast<core::f64>(segment);

    std::vector<core::f64> buffer(segment);
    for (core::usize s = 0; s < segmentCount; ++s) {
        const auto first = samples.begin() + static_cast<core::isize>(s * step);
        const core::f64 segmentMean =
            std::accumulate(first, first + static_cast<core::isize>(segment), 0.0) / static_cast<core::f64>(segment);

        for (core::usize i = 0; i < segment; ++i)
            buffer[i] = (first[static_cast<core::isize>(i)] - segmentMean) * window[i];

        const auto spectrumBins = Fft::forwardReal(buffer);
        for (core::usize k = 0; k < bins; ++k)
            spectrum.power[k] += std::norm(spectrumBins[k]) * scale;
    }

    // Fold negative frequencies into the one-sided spectrum; DC and, for an
    // even segment, the Nyquist bin have no mirror image.
    const core::usize lastDoubled = (segment % 2 == 0) ? bins - 1 : bins;
    for (core::usize k = 1; k < lastDoubled; ++k)
        spectrum.power[k] *= 2.0;

    for (core::f64 &p : spectrum.power)
        p /= static_cast<core::f64>(segmentCount);

    return spectrum;
}

} // namespace injsense::dsp
