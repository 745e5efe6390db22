/**
 * @file ImbalanceAnalyzer.cpp
 * @brief ImbalanceAnalyzer implementation.
 */

#include "injsense/features/ImbalanceAnalyzer.hpp"
#include "injsense/math/Statistics.hpp"

#include <cmath>
#include <format>

namespace injsense::features {

ImbalanceAnalyzer::ImbalanceAnalyzer(core::usize rmsWindowSize)
    : _rmsWindowSize(rmsWindowSize)
{
}

core::Expected<core::f64> ImbalanceAnalyzer::envelopeMean(std::span<const core::f64> samples) const
{
    if (_rmsWindowSize == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "RMS window size must be positive");
    if (samples.size() < _rmsWindowSize) {
        return core::makeError(core::ErrorCode::kInsufficientSamples,
            std::format("RMS envelope needs {} samples, got {}", _rmsWindowSize, samples.size()));
    }
    if (!math::Statistics::allFinite(samples))
        return core::makeError(core::ErrorCode::kNonFiniteSample, "EMG window holds a non-finite sample");

    const std::vector<core::f64> envelope = math::Statistics::slidingWindowRms(samples, _rmsWindowSize);
    return math::Statistics::mean(envelope);
}

core::Expected<core::f64> ImbalanceAnalyzer::imbalance(
    std::span<const core::f64> left,
    std::span<const core::f64> right) const
{
    const core::f64 l = INJSENSE_TRY(envelopeMean(left));
    const core::f64 r = INJSENSE_TRY(envelopeMean(right));

    const core::f64 total = l + r;
    if (total == 0.0)
        return 0.0;

    return 100.0 * std::abs(l - r) / total;
}

core::Expected<core::f64> ImbalanceAnalyzer::imbalance(
    const dsp::SignalWindow &left,
    const dsp::SignalWindow &right) const
{
    INJSENSE_TRY_VOID(left.validate());
    INJSENSE_TRY_VOID(right.validate());

    if (left.channelCount != 1 || right.channelCount != 1) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("imbalance expects single-channel windows, got {} and {}",
                        left.channelCount, right.channelCount));
    }

    return imbalance(left.channel(0), right.channel(0));
}

} // namespace injsense::features
