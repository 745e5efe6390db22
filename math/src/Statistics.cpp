/**
 * @file Statistics.cpp
 * @brief Implementation of time-domain statistics.
 */

#include "injsense/math/Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace injsense::math {

namespace {

constexpr int signOf(core::f64 x) noexcept
{
    return (x > 0.0) - (x < 0.0);
}

} // namespace

core::f64 Statistics::mean(std::span<const core::f64> data) noexcept
{
    if (data.empty())
        return 0.0;

    return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<core::f64>(data.size());
}

Baseline Statistics::computeBaseline(std::span<const core::f64> data) noexcept
{
    if (data.empty())
        return { .mean = 0.0, .stdDev = 0.0 };

    const core::f64 m = mean(data);

    core::f64 varianceSum = 0.0;
    for (const core::f64 x : data) {
        const core::f64 diff = x - m;
        varianceSum += diff * diff;
    }

    return {
        .mean   = m,
        .stdDev = std::sqrt(varianceSum / static_cast<core::f64>(data.size())),
    };
}

core::f64 Statistics::rms(std::span<const core::f64> data) noexcept
{
    if (data.empty())
        return 0.0;

    core::f64 sumSq = 0.0;
    for (const core::f64 x : data)
        sumSq += x * x;

    return std::sqrt(sumSq / static_cast<core::f64>(data.size()));
}

core::f64 Statistics::meanAbsolute(std::span<const core::f64> data) noexcept
{
    if (data.empty())
        return 0.0;

    return integratedAbsolute(data) / static_cast<core::f64>(data.size());
}

core::f64 Statistics::integratedAbsolute(std::span<const core::f64> data) noexcept
{
    return std::accumulate(
        data.begin(), data.end(), 0.0,
        [](core::f64 acc, core::f64 x) { return acc + std::abs(x); });
}

core::f64 Statistics::waveformLength(std::span<const core::f64> data) noexcept
{
    core::f64 length = 0.0;
    for (core::usize i = 1; i < data.size(); ++i)
        length += std::abs(data[i] - data[i - 1]);
    return length;
}

core::usize Statistics::zeroCrossings(std::span<const core::f64> data) noexcept
{
    core::usize count = 0;
    for (core::usize i = 1; i < data.size(); ++i) {
        if (signOf(data[i - 1]) != signOf(data[i]))
            ++count;
    }
    return count;
}

std::vector<core::f64> Statistics::slidingWindowRms(
    std::span<const core::f64> data,
    core::usize windowSize)
{
    if (windowSize == 0 || windowSize > data.size())
        return {};

    std::vector<core::f64> envelope;
    envelope.reserve(data.size() - windowSize + 1);

    const auto n = static_cast<core::f64>(windowSize);

    // Running sum of squares; recomputed from scratch periodically to bound
    // the drift of the incremental update.
    constexpr core::usize kResyncInterval = 1024;
    core::f64 sumSq = 0.0;
    for (core::usize i = 0; i < windowSize; ++i)
        sumSq += data[i] * data[i];
    envelope.push_back(std::sqrt(std::max(sumSq, 0.0) / n));

    for (core::usize start = 1; start + windowSize <= data.size(); ++start) {
        if (start % kResyncInterval == 0) {
            sumSq = 0.0;
            for (core::usize i = start; i < start + windowSize; ++i)
                sumSq += data[i] * data[i];
        } else {
            const core::f64 outgoing = data[start - 1];
            const core::f64 incoming = data[start + windowSize - 1];
            sumSq += incoming * incoming - outgoing * outgoing;
        }
        envelope.push_back(std::sqrt(std::max(sumSq, 0.0) / n));
    }

    return envelope;
}

core::f64 Statistics::delta(std::span<const core::f64> data) noexcept
{
    if (data.size() < 2)
        return 0.0;
    return data.back() - data.front();
}

bool Statistics::allFinite(std::span<const core::f64> data) noexcept
{
    return std::all_of(data.begin(), data.end(),
                       [](core::f64 x) { return std::isfinite(x); });
}

} // namespace injsense::math
