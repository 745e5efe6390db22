/**
 * @file SignalWindow.cpp
 * @brief SignalWindow construction helpers and invariant checks.
 */

#include "injsense/dsp/SignalWindow.hpp"
#include "injsense/core/Assert.hpp"

#include <cmath>
#include <format>

namespace injsense::dsp {

SignalWindow SignalWindow::fromSamples(std::span<const core::f64> samples, core::f64 sampleRate)
{
    SignalWindow window{ .data = {}, .sampleRate = sampleRate, .channelCount = 1 };
    window.data.reserve(samples.size());
    for (const core::f64 s : samples)
        window.data.push_back({s});
    return window;
}

core::Expected<SignalWindow> SignalWindow::fromChannels(
    const std::vector<std::vector<core::f64>> &channels,
    core::f64 sampleRate)
{
    if (channels.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "SignalWindow needs at least one channel");

    const core::usize length = channels.front().size();
    for (core::usize ch = 1; ch < channels.size(); ++ch) {
        if (channels[ch].size() != length) {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                std::format("channel {} has {} samples, channel 0 has {}", ch, channels[ch].size(), length));
        }
    }

    SignalWindow window{ .data = {}, .sampleRate = sampleRate, .channelCount = channels.size() };
    window.data.assign(length, std::vector<core::f64>(channels.size(), 0.0));
    for (core::usize ch = 0; ch < channels.size(); ++ch)
        window.setChannel(ch, channels[ch]);

    return window;
}

std::vector<core::f64> SignalWindow::channel(core::usize index) const
{
    INJSENSE_ASSERT(index < channelCount);

    std::vector<core::f64> out;
    out.reserve(data.size());
    for (const auto &row : data)
        out.push_back(row[index]);
    return out;
}

void SignalWindow::setChannel(core::usize index, std::span<const core::f64> values)
{
    INJSENSE_ASSERT(index < channelCount);
    INJSENSE_ASSERT(values.size() == data.size());

    for (core::usize t = 0; t < data.size(); ++t)
        data[t][index] = values[t];
}

core::ExpectedVoid SignalWindow::validate() const
{
    if (data.empty() || channelCount == 0)
        return core::makeError(core::ErrorCode::kInsufficientSamples, "signal window is empty");

    for (core::usize t = 0; t < data.size(); ++t) {
        if (data[t].size() != channelCount) {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                std::format("sample {} has {} channels, expected {}", t, data[t].size(), channelCount));
        }
        for (const core::f64 v : data[t]) {
            if (!std::isfinite(v)) {
                return core::makeError(core::ErrorCode::kNonFiniteSample,
                    std::format("non-finite value at sample {}", t));
            }
        }
    }

    return {};
}

} // namespace injsense::dsp
