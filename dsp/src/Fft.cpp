/**
 * @file Fft.cpp
 * @brief Radix-2 FFT with a direct DFT fallback.
 */

#include "injsense/dsp/Fft.hpp"

#include <bit>
#include <cmath>
#include <numbers>

namespace injsense::dsp {

void Fft::bitReversalPermutation(std::vector<Complex> &x)
{
    const auto N = static_cast<core::u32>(x.size());
    core::u32 j = 0;

    for (core::u32 i = 1; i < N; ++i) {
        core::u32 bit = N >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(x[i], x[j]);
        }
    }
}

void Fft::butterflyPass(std::vector<Complex> &x)
{
    const auto N = static_cast<core::u32>(x.size());

    for (core::u32 len = 2; len <= N; len <<= 1) {
        const core::u32 halfLen = len / 2;

        for (core::u32 i = 0; i < N; i += len) {
            for (core::u32 k = 0; k < halfLen; ++k) {
                const core::f64 angle = -2.0 * std::numbers::pi * static_cast<core::f64>(k) / static_cast<core::f64>(len);
                const Complex w(std::cos(angle), std::sin(angle));
                const Complex u = x[i + k];
                const Complex v = x[i + k + halfLen] * w;
                x[i + k] = u + v;
                x[i + k + halfLen] = u - v;
            }
        }
    }
}

void Fft::direct(std::vector<Complex> &x)
{
    const core::usize N = x.size();
    std::vector<Complex> out(N, Complex(0.0, 0.0));

    for (core::usize k = 0; k < N; ++k) {
        for (core::usize n = 0; n < N; ++n) {
            const core::usize phase = (k * n) % N;
            const core::f64 angle = -2.0 * std::numbers::pi * static_cast<core::f64>(phase) / static_cast<core::f64>(N);
            out[k] += x[n] * Complex(std::cos(angle), std::sin(angle));
        }
    }

    x = std::move(out);
}

void Fft::forward(std::vector<Complex> &x)
{
    if (x.size() <= 1)
        return;

    if (std::has_single_bit(x.size())) {
        bitReversalPermutation(x);
        butterflyPass(x);
    } else {
        direct(x);
    }
}

std::vector<Fft::Complex> Fft::forwardReal(const std::vector<core::f64> &x)
{
    std::vector<Complex> buffer(x.begin(), x.end());
    forward(buffer);
    buffer.resize(x.size() / 2 + 1);
    return buffer;
}

} // namespace injsense::dsp
