/**
 * @file Butterworth.cpp
 * @brief Butterworth band-pass design.
 */

#include "injsense/dsp/Butterworth.hpp"

#include <cmath>
#include <format>
#include <numbers>

namespace injsense::dsp {

namespace {

using Complex = std::complex<core::f64>;

// Digital design runs the analog math at fs = 2 so that normalized cutoffs
// in [0, 1] map directly onto the Nyquist range.
constexpr core::f64 kDesignRate = 2.0;

} // namespace

core::Expected<ZeroPoleGain> Butterworth::bandpassZpk(
    core::u32 order,
    core::f64 lowNorm,
    core::f64 highNorm)
{
    if (order == 0)
        return core::makeError(core::ErrorCode::kInvalidFilterSpec, "filter order must be at least 1");

    if (!(lowNorm > 0.0 && lowNorm < highNorm && highNorm < 1.0)) {
        return core::makeError(core::ErrorCode::kInvalidFilterSpec,
            std::format("normalized cutoffs must satisfy 0 < low < high < 1, got [{}, {}]", lowNorm, highNorm));
    }

    const auto n = static_cast<core::i32>(order);

    // Analog prototype: unit-circle poles in the left half plane, no zeros.
    std::vector<Complex> protoPoles;
    protoPoles.reserve(order);
    for (core::i32 m = -n + 1; m < n; m += 2) {
        const core::f64 theta = std::numbers::pi * static_cast<core::f64>(m) / (2.0 * static_cast<core::f64>(n));
        protoPoles.push_back(-std::exp(Complex(0.0, theta)));
    }

    // Pre-warp the band edges.
    const core::f64 warpedLow  = 2.0 * kDesignRate * std::tan(std::numbers::pi * lowNorm / kDesignRate);
    const core::f64 warpedHigh = 2.0 * kDesignRate * std::tan(std::numbers::pi * highNorm / kDesignRate);
    const core::f64 bandwidth  = warpedHigh - warpedLow;
    const core::f64 center     = std::sqrt(warpedLow * warpedHigh);

    // Low-pass to band-pass: each prototype pole splits into two, and the
    // degree difference becomes zeros at the origin.
    std::vector<Complex> analogPoles;
    analogPoles.reserve(2 * order);
    for (const Complex &p : protoPoles) {
        const Complex scaled = p * bandwidth / 2.0;
        const Complex root = std::sqrt(scaled * scaled - center * center);
        analogPoles.push_back(scaled + root);
    }
    for (const Complex &p : protoPoles) {
        const Complex scaled = p * bandwidth / 2.0;
        const Complex root = std::sqrt(scaled * scaled - center * center);
        analogPoles.push_back(scaled - root);
    }
    const std::vector<Complex> analogZeros(order, Complex(0.0, 0.0));
    const core::f64 analogGain = std::pow(bandwidth, static_cast<core::f64>(order));

    // Bilinear transform.
    const core::f64 fs2 = 2.0 * kDesignRate;

    ZeroPoleGain digital;
    digital.zeros.reserve(2 * order);
    digital.poles.reserve(2 * order);

    Complex zeroProduct(1.0, 0.0);
    for (const Complex &z : analogZeros) {
        digital.zeros.push_back((fs2 + z) / (fs2 - z));
        zeroProduct *= (fs2 - z);
    }
    Complex poleProduct(1.0, 0.0);
    for (const Complex &p : analogPoles) {
        digital.poles.push_back((fs2 + p) / (fs2 - p));
        poleProduct *= (fs2 - p);
    }
    // Zeros at infinity land on z = -1.
    for (core::usize i = analogZeros.size(); i < analogPoles.size(); ++i)
        digital.zeros.emplace_back(-1.0, 0.0);

    digital.gain = analogGain * (zeroProduct / poleProduct).real();
    return digital;
}

core::Expected<TransferFunction> Butterworth::bandpass(
    core::u32 order,
    core::f64 lowNorm,
    core::f64 highNorm)
{
    const ZeroPoleGain zpk = INJSENSE_TRY(bandpassZpk(order, lowNorm, highNorm));

    TransferFunction tf;
    tf.b = expandPolynomial(zpk.zeros);
    for (core::f64 &c : tf.b)
        c *= zpk.gain;
    tf.a = expandPolynomial(zpk.poles);
    return tf;
}

std::vector<core::f64> Butterworth::expandPolynomial(const std::vector<Complex> &roots)
{
    // Coefficients of prod(x - r), highest power first.
    std::vector<Complex> coeffs{Complex(1.0, 0.0)};
    for (const Complex &r : roots) {
        coeffs.emplace_back(0.0, 0.0);
        for (core::usize i = coeffs.size() - 1; i > 0; --i)
            coeffs[i] -= r * coeffs[i - 1];
    }

    // Roots come in conjugate pairs, so the imaginary parts cancel.
    std::vector<core::f64> out;
    out.reserve(coeffs.size());
    for (const Complex &c : coeffs)
        out.push_back(c.real());
    return out;
}

core::f64 Butterworth::magnitude(const TransferFunction &tf, core::f64 normFreq) noexcept
{
    const core::f64 w = std::numbers::pi * normFreq;
    const Complex zInv = std::exp(Complex(0.0, -w));

    auto evaluate = [&zInv](const std::vector<core::f64> &coeffs) {
        Complex acc(0.0, 0.0);
        Complex power(1.0, 0.0);
        for (const core::f64 c : coeffs) {
            acc += c * power;
            power *= zInv;
        }
        return acc;
    };

    const Complex den = evaluate(tf.a);
    if (std::abs(den) == 0.0)
        return 0.0;
    return std::abs(evaluate(tf.b) / den);
}

} // namespace injsense::dsp
