/**
 * @file Butterworth.hpp
 * @brief Digital Butterworth band-pass design via the bilinear transform.
 *
 * Designs the filter the classical way: analog low-pass prototype poles,
 * frequency pre-warping, low-pass to band-pass transformation, bilinear
 * mapping to the z-plane, then expansion of zeros/poles/gain into
 * transfer-function polynomials.
 *
 * @see ZeroPhaseFilter, SignalFilter
 */

#pragma once

#include "injsense/core/Expected.hpp"
#include "injsense/core/Types.hpp"

#include <complex>
#include <vector>

namespace injsense::dsp {

/**
 * @brief Rational transfer function H(z) = B(z) / A(z), coefficients in
 *        descending powers of z with a[0] == 1.
 */
struct TransferFunction {
    std::vector<core::f64> b;
    std::vector<core::f64> a;

    /// @brief Number of coefficients of the longer polynomial.
    [[nodiscard]] core::usize length() const noexcept { return b.size() > a.size() ? b.size() : a.size(); }
};

/**
 * @brief Zeros, poles and gain of a filter.
 */
struct ZeroPoleGain {
    std::vector<std::complex<core::f64>> zeros;
    std::vector<std::complex<core::f64>> poles;
    core::f64 gain = 1.0;
};

class Butterworth {
public:
    Butterworth() = delete;

    /**
     * @brief Designs a digital band-pass filter.
     *
     * @param order    Prototype order N (the band-pass has order 2N)
     * @param lowNorm  Lower cutoff normalized to Nyquist, in (0, 1)
     * @param highNorm Upper cutoff normalized to Nyquist, in (lowNorm, 1)
     * @return Transfer function with 2N+1 coefficients, or kInvalidFilterSpec
     */
    [[nodiscard]] static core::Expected<TransferFunction> bandpass(
        core::u32 order,
        core::f64 lowNorm,
        core::f64 highNorm);

    /**
     * @brief Same design, stopping at the digital zero/pole/gain form.
     */
    [[nodiscard]] static core::Expected<ZeroPoleGain> bandpassZpk(
        core::u32 order,
        core::f64 lowNorm,
        core::f64 highNorm);

    /**
     * @brief Magnitude response |H(e^jw)| at a normalized frequency in [0, 1].
     */
    [[nodiscard]] static core::f64 magnitude(const TransferFunction &tf, core::f64 normFreq) noexcept;

private:
    [[nodiscard]] static std::vector<core::f64> expandPolynomial(
        const std::vector<std::complex<core::f64>> &roots);
};

} // namespace injsense::dsp
