/**
 * @file Fft.hpp
 * @brief In-place discrete Fourier transform of complex sequences.
 *
 * Power-of-two sizes use the Cooley-Tukey radix-2 decimation-in-time
 * algorithm with bit-reversal permutation. Other sizes (short windows for
 * which the Welch segment shrinks to the window length) fall back to a
 * direct O(N^2) evaluation.
 *
 * @see Welch
 */

#pragma once

#include "injsense/core/Types.hpp"

#include <complex>
#include <vector>

namespace injsense::dsp {

class Fft {
public:
    using Complex = std::complex<core::f64>;

    Fft() = delete;

    /**
     * @brief Replaces @p x by its forward DFT, X[k] = sum x[n] e^{-2 pi i k n / N}.
     */
    static void forward(std::vector<Complex> &x);

    /**
     * @brief DFT of a real sequence, bins 0..N/2 inclusive.
     */
    [[nodiscard]] static std::vector<Complex> forwardReal(const std::vector<core::f64> &x);

private:
    static void bitReversalPermutation(std::vector<Complex> &x);
    static void butterflyPass(std::vector<Complex> &x);
    static void direct(std::vector<Complex> &x);
};

} // namespace injsense::dsp
