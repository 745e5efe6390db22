/**
 * @file Windowing.hpp
 * @brief Window functions applied to segments before spectral analysis.
 */

#pragma once

#include "injsense/core/Types.hpp"

#include <vector>

namespace injsense::dsp {

/**
 * @brief Hann (raised cosine) window coefficients.
 *
 * Symmetric:  w[n] = 0.5 * (1 - cos(2 pi n / (N - 1)))
 * Periodic:   w[n] = 0.5 * (1 - cos(2 pi n / N)), the form used for
 *             spectral estimation (DFT-even).
 *
 * @param size     Number of coefficients
 * @param periodic Selects the periodic variant
 */
[[nodiscard]] std::vector<core::f64> hannWindow(core::usize size, bool periodic = true);

} // namespace injsense::dsp
