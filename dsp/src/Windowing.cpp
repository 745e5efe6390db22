/**
 * @file Windowing.cpp
 * @brief Implementation of the Hann window.
 */

#include "injsense/dsp/Windowing.hpp"

#include <cmath>
#include <numbers>

namespace injsense::dsp {

std::vector<core::f64> hannWindow(core::usize size, bool periodic)
{
    if (size == 0)
        return {};
    if (size == 1)
        return {1.0};

    const auto denom = static_cast<core::f64>(periodic ? size : size - 1);

    std::vector<core::f64> coefficients(size);
    for (core::usize i = 0; i < size; ++i) {
        coefficients[i] = 0.5 * (1.0 - std::cos(
            2.0 * std::numbers::pi * static_cast<core::f64>(i) / denom));
    }
    return coefficients;
}

} // namespace injsense::dsp
