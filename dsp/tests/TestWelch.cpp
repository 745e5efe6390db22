/**
 * @file TestWelch.cpp
 * @brief Unit tests for Fft, hannWindow and Welch.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "injsense/dsp/Fft.hpp"
#include "injsense/dsp/Welch.hpp"
#include "injsense/dsp/Windowing.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>
#include <vector>

using namespace injsense;
using namespace injsense::dsp;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("hannWindow periodic and symmetric forms", "[dsp][window]")
{
    const auto periodic = hannWindow(4, true);
    REQUIRE(periodic.size() == 4);
    REQUIRE_THAT(periodic[0], WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(periodic[1], WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(periodic[2], WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(periodic[3], WithinAbs(0.5, 1e-12));

    const auto symmetric = hannWindow(5, false);
    REQUIRE_THAT(symmetric[2], WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(symmetric[4], WithinAbs(0.0, 1e-12));
}

TEST_CASE("Fft radix-2 and direct paths agree with the DFT definition", "[dsp][fft]")
{
    for (const std::size_t n : {std::size_t{8}, std::size_t{6}}) {
        std::vector<double> x(n);
        for (std::size_t i = 0; i < n; ++i)
            x[i] = std::cos(0.7 * static_cast<double>(i)) + 0.1 * static_cast<double>(i);

        std::vector<Fft::Complex> buffer(x.begin(), x.end());
        Fft::forward(buffer);

        for (std::size_t k = 0; k < n; ++k) {
            Fft::Complex expected(0.0, 0.0);
            for (std::size_t t = 0; t < n; ++t) {
                const double angle = -2.0 * std::numbers::pi * static_cast<double>(k * t) / static_cast<double>(n);
                expected += x[t] * Fft::Complex(std::cos(angle), std::sin(angle));
            }
            REQUIRE_THAT(buffer[k].real(), WithinAbs(expected.real(), 1e-9));
            REQUIRE_THAT(buffer[k].imag(), WithinAbs(expected.imag(), 1e-9));
        }
    }
}

TEST_CASE("Fft::forwardReal returns the non-negative half", "[dsp][fft]")
{
    std::vector<double> impulse(16, 0.0);
    impulse[0] = 1.0;

    const auto bins = Fft::forwardReal(impulse);
    REQUIRE(bins.size() == 9);
    for (const auto &b : bins)
        REQUIRE_THAT(std::abs(b), WithinAbs(1.0, 1e-12));
}

TEST_CASE("Welch locates a tone and preserves its power", "[dsp][welch]")
{
    constexpr double fs = 1000.0;
    std::vector<double> x(2048);
    for (std::size_t i = 0; i < x.size(); ++i)
        x[i] = std::sin(2.0 * std::numbers::pi * 100.0 * static_cast<double>(i) / fs);

    auto psd = Welch::estimate(x, fs);
    REQUIRE(psd.has_value());
    REQUIRE(psd->binCount() == 129);
    REQUIRE_THAT(psd->frequencies.back(), WithinAbs(500.0, 1e-9));

    const auto peak = std::max_element(psd->power.begin(), psd->power.end()) - psd->power.begin();
    REQUIRE_THAT(psd->frequencies[static_cast<std::size_t>(peak)], WithinAbs(100.0, fs / 256.0));

    const double df = fs / 256.0;
    const double total = std::accumulate(psd->power.begin(), psd->power.end(), 0.0) * df;
    REQUIRE_THAT(total, WithinRel(0.5, 0.02));
}

TEST_CASE("Welch removes the segment mean", "[dsp][welch]")
{
    std::vector<double> offset(512, 3.0);
    auto psd = Welch::estimate(offset, 1000.0);
    REQUIRE(psd.has_value());
    for (const double p : psd->power)
        REQUIRE_THAT(p, WithinAbs(0.0, 1e-20));
}

TEST_CASE("Welch shrinks the segment for short signals", "[dsp][welch]")
{
    std::vector<double> x(100);
    for (std::size_t i = 0; i < x.size(); ++i)
        x[i] = std::sin(0.5 * static_cast<double>(i));

    auto psd = Welch::estimate(x, 1000.0);
    REQUIRE(psd.has_value());
    REQUIRE(psd->binCount() == 51);
    REQUIRE_THAT(psd->frequencies[1], WithinAbs(10.0, 1e-9));
}

TEST_CASE("Welch honours an explicit zero overlap", "[dsp][welch]")
{
    std::vector<double> burst(256);
    for (std::size_t i = 0; i < burst.size(); ++i)
        burst[i] = std::sin(2.0 * std::numbers::pi * 50.0 * static_cast<double>(i) / 1000.0);

    std::vector<double> x(512, 0.0);
    std::copy(burst.begin(), burst.end(), x.begin());

    auto single = Welch::estimate(burst, 1000.0, { .segmentLength = 256 });
    auto disjoint = Welch::estimate(x, 1000.0, { .segmentLength = 256, .overlap = 0 });
    REQUIRE(single.has_value());
    REQUIRE(disjoint.has_value());
    REQUIRE(disjoint->binCount() == single->binCount());

    // Two disjoint segments, the second silent: the average is half the burst.
    for (std::size_t k = 0; k < single->binCount(); ++k)
        REQUIRE_THAT(disjoint->power[k], WithinAbs(single->power[k] / 2.0, 1e-12));
}

TEST_CASE("Welch validates its arguments", "[dsp][welch]")
{
    const std::vector<double> one = {1.0};
    REQUIRE(Welch::estimate(one, 1000.0).error().code() == core::ErrorCode::kInsufficientSamples);

    const std::vector<double> x(300, 1.0);
    REQUIRE(Welch::estimate(x, 0.0).error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(Welch::estimate(x, 1000.0, { .segmentLength = 0 }).error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(Welch::estimate(x, 1000.0, { .segmentLength = 64, .overlap = 64 }).error().code()
            == core::ErrorCode::kInvalidArgument);
}
