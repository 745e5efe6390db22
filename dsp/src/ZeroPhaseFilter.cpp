/**
 * @file ZeroPhaseFilter.cpp
 * @brief lfilter / steady-state / filtfilt implementation.
 */

#include "injsense/dsp/ZeroPhaseFilter.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <format>

namespace injsense::dsp {

namespace {

TransferFunction normalized(const TransferFunction &tf)
{
    const core::usize n = tf.length();
    TransferFunction out;
    out.b.assign(n, 0.0);
    out.a.assign(n, 0.0);
    std::copy(tf.b.begin(), tf.b.end(), out.b.begin());
    std::copy(tf.a.begin(), tf.a.end(), out.a.begin());

    const core::f64 a0 = out.a.front();
    for (core::f64 &c : out.b) c /= a0;
    for (core::f64 &c : out.a) c /= a0;
    return out;
}

} // namespace

std::vector<core::f64> ZeroPhaseFilter::lfilter(
    const TransferFunction &tf,
    std::span<const core::f64> input,
    std::span<const core::f64> state)
{
    const TransferFunction h = normalized(tf);
    const core::usize order = h.b.size() - 1;

    std::vector<core::f64> z(order, 0.0);
    if (!state.empty())
        std::copy_n(state.begin(), std::min(order, state.size()), z.begin());

    std::vector<core::f64> out;
    out.reserve(input.size());

    for (const core::f64 x : input) {
        const core::f64 y = h.b[0] * x + (order > 0 ? z[0] : 0.0);
        for (core::usize k = 1; k < order; ++k)
            z[k - 1] = h.b[k] * x + z[k] - h.a[k] * y;
        if (order > 0)
            z[order - 1] = h.b[order] * x - h.a[order] * y;
        out.push_back(y);
    }

    return out;
}

core::Expected<std::vector<core::f64>> ZeroPhaseFilter::steadyState(const TransferFunction &tf)
{
    if (tf.a.empty() || tf.a.front() == 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "leading denominator coefficient is zero");

    const TransferFunction h = normalized(tf);
    const auto order = static_cast<Eigen::Index>(h.b.size() - 1);
    if (order == 0)
        return std::vector<core::f64>{};

    // I - A^T, where A^T has -a[1:] in its first column and ones on the
    // superdiagonal.
    Eigen::MatrixXd system = Eigen::MatrixXd::Identity(order, order);
    Eigen::VectorXd rhs(order);
    for (Eigen::Index i = 0; i < order; ++i) {
        const auto k = static_cast<core::usize>(i + 1);
        system(i, 0) += h.a[k];
        if (i + 1 < order)
            system(i, i + 1) -= 1.0;
        rhs(i) = h.b[k] - h.a[k] * h.b[0];
    }

    const Eigen::FullPivLU<Eigen::MatrixXd> lu(system);
    if (!lu.isInvertible())
        return core::makeError(core::ErrorCode::kInvalidFilterSpec, "filter has no steady state (singular system)");

    const Eigen::VectorXd zi = lu.solve(rhs);
    return std::vector<core::f64>(zi.data(), zi.data() + zi.size());
}

core::usize ZeroPhaseFilter::padLength(const TransferFunction &tf) noexcept
{
    return 3 * tf.length();
}

core::Expected<std::vector<core::f64>> ZeroPhaseFilter::filtfilt(
    const TransferFunction &tf,
    std::span<const core::f64> input)
{
    const core::usize pad = padLength(tf);
    if (input.size() <= pad) {
        return core::makeError(core::ErrorCode::kInsufficientSamples,
            std::format("zero-phase filtering needs more than {} samples, got {}", pad, input.size()));
    }

    const std::vector<core::f64> zi = INJSENSE_TRY(steadyState(tf));

    // Odd extension: 2*x[0] - x[pad..1] | x | 2*x[n-1] - x[n-2..n-pad-1]
    const core::usize n = input.size();
    std::vector<core::f64> extended;
    extended.reserve(n + 2 * pad);
    for (core::usize i = pad; i >= 1; --i)
        extended.push_back(2.0 * input.front() - input[i]);
    extended.insert(extended.end(), input.begin(), input.end());
    for (core::usize i = 2; i <= pad + 1; ++i)
        extended.push_back(2.0 * input.back() - input[n - i]);

    std::vector<core::f64> state(zi.size());

    std::transform(zi.begin(), zi.end(), state.begin(),
                   [x0 = extended.front()](core::f64 z) { return z * x0; });
    std::vector<core::f64> forward = lfilter(tf, extended, state);

    std::reverse(forward.begin(), forward.end());
    std::transform(zi.begin(), zi.end(), state.begin(),
                   [y0 = forward.front()](core::f64 z) { return z * y0; });
    std::vector<core::f64> backward = lfilter(tf, forward, state);
    std::reverse(backward.begin(), backward.end());

    return std::vector<core::f64>(
        backward.begin() + static_cast<core::isize>(pad),
        backward.end() - static_cast<core::isize>(pad));
}

} // namespace injsense::dsp
