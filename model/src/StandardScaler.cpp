/**
 * @file StandardScaler.cpp
 * @brief StandardScaler implementation.
 */

#include "injsense/model/StandardScaler.hpp"
#include "injsense/serial/ByteStream.hpp"

#include "injsense/core/Assert.hpp"

#include <cmath>
#include <format>

namespace injsense::model {

core::ExpectedVoid StandardScaler::fit(const Eigen::MatrixXd &x)
{
    if (x.rows() == 0 || x.cols() == 0)
        return core::makeError(core::ErrorCode::kInsufficientSamples, "cannot fit a scaler on an empty matrix");

    _mean = x.colwise().mean().transpose();
    const Eigen::MatrixXd centered = x.rowwise() - _mean.transpose();
    const Eigen::VectorXd variance =
        (centered.array().square().colwise().sum().transpose() / static_cast<double>(x.rows())).matrix();

    _scale = variance.array().sqrt().matrix();
    for (Eigen::Index i = 0; i < _scale.size(); ++i) {
        if (_scale[i] == 0.0)
            _scale[i] = 1.0;
    }
    return {};
}

Eigen::MatrixXd StandardScaler::transform(const Eigen::MatrixXd &x) const
{
    INJSENSE_ASSERT(x.cols() == _mean.size());

    return ((x.rowwise() - _mean.transpose()).array().rowwise() / _scale.transpose().array()).matrix();
}

std::vector<core::f64> StandardScaler::transform(std::span<const core::f64> row) const
{
    INJSENSE_ASSERT(row.size() == featureCount());

    std::vector<core::f64> out(row.size());
    for (core::usize i = 0; i < row.size(); ++i) {
        const auto j = static_cast<Eigen::Index>(i);
        out[i] = (row[i] - _mean[j]) / _scale[j];
    }
    return out;
}

core::ExpectedVoid StandardScaler::serialize(serial::ByteStream &stream) const
{
    if (!fitted())
        return core::makeError(core::ErrorCode::kInvalidState, "scaler is not fitted");

    stream.writeF64Array({_mean.data(), static_cast<core::usize>(_mean.size())});
    stream.writeF64Array({_scale.data(), static_cast<core::usize>(_scale.size())});
    return {};
}

core::ExpectedVoid StandardScaler::deserialize(serial::ByteStream &stream)
{
    const std::vector<core::f64> mean = INJSENSE_TRY(stream.readF64Array());
    const std::vector<core::f64> scale = INJSENSE_TRY(stream.readF64Array());

    if (mean.empty() || mean.size() != scale.size()) {
        return core::makeError(core::ErrorCode::kCorruptedData,
            std::format("scaler has {} means and {} scales", mean.size(), scale.size()));
    }
    for (const core::f64 s : scale) {
        if (!(s > 0.0) || !std::isfinite(s))
            return core::makeError(core::ErrorCode::kCorruptedData, "scaler holds a non-positive scale");
    }

    _mean = Eigen::Map<const Eigen::VectorXd>(mean.data(), static_cast<Eigen::Index>(mean.size()));
    _scale = Eigen::Map<const Eigen::VectorXd>(scale.data(), static_cast<Eigen::Index>(scale.size()));
    return {};
}

} // namespace injsense::model
