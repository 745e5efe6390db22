/**
 * @file StandardScaler.hpp
 * @brief Per-feature standardisation to zero mean and unit variance.
 *
 * Fitted once on the training rows; inference only ever applies the stored
 * statistics. A feature with zero variance keeps a scale of 1.
 */

#pragma once

#include "injsense/serial/ISerializable.hpp"

#include "injsense/core/Expected.hpp"

#include <Eigen/Dense>

#include <span>
#include <vector>

namespace injsense::model {

class StandardScaler final : public serial::ISerializable {
public:
    /**
     * @brief Computes column means and population standard deviations.
     * @return kInsufficientSamples when @p x has no row.
     */
    [[nodiscard]] core::ExpectedVoid fit(const Eigen::MatrixXd &x);

    /// @brief Standardises every row of @p x.
    [[nodiscard]] Eigen::MatrixXd transform(const Eigen::MatrixXd &x) const;

    /// @brief Standardises one sample; @p row must hold featureCount() values.
    [[nodiscard]] std::vector<core::f64> transform(std::span<const core::f64> row) const;

    [[nodiscard]] bool fitted() const noexcept { return _mean.size() > 0; }
    [[nodiscard]] core::usize featureCount() const noexcept { return static_cast<core::usize>(_mean.size()); }
    [[nodiscard]] const Eigen::VectorXd &mean() const noexcept { return _mean; }
    [[nodiscard]] const Eigen::VectorXd &scale() const noexcept { return _scale; }

    [[nodiscard]] core::ExpectedVoid serialize(serial::ByteStream &stream) const override;
    [[nodiscard]] core::ExpectedVoid deserialize(serial::ByteStream &stream) override;

private:
    Eigen::VectorXd _mean;
    Eigen::VectorXd _scale;
};

} // namespace injsense::model
