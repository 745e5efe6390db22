/**
 * @file TrainedModel.hpp
 * @brief Fitted scaler and forest bound to the schema they were trained on.
 *
 * A TrainedModel is immutable once built and is shared as
 * std::shared_ptr<const TrainedModel>; every query is const and allocates
 * its own scratch, so concurrent predictions on one instance are safe.
 *
 * Artifact layout (little-endian):
 *   u32 magic "INJS" | u16 format version | schema (u32 count, names) |
 *   scaler (means, scales) | forest | u64 FNV-1a of all preceding bytes
 */

#pragma once

#include "injsense/model/FeatureSchema.hpp"
#include "injsense/model/RandomForest.hpp"
#include "injsense/model/RiskAssessment.hpp"
#include "injsense/model/RiskFeatureVector.hpp"
#include "injsense/model/StandardScaler.hpp"

#include "injsense/serial/ISerializable.hpp"

#include "injsense/core/Expected.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace injsense::model {

class TrainedModel final : public serial::ISerializable {
public:
    TrainedModel() = default;
    TrainedModel(FeatureSchema schema, StandardScaler scaler, RandomForest forest);

    [[nodiscard]] const FeatureSchema &schema() const noexcept { return _schema; }
    [[nodiscard]] const StandardScaler &scaler() const noexcept { return _scaler; }
    [[nodiscard]] const RandomForest &forest() const noexcept { return _forest; }

    /**
     * @brief Class-1 probability of @p features.
     * @return kSchemaMismatch when the vector was built for another schema.
     */
    [[nodiscard]] core::Expected<core::f64> probability(const RiskFeatureVector &features) const;

    /// @brief Class-1 probability of every row of an unscaled matrix.
    [[nodiscard]] std::vector<core::f64> probabilities(const Eigen::MatrixXd &x) const;

    /// @brief Named feature importances, descending.
    [[nodiscard]] std::vector<RiskFactor> riskFactors() const;

    /**
     * @brief Writes the artifact to @p path.
     * @return kIoError when the file cannot be written.
     */
    [[nodiscard]] core::ExpectedVoid save(const std::filesystem::path &path) const;

    /**
     * @brief Reads an artifact and checks it against @p expected.
     *
     * @return kModelNotFound when @p path does not exist, kIoError when it
     *         cannot be read, kCorruptedData for a bad magic, checksum or
     *         body, kVersionMismatch for another format version, and
     *         kSchemaMismatch when the stored schema differs from @p expected.
     */
    [[nodiscard]] static core::Expected<std::shared_ptr<const TrainedModel>> load(
        const std::filesystem::path &path,
        const FeatureSchema &expected);

    /// @brief Parses an in-memory artifact; same errors as load().
    [[nodiscard]] static core::Expected<std::shared_ptr<const TrainedModel>> fromBytes(
        std::span<const core::byte> bytes,
        const FeatureSchema &expected);

    /// @brief Serialises the artifact, checksum included.
    [[nodiscard]] core::Expected<std::vector<core::byte>> toBytes() const;

    /// @brief Writes magic, version, schema, scaler and forest (no checksum).
    [[nodiscard]] core::ExpectedVoid serialize(serial::ByteStream &stream) const override;
    [[nodiscard]] core::ExpectedVoid deserialize(serial::ByteStream &stream) override;

private:
    FeatureSchema _schema;
    StandardScaler _scaler;
    RandomForest _forest;
};

} // namespace injsense::model
