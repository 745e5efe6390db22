/**
 * @file TrainedModel.cpp
 * @brief TrainedModel inference and artifact persistence.
 */

#include "injsense/model/TrainedModel.hpp"

#include "injsense/serial/ByteStream.hpp"
#include "injsense/math/StateHash.hpp"

#include "injsense/core/Constants.hpp"
#include "injsense/core/Log.hpp"

#include <algorithm>
#include <format>
#include <fstream>

namespace injsense::model {

namespace {

constexpr core::usize kHeaderBytes   = sizeof(core::u32) + sizeof(core::u16);
constexpr core::usize kChecksumBytes = sizeof(core::u64);

constexpr const char *kTag = "TrainedModel";

} // namespace

TrainedModel::TrainedModel(FeatureSchema schema, StandardScaler scaler, RandomForest forest)
    : _schema(std::move(schema)), _scaler(std::move(scaler)), _forest(std::move(forest))
{
}

core::Expected<core::f64> TrainedModel::probability(const RiskFeatureVector &features) const
{
    if (features.schema() != _schema) {
        return core::makeError(core::ErrorCode::kSchemaMismatch,
            std::format("feature vector has {} features, model was trained on {}",
                        features.size(), _schema.size()));
    }

    const std::vector<core::f64> scaled = _scaler.transform(features.values());
    return _forest.predictProbability(scaled);
}

std::vector<core::f64> TrainedModel::probabilities(const Eigen::MatrixXd &x) const
{
    const Eigen::MatrixXd scaled = _scaler.transform(x);

    std::vector<core::f64> out;
    out.reserve(static_cast<core::usize>(scaled.rows()));

    std::vector<core::f64> row(static_cast<core::usize>(scaled.cols()));
    for (Eigen::Index r = 0; r < scaled.rows(); ++r) {
        for (Eigen::Index c = 0; c < scaled.cols(); ++c)
            row[static_cast<core::usize>(c)] = scaled(r, c);
        out.push_back(_forest.predictProbability(row));
    }
    return out;
}

std::vector<RiskFactor> TrainedModel::riskFactors() const
{
    const std::vector<core::f64> &importances = _forest.featureImportances();

    std::vector<RiskFactor> factors;
    factors.reserve(_schema.size());
    for (core::usize i = 0; i < _schema.size() && i < importances.size(); ++i)
        factors.push_back({ .name = _schema.name(i), .importance = importances[i] });

    std::stable_sort(factors.begin(), factors.end(),
        [](const RiskFactor &a, const RiskFactor &b) { return a.importance > b.importance; });
    return factors;
}

// ========================================================================== //
//  Serialisation                                                             //
// ========================================================================== //

core::ExpectedVoid TrainedModel::serialize(serial::ByteStream &stream) const
{
    if (_schema.empty())
        return core::makeError(core::ErrorCode::kInvalidState, "model has no schema");

    stream.writeU32(core::kModelMagic);
    stream.writeU16(core::kModelFormatVersion);

    stream.writeU32(static_cast<core::u32>(_schema.size()));
    for (const std::string &name : _schema.names())
        stream.writeString(name);

    INJSENSE_TRY_VOID(_scaler.serialize(stream));
    INJSENSE_TRY_VOID(_forest.serialize(stream));
    return {};
}

core::ExpectedVoid TrainedModel::deserialize(serial::ByteStream &stream)
{
    const core::u32 magic = INJSENSE_TRY(stream.readU32());
    if (magic != core::kModelMagic)
        return core::makeError(core::ErrorCode::kCorruptedData, std::format("bad magic 0x{:08X}", magic));

    const core::u16 version = INJSENSE_TRY(stream.readU16());
    if (version != core::kModelFormatVersion) {
        return core::makeError(core::ErrorCode::kVersionMismatch,
            std::format("artifact format version {}, expected {}", version, core::kModelFormatVersion));
    }

    const core::u32 featureCount = INJSENSE_TRY(stream.readU32());
    if (featureCount == 0 || featureCount > stream.bytesRemaining())
        return core::makeError(core::ErrorCode::kCorruptedData, std::format("invalid feature count {}", featureCount));

    std::vector<std::string> names;
    names.reserve(featureCount);
    for (core::u32 i = 0; i < featureCount; ++i)
        names.push_back(INJSENSE_TRY(stream.readString()));

    StandardScaler scaler;
    INJSENSE_TRY_VOID(scaler.deserialize(stream));

    RandomForest forest;
    INJSENSE_TRY_VOID(forest.deserialize(stream));

    if (scaler.featureCount() != featureCount || forest.featureCount() != featureCount) {
        return core::makeError(core::ErrorCode::kCorruptedData,
            std::format("schema has {} features, scaler {}, forest {}",
                        featureCount, scaler.featureCount(), forest.featureCount()));
    }

    _schema = FeatureSchema(std::move(names));
    _scaler = std::move(scaler);
    _forest = std::move(forest);
    return {};
}

core::Expected<std::vector<core::byte>> TrainedModel::toBytes() const
{
    serial::ByteStream stream;
    INJSENSE_TRY_VOID(serialize(stream));

    math::StateHash hash;
    hash.hashBytes(stream.data());
    stream.writeU64(hash.digest());

    const auto bytes = stream.data();
    return std::vector<core::byte>(bytes.begin(), bytes.end());
}

core::Expected<std::shared_ptr<const TrainedModel>> TrainedModel::fromBytes(
    std::span<const core::byte> bytes,
    const FeatureSchema &expected)
{
    if (bytes.size() < kHeaderBytes + kChecksumBytes)
        return core::makeError(core::ErrorCode::kCorruptedData, std::format("artifact is only {} bytes", bytes.size()));

    // Magic and version are checked before the checksum.
    serial::ByteStream header(bytes.first(kHeaderBytes));
    const core::u32 magic = INJSENSE_TRY(header.readU32());
    if (magic != core::kModelMagic)
        return core::makeError(core::ErrorCode::kCorruptedData, std::format("bad magic 0x{:08X}", magic));
    const core::u16 version = INJSENSE_TRY(header.readU16());
    if (version != core::kModelFormatVersion) {
        return core::makeError(core::ErrorCode::kVersionMismatch,
            std::format("artifact format version {}, expected {}", version, core::kModelFormatVersion));
    }

    const auto payload = bytes.first(bytes.size() - kChecksumBytes);
    serial::ByteStream trailer(bytes.last(kChecksumBytes));
    const core::u64 stored = INJSENSE_TRY(trailer.readU64());

    math::StateHash hash;
    hash.hashBytes(payload);
    if (hash.digest() != stored) {
        return core::makeError(core::ErrorCode::kCorruptedData,
            std::format("checksum mismatch: stored {:016x}, computed {:016x}", stored, hash.digest()));
    }

    auto model = std::make_shared<TrainedModel>();
    serial::ByteStream body(payload);
    INJSENSE_TRY_VOID(model->deserialize(body));
    if (body.bytesRemaining() != 0) {
        return core::makeError(core::ErrorCode::kCorruptedData,
            std::format("{} unexpected bytes after the model body", body.bytesRemaining()));
    }

    if (model->schema() != expected) {
        return core::makeError(core::ErrorCode::kSchemaMismatch,
            std::format("artifact schema has {} features, expected {}", model->schema().size(), expected.size()));
    }

    return std::shared_ptr<const TrainedModel>(std::move(model));
}

core::ExpectedVoid TrainedModel::save(const std::filesystem::path &path) const
{
    const std::vector<core::byte> bytes = INJSENSE_TRY(toBytes());

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        return core::makeError(core::ErrorCode::kIoError, std::format("cannot open {} for writing", path.string()));

    file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file)
        return core::makeError(core::ErrorCode::kIoError, std::format("failed to write {}", path.string()));

    core::Log::info(kTag, std::format("saved model ({} bytes) to {}", bytes.size(), path.string()));
    return {};
}

core::Expected<std::shared_ptr<const TrainedModel>> TrainedModel::load(
    const std::filesystem::path &path,
    const FeatureSchema &expected)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return core::makeError(core::ErrorCode::kModelNotFound, std::format("no model artifact at {}", path.string()));

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open())
        return core::makeError(core::ErrorCode::kIoError, std::format("cannot open {}", path.string()));

    const auto size = static_cast<core::usize>(file.tellg());
    std::vector<core::byte> bytes(size);
    file.seekg(0);
    file.read(reinterpret_cast<char *>(bytes.data()), static_cast<std::streamsize>(size));
    if (!file)
        return core::makeError(core::ErrorCode::kIoError, std::format("failed to read {}", path.string()));

    auto model = INJSENSE_TRY(fromBytes(bytes, expected));
    core::Log::info(kTag, std::format("loaded model from {} ({} trees)", path.string(), model->forest().trees().size()));
    return model;
}

} // namespace injsense::model
