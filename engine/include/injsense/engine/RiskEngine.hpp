// /////////////////////////////////////////////////////////////////////////////
/// @file RiskEngine.hpp
/// @brief Top-level orchestrator: raw windows + athlete record -> risk.
///
/// Owns the filter, the feature analyzers and a shared, immutable
/// TrainedModel. create() loads the model artifact and, when none exists,
/// trains one on the synthetic cohort and writes it back.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include "injsense/engine/Config.hpp"

#include "injsense/features/ImbalanceAnalyzer.hpp"
#include "injsense/features/SignalFeatureVector.hpp"
#include "injsense/features/SpectralAnalyzer.hpp"
#include "injsense/features/TemperatureAnalyzer.hpp"
#include "injsense/features/WindowFeatureExtractor.hpp"
#include "injsense/model/AthleteRecord.hpp"
#include "injsense/model/RiskAssessment.hpp"
#include "injsense/model/TrainedModel.hpp"
#include "injsense/dsp/SignalFilter.hpp"

#include "injsense/core/Expected.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace injsense::engine {

/// @brief Raw windows captured for one athlete over one interval.
struct SignalBundle {
    std::vector<core::f64> leftEmg;
    std::vector<core::f64> rightEmg;
    std::vector<core::f64> heartRate;
    std::vector<core::f64> temperature;
};

/// @brief Classifier features derived from a SignalBundle.
struct DerivedSignalFeatures {
    std::optional<core::f64> semgImbalance;
    std::optional<core::f64> muscleFatigue;
    std::optional<features::TemperatureReport> temperature;
};

class RiskEngine final
{
public:
    /// @brief Loads or trains the model described by @p config.
    /// @return kInvalidFilterSpec for a bad band, or any load error other
    ///         than kModelNotFound.
    [[nodiscard]] static core::Expected<RiskEngine> create(Config config);

    /// @brief Builds an engine around an existing model.
    [[nodiscard]] static core::Expected<RiskEngine> withModel(Config config,
                                                              std::shared_ptr<const model::TrainedModel> model);

    /// @brief Scores one athlete.
    ///
    /// Values derived from @p signals (semg_imbalance, muscle_fatigue,
    /// temperature_variation) override those of @p record; features still
    /// missing are imputed from the configured table.
    [[nodiscard]] core::Expected<model::RiskAssessment> assess(
        const model::AthleteRecord& record,
        const std::optional<SignalBundle>& signals = std::nullopt) const;

    /// @brief Filters both EMG sides and derives the classifier features.
    ///
    /// The EMG pair is used when either side is non-empty; the temperature
    /// report when the temperature window is non-empty.
    [[nodiscard]] core::Expected<DerivedSignalFeatures> deriveSignalFeatures(const SignalBundle& signals) const;

    /// @brief Low-level vector of the filtered left/right EMG (two channels),
    ///        heart rate and temperature.
    [[nodiscard]] core::Expected<features::SignalFeatureVector> extractSignalFeatures(const SignalBundle& signals) const;

    [[nodiscard]] const Config& config() const noexcept { return _config; }
    [[nodiscard]] std::shared_ptr<const model::TrainedModel> model() const noexcept { return _model; }

private:
    RiskEngine(Config config, dsp::SignalFilter filter, std::shared_ptr<const model::TrainedModel> model);

    [[nodiscard]] static core::Expected<std::shared_ptr<const model::TrainedModel>> loadOrTrain(const Config& config);
    [[nodiscard]] core::Expected<std::vector<core::f64>> filterChannel(const std::vector<core::f64>& raw) const;

    Config _config;
    dsp::SignalFilter _filter;
    features::WindowFeatureExtractor _extractor;
    features::SpectralAnalyzer _spectral;
    features::ImbalanceAnalyzer _imbalance;
    features::TemperatureAnalyzer _temperature;
    std::shared_ptr<const model::TrainedModel> _model;
};

} // namespace injsense::engine
