// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Risk engine configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises every tuneable parameter of the signal pipeline and of the
/// fallback model training.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include "injsense/features/SpectralAnalyzer.hpp"
#include "injsense/features/TemperatureAnalyzer.hpp"
#include "injsense/model/ImputationTable.hpp"
#include "injsense/model/RandomForest.hpp"
#include "injsense/model/SyntheticCohort.hpp"
#include "injsense/dsp/SignalFilter.hpp"

#include "injsense/core/Constants.hpp"
#include "injsense/core/Types.hpp"

#include <filesystem>

namespace injsense::engine {

/// @brief Immutable risk engine configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& modelPath(std::filesystem::path path);
        Builder& saveTrainedModel(bool enabled) noexcept;
        Builder& sampleRate(core::f64 hz) noexcept;
        Builder& band(core::f64 lowHz, core::f64 highHz) noexcept;
        Builder& filterOrder(core::u32 order) noexcept;
        Builder& rmsWindowSize(core::usize samples) noexcept;
        Builder& welchSegmentLength(core::usize samples) noexcept;
        Builder& fatigueMapping(const features::FatigueMapping& mapping) noexcept;
        Builder& temperatureThresholds(const features::TemperatureThresholds& thresholds) noexcept;
        Builder& forest(const model::ForestConfig& config) noexcept;
        Builder& cohort(const model::CohortConfig& config) noexcept;
        Builder& imputation(model::ImputationTable table);

        [[nodiscard]] Config build() const;

    private:
        std::filesystem::path _modelPath{core::kDefaultModelPath};
        bool _saveTrainedModel{true};
        dsp::FilterSpec _filter{};
        core::usize _rmsWindowSize{core::kRmsWindowSize};
        features::SpectralAnalyzerConfig _spectral{};
        features::TemperatureThresholds _temperature{};
        model::ForestConfig _forest{};
        model::CohortConfig _cohort{};
        model::ImputationTable _imputation{model::ImputationTable::defaults()};
    };

    [[nodiscard]] const std::filesystem::path& modelPath() const noexcept { return _modelPath; }
    [[nodiscard]] bool saveTrainedModel() const noexcept { return _saveTrainedModel; }
    [[nodiscard]] const dsp::FilterSpec& filter() const noexcept { return _filter; }
    [[nodiscard]] core::usize rmsWindowSize() const noexcept { return _rmsWindowSize; }
    [[nodiscard]] const features::SpectralAnalyzerConfig& spectral() const noexcept { return _spectral; }
    [[nodiscard]] const features::TemperatureThresholds& temperatureThresholds() const noexcept { return _temperature; }
    [[nodiscard]] const model::ForestConfig& forest() const noexcept { return _forest; }
    [[nodiscard]] const model::CohortConfig& cohort() const noexcept { return _cohort; }
    [[nodiscard]] const model::ImputationTable& imputation() const noexcept { return _imputation; }

private:
    friend class Builder;

    Config() = default;

    std::filesystem::path _modelPath;
    bool _saveTrainedModel{true};
    dsp::FilterSpec _filter{};
    core::usize _rmsWindowSize{core::kRmsWindowSize};
    features::SpectralAnalyzerConfig _spectral{};
    features::TemperatureThresholds _temperature{};
    model::ForestConfig _forest{};
    model::CohortConfig _cohort{};
    model::ImputationTable _imputation;
};

} // namespace injsense::engine
