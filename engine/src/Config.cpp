// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include "injsense/engine/Config.hpp"

namespace injsense::engine {

Config::Builder& Config::Builder::modelPath(std::filesystem::path path)
{
    _modelPath = std::move(path);
    return *this;
}

Config::Builder& Config::Builder::saveTrainedModel(bool enabled) noexcept
{
    _saveTrainedModel = enabled;
    return *this;
}

Config::Builder& Config::Builder::sampleRate(core::f64 hz) noexcept
{
    _filter.sampleRate = hz;
    return *this;
}

Config::Builder& Config::Builder::band(core::f64 lowHz, core::f64 highHz) noexcept
{
    _filter.lowHz = lowHz;
    _filter.highHz = highHz;
    return *this;
}

Config::Builder& Config::Builder::filterOrder(core::u32 order) noexcept
{
    _filter.order = order;
    return *this;
}

Config::Builder& Config::Builder::rmsWindowSize(core::usize samples) noexcept
{
    _rmsWindowSize = samples;
    return *this;
}

Config::Builder& Config::Builder::welchSegmentLength(core::usize samples) noexcept
{
    _spectral.segmentLength = samples;
    return *this;
}

Config::Builder& Config::Builder::fatigueMapping(const features::FatigueMapping& mapping) noexcept
{
    _spectral.mapping = mapping;
    return *this;
}

Config::Builder& Config::Builder::temperatureThresholds(const features::TemperatureThresholds& thresholds) noexcept
{
    _temperature = thresholds;
    return *this;
}

Config::Builder& Config::Builder::forest(const model::ForestConfig& config) noexcept
{
    _forest = config;
    return *this;
}

Config::Builder& Config::Builder::cohort(const model::CohortConfig& config) noexcept
{
    _cohort = config;
    return *this;
}

Config::Builder& Config::Builder::imputation(model::ImputationTable table)
{
    _imputation = std::move(table);
    return *this;
}

Config Config::Builder::build() const
{
    Config cfg;
    cfg._modelPath        = _modelPath;
    cfg._saveTrainedModel = _saveTrainedModel;
    cfg._filter           = _filter;
    cfg._rmsWindowSize    = _rmsWindowSize;
    cfg._spectral         = _spectral;
    cfg._temperature      = _temperature;
    cfg._forest           = _forest;
    cfg._cohort           = _cohort;
    cfg._imputation       = _imputation;
    return cfg;
}

} // namespace injsense::engine
