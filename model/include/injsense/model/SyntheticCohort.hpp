/**
 * @file SyntheticCohort.hpp
 * @brief Reproducible synthetic training data for the fallback model.
 *
 * Features are drawn uniformly over plausible ranges and labelled with a
 * weighted risk formula plus Gaussian noise:
 *
 *   risk = 0.3   * imbalance / 50
 *        + 0.2   * fatigue / 100
 *        + 0.15  * load / 100
 *        + 0.15  * (72 - recovery) / 72
 *        + 0.1   * injuries / 5
 *        + 0.05  * tempVariation / 3
 *        + 0.025 * (age - 18) / 17
 *        + 0.025 * games / 15
 *        + N(0, noise)
 *
 * clamped to [0, 1]; label = risk > labelThreshold. Every term is
 * normalised, so the noise-free risk spans [0, 1].
 */

#pragma once

#include "injsense/model/TrainingSet.hpp"

#include "injsense/core/Constants.hpp"
#include "injsense/core/Expected.hpp"

#include <span>

namespace injsense::model {

struct CohortConfig {
    core::usize sampleCount   = 1000;
    core::u64 seed            = core::kDefaultSeed;
    core::f64 noiseStdDev     = 0.1;
    core::f64 labelThreshold  = 0.35;
    core::f64 holdoutFraction = 0.2;
};

struct CohortSplit {
    TrainingSet training;
    TrainingSet holdout;
};

class SyntheticCohort {
public:
    explicit SyntheticCohort(const CohortConfig &config = {});

    /**
     * @brief Draws config().sampleCount labelled rows over
     *        FeatureSchema::injuryRisk().
     * @return kInsufficientSamples when sampleCount is 0.
     */
    [[nodiscard]] core::Expected<TrainingSet> generate() const;

    /**
     * @brief Shuffles @p set and holds out ceil(holdoutFraction * n) rows.
     * @return kInvalidArgument unless both parts end up non-empty.
     */
    [[nodiscard]] core::Expected<CohortSplit> split(const TrainingSet &set) const;

    /// @brief generate() followed by split().
    [[nodiscard]] core::Expected<CohortSplit> generateSplit() const;

    /// @brief Noise-free risk of one row laid out as FeatureSchema::injuryRisk().
    [[nodiscard]] static core::f64 riskFormula(std::span<const core::f64> row) noexcept;

    [[nodiscard]] const CohortConfig &config() const noexcept { return _config; }

private:
    CohortConfig _config;
};

} // namespace injsense::model
