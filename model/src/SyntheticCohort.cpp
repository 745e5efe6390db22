/**
 * @file SyntheticCohort.cpp
 * @brief SyntheticCohort implementation.
 */

#include "injsense/model/SyntheticCohort.hpp"

#include "injsense/core/Assert.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <random>

namespace injsense::model {

SyntheticCohort::SyntheticCohort(const CohortConfig &config)
    : _config(config)
{
}

core::f64 SyntheticCohort::riskFormula(std::span<const core::f64> row) noexcept
{
    INJSENSE_ASSERT(row.size() == 8);

    return 0.3   * row[0] / 50.0
         + 0.2   * row[1] / 100.0
         + 0.15  * row[2] / 100.0
         + 0.15  * (72.0 - row[3]) / 72.0
         + 0.1   * row[4] / 5.0
         + 0.05  * row[5] / 3.0
         + 0.025 * (row[6] - 18.0) / 17.0
         + 0.025 * row[7] / 15.0;
}

core::Expected<TrainingSet> SyntheticCohort::generate() const
{
    if (_config.sampleCount == 0)
        return core::makeError(core::ErrorCode::kInsufficientSamples, "cohort needs at least one sample");

    std::mt19937_64 rng(_config.seed);
    std::uniform_real_distribution<core::f64> imbalance(0.0, 50.0);
    std::uniform_real_distribution<core::f64> percent(0.0, 100.0);
    std::uniform_real_distribution<core::f64> recovery(0.0, 72.0);
    std::uniform_int_distribution<int> injuries(0, 5);
    std::uniform_real_distribution<core::f64> tempVariation(0.0, 3.0);
    std::uniform_int_distribution<int> age(18, 35);
    std::uniform_int_distribution<int> games(0, 15);
    std::normal_distribution<core::f64> noise(0.0, _config.noiseStdDev);

    std::vector<std::vector<core::f64>> rows;
    std::vector<core::u8> labels;
    rows.reserve(_config.sampleCount);
    labels.reserve(_config.sampleCount);

    for (core::usize i = 0; i < _config.sampleCount; ++i) {
        std::vector<core::f64> row(8);
        row[0] = imbalance(rng);
        row[1] = percent(rng);
        row[2] = percent(rng);
        row[3] = recovery(rng);
        row[4] = injuries(rng);
        row[5] = tempVariation(rng);
        row[6] = age(rng);
        row[7] = games(rng);

        const core::f64 risk = std::clamp(riskFormula(row) + noise(rng), 0.0, 1.0);
        labels.push_back(risk > _config.labelThreshold ? 1 : 0);
        rows.push_back(std::move(row));
    }

    return TrainingSet::fromRows(FeatureSchema::injuryRisk(), rows, std::move(labels));
}

core::Expected<CohortSplit> SyntheticCohort::split(const TrainingSet &set) const
{
    const core::usize n = set.size();
    const auto holdoutCount = static_cast<core::usize>(std::ceil(_config.holdoutFraction * static_cast<core::f64>(n)));
    if (holdoutCount == 0 || holdoutCount >= n) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("cannot hold out {} of {} samples", holdoutCount, n));
    }

    std::vector<core::usize> order(n);
    std::iota(order.begin(), order.end(), core::usize{0});

    // Fisher-Yates on a stream independent of generate().
    std::mt19937_64 rng(_config.seed ^ 0x9E3779B97F4A7C15ULL);
    for (core::usize i = n - 1; i > 0; --i) {
        std::uniform_int_distribution<core::usize> pick(0, i);
        std::swap(order[i], order[pick(rng)]);
    }

    const std::vector<core::usize> holdout(order.begin(), order.begin() + static_cast<core::isize>(holdoutCount));
    const std::vector<core::usize> training(order.begin() + static_cast<core::isize>(holdoutCount), order.end());

    return CohortSplit{ .training = set.select(training), .holdout = set.select(holdout) };
}

core::Expected<CohortSplit> SyntheticCohort::generateSplit() const
{
    const TrainingSet set = INJSENSE_TRY(generate());
    return split(set);
}

} // namespace injsense::model
