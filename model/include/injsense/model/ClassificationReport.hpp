/**
 * @file ClassificationReport.hpp
 * @brief Hold-out accuracy and per-class precision, recall and F1.
 */

#pragma once

#include "injsense/core/Expected.hpp"
#include "injsense/core/Types.hpp"

#include <array>
#include <span>
#include <string>

namespace injsense::model {

struct ClassMetrics {
    core::f64 precision = 0.0;
    core::f64 recall    = 0.0;
    core::f64 f1        = 0.0;
    core::usize support = 0;
};

struct ClassificationReport {
    core::f64 accuracy = 0.0;
    std::array<ClassMetrics, 2> classes{};
    core::usize sampleCount = 0;

    /**
     * @brief Scores binary predictions against ground truth.
     *
     * A ratio with a zero denominator is reported as 0.
     *
     * @return kInvalidArgument when the spans differ in length,
     *         kInsufficientSamples when they are empty.
     */
    [[nodiscard]] static core::Expected<ClassificationReport> compute(
        std::span<const core::u8> truth,
        std::span<const core::u8> predicted);

    /// @brief Multi-line table, one row per class plus accuracy.
    [[nodiscard]] std::string format() const;
};

} // namespace injsense::model
