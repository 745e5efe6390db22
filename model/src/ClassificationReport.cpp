/**
 * @file ClassificationReport.cpp
 * @brief ClassificationReport implementation.
 */

#include "injsense/model/ClassificationReport.hpp"

#include <format>

namespace injsense::model {

namespace {

core::f64 ratio(core::usize num, core::usize den) noexcept
{
    return den == 0 ? 0.0 : static_cast<core::f64>(num) / static_cast<core::f64>(den);
}

} // namespace

core::Expected<ClassificationReport> ClassificationReport::compute(
    std::span<const core::u8> truth,
    std::span<const core::u8> predicted)
{
    if (truth.size() != predicted.size()) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("{} labels but {} predictions", truth.size(), predicted.size()));
    }
    if (truth.empty())
        return core::makeError(core::ErrorCode::kInsufficientSamples, "nothing to evaluate");

    // confusion[t][p]
    core::usize confusion[2][2] = {};
    for (core::usize i = 0; i < truth.size(); ++i)
        ++confusion[truth[i] != 0][predicted[i] != 0];

    ClassificationReport report;
    report.sampleCount = truth.size();
    report.accuracy = ratio(confusion[0][0] + confusion[1][1], truth.size());

    for (core::usize c = 0; c < 2; ++c) {
        const core::usize other = 1 - c;
        const core::usize truePositive = confusion[c][c];

        ClassMetrics &m = report.classes[c];
        m.support = confusion[c][c] + confusion[c][other];
        m.precision = ratio(truePositive, confusion[c][c] + confusion[other][c]);
        m.recall = ratio(truePositive, m.support);
        m.f1 = (m.precision + m.recall) > 0.0 ? 2.0 * m.precision * m.recall / (m.precision + m.recall) : 0.0;
    }
    return report;
}

std::string ClassificationReport::format() const
{
    std::string out = std::format("{:>8} {:>10} {:>10} {:>10} {:>10}\n", "class", "precision", "recall", "f1-score", "support");
    for (core::usize c = 0; c < classes.size(); ++c) {
        const ClassMetrics &m = classes[c];
        out += std::format("{:>8} {:>10.2f} {:>10.2f} {:>10.2f} {:>10}\n", c, m.precision, m.recall, m.f1, m.support);
    }
    out += std::format("{:>8} {:>32.2f} {:>10}", "accuracy", accuracy, sampleCount);
    return out;
}

} // namespace injsense::model
