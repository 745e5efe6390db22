/**
 * @file ImputationTable.cpp
 * @brief ImputationTable implementation.
 */

#include "injsense/model/ImputationTable.hpp"

#include <format>

namespace injsense::model {

ImputationTable ImputationTable::defaults()
{
    ImputationTable table;
    table.set("semg_imbalance", 17.5)
         .set("muscle_fatigue", 50.0)
         .set("training_load", 60.0)
         .set("recovery_time", 30.0)
         .set("previous_injuries", 0.0)
         .set("temperature_variation", 0.8)
         .set("age", 26.0)
         .set("consecutive_games", 5.0);
    return table;
}

ImputationTable &ImputationTable::set(std::string name, core::f64 value)
{
    _defaults.insert_or_assign(std::move(name), value);
    return *this;
}

std::optional<core::f64> ImputationTable::defaultFor(std::string_view name) const
{
    const auto it = _defaults.find(name);
    if (it == _defaults.end())
        return std::nullopt;
    return it->second;
}

core::Expected<RiskFeatureVector> ImputationTable::assemble(
    const FeatureSchema &schema,
    const AthleteRecord &record,
    std::vector<std::string> *imputed) const
{
    std::vector<core::f64> values;
    values.reserve(schema.size());

    for (const std::string &name : schema.names()) {
        if (const auto it = record.features.find(name); it != record.features.end()) {
            values.push_back(it->second);
            continue;
        }

        if (imputed)
            imputed->push_back(name);

        if (name == "age" && record.age) {
            values.push_back(*record.age);
        } else if (name == "previous_injuries") {
            values.push_back(static_cast<core::f64>(record.injuryHistory.size()));
        } else if (const auto fallback = defaultFor(name)) {
            values.push_back(*fallback);
        } else {
            return core::makeError(core::ErrorCode::kSchemaMismatch,
                std::format("no value and no default for feature '{}'", name));
        }
    }

    return RiskFeatureVector::create(schema, std::move(values));
}

} // namespace injsense::model
