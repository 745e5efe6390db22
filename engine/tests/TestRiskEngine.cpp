/**
 * @file TestRiskEngine.cpp
 * @brief Unit tests for injsense::engine (Config, RiskEngine).
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "injsense/engine/RiskEngine.hpp"

#include "injsense/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <numbers>
#include <string>
#include <vector>

using namespace injsense;
using namespace injsense::engine;
using Catch::Matchers::WithinAbs;

namespace {

class CapturingLogger final : public core::ILogger {
public:
    void write(core::LogLevel level, std::string_view tag, std::string_view message) override
    {
        levels.push_back(level);
        lines.emplace_back(std::string(tag) + ":" + std::string(message));
    }

    std::vector<core::LogLevel> levels;
    std::vector<std::string> lines;
};

/// Installs a capturing sink for the lifetime of a test.
class ScopedLogger {
public:
    ScopedLogger() { core::Log::setLogger(&sink); }
    ~ScopedLogger() { core::Log::setLogger(nullptr); }

    bool saw(core::LogLevel level) const
    {
        return std::find(sink.levels.begin(), sink.levels.end(), level) != sink.levels.end();
    }

    CapturingLogger sink;
};

std::filesystem::path freshPath(const char *name)
{
    const auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path;
}

Config smallConfig(const std::filesystem::path &path)
{
    return Config::Builder{}
        .modelPath(path)
        .forest({ .treeCount = 20 })
        .cohort({ .sampleCount = 300 })
        .build();
}

std::vector<double> emg(double amplitude, std::size_t n = 2000)
{
    std::vector<double> x(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) / 1000.0;
        x[i] = amplitude * (std::sin(2.0 * std::numbers::pi * 80.0 * t) + 0.5 * std::sin(2.0 * std::numbers::pi * 150.0 * t));
    }
    return x;
}

SignalBundle bundle()
{
    return SignalBundle{
        .leftEmg     = emg(1.0),
        .rightEmg    = emg(0.5),
        .heartRate   = {72.0, 74.0, 78.0, 81.0},
        .temperature = {36.2, 36.4, 36.9, 37.1},
    };
}

} // namespace

TEST_CASE("Config::Builder defaults and overrides", "[engine][config]")
{
    const Config defaults = Config::Builder{}.build();
    REQUIRE(defaults.modelPath() == std::filesystem::path("injury_prediction_model.bin"));
    REQUIRE(defaults.filter().sampleRate == 1000.0);
    REQUIRE(defaults.filter().lowHz == 20.0);
    REQUIRE(defaults.filter().highHz == 450.0);
    REQUIRE(defaults.filter().order == 4);
    REQUIRE(defaults.rmsWindowSize() == 100);
    REQUIRE(defaults.spectral().segmentLength == 256);
    REQUIRE(defaults.forest().treeCount == 100);
    REQUIRE(defaults.forest().maxDepth == 10);
    REQUIRE(defaults.forest().seed == 42);
    REQUIRE(defaults.cohort().sampleCount == 1000);
    REQUIRE(defaults.imputation().defaultFor("training_load") == 60.0);
    REQUIRE(defaults.saveTrainedModel());

    const Config custom = Config::Builder{}
        .sampleRate(2000.0)
        .band(30.0, 500.0)
        .filterOrder(2)
        .rmsWindowSize(50)
        .welchSegmentLength(512)
        .imputation(model::ImputationTable{}.set("age", 30.0))
        .saveTrainedModel(false)
        .build();
    REQUIRE(custom.filter().sampleRate == 2000.0);
    REQUIRE(custom.filter().lowHz == 30.0);
    REQUIRE(custom.filter().order == 2);
    REQUIRE(custom.rmsWindowSize() == 50);
    REQUIRE(custom.spectral().segmentLength == 512);
    REQUIRE(custom.imputation().defaultFor("age") == 30.0);
    REQUIRE_FALSE(custom.imputation().defaultFor("training_load").has_value());
    REQUIRE_FALSE(custom.saveTrainedModel());
}

TEST_CASE("RiskEngine trains and saves when no artifact exists", "[engine][startup]")
{
    ScopedLogger log;
    const auto path = freshPath("injsense_engine_fallback.bin");

    auto engine = RiskEngine::create(smallConfig(path));
    REQUIRE(engine.has_value());
    REQUIRE(engine->model() != nullptr);
    REQUIRE(std::filesystem::exists(path));
    REQUIRE(log.saw(core::LogLevel::kWarn));

    SECTION("a second engine loads the saved artifact")
    {
        auto reloaded = RiskEngine::create(smallConfig(path));
        REQUIRE(reloaded.has_value());
        REQUIRE(reloaded->model()->toBytes().value() == engine->model()->toBytes().value());
    }

    std::filesystem::remove(path);
}

TEST_CASE("RiskEngine keeps running when the artifact cannot be saved", "[engine][startup]")
{
    ScopedLogger log;
    const auto path = std::filesystem::temp_directory_path() / "injsense_missing_dir" / "sub" / "model.bin";

    auto engine = RiskEngine::create(smallConfig(path));
    REQUIRE(engine.has_value());
    REQUIRE_FALSE(std::filesystem::exists(path));
    REQUIRE(log.saw(core::LogLevel::kError));
}

TEST_CASE("RiskEngine refuses a corrupted artifact", "[engine][startup]")
{
    ScopedLogger log;
    const auto path = freshPath("injsense_engine_corrupt.bin");
    {
        std::ofstream out(path, std::ios::binary);
        out << "definitely not a model";
    }

    auto engine = RiskEngine::create(smallConfig(path));
    REQUIRE_FALSE(engine.has_value());
    REQUIRE(engine.error().code() == core::ErrorCode::kCorruptedData);

    std::filesystem::remove(path);
}

TEST_CASE("RiskEngine rejects an invalid filter band", "[engine][startup]")
{
    const Config config = Config::Builder{}
        .modelPath(freshPath("injsense_engine_badband.bin"))
        .band(450.0, 20.0)
        .build();

    auto engine = RiskEngine::create(config);
    REQUIRE(engine.error().code() == core::ErrorCode::kInvalidFilterSpec);
}

TEST_CASE("RiskEngine rejects an unusable fatigue mapping", "[engine][startup]")
{
    const Config config = Config::Builder{}
        .modelPath(freshPath("injsense_engine_badmapping.bin"))
        .fatigueMapping({ .floorHz = 30.0, .spanHz = 0.0 })
        .build();

    auto engine = RiskEngine::create(config);
    REQUIRE(engine.error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE_FALSE(std::filesystem::exists(config.modelPath()));
}

TEST_CASE("RiskEngine assessments", "[engine][assess]")
{
    const auto path = freshPath("injsense_engine_assess.bin");
    auto engine = RiskEngine::create(smallConfig(path));
    REQUIRE(engine.has_value());

    model::AthleteRecord record;
    record.athleteId = "A-07";
    record.features = { {"training_load", 75.0}, {"recovery_time", 20.0}, {"semg_imbalance", 0.0} };
    record.age = 24.0;
    record.injuryHistory = {"ankle"};

    SECTION("record only")
    {
        auto a = engine->assess(record);
        REQUIRE(a.has_value());
        REQUIRE(a->riskScore >= 0);
        REQUIRE(a->riskScore <= 100);
        REQUIRE(a->riskFactors.size() == 8);
        REQUIRE(*a == engine->assess(record).value());
    }

    SECTION("derived signal features")
    {
        auto derived = engine->deriveSignalFeatures(bundle());
        REQUIRE(derived.has_value());
        REQUIRE(derived->semgImbalance.has_value());
        // Right side is the left side scaled by 0.5 and filtering is linear.
        REQUIRE_THAT(*derived->semgImbalance, WithinAbs(100.0 / 3.0, 1e-6));
        REQUIRE(*derived->muscleFatigue >= 0.0);
        REQUIRE(*derived->muscleFatigue <= 100.0);
        REQUIRE(derived->temperature.has_value());
        REQUIRE_FALSE(derived->temperature->abnormal);
    }

    SECTION("signal-derived values override the record")
    {
        const SignalBundle signals = bundle();
        auto withSignals = engine->assess(record, signals);
        REQUIRE(withSignals.has_value());

        const DerivedSignalFeatures derived = engine->deriveSignalFeatures(signals).value();
        model::AthleteRecord manual = record;
        manual.features["semg_imbalance"] = *derived.semgImbalance;
        manual.features["muscle_fatigue"] = *derived.muscleFatigue;
        manual.features["temperature_variation"] = derived.temperature->stdDeviation;

        REQUIRE(*withSignals == engine->assess(manual).value());
    }

    SECTION("temperature-only bundle")
    {
        SignalBundle signals;
        signals.temperature = {36.5, 36.6};
        auto derived = engine->deriveSignalFeatures(signals);
        REQUIRE(derived.has_value());
        REQUIRE_FALSE(derived->semgImbalance.has_value());
        REQUIRE(engine->assess(record, signals).has_value());
    }

    SECTION("errors from the signal path propagate")
    {
        SignalBundle signals = bundle();
        signals.rightEmg.resize(10);
        REQUIRE(engine->assess(record, signals).error().code() == core::ErrorCode::kInsufficientSamples);

        signals = bundle();
        signals.leftEmg[100] = std::nan("");
        REQUIRE(engine->assess(record, signals).error().code() == core::ErrorCode::kNonFiniteSample);
    }

    std::filesystem::remove(path);
}

TEST_CASE("RiskEngine low-level signal features", "[engine][features]")
{
    const auto path = freshPath("injsense_engine_features.bin");
    auto engine = RiskEngine::create(smallConfig(path));
    REQUIRE(engine.has_value());

    auto features = engine->extractSignalFeatures(bundle());
    REQUIRE(features.has_value());
    REQUIRE(features->size() == 15);
    REQUIRE(features->value("emg0_rms").value() > features->value("emg1_rms").value());
    REQUIRE_THAT(features->value("hr_delta").value(), WithinAbs(9.0, 1e-12));

    SignalBundle uneven = bundle();
    uneven.rightEmg.resize(1500);
    REQUIRE(engine->extractSignalFeatures(uneven).error().code() == core::ErrorCode::kInvalidArgument);

    std::filesystem::remove(path);
}

TEST_CASE("RiskEngine::withModel checks the schema", "[engine][startup]")
{
    const auto path = freshPath("injsense_engine_with_model.bin");
    auto trained = RiskEngine::create(smallConfig(path));
    REQUIRE(trained.has_value());

    auto shared = RiskEngine::withModel(Config::Builder{}.build(), trained->model());
    REQUIRE(shared.has_value());
    REQUIRE(shared->model() == trained->model());

    REQUIRE(RiskEngine::withModel(Config::Builder{}.build(), nullptr).error().code()
            == core::ErrorCode::kInvalidArgument);

    std::filesystem::remove(path);
}
