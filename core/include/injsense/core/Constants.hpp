/**
 * @file Constants.hpp
 * @brief Compile-time defaults for the signal processing and risk pipeline.
 *
 * Centralizes the physical and algorithmic parameters so that filters,
 * analyzers, the classifier and the engine configuration agree on them.
 * Runtime overrides go through engine::Config.
 *
 * @author InjSense Team
 * @version 0.1.0
 * @date 2026-10-16
 * @copyright MIT License
 */
#pragma once

#ifndef INJSENSE_CORE_CONSTANTS_HPP
    #define INJSENSE_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <string_view>

namespace injsense::core {

// ---- Acquisition ---------------------------------------------------------

inline constexpr f64   kDefaultSampleRate  = 1000.0;
inline constexpr f64   kEmgLowCutHz        = 20.0;
inline constexpr f64   kEmgHighCutHz       = 450.0;
inline constexpr u32   kButterworthOrder   = 4;

// ---- Feature extraction --------------------------------------------------

inline constexpr usize kRmsWindowSize      = 100;
inline constexpr usize kWelchSegmentLength = 256;

/// Median frequency mapped to a fatigue index of 100 (fully fatigued).
inline constexpr f64   kFatigueFloorHz     = 30.0;
/// Width of the healthy median-frequency range above the floor.
inline constexpr f64   kFatigueSpanHz      = 90.0;

inline constexpr f64   kTempStdAbnormal    = 0.5;
inline constexpr f64   kTempMaxAbnormal    = 38.0;

// ---- Risk scoring --------------------------------------------------------

inline constexpr i32   kHighRiskScore      = 60;
inline constexpr i32   kMediumRiskScore    = 30;

inline constexpr u32   kForestTreeCount    = 100;
inline constexpr u32   kForestMaxDepth     = 10;
inline constexpr u64   kDefaultSeed        = 42;

// ---- Model artifact ------------------------------------------------------

inline constexpr std::string_view kDefaultModelPath = "injury_prediction_model.bin";
inline constexpr u32 kModelMagic         = 0x534A4E49; // "INJS" little-endian
inline constexpr u16 kModelFormatVersion = 1;

} // namespace injsense::core

#endif // INJSENSE_CORE_CONSTANTS_HPP
