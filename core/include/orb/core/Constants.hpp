/**
 * @file Constants.hpp
 * @brief Engine-wide compile-time defaults.
 *
 * Defaults for the rendering format, the panner geometry, and the timing
 * of repositioning and volume ramps.  Every value can be overridden at
 * runtime through engine::Config.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_CORE_CONSTANTS_HPP
    #define ORB_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace orb::core {

inline constexpr u32   kDefaultSampleRate        = 48'000;
inline constexpr u32   kRenderQuantum            = 128;
inline constexpr u32   kOutputChannels           = 2;

inline constexpr u32   kRepositionDebounceMs     = 50;
inline constexpr u32   kVolumeRampMs             = 10;

inline constexpr f32   kPannerRefDistance        = 1.0f;
inline constexpr f32   kPannerMaxDistance        = 10'000.0f;
inline constexpr f32   kPannerRolloffFactor      = 1.0f;
inline constexpr f32   kPannerConeInnerAngle     = 360.0f;
inline constexpr f32   kPannerConeOuterAngle     = 0.0f;
inline constexpr f32   kPannerConeOuterGain      = 0.0f;
inline constexpr f32   kPannerScale              = 1.0f;

/// Spherical head model (average adult head radius, speed of sound).
inline constexpr f32   kHeadRadiusMeters         = 0.0875f;
inline constexpr f32   kSpeedOfSound             = 343.0f;

inline constexpr usize kMediaStreamRingSlots     = 16'384;

inline constexpr f64   kPi                       = 3.14159265358979323846;

} // namespace orb::core

#endif // ORB_CORE_CONSTANTS_HPP
