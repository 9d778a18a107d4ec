/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/engine/Config.hpp>

#include <algorithm>

namespace orb::engine {

Config::Builder &Config::Builder::sampleRate(core::u32 hz) noexcept
{
    _sampleRate = hz;
    return *this;
}

Config::Builder &Config::Builder::blockSize(core::u32 frames) noexcept
{
    _blockSize = frames;
    return *this;
}

Config::Builder &Config::Builder::spatialEnabledByDefault(bool enabled) noexcept
{
    _spatialEnabledByDefault = enabled;
    return *this;
}

Config::Builder &Config::Builder::spatialToggleEnabled(bool enabled) noexcept
{
    _spatialToggleEnabled = enabled;
    return *this;
}

Config::Builder &Config::Builder::requireUserGesture(bool required) noexcept
{
    _requireUserGesture = required;
    return *this;
}

Config::Builder &Config::Builder::repositionDebounce(std::chrono::milliseconds debounce) noexcept
{
    _repositionDebounce = std::max(debounce, std::chrono::milliseconds::zero());
    return *this;
}

Config::Builder &Config::Builder::volumeRamp(std::chrono::milliseconds ramp) noexcept
{
    _volumeRamp = std::max(ramp, std::chrono::milliseconds::zero());
    return *this;
}

Config::Builder &Config::Builder::pannerScale(core::f32 scale) noexcept
{
    _pannerScale = scale;
    return *this;
}

Config::Builder &Config::Builder::panningModel(graph::PanningModel model) noexcept
{
    _panner.panningModel = model;
    return *this;
}

Config::Builder &Config::Builder::distanceModel(graph::DistanceModel model) noexcept
{
    _panner.distanceModel = model;
    return *this;
}

Config::Builder &Config::Builder::refDistance(core::f32 distance) noexcept
{
    _panner.refDistance = distance;
    return *this;
}

Config::Builder &Config::Builder::maxDistance(core::f32 distance) noexcept
{
    _panner.maxDistance = distance;
    return *this;
}

Config::Builder &Config::Builder::rolloffFactor(core::f32 factor) noexcept
{
    _panner.rolloffFactor = factor;
    return *this;
}

Config::Builder &Config::Builder::coneInnerAngle(core::f32 degrees) noexcept
{
    _panner.coneInnerAngle = degrees;
    return *this;
}

Config::Builder &Config::Builder::coneOuterAngle(core::f32 degrees) noexcept
{
    _panner.coneOuterAngle = degrees;
    return *this;
}

Config::Builder &Config::Builder::coneOuterGain(core::f32 gain) noexcept
{
    _panner.coneOuterGain = gain;
    return *this;
}

Config::Builder &Config::Builder::logLevel(core::LogLevel level) noexcept
{
    _logLevel = level;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg._sampleRate              = _sampleRate;
    cfg._blockSize               = _blockSize;
    cfg._spatialEnabledByDefault = _spatialEnabledByDefault;
    cfg._spatialToggleEnabled    = _spatialToggleEnabled;
    cfg._requireUserGesture      = _requireUserGesture;
    cfg._repositionDebounce      = _repositionDebounce;
    cfg._volumeRamp              = _volumeRamp;
    cfg._pannerScale             = _pannerScale;
    cfg._panner                  = _panner;
    cfg._logLevel                = _logLevel;
    return cfg;
}

core::u32 Config::volumeRampFrames() const noexcept
{
    return static_cast<core::u32>(static_cast<core::u64>(_sampleRate) * _volumeRamp.count() / 1000);
}

} // namespace orb::engine
