/**
 * @file Config.hpp
 * @brief Engine configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_ENGINE_CONFIG_HPP
    #define ORB_ENGINE_CONFIG_HPP

    #include <orb/core/Types.hpp>
    #include <orb/core/Constants.hpp>
    #include <orb/core/Log.hpp>
    #include <orb/graph/PannerNode.hpp>

    #include <chrono>

namespace orb::engine {

/** @brief Immutable engine configuration. */
class Config {
public:
    /** @brief Fluent builder for Config. */
    class Builder {
    public:
        Builder &sampleRate(core::u32 hz) noexcept;
        Builder &blockSize(core::u32 frames) noexcept;
        Builder &spatialEnabledByDefault(bool enabled) noexcept;
        Builder &spatialToggleEnabled(bool enabled) noexcept;
        Builder &requireUserGesture(bool required) noexcept;
        Builder &repositionDebounce(std::chrono::milliseconds debounce) noexcept;
        Builder &volumeRamp(std::chrono::milliseconds ramp) noexcept;
        Builder &pannerScale(core::f32 scale) noexcept;
        Builder &panningModel(graph::PanningModel model) noexcept;
        Builder &distanceModel(graph::DistanceModel model) noexcept;
        Builder &refDistance(core::f32 distance) noexcept;
        Builder &maxDistance(core::f32 distance) noexcept;
        Builder &rolloffFactor(core::f32 factor) noexcept;
        Builder &coneInnerAngle(core::f32 degrees) noexcept;
        Builder &coneOuterAngle(core::f32 degrees) noexcept;
        Builder &coneOuterGain(core::f32 gain) noexcept;
        Builder &logLevel(core::LogLevel level) noexcept;

        [[nodiscard]] Config build() const noexcept;

    private:
        core::u32                 _sampleRate{core::kDefaultSampleRate};
        core::u32                 _blockSize{core::kRenderQuantum};
        bool                      _spatialEnabledByDefault{false};
        bool                      _spatialToggleEnabled{true};
        bool                      _requireUserGesture{true};
        std::chrono::milliseconds _repositionDebounce{core::kRepositionDebounceMs};
        std::chrono::milliseconds _volumeRamp{core::kVolumeRampMs};
        core::f32                 _pannerScale{core::kPannerScale};
        graph::PannerOptions      _panner{};
        core::LogLevel            _logLevel{core::LogLevel::kInfo};
    };

    [[nodiscard]] core::u32                 sampleRate()              const noexcept { return _sampleRate; }
    [[nodiscard]] core::u32                 blockSize()               const noexcept { return _blockSize; }
    [[nodiscard]] bool                      spatialEnabledByDefault() const noexcept { return _spatialEnabledByDefault; }
    [[nodiscard]] bool                      spatialToggleEnabled()    const noexcept { return _spatialToggleEnabled; }
    [[nodiscard]] bool                      requireUserGesture()      const noexcept { return _requireUserGesture; }
    [[nodiscard]] std::chrono::milliseconds repositionDebounce()      const noexcept { return _repositionDebounce; }
    [[nodiscard]] std::chrono::milliseconds volumeRamp()              const noexcept { return _volumeRamp; }
    [[nodiscard]] core::f32                 pannerScale()             const noexcept { return _pannerScale; }
    [[nodiscard]] const graph::PannerOptions &panner()                const noexcept { return _panner; }
    [[nodiscard]] core::LogLevel            logLevel()                const noexcept { return _logLevel; }

    /** @brief Volume ramp expressed in frames at the configured rate. */
    [[nodiscard]] core::u32 volumeRampFrames() const noexcept;

private:
    friend class Builder;

    core::u32                 _sampleRate{core::kDefaultSampleRate};
    core::u32                 _blockSize{core::kRenderQuantum};
    bool                      _spatialEnabledByDefault{false};
    bool                      _spatialToggleEnabled{true};
    bool                      _requireUserGesture{true};
    std::chrono::milliseconds _repositionDebounce{core::kRepositionDebounceMs};
    std::chrono::milliseconds _volumeRamp{core::kVolumeRampMs};
    core::f32                 _pannerScale{core::kPannerScale};
    graph::PannerOptions      _panner{};
    core::LogLevel            _logLevel{core::LogLevel::kInfo};
};

} // namespace orb::engine

#endif // ORB_ENGINE_CONFIG_HPP
