/**
 * @file PannerNode.hpp
 * @brief Positions a mono input in the listener's stereo/binaural field.
 *
 * Two panning models are available.  kEqualPower applies the Web Audio
 * equal-power law.  kHrtf approximates a head-related transfer function
 * with a spherical head: a Woodworth interaural time difference rendered
 * as a fractional per-ear delay, followed by a Brown-Duda single-pole
 * head-shadow filter per ear.  Both are followed by the distance and
 * cone gains of the Web Audio panner.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_PANNER_NODE_HPP
    #define ORB_GRAPH_PANNER_NODE_HPP

    #include <orb/graph/AudioNode.hpp>
    #include <orb/graph/AudioListener.hpp>
    #include <orb/core/Constants.hpp>
    #include <orb/math/Vec3.hpp>
    #include <orb/concurrency/SpinLock.hpp>

    #include <array>
    #include <vector>

namespace orb::graph {

enum class PanningModel : core::u8 {
    kEqualPower = 0,
    kHrtf
};

enum class DistanceModel : core::u8 {
    kLinear = 0,
    kInverse,
    kExponential
};

/** @brief Fixed source parameters of a panner. */
struct PannerOptions {
    PanningModel  panningModel{PanningModel::kHrtf};
    DistanceModel distanceModel{DistanceModel::kInverse};
    core::f32     refDistance{core::kPannerRefDistance};
    core::f32     maxDistance{core::kPannerMaxDistance};
    core::f32     rolloffFactor{core::kPannerRolloffFactor};
    core::f32     coneInnerAngle{core::kPannerConeInnerAngle};
    core::f32     coneOuterAngle{core::kPannerConeOuterAngle};
    core::f32     coneOuterGain{core::kPannerConeOuterGain};
    math::Vec3f   orientation{1.0f, 0.0f, 0.0f};
};

/** @brief Source direction in the listener frame, in degrees. */
struct SourceAngles {
    core::f32 azimuth{0.0f};   ///< -180..180, positive to the right.
    core::f32 elevation{0.0f}; ///< -90..90, positive upwards.
};

class PannerNode final : public AudioNode {
public:
    explicit PannerNode(AudioContext &context, const PannerOptions &options = {});

    void setPosition(const math::Vec3f &position);
    void setOrientation(const math::Vec3f &orientation);

    [[nodiscard]] math::Vec3f          position()    const;
    [[nodiscard]] math::Vec3f          orientation() const;
    [[nodiscard]] const PannerOptions &options()     const noexcept { return _options; }

    /**
     * @brief Clears the delay line and the head-shadow filter memory.
     *
     * Must be called with the context's graph lock held, as the render
     * thread owns this state while the node is pulled.
     */
    void reset();

    [[nodiscard]] static SourceAngles computeAngles(const ListenerPose &listener,
                                                    const math::Vec3f &source);
    [[nodiscard]] static core::f32 distanceGain(const PannerOptions &options, core::f32 distance);
    [[nodiscard]] static core::f32 coneGain(const PannerOptions &options,
                                            const ListenerPose &listener,
                                            const math::Vec3f &source,
                                            const math::Vec3f &orientation);

    /** @brief Equal-power {left, right} gains for an azimuth in degrees. */
    [[nodiscard]] static std::array<core::f32, 2> equalPowerGains(core::f32 azimuth);

protected:
    [[nodiscard]] core::u32 inputChannels()  const override { return 1; }
    [[nodiscard]] core::u32 outputChannels() const override { return 2; }

    void process(const AudioBus &in, AudioBus &out) override;

private:
    static constexpr core::usize kHistorySize = 256;
    static constexpr core::usize kHistoryMask = kHistorySize - 1;

    struct Ear {
        core::f32 delay{0.0f};
        core::f32 gain{1.0f};
        core::f32 b0{1.0f};
        core::f32 b1{0.0f};
        core::f32 a1{0.0f};
        core::f32 x1{0.0f};
        core::f32 y1{0.0f};
    };

    void processEqualPower(std::span<const float> in, AudioBus &out,
                           const SourceAngles &angles, core::f32 gain);
    void processHrtf(std::span<const float> in, AudioBus &out,
                     const SourceAngles &angles, core::f32 gain);

    const PannerOptions _options;
    const core::f32     _sampleRate;

    mutable concurrency::SpinLock _lock;
    math::Vec3f                   _position{0.0f, 0.0f, 0.0f};
    math::Vec3f                   _orientation;

    // render thread
    bool                     _primed{false};
    std::array<Ear, 2>       _ears{};
    std::vector<float>       _history;
    core::u64                _writePos{0};
};

} // namespace orb::graph

#endif // ORB_GRAPH_PANNER_NODE_HPP
