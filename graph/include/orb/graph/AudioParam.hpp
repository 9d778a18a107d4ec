/**
 * @file AudioParam.hpp
 * @brief Sample-accurate automatable parameter (value + linear ramp).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_AUDIO_PARAM_HPP
    #define ORB_GRAPH_AUDIO_PARAM_HPP

    #include <orb/core/Types.hpp>
    #include <orb/core/NonCopyable.hpp>
    #include <orb/concurrency/SpinLock.hpp>

    #include <span>

namespace orb::graph {

/**
 * @brief Parameter written by the main thread and read by the render thread.
 *
 * Supports an immediate set and a single linear ramp towards a target.
 * A new ramp starts from the value reached so far, so retargeting an
 * in-flight ramp never jumps.  The ramp only advances while the context
 * renders.
 */
class AudioParam final : public core::NonCopyable<AudioParam> {
public:
    AudioParam(core::f32 defaultValue, core::f32 minValue, core::f32 maxValue);

    /** @brief Sets the value immediately, dropping any scheduled ramp. */
    void setValue(core::f32 value);

    /**
     * @brief Ramps linearly from the current value to @p target.
     * @param frames Ramp length in frames; zero behaves as setValue().
     */
    void linearRampTo(core::f32 target, core::u32 frames);

    /** @brief Freezes the parameter at its current value. */
    void cancelScheduledValues();

    [[nodiscard]] core::f32 value()       const;
    [[nodiscard]] core::f32 targetValue() const;
    [[nodiscard]] bool      isRamping()   const;

    [[nodiscard]] core::f32 minValue() const noexcept { return _min; }
    [[nodiscard]] core::f32 maxValue() const noexcept { return _max; }

    /**
     * @brief Writes one value per frame into @p out and advances the ramp.
     *
     * Render thread only.
     */
    void process(std::span<float> out);

private:
    [[nodiscard]] core::f32 clamp(core::f32 v) const noexcept;

    const core::f32 _min;
    const core::f32 _max;

    mutable concurrency::SpinLock _lock;
    core::f32 _value;
    core::f32 _target;
    core::f32 _step{0.0f};
    core::u32 _remaining{0};
};

} // namespace orb::graph

#endif // ORB_GRAPH_AUDIO_PARAM_HPP
