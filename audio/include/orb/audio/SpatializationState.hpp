/**
 * @file SpatializationState.hpp
 * @brief Conference-wide spatial/mono switch.
 *
 * Read by every graph when it wires itself; written only by the
 * SpatializationModeController.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_AUDIO_SPATIALIZATION_STATE_HPP
    #define ORB_AUDIO_SPATIALIZATION_STATE_HPP

    #include <orb/core/NonCopyable.hpp>

    #include <atomic>

namespace orb::audio {

class SpatializationState final : public core::NonCopyable<SpatializationState> {
public:
    explicit SpatializationState(bool enabled = false) noexcept : _enabled{enabled} {}

    [[nodiscard]] bool enabled() const noexcept { return _enabled.load(std::memory_order_acquire); }

private:
    friend class SpatializationModeController;

    void set(bool enabled) noexcept { _enabled.store(enabled, std::memory_order_release); }

    std::atomic<bool> _enabled;
};

} // namespace orb::audio

#endif // ORB_AUDIO_SPATIALIZATION_STATE_HPP
