/**
 * @file SpatializationModeController.hpp
 * @brief Switches the whole conference between spatial and mono playback.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_AUDIO_SPATIALIZATION_MODE_CONTROLLER_HPP
    #define ORB_AUDIO_SPATIALIZATION_MODE_CONTROLLER_HPP

    #include <orb/audio/SpatialPositionIndex.hpp>
    #include <orb/audio/SpatializationState.hpp>
    #include <orb/core/Expected.hpp>
    #include <orb/core/NonCopyable.hpp>

    #include <functional>
    #include <mutex>
    #include <utility>
    #include <vector>

namespace orb::audio {

using StateChangedCallback = std::function<void(bool enabled)>;
using SubscriptionId       = core::u64;

struct ModeOptions {
    /// When false the UI toggle is hidden and toggle() is rejected.
    bool toggleEnabled{true};
};

/**
 * @brief Sole writer of the SpatializationState.
 *
 * A pass flips the state and rewires every live graph.  Passes are
 * serialized: a second request waits until the first has rewired all
 * graphs.  Subscribers are notified after the pass completes, outside of
 * any lock, and only when the state actually changed.
 */
class SpatializationModeController final : public core::NonCopyable<SpatializationModeController> {
public:
    SpatializationModeController(SpatializationState &state, SpatialPositionIndex &index,
                                 ModeOptions options = {});

    /**
     * @brief Flips the mode.
     * @return The new mode, or kNotSupported when the toggle is disabled.
     */
    [[nodiscard]] core::Expected<bool> toggle();

    void setEnabled(bool enabled);

    [[nodiscard]] bool enabled()       const noexcept { return _state.enabled(); }
    [[nodiscard]] bool toggleEnabled() const noexcept { return _options.toggleEnabled; }

    SubscriptionId onStateChanged(StateChangedCallback callback);
    bool           unsubscribe(SubscriptionId id);

private:
    /// @return @c true if the state changed.
    bool runPass(bool enabled);
    void notify(bool enabled);

    SpatializationState  &_state;
    SpatialPositionIndex &_index;
    const ModeOptions     _options;

    std::mutex _passMutex;

    std::mutex                                                  _subscribersMutex;
    std::vector<std::pair<SubscriptionId, StateChangedCallback>> _subscribers;
    SubscriptionId                                              _nextSubscription{1};
};

} // namespace orb::audio

#endif // ORB_AUDIO_SPATIALIZATION_MODE_CONTROLLER_HPP
