/**
 * @file SpatializationModeController.cpp
 * @brief SpatializationModeController implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/audio/SpatializationModeController.hpp>
#include <orb/core/Log.hpp>

#include <algorithm>

namespace orb::audio {

SpatializationModeController::SpatializationModeController(SpatializationState &state,
                                                           SpatialPositionIndex &index,
                                                           ModeOptions options)
    : _state{state}
    , _index{index}
    , _options{options}
{
}

core::Expected<bool> SpatializationModeController::toggle()
{
    if (!_options.toggleEnabled)
    {
        core::Log::debug("mode", "toggle ignored, spatial audio toggle is disabled");
        return core::makeError(core::ErrorCode::kNotSupported, "spatial audio toggle is disabled");
    }

    bool target = false;
    {
        std::lock_guard lock{_passMutex};
        target = !_state.enabled();
        runPass(target);
    }
    notify(target);
    return target;
}

void SpatializationModeController::setEnabled(bool enabled)
{
    bool changed = false;
    {
        std::lock_guard lock{_passMutex};
        changed = runPass(enabled);
    }
    if (changed)
        notify(enabled);
}

bool SpatializationModeController::runPass(bool enabled)
{
    if (_state.enabled() == enabled)
        return false;

    _state.set(enabled);

    core::usize rewired = 0;
    _index.forEach([enabled, &rewired](ParticipantAudioGraph &graph) {
        if (!graph.isAttached())
            return;
        if (auto result = graph.rewire(enabled); !result)
        {
            core::Log::error("mode", "rewire of " + graph.participantId() + " failed: "
                                     + result.error().message());
            return;
        }
        ++rewired;
    });

    core::Log::info("mode", std::string{"spatial audio "} + (enabled ? "enabled" : "disabled")
                            + " (" + std::to_string(rewired) + " graph(s) rewired)");
    return true;
}

SubscriptionId SpatializationModeController::onStateChanged(StateChangedCallback callback)
{
    std::lock_guard lock{_subscribersMutex};
    const SubscriptionId id = _nextSubscription++;
    _subscribers.emplace_back(id, std::move(callback));
    return id;
}

bool SpatializationModeController::unsubscribe(SubscriptionId id)
{
    std::lock_guard lock{_subscribersMutex};
    return std::erase_if(_subscribers, [id](const auto &entry) { return entry.first == id; }) > 0;
}

void SpatializationModeController::notify(bool enabled)
{
    std::vector<StateChangedCallback> callbacks;
    {
        std::lock_guard lock{_subscribersMutex};
        callbacks.reserve(_subscribers.size());
        for (const auto &entry : _subscribers)
            callbacks.push_back(entry.second);
    }
    for (const auto &callback : callbacks)
    {
        if (callback)
            callback(enabled);
    }
}

} // namespace orb::audio
