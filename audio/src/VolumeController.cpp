/**
 * @file VolumeController.cpp
 * @brief VolumeController implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/audio/VolumeController.hpp>
#include <orb/core/Log.hpp>

#include <cmath>
#include <utility>

namespace orb::audio {

VolumeController::VolumeController(SpatialPositionIndex &index) : _index{index} {}

bool VolumeController::applyInitialVolume(std::string_view id, const IVolumeSource &source)
{
    ParticipantAudioGraph *graph = _index.find(id);
    if (!graph)
        return false;

    if (const auto initial = source.initialVolume())
        graph->setVolume(*initial);
    graph->setMuted(source.initiallyMuted());
    return true;
}

bool VolumeController::setVolume(std::string_view id, core::f32 volume)
{
    if (std::isnan(volume))
    {
        core::Log::warn("volume", "ignoring NaN volume for " + std::string{id});
        return false;
    }

    ParticipantAudioGraph *graph = _index.find(id);
    if (!graph)
    {
        core::Log::debug("volume", "no graph for " + std::string{id});
        return false;
    }
    graph->setVolume(volume);
    return true;
}

bool VolumeController::setMuted(std::string_view id, bool muted)
{
    ParticipantAudioGraph *graph = _index.find(id);
    if (!graph)
    {
        core::Log::debug("volume", "no graph for " + std::string{id});
        return false;
    }
    graph->setMuted(muted);
    return true;
}

std::optional<core::f32> VolumeController::volume(std::string_view id) const
{
    const ParticipantAudioGraph *graph = std::as_const(_index).find(id);
    if (!graph)
        return std::nullopt;
    return graph->volume();
}

std::optional<bool> VolumeController::muted(std::string_view id) const
{
    const ParticipantAudioGraph *graph = std::as_const(_index).find(id);
    if (!graph)
        return std::nullopt;
    return graph->muted();
}

void VolumeController::onInitialVolumeSet(InitialVolumeCallback callback)
{
    _initialVolumeCallback = std::move(callback);
}

void VolumeController::notifyAttached(std::string_view id)
{
    const ParticipantAudioGraph *graph = std::as_const(_index).find(id);
    if (!graph)
        return;
    if (!_reported.emplace(id).second)
        return;
    if (_initialVolumeCallback)
        _initialVolumeCallback(id, graph->gainValue());
}

void VolumeController::forget(std::string_view id)
{
    _reported.erase(std::string{id});
}

} // namespace orb::audio
