/**
 * @file AudioBus.cpp
 * @brief AudioBus implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/graph/AudioBus.hpp>

#include <algorithm>

namespace orb::graph {

AudioBus::AudioBus(core::u32 channels, core::u32 frames)
{
    configure(channels, frames);
}

void AudioBus::configure(core::u32 channels, core::u32 frames)
{
    _channels = std::clamp<core::u32>(channels, 1, kMaxChannels);
    _frames   = frames;
    for (core::u32 ch = 0; ch < _channels; ++ch)
    {
        if (_data[ch].size() < frames)
            _data[ch].resize(frames, 0.0f);
    }
}

void AudioBus::zero()
{
    for (core::u32 ch = 0; ch < _channels; ++ch)
        std::fill_n(_data[ch].begin(), _frames, 0.0f);
}

void AudioBus::accumulate(const AudioBus &other)
{
    const core::u32 frames = std::min(_frames, other._frames);

    if (_channels == other._channels)
    {
        for (core::u32 ch = 0; ch < _channels; ++ch)
        {
            for (core::u32 i = 0; i < frames; ++i)
                _data[ch][i] += other._data[ch][i];
        }
        return;
    }

    if (_channels == 2 && other._channels == 1)
    {
        for (core::u32 i = 0; i < frames; ++i)
        {
            _data[0][i] += other._data[0][i];
            _data[1][i] += other._data[0][i];
        }
        return;
    }

    // stereo into mono
    for (core::u32 i = 0; i < frames; ++i)
        _data[0][i] += 0.5f * (other._data[0][i] + other._data[1][i]);
}

std::span<float> AudioBus::channel(core::u32 index)
{
    return {_data[std::min(index, _channels - 1)].data(), _frames};
}

std::span<const float> AudioBus::channel(core::u32 index) const
{
    return {_data[std::min(index, _channels - 1)].data(), _frames};
}

} // namespace orb::graph
