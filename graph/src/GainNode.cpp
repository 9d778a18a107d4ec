/**
 * @file GainNode.cpp
 * @brief GainNode implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/graph/GainNode.hpp>
#include <orb/graph/AudioContext.hpp>

namespace orb::graph {

GainNode::GainNode(AudioContext &context)
    : AudioNode{context, "gain"}
    , _gain{1.0f, 0.0f, 1.0f}
    , _gainValues(context.blockSize(), 1.0f)
{
}

void GainNode::process(const AudioBus &in, AudioBus &out)
{
    const core::u32 frames = out.frames();
    if (_gainValues.size() < frames)
        _gainValues.resize(frames);

    std::span<float> gains{_gainValues.data(), frames};
    _gain.process(gains);

    for (core::u32 ch = 0; ch < out.channels(); ++ch)
    {
        auto src = in.channel(ch);
        auto dst = out.channel(ch);
        for (core::u32 i = 0; i < frames; ++i)
            dst[i] = src[i] * gains[i];
    }
}

} // namespace orb::graph
