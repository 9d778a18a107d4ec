/**
 * @file AudioDestinationNode.cpp
 * @brief AudioDestinationNode implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/graph/AudioDestinationNode.hpp>

#include <algorithm>

namespace orb::graph {

AudioDestinationNode::AudioDestinationNode(AudioContext &context)
    : AudioNode{context, "destination"}
{
}

void AudioDestinationNode::process(const AudioBus &in, AudioBus &out)
{
    for (core::u32 ch = 0; ch < out.channels(); ++ch)
    {
        auto src = in.channel(ch);
        std::copy(src.begin(), src.end(), out.channel(ch).begin());
    }
}

} // namespace orb::graph
