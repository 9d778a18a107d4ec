/**
 * @file MediaStreamSourceNode.cpp
 * @brief MediaStreamSourceNode implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/graph/MediaStreamSourceNode.hpp>

#include <algorithm>

namespace orb::graph {

MediaStreamSourceNode::MediaStreamSourceNode(AudioContext &context,
                                             std::shared_ptr<IMediaStream> stream)
    : AudioNode{context, "source"}
    , _stream{std::move(stream)}
{
}

void MediaStreamSourceNode::process(const AudioBus & /*in*/, AudioBus &out)
{
    auto dst = out.channel(0);

    core::usize written = 0;
    if (_stream && _stream->active())
        written = std::min(_stream->read(dst), dst.size());

    std::fill(dst.begin() + static_cast<std::ptrdiff_t>(written), dst.end(), 0.0f);
}

} // namespace orb::graph
