/**
 * @file MediaStreamSourceNode.hpp
 * @brief Source node reading a participant's mono stream.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_MEDIA_STREAM_SOURCE_NODE_HPP
    #define ORB_GRAPH_MEDIA_STREAM_SOURCE_NODE_HPP

    #include <orb/graph/AudioNode.hpp>
    #include <orb/graph/IMediaStream.hpp>

    #include <memory>

namespace orb::graph {

/**
 * @brief Emits the stream's samples, or silence on underrun and while the
 *        stream is inactive.
 */
class MediaStreamSourceNode final : public AudioNode {
public:
    MediaStreamSourceNode(AudioContext &context, std::shared_ptr<IMediaStream> stream);

    [[nodiscard]] const std::shared_ptr<IMediaStream> &stream() const noexcept { return _stream; }

    [[nodiscard]] core::u32 numberOfInputs() const noexcept override { return 0; }

protected:
    [[nodiscard]] core::u32 outputChannels() const override { return 1; }

    void process(const AudioBus &in, AudioBus &out) override;

private:
    std::shared_ptr<IMediaStream> _stream;
};

} // namespace orb::graph

#endif // ORB_GRAPH_MEDIA_STREAM_SOURCE_NODE_HPP
