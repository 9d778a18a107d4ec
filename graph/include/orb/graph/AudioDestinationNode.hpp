/**
 * @file AudioDestinationNode.hpp
 * @brief Final stereo mix handed to the sink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_AUDIO_DESTINATION_NODE_HPP
    #define ORB_GRAPH_AUDIO_DESTINATION_NODE_HPP

    #include <orb/graph/AudioNode.hpp>

namespace orb::graph {

class AudioDestinationNode final : public AudioNode {
public:
    explicit AudioDestinationNode(AudioContext &context);

    [[nodiscard]] core::u32 numberOfOutputs() const noexcept override { return 0; }

protected:
    [[nodiscard]] core::u32 inputChannels()  const override { return 2; }
    [[nodiscard]] core::u32 outputChannels() const override { return 2; }

    void process(const AudioBus &in, AudioBus &out) override;
};

} // namespace orb::graph

#endif // ORB_GRAPH_AUDIO_DESTINATION_NODE_HPP
