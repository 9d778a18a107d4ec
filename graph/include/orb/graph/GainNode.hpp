/**
 * @file GainNode.hpp
 * @brief Scales its input by an automatable gain.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_GAIN_NODE_HPP
    #define ORB_GRAPH_GAIN_NODE_HPP

    #include <orb/graph/AudioNode.hpp>
    #include <orb/graph/AudioParam.hpp>

    #include <vector>

namespace orb::graph {

class GainNode final : public AudioNode {
public:
    explicit GainNode(AudioContext &context);

    [[nodiscard]] AudioParam       &gain()       noexcept { return _gain; }
    [[nodiscard]] const AudioParam &gain() const noexcept { return _gain; }

protected:
    void process(const AudioBus &in, AudioBus &out) override;

private:
    AudioParam         _gain;
    std::vector<float> _gainValues;
};

} // namespace orb::graph

#endif // ORB_GRAPH_GAIN_NODE_HPP
