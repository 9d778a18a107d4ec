/**
 * @file AudioNode.cpp
 * @brief AudioNode topology and pull-model rendering.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/graph/AudioNode.hpp>
#include <orb/graph/AudioContext.hpp>
#include <orb/core/Assert.hpp>

#include <algorithm>

namespace orb::graph {

AudioNode::AudioNode(AudioContext &context, std::string_view name)
    : _context{context}
    , _id{context.registerNode()}
    , _name{name}
{
}

AudioNode::~AudioNode()
{
    auto lock = _context.lockGraph();
    ORB_ASSERT(_outputs.empty());
    detachFromInputs();
    _inputs.clear();
    _context.unregisterNode();
}

// -------------------------------------------------------------------------- //
//  Topology                                                                  //
// -------------------------------------------------------------------------- //

core::ExpectedVoid AudioNode::connect(AudioNode &destination)
{
    if (&destination._context != &_context)
    {
        return core::makeError(core::ErrorCode::kGraphForeignNode,
                               "AudioNode: cannot connect nodes of different contexts");
    }
    if (numberOfOutputs() == 0 || destination.numberOfInputs() == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "AudioNode: " + _name + " -> " + destination._name + " has no matching port");
    }

    auto lock = _context.lockGraph();

    if (isConnectedTo(destination))
        return {};

    if (&destination == this || destination.reaches(*this))
    {
        return core::makeError(core::ErrorCode::kGraphCycle,
                               "AudioNode: " + _name + " -> " + destination._name + " would create a cycle");
    }

    _outputs.push_back(&destination);
    destination._inputs.push_back(shared_from_this());
    return {};
}

void AudioNode::disconnect()
{
    auto lock = _context.lockGraph();
    // The last reference may be the one held by a downstream input.
    auto self = shared_from_this();

    for (AudioNode *out : _outputs)
    {
        std::erase_if(out->_inputs, [this](const std::shared_ptr<AudioNode> &in) {
            return in.get() == this;
        });
    }
    _outputs.clear();
}

bool AudioNode::disconnect(AudioNode &destination)
{
    auto lock = _context.lockGraph();
    auto self = shared_from_this();

    auto it = std::find(_outputs.begin(), _outputs.end(), &destination);
    if (it == _outputs.end())
        return false;

    _outputs.erase(it);
    std::erase_if(destination._inputs, [this](const std::shared_ptr<AudioNode> &in) {
        return in.get() == this;
    });
    return true;
}

bool AudioNode::isConnectedTo(const AudioNode &destination) const
{
    auto lock = _context.lockGraph();
    return std::find(_outputs.begin(), _outputs.end(), &destination) != _outputs.end();
}

core::usize AudioNode::inputCount() const
{
    auto lock = _context.lockGraph();
    return _inputs.size();
}

core::usize AudioNode::outputCount() const
{
    auto lock = _context.lockGraph();
    return _outputs.size();
}

bool AudioNode::reaches(const AudioNode &target) const
{
    if (this == &target)
        return true;
    return std::any_of(_outputs.begin(), _outputs.end(), [&target](const AudioNode *out) {
        return out->reaches(target);
    });
}

void AudioNode::detachFromInputs()
{
    for (const auto &in : _inputs)
        std::erase(in->_outputs, this);
}

// -------------------------------------------------------------------------- //
//  Rendering                                                                 //
// -------------------------------------------------------------------------- //

core::u32 AudioNode::mixedInputChannels() const
{
    core::u32 channels = 1;
    for (const auto &in : _inputs)
        channels = std::max(channels, in->outputChannels());
    return channels;
}

core::u32 AudioNode::inputChannels() const
{
    return mixedInputChannels();
}

core::u32 AudioNode::outputChannels() const
{
    return inputChannels();
}

const AudioBus &AudioNode::pull(core::u64 quantum, core::u32 frames)
{
    if (_lastQuantum == quantum)
        return _outputBus;
    _lastQuantum = quantum;

    _inputBus.configure(inputChannels(), frames);
    _inputBus.zero();
    for (const auto &in : _inputs)
        _inputBus.accumulate(in->pull(quantum, frames));

    _outputBus.configure(outputChannels(), frames);
    process(_inputBus, _outputBus);
    return _outputBus;
}

} // namespace orb::graph
