/**
 * @file AudioNode.hpp
 * @brief Base class of every processing stage in the audio graph.
 *
 * A connection A -> B makes B own a reference to A: a connected chain is
 * kept alive by whatever it finally feeds (ultimately the destination),
 * exactly like a Web Audio graph.  Nodes are therefore only reclaimed
 * once they are explicitly disconnected and released by their owner.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_AUDIO_NODE_HPP
    #define ORB_GRAPH_AUDIO_NODE_HPP

    #include <orb/graph/AudioBus.hpp>
    #include <orb/core/Expected.hpp>
    #include <orb/core/NonCopyable.hpp>
    #include <orb/core/Types.hpp>

    #include <memory>
    #include <string>
    #include <string_view>
    #include <vector>

namespace orb::graph {

class AudioContext;

/**
 * @brief Abstract audio-graph node.
 *
 * Topology mutations lock the owning context's graph mutex, so they are
 * safe against a concurrently rendering sink.  The owning AudioContext
 * must outlive every node created from it.
 */
class AudioNode : public std::enable_shared_from_this<AudioNode>,
                  public core::NonCopyable<AudioNode>
{
public:
    virtual ~AudioNode();

    /**
     * @brief Connects this node's output to @p destination's input.
     *
     * Connecting an already connected pair is a no-op.
     *
     * @return kGraphForeignNode if the nodes belong to different contexts,
     *         kInvalidArgument if either side has no such port,
     *         kGraphCycle if the edge would close a loop.
     */
    [[nodiscard]] core::ExpectedVoid connect(AudioNode &destination);

    /** @brief Removes every outgoing connection. */
    void disconnect();

    /**
     * @brief Removes the connection to @p destination.
     * @return @c true if such a connection existed.
     */
    bool disconnect(AudioNode &destination);

    [[nodiscard]] bool        isConnectedTo(const AudioNode &destination) const;
    [[nodiscard]] core::usize inputCount()  const;
    [[nodiscard]] core::usize outputCount() const;

    [[nodiscard]] core::u32        id()   const noexcept { return _id; }
    [[nodiscard]] std::string_view name() const noexcept { return _name; }
    [[nodiscard]] AudioContext    &context() const noexcept { return _context; }

    /** @brief Number of input ports (0 for sources, 1 otherwise). */
    [[nodiscard]] virtual core::u32 numberOfInputs()  const noexcept { return 1; }

    /** @brief Number of output ports (0 for the destination, 1 otherwise). */
    [[nodiscard]] virtual core::u32 numberOfOutputs() const noexcept { return 1; }

protected:
    AudioNode(AudioContext &context, std::string_view name);

    /** @brief Channel count of the bus handed to process(); render thread. */
    [[nodiscard]] virtual core::u32 inputChannels() const;

    /** @brief Channel count produced by process(); render thread. */
    [[nodiscard]] virtual core::u32 outputChannels() const;

    /** @brief Largest output channel count among the connected inputs. */
    [[nodiscard]] core::u32 mixedInputChannels() const;

    /**
     * @brief Renders one quantum.
     * @param in  Sum of all inputs, already up/down-mixed.
     * @param out Bus to fill, configured to outputChannels().
     */
    virtual void process(const AudioBus &in, AudioBus &out) = 0;

private:
    friend class AudioContext;

    /** @brief Renders (once per quantum) and returns this node's output. */
    const AudioBus &pull(core::u64 quantum, core::u32 frames);

    [[nodiscard]] bool reaches(const AudioNode &target) const;
    void detachFromInputs();

    AudioContext &_context;
    core::u32     _id;
    std::string   _name;

    std::vector<std::shared_ptr<AudioNode>> _inputs;
    std::vector<AudioNode *>                _outputs;

    AudioBus  _inputBus;
    AudioBus  _outputBus;
    core::u64 _lastQuantum{~core::u64{0}};
};

} // namespace orb::graph

#endif // ORB_GRAPH_AUDIO_NODE_HPP
