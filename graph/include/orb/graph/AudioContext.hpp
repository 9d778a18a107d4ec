/**
 * @file AudioContext.hpp
 * @brief Owner of the render clock, the listener and the destination.
 *
 * The context is the node factory of the graph and the entry point of
 * the render thread.  Every topology mutation and every render quantum
 * run under the same graph mutex, exposed to callers as a GraphLock so
 * that a multi-step rewire is observed atomically by the renderer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_AUDIO_CONTEXT_HPP
    #define ORB_GRAPH_AUDIO_CONTEXT_HPP

    #include <orb/graph/AudioDestinationNode.hpp>
    #include <orb/graph/AudioListener.hpp>
    #include <orb/graph/GainNode.hpp>
    #include <orb/graph/IAudioSink.hpp>
    #include <orb/graph/MediaStreamSourceNode.hpp>
    #include <orb/graph/PannerNode.hpp>
    #include <orb/core/Constants.hpp>
    #include <orb/core/Expected.hpp>
    #include <orb/core/NonCopyable.hpp>

    #include <atomic>
    #include <memory>
    #include <mutex>
    #include <span>
    #include <string_view>

namespace orb::graph {

enum class ContextState : core::u8 {
    kSuspended = 0,
    kRunning,
    kClosed
};

[[nodiscard]] constexpr std::string_view toString(ContextState state) noexcept
{
    switch (state)
    {
        case ContextState::kSuspended: return "suspended";
        case ContextState::kRunning:   return "running";
        case ContextState::kClosed:    return "closed";
    }
    return "unknown";
}

struct ContextOptions {
    core::u32 sampleRate{core::kDefaultSampleRate};
    core::u32 blockSize{core::kRenderQuantum};
};

/// Scoped topology lock; holding it keeps the renderer out of the graph.
using GraphLock = std::unique_lock<std::recursive_mutex>;

class AudioContext final : public core::NonCopyable<AudioContext> {
public:
    /**
     * @brief Creates a suspended context and opens @p sink on it.
     * @return kInvalidArgument for a null sink or an empty format, or the
     *         sink's own error if it cannot be opened.
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<AudioContext>>
    create(const ContextOptions &options, std::unique_ptr<IAudioSink> sink);

    ~AudioContext();

    [[nodiscard]] std::shared_ptr<GainNode>   createGain();
    [[nodiscard]] std::shared_ptr<PannerNode> createPanner(const PannerOptions &options = {});
    [[nodiscard]] std::shared_ptr<MediaStreamSourceNode>
    createMediaStreamSource(std::shared_ptr<IMediaStream> stream);

    [[nodiscard]] AudioDestinationNode &destination() noexcept { return *_destination; }
    [[nodiscard]] AudioListener        &listener()    noexcept { return _listener; }
    [[nodiscard]] const AudioListener  &listener()    const noexcept { return _listener; }

    [[nodiscard]] ContextState state() const noexcept;

    /**
     * @brief Starts the sink; a no-op when already running.
     *
     * May block on the device, callers on the main thread go through
     * audio::AudioContextManager which runs it on a worker.
     */
    [[nodiscard]] core::ExpectedVoid resume();
    [[nodiscard]] core::ExpectedVoid suspend();

    /** @brief Stops and closes the sink.  Idempotent. */
    void close();

    /**
     * @brief Renders @p frames interleaved stereo frames into @p out.
     *
     * Called by the sink on its thread.  Produces silence unless running.
     */
    void render(std::span<float> out, core::u32 frames);

    [[nodiscard]] core::u32   sampleRate()    const noexcept { return _options.sampleRate; }
    [[nodiscard]] core::u32   blockSize()     const noexcept { return _options.blockSize; }
    [[nodiscard]] core::u64   currentFrame()  const noexcept;
    [[nodiscard]] core::usize liveNodeCount() const noexcept;
    [[nodiscard]] IAudioSink &sink()          noexcept { return *_sink; }

    [[nodiscard]] GraphLock lockGraph() const { return GraphLock{_graphMutex}; }

private:
    friend class AudioNode;

    AudioContext(const ContextOptions &options, std::unique_ptr<IAudioSink> sink);

    core::u32 registerNode() noexcept;
    void      unregisterNode() noexcept;

    const ContextOptions _options;

    mutable std::recursive_mutex _graphMutex;
    std::atomic<core::u32>       _nextNodeId{1};
    std::atomic<core::usize>     _liveNodes{0};
    std::atomic<ContextState>    _state{ContextState::kSuspended};
    std::atomic<core::u64>       _currentFrame{0};
    core::u64                    _quantum{0};

    AudioListener                         _listener;
    std::unique_ptr<IAudioSink>           _sink;
    std::shared_ptr<AudioDestinationNode> _destination;
};

} // namespace orb::graph

#endif // ORB_GRAPH_AUDIO_CONTEXT_HPP
