/**
 * @file ParticipantAudioGraph.hpp
 * @brief Node chain of one remote participant: source, panner, gain.
 *
 * Exactly one path is wired at any time:
 *   spatial: source -> panner -> gain -> destination
 *   mono:    source -> gain -> destination
 * The gain node is the final stage and owns volume and mute, so both
 * survive every mode switch untouched.
 *
 * Without an AudioContext (unsupported platform) the graph is a
 * pass-through handle that only records volume, mute and position.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_AUDIO_PARTICIPANT_AUDIO_GRAPH_HPP
    #define ORB_AUDIO_PARTICIPANT_AUDIO_GRAPH_HPP

    #include <orb/audio/SpatializationState.hpp>
    #include <orb/graph/AudioContext.hpp>
    #include <orb/core/Constants.hpp>
    #include <orb/core/Expected.hpp>
    #include <orb/core/NonCopyable.hpp>

    #include <memory>
    #include <string>
    #include <string_view>

namespace orb::audio {

class AudioContextManager;

/** @brief Position on the unit semicircle in front of the listener. */
struct Azimuth {
    core::f32 x{0.0f};
    core::f32 y{1.0f};

    [[nodiscard]] constexpr bool operator==(const Azimuth &rhs) const = default;
};

struct GraphOptions {
    graph::PannerOptions panner{};
    core::f32            pannerScale{core::kPannerScale};

    /// Length of the volume ramp; 0 applies volume changes immediately.
    core::u32            volumeRampFrames{core::kDefaultSampleRate * core::kVolumeRampMs / 1000};
};

class ParticipantAudioGraph final : public core::NonCopyable<ParticipantAudioGraph> {
public:
    /**
     * @brief Builds and wires the chain for @p stream.
     *
     * @return kInvalidArgument for an empty id or a null stream, or the
     *         graph error raised while wiring.
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<ParticipantAudioGraph>>
    attach(std::string participantId, std::shared_ptr<graph::IMediaStream> stream,
           AudioContextManager &contexts, const SpatializationState &state,
           const GraphOptions &options = {});

    ~ParticipantAudioGraph();

    /**
     * @brief Disconnects gain, panner then source and releases them.
     *
     * Pending volume ramps are cancelled first.  Idempotent; every mutator
     * becomes a no-op afterwards.
     */
    void detach();

    /** @brief Clamps to [0, 1]; NaN is ignored. */
    void setVolume(core::f32 volume);
    void setMuted(bool muted);

    /**
     * @brief Caches the azimuth and forwards it to the panner as
     *        (x * scale, y * scale, 0) while spatialization is enabled.
     */
    void setPosition(const Azimuth &position);

    /**
     * @brief Switches between the spatial and the mono path.
     *
     * Runs under the context's graph lock, disconnecting the source from
     * its current next stage before the new edges are made.  No-op for a
     * detached or pass-through graph, or when already on that path.
     */
    [[nodiscard]] core::ExpectedVoid rewire(bool spatial);

    [[nodiscard]] const std::string &participantId() const noexcept { return _participantId; }
    [[nodiscard]] core::f32 volume()        const noexcept { return _volume; }
    [[nodiscard]] bool      muted()         const noexcept { return _muted; }
    [[nodiscard]] core::f32 effectiveGain() const noexcept { return _muted ? 0.0f : _volume; }
    [[nodiscard]] Azimuth   position()      const noexcept { return _position; }
    [[nodiscard]] bool      isAttached()    const noexcept { return _attached; }
    [[nodiscard]] bool      isSpatialPath() const noexcept { return _spatialPath; }
    [[nodiscard]] bool      isPassthrough() const noexcept { return _context == nullptr; }

    /** @brief Value the gain stage is heading to (effectiveGain() when pass-through). */
    [[nodiscard]] core::f32 gainValue() const;

    [[nodiscard]] const GraphOptions &options() const noexcept { return _options; }
    [[nodiscard]] const std::shared_ptr<graph::IMediaStream> &stream() const noexcept { return _stream; }

    /// Nodes, null once detached or when pass-through.
    [[nodiscard]] graph::MediaStreamSourceNode *sourceNode() const noexcept { return _source.get(); }
    [[nodiscard]] graph::PannerNode            *pannerNode() const noexcept { return _panner.get(); }
    [[nodiscard]] graph::GainNode              *gainNode()   const noexcept { return _gain.get(); }

private:
    ParticipantAudioGraph(std::string participantId, std::shared_ptr<graph::IMediaStream> stream,
                          graph::AudioContext *context, const SpatializationState &state,
                          const GraphOptions &options);

    [[nodiscard]] core::ExpectedVoid wire(bool spatial);
    void applyGain();
    void applyPosition();

    std::string                          _participantId;
    std::shared_ptr<graph::IMediaStream> _stream;
    graph::AudioContext                 *_context;
    const SpatializationState           &_state;
    const GraphOptions                   _options;

    std::shared_ptr<graph::MediaStreamSourceNode> _source;
    std::shared_ptr<graph::PannerNode>            _panner;
    std::shared_ptr<graph::GainNode>              _gain;

    Azimuth   _position{};
    core::f32 _volume{1.0f};
    bool      _muted{false};
    bool      _attached{true};
    bool      _spatialPath{false};
};

} // namespace orb::audio

#endif // ORB_AUDIO_PARTICIPANT_AUDIO_GRAPH_HPP
