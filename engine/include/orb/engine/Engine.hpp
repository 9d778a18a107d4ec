/**
 * @file Engine.hpp
 * @brief Top-level engine façade (Façade pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_ENGINE_ENGINE_HPP
    #define ORB_ENGINE_ENGINE_HPP

    #include <orb/engine/Config.hpp>
    #include <orb/audio/AudioContextManager.hpp>
    #include <orb/audio/ParticipantAudioGraph.hpp>
    #include <orb/audio/SpatialPositionIndex.hpp>
    #include <orb/audio/SpatializationModeController.hpp>
    #include <orb/audio/VolumeController.hpp>
    #include <orb/core/Expected.hpp>
    #include <orb/core/Types.hpp>

    #include <functional>
    #include <future>
    #include <memory>
    #include <optional>
    #include <span>
    #include <string>
    #include <string_view>
    #include <vector>

namespace orb::engine {

/**
 * @brief Top-level engine façade.
 *
 * Owns the five audio components, wires them in dependency order and
 * translates track-layer and UI events into calls on them.  Every method
 * must be called from the same (main) thread; rendering happens on the
 * thread driving the sink.
 */
class Engine {
public:
    /**
     * @param config      Immutable engine configuration.
     * @param sinkFactory Opens the output sink when the first track arrives.
     * @param clock       Time source for repositioning; steady_clock when empty.
     */
    Engine(Config config, audio::SinkFactory sinkFactory,
           std::function<audio::Clock::time_point()> clock = {});
    ~Engine();

    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;

    // -- track layer ------------------------------------------------------ //

    /**
     * @brief A remote participant's stream became available.
     *
     * Builds the participant's graph, inherits the element's volume when
     * @p element is given, and tries to start playback.
     */
    core::ExpectedVoid onTrackAttached(std::string_view id, std::shared_ptr<graph::IMediaStream> stream,
                                       const audio::IVolumeSource *element = nullptr);

    /// @return @c false if @p id had no graph.
    bool onTrackDetached(std::string_view id);

    /** @brief Swaps the stream of @p id while keeping its place. */
    core::ExpectedVoid onTrackReplaced(std::string_view id, std::shared_ptr<graph::IMediaStream> stream);

    void onTracksReordered(std::span<const std::string> order);

    // -- UI --------------------------------------------------------------- //

    [[nodiscard]] core::Expected<bool> toggleSpatialAudio();
    void setSpatialAudio(bool enabled);

    bool setVolume(std::string_view id, core::f32 volume);
    bool setMuted(std::string_view id, bool muted);

    /** @brief Unlocks playback; resolves once the context runs (or cannot). */
    std::shared_future<bool> onUserGesture();

    audio::SubscriptionId onStateChanged(audio::StateChangedCallback callback);
    bool unsubscribe(audio::SubscriptionId id);
    void onInitialVolumeSet(audio::InitialVolumeCallback callback);

    // -- main loop -------------------------------------------------------- //

    /**
     * @brief Flushes debounced repositioning and retries a stalled resume.
     * @return @c true if positions were recomputed.
     */
    bool pump(audio::Clock::time_point now);
    bool pump();

    // -- queries ---------------------------------------------------------- //

    [[nodiscard]] std::optional<core::f32>      volume(std::string_view id)   const;
    [[nodiscard]] std::optional<bool>           muted(std::string_view id)    const;
    [[nodiscard]] std::optional<audio::Azimuth> position(std::string_view id) const;
    [[nodiscard]] std::vector<std::string>      participants()                const;

    [[nodiscard]] bool                 isSpatialEnabled()     const;
    [[nodiscard]] bool                 isSpatialToggleEnabled() const;
    [[nodiscard]] audio::ContextStatus contextState()         const;

    /** @brief The shared context, or null before the first track / when unsupported. */
    [[nodiscard]] graph::AudioContext *context();

    /** @brief Access the active configuration. */
    [[nodiscard]] const Config &config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace orb::engine

#endif // ORB_ENGINE_ENGINE_HPP
