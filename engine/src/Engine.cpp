/**
 * @file Engine.cpp
 * @brief Engine façade implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/engine/Engine.hpp>
#include <orb/core/Log.hpp>

#include <utility>

namespace orb::engine {

namespace {

audio::ContextManagerOptions contextManagerOptions(const Config &config)
{
    audio::ContextManagerOptions options;
    options.context.sampleRate  = config.sampleRate();
    options.context.blockSize   = config.blockSize();
    options.requireUserGesture  = config.requireUserGesture();
    return options;
}

audio::IndexOptions indexOptions(const Config &config, std::function<audio::Clock::time_point()> clock)
{
    audio::IndexOptions options;
    options.graph.panner           = config.panner();
    options.graph.pannerScale      = config.pannerScale();
    options.graph.volumeRampFrames = config.volumeRampFrames();
    options.debounce               = config.repositionDebounce();
    options.clock                  = std::move(clock);
    return options;
}

} // anonymous namespace

struct Engine::Impl {
    Config                                    config;
    std::function<audio::Clock::time_point()> clock;

    audio::AudioContextManager          contexts;
    audio::SpatializationState          state;
    audio::SpatialPositionIndex         index;
    audio::SpatializationModeController mode;
    audio::VolumeController             volumes;

    Impl(Config cfg, audio::SinkFactory sinkFactory, std::function<audio::Clock::time_point()> clockSource)
        : config{std::move(cfg)}
        , clock{std::move(clockSource)}
        , contexts{contextManagerOptions(config), std::move(sinkFactory)}
        , state{config.spatialEnabledByDefault()}
        , index{contexts, state, indexOptions(config, clock)}
        , mode{state, index, audio::ModeOptions{config.spatialToggleEnabled()}}
        , volumes{index}
    {
    }

    [[nodiscard]] audio::Clock::time_point now() const { return clock ? clock() : audio::Clock::now(); }
};

Engine::Engine(Config config, audio::SinkFactory sinkFactory,
               std::function<audio::Clock::time_point()> clock)
{
    core::Log::setMinLevel(config.logLevel());
    _impl = std::make_unique<Impl>(std::move(config), std::move(sinkFactory), std::move(clock));

    core::Log::info("engine", std::string{"ready, spatial audio "}
                                  + (_impl->state.enabled() ? "on" : "off"));
}

Engine::~Engine()
{
    core::Log::debug("engine", "shutting down");
}

// -------------------------------------------------------------------------- //
//  Track layer                                                               //
// -------------------------------------------------------------------------- //

core::ExpectedVoid Engine::onTrackAttached(std::string_view id, std::shared_ptr<graph::IMediaStream> stream,
                                           const audio::IVolumeSource *element)
{
    auto graph = _impl->index.attach(id, std::move(stream));
    if (!graph)
    {
        core::Log::warn("engine", "cannot attach '" + std::string{id} + "': " + graph.error().message());
        return std::unexpected(std::move(graph.error()));
    }

    if (element)
        _impl->volumes.applyInitialVolume(id, *element);
    _impl->volumes.notifyAttached(id);

    (void) _impl->contexts.ensureRunning(false);
    return {};
}

bool Engine::onTrackDetached(std::string_view id)
{
    _impl->volumes.forget(id);
    return _impl->index.detach(id);
}

core::ExpectedVoid Engine::onTrackReplaced(std::string_view id, std::shared_ptr<graph::IMediaStream> stream)
{
    const std::optional<core::f32> volume = _impl->volumes.volume(id);
    const std::optional<bool>      muted  = _impl->volumes.muted(id);

    auto graph = _impl->index.attach(id, std::move(stream));
    if (!graph)
    {
        core::Log::warn("engine", "cannot replace '" + std::string{id} + "': " + graph.error().message());
        return std::unexpected(std::move(graph.error()));
    }

    if (volume)
        (*graph)->setVolume(*volume);
    if (muted)
        (*graph)->setMuted(*muted);
    _impl->volumes.notifyAttached(id);
    return {};
}

void Engine::onTracksReordered(std::span<const std::string> order)
{
    _impl->index.reorder(order);
}

// -------------------------------------------------------------------------- //
//  UI                                                                        //
// -------------------------------------------------------------------------- //

core::Expected<bool> Engine::toggleSpatialAudio()
{
    return _impl->mode.toggle();
}

void Engine::setSpatialAudio(bool enabled)
{
    _impl->mode.setEnabled(enabled);
}

bool Engine::setVolume(std::string_view id, core::f32 volume)
{
    return _impl->volumes.setVolume(id, volume);
}

bool Engine::setMuted(std::string_view id, bool muted)
{
    return _impl->volumes.setMuted(id, muted);
}

std::shared_future<bool> Engine::onUserGesture()
{
    return _impl->contexts.ensureRunning(true);
}

audio::SubscriptionId Engine::onStateChanged(audio::StateChangedCallback callback)
{
    return _impl->mode.onStateChanged(std::move(callback));
}

bool Engine::unsubscribe(audio::SubscriptionId id)
{
    return _impl->mode.unsubscribe(id);
}

void Engine::onInitialVolumeSet(audio::InitialVolumeCallback callback)
{
    _impl->volumes.onInitialVolumeSet(std::move(callback));
}

// -------------------------------------------------------------------------- //
//  Main loop                                                                 //
// -------------------------------------------------------------------------- //

bool Engine::pump(audio::Clock::time_point now)
{
    const bool flushed = _impl->index.pump(now);

    // Only an existing, suspended context that is allowed to play is retried.
    if (_impl->contexts.state() == audio::ContextStatus::kSuspended
        && (!_impl->config.requireUserGesture() || _impl->contexts.hasUserActivation()))
        (void) _impl->contexts.ensureRunning(false);

    return flushed;
}

bool Engine::pump()
{
    return pump(_impl->now());
}

// -------------------------------------------------------------------------- //
//  Queries                                                                   //
// -------------------------------------------------------------------------- //

std::optional<core::f32> Engine::volume(std::string_view id) const
{
    return _impl->volumes.volume(id);
}

std::optional<bool> Engine::muted(std::string_view id) const
{
    return _impl->volumes.muted(id);
}

std::optional<audio::Azimuth> Engine::position(std::string_view id) const
{
    return _impl->index.positionOf(id);
}

std::vector<std::string> Engine::participants() const
{
    return _impl->index.ids();
}

bool Engine::isSpatialEnabled() const
{
    return _impl->mode.enabled();
}

bool Engine::isSpatialToggleEnabled() const
{
    return _impl->mode.toggleEnabled();
}

audio::ContextStatus Engine::contextState() const
{
    return _impl->contexts.state();
}

graph::AudioContext *Engine::context()
{
    if (_impl->contexts.state() == audio::ContextStatus::kUninitialized)
        return nullptr;
    return _impl->contexts.getContext();
}

const Config &Engine::config() const noexcept
{
    return _impl->config;
}

} // namespace orb::engine
