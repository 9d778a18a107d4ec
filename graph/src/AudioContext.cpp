/**
 * @file AudioContext.cpp
 * @brief AudioContext lifecycle and block rendering.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/graph/AudioContext.hpp>
#include <orb/core/Log.hpp>

#include <algorithm>

namespace orb::graph {

core::Expected<std::unique_ptr<AudioContext>>
AudioContext::create(const ContextOptions &options, std::unique_ptr<IAudioSink> sink)
{
    if (!sink)
        return core::makeError(core::ErrorCode::kInvalidArgument, "AudioContext: null sink");
    if (options.sampleRate == 0 || options.blockSize == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "AudioContext: empty render format");

    std::unique_ptr<AudioContext> context{new AudioContext{options, std::move(sink)}};

    const SinkFormat format{options.sampleRate, core::kOutputChannels, options.blockSize};
    AudioContext *raw = context.get();
    ORB_TRY_VOID(context->_sink->open(format, [raw](std::span<float> out, core::u32 frames) {
        raw->render(out, frames);
    }));

    return context;
}

AudioContext::AudioContext(const ContextOptions &options, std::unique_ptr<IAudioSink> sink)
    : _options{options}
    , _sink{std::move(sink)}
{
    _destination = std::make_shared<AudioDestinationNode>(*this);
}

AudioContext::~AudioContext()
{
    close();
    auto lock = lockGraph();
    _destination.reset();
}

// -------------------------------------------------------------------------- //
//  Factories                                                                 //
// -------------------------------------------------------------------------- //

std::shared_ptr<GainNode> AudioContext::createGain()
{
    return std::make_shared<GainNode>(*this);
}

std::shared_ptr<PannerNode> AudioContext::createPanner(const PannerOptions &options)
{
    return std::make_shared<PannerNode>(*this, options);
}

std::shared_ptr<MediaStreamSourceNode>
AudioContext::createMediaStreamSource(std::shared_ptr<IMediaStream> stream)
{
    return std::make_shared<MediaStreamSourceNode>(*this, std::move(stream));
}

// -------------------------------------------------------------------------- //
//  State                                                                     //
// -------------------------------------------------------------------------- //

ContextState AudioContext::state() const noexcept
{
    return _state.load(std::memory_order_acquire);
}

core::ExpectedVoid AudioContext::resume()
{
    const ContextState current = state();
    if (current == ContextState::kClosed)
        return core::makeError(core::ErrorCode::kContextClosed, "AudioContext: resume after close");
    if (current == ContextState::kRunning)
        return {};

    // The first device callback may arrive before start() returns.
    _state.store(ContextState::kRunning, std::memory_order_release);
    if (auto started = _sink->start(); !started)
    {
        _state.store(ContextState::kSuspended, std::memory_order_release);
        return std::unexpected(std::move(started.error()));
    }
    return {};
}

core::ExpectedVoid AudioContext::suspend()
{
    const ContextState current = state();
    if (current == ContextState::kClosed)
        return core::makeError(core::ErrorCode::kContextClosed, "AudioContext: suspend after close");
    if (current == ContextState::kSuspended)
        return {};

    ORB_TRY_VOID(_sink->stop());
    _state.store(ContextState::kSuspended, std::memory_order_release);
    return {};
}

void AudioContext::close()
{
    if (_state.exchange(ContextState::kClosed, std::memory_order_acq_rel) == ContextState::kClosed)
        return;

    if (_sink->isStarted())
    {
        if (auto stopped = _sink->stop(); !stopped)
            core::Log::warn("graph", "AudioContext: " + stopped.error().message());
    }
    _sink->close();
}

// -------------------------------------------------------------------------- //
//  Rendering                                                                 //
// -------------------------------------------------------------------------- //

void AudioContext::render(std::span<float> out, core::u32 frames)
{
    const core::usize samples = std::min<core::usize>(out.size(),
                                                      static_cast<core::usize>(frames) * core::kOutputChannels);
    auto lock = lockGraph();

    if (state() != ContextState::kRunning)
    {
        std::fill_n(out.begin(), samples, 0.0f);
        return;
    }

    core::usize written = 0;
    while (written < samples)
    {
        const core::u32 chunk = static_cast<core::u32>(
            std::min<core::usize>(_options.blockSize, (samples - written) / core::kOutputChannels));
        if (chunk == 0)
            break;

        const AudioBus &bus = _destination->pull(_quantum++, chunk);
        auto left  = bus.channel(0);
        auto right = bus.channel(1);
        for (core::u32 i = 0; i < chunk; ++i)
        {
            out[written++] = left[i];
            out[written++] = right[i];
        }
        _currentFrame.fetch_add(chunk, std::memory_order_relaxed);
    }
    std::fill(out.begin() + static_cast<std::ptrdiff_t>(written),
              out.begin() + static_cast<std::ptrdiff_t>(samples), 0.0f);
}

core::u64 AudioContext::currentFrame() const noexcept
{
    return _currentFrame.load(std::memory_order_relaxed);
}

core::usize AudioContext::liveNodeCount() const noexcept
{
    return _liveNodes.load(std::memory_order_acquire);
}

core::u32 AudioContext::registerNode() noexcept
{
    _liveNodes.fetch_add(1, std::memory_order_acq_rel);
    return _nextNodeId.fetch_add(1, std::memory_order_relaxed);
}

void AudioContext::unregisterNode() noexcept
{
    _liveNodes.fetch_sub(1, std::memory_order_acq_rel);
}

} // namespace orb::graph
