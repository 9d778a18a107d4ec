/**
 * @file AudioContextManager.cpp
 * @brief AudioContextManager implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/audio/AudioContextManager.hpp>
#include <orb/core/Log.hpp>

#include <chrono>
#include <string>

namespace orb::audio {

namespace {

std::shared_future<bool> readyFuture(bool value)
{
    std::promise<bool> promise;
    promise.set_value(value);
    return promise.get_future().share();
}

bool isPending(const std::shared_future<bool> &future)
{
    return future.valid()
        && future.wait_for(std::chrono::seconds{0}) != std::future_status::ready;
}

} // anonymous namespace

AudioContextManager::AudioContextManager(const ContextManagerOptions &options, SinkFactory sinkFactory)
    : _options{options}
    , _sinkFactory{std::move(sinkFactory)}
{
}

AudioContextManager::~AudioContextManager()
{
    _worker.shutdown();
}

graph::AudioContext *AudioContextManager::getContext()
{
    if (_unsupported.load(std::memory_order_acquire))
        return nullptr;

    std::lock_guard lock{_mutex};
    if (_context)
        return _context.get();

    core::Expected<std::unique_ptr<graph::IAudioSink>> sink =
        core::makeError(core::ErrorCode::kContextUnsupported, "no audio sink factory");
    if (_sinkFactory)
        sink = _sinkFactory();
    if (!sink)
    {
        _unsupported.store(true, std::memory_order_release);
        core::Log::warn("ctx", "audio output unavailable, falling back to pass-through: "
                               + sink.error().message());
        return nullptr;
    }

    auto created = graph::AudioContext::create(_options.context, std::move(*sink));
    if (!created)
    {
        _unsupported.store(true, std::memory_order_release);
        core::Log::warn("ctx", "audio context unavailable, falling back to pass-through: "
                               + created.error().message());
        return nullptr;
    }

    _context = std::move(*created);
    _context->listener().setPosition({0.0f, 0.0f, 1.0f});
    _context->listener().setOrientation({0.0f, 0.0f, -1.0f}, {0.0f, 1.0f, 0.0f});

    core::Log::info("ctx", "audio context created on '" + std::string{_context->sink().name()} + "' at "
                           + std::to_string(_context->sampleRate()) + " Hz");

    if (!_options.requireUserGesture)
        _pendingResume = scheduleResume(*_context);

    return _context.get();
}

std::shared_future<bool> AudioContextManager::ensureRunning(bool fromUserGesture)
{
    if (fromUserGesture)
        _activated.store(true, std::memory_order_release);

    graph::AudioContext *context = getContext();
    if (!context)
        return readyFuture(false);

    switch (context->state())
    {
        case graph::ContextState::kRunning: return readyFuture(true);
        case graph::ContextState::kClosed:  return readyFuture(false);
        case graph::ContextState::kSuspended: break;
    }

    if (_options.requireUserGesture && !hasUserActivation())
    {
        core::Log::debug("ctx", "resume deferred until a user gesture");
        return readyFuture(false);
    }

    std::lock_guard lock{_mutex};
    if (isPending(_pendingResume))
        return _pendingResume;

    _pendingResume = scheduleResume(*context);
    return _pendingResume;
}

std::shared_future<bool> AudioContextManager::scheduleResume(graph::AudioContext &context)
{
    graph::AudioContext *target = &context;
    return _worker.enqueue([this, target]() {
        auto resumed = target->resume();
        if (!resumed)
        {
            const bool first = !_resumeFailureLogged.exchange(true, std::memory_order_acq_rel);
            const std::string message = "resume failed: " + resumed.error().message();
            if (first)
                core::Log::warn("ctx", message);
            else
                core::Log::debug("ctx", message);
            return false;
        }
        core::Log::info("ctx", "audio context running");
        return true;
    }).share();
}

ContextStatus AudioContextManager::state() const
{
    if (_unsupported.load(std::memory_order_acquire))
        return ContextStatus::kUnsupported;

    std::lock_guard lock{_mutex};
    if (!_context)
        return ContextStatus::kUninitialized;

    switch (_context->state())
    {
        case graph::ContextState::kSuspended: return ContextStatus::kSuspended;
        case graph::ContextState::kRunning:   return ContextStatus::kRunning;
        case graph::ContextState::kClosed:    return ContextStatus::kClosed;
    }
    return ContextStatus::kUninitialized;
}

bool AudioContextManager::hasUserActivation() const noexcept
{
    return _activated.load(std::memory_order_acquire);
}

bool AudioContextManager::isUnsupported() const noexcept
{
    return _unsupported.load(std::memory_order_acquire);
}

} // namespace orb::audio
