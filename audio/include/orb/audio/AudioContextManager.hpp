/**
 * @file AudioContextManager.hpp
 * @brief Lazily created, conference-lifetime AudioContext.
 *
 * The manager is the only component allowed to create or resume the
 * context.  Resuming may block on the output device, so it runs on a
 * dedicated worker and callers receive a future.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_AUDIO_AUDIO_CONTEXT_MANAGER_HPP
    #define ORB_AUDIO_AUDIO_CONTEXT_MANAGER_HPP

    #include <orb/graph/AudioContext.hpp>
    #include <orb/graph/IAudioSink.hpp>
    #include <orb/concurrency/ThreadPool.hpp>
    #include <orb/core/Expected.hpp>
    #include <orb/core/NonCopyable.hpp>

    #include <atomic>
    #include <functional>
    #include <future>
    #include <memory>
    #include <mutex>
    #include <string_view>

namespace orb::audio {

enum class ContextStatus : core::u8 {
    kUninitialized = 0,
    kUnsupported,
    kSuspended,
    kRunning,
    kClosed
};

[[nodiscard]] constexpr std::string_view toString(ContextStatus status) noexcept
{
    switch (status)
    {
        case ContextStatus::kUninitialized: return "uninitialized";
        case ContextStatus::kUnsupported:   return "unsupported";
        case ContextStatus::kSuspended:     return "suspended";
        case ContextStatus::kRunning:       return "running";
        case ContextStatus::kClosed:        return "closed";
    }
    return "unknown";
}

/// Produces the output device; an error marks the platform unsupported.
using SinkFactory = std::function<core::Expected<std::unique_ptr<graph::IAudioSink>>()>;

struct ContextManagerOptions {
    graph::ContextOptions context{};
    bool                  requireUserGesture{true};
};

class AudioContextManager final : public core::NonCopyable<AudioContextManager> {
public:
    AudioContextManager(const ContextManagerOptions &options, SinkFactory sinkFactory);
    ~AudioContextManager();

    /**
     * @brief Returns the context, creating it on first use.
     * @return nullptr once the environment has been found unsupported.
     */
    [[nodiscard]] graph::AudioContext *getContext();

    /**
     * @brief Makes sure the context is running.
     *
     * Never blocks.  The future is immediately @c true when already
     * running, immediately @c false when unsupported, closed or still
     * waiting for a user gesture, and otherwise resolves once the worker
     * has tried to resume.  Concurrent calls share the pending attempt.
     *
     * @param fromUserGesture The call originates from a user interaction.
     */
    [[nodiscard]] std::shared_future<bool> ensureRunning(bool fromUserGesture);

    [[nodiscard]] ContextStatus state() const;

    /** @brief A user gesture has been seen; the autoplay gate stays open. */
    [[nodiscard]] bool hasUserActivation() const noexcept;

    [[nodiscard]] bool isUnsupported() const noexcept;

private:
    [[nodiscard]] std::shared_future<bool> scheduleResume(graph::AudioContext &context);

    const ContextManagerOptions _options;
    SinkFactory                 _sinkFactory;

    mutable std::mutex                   _mutex;
    std::unique_ptr<graph::AudioContext> _context;
    std::shared_future<bool>             _pendingResume;
    std::atomic<bool>                    _unsupported{false};
    std::atomic<bool>                    _activated{false};
    std::atomic<bool>                    _resumeFailureLogged{false};

    // Declared last: joined before the context it resumes is destroyed.
    concurrency::ThreadPool _worker{1};
};

} // namespace orb::audio

#endif // ORB_AUDIO_AUDIO_CONTEXT_MANAGER_HPP
