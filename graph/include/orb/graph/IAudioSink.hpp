/**
 * @file IAudioSink.hpp
 * @brief Output device abstraction driving an AudioContext.
 *
 * A sink owns the real-time thread: once started it repeatedly invokes
 * the render callback to obtain interleaved stereo blocks.  Concrete
 * sinks are the in-process OfflineSink and, when built, the PortAudio
 * device sink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_IAUDIO_SINK_HPP
    #define ORB_GRAPH_IAUDIO_SINK_HPP

    #include <orb/core/Expected.hpp>
    #include <orb/core/Types.hpp>

    #include <functional>
    #include <span>
    #include <string_view>

namespace orb::graph {

struct SinkFormat {
    core::u32 sampleRate{0};
    core::u32 channels{2};
    core::u32 framesPerBuffer{0};
};

/// Fills @c interleaved (frames * channels samples). Called on the sink thread.
using RenderCallback = std::function<void(std::span<float> interleaved, core::u32 frames)>;

class IAudioSink {
public:
    virtual ~IAudioSink() = default;

    [[nodiscard]] virtual core::ExpectedVoid open(const SinkFormat &format, RenderCallback callback) = 0;
    [[nodiscard]] virtual core::ExpectedVoid start() = 0;
    [[nodiscard]] virtual core::ExpectedVoid stop()  = 0;
    virtual void close() = 0;

    [[nodiscard]] virtual bool             isOpen()    const = 0;
    [[nodiscard]] virtual bool             isStarted() const = 0;
    [[nodiscard]] virtual std::string_view name()      const = 0;
};

} // namespace orb::graph

#endif // ORB_GRAPH_IAUDIO_SINK_HPP
