/**
 * @file PortAudioSink.hpp
 * @brief IAudioSink on the default PortAudio output device.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_DEVICE_PORT_AUDIO_SINK_HPP
    #define ORB_DEVICE_PORT_AUDIO_SINK_HPP

    #include <orb/graph/IAudioSink.hpp>
    #include <orb/core/Expected.hpp>

    #include <atomic>
    #include <memory>
    #include <mutex>

struct PaStreamCallbackTimeInfo;

namespace orb::device {

/**
 * @brief Float32 interleaved stereo output driven by the PortAudio callback.
 *
 * The render callback runs on PortAudio's audio thread.
 */
class PortAudioSink final : public graph::IAudioSink {
public:
    /**
     * @brief Initializes PortAudio and checks that an output device exists.
     * @return kDeviceNotFound when the host has no default output, or
     *         kDeviceOpenFailed when PortAudio cannot be initialized.
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<graph::IAudioSink>> create();

    ~PortAudioSink() override;

    [[nodiscard]] core::ExpectedVoid open(const graph::SinkFormat &format, graph::RenderCallback callback) override;
    [[nodiscard]] core::ExpectedVoid start() override;
    [[nodiscard]] core::ExpectedVoid stop()  override;
    void close() override;

    [[nodiscard]] bool             isOpen()    const override;
    [[nodiscard]] bool             isStarted() const override;
    [[nodiscard]] std::string_view name()      const override { return "portaudio"; }

private:
    PortAudioSink() = default;

    static int callback(const void *input, void *output, unsigned long frames,
                        const PaStreamCallbackTimeInfo *timeInfo, unsigned long statusFlags, void *userData);

    mutable std::mutex    _mutex;
    void                 *_stream{nullptr};
    graph::SinkFormat     _format{};
    graph::RenderCallback _render;
    std::atomic<bool>     _started{false};
};

} // namespace orb::device

#endif // ORB_DEVICE_PORT_AUDIO_SINK_HPP
