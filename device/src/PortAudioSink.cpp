/**
 * @file PortAudioSink.cpp
 * @brief PortAudioSink implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/device/PortAudioSink.hpp>
#include <orb/core/Log.hpp>

#include <portaudio.h>

#include <span>
#include <string>

namespace orb::device {

namespace {

std::string paMessage(const char *what, PaError err)
{
    return std::string{"PortAudioSink: "} + what + ": " + Pa_GetErrorText(err);
}

} // anonymous namespace

core::Expected<std::unique_ptr<graph::IAudioSink>> PortAudioSink::create()
{
    if (PaError err = Pa_Initialize(); err != paNoError)
        return core::makeError(core::ErrorCode::kDeviceOpenFailed, paMessage("initialize", err));

    if (Pa_GetDefaultOutputDevice() == paNoDevice)
    {
        Pa_Terminate();
        return core::makeError(core::ErrorCode::kDeviceNotFound, "PortAudioSink: no default output device");
    }

    return std::unique_ptr<graph::IAudioSink>{new PortAudioSink{}};
}

PortAudioSink::~PortAudioSink()
{
    close();
    Pa_Terminate();
}

core::ExpectedVoid PortAudioSink::open(const graph::SinkFormat &format, graph::RenderCallback callback)
{
    std::lock_guard lock{_mutex};
    if (_stream)
        return core::makeError(core::ErrorCode::kInvalidState, "PortAudioSink: already open");
    if (format.sampleRate == 0 || format.channels == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "PortAudioSink: invalid format");

    PaStreamParameters params{};
    params.device = Pa_GetDefaultOutputDevice();
    if (params.device == paNoDevice)
        return core::makeError(core::ErrorCode::kDeviceNotFound, "PortAudioSink: no default output device");

    const PaDeviceInfo *info = Pa_GetDeviceInfo(params.device);
    params.channelCount              = static_cast<int>(format.channels);
    params.sampleFormat              = paFloat32;
    params.suggestedLatency          = info ? info->defaultLowOutputLatency : 0.0;
    params.hostApiSpecificStreamInfo = nullptr;

    _format = format;
    _render = std::move(callback);

    PaStream *stream = nullptr;
    const unsigned long framesPerBuffer = format.framesPerBuffer ? format.framesPerBuffer
                                                                 : paFramesPerBufferUnspecified;
    PaError err = Pa_OpenStream(&stream, nullptr, &params, static_cast<double>(format.sampleRate),
                                framesPerBuffer, paClipOff, &PortAudioSink::callback, this);
    if (err != paNoError)
    {
        _render = nullptr;
        return core::makeError(core::ErrorCode::kDeviceOpenFailed, paMessage("open", err));
    }

    _stream = stream;
    core::Log::info("device", std::string{"opened '"} + (info ? info->name : "default") + "' at "
                                  + std::to_string(format.sampleRate) + " Hz");
    return {};
}

core::ExpectedVoid PortAudioSink::start()
{
    std::lock_guard lock{_mutex};
    if (!_stream)
        return core::makeError(core::ErrorCode::kDeviceClosed, "PortAudioSink: start on a closed sink");
    if (_started.load(std::memory_order_acquire))
        return {};

    if (PaError err = Pa_StartStream(static_cast<PaStream *>(_stream)); err != paNoError)
        return core::makeError(core::ErrorCode::kDeviceStartFailed, paMessage("start", err));
    _started.store(true, std::memory_order_release);
    return {};
}

core::ExpectedVoid PortAudioSink::stop()
{
    std::lock_guard lock{_mutex};
    if (!_stream)
        return core::makeError(core::ErrorCode::kDeviceClosed, "PortAudioSink: stop on a closed sink");
    if (!_started.load(std::memory_order_acquire))
        return {};

    if (PaError err = Pa_StopStream(static_cast<PaStream *>(_stream)); err != paNoError)
        return core::makeError(core::ErrorCode::kInternalError, paMessage("stop", err));
    _started.store(false, std::memory_order_release);
    return {};
}

void PortAudioSink::close()
{
    std::lock_guard lock{_mutex};
    if (!_stream)
        return;

    auto *stream = static_cast<PaStream *>(_stream);
    if (_started.exchange(false, std::memory_order_acq_rel))
        Pa_StopStream(stream);
    if (PaError err = Pa_CloseStream(stream); err != paNoError)
        core::Log::warn("device", paMessage("close", err));

    _stream = nullptr;
    _render = nullptr;
}

bool PortAudioSink::isOpen() const
{
    std::lock_guard lock{_mutex};
    return _stream != nullptr;
}

bool PortAudioSink::isStarted() const
{
    return _started.load(std::memory_order_acquire);
}

int PortAudioSink::callback(const void * /*input*/, void *output, unsigned long frames,
                            const PaStreamCallbackTimeInfo * /*timeInfo*/, unsigned long /*statusFlags*/,
                            void *userData)
{
    auto *self = static_cast<PortAudioSink *>(userData);
    auto *out  = static_cast<float *>(output);
    const std::span<float> buffer{out, frames * self->_format.channels};

    self->_render(buffer, static_cast<core::u32>(frames));
    return paContinue;
}

} // namespace orb::device
