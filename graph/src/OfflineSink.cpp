/**
 * @file OfflineSink.cpp
 * @brief OfflineSink implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/graph/OfflineSink.hpp>

#include <algorithm>

namespace orb::graph {

OfflineSink::~OfflineSink()
{
    close();
}

core::ExpectedVoid OfflineSink::open(const SinkFormat &format, RenderCallback callback)
{
    std::lock_guard lock{_mutex};
    if (_open)
        return core::makeError(core::ErrorCode::kInvalidState, "OfflineSink: already open");
    if (format.sampleRate == 0 || format.channels == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "OfflineSink: invalid format");

    _format   = format;
    _callback = std::move(callback);
    _open     = true;
    return {};
}

core::ExpectedVoid OfflineSink::start()
{
    std::lock_guard lock{_mutex};
    if (!_open)
        return core::makeError(core::ErrorCode::kDeviceClosed, "OfflineSink: start on a closed sink");
    _started.store(true, std::memory_order_release);
    return {};
}

core::ExpectedVoid OfflineSink::stop()
{
    std::lock_guard lock{_mutex};
    if (!_open)
        return core::makeError(core::ErrorCode::kDeviceClosed, "OfflineSink: stop on a closed sink");
    _started.store(false, std::memory_order_release);
    return {};
}

void OfflineSink::close()
{
    std::lock_guard lock{_mutex};
    _started.store(false, std::memory_order_release);
    _open = false;
    _callback = nullptr;
}

bool OfflineSink::isOpen() const
{
    std::lock_guard lock{_mutex};
    return _open;
}

bool OfflineSink::isStarted() const
{
    return _started.load(std::memory_order_acquire);
}

std::span<const float> OfflineSink::pull(core::u32 frames)
{
    std::lock_guard lock{_mutex};
    if (!_open)
        return {};

    const core::usize samples = static_cast<core::usize>(frames) * _format.channels;
    _buffer.resize(samples);
    std::span<float> out{_buffer.data(), samples};

    if (_started.load(std::memory_order_acquire) && _callback)
        _callback(out, frames);
    else
        std::fill(out.begin(), out.end(), 0.0f);

    _framesPulled += frames;
    return out;
}

} // namespace orb::graph
