/**
 * @file OfflineSink.hpp
 * @brief Sink rendered on demand by its owner instead of a device thread.
 *
 * Used by the simulator and by the tests: every pull() renders exactly
 * the requested number of frames, which keeps the output deterministic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_OFFLINE_SINK_HPP
    #define ORB_GRAPH_OFFLINE_SINK_HPP

    #include <orb/graph/IAudioSink.hpp>

    #include <atomic>
    #include <mutex>
    #include <vector>

namespace orb::graph {

class OfflineSink final : public IAudioSink {
public:
    OfflineSink() = default;
    ~OfflineSink() override;

    [[nodiscard]] core::ExpectedVoid open(const SinkFormat &format, RenderCallback callback) override;
    [[nodiscard]] core::ExpectedVoid start() override;
    [[nodiscard]] core::ExpectedVoid stop()  override;
    void close() override;

    [[nodiscard]] bool             isOpen()    const override;
    [[nodiscard]] bool             isStarted() const override;
    [[nodiscard]] std::string_view name()      const override { return "offline"; }

    /**
     * @brief Renders @p frames interleaved frames.
     *
     * A stopped sink yields silence without invoking the callback, like a
     * device whose stream is not running.  The returned view stays valid
     * until the next pull().
     */
    std::span<const float> pull(core::u32 frames);

    [[nodiscard]] const SinkFormat &format()       const noexcept { return _format; }
    [[nodiscard]] core::u64         framesPulled() const noexcept { return _framesPulled; }

private:
    mutable std::mutex _mutex;
    SinkFormat         _format{};
    RenderCallback     _callback;
    std::vector<float> _buffer;
    core::u64          _framesPulled{0};
    bool               _open{false};
    std::atomic<bool>  _started{false};
};

} // namespace orb::graph

#endif // ORB_GRAPH_OFFLINE_SINK_HPP
