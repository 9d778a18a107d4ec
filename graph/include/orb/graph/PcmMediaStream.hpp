/**
 * @file PcmMediaStream.hpp
 * @brief IMediaStream fed with decoded PCM through a lock-free ring.
 *
 * The track layer (producer) calls write() from its decode thread; the
 * render thread (consumer) calls read().
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_PCM_MEDIA_STREAM_HPP
    #define ORB_GRAPH_PCM_MEDIA_STREAM_HPP

    #include <orb/graph/IMediaStream.hpp>
    #include <orb/container/RingBuffer.hpp>
    #include <orb/core/Constants.hpp>

    #include <atomic>
    #include <string>

namespace orb::graph {

class PcmMediaStream final : public IMediaStream {
public:
    explicit PcmMediaStream(std::string id);

    /**
     * @brief Enqueues decoded samples.
     * @return Number of samples accepted; the rest are dropped when full.
     */
    core::usize write(std::span<const float> samples);

    void setActive(bool active) noexcept;

    /** @brief Marks the track as ended; subsequent reads yield nothing. */
    void end() noexcept;

    [[nodiscard]] bool        ended()    const noexcept;
    [[nodiscard]] core::usize buffered() const;

    [[nodiscard]] std::string_view id()     const override { return _id; }
    [[nodiscard]] bool             active() const override;
    core::usize read(std::span<float> out) override;

private:
    std::string _id;
    std::atomic<bool> _active{true};
    std::atomic<bool> _ended{false};
    container::RingBuffer<float, core::kMediaStreamRingSlots> _ring;
};

} // namespace orb::graph

#endif // ORB_GRAPH_PCM_MEDIA_STREAM_HPP
