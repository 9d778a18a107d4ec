/**
 * @file AudioBus.hpp
 * @brief Planar block of mono or stereo samples exchanged between nodes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_AUDIO_BUS_HPP
    #define ORB_GRAPH_AUDIO_BUS_HPP

    #include <orb/core/Types.hpp>

    #include <array>
    #include <span>
    #include <vector>

namespace orb::graph {

/**
 * @brief One render quantum of planar audio (1 or 2 channels).
 *
 * Storage is reserved once for the largest block size so that the render
 * thread never allocates after the first quantum.
 */
class AudioBus final {
public:
    static constexpr core::u32 kMaxChannels = 2;

    AudioBus() = default;
    AudioBus(core::u32 channels, core::u32 frames);

    /** @brief Resizes the bus; only allocates when @p frames grows. */
    void configure(core::u32 channels, core::u32 frames);

    void zero();

    /**
     * @brief Mixes @p other into this bus with speaker up/down-mix rules.
     *
     * Mono to stereo copies the signal to both channels; stereo to mono
     * averages left and right.
     */
    void accumulate(const AudioBus &other);

    [[nodiscard]] core::u32 channels() const noexcept { return _channels; }
    [[nodiscard]] core::u32 frames()   const noexcept { return _frames; }

    [[nodiscard]] std::span<float>       channel(core::u32 index);
    [[nodiscard]] std::span<const float> channel(core::u32 index) const;

private:
    core::u32 _channels{1};
    core::u32 _frames{0};
    std::array<std::vector<float>, kMaxChannels> _data;
};

} // namespace orb::graph

#endif // ORB_GRAPH_AUDIO_BUS_HPP
