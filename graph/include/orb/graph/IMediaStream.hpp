/**
 * @file IMediaStream.hpp
 * @brief Remote participant stream handed over by the media-track layer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_IMEDIA_STREAM_HPP
    #define ORB_GRAPH_IMEDIA_STREAM_HPP

    #include <orb/core/Types.hpp>

    #include <span>
    #include <string_view>

namespace orb::graph {

/**
 * @brief Mono PCM producer read by a MediaStreamSourceNode.
 *
 * read() is called from the render thread and must not block.
 */
class IMediaStream {
public:
    virtual ~IMediaStream() = default;

    [[nodiscard]] virtual std::string_view id() const = 0;

    /** @brief False once the track ended or was muted at the source. */
    [[nodiscard]] virtual bool active() const = 0;

    /**
     * @brief Copies up to @p out.size() samples at the context rate.
     * @return Number of samples written; the remainder is left untouched.
     */
    virtual core::usize read(std::span<float> out) = 0;
};

} // namespace orb::graph

#endif // ORB_GRAPH_IMEDIA_STREAM_HPP
