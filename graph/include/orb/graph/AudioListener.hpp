/**
 * @file AudioListener.hpp
 * @brief The single listener of an AudioContext (position + orientation).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_GRAPH_AUDIO_LISTENER_HPP
    #define ORB_GRAPH_AUDIO_LISTENER_HPP

    #include <orb/math/Vec3.hpp>
    #include <orb/core/NonCopyable.hpp>
    #include <orb/concurrency/SpinLock.hpp>

namespace orb::graph {

/** @brief Listener pose as seen by the panners during one quantum. */
struct ListenerPose {
    math::Vec3f position{0.0f, 0.0f, 0.0f};
    math::Vec3f forward{0.0f, 0.0f, -1.0f};
    math::Vec3f up{0.0f, 1.0f, 0.0f};
};

class AudioListener final : public core::NonCopyable<AudioListener> {
public:
    AudioListener() = default;

    void setPosition(const math::Vec3f &position);
    void setOrientation(const math::Vec3f &forward, const math::Vec3f &up);

    [[nodiscard]] ListenerPose pose() const;

private:
    mutable concurrency::SpinLock _lock;
    ListenerPose                  _pose;
};

} // namespace orb::graph

#endif // ORB_GRAPH_AUDIO_LISTENER_HPP
