/**
 * @file AudioListener.cpp
 * @brief AudioListener implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/graph/AudioListener.hpp>

namespace orb::graph {

void AudioListener::setPosition(const math::Vec3f &position)
{
    concurrency::SpinLockGuard guard{_lock};
    _pose.position = position;
}

void AudioListener::setOrientation(const math::Vec3f &forward, const math::Vec3f &up)
{
    concurrency::SpinLockGuard guard{_lock};
    _pose.forward = forward;
    _pose.up      = up;
}

ListenerPose AudioListener::pose() const
{
    concurrency::SpinLockGuard guard{_lock};
    return _pose;
}

} // namespace orb::graph
