/**
 * @file PcmMediaStream.cpp
 * @brief PcmMediaStream implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/graph/PcmMediaStream.hpp>

namespace orb::graph {

PcmMediaStream::PcmMediaStream(std::string id) : _id{std::move(id)} {}

core::usize PcmMediaStream::write(std::span<const float> samples)
{
    if (_ended.load(std::memory_order_acquire))
        return 0;
    return _ring.pushSome(samples);
}

void PcmMediaStream::setActive(bool active) noexcept
{
    _active.store(active, std::memory_order_release);
}

void PcmMediaStream::end() noexcept
{
    _ended.store(true, std::memory_order_release);
}

bool PcmMediaStream::ended() const noexcept
{
    return _ended.load(std::memory_order_acquire);
}

core::usize PcmMediaStream::buffered() const
{
    return _ring.size();
}

bool PcmMediaStream::active() const
{
    return _active.load(std::memory_order_acquire) && !ended();
}

core::usize PcmMediaStream::read(std::span<float> out)
{
    if (!active())
        return 0;
    return _ring.drain(out);
}

} // namespace orb::graph
