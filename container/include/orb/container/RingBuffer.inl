/**
 * @file RingBuffer.inl
 * @brief Template implementation of the SPSC lock-free ring buffer.
 *
 * Bulk transfers copy at most two contiguous segments so a render
 * quantum of PCM moves with two memcpy-sized copies.
 * @see   RingBuffer.hpp
 */

#ifndef ORB_CONTAINER_RING_BUFFER_INL
    #define ORB_CONTAINER_RING_BUFFER_INL

#include <algorithm>

namespace orb::container {

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::push(const T &item)
{
    auto tail = _tail.load(std::memory_order_relaxed);
    auto next = (tail + 1) & kMask;

    if (next == _head.load(std::memory_order_acquire))
        return false;

    _buffer[tail] = item;
    _tail.store(next, std::memory_order_release);
    return true;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
core::usize RingBuffer<T, C>::pushSome(std::span<const T> in)
{
    const auto tail = _tail.load(std::memory_order_relaxed);
    const auto head = _head.load(std::memory_order_acquire);
    const core::usize count = std::min(in.size(), (head - tail - 1) & kMask);

    // at most two contiguous segments: [tail, end) then [0, rest)
    const core::usize first = std::min(count, C - tail);
    std::copy_n(in.data(), first, _buffer.data() + tail);
    std::copy_n(in.data() + first, count - first, _buffer.data());

    _tail.store((tail + count) & kMask, std::memory_order_release);
    return count;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::pop(T &item)
{
    auto head = _head.load(std::memory_order_relaxed);

    if (head == _tail.load(std::memory_order_acquire))
        return false;

    item = _buffer[head];
    _head.store((head + 1) & kMask, std::memory_order_release);
    return true;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
core::usize RingBuffer<T, C>::drain(std::span<T> out)
{
    const auto head = _head.load(std::memory_order_relaxed);
    const auto tail = _tail.load(std::memory_order_acquire);
    const core::usize count = std::min(out.size(), (tail - head) & kMask);

    const core::usize first = std::min(count, C - head);
    std::copy_n(_buffer.data() + head, first, out.data());
    std::copy_n(_buffer.data(), count - first, out.data() + first);

    _head.store((head + count) & kMask, std::memory_order_release);
    return count;
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::isFull() const
{
    auto next = (_tail.load(std::memory_order_relaxed) + 1) & kMask;
    return next == _head.load(std::memory_order_acquire);
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
bool RingBuffer<T, C>::isEmpty() const
{
    return _head.load(std::memory_order_acquire) == _tail.load(std::memory_order_acquire);
}

template <typename T, core::usize C>
    requires (std::has_single_bit(C) && std::is_trivially_copyable_v<T>)
core::usize RingBuffer<T, C>::size() const
{
    auto h = _head.load(std::memory_order_acquire);
    auto t = _tail.load(std::memory_order_acquire);
    return (t - h) & kMask;
}

} // namespace orb::container

#endif // ORB_CONTAINER_RING_BUFFER_INL
