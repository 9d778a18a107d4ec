/**
 * @file RingBuffer.hpp
 * @brief Single-producer single-consumer lock-free ring buffer.
 *
 * Capacity must be a power of two so that modular arithmetic reduces to
 * a single bitwise AND.  Used to hand decoded PCM from the media-track
 * layer to the render thread.
 *
 * @tparam T        Element type (must be trivially copyable).
 * @tparam Capacity Number of slots (compile-time, power of two).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_CONTAINER_RING_BUFFER_HPP
    #define ORB_CONTAINER_RING_BUFFER_HPP

    #include <orb/core/Types.hpp>

    #include <atomic>
    #include <array>
    #include <bit>
    #include <span>
    #include <type_traits>

namespace orb::container {

/**
 * @brief SPSC lock-free circular buffer.
 *
 * Uses std::memory_order_acquire / release for the head and tail
 * indices.  One slot is kept free to distinguish full from empty, so at
 * most Capacity - 1 elements are stored.
 */
template <typename T, core::usize Capacity>
    requires (std::has_single_bit(Capacity) && std::is_trivially_copyable_v<T>)
class RingBuffer final {
public:
    /**
     * @brief Push one element into the buffer.
     * @return True on success, false if buffer is full.
     */
    bool push(const T &item);

    /**
     * @brief Push as many elements of @p in as fit.
     * @return Number of elements actually enqueued.
     */
    core::usize pushSome(std::span<const T> in);

    /**
     * @brief Pop one element from the buffer.
     * @param[out] item Destination for the dequeued element.
     * @return True on success, false if buffer is empty.
     */
    bool pop(T &item);

    /**
     * @brief Drain available elements into a span.
     * @return Number of elements actually drained.
     */
    core::usize drain(std::span<T> out);

    [[nodiscard]] bool        isFull()  const;
    [[nodiscard]] bool        isEmpty() const;
    [[nodiscard]] core::usize size()    const;

    /** @brief Maximum number of stored elements. */
    [[nodiscard]] static constexpr core::usize capacity() noexcept { return Capacity - 1; }

private:
    static constexpr core::usize kMask = Capacity - 1;

    std::array<T, Capacity>   _buffer{};
    std::atomic<core::usize>  _head{0};
    std::atomic<core::usize>  _tail{0};
};

} // namespace orb::container

    #include "RingBuffer.inl"

#endif // ORB_CONTAINER_RING_BUFFER_HPP
