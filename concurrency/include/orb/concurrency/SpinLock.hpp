/**
 * @file SpinLock.hpp
 * @brief Spin-lock shared between control and render threads.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef ORB_CONCURRENCY_SPINLOCK_HPP
    #define ORB_CONCURRENCY_SPINLOCK_HPP

#include <orb/core/NonCopyable.hpp>
#include <orb/core/Types.hpp>

#include <atomic>
#include <mutex>
#include <thread>

#if defined(__x86_64__) || defined(__i386__) || defined(_M_X64) || defined(_M_IX86)
    #include <immintrin.h>
#endif

namespace orb::concurrency {

/**
 * @class SpinLock
 * @brief Test-and-test-and-set lock guarding parameter and pose snapshots.
 *
 * Critical sections are a handful of loads and stores (an AudioParam
 * target, a listener pose), so the render thread never parks on an OS
 * mutex.  A waiter pauses the CPU for kSpinsBeforeYield rounds and then
 * yields its time slice, which keeps a preempted holder on a loaded
 * machine from starving it.
 *
 * Models BasicLockable.
 */
class SpinLock final : public core::NonCopyable<SpinLock>
{
public:
    SpinLock() noexcept = default;

    void lock() noexcept
    {
        core::u32 spins = 0;
        while (_flag.test_and_set(std::memory_order_acquire))
        {
            while (_flag.test(std::memory_order_relaxed))
            {
                if (++spins < kSpinsBeforeYield)
                    relax();
                else
                    std::this_thread::yield();
            }
        }
    }

    void unlock() noexcept
    {
        _flag.clear(std::memory_order_release);
    }

private:
    static constexpr core::u32 kSpinsBeforeYield = 64;

    static void relax() noexcept
    {
#if defined(__x86_64__) || defined(__i386__) || defined(_M_X64) || defined(_M_IX86)
        _mm_pause();
#elif defined(__aarch64__)
        __asm__ volatile("yield");
#endif
    }

    std::atomic_flag _flag = ATOMIC_FLAG_INIT;
};

/** @brief Scoped owner of a SpinLock. */
using SpinLockGuard = std::lock_guard<SpinLock>;

} // namespace orb::concurrency

#endif // ORB_CONCURRENCY_SPINLOCK_HPP
