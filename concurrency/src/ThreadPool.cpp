/**
 * @file ThreadPool.cpp
 * @brief Implementation of the fixed-size thread pool.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/concurrency/ThreadPool.hpp>
#include <orb/core/Assert.hpp>

namespace orb::concurrency {

// -------------------------------------------------------------------------- //
//  Construction / Destruction                                                //
// -------------------------------------------------------------------------- //

ThreadPool::ThreadPool(core::u32 threadCount)
{
    core::u32 count = (threadCount == 0)
        ? static_cast<core::u32>(std::thread::hardware_concurrency())
        : threadCount;
    if (count == 0)
    {
        count = 1;
    }

    _workers.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
    {
        _workers.emplace_back(&ThreadPool::workerLoop, this);
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_stopping)
        {
            return;
        }
        _stopping = true;
    }

    _cv.notify_all();

    for (auto& worker : _workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

core::u32 ThreadPool::threadCount() const noexcept
{
    return static_cast<core::u32>(_workers.size());
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

void ThreadPool::workerLoop()
{
    for (;;)
    {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock{_mutex};
            _cv.wait(lock, [this] { return _stopping || !_tasks.empty(); });

            if (_tasks.empty())
            {
                return;
            }

            task = std::move(_tasks.front());
            _tasks.pop_front();
        }

        ORB_ASSERT(task);
        task();
    }
}

} // namespace orb::concurrency
