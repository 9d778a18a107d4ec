/**
 * @file ThreadPool.hpp
 * @brief Fixed-size thread pool with std::future-based task submission.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef ORB_CONCURRENCY_THREADPOOL_HPP
    #define ORB_CONCURRENCY_THREADPOOL_HPP

#include <orb/core/Types.hpp>
#include <orb/core/NonCopyable.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace orb::concurrency {

/**
 * @class ThreadPool
 * @brief Simple fixed-thread-count pool.
 *
 * Workers pull tasks from a shared FIFO queue protected by a mutex +
 * condition variable.  The engine keeps a single worker so that slow
 * device operations (opening an output stream to resume the context)
 * never block the main thread and stay ordered among themselves.
 *
 * Call @ref shutdown to drain all queued tasks; the destructor calls
 * @c shutdown implicitly.
 */
class ThreadPool final : public core::NonCopyable<ThreadPool>
{
public:
    /**
     * @brief Creates the pool with @p threadCount worker threads.
     * @param threadCount Number of worker threads.  Zero means
     *        @c std::thread::hardware_concurrency().
     */
    explicit ThreadPool(core::u32 threadCount = 0);

    /** @brief Drains pending tasks and joins all workers. */
    ~ThreadPool();

    /**
     * @brief Enqueues a callable and returns its future.
     * @tparam F Callable type.
     * @param func Callable to execute.
     * @return @c std::future holding the return value.
     */
    template <typename F>
    [[nodiscard]] auto enqueue(F&& func)
        -> std::future<std::invoke_result_t<F>>;

    /**
     * @brief Signals workers to finish and blocks until all pending tasks
     *        are processed.
     */
    void shutdown();

    /** @brief Returns the number of worker threads. */
    [[nodiscard]] core::u32 threadCount() const noexcept;

private:
    void workerLoop();

    std::vector<std::thread>            _workers;
    std::deque<std::function<void()>>   _tasks;
    std::mutex                          _mutex;
    std::condition_variable             _cv;
    bool                                _stopping{false}; // guarded by _mutex
};

// /////////////////////////////////////////////////////////////////////////////
//  Template implementations                                                  //
// /////////////////////////////////////////////////////////////////////////////

template <typename F>
auto ThreadPool::enqueue(F&& func)
    -> std::future<std::invoke_result_t<F>>
{
    using ReturnType = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(func));

    std::future<ReturnType> future = task->get_future();

    {
        std::lock_guard<std::mutex> lock{_mutex};
        // after shutdown the task is dropped and the future reports broken_promise
        if (_stopping)
            return future;
        _tasks.emplace_back([task]() { (*task)(); });
    }
    _cv.notify_one();

    return future;
}

} // namespace orb::concurrency

#endif // ORB_CONCURRENCY_THREADPOOL_HPP
