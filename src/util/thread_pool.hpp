#ifndef PIIANON_UTIL_THREAD_POOL_HPP
#define PIIANON_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool. CSV row partitions and LLM second-pass
 *        requests are both scheduled on it.
 *
 * The worker count is the concurrency bound: with N workers at most N
 * queued tasks run at once, so a pool sized to the LLM concurrency limit
 * acts as its counting semaphore. Tasks that are never enqueued take no slot.
 *
 * Usage Example:
 *  @code
 *    piianon::util::ThreadPool pool(4);
 *    auto result = pool.enqueue([](int x) { return x * x; }, 10);
 *    std::cout << result.get() << std::endl;
 *  @endcode
 */

namespace piianon {
namespace util {

/**
 * @class ThreadPool
 * @brief A basic fixed-size thread pool.
 *
 * - Constructor spawns a given number of worker threads.
 * - enqueue(...) schedules a task and returns a future for its result;
 *   an exception thrown by the task is rethrown from future::get().
 * - Destructor drains the queue and joins every worker.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero uses hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const { return workers_.size(); }

    /**
     * @brief Enqueue a callable for asynchronous execution.
     * @return A future holding the callable's result (or its exception).
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = taskPtr->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        condVar_.notify_one();
        return res;
    }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] {
                    return !taskQueue_.empty() || stop_;
                });

                if (stop_ && taskQueue_.empty()) {
                    return;
                }
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> taskQueue_;
    std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_THREAD_POOL_HPP
