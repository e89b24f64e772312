#ifndef REDACTOR_UTIL_THREAD_POOL_HPP
#define REDACTOR_UTIL_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <future>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <algorithm>

/**
 * @file thread_pool.hpp
 * @brief A fixed-size thread pool used to scan the documents of a batch in parallel.
 *
 * Only pure work (pattern scanning) is ever handed to the pool. Anything that
 * touches the secret registry or the validator cache stays on the calling thread.
 *
 * Usage Example:
 *  @code
 *    redactor::util::ThreadPool pool(4);
 *    auto lengths = pool.mapOrdered(documents,
 *        [](const std::string &doc) { return doc.size(); });
 *    // lengths[i] belongs to documents[i], whatever order the workers finished in
 *  @endcode
 */

namespace redactor {
namespace util {

/**
 * @class ThreadPool
 * @brief A basic fixed-size thread pool.
 *
 * - Constructor spawns a given number of worker threads.
 * - enqueue(...) schedules a task and returns its future.
 * - mapOrdered(...) fans a function out over a vector and gathers results in input order.
 * - Destructor drains the queue and joins the workers.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads to create. If zero, uses hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] {
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
            });
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

    size_t size() const
    {
        return workers_.size();
    }

    /**
     * @brief Enqueue a task for asynchronous execution.
     * @return A std::future for the task's result. Exceptions thrown by the
     *         task are rethrown from future::get().
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
                throw std::runtime_error("ThreadPool: enqueue on stopped pool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        condVar_.notify_one();
        return res;
    }

    /**
     * @brief Apply fn to every item concurrently; result i corresponds to items[i].
     *
     * Blocks until every task has finished. The first exception (in input
     * order) is rethrown after all tasks completed.
     */
    template<typename T, typename F>
    auto mapOrdered(const std::vector<T> &items, F fn)
        -> std::vector<typename std::invoke_result<F, const T&>::type>
    {
        using result_type = typename std::invoke_result<F, const T&>::type;

        std::vector<std::future<result_type>> futures;
        futures.reserve(items.size());
        for (const auto &item : items) {
            const T *itemPtr = &item;
            futures.push_back(enqueue([fn, itemPtr]() { return fn(*itemPtr); }));
        }

        for (auto &f : futures) {
            f.wait();
        }

        std::vector<result_type> results;
        results.reserve(futures.size());
        for (auto &f : futures) {
            results.push_back(f.get());
        }
        return results;
    }

private:
    std::vector<std::thread> workers_;               ///< The pool of worker threads
    std::queue<std::function<void()>> taskQueue_;    ///< Task queue
    std::mutex queueMutex_;                          ///< Mutex to protect the queue
    std::condition_variable condVar_;                ///< Condition variable for task readiness
    bool stop_;                                      ///< Signals the pool to stop accepting new tasks
};

} // namespace util
} // namespace redactor

#endif // REDACTOR_UTIL_THREAD_POOL_HPP
