//
// Created by Giuseppe Francione on 16/10/26.
//

/**
 * @file thread_pool.hpp
 * @brief Small fixed-size pool of std::jthread workers.
 *
 * The completion detector uses it to stabilize several simultaneous
 * downloads at once; every task receives the worker's stop_token so a
 * cancelled drain stops polling promptly.
 */

#ifndef FETCHTAG_THREAD_POOL_HPP
#define FETCHTAG_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <stop_token>
#include <thread>

class ThreadPool {
public:
    /**
     * @param threads Worker count; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads);

    /**
     * @brief Requests stop, discards queued tasks and joins the workers.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable taking a std::stop_token.
     * @return Future for the callable's result; exceptions propagate through it.
     * @throws std::runtime_error if the pool is already stopping.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        auto future = task->get_future();
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(std::move(st)); });
        }
        condition_.notify_one();
        return future;
    }

    /**
     * @brief Block until every queued and running task has finished.
     */
    void wait_idle();

    /**
     * @brief Drop queued tasks and signal running ones through their stop_token.
     */
    void request_stop();

    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

private:
    void worker_loop(const std::stop_token& st);

    std::mutex queue_mutex_;
    std::condition_variable_any condition_;
    std::condition_variable idle_cv_;
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    size_t pending_{0};
    std::vector<std::jthread> workers_;
};

#endif // FETCHTAG_THREAD_POOL_HPP
