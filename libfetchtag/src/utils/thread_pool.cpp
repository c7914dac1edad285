//
// Created by Giuseppe Francione on 16/10/26.
//

#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    for (;;) {
        std::function<void(std::stop_token)> task;
        {
            std::unique_lock lock(queue_mutex_);
            condition_.wait(lock, st, [this] {
                return stop_ || !tasks_.empty();
            });
            if (stop_ || st.stop_requested())
                return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task stores exceptions in the future; this only catches
        // failures of the wrapper itself
        try {
            task(st);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Unhandled exception in thread pool: ") + e.what(), "thread_pool");
        }

        {
            std::lock_guard lock(queue_mutex_);
            if (pending_ > 0) --pending_;
        }
        idle_cv_.notify_all();
    }
}

void ThreadPool::request_stop() {
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
        while (!tasks_.empty()) {
            tasks_.pop();
            if (pending_ > 0) {
                pending_--;
            }
        }
    }
    condition_.notify_all();
    idle_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return pending_ == 0;
    });
}

ThreadPool::~ThreadPool() {
    request_stop();
    // std::jthread joins on destruction
}
