//
// Created by Giuseppe Francione on 16/10/26.
//

/**
 * @file event_channel.hpp
 * @brief Unbounded multi-producer queue with a cancellable timed pop.
 *
 * The inotify observer pushes newly seen paths; the stabilization loop pops
 * them. Decouples event arrival from poll timing.
 */

#ifndef FETCHTAG_EVENT_CHANNEL_HPP
#define FETCHTAG_EVENT_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace fetchtag {

template <typename T>
class EventChannel {
public:
    void push(T value) {
        {
            std::lock_guard lock(mtx_);
            if (closed_) return;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    /**
     * @brief Wait up to @p timeout for an item.
     * @return nullopt on timeout, on stop request or when the channel is closed and empty.
     */
    template <typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period> timeout, const std::stop_token& st) {
        std::unique_lock lock(mtx_);
        cv_.wait_for(lock, st, timeout, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /// @brief Take everything currently queued without blocking.
    std::vector<T> drain() {
        std::lock_guard lock(mtx_);
        std::vector<T> out(std::make_move_iterator(queue_.begin()),
                           std::make_move_iterator(queue_.end()));
        queue_.clear();
        return out;
    }

    /// @brief Wake all waiters; later pushes are ignored.
    void close() {
        {
            std::lock_guard lock(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// @brief Empty the queue and accept pushes again.
    void reset() {
        std::lock_guard lock(mtx_);
        queue_.clear();
        closed_ = false;
    }

private:
    std::mutex mtx_;
    std::condition_variable_any cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace fetchtag

#endif // FETCHTAG_EVENT_CHANNEL_HPP
