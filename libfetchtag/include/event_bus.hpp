//
// Created by Giuseppe Francione on 16/10/26.
//

/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus for workflow notifications.
 */

#ifndef FETCHTAG_EVENT_BUS_HPP
#define FETCHTAG_EVENT_BUS_HPP

#include <functional>
#include <unordered_map>
#include <typeindex>
#include <vector>
#include <mutex>

namespace fetchtag {

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details The workflow worker, the detector and the tag engine publish
     * from their own threads; the CLI (or a GUI) subscribes once at start-up.
     * Handlers run on the publishing thread, outside the bus lock, so a
     * handler may itself publish or subscribe.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., WorkflowSucceededEvent).
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([h = std::move(handler)](const void* e) {
                h(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Callback> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                targets = it->second;
            }
            for (const auto& fn : targets) {
                fn(&event);
            }
        }

        /// @brief Drop every subscription.
        void clear() {
            std::lock_guard lock(mtx_);
            subscribers_.clear();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        mutable std::mutex mtx_;
    };

} // namespace fetchtag

#endif // FETCHTAG_EVENT_BUS_HPP
