/**
 * @file event_bus.hpp
 * @brief Simple, thread-safe publish/subscribe event bus.
 */

#ifndef FLASHSYNC_EVENT_BUS_HPP
#define FLASHSYNC_EVENT_BUS_HPP

#include <functional>
#include <unordered_map>
#include <typeindex>
#include <vector>
#include <mutex>

namespace flashsync {

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details SyncExecutor publishes per-file lifecycle events from its
     * worker threads; the Synchronizer facade subscribes to bridge them to a
     * SyncObserver. Handlers run on the publishing thread while the bus
     * mutex is held, so they are serialized and must not publish or
     * subscribe themselves.
     */
    class EventBus {
    public:
        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., FileSyncCompleteEvent).
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it != subscribers_.end()) {
                for (auto& fn : it->second) {
                    fn(&event);
                }
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace flashsync

#endif // FLASHSYNC_EVENT_BUS_HPP
