/**
 * @file event_bus.hpp
 * @brief Type-indexed publish/subscribe channel for export progress.
 */

#ifndef MAINTLOG_EVENT_BUS_HPP
#define MAINTLOG_EVENT_BUS_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace maintlog {

    /**
     * @brief Routes events (see events.hpp) from ReportGenerator to whoever
     * subscribed to their type.
     *
     * @details Normalization workers publish concurrently. Each event type
     * owns an immutable handler list that subscribe() replaces wholesale, so
     * publish() only takes the lock long enough to grab a reference to the
     * current list. Handlers run on the publishing thread with no lock held.
     */
    class EventBus {
    public:
        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /// Adds `handler` for events of type Event. Takes effect for later publish() calls.
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            Handler erased = [handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            };
            std::lock_guard lock(mtx_);
            auto& slot = channels_[std::type_index(typeid(Event))];
            auto next = slot ? std::make_shared<HandlerList>(*slot) : std::make_shared<HandlerList>();
            next->push_back(std::move(erased));
            slot = std::move(next);
        }

        /// Delivers `event` to every handler subscribed to its type, in subscription order.
        template <typename Event>
        void publish(const Event& event) const {
            std::shared_ptr<const HandlerList> handlers;
            {
                std::lock_guard lock(mtx_);
                const auto it = channels_.find(std::type_index(typeid(Event)));
                if (it == channels_.end()) return;
                handlers = it->second;
            }
            for (const auto& fn : *handlers) {
                fn(&event);
            }
        }

    private:
        using Handler = std::function<void(const void*)>;
        using HandlerList = std::vector<Handler>;

        std::unordered_map<std::type_index, std::shared_ptr<const HandlerList>> channels_;
        mutable std::mutex mtx_;
    };

} // namespace maintlog

#endif // MAINTLOG_EVENT_BUS_HPP
