/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe hub between the engines and their observers
 *
 * The drift detector and conflict resolver emit events without knowing who
 * handles them; LoggerComponent and MetricsComponent subscribe without
 * knowing who emits them.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<DriftCheckedEvent>([](const DriftCheckedEvent& e) { ... });
 * bus.emit(DriftCheckedEvent{row, "origin/main", "HEAD"});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace vsync::events {

/**
 * @brief Handler registry keyed by event type
 *
 * THREAD SAFETY:
 * Each event type owns an immutable handler list that subscribe() replaces
 * wholesale. emit() takes the current list under the lock and calls the
 * handlers outside it, so parallel drift workers emit concurrently and a
 * handler may subscribe without deadlocking. Handlers run in the emitting
 * thread.
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    void subscribe(std::function<void(const EventType&)> handler) {
        Handler erased = [fn = std::move(handler)](const void* event) {
            fn(*static_cast<const EventType*>(event));
        };

        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = handlers_[std::type_index(typeid(EventType))];
        auto next = slot ? std::make_shared<HandlerList>(*slot) : std::make_shared<HandlerList>();
        next->push_back(std::move(erased));
        slot = std::move(next);
    }

    /**
     * @brief Deliver event to every handler subscribed to its type
     *
     * A handler that throws is logged; the remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        const auto list = handlers_for(std::type_index(typeid(EventType)));
        if (!list) {
            return;
        }

        for (const auto& handler : *list) {
            try {
                handler(&event);
            } catch (const std::exception& e) {
                spdlog::error("Handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        const auto list = handlers_for(std::type_index(typeid(EventType)));
        return list ? list->size() : 0;
    }

private:
    using Handler = std::function<void(const void*)>;
    using HandlerList = std::vector<Handler>;

    std::shared_ptr<const HandlerList> handlers_for(std::type_index type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(type);
        return it != handlers_.end() ? it->second : nullptr;
    }

    std::unordered_map<std::type_index, std::shared_ptr<const HandlerList>> handlers_;
    mutable std::mutex mutex_;
};

} // namespace vsync::events
