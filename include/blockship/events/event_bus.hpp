/**
 * @file event_bus.hpp
 * @brief Type-safe synchronous event bus
 *
 * WHY THIS FILE EXISTS:
 * The shipper reports what it does (sync passes, uploads, failures) as
 * events instead of talking to a metrics backend directly. Whoever owns the
 * bus decides what listens: the daemon attaches a MetricsComponent, tests
 * attach their own recorders, an embedding process can attach an exporter.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<BlockUploadedEvent>([](const BlockUploadedEvent& e) { ... });
 * bus.emit(BlockUploadedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace blockship::events {

/**
 * @brief Dispatches events to handlers registered for their exact type
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/emit may be called concurrently
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may itself subscribe or emit
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register `handler` for events of type EventType
     *
     * RETURNS:
     * Subscription id accepted by unsubscribe()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const std::size_t handler_id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(
            handler_id, std::make_shared<HandlerImpl<EventType>>(std::move(handler)));
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const auto& entry) { return entry.first == handler_id; }),
                   list.end());
    }

    /**
     * @brief Deliver `event` to every handler of its type
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the exception does not reach the emitter.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                targets.push_back(handler);
            }
        }

        for (const auto& handler : targets) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

} // namespace blockship::events
