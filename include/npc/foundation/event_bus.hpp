#pragma once

/// @file event_bus.hpp
/// @brief Typed synchronous event bus for one-way observability events.
///
/// Publishers never observe handler results; events such as
/// `AITickEvent` are diagnostic and must not feed back into control flow.

#include <algorithm>
#include <any>
#include <cstdint>
#include <functional>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace npc::foundation {

/// Unique identifier for an event subscription.
using SubscriptionId = uint64_t;

/// Dispatches events to handlers registered for the concrete event type.
///
/// Handlers run in priority order (lower value first); equal priorities
/// keep subscription order.  The bus is single-threaded, like the tick
/// loop that drives it.
///
/// Usage:
/// @code
///   EventBus bus;
///   auto id = bus.Subscribe<AITickEvent>([](const AITickEvent& e) {
///       // inspect e.entity / e.status
///   });
///   bus.Publish(AITickEvent{entity, BTStatus::Running});
///   bus.Unsubscribe(id);
/// @endcode
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) noexcept = default;
    EventBus& operator=(EventBus&&) noexcept = default;

    /// Subscribe a handler for events of type E.
    ///
    /// @param priority  Lower values are called first (default 0).
    /// @return A subscription ID for later Unsubscribe().
    template <typename E>
    SubscriptionId Subscribe(std::function<void(const E&)> handler,
                             int32_t priority = 0) {
        auto id = nextId_++;
        auto typeIdx = std::type_index(typeid(E));

        HandlerEntry entry;
        entry.id = id;
        entry.priority = priority;
        entry.handler = [fn = std::move(handler)](const std::any& event) {
            fn(std::any_cast<const E&>(event));
        };

        auto& handlers = handlers_[typeIdx];
        handlers.push_back(std::move(entry));
        std::stable_sort(handlers.begin(), handlers.end(),
                         [](const HandlerEntry& a, const HandlerEntry& b) {
                             return a.priority < b.priority;
                         });

        subscriptionTypes_.insert_or_assign(id, typeIdx);
        return id;
    }

    /// Remove a subscription by ID.  Unknown IDs are ignored.
    void Unsubscribe(SubscriptionId id) {
        auto typeIt = subscriptionTypes_.find(id);
        if (typeIt == subscriptionTypes_.end()) {
            return;
        }

        auto handlersIt = handlers_.find(typeIt->second);
        if (handlersIt != handlers_.end()) {
            auto& vec = handlersIt->second;
            vec.erase(std::remove_if(vec.begin(), vec.end(),
                                     [id](const HandlerEntry& e) { return e.id == id; }),
                      vec.end());
            if (vec.empty()) {
                handlers_.erase(handlersIt);
            }
        }

        subscriptionTypes_.erase(typeIt);
    }

    void UnsubscribeAll() {
        handlers_.clear();
        subscriptionTypes_.clear();
    }

    /// Publish an event to all handlers for type E, immediately.
    ///
    /// The handler list is copied first, so handlers may subscribe or
    /// unsubscribe while being dispatched.
    template <typename E>
    void Publish(const E& event) {
        auto it = handlers_.find(std::type_index(typeid(E)));
        if (it == handlers_.end()) {
            return;
        }
        auto snapshot = it->second;

        std::any wrapped = event;
        for (const auto& entry : snapshot) {
            entry.handler(wrapped);
        }
    }

    [[nodiscard]] std::size_t HandlerCount() const {
        std::size_t count = 0;
        for (const auto& [_, handlers] : handlers_) {
            count += handlers.size();
        }
        return count;
    }

    template <typename E>
    [[nodiscard]] std::size_t HandlerCountFor() const {
        auto it = handlers_.find(std::type_index(typeid(E)));
        return it == handlers_.end() ? 0 : it->second.size();
    }

private:
    struct HandlerEntry {
        SubscriptionId id = 0;
        int32_t priority = 0;
        std::function<void(const std::any&)> handler;
    };

    /// type_index -> handlers sorted by priority.
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;

    /// Subscription ID -> event type, for type-erased unsubscribe.
    std::unordered_map<SubscriptionId, std::type_index> subscriptionTypes_;

    SubscriptionId nextId_ = 1;
};

} // namespace npc::foundation
