/**
 * @file event_bus.hpp
 * @brief Type-safe in-process event bus
 *
 * Backup runs, the transfer client and the receiver publish what they do;
 * logging and metrics subscribe without either side knowing the other.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<BackupCompletedEvent>([](const BackupCompletedEvent& e) { ... });
 * bus.emit(BackupCompletedEvent{...});
 * bus.unsubscribe<BackupCompletedEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace mbk::events {

using SubscriptionId = std::uint64_t;

/**
 * @brief Dispatches events to the handlers registered for their exact type
 *
 * Each event type owns an immutable handler list that is replaced, never
 * edited, on subscribe and unsubscribe. emit() grabs the current list and
 * runs it without holding the lock.
 *
 * THREAD SAFETY:
 * - Multiple threads can emit and subscribe concurrently
 * - Handlers are called synchronously in the emitting thread
 * - A handler may subscribe, unsubscribe or emit from inside a callback
 * - A handler that throws is logged; the remaining handlers still run
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        Slot slot;
        slot.invoke = [fn = std::move(handler)](const void* event) {
            fn(*static_cast<const EventType*>(event));
        };

        std::unique_lock lock(mutex_);
        slot.id = ++last_id_;
        auto& current = slots_[key<EventType>()];
        auto next = current ? std::make_shared<SlotList>(*current) : std::make_shared<SlotList>();
        next->push_back(std::move(slot));
        current = std::move(next);
        return last_id_;
    }

    /// Unknown ids are ignored.
    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto it = slots_.find(key<EventType>());
        if (it == slots_.end() || !it->second) {
            return;
        }
        auto next = std::make_shared<SlotList>();
        for (const auto& slot : *it->second) {
            if (slot.id != id) {
                next->push_back(slot);
            }
        }
        it->second = std::move(next);
    }

    template<typename EventType>
    void emit(const EventType& event) const {
        const auto slots = snapshot(key<EventType>());
        if (!slots) {
            return;
        }
        for (const auto& slot : *slots) {
            try {
                slot.invoke(&event);
            } catch (const std::exception& e) {
                spdlog::error("Handler {} for {} threw: {}", slot.id, typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    [[nodiscard]] std::size_t subscriber_count() const {
        const auto slots = snapshot(key<EventType>());
        return slots ? slots->size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    struct Slot {
        SubscriptionId id = 0;
        std::function<void(const void*)> invoke;
    };
    using SlotList = std::vector<Slot>;

    template<typename EventType>
    static std::type_index key() {
        return std::type_index(typeid(EventType));
    }

    std::shared_ptr<const SlotList> snapshot(std::type_index type) const {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(type);
        return it != slots_.end() ? it->second : nullptr;
    }

    std::unordered_map<std::type_index, std::shared_ptr<const SlotList>> slots_;
    mutable std::shared_mutex mutex_;
    SubscriptionId last_id_ = 0;
};

} // namespace mbk::events
