/**
 * @file event_bus.hpp
 * @brief Synchronous typed publish/subscribe hub
 *
 * Transfer code reports attempts, faults and connections here without
 * knowing whether anything logs or counts them.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<AttemptFailedEvent>([](const AttemptFailedEvent& e) { ... });
 * bus.emit(AttemptFailedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace xfer::events {

/**
 * @brief Event bus keyed by event type
 *
 * Handlers run in the emitting thread. Emission copies the handler list
 * under a shared lock, so a handler may subscribe or unsubscribe without
 * deadlocking. Server connection threads emit concurrently.
 */
class EventBus {
public:
    using HandlerId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        auto slot = std::make_shared<Slot<EventType>>(std::move(handler));
        HandlerId id = next_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(id, std::move(slot));
        return id;
    }

    template<typename EventType>
    void unsubscribe(HandlerId id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   list.end());
    }

    /**
     * @brief Delivers an event to every subscriber of its type
     *
     * A throwing handler is logged and the remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<SlotBase>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& [id, slot] : it->second) {
                targets.push_back(slot);
            }
        }

        for (const auto& slot : targets) {
            try {
                slot->call(&event);
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

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct SlotBase {
        virtual ~SlotBase() = default;
        virtual void call(const void* event) const = 0;
    };

    template<typename EventType>
    struct Slot : SlotBase {
        std::function<void(const EventType&)> fn;

        explicit Slot(std::function<void(const EventType&)> f) : fn(std::move(f)) {}

        void call(const void* event) const override {
            fn(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<HandlerId, std::shared_ptr<SlotBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_id_ = 0;
};

} // namespace xfer::events
