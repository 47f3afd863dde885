/**
 * @file event_bus.hpp
 * @brief Type-safe event bus between the sync engine and its observers
 *
 * The engine, the connectivity monitor and the settings layer publish what
 * happened; logging, metrics and the auto-sync scheduler subscribe. Nobody
 * holds a pointer to anybody else.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe<SyncFinishedEvent>([](const SyncFinishedEvent& e) { ... });
 * bus.emit(SyncFinishedEvent{...});
 * // handler is removed when `sub` goes out of scope
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fieldsync::events {

class EventBus;

/**
 * @brief Scoped handler registration; unsubscribes on destruction
 *
 * Components that subscribe with a captured `this` keep one of these as a
 * member so the handler cannot outlive the component.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus* bus, std::size_t id) : bus_(bus), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : bus_(std::exchange(other.bus_, nullptr)), id_(other.id_) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = std::exchange(other.bus_, nullptr);
            id_ = other.id_;
        }
        return *this;
    }

    void reset();

    bool active() const noexcept { return bus_ != nullptr; }
    std::size_t id() const noexcept { return id_; }

private:
    EventBus* bus_ = nullptr;
    std::size_t id_ = 0;
};

/**
 * @brief Synchronous publish/subscribe bus keyed by event type
 *
 * THREAD SAFETY:
 * - emit() may be called from any thread, including the phase workers
 * - Handlers run synchronously on the emitting thread
 * - The handler list is copied before dispatch, so a handler may
 *   subscribe or unsubscribe without deadlocking
 * - unsubscribe() waits for a call of that handler running on another
 *   thread; once it returns the handler is not called again
 * - Calls of one handler are serialized
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    [[nodiscard]] Subscription subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const std::size_t id = ++next_handler_id_;
        handlers_[std::type_index(typeid(EventType))].push_back(
            {id, std::make_shared<HandlerImpl<EventType>>(std::move(handler))});
        return Subscription(this, id);
    }

    void unsubscribe(std::size_t handler_id) {
        std::vector<std::shared_ptr<HandlerBase>> removed;
        {
            std::unique_lock lock(mutex_);
            for (auto& [type, list] : handlers_) {
                auto first = std::remove_if(list.begin(), list.end(),
                                            [handler_id](const auto& entry) { return entry.first == handler_id; });
                for (auto it = first; it != list.end(); ++it) {
                    removed.push_back(it->second);
                }
                list.erase(first, list.end());
            }
        }
        // Outside the bus lock: a running handler may still emit
        for (const auto& handler : removed) {
            handler->deactivate();
        }
    }

    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& entry : it->second) {
                handlers_copy.push_back(entry.second);
            }
        }

        for (const auto& handler : handlers_copy) {
            try {
                handler->invoke(&event);
            } catch (const std::exception& e) {
                // One bad handler shouldn't starve the others
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
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
    class HandlerBase {
    public:
        virtual ~HandlerBase() = default;

        void invoke(const void* event) {
            std::lock_guard lock(call_mutex_);
            if (active_) {
                call(event);
            }
        }

        // Blocks until a call on another thread has returned
        void deactivate() {
            std::lock_guard lock(call_mutex_);
            active_ = false;
        }

    protected:
        virtual void call(const void* event) = 0;

    private:
        // Recursive so a handler can unsubscribe itself or re-emit its own event type
        std::recursive_mutex call_mutex_;
        bool active_ = true;
    };

    template<typename EventType>
    class HandlerImpl : public HandlerBase {
    public:
        explicit HandlerImpl(std::function<void(const EventType&)> f) : func_(std::move(f)) {}

    protected:
        void call(const void* event) override {
            func_(*static_cast<const EventType*>(event));
        }

    private:
        std::function<void(const EventType&)> func_;
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

inline void Subscription::reset() {
    if (bus_ != nullptr) {
        bus_->unsubscribe(id_);
        bus_ = nullptr;
    }
}

} // namespace fieldsync::events
