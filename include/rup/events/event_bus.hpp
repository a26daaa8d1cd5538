/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for decoupled component communication
 *
 * WHY THIS FILE EXISTS:
 * The upload session manager and sweeper report lifecycle changes
 * (created, chunk applied, completed, terminated, expired) without knowing
 * who consumes them: logging, metrics and the downstream media handoff
 * all subscribe here.
 *
 * Observers that live shorter than the bus hold a Subscription, which
 * removes the handler when it goes out of scope.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.scoped_subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) { ... });
 * bus.emit(UploadCompletedEvent{...});
 */

#pragma once

#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <shared_mutex>
#include <algorithm>

#include <spdlog/spdlog.h>

namespace rup::events {

/**
 * @brief Move-only handle that unsubscribes its handler on destruction
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}

    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    bool active() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

/**
 * @brief Synchronous publish/subscribe hub keyed by event type
 *
 * THREAD SAFETY:
 * - emit() may run on any HTTP worker or on the sweeper thread at once
 * - subscribe/unsubscribe take an exclusive lock, emit a shared one
 * - Handlers run on the emitting thread after the lock is released, so a
 *   handler may itself subscribe or emit
 */
class EventBus {
public:
    using HandlerId = size_t;

    EventBus() = default;
    ~EventBus() = default;

    // Subscriptions and components refer to the bus by address
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * RETURNS:
     * Id to pass to unsubscribe(); ids are never reused
     *
     * EXAMPLE:
     * auto id = bus.subscribe<ChunkAppliedEvent>([](const ChunkAppliedEvent& e) {
     *     spdlog::debug("{} now at {}", e.session_id, e.new_offset);
     * });
     */
    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        auto entry = HandlerEntry{0, std::make_shared<TypedHandler<EventType>>(std::move(handler))};

        std::unique_lock lock(mutex_);
        const HandlerId id = next_id_++;
        entry.id = id;
        handlers_[key_of<EventType>()].push_back(std::move(entry));
        return id;
    }

    /**
     * @brief Subscribe for as long as the returned handle lives
     *
     * The bus must outlive the handle.
     */
    template<typename EventType>
    [[nodiscard]] Subscription scoped_subscribe(std::function<void(const EventType&)> handler) {
        const HandlerId id = subscribe<EventType>(std::move(handler));
        return Subscription([this, id] { unsubscribe<EventType>(id); });
    }

    /// Unknown ids are ignored.
    template<typename EventType>
    void unsubscribe(HandlerId id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(key_of<EventType>());
        if (it == handlers_.end()) {
            return;
        }
        auto& entries = it->second;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [id](const HandlerEntry& entry) { return entry.id == id; }),
                      entries.end());
        if (entries.empty()) {
            handlers_.erase(it);
        }
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * A std::exception thrown by a handler is logged and the remaining
     * handlers still run; the emitter never sees it.
     *
     * EXAMPLE:
     * bus.emit(UploadTerminatedEvent{session_id, owner_id, "client"});
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(key_of<EventType>());
            if (it == handlers_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& entry : it->second) {
                targets.push_back(entry.handler);
            }
        }

        for (auto& handler : targets) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(key_of<EventType>());
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    // ════════════════════════════════════════════════════════
    // Type erasure
    // ════════════════════════════════════════════════════════

    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct TypedHandler : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit TypedHandler(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        // Only ever registered under key_of<EventType>()
        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    struct HandlerEntry {
        HandlerId id;
        std::shared_ptr<HandlerBase> handler;
    };

    template<typename EventType>
    static std::type_index key_of() {
        return std::type_index(typeid(EventType));
    }

    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_id_ = 0;
};

} // namespace rup::events
