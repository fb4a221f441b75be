/**
 * @file event_bus.hpp
 * @brief Type-safe event bus between the pipeline and its observers
 *
 * WHY THIS FILE EXISTS:
 * Workers report what they did to the catalog (imported, offline, removed)
 * without knowing whether anyone logs or counts it. Observers subscribe
 * without knowing which worker emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<AssetOfflineEvent>([](const AssetOfflineEvent& e) { ... });
 * bus.emit(AssetOfflineEvent{asset.id, asset.library_id, asset.original_path});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace medialib::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Workers on the dispatcher pool emit concurrently
 * - Handlers run synchronously on the emitting thread, so they must be
 *   thread-safe themselves
 * - Handlers are copied out before being called; a handler may subscribe
 *   or unsubscribe without deadlocking
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    // Non-copyable (would duplicate handlers)
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * TEMPLATE PARAMETERS:
     * EventType - One of the pipeline events (e.g., AssetImportedEvent)
     *
     * PARAMETERS:
     * handler - Called on the emitting thread for every event of that type
     *
     * RETURNS:
     * Subscription ID for unsubscribing later
     *
     * EXAMPLE:
     * auto id = bus.subscribe<AssetImportedEvent>([](const AssetImportedEvent& e) {
     *     spdlog::info("Imported {}", e.asset.original_path);
     * });
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;

        handlers_[type_id].push_back({handler_id, wrapper});

        return handler_id;
    }

    /**
     * @brief Unsubscribe a specific handler
     *
     * Unknown IDs are ignored. A handler may remove itself while it runs;
     * the current emit still completes with the handlers it copied.
     */
    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);

        if (it != handlers_.end()) {
            auto& handler_list = it->second;
            handler_list.erase(
                std::remove_if(handler_list.begin(), handler_list.end(),
                    [handler_id](const auto& pair) {
                        return pair.first == handler_id;
                    }),
                handler_list.end()
            );
        }
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * HOW IT WORKS:
     * 1. Copy the handler list for this event type under a shared lock
     * 2. Release the lock
     * 3. Call each handler in subscription order on the emitting thread
     *
     * EXCEPTION SAFETY:
     * A throwing handler is logged and skipped; the remaining
     * handlers still run and the emitting worker is not affected.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto type_id = std::type_index(typeid(EventType));
            auto it = handlers_.find(type_id);

            if (it == handlers_.end()) {
                return;
            }

            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            } catch (...) {
                spdlog::error("[EventBus] handler for {} threw a non-standard exception", typeid(EventType).name());
            }
        }
    }

    /**
     * @brief Number of live subscriptions for an event type
     */
    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /**
     * @brief Remove all subscribers
     */
    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    // ════════════════════════════════════════════════════════
    // Type Erasure Implementation
    // ════════════════════════════════════════════════════════

    /**
     * @brief Base class for type-erased handlers
     */
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    /**
     * @brief Typed handler implementation
     */
    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            // Only EventType* is ever stored under EventType's type_index
            func(*static_cast<const EventType*>(event));
        }
    };

    // Map: event type -> list of (handler_id, handler)
    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;

    size_t next_handler_id_ = 0;
};

} // namespace medialib::events
