#pragma once

/// @file event_bus.hpp
/// @brief Synchronous, re-entrant event bus over the closed GameEvent set.
///
/// One bus instance is constructed by the owner of a combat session and
/// passed by reference to every component that publishes or subscribes.

#include <algorithm>
#include <array>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "arc/event/game_events.hpp"
#include "arc/foundation/game_logger.hpp"

namespace arc::event {

/// Unique identifier for an event subscription.
using SubscriptionId = uint64_t;

/// Event bus supporting synchronous and deferred delivery.
///
/// Handlers are invoked in priority order (lower value = higher priority).
/// Within the same priority, handlers are called in subscription order.
///
/// Dispatch semantics:
///   - Publish() runs every handler on the calling thread before returning.
///   - Handlers may publish, subscribe or unsubscribe. The handler set of an
///     in-progress dispatch is a snapshot taken when it started.
///   - A handler that throws is logged and counted; the remaining handlers
///     still run and the exception never reaches the publisher.
///
/// Usage:
/// @code
///   EventBus bus;
///
///   auto id = bus.Subscribe<EnemyHit>([](const EnemyHit& e) {
///       // apply damage
///   });
///
///   bus.Publish(EnemyHit{enemy, 35, position});
///
///   bus.PublishDeferred(IncreaseScore{100});
///   bus.ProcessDeferred();  // at the frame boundary
///
///   bus.Unsubscribe(id);
/// @endcode
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    // -- Subscribe ------------------------------------------------------------

    /// Subscribe a handler for events of type E.
    ///
    /// Registering the same callable twice yields two subscriptions; avoiding
    /// duplicates is the caller's responsibility.
    ///
    /// @tparam E  A GameEvent alternative.
    /// @param handler   Callback invoked when an event of type E is published.
    /// @param priority  Handler priority (lower = called first, default 0).
    /// @return A unique subscription ID for later unsubscription.
    template <typename E>
    SubscriptionId Subscribe(std::function<void(const E&)> handler,
                             int32_t priority = 0) {
        static_assert(kIsGameEvent<E>, "E must be one of the GameEvent alternatives");
        std::lock_guard lock(mutex_);

        auto id = nextId_++;

        HandlerEntry entry;
        entry.id = id;
        entry.priority = priority;
        entry.handler = [fn = std::move(handler)](const GameEvent& event) {
            fn(std::get<E>(event));
        };

        auto& handlers = handlers_[kEventIndex<E>];
        handlers.push_back(std::move(entry));
        sortHandlers(handlers);

        subscriptionChannels_.insert_or_assign(id, kEventIndex<E>);
        return id;
    }

    // -- Unsubscribe ----------------------------------------------------------

    /// Remove a subscription by ID. No-op for unknown or removed IDs.
    void Unsubscribe(SubscriptionId id) {
        std::lock_guard lock(mutex_);
        auto channelIt = subscriptionChannels_.find(id);
        if (channelIt == subscriptionChannels_.end()) {
            return;
        }

        auto& vec = handlers_[channelIt->second];
        vec.erase(std::remove_if(vec.begin(), vec.end(),
                                 [id](const HandlerEntry& e) { return e.id == id; }),
                  vec.end());

        subscriptionChannels_.erase(channelIt);
    }

    /// Remove all subscriptions.
    void UnsubscribeAll() {
        std::lock_guard lock(mutex_);
        for (auto& vec : handlers_) {
            vec.clear();
        }
        subscriptionChannels_.clear();
    }

    // -- Synchronous publish --------------------------------------------------

    /// Publish an event synchronously to the handlers of its channel.
    template <typename E>
    void Publish(const E& event) {
        static_assert(kIsGameEvent<E>, "E must be one of the GameEvent alternatives");
        Publish(GameEvent(event));
    }

    /// Publish an already-wrapped event.
    void Publish(const GameEvent& event) {
        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot = handlers_[event.index()];
        }

        for (const auto& entry : snapshot) {
            invokeIsolated(entry, event);
        }
    }

    // -- Deferred publish -----------------------------------------------------

    /// Queue an event for delivery by the next ProcessDeferred().
    template <typename E>
    void PublishDeferred(E event) {
        static_assert(kIsGameEvent<E>, "E must be one of the GameEvent alternatives");
        std::lock_guard lock(mutex_);
        deferredQueue_.emplace_back(std::in_place_type<E>, std::move(event));
    }

    /// Flush the deferred queue in FIFO order. Events queued while flushing
    /// are delivered by the following call.
    void ProcessDeferred() {
        std::vector<GameEvent> queue;
        {
            std::lock_guard lock(mutex_);
            queue.swap(deferredQueue_);
        }

        for (const auto& event : queue) {
            Publish(event);
        }
    }

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] std::size_t HandlerCount() const {
        std::lock_guard lock(mutex_);
        return subscriptionChannels_.size();
    }

    template <typename E>
    [[nodiscard]] std::size_t HandlerCountFor() const {
        static_assert(kIsGameEvent<E>, "E must be one of the GameEvent alternatives");
        std::lock_guard lock(mutex_);
        return handlers_[kEventIndex<E>].size();
    }

    [[nodiscard]] std::size_t DeferredCount() const {
        std::lock_guard lock(mutex_);
        return deferredQueue_.size();
    }

    /// Number of handler invocations that ended in an exception.
    [[nodiscard]] uint64_t FailedDispatchCount() const {
        std::lock_guard lock(mutex_);
        return failedDispatches_;
    }

private:
    struct HandlerEntry {
        SubscriptionId id = 0;
        int32_t priority = 0;
        std::function<void(const GameEvent&)> handler;
    };

    /// Stable so that insertion order is kept within a priority level.
    static void sortHandlers(std::vector<HandlerEntry>& handlers) {
        std::stable_sort(handlers.begin(), handlers.end(),
                         [](const HandlerEntry& a, const HandlerEntry& b) {
                             return a.priority < b.priority;
                         });
    }

    void invokeIsolated(const HandlerEntry& entry, const GameEvent& event) {
        try {
            entry.handler(event);
        } catch (const std::exception& e) {
            recordFailure(entry.id, event, e.what());
        } catch (...) {
            recordFailure(entry.id, event, "non-standard exception");
        }
    }

    void recordFailure(SubscriptionId id, const GameEvent& event, std::string_view what) {
        {
            std::lock_guard lock(mutex_);
            ++failedDispatches_;
        }
        ARC_LOG_ERROR(::arc::foundation::LogCategory::Event,
                      std::string("handler ") + std::to_string(id) + " failed on " +
                          std::string(channelName(event)) + ": " + std::string(what));
    }

    /// Channel index -> handlers sorted by priority.
    std::array<std::vector<HandlerEntry>, kEventChannelCount> handlers_;

    /// Reverse lookup: subscription ID -> channel index.
    std::unordered_map<SubscriptionId, std::size_t> subscriptionChannels_;

    std::vector<GameEvent> deferredQueue_;

    SubscriptionId nextId_ = 1;
    uint64_t failedDispatches_ = 0;

    mutable std::mutex mutex_;
};

} // namespace arc::event
