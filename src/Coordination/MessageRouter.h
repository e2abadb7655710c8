/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file MessageRouter.h
 * @brief Publish/subscribe channel for coordination events with bounded per-subscriber queues
 */

#pragma once

#include "CoordinationEvents.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    /**
     * @brief What publish() does when a subscriber's queue is full
     */
    enum class OverflowPolicy : uint8_t {
        /// Evict the oldest queued event immediately. Publishers never wait.
        DropOldest,
        /// Wait up to backpressureTimeout for room, then evict the oldest.
        BackpressureWithTimeout
    };

    /**
     * @brief Routes coordination events to subscribers
     *
     * Each subscriber owns a bounded queue drained by its own delivery thread,
     * so a slow subscriber only ever delays itself (and, under
     * BackpressureWithTimeout, a publisher for at most the configured timeout).
     *
     * Delivery guarantees, per subscriber:
     * - Order: events are delivered in publish order, so events about one task
     *   arrive in the order they were emitted. Nothing is promised across
     *   subscribers.
     * - At-least-once: a handler that throws gets the same event again, up to
     *   maxDeliveryAttempts, before the router moves on. An event evicted on
     *   overflow is never delivered; evictions are counted in Stats::dropped.
     *   Nothing survives a restart.
     *
     * @code
     * MessageRouter router;
     * router.subscribe<TaskFailedEvent>("alerts", [](const TaskFailedEvent& e) {
     *     if (!e.willRetry) page(e.taskId, e.reason);
     * });
     *
     * TaskFailedEvent failed;
     * failed.taskId = "deploy";
     * failed.reason = "backend timeout";
     * router.publish(failed);
     * router.flush();
     * @endcode
     */
    class MessageRouter {
    public:
        using SubscriberId = uint64_t;
        using Handler = std::function<void(const EventEnvelope&)>;

        struct SubscriberConfig {
            size_t queueCapacity = 1024;
            OverflowPolicy overflow = OverflowPolicy::BackpressureWithTimeout;
            std::chrono::milliseconds backpressureTimeout{50};
            uint32_t maxDeliveryAttempts = 3;
            /// Event types to receive; empty means all
            std::set<CoordinationEventType> filter;
        };

        struct SubscriberStats {
            SubscriberId id = 0;
            std::string name;
            uint64_t delivered = 0;
            uint64_t dropped = 0;
            uint64_t handlerFailures = 0;
            uint64_t redeliveries = 0;
            size_t queueDepth = 0;
            size_t highWaterMark = 0;
        };

        struct Stats {
            uint64_t published = 0;
            uint64_t delivered = 0;
            uint64_t dropped = 0;
            uint64_t handlerFailures = 0;
            std::vector<SubscriberStats> subscribers;
        };

        MessageRouter() = default;
        ~MessageRouter();

        MessageRouter(const MessageRouter&) = delete;
        MessageRouter& operator=(const MessageRouter&) = delete;

        /**
         * @brief Register a subscriber and start its delivery thread
         */
        SubscriberId subscribe(std::string name, Handler handler, SubscriberConfig config = {});

        /**
         * @brief Subscribe to a single event type
         *
         * The filter of the config is replaced with that type.
         */
        template<typename EventType>
        SubscriberId subscribe(std::string name, std::function<void(const EventType&)> handler,
                               SubscriberConfig config = {}) {
            config.filter = {typeOf<EventType>()};
            return subscribe(std::move(name),
                             [handler = std::move(handler)](const EventEnvelope& envelope) {
                                 if (const auto* typed = std::get_if<EventType>(&envelope.event)) {
                                     handler(*typed);
                                 }
                             },
                             std::move(config));
        }

        /// Stop and remove a subscriber; queued events are discarded
        bool unsubscribe(SubscriberId id);

        /**
         * @brief Queue an event for every interested subscriber
         * @return Router sequence number of the event
         */
        uint64_t publish(CoordinationEvent event);

        /**
         * @brief Wait until every queue is empty and no handler is running
         * @return false if the timeout elapsed first
         */
        bool flush(std::chrono::milliseconds timeout = std::chrono::seconds(5));

        /// Stop every delivery thread. Undelivered events are discarded.
        void shutdown();

        size_t subscriberCount() const;
        Stats getStats() const;

        template<typename EventType>
        static constexpr CoordinationEventType typeOf() {
            return static_cast<CoordinationEventType>(variantIndex<EventType>(std::make_index_sequence<std::variant_size_v<CoordinationEvent>>{}));
        }

    private:
        template<typename EventType, size_t... I>
        static constexpr size_t variantIndex(std::index_sequence<I...>) {
            size_t index = 0;
            ((std::is_same_v<EventType, std::variant_alternative_t<I, CoordinationEvent>> ? (index = I, true) : false) || ...);
            return index;
        }

        struct Subscriber {
            SubscriberId id = 0;
            std::string name;
            Handler handler;
            SubscriberConfig config;

            std::mutex mutex;
            std::condition_variable_any changed;
            std::deque<EventEnvelope> queue;
            bool busy = false;

            std::atomic<uint64_t> delivered{0};
            std::atomic<uint64_t> dropped{0};
            std::atomic<uint64_t> handlerFailures{0};
            std::atomic<uint64_t> redeliveries{0};
            size_t highWaterMark = 0;

            std::jthread thread;

            bool accepts(CoordinationEventType type) const {
                return config.filter.empty() || config.filter.count(type) > 0;
            }
        };

        void enqueue(Subscriber& subscriber, const EventEnvelope& envelope);
        void deliveryLoop(Subscriber& subscriber, const std::stop_token& token);
        static void stopSubscriber(Subscriber& subscriber);

        mutable std::shared_mutex _subscribersMutex;
        std::unordered_map<SubscriberId, std::shared_ptr<Subscriber>> _subscribers;
        SubscriberId _nextId = 1;

        // Serialises sequence assignment with enqueueing so every queue sees
        // the same order
        std::mutex _publishMutex;
        uint64_t _sequence = 0;
        std::atomic<uint64_t> _published{0};
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
