/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "MessageRouter.h"
#include "../Logging/Logger.h"
#include "../Debug/Profiling.h"
#include <algorithm>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    MessageRouter::~MessageRouter() {
        shutdown();
    }

    MessageRouter::SubscriberId MessageRouter::subscribe(std::string name, Handler handler, SubscriberConfig config) {
        if (!handler) {
            throw std::invalid_argument("subscriber " + name + " has no handler");
        }
        if (config.queueCapacity == 0) {
            config.queueCapacity = 1;
        }
        if (config.maxDeliveryAttempts == 0) {
            config.maxDeliveryAttempts = 1;
        }

        auto subscriber = std::make_shared<Subscriber>();
        subscriber->name = std::move(name);
        subscriber->handler = std::move(handler);
        subscriber->config = std::move(config);

        // The thread is running before the subscriber becomes visible, so
        // unsubscribe() and shutdown() always see a joinable thread
        Subscriber* raw = subscriber.get();
        raw->thread = std::jthread([this, raw](const std::stop_token& token) {
            deliveryLoop(*raw, token);
        });

        SubscriberId id = 0;
        {
            std::unique_lock<std::shared_mutex> lock(_subscribersMutex);
            id = _nextId++;
            subscriber->id = id;
            _subscribers.emplace(id, std::move(subscriber));
        }

        SWARM_LOG_DEBUG_CAT("MessageRouter", "Subscriber {} '{}' registered", id, raw->name);
        return id;
    }

    void MessageRouter::stopSubscriber(Subscriber& subscriber) {
        if (subscriber.thread.joinable()) {
            subscriber.thread.request_stop();
            subscriber.changed.notify_all();
            subscriber.thread.join();
        }
    }

    bool MessageRouter::unsubscribe(SubscriberId id) {
        std::shared_ptr<Subscriber> subscriber;
        {
            std::unique_lock<std::shared_mutex> lock(_subscribersMutex);
            auto it = _subscribers.find(id);
            if (it == _subscribers.end()) {
                return false;
            }
            subscriber = std::move(it->second);
            _subscribers.erase(it);
        }
        stopSubscriber(*subscriber);
        return true;
    }

    uint64_t MessageRouter::publish(CoordinationEvent event) {
        SWARM_PROFILE_ZONE_NC("MessageRouter::publish", Debug::ProfileColors::Messaging);

        std::vector<std::shared_ptr<Subscriber>> targets;
        auto type = eventType(event);
        {
            std::shared_lock<std::shared_mutex> lock(_subscribersMutex);
            targets.reserve(_subscribers.size());
            for (const auto& [id, subscriber] : _subscribers) {
                if (subscriber->accepts(type)) {
                    targets.push_back(subscriber);
                }
            }
        }
        // Stable fan-out order keeps test output and logs predictable
        std::sort(targets.begin(), targets.end(), [](const auto& a, const auto& b) { return a->id < b->id; });

        std::lock_guard<std::mutex> publishLock(_publishMutex);
        EventEnvelope envelope;
        envelope.sequence = ++_sequence;
        envelope.event = std::move(event);
        _published.fetch_add(1, std::memory_order_relaxed);

        for (auto& subscriber : targets) {
            enqueue(*subscriber, envelope);
        }
        return envelope.sequence;
    }

    void MessageRouter::enqueue(Subscriber& subscriber, const EventEnvelope& envelope) {
        std::unique_lock<std::mutex> lock(subscriber.mutex);
        const auto capacity = subscriber.config.queueCapacity;

        if (subscriber.queue.size() >= capacity &&
            subscriber.config.overflow == OverflowPolicy::BackpressureWithTimeout) {
            subscriber.changed.wait_for(lock, subscriber.config.backpressureTimeout, [&subscriber, capacity] {
                return subscriber.queue.size() < capacity;
            });
        }

        if (subscriber.queue.size() >= capacity) {
            subscriber.queue.pop_front();
            auto dropped = subscriber.dropped.fetch_add(1, std::memory_order_relaxed) + 1;
            // Power-of-two sampling keeps a stuck subscriber from flooding the log
            if ((dropped & (dropped - 1)) == 0) {
                SWARM_LOG_WARNING_CAT("MessageRouter", "Subscriber '{}' is full, {} event(s) dropped so far",
                                      subscriber.name, dropped);
            }
        }

        subscriber.queue.push_back(envelope);
        subscriber.highWaterMark = std::max(subscriber.highWaterMark, subscriber.queue.size());
        lock.unlock();
        subscriber.changed.notify_all();
    }

    void MessageRouter::deliveryLoop(Subscriber& subscriber, const std::stop_token& token) {
        while (!token.stop_requested()) {
            EventEnvelope envelope;
            {
                std::unique_lock<std::mutex> lock(subscriber.mutex);
                if (!subscriber.changed.wait(lock, token, [&subscriber] { return !subscriber.queue.empty(); })) {
                    return;
                }
                envelope = std::move(subscriber.queue.front());
                subscriber.queue.pop_front();
                subscriber.busy = true;
            }
            subscriber.changed.notify_all();

            for (uint32_t attempt = 1; attempt <= subscriber.config.maxDeliveryAttempts; ++attempt) {
                envelope.deliveryAttempt = attempt;
                try {
                    subscriber.handler(envelope);
                    subscriber.delivered.fetch_add(1, std::memory_order_relaxed);
                    break;
                } catch (const std::exception& e) {
                    subscriber.handlerFailures.fetch_add(1, std::memory_order_relaxed);
                    SWARM_LOG_WARNING_CAT("MessageRouter", "Subscriber '{}' failed on {} event for task {} (attempt {}): {}",
                                          subscriber.name, eventTypeToString(envelope.type()), envelope.taskId(),
                                          attempt, e.what());
                    if (attempt < subscriber.config.maxDeliveryAttempts) {
                        subscriber.redeliveries.fetch_add(1, std::memory_order_relaxed);
                    }
                } catch (...) {
                    // Anything else would end the delivery thread; treat it like any handler failure
                    subscriber.handlerFailures.fetch_add(1, std::memory_order_relaxed);
                    SWARM_LOG_WARNING_CAT("MessageRouter", "Subscriber '{}' failed on {} event for task {} (attempt {}): unknown exception",
                                          subscriber.name, eventTypeToString(envelope.type()), envelope.taskId(),
                                          attempt);
                    if (attempt < subscriber.config.maxDeliveryAttempts) {
                        subscriber.redeliveries.fetch_add(1, std::memory_order_relaxed);
                    }
                }
            }

            {
                std::lock_guard<std::mutex> lock(subscriber.mutex);
                subscriber.busy = false;
            }
            subscriber.changed.notify_all();
        }
    }

    bool MessageRouter::flush(std::chrono::milliseconds timeout) {
        SWARM_PROFILE_ZONE_NC("MessageRouter::flush", Debug::ProfileColors::Messaging);
        auto deadline = Clock::now() + timeout;

        std::vector<std::shared_ptr<Subscriber>> subscribers;
        {
            std::shared_lock<std::shared_mutex> lock(_subscribersMutex);
            for (const auto& [id, subscriber] : _subscribers) {
                subscribers.push_back(subscriber);
            }
        }

        for (auto& subscriber : subscribers) {
            std::unique_lock<std::mutex> lock(subscriber->mutex);
            bool idle = subscriber->changed.wait_until(lock, deadline, [&subscriber] {
                return subscriber->queue.empty() && !subscriber->busy;
            });
            if (!idle) {
                SWARM_LOG_WARNING_CAT("MessageRouter", "Flush timed out waiting for subscriber '{}' ({} queued)",
                                      subscriber->name, subscriber->queue.size());
                return false;
            }
        }
        return true;
    }

    void MessageRouter::shutdown() {
        std::unordered_map<SubscriberId, std::shared_ptr<Subscriber>> subscribers;
        {
            std::unique_lock<std::shared_mutex> lock(_subscribersMutex);
            subscribers.swap(_subscribers);
        }
        for (auto& [id, subscriber] : subscribers) {
            stopSubscriber(*subscriber);
        }
    }

    size_t MessageRouter::subscriberCount() const {
        std::shared_lock<std::shared_mutex> lock(_subscribersMutex);
        return _subscribers.size();
    }

    MessageRouter::Stats MessageRouter::getStats() const {
        Stats stats;
        stats.published = _published.load(std::memory_order_relaxed);

        std::shared_lock<std::shared_mutex> lock(_subscribersMutex);
        for (const auto& [id, subscriber] : _subscribers) {
            SubscriberStats s;
            s.id = id;
            s.name = subscriber->name;
            s.delivered = subscriber->delivered.load(std::memory_order_relaxed);
            s.dropped = subscriber->dropped.load(std::memory_order_relaxed);
            s.handlerFailures = subscriber->handlerFailures.load(std::memory_order_relaxed);
            s.redeliveries = subscriber->redeliveries.load(std::memory_order_relaxed);
            {
                std::lock_guard<std::mutex> subscriberLock(subscriber->mutex);
                s.queueDepth = subscriber->queue.size();
                s.highWaterMark = subscriber->highWaterMark;
            }
            stats.delivered += s.delivered;
            stats.dropped += s.dropped;
            stats.handlerFailures += s.handlerFailures;
            stats.subscribers.push_back(std::move(s));
        }
        std::sort(stats.subscribers.begin(), stats.subscribers.end(),
                  [](const auto& a, const auto& b) { return a.id < b.id; });
        return stats;
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
