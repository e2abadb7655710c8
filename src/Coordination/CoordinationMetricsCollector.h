/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file CoordinationMetricsCollector.h
 * @brief Periodic, bounded history of coordination health samples
 */

#pragma once

#include "CircuitBreaker.h"
#include "ConflictResolver.h"
#include "ConnectionPool.h"
#include "CoordinationState.h"
#include "MessageRouter.h"
#include "ResourceManager.h"
#include "TaskScheduler.h"
#include "WorkStealingCoordinator.h"
#include "../Core/CircularBuffer.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    struct AgentLoadSample {
        AgentId agentId;
        AgentStatus status = AgentStatus::Idle;
        size_t queued = 0;
        size_t running = 0;

        size_t load() const { return queued + running; }
    };

    struct EndpointSample {
        EndpointId endpoint;
        CircuitState state = CircuitState::Closed;
        uint32_t consecutiveFailures = 0;
        double failureRate = 0.0;
    };

    /**
     * @brief One point-in-time view of the engine
     *
     * Rates cover the interval since the previous sample: conflictRate is
     * conflicts per assignment and stealRate is successful steals per
     * assignment. Both are zero for an interval without assignments.
     */
    struct CoordinationMetricsSample {
        TimePoint timestamp = Clock::now();
        std::chrono::milliseconds interval{0};

        size_t queueDepth = 0;
        std::vector<AgentLoadSample> agents;
        std::vector<EndpointSample> endpoints;
        std::vector<ResourceManager::ResourceSnapshot> resources;

        std::optional<ConnectionPool::Stats> pool;
        double poolUtilization = 0.0;

        uint64_t assignments = 0;   ///< In this interval
        uint64_t conflicts = 0;     ///< In this interval
        uint64_t steals = 0;        ///< In this interval
        double conflictRate = 0.0;
        double stealRate = 0.0;

        /// Cumulative event counts seen on the router
        uint64_t tasksCompleted = 0;
        uint64_t tasksFailed = 0;
        uint64_t tasksRetried = 0;
        uint64_t tasksCancelled = 0;
    };

    /**
     * @brief Samples every coordination component on a fixed interval
     *
     * All sources are optional and only read. Samples go into a ring of
     * Config::historyCapacity entries, the oldest evicted first. When a router
     * is supplied the collector subscribes to it with a drop-oldest queue to
     * count task outcomes, so a stalled collector never slows publishers.
     *
     * @code
     * CoordinationMetricsCollector::Sources sources;
     * sources.scheduler = &scheduler;
     * sources.breakers = &breakers;
     * sources.router = &router;
     *
     * CoordinationMetricsCollector metrics(sources);
     * metrics.start();
     * ...
     * if (auto sample = metrics.latest()) {
     *     SWARM_LOG_INFO("queue depth {}", sample->queueDepth);
     * }
     * @endcode
     */
    class CoordinationMetricsCollector {
    public:
        struct Config {
            std::chrono::milliseconds interval{1000};
            size_t historyCapacity = 300;
        };

        struct Sources {
            const CoordinationState* state = nullptr;
            const TaskScheduler* scheduler = nullptr;
            const WorkStealingCoordinator* stealer = nullptr;
            const CircuitBreakerManager* breakers = nullptr;
            const ConnectionPool* pool = nullptr;
            const ResourceManager* resources = nullptr;
            const ConflictResolver* resolver = nullptr;
            MessageRouter* router = nullptr;
        };

        explicit CoordinationMetricsCollector(const Sources& sources);
        CoordinationMetricsCollector(const Sources& sources, const Config& config);
        ~CoordinationMetricsCollector();

        CoordinationMetricsCollector(const CoordinationMetricsCollector&) = delete;
        CoordinationMetricsCollector& operator=(const CoordinationMetricsCollector&) = delete;

        void start();

        /// Stop sampling; a final sample is taken so the history ends current
        void stop();

        bool isRunning() const;

        /// Take a sample now and add it to the history
        CoordinationMetricsSample sample();

        std::optional<CoordinationMetricsSample> latest() const;

        /// Retained samples, oldest first
        std::vector<CoordinationMetricsSample> history() const;

        /// Samples dropped from the ring so far
        size_t evictedCount() const;

        const Config& getConfig() const { return _config; }

    private:
        struct Totals {
            uint64_t assignments = 0;
            uint64_t conflicts = 0;
            uint64_t steals = 0;
        };

        Totals currentTotals() const;
        void onEvent(const EventEnvelope& envelope);
        void run(const std::stop_token& token);

        Sources _sources;
        Config _config;
        std::optional<MessageRouter::SubscriberId> _subscription;

        std::atomic<uint64_t> _completed{0};
        std::atomic<uint64_t> _failed{0};
        std::atomic<uint64_t> _retried{0};
        std::atomic<uint64_t> _cancelled{0};

        mutable std::mutex _historyMutex;
        CircularBuffer<CoordinationMetricsSample> _history;
        Totals _lastTotals;
        TimePoint _lastSampleAt = Clock::now();

        std::mutex _wakeMutex;
        std::condition_variable_any _wake;
        std::atomic<bool> _running{false};
        std::jthread _thread;
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
