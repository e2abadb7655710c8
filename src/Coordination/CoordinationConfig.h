/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file CoordinationConfig.h
 * @brief Everything a CoordinationManager can be configured with
 */

#pragma once

#include "CircuitBreaker.h"
#include "ConflictResolver.h"
#include "ConnectionPool.h"
#include "CoordinationMetricsCollector.h"
#include "ISchedulingStrategy.h"
#include "MessageRouter.h"
#include "TaskScheduler.h"
#include "WorkStealingCoordinator.h"
#include <chrono>
#include <string>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    /// A resource registered with the ResourceManager at initialize()
    struct ResourceConfig {
        ResourceName name;
        double capacity = 1.0;
        ResourceMode mode = ResourceMode::Shared;
    };

    /// Bounded retries of a single backend call inside executeTask()
    struct BackendRetryConfig {
        uint32_t maxAttempts = 3;
        std::chrono::milliseconds baseDelay{50};
        std::chrono::milliseconds maxDelay{2000};
    };

    /**
     * @brief Aggregate configuration of the coordination engine
     *
     * Each component keeps its own nested Config; this struct only collects
     * them so one value describes a deployment. Defaults give a working
     * engine with capability scheduling, work stealing and metrics on.
     *
     * @code
     * CoordinationConfig config;
     * config.strategy = SchedulingStrategyKind::Affinity;
     * config.circuitBreaker.failureThreshold = 3;
     * config.pool.maxSize = 4;
     * config.resources.push_back({"gpu", 2.0, ResourceMode::Exclusive});
     * config.logLevel = "DEBUG";
     *
     * CoordinationManager manager(config, makeConnection);
     * manager.initialize();
     * @endcode
     */
    struct CoordinationConfig {
        // Scheduling
        SchedulingStrategyKind strategy = SchedulingStrategyKind::Capability;
        TaskScheduler::Config scheduler;

        // Claim arbitration
        ConflictStrategyKind conflictStrategy = ConflictStrategyKind::Priority;
        double votingQuorum = 0.5;
        size_t conflictHistory = 256;

        // Load balancing
        bool enableWorkStealing = true;
        WorkStealingCoordinator::Config workStealing;

        // Backend access
        CircuitBreaker::Config circuitBreaker;
        ConnectionPool::Config pool;
        BackendRetryConfig backendRetry;

        /// Defaults for subscribers added through CoordinationManager::subscribe()
        MessageRouter::SubscriberConfig subscriber;

        bool enableMetrics = true;
        CoordinationMetricsCollector::Config metrics;

        std::vector<ResourceConfig> resources;

        /// Backoff before a failed task is offered again: base * 2^(retry - 1), capped
        std::chrono::milliseconds retryBackoffBase{100};
        std::chrono::milliseconds retryBackoffMax{10000};

        /**
         * @brief Run scheduling, retries and deadline checks on a background thread
         *
         * Off by default; callers then drive scheduleReadyTasks() and
         * checkDeadlines() themselves.
         */
        bool autoSchedule = false;
        std::chrono::milliseconds maintenanceInterval{100};

        /// Write task and agent snapshots to the memory store after every change
        bool checkpointing = true;
        std::string checkpointNamespace = "swarm";

        /// Minimum level for the global logger, parsed with stringToLogLevel()
        std::string logLevel = "INFO";
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
