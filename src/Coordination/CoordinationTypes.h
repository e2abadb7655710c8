/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file CoordinationTypes.h
 * @brief Task, agent and resource records shared by every coordination component
 *
 * These are plain value types. Shared instances never get mutated in place:
 * they live as versioned snapshots inside an OptimisticLockManager and change
 * only through tryUpdate().
 */

#pragma once

#include "../CoreCommon.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    /**
     * @brief Lifecycle of a task
     *
     * State flow:
     * - Pending → Ready (all dependencies completed)
     * - Ready → Assigned (scheduler picked an agent)
     * - Assigned → Running (agent started it)
     * - Running → Completed / Failed
     * - Failed → Ready (retries remain)
     * - Assigned → Ready (owning agent drained or went offline)
     * - Pending / Ready / Assigned → Cancelled
     * - Ready → Failed (no eligible agent within the grace period)
     *
     * Running tasks are never cancelled directly; they are flagged and the agent
     * observes the request cooperatively.
     */
    enum class TaskStatus : uint8_t {
        Pending   = 0,
        Ready     = 1,
        Assigned  = 2,
        Running   = 3,
        Completed = 4,
        Failed    = 5,
        Cancelled = 6
    };

    enum class AgentStatus : uint8_t {
        Idle     = 0,  ///< Accepting work, nothing assigned
        Busy     = 1,  ///< Accepting work, something assigned
        Draining = 2,  ///< Finishing current work, no new assignments
        Offline  = 3   ///< Gone
    };

    /**
     * @brief Whether a resource is held by one task at a time or shared by amount
     */
    enum class ResourceMode : uint8_t {
        Shared    = 0,
        Exclusive = 1
    };

    struct ResourceRequirement {
        ResourceName name;
        double amount = 1.0;
    };

    /**
     * @brief A unit of work
     */
    struct Task {
        TaskId id;
        std::vector<TaskId> dependencies;
        int priority = 0;
        std::set<std::string> requiredCapabilities;
        TaskStatus status = TaskStatus::Pending;
        std::optional<AgentId> assignedAgent;
        uint32_t retryCount = 0;
        uint32_t maxRetries = 3;
        TimePoint createdAt = Clock::now();

        /// Namespace used for affinity scheduling ("build", "tests/unit", ...)
        std::string ns;
        /// Free-form tags, also used for affinity
        std::set<std::string> tags;
        std::vector<ResourceRequirement> resources;

        /// Maximum time in Running; zero disables the deadline
        std::chrono::milliseconds timeout{0};
        std::optional<TimePoint> startedAt;
        std::optional<TimePoint> finishedAt;
        std::optional<TimePoint> lastRetryAt;

        std::string failureReason;
        uint32_t stealCount = 0;
        bool cancelRequested = false;

        bool isTerminal() const {
            return status == TaskStatus::Completed ||
                   status == TaskStatus::Failed ||
                   status == TaskStatus::Cancelled;
        }

        bool canRetry() const { return retryCount < maxRetries; }

        /// Namespace plus tags, the keys affinity scheduling matches on
        std::set<std::string> affinityKeys() const;
    };

    /**
     * @brief A worker that executes tasks
     */
    struct AgentInfo {
        AgentId id;
        std::set<std::string> capabilities;
        AgentStatus status = AgentStatus::Idle;

        /// Maximum assigned + running tasks, zero means unbounded
        size_t maxConcurrentTasks = 0;

        /// Assigned but not yet started, oldest first
        std::vector<TaskId> queuedTasks;
        std::vector<TaskId> runningTasks;

        uint64_t completedCount = 0;
        uint64_t failedCount = 0;
        TimePoint lastActivity = Clock::now();

        size_t load() const { return queuedTasks.size() + runningTasks.size(); }

        bool acceptsWork() const {
            return status == AgentStatus::Idle || status == AgentStatus::Busy;
        }

        bool hasCapacity() const {
            return maxConcurrentTasks == 0 || load() < maxConcurrentTasks;
        }

        bool hasCapabilities(const std::set<std::string>& required) const;
    };

    const char* taskStatusToString(TaskStatus status);
    const char* agentStatusToString(AgentStatus status);

    /// Inverse of taskStatusToString(); nullopt for unknown names
    std::optional<TaskStatus> stringToTaskStatus(std::string_view name);
    std::optional<AgentStatus> stringToAgentStatus(std::string_view name);

    /**
     * @brief Check a task status transition against the lifecycle above
     */
    bool isValidTransition(TaskStatus from, TaskStatus to);

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
