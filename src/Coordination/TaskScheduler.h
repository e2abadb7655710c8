/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file TaskScheduler.h
 * @brief Ready queue and the assignment pipeline that turns ready tasks into agent work
 */

#pragma once

#include "CoordinationState.h"
#include "ConflictResolver.h"
#include "DependencyGraph.h"
#include "ISchedulingStrategy.h"
#include "MessageRouter.h"
#include "ResourceManager.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    /**
     * @brief What happened to one assignment attempt
     *
     * Everything except Assigned and Expired leaves the task in the ready
     * queue at its current position.
     */
    enum class AssignmentStatus : uint8_t {
        Assigned,               ///< Task is now Assigned to an agent
        NotReady,               ///< Task is not Ready any more and left the queue
        NoCapableAgent,         ///< No candidate qualified; counts toward the grace period
        InsufficientResources,  ///< Resources did not fit; counts toward the grace period
        VersionConflict,        ///< Lost an optimistic race on the task or agent
        Deferred,               ///< Competing claims pending arbitration or another pass holds the task
        Expired                 ///< Grace period ran out; the task was failed
    };

    const char* assignmentStatusToString(AssignmentStatus status);

    struct AssignmentResult {
        AssignmentStatus status = AssignmentStatus::NotReady;
        TaskId taskId;
        std::optional<AgentId> agentId;
        std::string strategy;
        std::string detail;

        bool assigned() const { return status == AssignmentStatus::Assigned; }
    };

    /**
     * @brief Priority ready queue plus the assign pipeline
     *
     * The queue orders tasks by priority, highest first, and by enqueue order
     * within a priority. assign() runs the pipeline for one task:
     *
     * 1. pick an agent from the candidates (agents accepting work with spare capacity)
     * 2. claim the task's resources, all or nothing
     * 3. Ready → Assigned on the task record, version checked
     * 4. append to the agent's queue, version checked
     * 5. mark the graph node dispatched and publish a TaskAssignedEvent
     *
     * A failure at any step undoes the earlier ones and leaves the task queued,
     * untouched. Capability and capacity shortfalls are only counted until the
     * task has been unassignable for longer than Config::gracePeriod; then it is
     * failed with a diagnostic reason and its dependents are cancelled.
     *
     * The base scheduler places each task on the first capable agent in id
     * order. AdvancedTaskScheduler replaces that with a pluggable strategy.
     *
     * Thread Safety: all methods are thread-safe. A task is processed by at
     * most one assign() at a time; a concurrent attempt reports Deferred.
     *
     * @code
     * TaskScheduler scheduler(state, graph, resources, &router);
     * scheduler.enqueue("compile");
     * for (const auto& result : scheduler.schedule()) {
     *     if (!result.assigned()) {
     *         SWARM_LOG_DEBUG("{} not assigned: {}", result.taskId, assignmentStatusToString(result.status));
     *     }
     * }
     * @endcode
     */
    class TaskScheduler {
    public:
        struct Config {
            /// How long a task may stay unassignable before it is failed
            std::chrono::milliseconds gracePeriod{30000};
            /// Cap on assignments per schedule() pass, zero for no cap
            size_t maxAssignmentsPerPass = 0;
            /// Attempts at the agent record update before giving up on this pass
            size_t maxAgentUpdateAttempts = 4;
        };

        struct Stats {
            uint64_t passes = 0;
            uint64_t assigned = 0;
            uint64_t noCapableAgent = 0;
            uint64_t insufficientResources = 0;
            uint64_t versionConflicts = 0;
            uint64_t deferred = 0;
            uint64_t expired = 0;
            size_t queueDepth = 0;

            /// Assignment attempts that did not assign, excluding stale queue entries
            uint64_t failedAttempts() const {
                return noCapableAgent + insufficientResources + versionConflicts + deferred;
            }
        };

        TaskScheduler(CoordinationState& state,
                      DependencyGraph& graph,
                      ResourceManager& resources,
                      MessageRouter* router = nullptr,
                      ConflictResolver* resolver = nullptr);
        TaskScheduler(CoordinationState& state,
                      DependencyGraph& graph,
                      ResourceManager& resources,
                      MessageRouter* router,
                      ConflictResolver* resolver,
                      const Config& config);
        virtual ~TaskScheduler() = default;

        TaskScheduler(const TaskScheduler&) = delete;
        TaskScheduler& operator=(const TaskScheduler&) = delete;

        /**
         * @brief Add a Ready task to the queue
         * @return false if the task is unknown, not Ready, or already queued
         */
        bool enqueue(const TaskId& taskId);

        /**
         * @brief Put a task back at the end of its priority class
         *
         * Used for retries and for work returned by a draining agent.
         */
        bool requeue(const TaskId& taskId);

        /// Drop a task from the queue (cancelled, removed)
        bool remove(const TaskId& taskId);

        bool isQueued(const TaskId& taskId) const;
        size_t queueDepth() const;

        /// Queued task ids in scheduling order
        std::vector<TaskId> readyQueue() const;

        /// Run the assignment pipeline for one queued task
        AssignmentResult assign(const TaskId& taskId);

        /**
         * @brief Run the pipeline with a fixed agent instead of the strategy
         *
         * Used to apply the winner of an arbitrated claim. The agent must be
         * accepting work, have a free slot and the task's capabilities, or the
         * result is NoCapableAgent. Task and agent writes are version checked
         * exactly as in assign().
         */
        AssignmentResult assignTo(const TaskId& taskId, const AgentId& agentId);

        /**
         * @brief One scheduling pass over the queue in priority order
         *
         * Resolves pending claim arbitration first, then attempts every queued
         * task until maxAssignments tasks were assigned.
         *
         * @param maxAssignments Zero uses Config::maxAssignmentsPerPass
         */
        std::vector<AssignmentResult> schedule(size_t maxAssignments = 0);

        /// Forwarded by the manager when an agent finishes a task
        virtual void notifyTaskCompleted(const Task& task, const AgentId& agentId) {}
        /// Forwarded by the manager when an agent leaves
        virtual void notifyAgentRemoved(const AgentId& agentId) {}

        /// Name of the current agent selection policy
        virtual std::string strategyName() const { return "first-fit"; }

        Stats getStats() const;

        /// Stats broken down by the strategy that handled each attempt
        std::map<std::string, Stats> getStrategyStats() const;

        const Config& getConfig() const { return _config; }

    protected:
        struct Selection {
            AgentId agentId;
            std::string strategy;
        };

        /**
         * @brief Choose an agent for the task
         * @throws NoCapableAgentError if no candidate qualifies
         */
        virtual Selection selectAgent(const Task& task, const std::vector<AgentInfo>& candidates);

    private:
        struct QueueEntry {
            int priority = 0;
            uint64_t sequence = 0;
            TaskId taskId;

            bool operator<(const QueueEntry& other) const {
                if (priority != other.priority) return priority > other.priority;
                if (sequence != other.sequence) return sequence < other.sequence;
                return taskId < other.taskId;
            }
        };

        bool insertLocked(const TaskId& taskId, int priority);
        bool removeLocked(const TaskId& taskId);
        std::vector<AgentInfo> candidateAgents() const;

        AssignmentResult runPipeline(const TaskId& taskId, const std::optional<AgentId>& claimant);
        AssignmentResult unassignable(const Versioned<Task>& snapshot, AssignmentStatus status,
                                      std::string strategy, std::string detail);
        AssignmentResult expire(const Versioned<Task>& snapshot, std::string strategy, std::string reason);
        void rollbackTask(const TaskId& taskId, const AgentId& agentId);
        void rollbackAgent(const TaskId& taskId, const AgentId& agentId);
        void record(const AssignmentResult& result);

        CoordinationState& _state;
        DependencyGraph& _graph;
        ResourceManager& _resources;
        MessageRouter* _router;
        ConflictResolver* _resolver;
        Config _config;

        mutable std::mutex _queueMutex;
        std::set<QueueEntry> _queue;
        std::unordered_map<TaskId, QueueEntry> _queued;
        std::set<TaskId> _inFlight;
        std::unordered_map<TaskId, TimePoint> _unassignableSince;
        uint64_t _nextSequence = 0;

        mutable std::mutex _statsMutex;
        Stats _stats;
        std::map<std::string, Stats> _strategyStats;
    };

    /**
     * @brief TaskScheduler whose agent selection is a pluggable strategy
     *
     * The strategy is chosen at construction (usually from
     * CoordinationConfig::strategy) and can be swapped at runtime; attempts in
     * flight finish with the strategy they started with.
     *
     * @code
     * AdvancedTaskScheduler scheduler(state, graph, resources,
     *                                 makeSchedulingStrategy(SchedulingStrategyKind::Affinity), &router);
     * @endcode
     */
    class AdvancedTaskScheduler : public TaskScheduler {
    public:
        AdvancedTaskScheduler(CoordinationState& state,
                              DependencyGraph& graph,
                              ResourceManager& resources,
                              std::unique_ptr<ISchedulingStrategy> strategy,
                              MessageRouter* router = nullptr,
                              ConflictResolver* resolver = nullptr);
        AdvancedTaskScheduler(CoordinationState& state,
                              DependencyGraph& graph,
                              ResourceManager& resources,
                              std::unique_ptr<ISchedulingStrategy> strategy,
                              MessageRouter* router,
                              ConflictResolver* resolver,
                              const Config& config);

        void setStrategy(std::unique_ptr<ISchedulingStrategy> strategy);
        std::string strategyName() const override;

        void notifyTaskCompleted(const Task& task, const AgentId& agentId) override;
        void notifyAgentRemoved(const AgentId& agentId) override;

    protected:
        Selection selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) override;

    private:
        std::shared_ptr<ISchedulingStrategy> currentStrategy() const;

        mutable std::mutex _strategyMutex;
        std::shared_ptr<ISchedulingStrategy> _strategy;
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
