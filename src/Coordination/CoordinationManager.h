/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file CoordinationManager.h
 * @brief Composition root that owns and wires every coordination component
 *
 * The manager is the one object an embedding application talks to. It owns
 * the agent and task tables, builds the components in dependency order at
 * initialize(), and tears them down in reverse at shutdown(). Agents drive
 * their tasks through startTask(), completeTask() and failTask(), or hand the
 * whole backend round trip to executeTask().
 */

#pragma once

#include "CircuitBreaker.h"
#include "ConflictResolver.h"
#include "ConnectionPool.h"
#include "CoordinationConfig.h"
#include "CoordinationMetricsCollector.h"
#include "CoordinationState.h"
#include "DependencyGraph.h"
#include "MessageRouter.h"
#include "ResourceManager.h"
#include "TaskScheduler.h"
#include "WorkStealingCoordinator.h"
#include "../Memory/IMemoryStore.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    /// Outcome of one executeTask() call
    struct ExecutionResult {
        bool succeeded = false;
        std::string output;
        uint32_t attempts = 0;      ///< Backend calls made, including the failed ones
        bool willRetry = false;     ///< Task failed but went back to the queue
        bool deferred = false;      ///< No connection could be leased; the task is still running on the agent
        std::exception_ptr error;   ///< Last failure, null on success
        std::string errorMessage;
    };

    /// What recover() restored
    struct RecoveryReport {
        size_t tasks = 0;
        size_t agents = 0;
        size_t requeued = 0;        ///< Restored tasks that went straight back to the ready queue
        size_t skipped = 0;         ///< Unreadable records or ids already present
    };

    /**
     * @brief Owns the coordination engine and exposes its inbound operations
     *
     * Lifecycle is explicit. The constructor only stores configuration;
     * initialize() constructs the leaves (graph, resources, router, resolver,
     * breakers, pool), then the scheduler, the work-stealing coordinator and
     * the metrics collector on top of them, and starts the background loops.
     * shutdown() stops the loops, drains the pool, flushes the router and
     * takes a final metrics sample. The destructor calls shutdown().
     *
     * Task lifecycle as seen from outside:
     * - submit() inserts the task into the graph and the task table and queues
     *   it when it is ready
     * - scheduleReadyTasks() assigns queued tasks to agents
     * - the agent calls startTask(), then completeTask() or failTask()
     * - failTask() re-offers the task after an exponential backoff while it
     *   has retries left, otherwise fails it and cancels its dependents
     * - cancel() cancels a task that has not started and everything
     *   downstream of it; a running task is only flagged
     *
     * With a memory store, task and agent records are checkpointed after each
     * change and recover() reloads them after a restart. The store is best
     * effort: a failed write is logged and nothing else happens.
     *
     * Thread Safety: every public method is thread-safe.
     *
     * @code
     * CoordinationConfig config;
     * config.strategy = SchedulingStrategyKind::LeastLoaded;
     *
     * CoordinationManager manager(config, [] { return std::make_unique<HttpConnection>(); },
     *                             std::make_shared<Memory::InMemoryStore>());
     * manager.initialize();
     * manager.recover();
     *
     * manager.registerAgent("agent-1", {"compile"});
     *
     * Task task;
     * task.id = "build";
     * task.requiredCapabilities = {"compile"};
     * manager.submit(task);
     *
     * manager.scheduleReadyTasks();
     * auto result = manager.executeTask("agent-1", "build", "compiler", payload);
     *
     * manager.shutdown();
     * @endcode
     */
    class CoordinationManager {
    public:
        CoordinationManager();
        explicit CoordinationManager(const CoordinationConfig& config);
        CoordinationManager(const CoordinationConfig& config,
                            ConnectionFactory connectionFactory,
                            std::shared_ptr<Memory::IMemoryStore> store = nullptr);
        ~CoordinationManager();

        CoordinationManager(const CoordinationManager&) = delete;
        CoordinationManager& operator=(const CoordinationManager&) = delete;

        /**
         * @brief Build the components and start the background loops
         * @throws std::logic_error if called again after shutdown()
         */
        void initialize();

        /**
         * @brief Stop loops, drain the pool, flush events, take a final sample
         *
         * Components stay readable afterwards; mutating calls throw.
         */
        void shutdown(std::chrono::milliseconds drainTimeout = std::chrono::seconds(5));

        bool isRunning() const { return _lifecycle.load() == Lifecycle::Running; }

        // Agents

        /**
         * @brief Add an agent, or bring back one that went offline
         * @throws std::invalid_argument if the agent is already registered and not offline
         */
        void registerAgent(const AgentId& agentId,
                           std::set<std::string> capabilities,
                           size_t maxConcurrentTasks = 0);

        /**
         * @brief Drain an agent
         *
         * The agent stops receiving work. Its assigned but unstarted tasks go
         * back to the ready queue; running tasks finish normally and the agent
         * goes offline with the last one.
         *
         * @return Number of tasks returned to the queue
         * @throws UnknownEntityError if the agent is not registered
         */
        size_t unregisterAgent(const AgentId& agentId);

        std::optional<Versioned<AgentInfo>> getAgent(const AgentId& agentId) const;

        // Tasks

        /**
         * @brief Add a task to the engine
         *
         * Status, assignment and timestamps of the argument are reset. A task
         * whose dependency already failed or was cancelled is accepted and
         * immediately cancelled.
         *
         * @return The task's initial status: Ready, Pending or Cancelled
         * @throws CycleError if the dependencies would close a cycle
         * @throws DuplicateTaskError if the id is already known
         * @throws std::invalid_argument if the id is empty
         */
        TaskStatus submit(Task task);

        /**
         * @brief Cancel a task and everything downstream of it
         *
         * Pending, ready and assigned tasks are cancelled at once and their
         * resources released. A running task is only flagged; the agent sees
         * Task::cancelRequested and reports back through failTask().
         *
         * @return Ids moved to Cancelled, the task itself first; empty when
         *         the task was running or already finished
         * @throws UnknownEntityError if the task is unknown
         */
        std::vector<TaskId> cancel(const TaskId& taskId);

        /// Current record and its version, nullopt for unknown ids
        std::optional<Versioned<Task>> getStatus(const TaskId& taskId) const;

        /**
         * @brief Re-offer due retries, then run one scheduling pass
         * @param maxAssignments Zero uses the scheduler's configured cap
         */
        std::vector<AssignmentResult> scheduleReadyTasks(size_t maxAssignments = 0);

        /**
         * @brief Assigned → Running, called by the agent that holds the task
         * @throws std::logic_error if the task is not assigned to this agent
         */
        void startTask(const AgentId& agentId, const TaskId& taskId);

        /**
         * @brief Running → Completed; releases resources and promotes dependents
         * @throws std::logic_error if the task is not running on this agent
         */
        void completeTask(const AgentId& agentId, const TaskId& taskId);

        /**
         * @brief Report a failed execution
         * @return true if the task will be retried
         * @throws std::logic_error if the task is not running on this agent
         */
        bool failTask(const AgentId& agentId, const TaskId& taskId, const std::string& reason);

        /**
         * @brief Run a task's backend call on behalf of an agent
         *
         * Starts the task if it is still only assigned, then calls the
         * endpoint through a pooled connection guarded by the endpoint's
         * circuit breaker. Backend failures are retried up to
         * CoordinationConfig::backendRetry.maxAttempts with exponential
         * backoff; an open circuit ends the attempts at once. The outcome is
         * reported through completeTask() or failTask() with the cause.
         *
         * Pool timeouts are contention, not failures: they are waited out with
         * the same backoff without spending attempts, and if the pool stays
         * exhausted the result comes back deferred with the task still
         * running on the agent. Calling executeTask() again resumes it.
         *
         * @throws std::logic_error if no connection factory was supplied, or
         *         the task is not assigned to or running on this agent
         */
        ExecutionResult executeTask(const AgentId& agentId,
                                    const TaskId& taskId,
                                    const EndpointId& endpoint,
                                    const std::string& payload);

        /**
         * @brief Fail running tasks that outlived their timeout
         *
         * Each one is failed with a TaskTimeoutError message as its reason,
         * which releases its resources and frees the agent's slot. Retries
         * apply as for any other failure.
         *
         * @return Ids of the tasks that timed out
         */
        std::vector<TaskId> checkDeadlines();

        /// Re-offer failed tasks whose backoff has elapsed; returns how many
        size_t processRetries();

        /**
         * @brief Ask for a specific ready task on behalf of an agent
         *
         * Claims on the same task are collected and arbitrated by the
         * configured conflict strategy at the start of the next scheduling
         * pass; the task is not handed out by the strategy meanwhile.
         *
         * @return Ticket for claimOutcome()
         * @throws UnknownEntityError if the task or agent is unknown
         */
        ConflictResolver::Ticket claimTask(const AgentId& agentId, const TaskId& taskId, int priority = 0);

        ClaimOutcome claimOutcome(ConflictResolver::Ticket ticket) const;

        /// Vote for a claimant when the voting strategy is configured
        void voteOnClaim(const TaskId& taskId, const AgentId& voter, const AgentId& candidate);

        // Observability

        /// Sample every component now; the sample is also added to the history
        CoordinationMetricsSample getMetricsSnapshot();

        /// Subscribe to the event stream with CoordinationConfig::subscriber defaults
        MessageRouter::SubscriberId subscribe(std::string name, MessageRouter::Handler handler);
        bool unsubscribe(MessageRouter::SubscriberId id);

        /// Wait until every subscriber has handled what was published so far
        bool flushEvents(std::chrono::milliseconds timeout = std::chrono::seconds(5));

        // Recovery

        /**
         * @brief Reload checkpointed tasks and agents
         *
         * Finished tasks keep their outcome. Tasks that were assigned or
         * running when the checkpoint was written lost their agent and start
         * over as ready or pending. Agents come back offline until they
         * register again. No store, or an empty one, is not an error.
         */
        RecoveryReport recover();

        // Components

        CoordinationState& state() { return _state; }
        const CoordinationState& state() const { return _state; }
        DependencyGraph& graph();
        ResourceManager& resources();
        MessageRouter& router();
        ConflictResolver& conflictResolver();
        CircuitBreakerManager& circuitBreakers();
        AdvancedTaskScheduler& scheduler();
        WorkStealingCoordinator& workStealing();
        CoordinationMetricsCollector& metrics();
        /// Null when no connection factory was supplied
        ConnectionPool* connectionPool() { return _pool.get(); }

        const CoordinationConfig& getConfig() const { return _config; }

    private:
        enum class Lifecycle : uint8_t {
            Created,
            Running,
            Stopped
        };

        struct PendingRetry {
            TimePoint due;
            std::chrono::milliseconds backoff{0};
        };

        void requireComponents() const;
        void requireRunning() const;

        void promoteReady(const TaskId& taskId);
        void releaseFromAgent(const AgentId& agentId, const TaskId& taskId, std::optional<bool> succeeded);
        void requeueRetry(const TaskId& taskId, std::chrono::milliseconds backoff);
        void forgetTask(const TaskId& taskId);
        std::chrono::milliseconds retryBackoff(uint32_t attempt) const;

        void checkpointTask(const TaskId& taskId);
        void checkpointAgent(const AgentId& agentId);
        void onEventForCheckpoint(const EventEnvelope& envelope);

        void maintenanceLoop(const std::stop_token& token);

        CoordinationConfig _config;
        ConnectionFactory _connectionFactory;
        std::shared_ptr<Memory::IMemoryStore> _store;

        std::atomic<Lifecycle> _lifecycle{Lifecycle::Created};
        std::mutex _lifecycleMutex;

        CoordinationState _state;

        // Declaration order is construction order; destruction runs in reverse
        std::unique_ptr<DependencyGraph> _graph;
        std::unique_ptr<ResourceManager> _resources;
        std::unique_ptr<MessageRouter> _router;
        std::unique_ptr<ConflictResolver> _resolver;
        std::unique_ptr<CircuitBreakerManager> _breakers;
        std::unique_ptr<ConnectionPool> _pool;
        std::unique_ptr<AdvancedTaskScheduler> _scheduler;
        std::unique_ptr<WorkStealingCoordinator> _stealer;
        std::unique_ptr<CoordinationMetricsCollector> _metrics;
        std::optional<MessageRouter::SubscriberId> _checkpointSubscription;

        std::mutex _retryMutex;
        std::map<TaskId, PendingRetry> _retries;

        std::mutex _wakeMutex;
        std::condition_variable_any _wake;
        std::jthread _maintenance;
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
