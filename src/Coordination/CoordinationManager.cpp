/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "CoordinationManager.h"
#include "CoordinationCheckpoint.h"
#include "SchedulingStrategies.h"
#include "../Logging/Logger.h"
#include "../Debug/Profiling.h"
#include <algorithm>
#include <format>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    CoordinationManager::CoordinationManager()
        : CoordinationManager(CoordinationConfig{}) {}

    CoordinationManager::CoordinationManager(const CoordinationConfig& config)
        : CoordinationManager(config, nullptr, nullptr) {}

    CoordinationManager::CoordinationManager(const CoordinationConfig& config,
                                             ConnectionFactory connectionFactory,
                                             std::shared_ptr<Memory::IMemoryStore> store)
        : _config(config)
        , _connectionFactory(std::move(connectionFactory))
        , _store(std::move(store)) {}

    CoordinationManager::~CoordinationManager() {
        shutdown();
    }

    // Lifecycle

    void CoordinationManager::initialize() {
        std::lock_guard<std::mutex> lock(_lifecycleMutex);
        auto lifecycle = _lifecycle.load();
        if (lifecycle == Lifecycle::Running) {
            return;
        }
        if (lifecycle == Lifecycle::Stopped) {
            throw std::logic_error("coordination manager cannot be restarted after shutdown");
        }

        Logging::Logger::global().setMinLevel(Logging::stringToLogLevel(_config.logLevel));

        // Leaves
        _graph = std::make_unique<DependencyGraph>();
        _resources = std::make_unique<ResourceManager>();
        for (const auto& resource : _config.resources) {
            _resources->registerResource(resource.name, resource.capacity, resource.mode);
        }
        _router = std::make_unique<MessageRouter>();
        _resolver = std::make_unique<ConflictResolver>(
            makeConflictStrategy(_config.conflictStrategy, _config.votingQuorum), _config.conflictHistory);
        _breakers = std::make_unique<CircuitBreakerManager>(_config.circuitBreaker);
        _breakers->setStateChangeCallback([](const EndpointId& endpoint, CircuitState from, CircuitState to) {
            if (to == CircuitState::Open) {
                SWARM_LOG_WARNING_CAT("Coordination", "Circuit for {} opened (was {})", endpoint,
                                      circuitStateToString(from));
            } else {
                SWARM_LOG_INFO_CAT("Coordination", "Circuit for {}: {} -> {}", endpoint,
                                   circuitStateToString(from), circuitStateToString(to));
            }
        });
        if (_connectionFactory) {
            _pool = std::make_unique<ConnectionPool>(_connectionFactory, _config.pool);
        }

        // Dependents
        _scheduler = std::make_unique<AdvancedTaskScheduler>(_state, *_graph, *_resources,
                                                             makeSchedulingStrategy(_config.strategy),
                                                             _router.get(), _resolver.get(), _config.scheduler);
        _stealer = std::make_unique<WorkStealingCoordinator>(_state, _router.get(), _config.workStealing);

        CoordinationMetricsCollector::Sources sources;
        sources.state = &_state;
        sources.scheduler = _scheduler.get();
        sources.stealer = _stealer.get();
        sources.breakers = _breakers.get();
        sources.pool = _pool.get();
        sources.resources = _resources.get();
        sources.resolver = _resolver.get();
        sources.router = _router.get();
        _metrics = std::make_unique<CoordinationMetricsCollector>(sources, _config.metrics);

        if (_store && _config.checkpointing) {
            _checkpointSubscription = _router->subscribe(
                "checkpoint", [this](const EventEnvelope& envelope) { onEventForCheckpoint(envelope); },
                _config.subscriber);
        }

        // Background loops
        if (_pool) {
            _pool->start();
        }
        if (_config.enableWorkStealing) {
            _stealer->start();
        }
        if (_config.enableMetrics) {
            _metrics->start();
        }
        if (_config.autoSchedule) {
            _maintenance = std::jthread([this](const std::stop_token& token) { maintenanceLoop(token); });
        }

        _lifecycle.store(Lifecycle::Running);
        SWARM_LOG_INFO_CAT("Coordination", "Coordination engine started (strategy {}, conflicts {})",
                           _scheduler->strategyName(), _resolver->strategyName());
    }

    void CoordinationManager::shutdown(std::chrono::milliseconds drainTimeout) {
        std::lock_guard<std::mutex> lock(_lifecycleMutex);
        if (_lifecycle.load() != Lifecycle::Running) {
            return;
        }
        _lifecycle.store(Lifecycle::Stopped);

        if (_maintenance.joinable()) {
            _maintenance.request_stop();
            _wake.notify_all();
            _maintenance.join();
        }
        _stealer->stop();

        if (_pool) {
            if (!_pool->drain(drainTimeout)) {
                SWARM_LOG_WARNING_CAT("Coordination", "Connection pool did not drain within {}ms",
                                      drainTimeout.count());
            }
            _pool->stop();
        }

        if (!_router->flush(drainTimeout)) {
            SWARM_LOG_WARNING_CAT("Coordination", "Event subscribers did not catch up within {}ms",
                                  drainTimeout.count());
        }
        _metrics->stop();
        if (!_config.enableMetrics) {
            _metrics->sample();
        }
        _router->shutdown();

        SWARM_LOG_INFO_CAT("Coordination", "Coordination engine stopped");
    }

    void CoordinationManager::requireComponents() const {
        if (_lifecycle.load() == Lifecycle::Created) {
            throw std::logic_error("coordination manager is not initialized");
        }
    }

    void CoordinationManager::requireRunning() const {
        if (_lifecycle.load() != Lifecycle::Running) {
            throw std::logic_error("coordination manager is not running");
        }
    }

    void CoordinationManager::maintenanceLoop(const std::stop_token& token) {
        while (!token.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(_wakeMutex);
                _wake.wait_for(lock, token, _config.maintenanceInterval, [] { return false; });
            }
            if (token.stop_requested() || !isRunning()) {
                return;
            }
            try {
                scheduleReadyTasks();
                checkDeadlines();
            } catch (const std::exception& e) {
                SWARM_LOG_ERROR_CAT("Coordination", "Maintenance pass failed: {}", e.what());
            }
        }
    }

    // Agents

    void CoordinationManager::registerAgent(const AgentId& agentId,
                                            std::set<std::string> capabilities,
                                            size_t maxConcurrentTasks) {
        requireRunning();
        if (agentId.empty()) {
            throw std::invalid_argument("agent id must not be empty");
        }

        AgentInfo agent;
        agent.id = agentId;
        agent.capabilities = capabilities;
        agent.maxConcurrentTasks = maxConcurrentTasks;

        if (!_state.agents.insert(agentId, agent)) {
            _state.agents.update(agentId, [&](AgentInfo& existing) {
                if (existing.status != AgentStatus::Offline) {
                    throw std::invalid_argument("agent " + agentId + " is already registered");
                }
                existing.capabilities = std::move(capabilities);
                existing.maxConcurrentTasks = maxConcurrentTasks;
                existing.queuedTasks.clear();
                existing.runningTasks.clear();
                existing.status = AgentStatus::Idle;
                existing.lastActivity = Clock::now();
            });
            SWARM_LOG_INFO_CAT("Coordination", "Agent {} is back online", agentId);
        } else {
            SWARM_LOG_INFO_CAT("Coordination", "Agent {} registered", agentId);
        }

        checkpointAgent(agentId);
        _stealer->notifyLoadChanged();
    }

    size_t CoordinationManager::unregisterAgent(const AgentId& agentId) {
        requireRunning();

        std::vector<TaskId> returned;
        _state.agents.update(agentId, [&returned](AgentInfo& agent) {
            returned = agent.queuedTasks;
            agent.queuedTasks.clear();
            if (agent.status != AgentStatus::Offline) {
                agent.status = agent.runningTasks.empty() ? AgentStatus::Offline : AgentStatus::Draining;
            }
            agent.lastActivity = Clock::now();
        });

        size_t requeued = 0;
        for (const auto& taskId : returned) {
            bool released = false;
            try {
                _state.tasks.update(taskId, [&](Task& task) {
                    released = false;
                    if (task.status == TaskStatus::Assigned && task.assignedAgent == agentId) {
                        task.status = TaskStatus::Ready;
                        task.assignedAgent.reset();
                        released = true;
                    }
                });
            } catch (const CoordinationError& e) {
                SWARM_LOG_WARNING_CAT("Coordination", "Could not return {} from {}: {}", taskId, agentId, e.what());
                continue;
            }
            if (!released) {
                continue;
            }

            _resources->release(taskId);
            try {
                _graph->markReady(taskId);
            } catch (const std::logic_error& e) {
                SWARM_LOG_WARNING_CAT("Coordination", "Returned task {} is no longer dispatchable: {}", taskId, e.what());
                continue;
            }
            if (_scheduler->requeue(taskId)) {
                ++requeued;
            }
            checkpointTask(taskId);
        }

        _scheduler->notifyAgentRemoved(agentId);
        checkpointAgent(agentId);
        _stealer->notifyLoadChanged();

        SWARM_LOG_INFO_CAT("Coordination", "Agent {} draining, {} task(s) returned to the queue", agentId, requeued);
        return requeued;
    }

    std::optional<Versioned<AgentInfo>> CoordinationManager::getAgent(const AgentId& agentId) const {
        return _state.agents.read(agentId);
    }

    void CoordinationManager::releaseFromAgent(const AgentId& agentId, const TaskId& taskId,
                                               std::optional<bool> succeeded) {
        try {
            _state.agents.update(agentId, [&](AgentInfo& agent) {
                auto erase = [&taskId](std::vector<TaskId>& ids) {
                    ids.erase(std::remove(ids.begin(), ids.end(), taskId), ids.end());
                };
                erase(agent.queuedTasks);
                erase(agent.runningTasks);
                if (succeeded) {
                    ++(*succeeded ? agent.completedCount : agent.failedCount);
                }
                if (agent.load() == 0) {
                    if (agent.status == AgentStatus::Draining) {
                        agent.status = AgentStatus::Offline;
                    } else if (agent.status == AgentStatus::Busy) {
                        agent.status = AgentStatus::Idle;
                    }
                }
                agent.lastActivity = Clock::now();
            });
        } catch (const CoordinationError& e) {
            SWARM_LOG_WARNING_CAT("Coordination", "Could not release {} from agent {}: {}", taskId, agentId, e.what());
            return;
        }
        checkpointAgent(agentId);
        _stealer->notifyLoadChanged();
    }

    // Tasks

    TaskStatus CoordinationManager::submit(Task task) {
        SWARM_PROFILE_ZONE_NC("CoordinationManager::submit", Debug::ProfileColors::Graph);
        requireRunning();
        if (task.id.empty()) {
            throw std::invalid_argument("task id must not be empty");
        }
        if (_state.tasks.contains(task.id)) {
            throw DuplicateTaskError(task.id);
        }

        // The graph is the gate for duplicates and cycles
        GraphNodeState initial = _graph->addTask(task.id, task.dependencies);

        task.assignedAgent.reset();
        task.createdAt = Clock::now();
        task.startedAt.reset();
        task.finishedAt.reset();
        task.lastRetryAt.reset();
        task.cancelRequested = false;
        task.stealCount = 0;
        switch (initial) {
            case GraphNodeState::Ready:
                task.status = TaskStatus::Ready;
                break;
            case GraphNodeState::Cancelled:
                task.status = TaskStatus::Cancelled;
                task.failureReason = "a dependency already failed or was cancelled";
                task.finishedAt = task.createdAt;
                break;
            default:
                task.status = TaskStatus::Pending;
                break;
        }

        const TaskId taskId = task.id;
        if (!_state.tasks.insert(taskId, task)) {
            throw DuplicateTaskError(taskId);
        }

        if (task.status == TaskStatus::Ready) {
            _scheduler->enqueue(taskId);
        } else if (task.status == TaskStatus::Pending) {
            // A dependency may have completed between addTask() and insert()
            if (_graph->getStatus(taskId) == GraphNodeState::Ready) {
                promoteReady(taskId);
            }
        } else {
            TaskCancelledEvent event;
            event.taskId = taskId;
            event.reason = task.failureReason;
            _router->publish(event);
        }

        SWARM_LOG_TASK(Logging::LogLevel::Debug, "Coordination", taskId, "",
                       "Submitted as {} with {} dependenc{}", taskStatusToString(task.status),
                       task.dependencies.size(), task.dependencies.size() == 1 ? "y" : "ies");
        checkpointTask(taskId);
        return task.status;
    }

    void CoordinationManager::promoteReady(const TaskId& taskId) {
        if (!_state.tasks.contains(taskId)) {
            // submit() is between the graph and the table; it promotes the task itself
            return;
        }
        bool promoted = false;
        _state.tasks.update(taskId, [&promoted](Task& task) {
            promoted = false;
            if (task.status == TaskStatus::Pending) {
                task.status = TaskStatus::Ready;
                promoted = true;
            }
        });
        if (promoted) {
            _scheduler->enqueue(taskId);
            checkpointTask(taskId);
        }
    }

    std::vector<TaskId> CoordinationManager::cancel(const TaskId& taskId) {
        requireRunning();

        enum class Action { None, Flagged, Cancelled };
        Action action = Action::None;
        TaskStatus before = TaskStatus::Pending;
        std::optional<AgentId> heldBy;

        _state.tasks.update(taskId, [&](Task& task) {
            action = Action::None;
            before = task.status;
            heldBy = task.assignedAgent;
            if (task.isTerminal()) {
                return;
            }
            if (task.status == TaskStatus::Running) {
                task.cancelRequested = true;
                action = Action::Flagged;
                return;
            }
            task.status = TaskStatus::Cancelled;
            task.failureReason = "cancelled by request";
            task.finishedAt = Clock::now();
            task.assignedAgent.reset();
            action = Action::Cancelled;
        });

        if (action == Action::None) {
            return {};
        }
        if (action == Action::Flagged) {
            SWARM_LOG_TASK(Logging::LogLevel::Info, "Coordination", taskId, heldBy.value_or(""),
                           "Cancellation requested while running");
            checkpointTask(taskId);
            return {};
        }

        forgetTask(taskId);
        if (before == TaskStatus::Assigned && heldBy) {
            releaseFromAgent(*heldBy, taskId, std::nullopt);
        }
        _resources->release(taskId);

        auto graphCancelled = _graph->cancel(taskId);

        TaskCancelledEvent event;
        event.taskId = taskId;
        event.reason = "cancelled by request";
        _router->publish(event);

        std::vector<TaskId> cancelled{taskId};
        if (graphCancelled.size() > 1) {
            std::vector<TaskId> dependents(graphCancelled.begin() + 1, graphCancelled.end());
            auto cascaded = recordCancellations(_state, _router.get(), dependents, taskId,
                                                "upstream task " + taskId + " was cancelled");
            for (const auto& id : cascaded) {
                forgetTask(id);
                checkpointTask(id);
            }
            cancelled.insert(cancelled.end(), cascaded.begin(), cascaded.end());
        }

        SWARM_LOG_TASK(Logging::LogLevel::Info, "Coordination", taskId, "",
                       "Cancelled along with {} dependent(s)", cancelled.size() - 1);
        checkpointTask(taskId);
        return cancelled;
    }

    void CoordinationManager::forgetTask(const TaskId& taskId) {
        _scheduler->remove(taskId);
        std::lock_guard<std::mutex> lock(_retryMutex);
        _retries.erase(taskId);
    }

    std::optional<Versioned<Task>> CoordinationManager::getStatus(const TaskId& taskId) const {
        return _state.tasks.read(taskId);
    }

    std::vector<AssignmentResult> CoordinationManager::scheduleReadyTasks(size_t maxAssignments) {
        SWARM_PROFILE_ZONE_NC("CoordinationManager::scheduleReadyTasks", Debug::ProfileColors::Scheduling);
        requireRunning();

        processRetries();
        auto results = _scheduler->schedule(maxAssignments);

        bool assigned = false;
        for (const auto& result : results) {
            if (result.assigned()) {
                assigned = true;
            }
            if (result.status == AssignmentStatus::Expired) {
                forgetTask(result.taskId);
            }
        }
        if (assigned) {
            _stealer->notifyLoadChanged();
        }
        return results;
    }

    void CoordinationManager::startTask(const AgentId& agentId, const TaskId& taskId) {
        requireRunning();

        _state.tasks.update(taskId, [&](Task& task) {
            if (task.status != TaskStatus::Assigned || task.assignedAgent != agentId) {
                throw std::logic_error(std::format("task {} is {}{}, cannot be started by {}", taskId,
                                                   taskStatusToString(task.status),
                                                   task.assignedAgent ? " on " + *task.assignedAgent : "",
                                                   agentId));
            }
            task.status = TaskStatus::Running;
            task.startedAt = Clock::now();
        });

        try {
            _state.agents.update(agentId, [&taskId](AgentInfo& agent) {
                auto& queued = agent.queuedTasks;
                queued.erase(std::remove(queued.begin(), queued.end(), taskId), queued.end());
                if (std::find(agent.runningTasks.begin(), agent.runningTasks.end(), taskId) == agent.runningTasks.end()) {
                    agent.runningTasks.push_back(taskId);
                }
                if (agent.status == AgentStatus::Idle) {
                    agent.status = AgentStatus::Busy;
                }
                agent.lastActivity = Clock::now();
            });
        } catch (const CoordinationError& e) {
            SWARM_LOG_WARNING_CAT("Coordination", "Agent {} record not updated for {}: {}", agentId, taskId, e.what());
        }

        TaskStartedEvent event;
        event.taskId = taskId;
        event.agentId = agentId;
        _router->publish(event);
        SWARM_LOG_TASK(Logging::LogLevel::Debug, "Coordination", taskId, agentId, "Started");
    }

    void CoordinationManager::completeTask(const AgentId& agentId, const TaskId& taskId) {
        SWARM_PROFILE_ZONE_NC("CoordinationManager::completeTask", Debug::ProfileColors::Graph);
        requireRunning();

        auto finished = _state.tasks.update(taskId, [&](Task& task) {
            if (task.status != TaskStatus::Running || task.assignedAgent != agentId) {
                throw std::logic_error(std::format("task {} is {}, not running on {}", taskId,
                                                   taskStatusToString(task.status), agentId));
            }
            task.status = TaskStatus::Completed;
            task.finishedAt = Clock::now();
        });

        releaseFromAgent(agentId, taskId, true);
        _resources->release(taskId);

        std::vector<TaskId> promoted;
        try {
            promoted = _graph->markCompleted(taskId);
        } catch (const std::logic_error& e) {
            SWARM_LOG_ERROR_CAT("Coordination", "Graph rejected completion of {}: {}", taskId, e.what());
        }
        for (const auto& id : promoted) {
            promoteReady(id);
        }

        _scheduler->notifyTaskCompleted(finished.value, agentId);

        TaskCompletedEvent event;
        event.taskId = taskId;
        event.agentId = agentId;
        if (finished.value.startedAt && finished.value.finishedAt) {
            event.runTime = std::chrono::duration_cast<std::chrono::milliseconds>(
                *finished.value.finishedAt - *finished.value.startedAt);
        }
        _router->publish(event);

        SWARM_LOG_TASK(Logging::LogLevel::Debug, "Coordination", taskId, agentId,
                       "Completed in {}ms, {} dependent(s) ready", event.runTime.count(), promoted.size());
    }

    bool CoordinationManager::failTask(const AgentId& agentId, const TaskId& taskId, const std::string& reason) {
        requireRunning();

        bool willRetry = false;
        auto failed = _state.tasks.update(taskId, [&](Task& task) {
            if (task.status != TaskStatus::Running || task.assignedAgent != agentId) {
                throw std::logic_error(std::format("task {} is {}, not running on {}", taskId,
                                                   taskStatusToString(task.status), agentId));
            }
            willRetry = task.canRetry() && !task.cancelRequested;
            auto now = Clock::now();
            if (willRetry) {
                // Failed and straight back to Ready; the queue sees it after the backoff
                ++task.retryCount;
                task.status = TaskStatus::Ready;
                task.assignedAgent.reset();
                task.startedAt.reset();
                task.lastRetryAt = now;
                task.failureReason = reason;
            } else {
                task.status = TaskStatus::Failed;
                task.finishedAt = now;
                task.failureReason = task.cancelRequested ? "cancelled while running: " + reason : reason;
            }
        });

        releaseFromAgent(agentId, taskId, false);
        _resources->release(taskId);

        TaskFailedEvent event;
        event.taskId = taskId;
        event.agentId = agentId;
        event.reason = failed.value.failureReason;
        event.willRetry = willRetry;
        _router->publish(event);

        if (willRetry) {
            auto backoff = retryBackoff(failed.value.retryCount);
            SWARM_LOG_TASK(Logging::LogLevel::Warning, "Coordination", taskId, agentId,
                           "Failed ({}), retry {}/{} in {}ms", reason, failed.value.retryCount,
                           failed.value.maxRetries, backoff.count());
            if (backoff.count() <= 0) {
                requeueRetry(taskId, backoff);
            } else {
                std::lock_guard<std::mutex> lock(_retryMutex);
                _retries[taskId] = PendingRetry{Clock::now() + backoff, backoff};
            }
            return true;
        }

        SWARM_LOG_TASK(Logging::LogLevel::Error, "Coordination", taskId, agentId,
                       "Failed permanently: {}", failed.value.failureReason);
        auto dependents = _graph->markFailed(taskId);
        auto cascaded = recordCancellations(_state, _router.get(), dependents, taskId,
                                            "upstream task " + taskId + " failed");
        for (const auto& id : cascaded) {
            forgetTask(id);
            checkpointTask(id);
        }
        return false;
    }

    std::chrono::milliseconds CoordinationManager::retryBackoff(uint32_t attempt) const {
        auto delay = _config.retryBackoffBase;
        for (uint32_t i = 1; i < attempt && delay < _config.retryBackoffMax; ++i) {
            delay *= 2;
        }
        return std::min(delay, _config.retryBackoffMax);
    }

    void CoordinationManager::requeueRetry(const TaskId& taskId, std::chrono::milliseconds backoff) {
        auto snapshot = _state.tasks.read(taskId);
        if (!snapshot || snapshot->value.status != TaskStatus::Ready) {
            return;
        }
        try {
            _graph->markReady(taskId);
        } catch (const std::logic_error& e) {
            SWARM_LOG_DEBUG_CAT("Coordination", "Retry of {} dropped: {}", taskId, e.what());
            return;
        }
        _scheduler->requeue(taskId);

        TaskRetriedEvent event;
        event.taskId = taskId;
        event.attempt = snapshot->value.retryCount;
        event.backoff = backoff;
        _router->publish(event);
    }

    size_t CoordinationManager::processRetries() {
        requireRunning();

        std::vector<std::pair<TaskId, std::chrono::milliseconds>> due;
        {
            auto now = Clock::now();
            std::lock_guard<std::mutex> lock(_retryMutex);
            for (auto it = _retries.begin(); it != _retries.end();) {
                if (it->second.due <= now) {
                    due.emplace_back(it->first, it->second.backoff);
                    it = _retries.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (const auto& [taskId, backoff] : due) {
            requeueRetry(taskId, backoff);
        }
        return due.size();
    }

    ExecutionResult CoordinationManager::executeTask(const AgentId& agentId,
                                                     const TaskId& taskId,
                                                     const EndpointId& endpoint,
                                                     const std::string& payload) {
        SWARM_PROFILE_ZONE_NC("CoordinationManager::executeTask", Debug::ProfileColors::Backend);
        requireRunning();
        if (!_pool) {
            throw std::logic_error("no backend connection factory configured");
        }

        auto snapshot = _state.tasks.get(taskId);
        if (snapshot.value.status == TaskStatus::Assigned) {
            startTask(agentId, taskId);
        } else if (snapshot.value.status != TaskStatus::Running || snapshot.value.assignedAgent != agentId) {
            throw std::logic_error(std::format("task {} is {}, not held by {}", taskId,
                                               taskStatusToString(snapshot.value.status), agentId));
        }

        ExecutionResult result;
        const auto& retry = _config.backendRetry;
        uint32_t maxAttempts = std::max(retry.maxAttempts, 1u);
        auto delay = retry.baseDelay;
        uint32_t attempt = 0;
        uint32_t poolWaits = 0;
        bool contended = false;

        while (attempt < maxAttempts) {
            contended = false;
            try {
                auto lease = _pool->acquire();
                result.attempts = ++attempt;
                try {
                    result.output = _breakers->execute(endpoint, [&lease, &endpoint, &payload] {
                        return lease->invoke(endpoint, payload);
                    });
                } catch (const std::exception&) {
                    if (!lease->isHealthy()) {
                        lease.invalidate();
                    }
                    throw;
                }
                result.succeeded = true;
                result.error = nullptr;
                result.errorMessage.clear();
                break;
            } catch (const CircuitOpenError& e) {
                // Isolated endpoint: further attempts would be rejected the same way
                result.error = std::current_exception();
                result.errorMessage = e.what();
                break;
            } catch (const PoolExhaustedError& e) {
                // Contention, not a backend failure: no attempt is spent on it
                contended = true;
                result.error = std::current_exception();
                result.errorMessage = e.what();
                SWARM_LOG_TASK(Logging::LogLevel::Debug, "Coordination", taskId, agentId,
                               "No connection for {} (wait {}/{}): {}", endpoint, poolWaits + 1, maxAttempts,
                               e.what());
                if (++poolWaits >= maxAttempts) {
                    break;
                }
            } catch (const std::exception& e) {
                result.error = std::current_exception();
                result.errorMessage = e.what();
                SWARM_LOG_TASK(Logging::LogLevel::Warning, "Coordination", taskId, agentId,
                               "Backend call to {} failed (attempt {}/{}): {}", endpoint, attempt, maxAttempts,
                               e.what());
            }

            auto current = _state.tasks.read(taskId);
            if (attempt == maxAttempts || !current || current->value.cancelRequested) {
                break;
            }
            std::this_thread::sleep_for(delay);
            delay = std::min(delay * 2, retry.maxDelay);
        }

        if (result.succeeded) {
            completeTask(agentId, taskId);
        } else if (contended) {
            // The task stays Running on the agent, which may call again later
            result.deferred = true;
            SWARM_LOG_TASK(Logging::LogLevel::Info, "Coordination", taskId, agentId,
                           "Execution on {} deferred, connection pool exhausted", endpoint);
        } else {
            result.willRetry = failTask(agentId, taskId,
                                        std::format("backend call to {} failed after {} attempt(s): {}",
                                                    endpoint, result.attempts, result.errorMessage));
        }
        return result;
    }

    std::vector<TaskId> CoordinationManager::checkDeadlines() {
        requireRunning();

        std::vector<TaskId> timedOut;
        auto now = Clock::now();
        for (const auto& snapshot : _state.tasks.snapshotAll()) {
            const Task& task = snapshot.value;
            if (task.status != TaskStatus::Running || task.timeout.count() <= 0 ||
                !task.startedAt || !task.assignedAgent) {
                continue;
            }
            if (now - *task.startedAt <= task.timeout) {
                continue;
            }
            try {
                failTask(*task.assignedAgent, task.id, TaskTimeoutError(task.id).what());
                timedOut.push_back(task.id);
            } catch (const std::logic_error& e) {
                // Finished or moved while we were looking
                SWARM_LOG_DEBUG_CAT("Coordination", "Deadline check skipped {}: {}", task.id, e.what());
            }
        }
        if (!timedOut.empty()) {
            SWARM_LOG_WARNING_CAT("Coordination", "{} task(s) exceeded their deadline", timedOut.size());
        }
        return timedOut;
    }

    // Claims

    ConflictResolver::Ticket CoordinationManager::claimTask(const AgentId& agentId, const TaskId& taskId, int priority) {
        requireRunning();
        auto snapshot = _state.tasks.get(taskId);
        if (!_state.agents.contains(agentId)) {
            throw UnknownEntityError("agent", agentId);
        }

        ConflictResolver::Proposal proposal;
        proposal.claim.agentId = agentId;
        proposal.claim.requestedVersion = snapshot.version;
        proposal.claim.priority = priority;
        proposal.apply = [this, agentId, taskId, version = snapshot.version] {
            auto current = _state.tasks.get(taskId);
            if (current.version != version) {
                throw VersionConflictError(taskId, version, current.version);
            }
            auto result = _scheduler->assignTo(taskId, agentId);
            switch (result.status) {
                case AssignmentStatus::Assigned:
                    _stealer->notifyLoadChanged();
                    return;
                case AssignmentStatus::NoCapableAgent:
                    throw NoCapableAgentError(taskId);
                case AssignmentStatus::InsufficientResources:
                case AssignmentStatus::Expired:
                    throw CoordinationError(CoordinationErrorCode::InsufficientResource, result.detail);
                default: {
                    auto latest = _state.tasks.get(taskId);
                    throw VersionConflictError(taskId, version, latest.version);
                }
            }
        };
        proposal.onResolved = [agentId, taskId](ClaimOutcome outcome) {
            SWARM_LOG_TASK(Logging::LogLevel::Debug, "Coordination", taskId, agentId,
                           "Claim resolved: {}", claimOutcomeToString(outcome));
        };
        return _resolver->submit(taskId, std::move(proposal));
    }

    ClaimOutcome CoordinationManager::claimOutcome(ConflictResolver::Ticket ticket) const {
        requireComponents();
        return _resolver->outcome(ticket);
    }

    void CoordinationManager::voteOnClaim(const TaskId& taskId, const AgentId& voter, const AgentId& candidate) {
        requireRunning();
        _resolver->castVote(taskId, voter, candidate);
    }

    // Observability

    CoordinationMetricsSample CoordinationManager::getMetricsSnapshot() {
        requireComponents();
        return _metrics->sample();
    }

    MessageRouter::SubscriberId CoordinationManager::subscribe(std::string name, MessageRouter::Handler handler) {
        requireRunning();
        return _router->subscribe(std::move(name), std::move(handler), _config.subscriber);
    }

    bool CoordinationManager::unsubscribe(MessageRouter::SubscriberId id) {
        requireComponents();
        return _router->unsubscribe(id);
    }

    bool CoordinationManager::flushEvents(std::chrono::milliseconds timeout) {
        requireComponents();
        return _router->flush(timeout);
    }

    // Checkpoints

    void CoordinationManager::onEventForCheckpoint(const EventEnvelope& envelope) {
        checkpointTask(envelope.taskId());
        std::visit([this](const auto& event) {
            using EventType = std::decay_t<decltype(event)>;
            if constexpr (std::is_same_v<EventType, TaskStolenEvent>) {
                checkpointAgent(event.fromAgent);
                checkpointAgent(event.toAgent);
            } else if constexpr (std::is_same_v<EventType, TaskAssignedEvent>) {
                checkpointAgent(event.agentId);
            }
        }, envelope.event);
    }

    void CoordinationManager::checkpointTask(const TaskId& taskId) {
        if (!_store || !_config.checkpointing) {
            return;
        }
        try {
            auto snapshot = _state.tasks.read(taskId);
            if (!snapshot) {
                _store->remove(_config.checkpointNamespace, taskCheckpointKey(taskId));
                return;
            }
            _store->put(_config.checkpointNamespace, taskCheckpointKey(taskId),
                        taskToJson(snapshot->value, snapshot->version).dump());
        } catch (const std::exception& e) {
            SWARM_LOG_WARNING_CAT("Coordination", "Checkpoint of task {} failed: {}", taskId, e.what());
        }
    }

    void CoordinationManager::checkpointAgent(const AgentId& agentId) {
        if (!_store || !_config.checkpointing) {
            return;
        }
        try {
            auto snapshot = _state.agents.read(agentId);
            if (!snapshot) {
                _store->remove(_config.checkpointNamespace, agentCheckpointKey(agentId));
                return;
            }
            _store->put(_config.checkpointNamespace, agentCheckpointKey(agentId),
                        agentToJson(snapshot->value, snapshot->version).dump());
        } catch (const std::exception& e) {
            SWARM_LOG_WARNING_CAT("Coordination", "Checkpoint of agent {} failed: {}", agentId, e.what());
        }
    }

    RecoveryReport CoordinationManager::recover() {
        requireRunning();
        RecoveryReport report;
        if (!_store) {
            return report;
        }
        const auto& ns = _config.checkpointNamespace;

        std::unordered_map<TaskId, Task> restored;
        for (const auto& key : _store->keys(ns, kTaskKeyPrefix)) {
            auto value = _store->get(ns, key);
            if (!value) {
                continue;
            }
            try {
                Task task = taskFromJson(nlohmann::json::parse(*value));
                if (_graph->contains(task.id) || _state.tasks.contains(task.id)) {
                    ++report.skipped;
                    continue;
                }
                restored.emplace(task.id, std::move(task));
            } catch (const std::exception& e) {
                SWARM_LOG_WARNING_CAT("Coordination", "Unreadable checkpoint {}: {}", key, e.what());
                ++report.skipped;
            }
        }

        // Edges first, in any order: forward references resolve as tasks arrive
        for (auto it = restored.begin(); it != restored.end();) {
            try {
                _graph->addTask(it->first, it->second.dependencies);
                ++it;
            } catch (const CoordinationError& e) {
                SWARM_LOG_WARNING_CAT("Coordination", "Checkpointed task {} rejected: {}", it->first, e.what());
                ++report.skipped;
                it = restored.erase(it);
            }
        }

        // Replay finished outcomes upstream first so the graph derives the rest
        for (const auto& id : _graph->topologicalOrder()) {
            auto it = restored.find(id);
            if (it == restored.end()) {
                continue;
            }
            auto state = _graph->getStatus(id);
            if (!state || *state == GraphNodeState::Completed || *state == GraphNodeState::Failed ||
                *state == GraphNodeState::Cancelled) {
                continue;
            }
            switch (it->second.status) {
                case TaskStatus::Completed:
                    if (*state == GraphNodeState::Pending) {
                        // Its dependencies were not restored as completed; run it again
                        SWARM_LOG_WARNING_CAT("Coordination", "Checkpointed task {} completed before its dependencies",
                                              id);
                        it->second.status = TaskStatus::Pending;
                    } else {
                        _graph->markCompleted(id);
                    }
                    break;
                case TaskStatus::Failed:    _graph->markFailed(id); break;
                case TaskStatus::Cancelled: _graph->cancel(id); break;
                default: break;
            }
        }

        for (auto& [id, task] : restored) {
            if (!task.isTerminal()) {
                auto state = _graph->getStatus(id);
                task.assignedAgent.reset();
                task.startedAt.reset();
                task.cancelRequested = false;
                if (state == GraphNodeState::Ready) {
                    task.status = TaskStatus::Ready;
                } else if (state == GraphNodeState::Cancelled) {
                    task.status = TaskStatus::Cancelled;
                    task.failureReason = "upstream task did not survive recovery";
                } else {
                    task.status = TaskStatus::Pending;
                }
            }
            task.createdAt = Clock::now();
            if (!_state.tasks.insert(id, task)) {
                ++report.skipped;
                continue;
            }
            ++report.tasks;
            if (task.status == TaskStatus::Ready && _scheduler->enqueue(id)) {
                ++report.requeued;
            }
            checkpointTask(id);
        }

        for (const auto& key : _store->keys(ns, kAgentKeyPrefix)) {
            auto value = _store->get(ns, key);
            if (!value) {
                continue;
            }
            try {
                AgentInfo agent = agentFromJson(nlohmann::json::parse(*value));
                agent.status = AgentStatus::Offline;
                agent.queuedTasks.clear();
                agent.runningTasks.clear();
                agent.lastActivity = Clock::now();
                const AgentId agentId = agent.id;
                if (!_state.agents.insert(agentId, std::move(agent))) {
                    ++report.skipped;
                    continue;
                }
                ++report.agents;
                checkpointAgent(agentId);
            } catch (const std::exception& e) {
                SWARM_LOG_WARNING_CAT("Coordination", "Unreadable checkpoint {}: {}", key, e.what());
                ++report.skipped;
            }
        }

        SWARM_LOG_INFO_CAT("Coordination", "Recovered {} task(s) and {} agent(s), {} requeued, {} skipped",
                           report.tasks, report.agents, report.requeued, report.skipped);
        return report;
    }

    // Components

    DependencyGraph& CoordinationManager::graph() {
        requireComponents();
        return *_graph;
    }

    ResourceManager& CoordinationManager::resources() {
        requireComponents();
        return *_resources;
    }

    MessageRouter& CoordinationManager::router() {
        requireComponents();
        return *_router;
    }

    ConflictResolver& CoordinationManager::conflictResolver() {
        requireComponents();
        return *_resolver;
    }

    CircuitBreakerManager& CoordinationManager::circuitBreakers() {
        requireComponents();
        return *_breakers;
    }

    AdvancedTaskScheduler& CoordinationManager::scheduler() {
        requireComponents();
        return *_scheduler;
    }

    WorkStealingCoordinator& CoordinationManager::workStealing() {
        requireComponents();
        return *_stealer;
    }

    CoordinationMetricsCollector& CoordinationManager::metrics() {
        requireComponents();
        return *_metrics;
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
