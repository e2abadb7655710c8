/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "TaskScheduler.h"
#include "SchedulingStrategies.h"
#include "../Logging/Logger.h"
#include "../Debug/Profiling.h"
#include <algorithm>
#include <format>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    namespace {
        // Raised from inside an agent record mutation to abort it
        class AgentUnavailableError : public std::runtime_error {
        public:
            explicit AgentUnavailableError(const AgentId& agentId)
                : std::runtime_error("agent " + agentId + " no longer accepts work") {}
        };

        // Holds a task in the in-flight set for the duration of one assign()
        class InFlightGuard {
        public:
            InFlightGuard(std::mutex& mutex, std::set<TaskId>& inFlight, const TaskId& taskId)
                : _mutex(mutex), _inFlight(inFlight), _taskId(taskId) {
                std::lock_guard<std::mutex> lock(_mutex);
                _acquired = _inFlight.insert(_taskId).second;
            }

            ~InFlightGuard() {
                if (_acquired) {
                    std::lock_guard<std::mutex> lock(_mutex);
                    _inFlight.erase(_taskId);
                }
            }

            bool acquired() const { return _acquired; }

        private:
            std::mutex& _mutex;
            std::set<TaskId>& _inFlight;
            const TaskId& _taskId;
            bool _acquired = false;
        };
    }

    const char* assignmentStatusToString(AssignmentStatus status) {
        switch (status) {
            case AssignmentStatus::Assigned:              return "assigned";
            case AssignmentStatus::NotReady:              return "not-ready";
            case AssignmentStatus::NoCapableAgent:        return "no-capable-agent";
            case AssignmentStatus::InsufficientResources: return "insufficient-resources";
            case AssignmentStatus::VersionConflict:       return "version-conflict";
            case AssignmentStatus::Deferred:              return "deferred";
            case AssignmentStatus::Expired:               return "expired";
        }
        return "unknown";
    }

    TaskScheduler::TaskScheduler(CoordinationState& state,
                                 DependencyGraph& graph,
                                 ResourceManager& resources,
                                 MessageRouter* router,
                                 ConflictResolver* resolver)
        : TaskScheduler(state, graph, resources, router, resolver, Config{}) {}

    TaskScheduler::TaskScheduler(CoordinationState& state,
                                 DependencyGraph& graph,
                                 ResourceManager& resources,
                                 MessageRouter* router,
                                 ConflictResolver* resolver,
                                 const Config& config)
        : _state(state)
        , _graph(graph)
        , _resources(resources)
        , _router(router)
        , _resolver(resolver)
        , _config(config) {}

    bool TaskScheduler::insertLocked(const TaskId& taskId, int priority) {
        if (_queued.count(taskId)) {
            return false;
        }
        QueueEntry entry{priority, _nextSequence++, taskId};
        _queue.insert(entry);
        _queued.emplace(taskId, std::move(entry));
        return true;
    }

    bool TaskScheduler::removeLocked(const TaskId& taskId) {
        _unassignableSince.erase(taskId);
        auto it = _queued.find(taskId);
        if (it == _queued.end()) {
            return false;
        }
        _queue.erase(it->second);
        _queued.erase(it);
        return true;
    }

    bool TaskScheduler::enqueue(const TaskId& taskId) {
        auto snapshot = _state.tasks.read(taskId);
        if (!snapshot || snapshot->value.status != TaskStatus::Ready) {
            return false;
        }
        std::lock_guard<std::mutex> lock(_queueMutex);
        return insertLocked(taskId, snapshot->value.priority);
    }

    bool TaskScheduler::requeue(const TaskId& taskId) {
        auto snapshot = _state.tasks.read(taskId);
        if (!snapshot || snapshot->value.status != TaskStatus::Ready) {
            return false;
        }
        std::lock_guard<std::mutex> lock(_queueMutex);
        auto it = _queued.find(taskId);
        if (it != _queued.end()) {
            _queue.erase(it->second);
            _queued.erase(it);
        }
        return insertLocked(taskId, snapshot->value.priority);
    }

    bool TaskScheduler::remove(const TaskId& taskId) {
        std::lock_guard<std::mutex> lock(_queueMutex);
        return removeLocked(taskId);
    }

    bool TaskScheduler::isQueued(const TaskId& taskId) const {
        std::lock_guard<std::mutex> lock(_queueMutex);
        return _queued.count(taskId) > 0;
    }

    size_t TaskScheduler::queueDepth() const {
        std::lock_guard<std::mutex> lock(_queueMutex);
        return _queue.size();
    }

    std::vector<TaskId> TaskScheduler::readyQueue() const {
        std::lock_guard<std::mutex> lock(_queueMutex);
        std::vector<TaskId> order;
        order.reserve(_queue.size());
        for (const auto& entry : _queue) {
            order.push_back(entry.taskId);
        }
        return order;
    }

    std::vector<AgentInfo> TaskScheduler::candidateAgents() const {
        std::vector<AgentInfo> candidates;
        for (auto& snapshot : _state.agents.snapshotAll()) {
            if (snapshot.value.acceptsWork() && snapshot.value.hasCapacity()) {
                candidates.push_back(std::move(snapshot.value));
            }
        }
        std::sort(candidates.begin(), candidates.end(),
                  [](const AgentInfo& a, const AgentInfo& b) { return a.id < b.id; });
        return candidates;
    }

    TaskScheduler::Selection TaskScheduler::selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) {
        for (const auto& agent : candidates) {
            if (agent.hasCapabilities(task.requiredCapabilities)) {
                return {agent.id, strategyName()};
            }
        }
        throw NoCapableAgentError(task.id);
    }

    AssignmentResult TaskScheduler::assign(const TaskId& taskId) {
        SWARM_PROFILE_ZONE_NC("TaskScheduler::assign", Debug::ProfileColors::Scheduling);

        InFlightGuard guard(_queueMutex, _inFlight, taskId);
        AssignmentResult result;
        if (!guard.acquired()) {
            result.status = AssignmentStatus::Deferred;
            result.taskId = taskId;
            result.strategy = strategyName();
            result.detail = "assignment already in progress";
        } else {
            result = runPipeline(taskId, std::nullopt);
        }
        record(result);
        return result;
    }

    AssignmentResult TaskScheduler::assignTo(const TaskId& taskId, const AgentId& agentId) {
        SWARM_PROFILE_ZONE_NC("TaskScheduler::assignTo", Debug::ProfileColors::Scheduling);

        InFlightGuard guard(_queueMutex, _inFlight, taskId);
        AssignmentResult result;
        if (!guard.acquired()) {
            result.status = AssignmentStatus::Deferred;
            result.taskId = taskId;
            result.agentId = agentId;
            result.strategy = "claim";
            result.detail = "assignment already in progress";
        } else {
            result = runPipeline(taskId, agentId);
        }
        record(result);
        return result;
    }

    AssignmentResult TaskScheduler::runPipeline(const TaskId& taskId, const std::optional<AgentId>& claimant) {
        auto snapshot = _state.tasks.read(taskId);
        if (!snapshot || snapshot->value.status != TaskStatus::Ready) {
            remove(taskId);
            AssignmentResult result;
            result.status = AssignmentStatus::NotReady;
            result.taskId = taskId;
            result.detail = snapshot ? std::string("task is ") + taskStatusToString(snapshot->value.status)
                                     : std::string("unknown task");
            return result;
        }
        const Task& task = snapshot->value;

        if (!claimant && _resolver && _resolver->hasPending(taskId)) {
            AssignmentResult result;
            result.status = AssignmentStatus::Deferred;
            result.taskId = taskId;
            result.strategy = strategyName();
            result.detail = "competing claims awaiting arbitration";
            return result;
        }

        Selection selection;
        if (claimant) {
            auto candidates = candidateAgents();
            auto it = std::find_if(candidates.begin(), candidates.end(),
                                   [&claimant](const AgentInfo& agent) { return agent.id == *claimant; });
            if (it == candidates.end() || !it->hasCapabilities(task.requiredCapabilities)) {
                // A bad claim says nothing about the task, so no grace period accounting
                AssignmentResult result;
                result.status = AssignmentStatus::NoCapableAgent;
                result.taskId = taskId;
                result.agentId = claimant;
                result.strategy = "claim";
                result.detail = "claimant " + *claimant + " cannot take the task";
                return result;
            }
            selection = {*claimant, "claim"};
        } else {
            try {
                selection = selectAgent(task, candidateAgents());
            } catch (const NoCapableAgentError& e) {
                return unassignable(*snapshot, AssignmentStatus::NoCapableAgent, strategyName(), e.what());
            }
        }

        try {
            if (!_resources.tryClaim(taskId, task.resources)) {
                return unassignable(*snapshot, AssignmentStatus::InsufficientResources, selection.strategy,
                                    "required resources are not available");
            }
        } catch (const UnknownEntityError& e) {
            return expire(*snapshot, selection.strategy, e.what());
        } catch (const std::invalid_argument& e) {
            return expire(*snapshot, selection.strategy, e.what());
        }

        AssignmentResult result;
        result.taskId = taskId;
        result.agentId = selection.agentId;
        result.strategy = selection.strategy;

        try {
            _state.tasks.tryUpdate(taskId, snapshot->version, [&selection](Task& t) {
                t.status = TaskStatus::Assigned;
                t.assignedAgent = selection.agentId;
            });
        } catch (const VersionConflictError& e) {
            _resources.release(taskId);
            result.status = AssignmentStatus::VersionConflict;
            result.detail = e.what();
            return result;
        }

        try {
            _state.agents.update(selection.agentId, [&taskId, &selection](AgentInfo& agent) {
                if (!agent.acceptsWork() || !agent.hasCapacity()) {
                    throw AgentUnavailableError(selection.agentId);
                }
                agent.queuedTasks.push_back(taskId);
                agent.status = AgentStatus::Busy;
                agent.lastActivity = Clock::now();
            }, _config.maxAgentUpdateAttempts);
        } catch (const std::runtime_error& e) {
            // Lost the agent to a race, a drain or removal
            rollbackTask(taskId, selection.agentId);
            _resources.release(taskId);
            result.status = AssignmentStatus::VersionConflict;
            result.detail = e.what();
            return result;
        }

        try {
            _graph.markDispatched(taskId);
        } catch (const std::exception& e) {
            // Cancelled or removed from the graph while we were assigning
            rollbackAgent(taskId, selection.agentId);
            rollbackTask(taskId, selection.agentId);
            _resources.release(taskId);
            remove(taskId);
            result.status = AssignmentStatus::NotReady;
            result.detail = e.what();
            return result;
        }

        remove(taskId);
        result.status = AssignmentStatus::Assigned;

        SWARM_LOG_TASK(Logging::LogLevel::Debug, "Scheduler", taskId, selection.agentId,
                       "Assigned {} to {} ({})", taskId, selection.agentId, selection.strategy);

        if (_router) {
            TaskAssignedEvent event;
            event.taskId = taskId;
            event.agentId = selection.agentId;
            event.strategy = selection.strategy;
            _router->publish(event);
        }
        return result;
    }

    AssignmentResult TaskScheduler::unassignable(const Versioned<Task>& snapshot, AssignmentStatus status,
                                                 std::string strategy, std::string detail) {
        auto now = Clock::now();
        TimePoint since = now;
        {
            std::lock_guard<std::mutex> lock(_queueMutex);
            since = _unassignableSince.emplace(snapshot.value.id, now).first->second;
        }

        if (now - since >= _config.gracePeriod) {
            auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(now - since);
            return expire(snapshot, std::move(strategy),
                          std::format("{} (unassignable for {}ms)", detail, waited.count()));
        }

        AssignmentResult result;
        result.status = status;
        result.taskId = snapshot.value.id;
        result.strategy = std::move(strategy);
        result.detail = std::move(detail);
        return result;
    }

    AssignmentResult TaskScheduler::expire(const Versioned<Task>& snapshot, std::string strategy, std::string reason) {
        const TaskId& taskId = snapshot.value.id;

        AssignmentResult result;
        result.taskId = taskId;
        result.strategy = std::move(strategy);
        result.detail = reason;

        try {
            _state.tasks.tryUpdate(taskId, snapshot.version, [&reason](Task& t) {
                t.status = TaskStatus::Failed;
                t.failureReason = reason;
                t.finishedAt = Clock::now();
            });
        } catch (const VersionConflictError& e) {
            result.status = AssignmentStatus::VersionConflict;
            result.detail = e.what();
            return result;
        }
        remove(taskId);

        std::vector<TaskId> cascaded;
        try {
            cascaded = _graph.markFailed(taskId);
        } catch (const UnknownEntityError& e) {
            SWARM_LOG_WARNING_CAT("Scheduler", "Failed task {} is not in the graph: {}", taskId, e.what());
        }
        for (const auto& id : recordCancellations(_state, _router, cascaded, taskId, "dependency " + taskId + " failed")) {
            remove(id);
        }

        SWARM_LOG_TASK(Logging::LogLevel::Warning, "Scheduler", taskId, "",
                       "Task {} failed: {}", taskId, reason);

        if (_router) {
            TaskFailedEvent event;
            event.taskId = taskId;
            event.reason = reason;
            event.willRetry = false;
            _router->publish(event);
        }

        result.status = AssignmentStatus::Expired;
        return result;
    }

    void TaskScheduler::rollbackTask(const TaskId& taskId, const AgentId& agentId) {
        try {
            _state.tasks.update(taskId, [&agentId](Task& t) {
                if (t.status == TaskStatus::Assigned && t.assignedAgent == agentId) {
                    t.status = TaskStatus::Ready;
                    t.assignedAgent.reset();
                }
            });
        } catch (const CoordinationError& e) {
            SWARM_LOG_WARNING_CAT("Scheduler", "Could not return {} to ready: {}", taskId, e.what());
        }
    }

    void TaskScheduler::rollbackAgent(const TaskId& taskId, const AgentId& agentId) {
        try {
            _state.agents.update(agentId, [&taskId](AgentInfo& agent) {
                auto& queued = agent.queuedTasks;
                queued.erase(std::remove(queued.begin(), queued.end(), taskId), queued.end());
                if (agent.status == AgentStatus::Busy && agent.load() == 0) {
                    agent.status = AgentStatus::Idle;
                }
            });
        } catch (const CoordinationError& e) {
            SWARM_LOG_WARNING_CAT("Scheduler", "Could not take {} back from {}: {}", taskId, agentId, e.what());
        }
    }

    std::vector<AssignmentResult> TaskScheduler::schedule(size_t maxAssignments) {
        SWARM_PROFILE_ZONE_NC("TaskScheduler::schedule", Debug::ProfileColors::Scheduling);

        if (_resolver) {
            _resolver->resolvePending();
        }

        size_t limit = maxAssignments ? maxAssignments : _config.maxAssignmentsPerPass;
        std::vector<AssignmentResult> results;
        size_t assigned = 0;

        for (const auto& taskId : readyQueue()) {
            if (limit && assigned >= limit) {
                break;
            }
            auto result = assign(taskId);
            if (result.assigned()) {
                ++assigned;
            }
            results.push_back(std::move(result));
        }

        {
            std::lock_guard<std::mutex> lock(_statsMutex);
            ++_stats.passes;
        }
        SWARM_PROFILE_PLOT_I("ReadyQueueDepth", queueDepth());
        return results;
    }

    void TaskScheduler::record(const AssignmentResult& result) {
        auto bump = [&result](Stats& stats) {
            switch (result.status) {
                case AssignmentStatus::Assigned:              ++stats.assigned; break;
                case AssignmentStatus::NoCapableAgent:        ++stats.noCapableAgent; break;
                case AssignmentStatus::InsufficientResources: ++stats.insufficientResources; break;
                case AssignmentStatus::VersionConflict:       ++stats.versionConflicts; break;
                case AssignmentStatus::Deferred:              ++stats.deferred; break;
                case AssignmentStatus::Expired:               ++stats.expired; break;
                case AssignmentStatus::NotReady:              break;
            }
        };

        std::lock_guard<std::mutex> lock(_statsMutex);
        bump(_stats);
        if (!result.strategy.empty()) {
            bump(_strategyStats[result.strategy]);
        }
    }

    TaskScheduler::Stats TaskScheduler::getStats() const {
        Stats stats;
        {
            std::lock_guard<std::mutex> lock(_statsMutex);
            stats = _stats;
        }
        stats.queueDepth = queueDepth();
        return stats;
    }

    std::map<std::string, TaskScheduler::Stats> TaskScheduler::getStrategyStats() const {
        std::lock_guard<std::mutex> lock(_statsMutex);
        return _strategyStats;
    }

    AdvancedTaskScheduler::AdvancedTaskScheduler(CoordinationState& state,
                                                 DependencyGraph& graph,
                                                 ResourceManager& resources,
                                                 std::unique_ptr<ISchedulingStrategy> strategy,
                                                 MessageRouter* router,
                                                 ConflictResolver* resolver)
        : AdvancedTaskScheduler(state, graph, resources, std::move(strategy), router, resolver, Config{}) {}

    AdvancedTaskScheduler::AdvancedTaskScheduler(CoordinationState& state,
                                                 DependencyGraph& graph,
                                                 ResourceManager& resources,
                                                 std::unique_ptr<ISchedulingStrategy> strategy,
                                                 MessageRouter* router,
                                                 ConflictResolver* resolver,
                                                 const Config& config)
        : TaskScheduler(state, graph, resources, router, resolver, config)
        , _strategy(strategy ? std::move(strategy)
                             : std::unique_ptr<ISchedulingStrategy>(std::make_unique<CapabilityStrategy>())) {}

    std::shared_ptr<ISchedulingStrategy> AdvancedTaskScheduler::currentStrategy() const {
        std::lock_guard<std::mutex> lock(_strategyMutex);
        return _strategy;
    }

    void AdvancedTaskScheduler::setStrategy(std::unique_ptr<ISchedulingStrategy> strategy) {
        if (!strategy) {
            return;
        }
        std::string previous;
        {
            std::lock_guard<std::mutex> lock(_strategyMutex);
            previous = _strategy->getName();
            _strategy = std::move(strategy);
        }
        SWARM_LOG_INFO_CAT("Scheduler", "Scheduling strategy changed from {} to {}", previous, strategyName());
    }

    std::string AdvancedTaskScheduler::strategyName() const {
        return currentStrategy()->getName();
    }

    TaskScheduler::Selection AdvancedTaskScheduler::selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) {
        auto strategy = currentStrategy();
        return {strategy->selectAgent(task, candidates), strategy->getName()};
    }

    void AdvancedTaskScheduler::notifyTaskCompleted(const Task& task, const AgentId& agentId) {
        currentStrategy()->notifyTaskCompleted(task, agentId);
    }

    void AdvancedTaskScheduler::notifyAgentRemoved(const AgentId& agentId) {
        currentStrategy()->notifyAgentRemoved(agentId);
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
