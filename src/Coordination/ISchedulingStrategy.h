/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file ISchedulingStrategy.h
 * @brief Abstract interface for pluggable agent selection
 *
 * The scheduler owns the ready queue, resource claims and the optimistic
 * bookkeeping. A strategy only answers one question: which of these agents
 * should run this task.
 */

#pragma once

#include "CoordinationErrors.h"
#include "CoordinationTypes.h"
#include <memory>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

/**
 * @brief Agent selection policy used by AdvancedTaskScheduler
 *
 * The scheduler hands every strategy the same candidate list: agents that
 * accept work and have spare capacity, sorted by id. Capability filtering is
 * the strategy's job, so a strategy can tell "nobody can do this" apart from
 * "everybody who can is busy" if it wants to.
 *
 * Thread Safety: implementations MUST be thread-safe. Several scheduling
 * passes may run concurrently (the manager's pass and a direct call from a
 * worker), and notifyTaskCompleted() arrives from whichever thread finished
 * the task.
 *
 * @code
 * // Always pick the agent with the most capabilities
 * class GeneralistStrategy : public ISchedulingStrategy {
 * public:
 *     AgentId selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) override {
 *         auto capable = capableAgents(task, candidates);
 *         if (capable.empty()) throw NoCapableAgentError(task.id);
 *         auto best = std::max_element(capable.begin(), capable.end(), [](auto* a, auto* b) {
 *             return a->capabilities.size() < b->capabilities.size();
 *         });
 *         return (*best)->id;
 *     }
 *     const char* getName() const override { return "generalist"; }
 * };
 * @endcode
 */
class ISchedulingStrategy {
public:
    virtual ~ISchedulingStrategy() = default;

    /**
     * @brief Choose the agent for a task
     *
     * @param task Snapshot of the ready task
     * @param candidates Agents accepting work with spare capacity, sorted by id
     * @return Id of one of the candidates
     * @throws NoCapableAgentError if no candidate qualifies
     */
    virtual AgentId selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) = 0;

    /**
     * @brief Called after an agent completed a task
     *
     * Optional hook for strategies that learn from history. Default is no-op.
     */
    virtual void notifyTaskCompleted(const Task& task, const AgentId& agentId) {}

    /**
     * @brief Called when an agent leaves the pool
     *
     * Strategies holding on to agent ids should forget this one.
     */
    virtual void notifyAgentRemoved(const AgentId& agentId) {}

    /// Clear learned state. Default is no-op.
    virtual void reset() {}

    /// Name used in logs, events and statistics (must be a static string)
    virtual const char* getName() const = 0;

protected:
    /// Candidates whose capability set covers the task's requirements
    static std::vector<const AgentInfo*> capableAgents(const Task& task, const std::vector<AgentInfo>& candidates) {
        std::vector<const AgentInfo*> capable;
        capable.reserve(candidates.size());
        for (const auto& agent : candidates) {
            if (agent.acceptsWork() && agent.hasCapacity() && agent.hasCapabilities(task.requiredCapabilities)) {
                capable.push_back(&agent);
            }
        }
        return capable;
    }
};

/**
 * @brief The built-in strategies, for configuration
 */
enum class SchedulingStrategyKind : uint8_t {
    Capability,
    RoundRobin,
    LeastLoaded,
    Affinity
};

const char* schedulingStrategyKindToString(SchedulingStrategyKind kind);

std::unique_ptr<ISchedulingStrategy> makeSchedulingStrategy(SchedulingStrategyKind kind);

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
