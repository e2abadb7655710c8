/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file SchedulingStrategies.h
 * @brief Capability, round-robin, least-loaded and affinity agent selection
 */

#pragma once

#include "ISchedulingStrategy.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

/**
 * @brief Least-loaded agent whose capabilities cover the task
 *
 * Ties go to the agent with the fewest capabilities, keeping generalists free
 * for work only they can do, then to the lower agent id.
 */
class CapabilityStrategy : public ISchedulingStrategy {
public:
    AgentId selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) override;
    const char* getName() const override { return "capability"; }
};

/**
 * @brief Cycles through eligible agents in id order, ignoring load
 *
 * The rotation remembers the last agent picked rather than a position, so
 * agents joining or leaving do not make it skip or repeat anyone.
 */
class RoundRobinStrategy : public ISchedulingStrategy {
public:
    AgentId selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) override;
    void reset() override;
    const char* getName() const override { return "round-robin"; }

private:
    std::mutex _mutex;
    std::optional<AgentId> _last;
};

/**
 * @brief Eligible agent with the smallest load, ties broken by agent id
 */
class LeastLoadedStrategy : public ISchedulingStrategy {
public:
    AgentId selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) override;
    const char* getName() const override { return "least-loaded"; }
};

/**
 * @brief Prefers the agent that most recently completed related work
 *
 * Two tasks are related when they share a tag or a namespace. Among the
 * eligible agents, the one whose last completion on any of the task's keys
 * is the most recent wins. With no history for any key, falls back to
 * LeastLoadedStrategy.
 */
class AffinityStrategy : public ISchedulingStrategy {
public:
    AgentId selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) override;
    void notifyTaskCompleted(const Task& task, const AgentId& agentId) override;
    void notifyAgentRemoved(const AgentId& agentId) override;
    void reset() override;
    const char* getName() const override { return "affinity"; }

    /// Agent that last completed work under the key, if any
    std::optional<AgentId> lastCompleter(const std::string& key) const;

private:
    struct Completion {
        AgentId agentId;
        uint64_t sequence = 0;
    };

    mutable std::mutex _mutex;
    std::map<std::string, Completion> _lastCompletion;
    uint64_t _sequence = 0;
    LeastLoadedStrategy _fallback;
};

/// Parse "capability", "round-robin", "least-loaded" or "affinity"
std::optional<SchedulingStrategyKind> stringToSchedulingStrategyKind(std::string_view name);

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
