/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "SchedulingStrategies.h"
#include <algorithm>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

namespace {
    const AgentInfo* pickLeastLoaded(const std::vector<const AgentInfo*>& agents) {
        const AgentInfo* best = nullptr;
        for (const auto* agent : agents) {
            if (!best || agent->load() < best->load() ||
                (agent->load() == best->load() && agent->id < best->id)) {
                best = agent;
            }
        }
        return best;
    }
}

AgentId CapabilityStrategy::selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) {
    auto capable = capableAgents(task, candidates);
    if (capable.empty()) {
        throw NoCapableAgentError(task.id);
    }

    auto best = std::min_element(capable.begin(), capable.end(), [](const AgentInfo* a, const AgentInfo* b) {
        if (a->load() != b->load()) return a->load() < b->load();
        if (a->capabilities.size() != b->capabilities.size()) return a->capabilities.size() < b->capabilities.size();
        return a->id < b->id;
    });
    return (*best)->id;
}

AgentId RoundRobinStrategy::selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) {
    auto capable = capableAgents(task, candidates);
    if (capable.empty()) {
        throw NoCapableAgentError(task.id);
    }
    std::sort(capable.begin(), capable.end(), [](const AgentInfo* a, const AgentInfo* b) { return a->id < b->id; });

    std::lock_guard<std::mutex> lock(_mutex);
    const AgentInfo* next = capable.front();
    if (_last) {
        auto it = std::find_if(capable.begin(), capable.end(),
                               [this](const AgentInfo* agent) { return agent->id > *_last; });
        if (it != capable.end()) {
            next = *it;
        }
    }
    _last = next->id;
    return next->id;
}

void RoundRobinStrategy::reset() {
    std::lock_guard<std::mutex> lock(_mutex);
    _last.reset();
}

AgentId LeastLoadedStrategy::selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) {
    const auto* best = pickLeastLoaded(capableAgents(task, candidates));
    if (!best) {
        throw NoCapableAgentError(task.id);
    }
    return best->id;
}

AgentId AffinityStrategy::selectAgent(const Task& task, const std::vector<AgentInfo>& candidates) {
    auto capable = capableAgents(task, candidates);
    if (capable.empty()) {
        throw NoCapableAgentError(task.id);
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        const AgentInfo* preferred = nullptr;
        uint64_t newest = 0;
        for (const auto& key : task.affinityKeys()) {
            auto it = _lastCompletion.find(key);
            if (it == _lastCompletion.end() || it->second.sequence <= newest) {
                continue;
            }
            auto agent = std::find_if(capable.begin(), capable.end(),
                                      [&it](const AgentInfo* a) { return a->id == it->second.agentId; });
            if (agent != capable.end()) {
                preferred = *agent;
                newest = it->second.sequence;
            }
        }
        if (preferred) {
            return preferred->id;
        }
    }
    return pickLeastLoaded(capable)->id;
}

void AffinityStrategy::notifyTaskCompleted(const Task& task, const AgentId& agentId) {
    auto keys = task.affinityKeys();
    if (keys.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    ++_sequence;
    for (const auto& key : keys) {
        _lastCompletion[key] = Completion{agentId, _sequence};
    }
}

void AffinityStrategy::notifyAgentRemoved(const AgentId& agentId) {
    std::lock_guard<std::mutex> lock(_mutex);
    for (auto it = _lastCompletion.begin(); it != _lastCompletion.end();) {
        if (it->second.agentId == agentId) {
            it = _lastCompletion.erase(it);
        } else {
            ++it;
        }
    }
}

void AffinityStrategy::reset() {
    std::lock_guard<std::mutex> lock(_mutex);
    _lastCompletion.clear();
    _sequence = 0;
}

std::optional<AgentId> AffinityStrategy::lastCompleter(const std::string& key) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _lastCompletion.find(key);
    if (it == _lastCompletion.end()) {
        return std::nullopt;
    }
    return it->second.agentId;
}

const char* schedulingStrategyKindToString(SchedulingStrategyKind kind) {
    switch (kind) {
        case SchedulingStrategyKind::Capability:  return "capability";
        case SchedulingStrategyKind::RoundRobin:  return "round-robin";
        case SchedulingStrategyKind::LeastLoaded: return "least-loaded";
        case SchedulingStrategyKind::Affinity:    return "affinity";
    }
    return "unknown";
}

std::optional<SchedulingStrategyKind> stringToSchedulingStrategyKind(std::string_view name) {
    if (name == "capability") return SchedulingStrategyKind::Capability;
    if (name == "round-robin" || name == "roundrobin") return SchedulingStrategyKind::RoundRobin;
    if (name == "least-loaded" || name == "leastloaded") return SchedulingStrategyKind::LeastLoaded;
    if (name == "affinity") return SchedulingStrategyKind::Affinity;
    return std::nullopt;
}

std::unique_ptr<ISchedulingStrategy> makeSchedulingStrategy(SchedulingStrategyKind kind) {
    switch (kind) {
        case SchedulingStrategyKind::RoundRobin:
            return std::make_unique<RoundRobinStrategy>();
        case SchedulingStrategyKind::LeastLoaded:
            return std::make_unique<LeastLoadedStrategy>();
        case SchedulingStrategyKind::Affinity:
            return std::make_unique<AffinityStrategy>();
        case SchedulingStrategyKind::Capability:
            break;
    }
    return std::make_unique<CapabilityStrategy>();
}

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
