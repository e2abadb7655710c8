/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "DependencyGraph.h"
#include "../Logging/Logger.h"
#include "../Debug/Profiling.h"
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    const char* graphNodeStateToString(GraphNodeState state) {
        switch (state) {
            case GraphNodeState::Pending:    return "pending";
            case GraphNodeState::Ready:      return "ready";
            case GraphNodeState::Dispatched: return "dispatched";
            case GraphNodeState::Completed:  return "completed";
            case GraphNodeState::Failed:     return "failed";
            case GraphNodeState::Cancelled:  return "cancelled";
        }
        return "unknown";
    }

    DependencyGraph::GraphNode& DependencyGraph::nodeOrThrow(const TaskId& id) {
        auto it = _nodes.find(id);
        if (it == _nodes.end()) {
            throw UnknownEntityError("task", id);
        }
        return it->second;
    }

    const DependencyGraph::GraphNode& DependencyGraph::nodeOrThrow(const TaskId& id) const {
        auto it = _nodes.find(id);
        if (it == _nodes.end()) {
            throw UnknownEntityError("task", id);
        }
        return it->second;
    }

    bool DependencyGraph::reachesAny(const std::vector<TaskId>& roots, const std::set<TaskId>& targets,
                                     TaskId& hit) const {
        std::unordered_set<TaskId> visited;
        std::vector<TaskId> stack(roots.begin(), roots.end());

        while (!stack.empty()) {
            TaskId current = std::move(stack.back());
            stack.pop_back();

            if (targets.count(current)) {
                hit = current;
                return true;
            }
            if (!visited.insert(current).second) {
                continue;
            }

            auto it = _nodes.find(current);
            if (it == _nodes.end()) {
                continue;
            }
            for (const auto& dependent : it->second.edges.outgoing) {
                if (!visited.count(dependent)) {
                    stack.push_back(dependent);
                }
            }
        }
        return false;
    }

    bool DependencyGraph::dependenciesSatisfied(const GraphNode& node) const {
        if (!node.unresolved.empty()) {
            return false;
        }
        for (const auto& dep : node.edges.incoming) {
            auto it = _nodes.find(dep);
            if (it == _nodes.end() || it->second.state != GraphNodeState::Completed) {
                return false;
            }
        }
        return true;
    }

    void DependencyGraph::setState(const TaskId& id, GraphNode& node, GraphNodeState state) {
        node.state = state;
        if (state == GraphNodeState::Ready) {
            _ready.insert(id);
        } else {
            _ready.erase(id);
        }
    }

    GraphNodeState DependencyGraph::addTask(const TaskId& id, const std::vector<TaskId>& dependencies) {
        SWARM_PROFILE_ZONE_NC("DependencyGraph::addTask", Debug::ProfileColors::Graph);
        std::unique_lock<std::shared_mutex> lock(_mutex);

        if (_nodes.count(id)) {
            throw DuplicateTaskError(id);
        }

        std::set<TaskId> deps(dependencies.begin(), dependencies.end());
        if (deps.count(id)) {
            throw CycleError(id, id);
        }

        // Tasks submitted earlier may already name this id as a dependency.
        // The new edges close a cycle iff one of our dependencies is downstream
        // of those waiting tasks.
        std::vector<TaskId> waiting;
        if (auto it = _unresolved.find(id); it != _unresolved.end()) {
            waiting.assign(it->second.begin(), it->second.end());
        }
        TaskId hit;
        if (!waiting.empty() && reachesAny(waiting, deps, hit)) {
            throw CycleError(id, hit);
        }

        // Nothing below can throw except allocation; commit
        GraphNode node;
        bool doomed = false;
        for (const auto& dep : deps) {
            auto depIt = _nodes.find(dep);
            if (depIt == _nodes.end()) {
                node.unresolved.insert(dep);
                _unresolved[dep].insert(id);
                continue;
            }
            node.edges.incoming.push_back(dep);
            depIt->second.edges.outgoing.push_back(id);
            if (depIt->second.state == GraphNodeState::Failed ||
                depIt->second.state == GraphNodeState::Cancelled) {
                doomed = true;
            }
        }

        for (const auto& dependent : waiting) {
            node.edges.outgoing.push_back(dependent);
            auto& waiter = _nodes.at(dependent);
            waiter.unresolved.erase(id);
            waiter.edges.incoming.push_back(id);
        }
        _unresolved.erase(id);

        auto it = _nodes.emplace(id, std::move(node)).first;
        GraphNodeState initial = doomed ? GraphNodeState::Cancelled
                               : dependenciesSatisfied(it->second) ? GraphNodeState::Ready
                               : GraphNodeState::Pending;
        setState(id, it->second, initial);
        if (doomed) {
            std::vector<TaskId> cancelled;
            cascadeCancel(id, cancelled);
        }

        SWARM_LOG_TRACE_CAT("DependencyGraph", "Added task {} with {} dependencies ({})",
                            id, deps.size(), graphNodeStateToString(initial));
        return initial;
    }

    void DependencyGraph::addDependency(const TaskId& id, const TaskId& dependsOn) {
        SWARM_PROFILE_ZONE_NC("DependencyGraph::addDependency", Debug::ProfileColors::Graph);
        std::unique_lock<std::shared_mutex> lock(_mutex);

        auto& node = nodeOrThrow(id);
        if (node.state != GraphNodeState::Pending && node.state != GraphNodeState::Ready) {
            throw std::logic_error("cannot add a dependency to " + std::string(graphNodeStateToString(node.state)) +
                                   " task " + id);
        }
        if (id == dependsOn) {
            throw CycleError(id, dependsOn);
        }

        const auto& incoming = node.edges.incoming;
        if (std::find(incoming.begin(), incoming.end(), dependsOn) != incoming.end() ||
            node.unresolved.count(dependsOn)) {
            return;
        }

        auto depIt = _nodes.find(dependsOn);

        // The edge dependsOn -> id closes a cycle iff dependsOn is downstream of id
        TaskId hit;
        if (depIt != _nodes.end() && reachesAny({id}, {dependsOn}, hit)) {
            throw CycleError(id, dependsOn);
        }

        // A ready task may already sit in a scheduler queue; it only takes
        // edges that keep it ready
        if (node.state == GraphNodeState::Ready &&
            (depIt == _nodes.end() || depIt->second.state != GraphNodeState::Completed)) {
            throw std::logic_error("task " + id + " is already ready; " + dependsOn + " has not completed");
        }

        if (depIt == _nodes.end()) {
            node.unresolved.insert(dependsOn);
            _unresolved[dependsOn].insert(id);
            return;
        }

        node.edges.incoming.push_back(dependsOn);
        depIt->second.edges.outgoing.push_back(id);

        if (depIt->second.state == GraphNodeState::Failed || depIt->second.state == GraphNodeState::Cancelled) {
            std::vector<TaskId> cancelled;
            setState(id, node, GraphNodeState::Cancelled);
            cascadeCancel(id, cancelled);
        } else if (depIt->second.state != GraphNodeState::Completed) {
            setState(id, node, GraphNodeState::Pending);
        }
    }

    std::vector<TaskId> DependencyGraph::markCompleted(const TaskId& id) {
        SWARM_PROFILE_ZONE_NC("DependencyGraph::markCompleted", Debug::ProfileColors::Graph);
        std::unique_lock<std::shared_mutex> lock(_mutex);

        auto& node = nodeOrThrow(id);
        if (node.state != GraphNodeState::Ready && node.state != GraphNodeState::Dispatched) {
            throw std::logic_error("task " + id + " is " + graphNodeStateToString(node.state) +
                                   ", only ready or dispatched tasks can complete");
        }
        setState(id, node, GraphNodeState::Completed);

        std::vector<TaskId> promoted;
        for (const auto& dependentId : node.edges.outgoing) {
            auto& dependent = _nodes.at(dependentId);
            if (dependent.state == GraphNodeState::Pending && dependenciesSatisfied(dependent)) {
                setState(dependentId, dependent, GraphNodeState::Ready);
                promoted.push_back(dependentId);
            }
        }
        return promoted;
    }

    void DependencyGraph::markDispatched(const TaskId& id) {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        auto& node = nodeOrThrow(id);
        if (node.state != GraphNodeState::Ready) {
            throw std::logic_error("task " + id + " is " + graphNodeStateToString(node.state) + ", not ready");
        }
        setState(id, node, GraphNodeState::Dispatched);
    }

    void DependencyGraph::markReady(const TaskId& id) {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        auto& node = nodeOrThrow(id);
        if (node.state == GraphNodeState::Ready) {
            return;
        }
        if (node.state != GraphNodeState::Dispatched && node.state != GraphNodeState::Failed) {
            throw std::logic_error("task " + id + " cannot return to ready from " +
                                   graphNodeStateToString(node.state));
        }
        setState(id, node, GraphNodeState::Ready);
    }

    void DependencyGraph::cascadeCancel(const TaskId& from, std::vector<TaskId>& cancelled) {
        std::vector<TaskId> stack{from};
        while (!stack.empty()) {
            TaskId current = std::move(stack.back());
            stack.pop_back();

            for (const auto& dependentId : _nodes.at(current).edges.outgoing) {
                auto& dependent = _nodes.at(dependentId);
                if (dependent.state == GraphNodeState::Pending || dependent.state == GraphNodeState::Ready) {
                    setState(dependentId, dependent, GraphNodeState::Cancelled);
                    cancelled.push_back(dependentId);
                    stack.push_back(dependentId);
                }
            }
        }
    }

    std::vector<TaskId> DependencyGraph::markFailed(const TaskId& id) {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        auto& node = nodeOrThrow(id);
        if (isTerminal(node.state)) {
            return {};
        }
        setState(id, node, GraphNodeState::Failed);

        std::vector<TaskId> cancelled;
        cascadeCancel(id, cancelled);
        if (!cancelled.empty()) {
            SWARM_LOG_DEBUG_CAT("DependencyGraph", "Failure of {} cancelled {} dependent(s)", id, cancelled.size());
        }
        return cancelled;
    }

    std::vector<TaskId> DependencyGraph::cancel(const TaskId& id) {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        auto& node = nodeOrThrow(id);
        if (isTerminal(node.state)) {
            return {};
        }
        setState(id, node, GraphNodeState::Cancelled);

        std::vector<TaskId> cancelled{id};
        cascadeCancel(id, cancelled);
        return cancelled;
    }

    std::vector<TaskId> DependencyGraph::removeTask(const TaskId& id, bool force) {
        SWARM_PROFILE_ZONE_NC("DependencyGraph::removeTask", Debug::ProfileColors::Graph);
        std::unique_lock<std::shared_mutex> lock(_mutex);

        auto& node = nodeOrThrow(id);
        size_t live = 0;
        for (const auto& dependentId : node.edges.outgoing) {
            if (!isTerminal(_nodes.at(dependentId).state)) {
                ++live;
            }
        }
        if (live > 0 && !force) {
            throw HasDependentsError(id, live);
        }

        std::vector<TaskId> cancelled;
        if (live > 0) {
            cascadeCancel(id, cancelled);
        }

        for (const auto& dependentId : node.edges.outgoing) {
            auto& incoming = _nodes.at(dependentId).edges.incoming;
            incoming.erase(std::remove(incoming.begin(), incoming.end(), id), incoming.end());
        }
        for (const auto& dependencyId : node.edges.incoming) {
            auto& outgoing = _nodes.at(dependencyId).edges.outgoing;
            outgoing.erase(std::remove(outgoing.begin(), outgoing.end(), id), outgoing.end());
        }
        for (const auto& missing : node.unresolved) {
            auto it = _unresolved.find(missing);
            if (it != _unresolved.end()) {
                it->second.erase(id);
                if (it->second.empty()) {
                    _unresolved.erase(it);
                }
            }
        }

        _ready.erase(id);
        _nodes.erase(id);

        SWARM_LOG_DEBUG_CAT("DependencyGraph", "Removed task {} ({} dependent(s) cancelled)", id, cancelled.size());
        return cancelled;
    }

    std::vector<TaskId> DependencyGraph::getReadyTasks() const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        return {_ready.begin(), _ready.end()};
    }

    std::optional<GraphNodeState> DependencyGraph::getStatus(const TaskId& id) const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        auto it = _nodes.find(id);
        if (it == _nodes.end()) {
            return std::nullopt;
        }
        return it->second.state;
    }

    bool DependencyGraph::contains(const TaskId& id) const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        return _nodes.count(id) > 0;
    }

    std::vector<TaskId> DependencyGraph::getDependencies(const TaskId& id) const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        const auto& node = nodeOrThrow(id);
        std::vector<TaskId> out = node.edges.incoming;
        out.insert(out.end(), node.unresolved.begin(), node.unresolved.end());
        std::sort(out.begin(), out.end());
        return out;
    }

    std::vector<TaskId> DependencyGraph::getDependents(const TaskId& id) const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        std::vector<TaskId> out = nodeOrThrow(id).edges.outgoing;
        std::sort(out.begin(), out.end());
        return out;
    }

    std::vector<TaskId> DependencyGraph::getUnresolvedDependencies(const TaskId& id) const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        const auto& node = nodeOrThrow(id);
        return {node.unresolved.begin(), node.unresolved.end()};
    }

    size_t DependencyGraph::longestChainFrom(const TaskId& id, std::unordered_map<TaskId, size_t>& memo) const {
        if (auto it = memo.find(id); it != memo.end()) {
            return it->second;
        }
        size_t longest = 0;
        for (const auto& dependent : _nodes.at(id).edges.outgoing) {
            longest = std::max(longest, longestChainFrom(dependent, memo));
        }
        memo[id] = longest + 1;
        return longest + 1;
    }

    size_t DependencyGraph::criticalPathLength(const TaskId& id) const {
        SWARM_PROFILE_ZONE_NC("DependencyGraph::criticalPathLength", Debug::ProfileColors::Graph);
        std::shared_lock<std::shared_mutex> lock(_mutex);
        nodeOrThrow(id);
        std::unordered_map<TaskId, size_t> memo;
        return longestChainFrom(id, memo);
    }

    std::vector<TaskId> DependencyGraph::criticalPath() const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        if (_nodes.empty()) {
            return {};
        }

        std::unordered_map<TaskId, size_t> memo;
        std::vector<TaskId> ids;
        ids.reserve(_nodes.size());
        for (const auto& [id, node] : _nodes) {
            ids.push_back(id);
        }
        std::sort(ids.begin(), ids.end());

        TaskId start;
        size_t best = 0;
        for (const auto& id : ids) {
            size_t length = longestChainFrom(id, memo);
            if (length > best) {
                best = length;
                start = id;
            }
        }

        std::vector<TaskId> path{start};
        while (true) {
            std::vector<TaskId> next = _nodes.at(path.back()).edges.outgoing;
            if (next.empty()) {
                break;
            }
            std::sort(next.begin(), next.end());
            const TaskId* chosen = &next.front();
            for (const auto& candidate : next) {
                if (memo.at(candidate) > memo.at(*chosen)) {
                    chosen = &candidate;
                }
            }
            path.push_back(*chosen);
        }
        return path;
    }

    std::vector<TaskId> DependencyGraph::topologicalOrder() const {
        std::shared_lock<std::shared_mutex> lock(_mutex);

        std::unordered_map<TaskId, size_t> inDegrees;
        std::set<TaskId> zeroInDegree;
        for (const auto& [id, node] : _nodes) {
            inDegrees[id] = node.edges.incoming.size();
            if (node.edges.incoming.empty()) {
                zeroInDegree.insert(id);
            }
        }

        std::vector<TaskId> result;
        result.reserve(_nodes.size());
        while (!zeroInDegree.empty()) {
            TaskId current = *zeroInDegree.begin();
            zeroInDegree.erase(zeroInDegree.begin());
            result.push_back(current);

            for (const auto& target : _nodes.at(current).edges.outgoing) {
                if (--inDegrees[target] == 0) {
                    zeroInDegree.insert(target);
                }
            }
        }
        return result;
    }

    size_t DependencyGraph::size() const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        return _nodes.size();
    }

    size_t DependencyGraph::countInState(GraphNodeState state) const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        if (state == GraphNodeState::Ready) {
            return _ready.size();
        }
        return static_cast<size_t>(std::count_if(_nodes.begin(), _nodes.end(),
                                                 [state](const auto& entry) { return entry.second.state == state; }));
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
