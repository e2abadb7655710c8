/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file DependencyGraph.h
 * @brief Task dependency DAG with readiness tracking
 *
 * The graph orders execution: a task becomes ready when every task it depends
 * on has completed. Cycles are rejected before anything is committed.
 */

#pragma once

#include "CoordinationErrors.h"
#include "../CoreCommon.h"
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    /**
     * @brief Execution state of a node as far as ordering is concerned
     *
     * The graph does not distinguish assigned from running; both are
     * Dispatched. Failed is terminal here: a retryable failure goes straight
     * back to Ready through markReady().
     */
    enum class GraphNodeState : uint8_t {
        Pending,     ///< At least one dependency not completed
        Ready,       ///< All dependencies completed, waiting for dispatch
        Dispatched,  ///< Handed to an agent
        Completed,
        Failed,
        Cancelled
    };

    const char* graphNodeStateToString(GraphNodeState state);

    /**
     * @brief Directed acyclic graph of task dependencies
     *
     * Edges point from a dependency to its dependents. A dependency that has
     * not been submitted yet is recorded as unresolved; the dependent stays
     * Pending until it shows up and completes. That lets callers submit tasks
     * in any order.
     *
     * Every mutating call either commits fully or throws and leaves the graph
     * as it was.
     *
     * Thread Safety: all methods are thread-safe. Readers share, writers are
     * exclusive. Each call touches only the node and its direct neighbourhood
     * except the explicit whole-graph queries (topologicalOrder, criticalPath).
     *
     * @code
     * DependencyGraph graph;
     * graph.addTask("fetch", {});
     * graph.addTask("build", {"fetch"});
     * graph.addTask("test",  {"build"});
     *
     * graph.getReadyTasks();          // {"fetch"}
     * graph.markDispatched("fetch");
     * graph.markCompleted("fetch");   // returns {"build"}
     *
     * graph.addDependency("fetch", "test");   // throws CycleError
     * @endcode
     */
    class DependencyGraph {
    public:
        DependencyGraph() = default;
        DependencyGraph(const DependencyGraph&) = delete;
        DependencyGraph& operator=(const DependencyGraph&) = delete;

        /**
         * @brief Insert a task and its dependency edges
         *
         * @return The initial state: Ready, Pending, or Cancelled when a
         *         dependency has already failed or been cancelled
         * @throws DuplicateTaskError if the id is already present
         * @throws CycleError if the edges would close a cycle (including
         *         through earlier tasks that named this id before it existed)
         */
        GraphNodeState addTask(const TaskId& id, const std::vector<TaskId>& dependencies);

        /**
         * @brief Add one edge: id depends on dependsOn
         *
         * Pending tasks take any edge. A Ready task may already be queued by
         * a scheduler, so it only takes edges to completed tasks and stays
         * Ready.
         *
         * @throws UnknownEntityError if id is not present
         * @throws CycleError if dependsOn is reachable from id
         * @throws std::logic_error if id was already dispatched or finished,
         *         or is Ready and dependsOn has not completed
         */
        void addDependency(const TaskId& id, const TaskId& dependsOn);

        /**
         * @brief Record completion and promote dependents whose last dependency this was
         *
         * Only the direct dependents are examined.
         * @return Ids that became ready because of this completion
         * @throws std::logic_error unless the task is Ready or Dispatched
         */
        std::vector<TaskId> markCompleted(const TaskId& id);

        /// Ready → Dispatched. @throws std::logic_error from any other state
        void markDispatched(const TaskId& id);

        /// Dispatched or Failed → Ready, for retries and returned work
        void markReady(const TaskId& id);

        /**
         * @brief Terminal failure; not-yet-started dependents are cancelled transitively
         * @return The cancelled dependents
         */
        std::vector<TaskId> markFailed(const TaskId& id);

        /**
         * @brief Cancel a non-terminal task and everything downstream of it
         * @return Every id moved to Cancelled, the task itself first; empty if
         *         the task was already terminal
         */
        std::vector<TaskId> cancel(const TaskId& id);

        /**
         * @brief Remove a task from the graph
         *
         * Terminal dependents do not block removal; their edge is dropped.
         *
         * @param force Cancel live dependents transitively instead of failing
         * @return The dependents that were cancelled by a forced removal
         * @throws HasDependentsError if live dependents exist and force is false
         * @throws UnknownEntityError if the task is not present
         */
        std::vector<TaskId> removeTask(const TaskId& id, bool force = false);

        /// Current ready set, sorted by id
        std::vector<TaskId> getReadyTasks() const;

        std::optional<GraphNodeState> getStatus(const TaskId& id) const;
        bool contains(const TaskId& id) const;

        /// Declared dependencies, including ones not submitted yet
        std::vector<TaskId> getDependencies(const TaskId& id) const;
        std::vector<TaskId> getDependents(const TaskId& id) const;
        std::vector<TaskId> getUnresolvedDependencies(const TaskId& id) const;

        /**
         * @brief Number of tasks on the longest chain from id to a task with no dependents
         *
         * Computed on demand, used as a priority hint. A task with no
         * dependents has length 1.
         */
        size_t criticalPathLength(const TaskId& id) const;

        /// Longest dependency chain in the whole graph, ties broken by id
        std::vector<TaskId> criticalPath() const;

        /// Kahn order over submitted tasks, ties broken by id
        std::vector<TaskId> topologicalOrder() const;

        size_t size() const;
        size_t countInState(GraphNodeState state) const;

    private:
        /**
         * @brief Edge storage per node
         */
        struct EdgeList {
            std::vector<TaskId> outgoing;  ///< Dependents
            std::vector<TaskId> incoming;  ///< Submitted dependencies
        };

        struct GraphNode {
            GraphNodeState state = GraphNodeState::Pending;
            EdgeList edges;
            std::set<TaskId> unresolved;   ///< Dependencies not submitted yet
        };

        GraphNode& nodeOrThrow(const TaskId& id);
        const GraphNode& nodeOrThrow(const TaskId& id) const;

        // DFS over dependents starting at the given roots
        bool reachesAny(const std::vector<TaskId>& roots, const std::set<TaskId>& targets,
                        TaskId& hit) const;

        bool dependenciesSatisfied(const GraphNode& node) const;
        void setState(const TaskId& id, GraphNode& node, GraphNodeState state);
        void cascadeCancel(const TaskId& from, std::vector<TaskId>& cancelled);
        size_t longestChainFrom(const TaskId& id, std::unordered_map<TaskId, size_t>& memo) const;

        static bool isTerminal(GraphNodeState state) {
            return state == GraphNodeState::Completed ||
                   state == GraphNodeState::Failed ||
                   state == GraphNodeState::Cancelled;
        }

        mutable std::shared_mutex _mutex;
        std::unordered_map<TaskId, GraphNode> _nodes;
        std::set<TaskId> _ready;
        /// Not-yet-submitted id → tasks waiting on it
        std::unordered_map<TaskId, std::set<TaskId>> _unresolved;
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
